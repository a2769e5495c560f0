#include "cli_options.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "internal/util/errors.hpp"

namespace miner::runtime {

namespace {

// --models-dir -> --models_dir
std::string Canonical(std::string_view flag) {
  std::string out(flag);
  std::replace(out.begin() + 2, out.end(), '-', '_');
  return out;
}

} // namespace

CliOptions ParseCliOptions(int argc, const char* const* argv) {
  CliOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg.size() < 3 || arg.substr(0, 2) != "--") {
      throw util::InvalidArgument("unexpected argument: " + std::string(arg));
    }

    std::optional<std::string> inline_value;
    if (auto eq = arg.find('='); eq != std::string_view::npos) {
      inline_value = std::string(arg.substr(eq + 1));
      arg          = arg.substr(0, eq);
    }
    const auto flag = Canonical(arg);

    auto value = [&]() -> std::string {
      if (inline_value) return *inline_value;
      if (i + 1 >= argc) throw util::InvalidArgument(flag + " requires a value");
      return argv[++i];
    };
    auto no_value = [&]() {
      if (inline_value) throw util::InvalidArgument(flag + " does not take a value");
    };

    if (flag == "--url") {
      options.url = value();
    } else if (flag == "--process") {
      options.process.push_back(value());
    } else if (flag == "--mode") {
      const auto mode = value();
      if (mode == "local") {
        options.mode = RunMode::kLocal;
      } else if (mode == "db") {
        options.mode = RunMode::kDb;
      } else {
        throw util::InvalidArgument("--mode must be 'local' or 'db', got '" + mode + "'");
      }
    } else if (flag == "--cleanup") {
      no_value();
      options.cleanup = true;
    } else if (flag == "--models_dir") {
      options.models_dir = value();
    } else if (flag == "--cookies") {
      options.cookies = value();
    } else if (flag == "--sync_only") {
      no_value();
      options.sync_only = true;
    } else if (flag == "--non_interactive") {
      no_value();
      options.non_interactive = true;
    } else if (flag == "--config") {
      options.config_path = value();
    } else if (flag == "--help") {
      options.help = true;
    } else {
      throw util::InvalidArgument("unknown option: " + std::string(arg));
    }
  }

  if (!options.help && options.url.empty()) {
    throw util::InvalidArgument("--url is required");
  }
  return options;
}

std::string Usage() {
  return "Usage: miner --url <source-url> [options]\n"
         "\n"
         "  --process <stages>     metadata,audio,video,emotions or all (repeatable, default all)\n"
         "  --mode local|db        db also syncs the results into the store (default local)\n"
         "  --cleanup              remove the run directory after a successful sync\n"
         "  --models_dir <dir>     model cache directory handed to every tool\n"
         "  --cookies <file>       cookie file for the source fetcher\n"
         "  --sync_only            skip the stages and sync existing artifacts\n"
         "  --non-interactive      do not listen for 'skip' on stdin\n"
         "  --config <yaml>        runtime configuration file\n";
}

} // namespace miner::runtime

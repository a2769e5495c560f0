#include "internal/runtime/cli_options.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using miner::runtime::CliOptions;
using miner::runtime::ParseCliOptions;
using miner::runtime::RunMode;

CliOptions Parse(std::initializer_list<const char*> args) {
  std::vector<const char*> argv{"miner"};
  argv.insert(argv.end(), args.begin(), args.end());
  return ParseCliOptions(static_cast<int>(argv.size()), argv.data());
}

bool Rejects(std::initializer_list<const char*> args) {
  try {
    Parse(args);
  } catch (const miner::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto options = Parse({"--url", "https://youtu.be/abc"});
  assert(options.url == "https://youtu.be/abc");
  assert(options.process.empty());
  assert(options.mode == RunMode::kLocal);
  assert(!options.cleanup);
  assert(!options.sync_only);
  assert(!options.non_interactive);
  assert(options.config_path.empty());
}

void TestAllOptions() {
  const auto options = Parse({"--url=https://youtu.be/abc", "--process", "audio,video", "--process=emotions", "--mode", "db", "--cleanup",
                              "--models-dir", "/models", "--cookies=/tmp/cookies.txt", "--sync-only", "--non-interactive", "--config",
                              "miner.yaml"});

  assert(options.url == "https://youtu.be/abc");
  assert(options.process == (std::vector<std::string>{"audio,video", "emotions"}));
  assert(options.mode == RunMode::kDb);
  assert(options.cleanup);
  assert(options.models_dir == "/models");
  assert(options.cookies == "/tmp/cookies.txt");
  assert(options.sync_only);
  assert(options.non_interactive);
  assert(options.config_path == "miner.yaml");
}

void TestUnderscoreSpellings() {
  const auto options = Parse({"--url", "x", "--models_dir", "/m", "--sync_only", "--non_interactive"});
  assert(options.models_dir == "/m");
  assert(options.sync_only);
  assert(options.non_interactive);
}

void TestHelpDoesNotNeedUrl() {
  const auto options = Parse({"--help"});
  assert(options.help);
  assert(!miner::runtime::Usage().empty());
}

void TestInvalidCommandLines() {
  assert(Rejects({}));
  assert(Rejects({"--process", "audio"}));
  assert(Rejects({"--url"}));
  assert(Rejects({"--url", "x", "--mode", "cloud"}));
  assert(Rejects({"--url", "x", "--verbose"}));
  assert(Rejects({"--url", "x", "--cleanup=yes"}));
  assert(Rejects({"--url", "x", "positional"}));
}

} // namespace

int main() {
  TestDefaults();
  TestAllOptions();
  TestUnderscoreSpellings();
  TestHelpDoesNotNeedUrl();
  TestInvalidCommandLines();

  std::cout << "miner_unit_cli_options: pass\n";
  return 0;
}

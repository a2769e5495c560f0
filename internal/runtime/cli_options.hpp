#pragma once

#include <string>
#include <vector>

namespace miner::runtime {

enum class RunMode {
  kLocal, // stages only
  kDb,    // stages, then sync
};

struct CliOptions {
  std::string              url;
  std::vector<std::string> process; // raw --process values, may be comma-separated
  RunMode                  mode = RunMode::kLocal;
  bool                     cleanup = false;
  std::string              models_dir;
  std::string              cookies;
  bool                     sync_only       = false;
  bool                     non_interactive = false;
  std::string              config_path;
  bool                     help = false;
};

/*
  Parses the command line.

  Options take their value either as the next argument or inline
  (--mode=db). Underscore and dash spellings are both accepted
  (--sync_only / --sync-only). Throws util::InvalidArgument on unknown
  options, missing values or a missing --url.
*/
CliOptions ParseCliOptions(int argc, const char* const* argv);

std::string Usage();

} // namespace miner::runtime

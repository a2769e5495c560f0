#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/subprocess.hpp"

namespace miner::collaborators {

/*
  Per-run values substituted into command templates ({url}, {video},
  {models_dir}, ...) plus environment exported to every tool.
*/
struct CommandContext {
  std::map<std::string, std::string> vars;
  std::map<std::string, std::string> env;
};

/*
  Expands an argv template.

  Every {name} with a known value is replaced. An element consisting of
  a single placeholder whose value is empty is dropped, together with
  the option flag right before it ("--cookies {cookies}" disappears when
  no cookie file is in use).
*/
std::vector<std::string> ExpandArgv(const google::protobuf::RepeatedPtrField<std::string>& argv, const std::map<std::string, std::string>& vars);

// Template + context (+ per-call vars) -> ready-to-run options.
util::SubprocessOptions BuildCommand(const miner::runtime::config::CommandConfig& command, const CommandContext& context,
                                     const std::map<std::string, std::string>& call_vars = {});

} // namespace miner::collaborators

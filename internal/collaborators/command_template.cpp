#include "command_template.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace miner::collaborators {

namespace {

bool IsLonePlaceholder(const std::string& arg) {
  return arg.size() > 2 && arg.front() == '{' && arg.back() == '}' && arg.find('{', 1) == std::string::npos;
}

} // namespace

std::vector<std::string> ExpandArgv(const google::protobuf::RepeatedPtrField<std::string>& argv, const std::map<std::string, std::string>& vars) {
  std::vector<std::string> out;
  out.reserve(argv.size());

  for (const auto& arg : argv) {
    if (IsLonePlaceholder(arg)) {
      auto it = vars.find(arg.substr(1, arg.size() - 2));
      if (it != vars.end() && it->second.empty()) {
        if (out.size() > 1 && out.back().rfind("-", 0) == 0) {
          out.pop_back();
        }
        continue;
      }
    }
    out.push_back(util::Substitute(arg, vars));
  }
  return out;
}

util::SubprocessOptions BuildCommand(const miner::runtime::config::CommandConfig& command, const CommandContext& context,
                                     const std::map<std::string, std::string>& call_vars) {
  auto vars = context.vars;
  for (const auto& [key, value] : call_vars) {
    vars[key] = value;
  }

  util::SubprocessOptions options;
  options.argv = ExpandArgv(command.argv(), vars);
  if (options.argv.empty()) {
    throw util::InvalidArgument("command template expands to an empty argv");
  }

  options.env = context.env;
  for (const auto& [key, value] : command.env()) {
    options.env[key] = util::Substitute(value, vars);
  }
  return options;
}

} // namespace miner::collaborators

#include "internal/collaborators/command_template.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using miner::collaborators::BuildCommand;
using miner::collaborators::CommandContext;
using miner::collaborators::ExpandArgv;
using miner::runtime::config::CommandConfig;

CommandConfig MakeCommand(std::initializer_list<const char*> argv) {
  CommandConfig command;
  for (const char* arg : argv) command.add_argv(arg);
  return command;
}

void TestPlaceholdersAreSubstituted() {
  const auto command = MakeCommand({"yt-dlp", "-o", "{output_dir}/video.%(ext)s", "{url}"});
  const auto argv    = ExpandArgv(command.argv(), {{"output_dir", "/runs/k1"}, {"url", "https://youtu.be/k1"}});
  assert(argv == (std::vector<std::string>{"yt-dlp", "-o", "/runs/k1/video.%(ext)s", "https://youtu.be/k1"}));
}

void TestEmptyPlaceholderDropsItsFlag() {
  const auto command = MakeCommand({"yt-dlp", "--cookies", "{cookies}", "{url}"});

  assert(ExpandArgv(command.argv(), {{"cookies", ""}, {"url", "U"}}) == (std::vector<std::string>{"yt-dlp", "U"}));
  assert(ExpandArgv(command.argv(), {{"cookies", "/c.txt"}, {"url", "U"}}) ==
         (std::vector<std::string>{"yt-dlp", "--cookies", "/c.txt", "U"}));

  // the program name is never taken for a flag
  assert(ExpandArgv(MakeCommand({"-tool", "{x}"}).argv(), {{"x", ""}}) == std::vector<std::string>{"-tool"});
}

void TestUnknownPlaceholdersStay() {
  const auto argv = ExpandArgv(MakeCommand({"tool", "{unknown}", "--fmt={x}"}).argv(), {{"x", "json"}});
  assert(argv == (std::vector<std::string>{"tool", "{unknown}", "--fmt=json"}));
}

void TestBuildCommandMergesVarsAndEnv() {
  auto command = MakeCommand({"narrate", "--models-dir", "{models_dir}", "{video}"});
  (*command.mutable_env())["NARRATE_CACHE"] = "{models_dir}/narrate";

  CommandContext context;
  context.vars = {{"models_dir", "/models"}, {"video", "ignored.mp4"}};
  context.env  = {{"HF_HOME", "/models"}};

  const auto options = BuildCommand(command, context, {{"video", "/runs/k1/video.mp4"}});
  assert(options.argv == (std::vector<std::string>{"narrate", "--models-dir", "/models", "/runs/k1/video.mp4"}));
  assert(options.env.at("HF_HOME") == "/models");
  assert(options.env.at("NARRATE_CACHE") == "/models/narrate");
  assert(options.stdin_data.empty());
}

void TestEmptyArgvIsRejected() {
  bool threw = false;
  try {
    BuildCommand(CommandConfig{}, CommandContext{});
  } catch (const miner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlaceholdersAreSubstituted();
  TestEmptyPlaceholderDropsItsFlag();
  TestUnknownPlaceholdersStay();
  TestBuildCommandMergesVarsAndEnv();
  TestEmptyArgvIsRejected();

  std::cout << "miner_unit_command_template: pass\n";
  return 0;
}

#include <unistd.h>

#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/cancellation.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "internal/runtime/application.hpp"
#include "internal/runtime/cli_options.hpp"
#include "internal/util/errors.hpp"

namespace {

void ShutdownTelemetry() {
  miner::observability::ShutdownLogging();
  miner::observability::ShutdownMetrics();
  miner::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  // a collaborator exiting early must not kill us while we write its stdin
  std::signal(SIGPIPE, SIG_IGN);

  miner::runtime::CliOptions options;
  try {
    options = miner::runtime::ParseCliOptions(argc, argv);
  } catch (const miner::util::InvalidArgument& e) {
    std::cerr << "miner: " << e.what() << "\n\n" << miner::runtime::Usage();
    return 1;
  }
  if (options.help) {
    std::cerr << miner::runtime::Usage();
    return 0;
  }

  // stdout carries progress events only; logging goes to stderr from the start
  miner::observability::InitializeLogging(miner::runtime::config::RuntimeConfig{});

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = miner::config::ConfigLoader::Load(options.config_path);

    miner::observability::InitializeTracing(config);
    miner::observability::InitializeMetrics(config);
    miner::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Control plane: progress out, skip commands in
    // ------------------------------------------------------------
    miner::pipeline::ProgressReporter    progress(STDOUT_FILENO);
    miner::pipeline::CancellationToken   token;
    miner::pipeline::CancellationChannel channel(STDIN_FILENO, token);
    if (!options.non_interactive) {
      channel.Start();
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto context       = miner::runtime::BuildCommandContext(options);
    auto collaborators = miner::factory::BuildCollaborators(config, context, progress);
    auto repositories  = [config]() { return miner::factory::BuildRepository(config); };

    miner::runtime::Application app(config, options, std::move(collaborators), repositories, progress, token);

    MINER_LOG_INFO("miner started", {miner::observability::StringField("url", options.url), miner::observability::BoolField("sync_only", options.sync_only)});
    const int exit_code = app.Run();

    channel.Stop();
    MINER_LOG_INFO("miner finished", {miner::observability::IntField("exit_code", exit_code)});
    ShutdownTelemetry();
    return exit_code;
  } catch (const std::exception& e) {
    MINER_LOG_ERROR("Fatal error", {miner::observability::StringField("error", e.what())});
    ShutdownTelemetry();
    return 1;
  }
}

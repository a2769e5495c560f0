#pragma once

#include "config/config.pb.h"
#include "internal/collaborators/collaborators.hpp"
#include "internal/collaborators/command_template.hpp"
#include "internal/pipeline/artifact_cache.hpp"
#include "internal/pipeline/cancellation.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "internal/runtime/cli_options.hpp"
#include "internal/sync/sync_engine.hpp"

namespace miner::runtime {

// {models_dir} and {cookies} placeholders plus the model cache
// environment (HF_HOME, MINER_CACHE_ROOT) for every external tool.
collaborators::CommandContext BuildCommandContext(const CliOptions& options);

/*
  One invocation of the miner.

  run mode:       download, requested stages, sync when --mode db
  sync-only mode: sync whatever artifacts the run directory holds

  Returns the process exit code. Fatal errors (unusable URL, failed
  download) propagate as util::FatalRunError.
*/
class Application {
 public:
  Application(miner::runtime::config::RuntimeConfig config, CliOptions options, collaborators::Collaborators collaborators,
              sync::RepositoryProvider repositories, pipeline::ProgressReporter& progress, pipeline::CancellationToken& token);

  int Run();

 private:
  int  RunPipeline();
  int  SyncOnly();
  bool SyncAndCleanup(const pipeline::ArtifactCache& cache, const v1::SourceInfo& source);

  miner::runtime::config::RuntimeConfig config_;
  CliOptions                            options_;
  collaborators::Collaborators          collaborators_;
  sync::RepositoryProvider              repositories_;
  pipeline::ProgressReporter&           progress_;
  pipeline::CancellationToken&          token_;
};

} // namespace miner::runtime

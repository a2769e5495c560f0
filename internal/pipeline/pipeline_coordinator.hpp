#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>

#include "internal/collaborators/collaborators.hpp"
#include "internal/pipeline/artifact_cache.hpp"
#include "internal/pipeline/cancellation.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "internal/pipeline/stage.hpp"
#include "internal/pipeline/stage_executor.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::pipeline {

// Terminal state of one requested stage.
enum class StageStatus {
  kCompleted,
  kCached,
  kSkipped,
  kFailed,
};

const char* StageStatusName(StageStatus status);

struct CoordinatorOptions {
  std::filesystem::path output_root{"output"};
  ExecutorOptions       executor;
};

struct RunReport {
  std::string                      run_key;
  RunPaths                         paths;
  v1::SourceInfo                   source;
  std::map<StageKind, StageStatus> stages;
};

// Source information used when nothing better is known.
v1::SourceInfo PlaceholderSource(const std::string& run_key, const std::string& title);

/*
  Drives one run.

    1. resolve the run key, create/reuse <output_root>/<run_key>/
    2. download the media (or reuse a local video.mp4)
    3. for every requested stage, in the fixed order:
         cached   -> PRG:<Stage>:Cached:100
         otherwise PRG:<Stage>:Initializing...:0, arm the token,
                   execute in a worker, persist, PRG:<Stage>:100:100

  Stage problems never abort the run. Only a failed download (or an
  unusable URL) throws util::FatalRunError.
*/
class PipelineCoordinator {
 public:
  PipelineCoordinator(collaborators::Collaborators collaborators, ProgressReporter& progress, CancellationToken& token, CoordinatorOptions options = {});

  RunReport Run(const std::string& url, const std::set<StageKind>& stages);

  // Step 2 on its own.
  v1::SourceInfo AcquireSource(const std::string& url, const std::string& run_key, const ArtifactCache& cache);

 private:
  StageStatus      RunStage(StageKind kind, const v1::SourceInfo& source, const ArtifactCache& cache);
  StageComputation ComputationFor(StageKind kind, const v1::SourceInfo& source, const ArtifactCache& cache);

  collaborators::Collaborators collaborators_;
  ProgressReporter&            progress_;
  CancellationToken&           token_;
  CoordinatorOptions           options_;
  StageExecutor                executor_;
};

} // namespace miner::pipeline

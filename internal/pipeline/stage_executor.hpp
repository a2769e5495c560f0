#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

#include "internal/pipeline/cancellation.hpp"
#include "internal/pipeline/progress_reporter.hpp"
#include "miner/v1/artifacts.pb.h"

namespace miner::pipeline {

// Runs inside the worker process. Throwing is allowed: it becomes an
// absent result.
using StageComputation = std::function<v1::StageOutput()>;

enum class StageOutcome {
  kCompleted, // worker returned a payload
  kSkipped,   // cancelled by the operator
  kFailed,    // worker threw, crashed or returned nothing
};

const char* StageOutcomeName(StageOutcome outcome);

struct ExecutionResult {
  StageOutcome                   outcome = StageOutcome::kFailed;
  std::optional<v1::StageOutput> output;
};

struct ExecutorOptions {
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds terminate_grace{2000};
};

/*
  Runs one stage computation in a forked worker process.

  - the worker is the leader of its own process group; cancellation
    terminates the whole group (SIGTERM, grace period, SIGKILL) so any
    tool it spawned goes with it
  - the result travels back over a pipe as one length-prefixed
    serialized StageOutput
  - the parent polls the cancellation token every poll_interval while
    waiting; on cancellation it emits SKIP_ACK and returns kSkipped
  - an exception inside the worker emits PRG:<label>:Error:100 there
    and yields kFailed here; it never crashes the run

  Exactly one worker exists at a time: Execute() blocks until the
  worker is reaped.
*/
class StageExecutor {
 public:
  StageExecutor(ProgressReporter& progress, CancellationToken& token, ExecutorOptions options = {});

  ExecutionResult Execute(std::string_view label, const StageComputation& compute);

 private:
  [[noreturn]] void RunWorker(std::string_view label, const StageComputation& compute, int result_fd);
  void              TerminateWorker(pid_t pid);

  ProgressReporter&  progress_;
  CancellationToken& token_;
  ExecutorOptions    options_;
};

} // namespace miner::pipeline

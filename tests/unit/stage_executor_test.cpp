#include "internal/pipeline/stage_executor.hpp"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using miner::pipeline::CancellationToken;
using miner::pipeline::ExecutorOptions;
using miner::pipeline::ProgressReporter;
using miner::pipeline::StageExecutor;
using miner::pipeline::StageOutcome;

/*
  Captures the progress stream of one test through a pipe; workers
  inherit the write end, so reading happens after the executor returns.
*/
class ProgressCapture {
 public:
  ProgressCapture() {
    int fds[2];
    if (::pipe(fds) != 0) throw std::runtime_error("pipe");
    read_fd_  = fds[0];
    write_fd_ = fds[1];
  }

  ~ProgressCapture() {
    if (read_fd_ >= 0) ::close(read_fd_);
    if (write_fd_ >= 0) ::close(write_fd_);
  }

  int WriteFd() const {
    return write_fd_;
  }

  std::string Finish() {
    ::close(write_fd_);
    write_fd_ = -1;

    std::string out;
    char        buf[1024];
    ssize_t     n;
    while ((n = ::read(read_fd_, buf, sizeof(buf))) > 0) {
      out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
  }

 private:
  int read_fd_  = -1;
  int write_fd_ = -1;
};

ExecutorOptions FastOptions() {
  ExecutorOptions options;
  options.poll_interval   = std::chrono::milliseconds(20);
  options.terminate_grace = std::chrono::milliseconds(300);
  return options;
}

void TestCompletedWorkerReturnsPayload() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  auto result = executor.Execute("Video", [] {
    miner::v1::StageOutput output;
    output.mutable_narrative()->set_text("people walking on a beach");
    return output;
  });

  assert(result.outcome == StageOutcome::kCompleted);
  assert(result.output);
  assert(result.output->narrative().text() == "people walking on a beach");
  assert(capture.Finish().empty());
}

void TestThrowingWorkerReportsError() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  auto result = executor.Execute("Audio", []() -> miner::v1::StageOutput { throw std::runtime_error("model missing"); });

  assert(result.outcome == StageOutcome::kFailed);
  assert(!result.output);
  assert(capture.Finish() == "PRG:Audio:Error:100\n");
}

void TestEmptyOutputIsFailure() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  auto result = executor.Execute("Emotions", [] { return miner::v1::StageOutput{}; });
  assert(result.outcome == StageOutcome::kFailed);
  capture.Finish();
}

void TestCrashedWorkerIsFailure() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  auto result = executor.Execute("Video", []() -> miner::v1::StageOutput { std::abort(); });
  assert(result.outcome == StageOutcome::kFailed);
  capture.Finish();
}

void TestCancelTerminatesWorker() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    token.Cancel();
  });

  const auto start  = std::chrono::steady_clock::now();
  auto       result = executor.Execute("Audio", []() -> miner::v1::StageOutput {
    std::this_thread::sleep_for(std::chrono::seconds(30));
    miner::v1::StageOutput output;
    output.mutable_transcript()->set_text("too late");
    return output;
  });
  canceller.join();

  assert(result.outcome == StageOutcome::kSkipped);
  assert(!result.output);
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
  assert(capture.Finish() == "SKIP_ACK\n");
}

void TestWorkersRunSequentially() {
  ProgressCapture   capture;
  ProgressReporter  progress(capture.WriteFd());
  CancellationToken token;
  StageExecutor     executor(progress, token, FastOptions());

  for (int i = 0; i < 3; ++i) {
    auto result = executor.Execute("Metadata", [i] {
      miner::v1::StageOutput output;
      output.mutable_metadata()->set_title("run " + std::to_string(i));
      return output;
    });
    assert(result.outcome == StageOutcome::kCompleted);
    assert(result.output->metadata().title() == "run " + std::to_string(i));
  }
  capture.Finish();
}

} // namespace

int main() {
  TestCompletedWorkerReturnsPayload();
  TestThrowingWorkerReportsError();
  TestEmptyOutputIsFailure();
  TestCrashedWorkerIsFailure();
  TestCancelTerminatesWorker();
  TestWorkersRunSequentially();

  std::cout << "miner_unit_stage_executor: pass\n";
  return 0;
}

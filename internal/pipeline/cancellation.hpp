#pragma once

#include <atomic>
#include <string_view>
#include <thread>

namespace miner::pipeline {

/*
  Stage-scoped stop flag.

  The coordinator arms (clears) it right before each stage, the
  cancellation channel sets it, the executor polls it. It never leaves
  the control process: a cancelled worker is terminated, not signalled
  through the flag.
*/
class CancellationToken {
 public:
  void Arm() {
    cancelled_.store(false);
  }

  void Cancel() {
    cancelled_.store(true);
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

 private:
  std::atomic<bool> cancelled_{false};
};

// "skip", case-insensitive, surrounding whitespace ignored
bool IsSkipCommand(std::string_view line);

/*
  Reads line commands from a descriptor (stdin) on its own thread for
  the lifetime of the run. EOF ends the listener; unrecognised lines are
  ignored.
*/
class CancellationChannel {
 public:
  CancellationChannel(int fd, CancellationToken& token);
  ~CancellationChannel();

  CancellationChannel(const CancellationChannel&)            = delete;
  CancellationChannel& operator=(const CancellationChannel&) = delete;

  void Start();
  void Stop();

 private:
  void Loop();

  int                fd_;
  CancellationToken& token_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace miner::pipeline

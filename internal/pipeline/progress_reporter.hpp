#pragma once

#include <unistd.h>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace miner::pipeline {

/*
  Progress protocol, one event per line on a dedicated stream:

    PRG:<StageLabel>:<status-or-current>:<total>
    SKIP_ACK

  Each line goes out in a single write(2) so lines from worker processes
  sharing the descriptor never interleave. ':' and line breaks inside a
  field are replaced with spaces.
*/

struct ProgressEvent {
  std::string label;
  std::string status; // free text or the numeric current value
  std::string total;
  bool        skip_ack = false;
};

std::string FormatProgress(std::string_view label, std::string_view status, std::string_view total);

// Parses one protocol line (without the trailing newline).
std::optional<ProgressEvent> ParseProgressLine(std::string_view line);

class ProgressReporter {
 public:
  explicit ProgressReporter(int fd = STDOUT_FILENO);

  void Emit(std::string_view label, std::string_view status, int total = 100);
  void Emit(std::string_view label, int current, int total);
  void SkipAck();

  int Fd() const {
    return fd_;
  }

 private:
  void WriteLine(const std::string& line);

  int        fd_;
  std::mutex mutex_;
};

} // namespace miner::pipeline

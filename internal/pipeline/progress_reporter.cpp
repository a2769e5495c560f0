#include "progress_reporter.hpp"

#include <cerrno>

#include "internal/util/strings.hpp"

namespace miner::pipeline {

namespace {

std::string Sanitize(std::string_view field) {
  std::string out(field);
  for (auto& c : out) {
    if (c == ':' || c == '\n' || c == '\r') c = ' ';
  }
  return out;
}

} // namespace

std::string FormatProgress(std::string_view label, std::string_view status, std::string_view total) {
  return "PRG:" + Sanitize(label) + ":" + Sanitize(status) + ":" + Sanitize(total);
}

std::optional<ProgressEvent> ParseProgressLine(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);

  if (line == "SKIP_ACK") {
    ProgressEvent event;
    event.skip_ack = true;
    return event;
  }

  auto parts = util::Split(line, ':');
  if (parts.size() != 4 || parts[0] != "PRG") return std::nullopt;

  ProgressEvent event;
  event.label  = parts[1];
  event.status = parts[2];
  event.total  = parts[3];
  return event;
}

ProgressReporter::ProgressReporter(int fd) : fd_(fd) {
}

void ProgressReporter::Emit(std::string_view label, std::string_view status, int total) {
  WriteLine(FormatProgress(label, status, std::to_string(total)));
}

void ProgressReporter::Emit(std::string_view label, int current, int total) {
  WriteLine(FormatProgress(label, std::to_string(current), std::to_string(total)));
}

void ProgressReporter::SkipAck() {
  WriteLine("SKIP_ACK");
}

void ProgressReporter::WriteLine(const std::string& line) {
  const std::string framed = line + "\n";

  std::lock_guard lock(mutex_);
  std::size_t     offset = 0;
  while (offset < framed.size()) {
    ssize_t n = ::write(fd_, framed.data() + offset, framed.size() - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      // the controller went away; progress is advisory from here on
      return;
    }
    offset += static_cast<std::size_t>(n);
  }
}

} // namespace miner::pipeline

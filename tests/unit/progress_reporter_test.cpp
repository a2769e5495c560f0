#include "internal/pipeline/progress_reporter.hpp"

#include <unistd.h>

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using miner::pipeline::FormatProgress;
using miner::pipeline::ParseProgressLine;
using miner::pipeline::ProgressReporter;

std::string DrainPipe(int fd) {
  std::string out;
  char        buf[4096];
  ssize_t     n;
  while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

void TestFormatSanitizesSeparators() {
  assert(FormatProgress("Audio", "Transcribing...", "100") == "PRG:Audio:Transcribing...:100");
  assert(FormatProgress("Audio", "a:b\nc", "100") == "PRG:Audio:a b c:100");
}

void TestParseAcceptsProtocolLines() {
  auto event = ParseProgressLine("PRG:Video:Analyzing Scenes...:100\r\n");
  assert(event);
  assert(!event->skip_ack);
  assert(event->label == "Video");
  assert(event->status == "Analyzing Scenes...");
  assert(event->total == "100");

  auto ack = ParseProgressLine("SKIP_ACK");
  assert(ack && ack->skip_ack);
}

void TestParseRejectsMalformedLines() {
  assert(!ParseProgressLine("PRG:Video:100"));
  assert(!ParseProgressLine("XYZ:Video:1:100"));
  assert(!ParseProgressLine("PRG:Video:a:b:100"));
  assert(!ParseProgressLine(""));
}

void TestEmitWritesWholeLines() {
  int fds[2];
  const int rc = ::pipe(fds);
  assert(rc == 0);

  {
    ProgressReporter reporter(fds[1]);
    reporter.Emit("Metadata", "Checking Generator...");
    reporter.Emit("Emotions", 42, 100);
    reporter.SkipAck();
  }
  ::close(fds[1]);

  const auto out = DrainPipe(fds[0]);
  ::close(fds[0]);
  assert(out == "PRG:Metadata:Checking Generator...:100\nPRG:Emotions:42:100\nSKIP_ACK\n");
}

void TestConcurrentEmittersNeverInterleave() {
  int fds[2];
  const int rc = ::pipe(fds);
  assert(rc == 0);

  constexpr int kThreads = 4;
  constexpr int kLines   = 50;

  std::string result;
  std::thread reader([&] { result = DrainPipe(fds[0]); });

  {
    ProgressReporter         reporter(fds[1]);
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
      writers.emplace_back([&reporter, t] {
        for (int i = 0; i < kLines; ++i) {
          reporter.Emit("Stage" + std::to_string(t), i, kLines);
        }
      });
    }
    for (auto& w : writers) w.join();
  }
  ::close(fds[1]);
  reader.join();
  ::close(fds[0]);

  int         lines = 0;
  std::size_t start = 0;
  for (auto pos = result.find('\n'); pos != std::string::npos; pos = result.find('\n', start)) {
    auto event = ParseProgressLine(std::string_view(result).substr(start, pos - start));
    assert(event);
    assert(event->label.rfind("Stage", 0) == 0);
    ++lines;
    start = pos + 1;
  }
  assert(lines == kThreads * kLines);
}

} // namespace

int main() {
  TestFormatSanitizesSeparators();
  TestParseAcceptsProtocolLines();
  TestParseRejectsMalformedLines();
  TestEmitWritesWholeLines();
  TestConcurrentEmittersNeverInterleave();

  std::cout << "miner_unit_progress_reporter: pass\n";
  return 0;
}

#include "cancellation.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "internal/util/strings.hpp"

namespace miner::pipeline {

bool IsSkipCommand(std::string_view line) {
  return util::ToLower(util::Trim(line)) == "skip";
}

CancellationChannel::CancellationChannel(int fd, CancellationToken& token) : fd_(fd), token_(token) {
}

CancellationChannel::~CancellationChannel() {
  Stop();
}

void CancellationChannel::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CancellationChannel::Loop, this);
}

void CancellationChannel::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void CancellationChannel::Loop() {
  std::string pending;
  char        buf[256];

  // poll with a timeout so Stop() is observed without closing the fd
  while (running_) {
    pollfd pfd{fd_, POLLIN, 0};
    int    rc = ::poll(&pfd, 1, 100);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (n == 0) {
      // a last command without a trailing newline
      if (IsSkipCommand(pending)) token_.Cancel();
      break;
    }

    pending.append(buf, static_cast<std::size_t>(n));
    for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n')) {
      if (IsSkipCommand(std::string_view(pending).substr(0, pos))) {
        token_.Cancel();
      }
      pending.erase(0, pos + 1);
    }
  }
}

} // namespace miner::pipeline

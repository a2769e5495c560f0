#include "stage_executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace miner::pipeline {

namespace {

bool WriteAll(int fd, const char* data, std::size_t size) {
  std::size_t offset = 0;
  while (offset < size) {
    ssize_t n = ::write(fd, data + offset, size - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    offset += static_cast<std::size_t>(n);
  }
  return true;
}

// Non-blocking reap; true once the child is gone.
bool TryReap(pid_t pid, int* status) {
  pid_t rc;
  do {
    rc = ::waitpid(pid, status, WNOHANG);
  } while (rc < 0 && errno == EINTR);
  return rc == pid || (rc < 0 && errno == ECHILD);
}

void BlockingReap(pid_t pid, int* status) {
  pid_t rc;
  do {
    rc = ::waitpid(pid, status, 0);
  } while (rc < 0 && errno == EINTR);
}

std::optional<v1::StageOutput> DecodeFrame(const std::string& frame) {
  if (frame.size() < sizeof(std::uint64_t)) return std::nullopt;

  std::uint64_t length = 0;
  std::memcpy(&length, frame.data(), sizeof(length));
  if (frame.size() - sizeof(length) != length) return std::nullopt;

  v1::StageOutput output;
  if (!output.ParseFromArray(frame.data() + sizeof(length), static_cast<int>(length))) {
    return std::nullopt;
  }
  if (output.payload_case() == v1::StageOutput::PAYLOAD_NOT_SET) return std::nullopt;
  return output;
}

} // namespace

const char* StageOutcomeName(StageOutcome outcome) {
  switch (outcome) {
    case StageOutcome::kCompleted:
      return "completed";
    case StageOutcome::kSkipped:
      return "skipped";
    case StageOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

StageExecutor::StageExecutor(ProgressReporter& progress, CancellationToken& token, ExecutorOptions options)
    : progress_(progress), token_(token), options_(options) {
}

ExecutionResult StageExecutor::Execute(std::string_view label, const StageComputation& compute) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) < 0) {
    throw util::FatalRunError("cannot create worker pipe: " + std::string(std::strerror(errno)));
  }

  // buffered stdio would otherwise be flushed twice, once per process
  std::fflush(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    throw util::FatalRunError("cannot fork stage worker: " + reason);
  }

  if (pid == 0) {
    ::close(fds[0]);
    RunWorker(label, compute, fds[1]);
  }

  ::close(fds[1]);
  // mirror the child's setpgid so a cancel right after fork hits the group
  ::setpgid(pid, pid);

  const int   result_fd = fds[0];
  std::string frame;
  char        buf[8192];
  bool        eof = false;

  while (!eof) {
    if (token_.IsCancelled()) {
      ::close(result_fd);
      TerminateWorker(pid);
      MINER_LOG_INFO("stage cancelled", {observability::StringField("stage", label)});
      progress_.SkipAck();
      return {StageOutcome::kSkipped, std::nullopt};
    }

    pollfd pfd{result_fd, POLLIN, 0};
    int    rc = ::poll(&pfd, 1, static_cast<int>(options_.poll_interval.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      ::close(result_fd);
      TerminateWorker(pid);
      throw util::FatalRunError("poll() on worker pipe failed: " + std::string(std::strerror(errno)));
    }
    if (rc == 0) continue;

    ssize_t n = ::read(result_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      eof = true;
    } else if (n == 0) {
      eof = true;
    } else {
      frame.append(buf, static_cast<std::size_t>(n));
    }
  }
  ::close(result_fd);

  int status = 0;
  BlockingReap(pid, &status);

  if (WIFSIGNALED(status)) {
    MINER_LOG_ERROR("stage worker crashed", {observability::StringField("stage", label), observability::IntField("signal", WTERMSIG(status))});
    return {StageOutcome::kFailed, std::nullopt};
  }

  auto output = DecodeFrame(frame);
  if (!output) {
    return {StageOutcome::kFailed, std::nullopt};
  }
  return {StageOutcome::kCompleted, std::move(output)};
}

void StageExecutor::RunWorker(std::string_view label, const StageComputation& compute, int result_fd) {
  ::setpgid(0, 0);
  // a controller that dies must not leave a model resident
  ::prctl(PR_SET_PDEATHSIG, SIGTERM);

  // stdin belongs to the cancellation channel
  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }

  v1::StageOutput output;
  try {
    output = compute();
  } catch (const std::exception& e) {
    MINER_LOG_ERROR("stage computation failed", {observability::StringField("stage", label), observability::StringField("error", e.what())});
    progress_.Emit(label, "Error", 100);
    output.Clear();
  } catch (...) {
    MINER_LOG_ERROR("stage computation failed", {observability::StringField("stage", label), observability::StringField("error", "unknown error")});
    progress_.Emit(label, "Error", 100);
    output.Clear();
  }

  std::string   payload = output.SerializeAsString();
  std::uint64_t length  = payload.size();

  std::string frame(reinterpret_cast<const char*>(&length), sizeof(length));
  frame += payload;

  const bool sent = WriteAll(result_fd, frame.data(), frame.size());
  ::close(result_fd);
  ::_exit(sent ? 0 : 1);
}

void StageExecutor::TerminateWorker(pid_t pid) {
  int status = 0;
  if (TryReap(pid, &status)) return;

  ::kill(-pid, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + options_.terminate_grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (TryReap(pid, &status)) {
      // stragglers spawned by the worker share its group
      ::kill(-pid, SIGKILL);
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ::kill(-pid, SIGKILL);
  BlockingReap(pid, &status);
}

} // namespace miner::pipeline

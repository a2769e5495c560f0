#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

extern char** environ;

namespace miner::util {

namespace {

void ClosePipe(int fds[2]) {
  if (fds[0] >= 0) ::close(fds[0]);
  if (fds[1] >= 0) ::close(fds[1]);
}

void SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    auto             eq = kv.find('=');
    if (eq != std::string_view::npos && overrides.contains(std::string(kv.substr(0, eq)))) {
      continue;
    }
    env.emplace_back(kv);
  }
  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

} // namespace

Subprocess::Subprocess(SubprocessOptions options) : options_(std::move(options)) {
  if (options_.argv.empty()) {
    throw InvalidArgument("subprocess argv must not be empty");
  }

  // a tool that exits early must not take us down when we write its stdin
  std::signal(SIGPIPE, SIG_IGN);

  Spawn();
}

Subprocess::~Subprocess() {
  if (!exited_) {
    Terminate(std::chrono::milliseconds(500));
  }
  CloseFds();
}

void Subprocess::Spawn() {
  int in_pipe[2]  = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};

  if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
    const std::string reason = std::strerror(errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw CollaboratorError("failed to create pipes: " + reason);
  }

  // everything the child needs is materialised before fork: only
  // async-signal-safe calls happen between fork and exec
  std::vector<char*> argv;
  argv.reserve(options_.argv.size() + 1);
  for (auto& arg : options_.argv) argv.push_back(arg.data());
  argv.push_back(nullptr);

  auto               env_storage = BuildEnvironment(options_.env);
  std::vector<char*> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto& kv : env_storage) envp.push_back(kv.data());
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw CollaboratorError("fork() failed: " + reason);
  }

  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvpe(argv[0], argv.data(), envp.data());
    ::_exit(127);
  }

  pid_ = pid;
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  stdin_fd_  = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  SetNonBlocking(stdin_fd_);
  SetNonBlocking(stdout_fd_);
  SetNonBlocking(stderr_fd_);

  if (options_.stdin_data.empty()) {
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }
}

SubprocessResult Subprocess::Wait(const OutputCallback& on_stdout) {
  SubprocessResult result;
  std::size_t      stdin_offset = 0;
  char             buf[4096];

  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    pollfd fds[3];
    int    n = 0;

    int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
    if (stdin_fd_ >= 0) {
      stdin_idx = n;
      fds[n++]  = {stdin_fd_, POLLOUT, 0};
    }
    if (stdout_fd_ >= 0) {
      stdout_idx = n;
      fds[n++]   = {stdout_fd_, POLLIN, 0};
    }
    if (stderr_fd_ >= 0) {
      stderr_idx = n;
      fds[n++]   = {stderr_fd_, POLLIN, 0};
    }

    int rc = ::poll(fds, n, 200);
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw CollaboratorError("poll() failed: " + std::string(std::strerror(errno)));
    }

    if (stdin_idx >= 0 && fds[stdin_idx].revents != 0) {
      if (fds[stdin_idx].revents & POLLOUT) {
        const auto& data    = options_.stdin_data;
        ssize_t     written = ::write(stdin_fd_, data.data() + stdin_offset, data.size() - stdin_offset);
        if (written > 0) stdin_offset += static_cast<std::size_t>(written);
        if ((written < 0 && errno != EAGAIN && errno != EINTR) || stdin_offset >= data.size()) {
          ::close(stdin_fd_);
          stdin_fd_ = -1;
        }
      } else {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
      }
    }

    auto drain = [&](int idx, int& fd, std::string& sink, bool is_stdout) {
      if (idx < 0 || fds[idx].revents == 0) return;
      ssize_t got = ::read(fd, buf, sizeof(buf));
      if (got > 0) {
        sink.append(buf, static_cast<std::size_t>(got));
        if (is_stdout && on_stdout) on_stdout(std::string_view(buf, static_cast<std::size_t>(got)));
        return;
      }
      if (got == 0 || (errno != EAGAIN && errno != EINTR)) {
        ::close(fd);
        fd = -1;
      }
    };

    drain(stdout_idx, stdout_fd_, result.stdout_data, true);
    drain(stderr_idx, stderr_fd_, result.stderr_data, false);
  }

  if (stdin_fd_ >= 0) {
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }

  Reap(true);
  result.exit_code = exit_code_;
  return result;
}

bool Subprocess::Reap(bool block) {
  if (exited_ || pid_ <= 0) return true;

  int   status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == pid_) {
    exit_code_ = DecodeStatus(status);
    exited_    = true;
    return true;
  }
  if (rc < 0) {
    // ECHILD: already reaped elsewhere
    exited_ = true;
    return true;
  }
  return false;
}

void Subprocess::Terminate(std::chrono::milliseconds grace) {
  if (exited_ || pid_ <= 0) return;

  if (::kill(pid_, SIGTERM) == 0) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
      if (Reap(false)) return;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  ::kill(pid_, SIGKILL);
  Reap(true);
}

void Subprocess::CloseFds() {
  for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }
}

SubprocessResult RunCommand(SubprocessOptions options, const OutputCallback& on_stdout) {
  Subprocess process(std::move(options));
  return process.Wait(on_stdout);
}

} // namespace miner::util

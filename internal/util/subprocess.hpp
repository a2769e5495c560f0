#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace miner::util {

struct SubprocessOptions {
  std::vector<std::string>           argv;
  std::map<std::string, std::string> env;

  // Written to the child's stdin, which is then closed.
  std::string stdin_data;
};

struct SubprocessResult {
  int         exit_code = -1;
  std::string stdout_data;
  std::string stderr_data;

  bool Ok() const {
    return exit_code == 0;
  }
};

using OutputCallback = std::function<void(std::string_view chunk)>;

/*
  Child process running an external tool.

  - argv[0] is resolved through PATH (execvp)
  - stdin/stdout/stderr are pipes owned by this object
  - destructor terminates a still-running child (SIGTERM, then SIGKILL)

  Exit code follows the shell convention: 128 + signal for a signalled
  child, 127 when exec failed.
*/
class Subprocess {
 public:
  explicit Subprocess(SubprocessOptions options);
  ~Subprocess();

  Subprocess(const Subprocess&)            = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // Pumps stdin/stdout/stderr until the child exits. Every stdout chunk is
  // handed to `on_stdout` (if set) as it arrives and also accumulated.
  SubprocessResult Wait(const OutputCallback& on_stdout = {});

  void Terminate(std::chrono::milliseconds grace);

  pid_t Pid() const {
    return pid_;
  }

 private:
  void Spawn();
  bool Reap(bool block);
  void CloseFds();

  SubprocessOptions options_;
  pid_t             pid_       = -1;
  int               stdin_fd_  = -1;
  int               stdout_fd_ = -1;
  int               stderr_fd_ = -1;
  int               exit_code_ = -1;
  bool              exited_    = false;
};

// Spawns, pumps and reaps in one call. Throws CollaboratorError when the
// tool cannot be started.
SubprocessResult RunCommand(SubprocessOptions options, const OutputCallback& on_stdout = {});

} // namespace miner::util

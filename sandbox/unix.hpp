#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/resource.h>

#include <memory>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Owns a child process group. Unless Release is called, the destructor kills
// the whole group and reaps the child.
class ScopedChild {
 public:
  explicit ScopedChild(int pid) : pid_(pid) {}
  ~ScopedChild();
  ScopedChild(const ScopedChild&) = delete;
  ScopedChild& operator=(const ScopedChild&) = delete;

  int Pid() const { return pid_; }
  // Marks the child as reaped, after its group was killed: the destructor
  // does nothing.
  void Release() { reaped_ = true; }

 private:
  int pid_;
  bool reaped_ = false;
};

// Sandbox for UNIX-like systems: runs the program in a new session, with
// resource limits, a replaced environment and no inherited descriptors.
class Unix : public Sandbox {
 public:
  bool MakeImmutable(const std::string& path, std::string* error_msg) override;
  bool Execute(const ExecutionOptions& options, CancellationToken* token,
               ExecutionInfo* info, std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process: creates the error pipe and
  // prepares argv and envp, so that the child does not allocate memory.
  // Returns false and sets error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, stopping it if it exceeds the wall
  // time limit or if the token is cancelled.
  bool Wait(ScopedChild* child, CancellationToken* token, ExecutionInfo* info,
            std::string* error_msg);

  // Sends SIGTERM to the process group, then SIGKILL if the child does not
  // exit within the grace period. Returns once the child has exited, without
  // reaping it.
  bool Terminate(ScopedChild* child, std::string* error_msg);

  void ClosePipe();

  int pipe_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif

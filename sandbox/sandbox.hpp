#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values. A zero limit means no limit.
  int64_t wall_limit_millis = 0;
  // Time between SIGTERM and SIGKILL when the program has to be stopped.
  int64_t grace_millis = 500;
  int64_t memory_limit_kb = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;
  // If set, failing to obtain a private network namespace is an error.
  bool require_network_isolation = false;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;
  // Full environment of the program, as NAME=value strings.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The program was stopped because it exceeded the wall limit.
  bool timed_out = false;
  // The program was stopped because of a CancellationToken.
  bool cancelled = false;
};

class Unix;

// Handle used to stop a running execution from another thread. A token can be
// cancelled before, during or after the execution it is passed to; once
// cancelled it stays cancelled.
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Requests the termination of the attached process, if any. Thread-safe.
  void Cancel();
  bool IsCancelled() const;
  // Process id of the running program, 0 if nothing is running.
  int Pid() const;

 private:
  friend class Unix;
  // Returns false if the token was already cancelled.
  bool Attach(int pid);
  void Detach();

  mutable absl::Mutex mutex_;
  bool cancelled_ ABSL_GUARDED_BY(mutex_) = false;
  int pid_ ABSL_GUARDED_BY(mutex_) = 0;
};

// Runs one guest program with limits. Each implementation provides static
// Create() (a new heap instance) and Score() functions, and makes itself known
// through a namespace-scope Sandbox::Register<Impl> object. Create() picks the
// implementation with the highest positive score.
// Registration happens during static initialization only.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Makes a file read-only for the program. Returns false on error, and sets
  // error_msg.
  virtual bool MakeImmutable(const std::string& path,
                             std::string* error_msg) = 0;

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // token may be null; otherwise cancelling it stops the program.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options,
                       CancellationToken* token, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif

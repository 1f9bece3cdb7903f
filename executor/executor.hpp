#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <stdexcept>
#include <string>

#include "proto/execution.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// Thrown when the program could not be started at all: missing interpreter,
// no usable sandbox, or the operating system refused to create the process.
// Failures of the program itself are reported in the ExecutionResult.
class spawn_error : public std::runtime_error {
 public:
  explicit spawn_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct ExecutionRequest {
  // Source of the program to run.
  std::string code;
  // Contents of the standard input of the program.
  std::string stdin_contents;
  int64_t timeout_millis = 0;
};

class Executor {
 public:
  // Runs the program in a fresh sandbox and waits for it. token may be null;
  // cancelling it stops the execution, and the result has cancelled set.
  virtual proto::ExecutionResult Execute(const ExecutionRequest& request,
                                         sandbox::CancellationToken* token) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif

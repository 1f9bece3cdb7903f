#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs Python programs on this machine, each in a new box directory under
// temp_directory, with the limits given by the sandbox flags.
class LocalExecutor : public Executor {
 public:
  proto::ExecutionResult Execute(const ExecutionRequest& request,
                                 sandbox::CancellationToken* token) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  // A bare interpreter name is looked up in PATH on every execution.
  LocalExecutor(std::string temp_directory, std::string interpreter);

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kSourceName = "solution.py";

  // Returns the absolute path of the interpreter, or throws spawn_error.
  std::string ResolveInterpreter() const;

  static std::vector<std::string> Environment(const std::string& box);

  std::string temp_directory_;
  std::string interpreter_;
};

}  // namespace executor

#endif

#include "executor/local_executor.hpp"

#include <string.h>
#include <unistd.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace executor {

LocalExecutor::LocalExecutor(std::string temp_directory,
                             std::string interpreter)
    : temp_directory_(std::move(temp_directory)),
      interpreter_(std::move(interpreter)) {}

std::string LocalExecutor::ResolveInterpreter() const {
  std::string path = interpreter_;
  if (path.find('/') == std::string::npos) {
    try {
      path = util::which(interpreter_);
    } catch (const std::runtime_error& exc) {
      throw spawn_error(
          absl::StrCat("Cannot look up ", interpreter_, ": ", exc.what()));
    }
  }
  if (path.empty() || access(path.c_str(), X_OK) == -1) {
    throw spawn_error(absl::StrCat("Interpreter not found: ", interpreter_));
  }
  return path;
}

std::vector<std::string> LocalExecutor::Environment(const std::string& box) {
  return {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      "HOME=" + box,
      "TMPDIR=" + box,
      "LANG=C.UTF-8",
      "PYTHONDONTWRITEBYTECODE=1",
      "PYTHONIOENCODING=utf-8",
  };
}

proto::ExecutionResult LocalExecutor::Execute(
    const ExecutionRequest& request, sandbox::CancellationToken* token) {
  std::string interpreter = ResolveInterpreter();

  util::TempDir tmp(temp_directory_);
  if (FLAGS_keep_sandboxes) tmp.Keep();
  std::string sandbox_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(sandbox_dir);

  std::string source = util::File::JoinPath(sandbox_dir, kSourceName);
  util::File::Write(source, request.code);
  std::string stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
  util::File::Write(stdin_file, request.stdin_contents);

  // Folder and arguments. -I ignores the user site and PYTHON* variables,
  // -B avoids writing bytecode next to the source.
  sandbox::ExecutionOptions exec_options(sandbox_dir, interpreter);
  exec_options.args = {"-I", "-B", kSourceName};
  exec_options.env = Environment(sandbox_dir);

  // Limits.
  exec_options.wall_limit_millis = request.timeout_millis;
  exec_options.grace_millis = FLAGS_kill_grace_millis;
  exec_options.memory_limit_kb = FLAGS_memory_limit_kb;
  exec_options.max_files = FLAGS_max_files;
  exec_options.max_file_size_kb = FLAGS_max_output_kb;
  exec_options.require_network_isolation = FLAGS_require_network_isolation;

  // Stdin/out/err files, outside of the box.
  exec_options.stdin_file = stdin_file;
  exec_options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  exec_options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw spawn_error("No sandbox available");
  if (!sb->MakeImmutable(source, &error_msg)) throw spawn_error(error_msg);

  // Actual execution.
  sandbox::ExecutionInfo info;
  VLOG(1) << "Executing " << request.code.size() << " bytes of code in "
          << sandbox_dir;
  if (!sb->Execute(exec_options, token, &info, &error_msg)) {
    throw spawn_error(error_msg);
  }

  proto::ExecutionResult result;
  const size_t max_output = static_cast<size_t>(FLAGS_max_output_kb) * 1024;
  bool truncated = false;
  // A program killed early may not have created its output files.
  if (util::File::Exists(exec_options.stdout_file)) {
    result.set_output(
        util::File::ReadAll(exec_options.stdout_file, max_output, &truncated));
  }
  std::string stderr_contents;
  if (util::File::Exists(exec_options.stderr_file)) {
    stderr_contents =
        util::File::ReadAll(exec_options.stderr_file, max_output, &truncated);
  }

  // Resource usage.
  result.set_execution_time(info.wall_time_millis / 1000.0);
  result.set_memory_kb(info.memory_usage_kb);

  // Termination status.
  result.set_signal(info.signal);
  result.set_exit_code(info.signal ? -info.signal : info.status_code);
  result.set_timed_out(info.timed_out);
  result.set_cancelled(info.cancelled);
  if (info.timed_out) {
    result.set_error(absl::StrFormat("Execution timed out after %g seconds",
                                     request.timeout_millis / 1000.0));
  } else if (info.cancelled) {
    result.set_error("Execution cancelled");
  } else if (info.signal) {
    std::string message =
        absl::StrCat("Killed by signal ", info.signal, " (",
                     strsignal(info.signal), ")");
    if (exec_options.memory_limit_kb &&
        info.memory_usage_kb >= exec_options.memory_limit_kb) {
      absl::StrAppend(&message, ": memory limit exceeded");
    }
    result.set_error(stderr_contents.empty()
                         ? message
                         : absl::StrCat(stderr_contents, "\n", message));
  } else {
    result.set_error(stderr_contents);
  }
  result.set_success(!info.timed_out && !info.cancelled && !info.signal &&
                     info.status_code == 0);
  if (truncated) {
    LOG(WARNING) << "Output of the program truncated to " << max_output
                 << " bytes";
  }
  return result;
}

}  // namespace executor

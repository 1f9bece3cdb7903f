#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/close_range.h>
#include <sched.h>
#include <sys/prctl.h>
#endif

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

void SignalGroup(int pid, int sig) {
  if (killpg(pid, sig) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "killpg " << pid;
  }
}

// Returns 1 if the child has exited, 0 if it is still running and -1 on
// error. The child is not reaped, so its pid (the id of its process group)
// stays reserved.
int PollExit(int pid, bool block) {
  siginfo_t si{};
  int flags = WEXITED | WNOWAIT | (block ? 0 : WNOHANG);
  while (waitid(P_PID, pid, &si, flags) == -1) {
    if (errno != EINTR) return -1;
  }
  return si.si_pid == pid ? 1 : 0;
}

std::vector<char*> MakeCStrings(const std::vector<std::string>& strings,
                                std::vector<std::vector<char>>* storage) {
  storage->clear();
  for (const std::string& s : strings) {
    storage->emplace_back(s.begin(), s.end());
    storage->back().push_back(0);
  }
  std::vector<char*> pointers;
  for (std::vector<char>& s : *storage) pointers.push_back(s.data());
  pointers.push_back(nullptr);
  return pointers;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr int kPollMillis = 10;
static const constexpr int kExecAttempts = 16;

ScopedChild::~ScopedChild() {
  if (pid_ <= 0 || reaped_) return;
  // Also takes care of any process the child left behind in its group.
  SignalGroup(pid_, SIGKILL);
  if (kill(pid_, SIGKILL) == -1 && errno != ESRCH) PLOG(WARNING) << "kill";
  while (waitpid(pid_, nullptr, 0) == -1 && errno == EINTR) {
  }
}

bool Unix::MakeImmutable(const std::string& path, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (chmod(path.c_str(), S_IRUSR) == -1) {
    *error_msg = "chmod: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::Execute(const ExecutionOptions& options, CancellationToken* token,
                   ExecutionInfo* info, std::string* error_msg) {
  options_ = &options;
  *info = ExecutionInfo();
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) {
    ClosePipe();
    return false;
  }
  ScopedChild child(child_pid_);
  return Wait(&child, token, info, error_msg);
}

void Unix::ClosePipe() {
  for (int& fd : pipe_fds_) {
    if (fd != -1) close(fd);
    fd = -1;
  }
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe(pipe_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    ClosePipe();
    return false;
  }
  std::vector<std::string> args{options_->executable};
  args.insert(args.end(), options_->args.begin(), options_->args.end());
  argv_ = MakeCStrings(args, &arg_storage_);
  envp_ = MakeCStrings(options_->env, &env_storage_);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  VLOG(2) << "Started " << options_->executable << " as " << child_pid_;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group: the whole group can be signalled at once,
  // and Ctrl-Cs in the terminal are not received.
  if (setsid() == -1) die("setsid", errno);

#ifdef __linux__
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);
  if (unshare(CLONE_NEWNET) == -1 && options_->require_network_isolation) {
    die("unshare", errno);
  }
#else
  if (options_->require_network_isolation) {
    die2("unshare", "network isolation is not supported");
  }
#endif

  const char* stdin_path =
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file.c_str();
  const char* stdout_path = options_->stdout_file.empty()
                                ? "/dev/null"
                                : options_->stdout_file.c_str();
  const char* stderr_path = options_->stderr_file.empty()
                                ? "/dev/null"
                                : options_->stderr_file.c_str();
  int stdin_fd = open(stdin_path, O_RDONLY);
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd = open(stdout_path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (stdout_fd == -1) die("open", errno);
  int stderr_fd = open(stderr_path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (stderr_fd == -1) die("open", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  const int redirections[][2] = {
      {stdin_fd, STDIN_FILENO},
      {stdout_fd, STDOUT_FILENO},
      {stderr_fd, STDERR_FILENO}};
  for (const auto& redirection : redirections) {
    if (redirection[0] == redirection[1]) continue;
    if (dup2(redirection[0], redirection[1]) == -1) die("dup2", errno);
  }

  // Every descriptor beyond stdio is closed on exec, the error pipe included.
#ifdef __linux__
  if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == -1)
#endif
  {
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = 3; fd < max_fd; fd++) fcntl(fd, F_SETFD, FD_CLOEXEC);
  }

  auto limit = [&die](int resource, const char* name, rlim_t value) {
    if (value == 0) return;
    struct rlimit rlim {};
    rlim.rlim_cur = rlim.rlim_max = value;
    if (setrlimit(resource, &rlim) == -1) die(name, errno);
  };
  limit(RLIMIT_AS, "setrlimit AS", options_->memory_limit_kb * 1024);
  limit(RLIMIT_FSIZE, "setrlimit FSIZE", options_->max_file_size_kb * 1024);
  limit(RLIMIT_NOFILE, "setrlimit NOFILE", options_->max_files);
#ifndef __APPLE__
  limit(RLIMIT_STACK, "setrlimit STACK", options_->max_stack_kb * 1024);
#endif

  // ETXTBSY: the executable may still be open for writing in a forked sibling.
  for (int attempt = 0; attempt < kExecAttempts; attempt++) {
    execve(options_->executable.c_str(), argv_.data(), envp_.data());
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  die("exec", errno);
  _Exit(1);
}

bool Unix::Wait(ScopedChild* child, CancellationToken* token,
                ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  int error_len = 0;
  ssize_t got = 0;
  while ((got = read(pipe_fds_[0], &error_len, sizeof(error_len))) == -1 &&
         errno == EINTR) {
  }
  if (got == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) {
      *error_msg = "child setup failed";
    } else {
      *error_msg = error;
    }
    ClosePipe();
    return false;
  }
  ClosePipe();

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  char buf[kStrErrorBufSize] = {};
  if (token != nullptr && !token->Attach(child_pid_)) info->cancelled = true;

  bool has_exited = false;
  while (!info->cancelled) {
    int exited = PollExit(child_pid_, /* block = */ false);
    if (exited == -1) {
      *error_msg = "waitid: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      if (token != nullptr) token->Detach();
      return false;
    }
    if (exited == 1) {
      has_exited = true;
      break;
    }
    if (token != nullptr && token->IsCancelled()) {
      info->cancelled = true;
      break;
    }
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollMillis));
  }
  // Once the program is being stopped, the reason stays the same even if it
  // exits on its own during the grace period.
  if (!has_exited) {
    VLOG(2) << "Stopping " << child_pid_
            << (info->timed_out ? ": wall limit" : ": cancelled");
    if (!Terminate(child, error_msg)) {
      if (token != nullptr) token->Detach();
      return false;
    }
  }
  // The group is signalled only while the exited child still holds its id.
  if (token != nullptr) token->Detach();
  SignalGroup(child_pid_, SIGKILL);

  // wait4, unlike waitpid, reports the resource usage.
  int child_status = 0;
  struct rusage rusage {};
  int ret = 0;
  while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
         errno == EINTR) {
  }
  if (ret != child_pid_) {
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  child->Release();

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
#ifdef __APPLE__
  info->memory_usage_kb = rusage.ru_maxrss / 1024;
#else
  info->memory_usage_kb = rusage.ru_maxrss;
#endif
  VLOG(2) << child_pid_ << " exited: status " << info->status_code
          << " signal " << info->signal << " wall "
          << info->wall_time_millis << "ms";
  return true;
}

bool Unix::Terminate(ScopedChild* child, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  SignalGroup(child->Pid(), SIGTERM);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(options_->grace_millis);
  int exited = 0;
  while ((exited = PollExit(child->Pid(), /* block = */ false)) == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kPollMillis));
  }
  if (exited == 0) {
    VLOG(2) << child->Pid() << " ignored SIGTERM, killing it";
    SignalGroup(child->Pid(), SIGKILL);
    exited = PollExit(child->Pid(), /* block = */ true);
  }
  if (exited == -1) {
    *error_msg = "waitid: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox

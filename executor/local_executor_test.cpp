#include "executor/local_executor.hpp"

#include <chrono>
#include <cstdlib>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/codeforge_testdir/executor";
const std::string python = "/usr/bin/python3";

proto::ExecutionResult Run(const std::string& code,
                           int64_t timeout_millis = 5000,
                           const std::string& stdin_contents = "") {
  executor::LocalExecutor executor(test_tmpdir, python);
  executor::ExecutionRequest request;
  request.code = code;
  request.stdin_contents = stdin_contents;
  request.timeout_millis = timeout_millis;
  return executor.Execute(request, nullptr);
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, CapturesOutputSeparately) {
  proto::ExecutionResult result = ::Run(
      "import sys\n"
      "print('hello')\n"
      "print('oops', file=sys.stderr)\n");
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.output(), "hello\n");
  EXPECT_EQ(result.error(), "oops\n");
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_FALSE(result.timed_out());
  EXPECT_GT(result.execution_time(), 0);
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, NonZeroExitIsData) {
  proto::ExecutionResult result = ::Run("import sys\nsys.exit(3)\n");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_FALSE(result.timed_out());
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, ExceptionIsReported) {
  proto::ExecutionResult result =
      ::Run("print('before')\nraise ValueError('boom')\n");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_EQ(result.output(), "before\n");
  EXPECT_THAT(result.error(), HasSubstr("ValueError: boom"));
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, ReadsStdin) {
  proto::ExecutionResult result =
      ::Run("import sys\nprint(sys.stdin.read().upper())\n", 5000, "abc");
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.output(), "ABC\n");
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, InfiniteLoopTimesOut) {
  auto start = std::chrono::steady_clock::now();
  proto::ExecutionResult result =
      ::Run("print('started', flush=True)\nwhile True:\n    pass\n", 1000);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.error(), "Execution timed out after 1 seconds");
  EXPECT_EQ(result.output(), "started\n");
  EXPECT_LT(elapsed, std::chrono::seconds(4));
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, IgnoredTermIsKilled) {
  proto::ExecutionResult result = ::Run(
      "import signal, time\n"
      "signal.signal(signal.SIGTERM, signal.SIG_IGN)\n"
      "time.sleep(60)\n",
      500);
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.signal(), 9);
  EXPECT_EQ(result.exit_code(), -9);
  EXPECT_LT(result.execution_time(), 4);
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, Cancel) {
  executor::LocalExecutor executor(test_tmpdir, python);
  executor::ExecutionRequest request;
  request.code = "import time\ntime.sleep(60)\n";
  request.timeout_millis = 30000;
  sandbox::CancellationToken token;
  std::thread canceller([&token]() {
    while (token.Pid() == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    token.Cancel();
  });
  proto::ExecutionResult result = executor.Execute(request, &token);
  canceller.join();
  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.cancelled());
  EXPECT_FALSE(result.timed_out());
  EXPECT_EQ(result.error(), "Execution cancelled");
  EXPECT_LT(result.execution_time(), 5);
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, NoInheritedEnvironment) {
  setenv("CODEFORGE_TEST_SECRET", "hunter2", 1);
  proto::ExecutionResult result = ::Run(
      "import os\n"
      "print(os.environ.get('CODEFORGE_TEST_SECRET'))\n"
      "print(os.getcwd() == os.environ['HOME'] == os.environ['TMPDIR'])\n");
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.output(), "None\nTrue\n");
}

// NOLINTNEXTLINE
TEST(LocalExecutorTest, MissingInterpreterThrows) {
  executor::LocalExecutor absolute(test_tmpdir, "/no/such/python");
  executor::LocalExecutor bare(test_tmpdir, "no-such-python-interpreter");
  executor::ExecutionRequest request;
  request.code = "print(1)\n";
  request.timeout_millis = 1000;
  EXPECT_THROW(absolute.Execute(request, nullptr),  // NOLINT
               executor::spawn_error);
  EXPECT_THROW(bare.Execute(request, nullptr),  // NOLINT
               executor::spawn_error);
}

}  // namespace

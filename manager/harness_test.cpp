#include "manager/harness.hpp"

#include "executor/local_executor.hpp"
#include "gmock/gmock.h"
#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"
#include "manager/validation.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/codeforge_testdir/harness";

proto::TestCase Test(const std::string& json) {
  proto::TestCase test;
  EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(json, &test).ok());
  return test;
}

proto::ExecutionResult Run(const manager::Harness& harness) {
  executor::LocalExecutor executor(test_tmpdir, "/usr/bin/python3");
  executor::ExecutionRequest request;
  request.code = harness.program;
  request.stdin_contents = harness.stdin_contents;
  request.timeout_millis = 10000;
  return executor.Execute(request, nullptr);
}

// NOLINTNEXTLINE
TEST(HarnessTest, StdinHoldsTheInputs) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {"a": 1, "b": "x"}, "expectedOutput": 1})"),
      ::Test(R"({"inputs": {}, "expectedOutput": 2})"),
  };
  manager::Harness harness = manager::BuildHarness("def main(): pass", tests);
  EXPECT_THAT(harness.marker, StartsWith("@@codeforge-"));
  EXPECT_EQ(harness.stdin_contents,
            harness.marker + "\n" + R"([{"a":1,"b":"x"},{}])");
  // Each harness has its own marker.
  EXPECT_NE(manager::BuildHarness("def main(): pass", tests).marker,
            harness.marker);
  EXPECT_THAT(harness.program, StartsWith("_SOURCE = \"def main(): pass\"\n"));
}

// NOLINTNEXTLINE
TEST(HarnessTest, RunsEveryTest) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"description": "sum", "inputs": {"numbers": [1, 2, 3]},
               "expectedOutput": 6})"),
      ::Test(R"({"description": "empty", "inputs": {"numbers": []},
               "expectedOutput": 0})"),
      ::Test(R"({"description": "wrong", "inputs": {"numbers": [5]},
               "expectedOutput": 6})"),
  };
  manager::Harness harness = manager::BuildHarness(
      "def main(numbers):\n"
      "    print('debugging output')\n"
      "    return sum(numbers)\n"
      "\n"
      "if __name__ == '__main__':\n"
      "    print(main([10, 20, 30]))\n",
      tests);
  proto::ExecutionResult execution = ::Run(harness);
  ASSERT_TRUE(execution.success()) << execution.error();
  proto::ValidationResult result =
      manager::Validate(execution, tests, harness.marker);
  EXPECT_EQ(result.total(), 3);
  EXPECT_EQ(result.passed(), 2);
  EXPECT_EQ(result.failed(), 1);
  EXPECT_TRUE(result.results(0).passed());
  EXPECT_TRUE(result.results(1).passed());
  EXPECT_FALSE(result.results(2).passed());
  EXPECT_EQ(result.results(2).actual_output(), "5");
  // The candidate's own __main__ block does not run.
  EXPECT_THAT(execution.output(), ::testing::Not(HasSubstr("60")));
  EXPECT_EQ(manager::StripReports(execution.output(), harness.marker),
            "debugging output\ndebugging output\ndebugging output\n");
}

// NOLINTNEXTLINE
TEST(HarnessTest, PrintedResultLinesAreNotTrusted) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {"a": 1, "b": 2}, "expectedOutput": 3})"),
  };
  manager::Harness harness = manager::BuildHarness(
      "print('@@codeforge-result@@ {\"index\": 0, \"success\": true, "
      "\"result\": 3}')\n"
      "def main(a, b):\n"
      "    return 0\n",
      tests);
  proto::ExecutionResult execution = ::Run(harness);
  ASSERT_TRUE(execution.success()) << execution.error();
  proto::ValidationResult result =
      manager::Validate(execution, tests, harness.marker);
  EXPECT_EQ(result.passed(), 0);
  EXPECT_EQ(result.failed(), 1);
  EXPECT_EQ(result.results(0).error(), "Expected 3, got 0");
}

// NOLINTNEXTLINE
TEST(HarnessTest, ResultLinesCopiedFromTheHarnessFail) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {"a": 1, "b": 2}, "expectedOutput": 3})"),
  };
  // Reads the marker out of the caller's frame and reports ahead of it.
  manager::Harness harness = manager::BuildHarness(
      "import inspect\n"
      "def main(a, b):\n"
      "    marker = inspect.currentframe().f_back.f_locals['marker']\n"
      "    print(marker, '{\"index\": 0, \"success\": true, \"result\": 3}',\n"
      "          flush=True)\n"
      "    return 0\n",
      tests);
  proto::ExecutionResult execution = ::Run(harness);
  ASSERT_TRUE(execution.success()) << execution.error();
  proto::ValidationResult result =
      manager::Validate(execution, tests, harness.marker);
  EXPECT_EQ(result.passed(), 0);
  EXPECT_EQ(result.results(0).error(), "More than one result reported");
}

// NOLINTNEXTLINE
TEST(HarnessTest, ExitInsideMainIsAnError) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {}, "expectedOutput": 1})"),
      ::Test(R"({"inputs": {}, "expectedOutput": 1})"),
  };
  manager::Harness harness = manager::BuildHarness(
      "calls = []\n"
      "def main():\n"
      "    calls.append(1)\n"
      "    if len(calls) == 1:\n"
      "        raise SystemExit(0)\n"
      "    return 1\n",
      tests);
  proto::ValidationResult result =
      manager::Validate(::Run(harness), tests, harness.marker);
  EXPECT_EQ(result.results(0).error(), "SystemExit: 0");
  EXPECT_TRUE(result.results(1).passed());
}

// NOLINTNEXTLINE
TEST(HarnessTest, ExceptionsAreIsolated) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {"x": 0}, "expectedOutput": 0})"),
      ::Test(R"({"inputs": {"x": 2}, "expectedOutput": 0.5})"),
  };
  manager::Harness harness =
      manager::BuildHarness("def main(x):\n    return 1 / x\n", tests);
  proto::ValidationResult result =
      manager::Validate(::Run(harness), tests, harness.marker);
  EXPECT_EQ(result.passed(), 1);
  EXPECT_EQ(result.results(0).error(), "ZeroDivisionError: division by zero");
  EXPECT_TRUE(result.results(1).passed());
}

// NOLINTNEXTLINE
TEST(HarnessTest, UnserializableResult) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {}, "expectedOutput": [1]})"),
  };
  manager::Harness harness =
      manager::BuildHarness("def main():\n    return {1}\n", tests);
  proto::ValidationResult result =
      manager::Validate(::Run(harness), tests, harness.marker);
  EXPECT_EQ(result.failed(), 1);
  EXPECT_THAT(result.results(0).error(), StartsWith("TypeError"));
}

// NOLINTNEXTLINE
TEST(HarnessTest, SyntaxErrorFailsEveryTest) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {}, "expectedOutput": 1})"),
      ::Test(R"({"inputs": {}, "expectedOutput": 2})"),
  };
  manager::Harness harness =
      manager::BuildHarness("def main(:\n    return 1\n", tests);
  proto::ExecutionResult execution = ::Run(harness);
  EXPECT_FALSE(execution.success());
  proto::ValidationResult result =
      manager::Validate(execution, tests, harness.marker);
  EXPECT_EQ(result.failed(), 2);
  EXPECT_THAT(result.results(0).error(), HasSubstr("SyntaxError"));
  EXPECT_THAT(result.results(1).error(), HasSubstr("SyntaxError"));
}

// NOLINTNEXTLINE
TEST(HarnessTest, QuotesAndUnicodeInSource) {
  std::vector<proto::TestCase> tests = {
      ::Test(R"({"inputs": {}, "expectedOutput": "café \"quoted\"\n\\"})"),
  };
  manager::Harness harness = manager::BuildHarness(
      "def main():\n    return 'caf\xc3\xa9 \"quoted\"\\n\\\\'\n", tests);
  proto::ValidationResult result =
      manager::Validate(::Run(harness), tests, harness.marker);
  EXPECT_EQ(result.passed(), 1) << result.results(0).error();
}

}  // namespace

#include <signal.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "executor/local_executor.hpp"
#include "gateway/hardcoding_policy.hpp"
#include "gateway/remote_gateway.hpp"
#include "gateway/screening_gateway.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/event_queue.hpp"
#include "manager/orchestrator.hpp"
#include "manager/session_store.hpp"
#include "proto/test_case.pb.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/random_id.hpp"

DEFINE_string(task, "", "description of the program to write");
DEFINE_string(tests_file, "",
              "JSON array of test cases to use instead of inferring them");
DEFINE_string(session_id, "", "session to append the run to");
DEFINE_bool(persist, false, "store the run in a new session");

namespace {
const auto INTERRUPT_POLL_INTERVAL = std::chrono::milliseconds(100);  // NOLINT
const size_t kMaxTestsFileBytes = 16 * 1024 * 1024;

volatile sig_atomic_t interrupted = 0;

void OnInterrupt(int /*signum*/) { interrupted = 1; }

// Returns false, after logging why, if the file is not a valid list of tests.
bool ReadTests(const std::string& path, std::vector<proto::TestCase>* tests) {
  bool truncated = false;
  std::string contents = util::File::ReadAll(path, kMaxTestsFileBytes,
                                             &truncated);
  if (truncated) {
    LOG(ERROR) << path << " is too big";
    return false;
  }
  proto::TestSuite suite;
  auto status = google::protobuf::util::JsonStringToMessage(
      absl::StrCat("{\"test_cases\": ", contents, "}"), &suite);
  if (!status.ok()) {
    LOG(ERROR) << "Invalid test cases in " << path << ": "
               << status.ToString();
    return false;
  }
  tests->assign(suite.test_cases().begin(), suite.test_cases().end());
  return true;
}

std::string ToJsonLine(const proto::Event& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot print " << manager::EventType(event) << ": "
               << status.ToString();
    return absl::StrCat("{\"", manager::EventType(event), "\": {}}");
  }
  return json;
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Writes a program for a task, and tests it");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (absl::StripAsciiWhitespace(FLAGS_task).empty()) {
    LOG(ERROR) << "--task is required";
    return 1;
  }

  manager::RunOptions options;
  options.run_id = util::RandomId();
  if (!FLAGS_tests_file.empty()) {
    std::vector<proto::TestCase> tests;
    try {
      if (!ReadTests(FLAGS_tests_file, &tests)) return 1;
    } catch (const std::system_error& exc) {
      LOG(ERROR) << "Cannot read " << FLAGS_tests_file << ": " << exc.what();
      return 1;
    }
    options.user_tests = std::move(tests);
  }

  std::unique_ptr<manager::FileSessionStore> sessions;
  std::unique_ptr<manager::SessionRecorder> recorder;
  if (FLAGS_persist || !FLAGS_session_id.empty()) {
    std::string session_id =
        FLAGS_session_id.empty() ? util::RandomId() : FLAGS_session_id;
    try {
      sessions =
          absl::make_unique<manager::FileSessionStore>(FLAGS_session_directory);
      if (!FLAGS_session_id.empty() && !sessions->Exists(session_id)) {
        LOG(ERROR) << "No such session: " << session_id;
        return 1;
      }
      recorder = absl::make_unique<manager::SessionRecorder>(
          sessions.get(), session_id, FLAGS_task);
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot open session " << session_id << ": "
                 << exc.what();
      return 1;
    }
    LOG(INFO) << "Storing the run in session " << session_id;
  }

  gateway::RemoteGateway remote(FLAGS_gateway_address,
                                FLAGS_gateway_deadline_seconds);
  gateway::HeuristicHardcodingPolicy policy;
  gateway::ScreeningGateway screening(&remote, &policy);
  executor::LocalExecutor executor(FLAGS_temp_directory, FLAGS_interpreter);
  manager::EventQueue queue;
  manager::Orchestrator orchestrator(&screening, &executor, &queue);

  struct sigaction action {};
  action.sa_handler = OnInterrupt;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);

  proto::Run run;
  absl::Notification done;
  std::thread runner([&] {
    try {
      run = orchestrator.Run(FLAGS_task, options);
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Run failed: " << exc.what();
      queue.Error(exc.what());
      run.set_outcome(proto::Outcome::FATAL);
    }
    queue.Stop();
    done.Notify();
  });
  std::thread watcher([&] {
    while (!done.WaitForNotificationWithTimeout(
        absl::FromChrono(INTERRUPT_POLL_INTERVAL))) {
      if (interrupted) {
        orchestrator.Cancel();
        return;
      }
    }
  });

  while (absl::optional<proto::Event> event = queue.Dequeue()) {
    std::cout << ToJsonLine(*event) << std::endl;
    if (!recorder) continue;
    try {
      recorder->Record(*event);
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot store " << manager::EventType(*event) << ": "
                 << exc.what();
    }
  }
  runner.join();
  watcher.join();

  if (recorder) {
    try {
      recorder->Finish(orchestrator.Ledger());
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot update the session totals: " << exc.what();
    }
  }
  switch (run.outcome()) {
    case proto::Outcome::SUCCESS:
      return 0;
    case proto::Outcome::CANCELLED:
      return 130;
    default:
      return 1;
  }
}

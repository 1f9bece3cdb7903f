#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "executor/local_executor.hpp"
#include "gateway/hardcoding_policy.hpp"
#include "gateway/remote_gateway.hpp"
#include "gateway/screening_gateway.hpp"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "manager/event_queue.hpp"
#include "manager/orchestrator.hpp"
#include "manager/session_store.hpp"
#include "proto/codeforge.grpc.pb.h"
#include "util/flags.hpp"
#include "util/random_id.hpp"

namespace {
const auto CLIENT_POLL_INTERVAL = std::chrono::milliseconds(100);  // NOLINT
}  // namespace

class CodeForgeImpl : public proto::CodeForge::Service {
 public:
  CodeForgeImpl(gateway::Gateway* gateway, executor::Executor* executor,
                manager::SessionStore* sessions)
      : gateway_(gateway), executor_(executor), sessions_(sessions) {}

  grpc::Status Generate(grpc::ServerContext* context,
                        const proto::GenerateRequest* request,
                        grpc::ServerWriter<proto::Event>* writer) override {
    if (absl::StripAsciiWhitespace(request->task()).empty()) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Empty task");
    }
    manager::RunOptions options;
    if (request->max_iterations() != 0) {
      options.max_iterations = request->max_iterations();
    }
    if (options.max_iterations < manager::Orchestrator::kMinIterations ||
        options.max_iterations > manager::Orchestrator::kMaxIterations) {
      return grpc::Status(
          grpc::StatusCode::INVALID_ARGUMENT,
          absl::StrCat("max_iterations must be between ",
                       manager::Orchestrator::kMinIterations, " and ",
                       manager::Orchestrator::kMaxIterations));
    }
    if (request->has_user_tests()) {
      options.user_tests = std::vector<proto::TestCase>(
          request->user_tests().test_cases().begin(),
          request->user_tests().test_cases().end());
    }
    std::string session_id = request->session_id();
    try {
      if (!session_id.empty() && !sessions_->Exists(session_id)) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            absl::StrCat("No such session: ", session_id));
      }
    } catch (const std::invalid_argument& exc) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, exc.what());
    }
    if (session_id.empty()) session_id = util::RandomId();
    options.run_id = util::RandomId();

    std::unique_ptr<manager::SessionRecorder> recorder;
    try {
      recorder = absl::make_unique<manager::SessionRecorder>(
          sessions_, session_id, request->task());
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot open session " << session_id << ": "
                 << exc.what();
      return grpc::Status(grpc::StatusCode::INTERNAL, exc.what());
    }

    auto info = std::make_shared<RunInfo>(gateway_, executor_);
    {
      absl::MutexLock lock(&running_mutex_);
      running_[options.run_id] = info;
    }
    LOG(INFO) << "Starting run " << options.run_id << " in session "
              << session_id;
    info->queue.RunStarted(options.run_id, session_id);

    std::string task = request->task();
    std::thread runner([info, task, options] {
      try {
        info->orchestrator.Run(task, options);
      } catch (const std::exception& exc) {
        LOG(ERROR) << "Run " << options.run_id << " failed: " << exc.what();
        info->queue.Error(exc.what());
      }
      info->queue.Stop();
      info->done.Notify();
    });
    // The run is cancelled if the client goes away.
    std::string run_id = options.run_id;
    std::thread watcher([info, context, run_id] {
      while (!info->done.WaitForNotificationWithTimeout(
          absl::FromChrono(CLIENT_POLL_INTERVAL))) {
        if (context->IsCancelled()) {
          LOG(WARNING) << "Client of run " << run_id << " went away";
          info->orchestrator.Cancel();
          return;
        }
      }
    });

    bool client_alive = true;
    while (absl::optional<proto::Event> event = info->queue.Dequeue()) {
      try {
        recorder->Record(*event);
      } catch (const std::exception& exc) {
        LOG(ERROR) << "Cannot store " << manager::EventType(*event)
                   << " of run " << options.run_id << ": " << exc.what();
      }
      if (client_alive && !writer->Write(*event)) {
        LOG(WARNING) << "Stream of run " << options.run_id << " closed";
        client_alive = false;
        info->orchestrator.Cancel();
      }
    }
    runner.join();
    watcher.join();

    try {
      recorder->Finish(info->orchestrator.Ledger());
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot update the totals of session " << session_id
                 << ": " << exc.what();
    }
    {
      absl::MutexLock lock(&running_mutex_);
      running_.erase(options.run_id);
    }
    LOG(INFO) << "Run " << options.run_id << " ended";
    return grpc::Status::OK;
  }

  grpc::Status Cancel(grpc::ServerContext* /*context*/,
                      const proto::CancelRequest* request,
                      proto::CancelResponse* /*response*/) override {
    std::shared_ptr<RunInfo> info;
    {
      absl::MutexLock lock(&running_mutex_);
      auto it = running_.find(request->run_id());
      if (it == running_.end()) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "No such run");
      }
      info = it->second;
    }
    LOG(WARNING) << "Requesting to cancel run " << request->run_id();
    info->orchestrator.Cancel();
    return grpc::Status::OK;
  }

  grpc::Status GetSession(grpc::ServerContext* /*context*/,
                          const proto::GetSessionRequest* request,
                          proto::StoredSession* response) override {
    try {
      absl::optional<proto::StoredSession> session =
          sessions_->Load(request->session_id());
      if (!session) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "No such session");
      }
      response->Swap(&*session);
    } catch (const std::invalid_argument& exc) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, exc.what());
    } catch (const std::exception& exc) {
      LOG(ERROR) << "Cannot load session " << request->session_id() << ": "
                 << exc.what();
      return grpc::Status(grpc::StatusCode::INTERNAL, exc.what());
    }
    return grpc::Status::OK;
  }

 private:
  struct RunInfo {
    RunInfo(gateway::Gateway* gateway, executor::Executor* executor)
        : orchestrator(gateway, executor, &queue) {}

    manager::EventQueue queue;
    manager::Orchestrator orchestrator;
    absl::Notification done;
  };

  gateway::Gateway* gateway_;
  executor::Executor* executor_;
  manager::SessionStore* sessions_;
  absl::Mutex running_mutex_;
  std::map<std::string, std::shared_ptr<RunInfo>> running_
      ABSL_GUARDED_BY(running_mutex_);
};

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  gateway::RemoteGateway remote(FLAGS_gateway_address,
                                FLAGS_gateway_deadline_seconds);
  gateway::HeuristicHardcodingPolicy policy;
  gateway::ScreeningGateway screening(&remote, &policy);
  executor::LocalExecutor executor(FLAGS_temp_directory, FLAGS_interpreter);
  manager::FileSessionStore sessions(FLAGS_session_directory);

  std::string server_address = "127.0.0.1:" + std::to_string(FLAGS_port);
  CodeForgeImpl service(&screening, &executor, &sessions);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}

#ifndef MANAGER_ORCHESTRATOR_HPP
#define MANAGER_ORCHESTRATOR_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "executor/executor.hpp"
#include "gateway/gateway.hpp"
#include "manager/cost_ledger.hpp"
#include "manager/event_queue.hpp"
#include "proto/run.pb.h"
#include "sandbox/sandbox.hpp"

namespace manager {

struct RunOptions {
  RunOptions();

  int32_t max_iterations;
  // When set the tests are used verbatim and not inferred.
  absl::optional<std::vector<proto::TestCase>> user_tests;
  // Wall limit of each execution of a candidate.
  int64_t timeout_millis;
  bool emit_cost_updates;
  std::string run_id;
};

// Drives one run: plan, acquire tests, then generate, execute, validate and
// repair until every test passes or the iterations are over. Every step is
// reported on the queue, and exactly one terminal event (complete or error)
// ends the stream. An Orchestrator runs a single task.
class Orchestrator {
 public:
  static const constexpr int32_t kMinIterations = 1;
  static const constexpr int32_t kMaxIterations = 10;

  enum class State {
    PLANNING,
    TEST_ACQUISITION,
    GENERATING,
    EXECUTING,
    VALIDATING,
    REPAIRING,
    COMPLETE,
    FAILED,
    CANCELLED
  };

  Orchestrator(gateway::Gateway* gateway, executor::Executor* executor,
               EventQueue* queue);

  // Runs the task to its end and returns the record of the run. Throws
  // std::invalid_argument if max_iterations is outside [1, 10]; every other
  // failure is reported on the queue and in the outcome.
  proto::Run Run(const std::string& task, const RunOptions& options);

  // Stops the run as soon as possible, killing the program under execution
  // and aborting the gateway call in flight. Can be called from any thread,
  // also before Run.
  void Cancel();
  bool IsCancelled() const { return token_.IsCancelled(); }

  // Consistent view of the costs so far, safe to call while running.
  proto::CostLedger Ledger() const { return ledger_.Snapshot(); }

 private:
  State Plan();
  State AcquireTests();
  State Generate();
  State ExecuteCandidate();
  State ValidateCandidate();
  State Repair();
  proto::Run Finish(State state);

  // Sends the request and records the tokens it used under step.
  proto::GatewayResponse CallGateway(const proto::GatewayRequest& request,
                                     const std::string& step);
  void MaybeEmitCostUpdate();
  // Ends the run with an error event.
  State Fatal(const std::string& message);
  // After a failed iteration: repair, or give up if it was the last one.
  State AfterFailure();
  proto::Iteration* CurrentIteration();
  std::string Tag() const;

  gateway::Gateway* gateway_;
  executor::Executor* executor_;
  EventQueue* queue_;

  sandbox::CancellationToken token_;
  gateway::CallToken call_token_;
  CostLedger ledger_;
  RunOptions options_;
  proto::Run run_;
  std::vector<proto::TestCase> tests_;
  // Last execution as the harness produced it, with its result lines.
  proto::ExecutionResult raw_execution_;
  std::string marker_;
  int32_t version_ = 0;
  std::string previous_analysis_;
  bool started_ = false;
};

const char* StateName(Orchestrator::State state);

}  // namespace manager

#endif

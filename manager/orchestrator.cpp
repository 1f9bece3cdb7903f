#include "manager/orchestrator.hpp"

#include <stdexcept>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "manager/harness.hpp"
#include "manager/validation.hpp"
#include "util/flags.hpp"

namespace manager {

namespace {
using google::protobuf::util::TimeUtil;

const char* const kAntiShortcutPolicy =
    "The program must compute its results from the inputs. Do not embed the "
    "expected outputs of the test cases, do not special-case the test inputs "
    "and do not return literal answers looked up from them: the code will be "
    "rejected and regenerated.";

const char* const kUserTestsMessage = "Using user-provided test cases";
const char* const kExhaustedReason = "iterations exhausted";
const char* const kCancelledReason = "cancelled";
const char* const kSuccessReason = "success";
}  // namespace

const char* StateName(Orchestrator::State state) {
  switch (state) {
    case Orchestrator::State::PLANNING:
      return "PLANNING";
    case Orchestrator::State::TEST_ACQUISITION:
      return "TEST_ACQUISITION";
    case Orchestrator::State::GENERATING:
      return "GENERATING";
    case Orchestrator::State::EXECUTING:
      return "EXECUTING";
    case Orchestrator::State::VALIDATING:
      return "VALIDATING";
    case Orchestrator::State::REPAIRING:
      return "REPAIRING";
    case Orchestrator::State::COMPLETE:
      return "COMPLETE";
    case Orchestrator::State::FAILED:
      return "FAILED";
    case Orchestrator::State::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

const constexpr int32_t Orchestrator::kMinIterations;
const constexpr int32_t Orchestrator::kMaxIterations;

RunOptions::RunOptions()
    : max_iterations(FLAGS_max_iterations),
      timeout_millis(FLAGS_execution_timeout_millis),
      emit_cost_updates(FLAGS_emit_cost_updates) {}

Orchestrator::Orchestrator(gateway::Gateway* gateway,
                           executor::Executor* executor, EventQueue* queue)
    : gateway_(gateway), executor_(executor), queue_(queue) {
  CHECK(gateway_ != nullptr);
  CHECK(executor_ != nullptr);
  CHECK(queue_ != nullptr);
}

void Orchestrator::Cancel() {
  LOG(WARNING) << "Cancellation requested";
  token_.Cancel();
  call_token_.Cancel();
}

std::string Orchestrator::Tag() const {
  return absl::StrCat("[", options_.run_id, "] ");
}

proto::Run Orchestrator::Run(const std::string& task,
                             const RunOptions& options) {
  if (options.max_iterations < kMinIterations ||
      options.max_iterations > kMaxIterations) {
    throw std::invalid_argument(
        absl::StrCat("max_iterations must be between ", kMinIterations,
                     " and ", kMaxIterations, ", got ",
                     options.max_iterations));
  }
  CHECK(!started_) << "An orchestrator runs a single task";
  started_ = true;
  options_ = options;

  run_.set_run_id(options_.run_id);
  run_.set_task(task);
  run_.set_max_iterations(options_.max_iterations);
  *run_.mutable_created_at() = TimeUtil::GetCurrentTime();

  State state = State::PLANNING;
  while (state != State::COMPLETE && state != State::FAILED &&
         state != State::CANCELLED) {
    if (IsCancelled()) {
      state = State::CANCELLED;
      break;
    }
    LOG(INFO) << Tag() << StateName(state) << " (iteration "
              << run_.iteration() << ")";
    switch (state) {
      case State::PLANNING:
        state = Plan();
        break;
      case State::TEST_ACQUISITION:
        state = AcquireTests();
        break;
      case State::GENERATING:
        state = Generate();
        break;
      case State::EXECUTING:
        state = ExecuteCandidate();
        break;
      case State::VALIDATING:
        state = ValidateCandidate();
        break;
      case State::REPAIRING:
        state = Repair();
        break;
      case State::COMPLETE:
      case State::FAILED:
      case State::CANCELLED:
        LOG(FATAL) << "Unreachable";
    }
  }
  return Finish(state);
}

proto::GatewayResponse Orchestrator::CallGateway(
    const proto::GatewayRequest& request, const std::string& step) {
  VLOG(1) << Tag() << "Gateway request "
          << proto::RequestKind_Name(request.kind()) << ", "
          << request.ByteSizeLong() << " bytes";
  proto::GatewayResponse response = gateway_->Call(request, &call_token_);
  const proto::TokenUsage& usage = response.usage();
  ledger_.Record(step, usage.prompt_tokens(), usage.completion_tokens(),
                 UnitCost{usage.input_cost_per_mtok(),
                          usage.output_cost_per_mtok()});
  if (response.has_failure()) {
    LOG(WARNING) << Tag() << "Gateway failure at " << step << " ("
                 << proto::FailureKind_Name(response.failure().kind())
                 << "): " << response.failure().message();
  } else {
    VLOG(1) << Tag() << "Gateway response " << response.ByteSizeLong()
            << " bytes";
  }
  return response;
}

void Orchestrator::MaybeEmitCostUpdate() {
  if (options_.emit_cost_updates) queue_->CostUpdate(ledger_.Snapshot());
}

Orchestrator::State Orchestrator::Fatal(const std::string& message) {
  LOG(ERROR) << Tag() << message;
  run_.set_outcome(proto::Outcome::FATAL);
  run_.set_reason(message);
  queue_->Error(message);
  return State::FAILED;
}

Orchestrator::State Orchestrator::AfterFailure() {
  if (run_.iteration() >= options_.max_iterations) {
    run_.set_outcome(proto::Outcome::EXHAUSTED);
    run_.set_reason(kExhaustedReason);
    return State::FAILED;
  }
  return State::REPAIRING;
}

proto::Iteration* Orchestrator::CurrentIteration() {
  CHECK_GT(run_.iterations_size(), 0);
  return run_.mutable_iterations(run_.iterations_size() - 1);
}

Orchestrator::State Orchestrator::Plan() {
  proto::GatewayRequest request;
  request.set_kind(proto::RequestKind::PLAN);
  request.mutable_plan()->set_task(run_.task());
  proto::GatewayResponse response = CallGateway(request, "planning");
  if (IsCancelled()) return State::CANCELLED;
  if (response.has_failure()) {
    return Fatal(
        absl::StrCat("Planning failed: ", response.failure().message()));
  }
  if (!response.has_plan()) {
    return Fatal("Planning failed: the response carries no plan");
  }
  run_.set_understanding(response.plan().understanding());
  run_.set_approach(response.plan().approach());
  queue_->Planning(run_.understanding(), run_.approach());
  MaybeEmitCostUpdate();
  return State::TEST_ACQUISITION;
}

Orchestrator::State Orchestrator::AcquireTests() {
  bool inferred = !options_.user_tests;
  if (inferred) {
    proto::GatewayRequest request;
    request.set_kind(proto::RequestKind::INFER_TESTS);
    auto* context = request.mutable_infer_tests();
    context->set_task(run_.task());
    context->set_understanding(run_.understanding());
    context->set_approach(run_.approach());
    proto::GatewayResponse response = CallGateway(request, "test_inference");
    if (IsCancelled()) return State::CANCELLED;
    if (response.has_failure()) {
      return Fatal(absl::StrCat("Test inference failed: ",
                                response.failure().message()));
    }
    tests_.assign(response.tests().test_cases().begin(),
                  response.tests().test_cases().end());
  } else {
    tests_ = *options_.user_tests;
  }

  if (tests_.empty()) return Fatal("No test cases available");
  for (size_t i = 0; i < tests_.size(); i++) {
    if (!tests_[i].has_expected_output()) {
      return Fatal(
          absl::StrCat("Test case ", i + 1, " has no expected output"));
    }
  }
  for (const proto::TestCase& test : tests_) *run_.add_test_cases() = test;

  if (inferred) {
    queue_->TestInference(tests_);
    MaybeEmitCostUpdate();
  } else {
    run_.set_test_inference_skipped(true);
    queue_->TestInferenceSkipped(kUserTestsMessage, tests_.size());
  }
  LOG(INFO) << Tag() << tests_.size() << " test cases";
  return State::GENERATING;
}

Orchestrator::State Orchestrator::Generate() {
  int32_t iteration = run_.iteration() + 1;
  run_.set_iteration(iteration);
  proto::Iteration* current = run_.add_iterations();
  current->set_index(iteration);

  proto::GatewayRequest request;
  request.set_kind(proto::RequestKind::GENERATE);
  auto* context = request.mutable_generate();
  context->set_task(run_.task());
  context->set_understanding(run_.understanding());
  context->set_approach(run_.approach());
  for (const proto::TestCase& test : tests_) *context->add_test_cases() = test;
  context->set_iteration(iteration);
  context->set_previous_analysis(previous_analysis_);
  context->set_policy(kAntiShortcutPolicy);

  proto::GatewayResponse response = CallGateway(
      request, absl::StrCat("code_generation_iter_", iteration));
  if (IsCancelled()) return State::CANCELLED;

  if (!response.has_code()) {
    proto::GatewayFailure failure = response.failure();
    if (!response.has_failure()) {
      failure.set_kind(proto::FailureKind::MALFORMED_OUTPUT);
      failure.set_message("the response carries no code");
    }
    current->set_generation_error(failure.message());
    queue_->GenerationFailed(iteration, failure.kind(), failure.message());
    MaybeEmitCostUpdate();
    return AfterFailure();
  }

  const proto::CodePayload& code = response.code();
  version_++;
  current->set_code_version(version_);
  current->set_code(code.code());
  current->set_suspected_hardcoding(code.suspected_hardcoding());
  *current->mutable_hardcoding_findings() = code.hardcoding_findings();
  queue_->CodeGenerated(code, version_, iteration);
  MaybeEmitCostUpdate();

  if (code.suspected_hardcoding()) {
    LOG(WARNING) << Tag() << "Version " << version_
                 << " looks hardcoded, not executing it";
    return AfterFailure();
  }
  return State::EXECUTING;
}

Orchestrator::State Orchestrator::ExecuteCandidate() {
  proto::Iteration* current = CurrentIteration();
  Harness harness;
  try {
    harness = BuildHarness(current->code(), tests_);
  } catch (const std::invalid_argument& exc) {
    return Fatal(absl::StrCat("Cannot prepare the tests: ", exc.what()));
  }

  executor::ExecutionRequest request;
  request.code = harness.program;
  request.stdin_contents = harness.stdin_contents;
  request.timeout_millis = options_.timeout_millis;

  proto::ExecutionResult result;
  try {
    result = executor_->Execute(request, &token_);
  } catch (const executor::spawn_error& exc) {
    return Fatal(absl::StrCat("Cannot execute the code: ", exc.what()));
  } catch (const std::system_error& exc) {
    return Fatal(absl::StrCat("Cannot execute the code: ", exc.what()));
  }
  if (result.cancelled() || IsCancelled()) return State::CANCELLED;

  if (!result.success()) {
    LOG(WARNING) << Tag() << "Execution of version " << version_
                 << " failed: " << result.error();
  }
  raw_execution_ = result;
  marker_ = harness.marker;
  // Only the output of the program itself is reported.
  result.set_output(StripReports(result.output(), marker_));
  *current->mutable_execution() = result;
  queue_->Execution(result, run_.iteration());
  return State::VALIDATING;
}

Orchestrator::State Orchestrator::ValidateCandidate() {
  proto::Iteration* current = CurrentIteration();
  proto::ValidationResult validation =
      Validate(raw_execution_, tests_, marker_);
  *current->mutable_validation() = validation;
  queue_->Validation(validation, run_.iteration());
  LOG(INFO) << Tag() << validation.passed() << "/" << validation.total()
            << " tests passed";
  if (validation.failed() == 0) return State::COMPLETE;
  return AfterFailure();
}

Orchestrator::State Orchestrator::Repair() {
  proto::Iteration* current = CurrentIteration();
  int32_t iteration = run_.iteration();

  proto::GatewayRequest request;
  request.set_kind(proto::RequestKind::REPAIR);
  auto* context = request.mutable_repair();
  context->set_task(run_.task());
  context->set_approach(run_.approach());
  context->set_code(current->code());
  if (current->has_execution()) {
    *context->mutable_execution() = current->execution();
  }
  if (current->has_validation()) {
    *context->mutable_validation() = current->validation();
  }
  context->set_iteration(iteration);
  context->set_generation_error(current->generation_error());
  *context->mutable_hardcoding_findings() = current->hardcoding_findings();

  proto::GatewayResponse response =
      CallGateway(request, absl::StrCat("error_fixing_iter_", iteration));
  if (IsCancelled()) return State::CANCELLED;

  std::string analysis;
  if (response.has_repair()) {
    analysis = absl::StrCat("Root Cause: ", response.repair().root_cause(),
                            "\n\nSuggested Fix: ",
                            response.repair().suggested_fix());
  } else {
    std::string message = response.has_failure()
                              ? response.failure().message()
                              : "the response carries no analysis";
    analysis = absl::StrCat("Root Cause: Error analysis failed: ", message,
                            "\n\nSuggested Fix: Review the failing tests and "
                            "regenerate the code from the approach.");
  }
  current->set_repair_analysis(analysis);
  previous_analysis_ = analysis;
  queue_->ErrorFixing(analysis, iteration);
  MaybeEmitCostUpdate();
  return State::GENERATING;
}

proto::Run Orchestrator::Finish(State state) {
  if (state == State::CANCELLED) {
    run_.set_outcome(proto::Outcome::CANCELLED);
    run_.set_reason(kCancelledReason);
  } else if (state == State::COMPLETE) {
    run_.set_outcome(proto::Outcome::SUCCESS);
    run_.set_reason(kSuccessReason);
  }
  *run_.mutable_ledger() = ledger_.Snapshot();
  *run_.mutable_completed_at() = TimeUtil::GetCurrentTime();
  LOG(INFO) << Tag() << "Run ended: " << proto::Outcome_Name(run_.outcome())
            << " (" << run_.reason() << ") after " << run_.iteration()
            << " iterations, " << run_.ledger().total_tokens() << " tokens";

  // Fatal errors have already been reported.
  if (run_.outcome() == proto::Outcome::FATAL) return run_;

  proto::CompleteEvent complete;
  complete.set_success(run_.outcome() == proto::Outcome::SUCCESS);
  complete.set_reason(run_.reason());
  complete.set_outcome(run_.outcome());
  complete.set_iterations(run_.iteration());
  complete.set_total_tests(tests_.size());
  if (run_.iterations_size() > 0) {
    const proto::Iteration& last = run_.iterations(run_.iterations_size() - 1);
    complete.set_final_code(last.code());
    complete.set_final_output(last.execution().output());
    complete.set_passed_tests(last.validation().passed());
  }
  auto* usage = complete.mutable_token_usage();
  usage->set_total_tokens(run_.ledger().total_tokens());
  usage->set_estimated_cost_usd(run_.ledger().total_cost());
  *usage->mutable_breakdown() = run_.ledger().entries();
  queue_->Complete(std::move(complete));
  return run_;
}

}  // namespace manager

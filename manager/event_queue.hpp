#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/event.pb.h"

namespace manager {

// Channel of the events of one run, from the orchestrator to whoever streams
// or stores them. Events are delivered in order; after Stop, Dequeue returns
// the remaining events and then nothing.
class EventQueue {
 public:
  void RunStarted(const std::string& run_id, const std::string& session_id) {
    proto::Event event;
    auto* sub_event = event.mutable_run_started();
    sub_event->set_run_id(run_id);
    sub_event->set_session_id(session_id);
    Enqueue(std::move(event));
  }
  void Planning(const std::string& understanding, const std::string& approach) {
    proto::Event event;
    auto* sub_event = event.mutable_planning();
    sub_event->set_understanding(understanding);
    sub_event->set_approach(approach);
    Enqueue(std::move(event));
  }
  void TestInference(const std::vector<proto::TestCase>& tests) {
    proto::Event event;
    auto* sub_event = event.mutable_test_inference();
    for (const proto::TestCase& test : tests) {
      *sub_event->add_test_cases() = test;
    }
    sub_event->set_count(tests.size());
    Enqueue(std::move(event));
  }
  void TestInferenceSkipped(const std::string& message, int32_t test_count) {
    proto::Event event;
    auto* sub_event = event.mutable_test_inference_skipped();
    sub_event->set_message(message);
    sub_event->set_test_count(test_count);
    Enqueue(std::move(event));
  }
  void CodeGenerated(const proto::CodePayload& code, int32_t version,
                     int32_t iteration) {
    proto::Event event;
    auto* sub_event = event.mutable_code_generated();
    sub_event->set_code(code.code());
    sub_event->set_version(version);
    sub_event->set_iteration(iteration);
    sub_event->set_suspected_hardcoding(code.suspected_hardcoding());
    *sub_event->mutable_hardcoding_findings() = code.hardcoding_findings();
    Enqueue(std::move(event));
  }
  void GenerationFailed(int32_t iteration, proto::FailureKind kind,
                        const std::string& message) {
    proto::Event event;
    auto* sub_event = event.mutable_generation_failed();
    sub_event->set_iteration(iteration);
    sub_event->set_failure_kind(kind);
    sub_event->set_message(message);
    Enqueue(std::move(event));
  }
  void Execution(const proto::ExecutionResult& result, int32_t iteration) {
    proto::Event event;
    auto* sub_event = event.mutable_execution();
    sub_event->set_success(result.success());
    sub_event->set_output(result.output());
    sub_event->set_error(result.error());
    sub_event->set_execution_time(result.execution_time());
    sub_event->set_timed_out(result.timed_out());
    sub_event->set_exit_code(result.exit_code());
    sub_event->set_iteration(iteration);
    Enqueue(std::move(event));
  }
  void Validation(const proto::ValidationResult& result, int32_t iteration) {
    proto::Event event;
    auto* sub_event = event.mutable_validation();
    sub_event->set_passed(result.passed());
    sub_event->set_failed(result.failed());
    sub_event->set_total(result.total());
    *sub_event->mutable_results() = result.results();
    sub_event->set_iteration(iteration);
    Enqueue(std::move(event));
  }
  void ErrorFixing(const std::string& analysis, int32_t iteration) {
    proto::Event event;
    auto* sub_event = event.mutable_error_fixing();
    sub_event->set_analysis(analysis);
    sub_event->set_iteration(iteration);
    Enqueue(std::move(event));
  }
  void CostUpdate(const proto::CostLedger& ledger) {
    proto::Event event;
    auto* sub_event = event.mutable_cost_update();
    sub_event->set_total_tokens(ledger.total_tokens());
    sub_event->set_estimated_cost(ledger.total_cost());
    *sub_event->mutable_per_step_breakdown() = ledger.entries();
    Enqueue(std::move(event));
  }
  void Complete(proto::CompleteEvent&& complete) {
    proto::Event event;
    event.mutable_complete()->Swap(&complete);
    Enqueue(std::move(event));
  }
  void Error(const std::string& message) {
    proto::Event event;
    event.mutable_error()->set_error(message);
    Enqueue(std::move(event));
  }

  void Enqueue(proto::Event&& event);
  absl::optional<proto::Event> Dequeue();
  void Stop();
  bool IsStopped() {
    absl::MutexLock lck(&queue_mutex_);
    return stopped_;
  }

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::Event> queue_ ABSL_GUARDED_BY(queue_mutex_);
  bool stopped_ ABSL_GUARDED_BY(queue_mutex_) = false;
};

// Tag of the event kind, as used in the stored records ("planning",
// "code_generated", ...).
std::string EventType(const proto::Event& event);

// Whether no event of the same run can follow this one.
bool IsTerminal(const proto::Event& event);

}  // namespace manager

#endif

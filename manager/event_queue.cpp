#include "manager/event_queue.hpp"

namespace manager {

void EventQueue::Enqueue(proto::Event&& event) {
  absl::MutexLock lck(&queue_mutex_);
  queue_.push(std::move(event));
}

absl::optional<proto::Event> EventQueue::Dequeue() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  if (queue_.empty()) return {};
  absl::optional<proto::Event> event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

std::string EventType(const proto::Event& event) {
  switch (event.event_case()) {
    case proto::Event::kRunStarted:
      return "run_started";
    case proto::Event::kPlanning:
      return "planning";
    case proto::Event::kTestInference:
      return "test_inference";
    case proto::Event::kTestInferenceSkipped:
      return "test_inference_skipped";
    case proto::Event::kCodeGenerated:
      return "code_generated";
    case proto::Event::kGenerationFailed:
      return "generation_failed";
    case proto::Event::kExecution:
      return "execution";
    case proto::Event::kValidation:
      return "validation";
    case proto::Event::kErrorFixing:
      return "error_fixing";
    case proto::Event::kCostUpdate:
      return "cost_update";
    case proto::Event::kComplete:
      return "complete";
    case proto::Event::kError:
      return "error";
    case proto::Event::EVENT_NOT_SET:
      return "";
  }
  return "";
}

bool IsTerminal(const proto::Event& event) {
  return event.event_case() == proto::Event::kComplete ||
         event.event_case() == proto::Event::kError;
}

}  // namespace manager

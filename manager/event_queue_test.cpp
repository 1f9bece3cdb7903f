#include "manager/event_queue.hpp"

#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(EventQueueTest, DeliversInOrder) {
  manager::EventQueue queue;
  queue.Planning("understanding", "approach");
  queue.ErrorFixing("analysis", 2);
  queue.Error("boom");
  queue.Stop();

  absl::optional<proto::Event> event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(manager::EventType(*event), "planning");
  EXPECT_EQ(event->planning().approach(), "approach");

  event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(manager::EventType(*event), "error_fixing");
  EXPECT_EQ(event->error_fixing().iteration(), 2);
  EXPECT_FALSE(manager::IsTerminal(*event));

  event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->error().error(), "boom");
  EXPECT_TRUE(manager::IsTerminal(*event));

  EXPECT_FALSE(queue.Dequeue().has_value());
  EXPECT_TRUE(queue.IsStopped());
}

// NOLINTNEXTLINE
TEST(EventQueueTest, DequeueWaitsForProducer) {
  manager::EventQueue queue;
  std::thread producer([&queue]() {
    proto::ValidationResult result;
    result.set_passed(1);
    result.set_total(1);
    queue.Validation(result, 1);
    queue.Stop();
  });
  absl::optional<proto::Event> event = queue.Dequeue();
  producer.join();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(manager::EventType(*event), "validation");
  EXPECT_EQ(event->validation().passed(), 1);
  EXPECT_FALSE(queue.Dequeue().has_value());
}

// NOLINTNEXTLINE
TEST(EventQueueTest, CodeGeneratedCopiesFindings) {
  manager::EventQueue queue;
  proto::CodePayload code;
  code.set_code("def main():\n    return 1\n");
  code.set_suspected_hardcoding(true);
  code.add_hardcoding_findings("finding");
  queue.CodeGenerated(code, 3, 2);
  queue.Stop();
  absl::optional<proto::Event> event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->code_generated().version(), 3);
  EXPECT_EQ(event->code_generated().iteration(), 2);
  EXPECT_TRUE(event->code_generated().suspected_hardcoding());
  EXPECT_THAT(event->code_generated().hardcoding_findings(),
              ::testing::ElementsAre("finding"));
}

// NOLINTNEXTLINE
TEST(EventQueueTest, EveryKindHasATag) {
  proto::Event event;
  EXPECT_EQ(manager::EventType(event), "");
  event.mutable_test_inference_skipped();
  EXPECT_EQ(manager::EventType(event), "test_inference_skipped");
  event.mutable_cost_update();
  EXPECT_EQ(manager::EventType(event), "cost_update");
  event.mutable_complete();
  EXPECT_EQ(manager::EventType(event), "complete");
  EXPECT_TRUE(manager::IsTerminal(event));
}

}  // namespace

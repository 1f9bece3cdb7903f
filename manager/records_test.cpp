#include "manager/records.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"
#include "manager/event_queue.hpp"
#include "manager/session_store.hpp"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/codeforge_testdir/records";

google::protobuf::Struct ParseContent(const proto::StoredMessage& message) {
  google::protobuf::Struct content;
  EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(message.content(),
                                                          &content)
                  .ok())
      << message.content();
  return content;
}

// NOLINTNEXTLINE
TEST(RecordsTest, SnakeCaseFieldNames) {
  proto::Event event;
  auto* execution = event.mutable_execution();
  execution->set_success(false);
  execution->set_timed_out(true);
  execution->set_execution_time(2.5);
  execution->set_iteration(1);

  proto::StoredMessage message = manager::ToStoredMessage(event, 7);
  EXPECT_EQ(message.event_type(), "execution");
  EXPECT_EQ(message.order_index(), 7);
  EXPECT_THAT(message.content(), HasSubstr("\"timed_out\":true"));
  EXPECT_THAT(message.content(), HasSubstr("\"execution_time\":2.5"));
  // Default values are written too.
  EXPECT_THAT(message.content(), HasSubstr("\"exit_code\":0"));
  EXPECT_THAT(message.content(), HasSubstr("\"success\":false"));
  EXPECT_FALSE(message.timestamp().empty());
}

// NOLINTNEXTLINE
TEST(RecordsTest, UserQuery) {
  proto::StoredMessage message = manager::UserQuery("Sort \"numbers\"", 0);
  EXPECT_EQ(message.event_type(), "user_query");
  google::protobuf::Struct content = ParseContent(message);
  EXPECT_EQ(content.fields().at("query").string_value(), "Sort \"numbers\"");
}

// NOLINTNEXTLINE
TEST(RecordsTest, EmptyEventIsRejected) {
  EXPECT_THROW(manager::ToStoredMessage(proto::Event(), 0),
               std::invalid_argument);
}

class SessionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::RemoveTree(test_tmpdir);
    store_.reset(new manager::FileSessionStore(test_tmpdir));
  }
  void TearDown() override { util::File::RemoveTree(test_tmpdir); }

  std::unique_ptr<manager::FileSessionStore> store_;
};

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, CreateAndLoad) {
  EXPECT_FALSE(store_->Exists("abc"));
  EXPECT_FALSE(store_->Load("abc").has_value());
  store_->Create("abc", "A title");
  EXPECT_TRUE(store_->Exists("abc"));
  absl::optional<proto::StoredSession> session = store_->Load("abc");
  ASSERT_TRUE(session.has_value());
  EXPECT_EQ(session->session_id(), "abc");
  EXPECT_EQ(session->title(), "A title");
  EXPECT_FALSE(session->created_at().empty());
  EXPECT_EQ(session->messages_size(), 0);

  // Creating again keeps the session as it is.
  store_->Append("abc", manager::UserQuery("q", 0));
  store_->Create("abc", "Another title");
  EXPECT_EQ(store_->Load("abc")->title(), "A title");
  EXPECT_EQ(store_->Load("abc")->messages_size(), 1);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, MissingSession) {
  EXPECT_THROW(store_->Append("nope", manager::UserQuery("q", 0)),
               std::out_of_range);
  EXPECT_THROW(store_->UpdateTotals("nope", 1, 1), std::out_of_range);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, InvalidId) {
  EXPECT_THROW(store_->Exists("../etc"), std::invalid_argument);
  EXPECT_THROW(store_->Create("", "title"), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, RecorderWritesQueryFirst) {
  {
    manager::SessionRecorder recorder(store_.get(), "s1", "Add two numbers");
    proto::Event started;
    started.mutable_run_started()->set_run_id("r1");
    recorder.Record(started);
    proto::Event planning;
    planning.mutable_planning()->set_understanding("u");
    recorder.Record(planning);
    proto::Event error;
    error.mutable_error()->set_error("boom");
    recorder.Record(error);
    proto::CostLedger ledger;
    ledger.set_total_tokens(1500);
    ledger.set_total_cost(0.01);
    recorder.Finish(ledger);
  }

  proto::StoredSession session = *store_->Load("s1");
  EXPECT_EQ(session.title(), "Add two numbers");
  ASSERT_EQ(session.messages_size(), 3);
  EXPECT_EQ(session.messages(0).event_type(), "user_query");
  EXPECT_EQ(session.messages(1).event_type(), "planning");
  EXPECT_EQ(session.messages(2).event_type(), "error");
  for (int i = 0; i < session.messages_size(); i++) {
    EXPECT_EQ(session.messages(i).order_index(), i);
  }
  EXPECT_EQ(session.total_tokens(), 1500);
  EXPECT_DOUBLE_EQ(session.total_cost(), 0.01);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, SecondRunContinuesTheSequence) {
  proto::CostLedger ledger;
  ledger.set_total_tokens(100);
  ledger.set_total_cost(0.5);
  for (int run = 0; run < 2; run++) {
    manager::SessionRecorder recorder(store_.get(), "s2", "task");
    proto::Event complete;
    complete.mutable_complete()->set_success(true);
    recorder.Record(complete);
    recorder.Finish(ledger);
  }
  proto::StoredSession session = *store_->Load("s2");
  ASSERT_EQ(session.messages_size(), 4);
  EXPECT_EQ(session.messages(2).event_type(), "user_query");
  EXPECT_EQ(session.messages(2).order_index(), 2);
  EXPECT_EQ(session.messages(3).order_index(), 3);
  EXPECT_EQ(session.total_tokens(), 200);
  EXPECT_DOUBLE_EQ(session.total_cost(), 1.0);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, LongTaskTitleIsTruncated) {
  manager::SessionRecorder recorder(store_.get(), "s3", std::string(500, 'x'));
  EXPECT_EQ(store_->Load("s3")->title().size(),
            manager::SessionRecorder::kMaxTitleLength);
}

// NOLINTNEXTLINE
TEST_F(SessionStoreTest, TitleIsNotCutInsideACharacter) {
  // U+00E9 takes two bytes, the second one beyond the limit.
  std::string task = std::string(199, 'a') + "\xc3\xa9" + "tail";
  manager::SessionRecorder first(store_.get(), "s4", task);
  EXPECT_EQ(store_->Load("s4")->title(), std::string(199, 'a'));

  // Here it ends exactly at the limit.
  task = std::string(198, 'a') + "\xc3\xa9" + "tail";
  manager::SessionRecorder second(store_.get(), "s5", task);
  EXPECT_EQ(store_->Load("s5")->title(),
            std::string(198, 'a') + "\xc3\xa9");

  // The stored session is valid proto3, so it can be served as is.
  std::string json;
  EXPECT_TRUE(google::protobuf::util::MessageToJsonString(*store_->Load("s4"),
                                                          &json)
                  .ok());
}

}  // namespace

#include "gateway/remote_gateway.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "gtest/gtest.h"
#include "proto/gateway.grpc.pb.h"

namespace {

// Plans at once, rate limits test inference, and holds every other request
// until the client gives up.
class SlowService : public proto::GenerationGateway::Service {
 public:
  grpc::Status Call(grpc::ServerContext* context,
                    const proto::GatewayRequest* request,
                    proto::GatewayResponse* response) override {
    switch (request->kind()) {
      case proto::PLAN:
        response->mutable_plan()->set_understanding("add");
        response->mutable_plan()->set_approach("a + b");
        response->mutable_usage()->set_prompt_tokens(10);
        return grpc::Status::OK;
      case proto::INFER_TESTS:
        return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                            "slow down");
      default:
        break;
    }
    started.Notify();
    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (!context->IsCancelled() &&
           std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return grpc::Status(grpc::StatusCode::CANCELLED, "gave up");
  }

  absl::Notification started;
};

class RemoteGatewayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    int port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port);
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    ASSERT_TRUE(server_);
    ASSERT_GT(port, 0);
    address_ = "127.0.0.1:" + std::to_string(port);
  }

  void TearDown() override {
    if (server_) server_->Shutdown();
  }

  proto::GatewayRequest Request(proto::RequestKind kind) {
    proto::GatewayRequest request;
    request.set_kind(kind);
    return request;
  }

  SlowService service_;
  std::unique_ptr<grpc::Server> server_;
  std::string address_;
};

// NOLINTNEXTLINE
TEST_F(RemoteGatewayTest, ReturnsTheResponse) {
  gateway::RemoteGateway remote(address_, 10);
  proto::GatewayResponse response =
      remote.Call(Request(proto::PLAN), nullptr);
  ASSERT_FALSE(response.has_failure()) << response.failure().message();
  EXPECT_EQ(response.plan().approach(), "a + b");
  EXPECT_EQ(response.usage().prompt_tokens(), 10);
}

// NOLINTNEXTLINE
TEST_F(RemoteGatewayTest, ResourceExhaustedIsRateLimited) {
  gateway::RemoteGateway remote(address_, 10);
  proto::GatewayResponse response =
      remote.Call(Request(proto::INFER_TESTS), nullptr);
  EXPECT_EQ(response.failure().kind(), proto::RATE_LIMITED);
  EXPECT_EQ(response.failure().message(), "slow down");
}

// NOLINTNEXTLINE
TEST_F(RemoteGatewayTest, CancelAbortsTheCallInFlight) {
  gateway::RemoteGateway remote(address_, 120);
  gateway::CallToken token;
  std::thread canceller([this, &token] {
    service_.started.WaitForNotification();
    token.Cancel();
  });
  auto start = std::chrono::steady_clock::now();
  proto::GatewayResponse response =
      remote.Call(Request(proto::GENERATE), &token);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();
  EXPECT_TRUE(response.has_failure());
  EXPECT_EQ(response.failure().kind(), proto::PROVIDER_ERROR);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

// NOLINTNEXTLINE
TEST_F(RemoteGatewayTest, CancelledTokenFailsAtOnce) {
  gateway::RemoteGateway remote(address_, 120);
  gateway::CallToken token;
  token.Cancel();
  proto::GatewayResponse response =
      remote.Call(Request(proto::GENERATE), &token);
  EXPECT_EQ(response.failure().kind(), proto::PROVIDER_ERROR);
  EXPECT_FALSE(service_.started.HasBeenNotified());
}

}  // namespace

#include "gateway/remote_gateway.hpp"

#include <chrono>

#include "glog/logging.h"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "grpc/grpc.h"

namespace gateway {

std::shared_ptr<proto::GenerationGateway::Stub> RemoteGateway::GetStub() {
  absl::MutexLock lock(&mutex_);
  if (channel_ &&
      channel_->GetState(/* try_to_connect = */ true) != GRPC_CHANNEL_SHUTDOWN)
    return stub_;
  VLOG(1) << "Connecting to the generation gateway at " << address_;
  channel_ = grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
  stub_ = proto::GenerationGateway::NewStub(channel_);
  return stub_;
}

proto::GatewayResponse RemoteGateway::Call(
    const proto::GatewayRequest& request, CallToken* token) {
  std::shared_ptr<proto::GenerationGateway::Stub> stub = GetStub();
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() +
                       std::chrono::seconds(deadline_seconds_));
  if (token != nullptr && !token->Attach([&context] { context.TryCancel(); })) {
    return MakeFailure(proto::PROVIDER_ERROR, "Cancelled");
  }
  proto::GatewayResponse response;
  VLOG(1) << "Gateway request " << proto::RequestKind_Name(request.kind())
          << ", " << request.ByteSizeLong() << " bytes";
  grpc::Status status = stub->Call(&context, request, &response);
  if (token != nullptr) token->Detach();
  if (status.ok()) return response;
  LOG(WARNING) << "Generation gateway call failed: " << status.error_message();
  if (status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED) {
    return MakeFailure(proto::RATE_LIMITED, status.error_message());
  }
  return MakeFailure(proto::PROVIDER_ERROR, status.error_message());
}

}  // namespace gateway

#ifndef GATEWAY_REMOTE_GATEWAY_HPP
#define GATEWAY_REMOTE_GATEWAY_HPP

#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"
#include "gateway/gateway.hpp"
#include "grpc++/channel.h"
#include "proto/gateway.grpc.pb.h"

namespace gateway {

// Forwards requests to a GenerationGateway service, such as a provider
// adapter running next to the server.
class RemoteGateway : public Gateway {
 public:
  RemoteGateway(std::string address, int deadline_seconds)
      : address_(std::move(address)), deadline_seconds_(deadline_seconds) {}
  proto::GatewayResponse Call(const proto::GatewayRequest& request,
                              CallToken* token) override;

 private:
  // Returns a stub, creating a new channel if there is none or if the
  // current one was shut down.
  std::shared_ptr<proto::GenerationGateway::Stub> GetStub();

  std::string address_;
  int deadline_seconds_;
  absl::Mutex mutex_;
  std::shared_ptr<grpc::Channel> channel_ ABSL_GUARDED_BY(mutex_);
  std::shared_ptr<proto::GenerationGateway::Stub> stub_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace gateway

#endif

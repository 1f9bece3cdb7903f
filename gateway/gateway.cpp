#include "gateway/gateway.hpp"

#include <utility>

namespace gateway {

void CallToken::Cancel() {
  absl::MutexLock lock(&mutex_);
  if (cancelled_) return;
  cancelled_ = true;
  if (abort_) abort_();
}

bool CallToken::IsCancelled() const {
  absl::MutexLock lock(&mutex_);
  return cancelled_;
}

bool CallToken::Attach(std::function<void()> abort) {
  absl::MutexLock lock(&mutex_);
  if (cancelled_) return false;
  abort_ = std::move(abort);
  return true;
}

void CallToken::Detach() {
  absl::MutexLock lock(&mutex_);
  abort_ = nullptr;
}

proto::GatewayResponse MakeFailure(proto::FailureKind kind,
                                   const std::string& message) {
  proto::GatewayResponse response;
  response.mutable_failure()->set_kind(kind);
  response.mutable_failure()->set_message(message);
  return response;
}

}  // namespace gateway

#ifndef GATEWAY_GATEWAY_HPP
#define GATEWAY_GATEWAY_HPP

#include <functional>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/gateway.pb.h"

namespace gateway {

// Handle used to abort the calls of a run from another thread. Once cancelled
// it stays cancelled, and calls made with it fail at once.
class CallToken {
 public:
  CallToken() = default;
  CallToken(const CallToken&) = delete;
  CallToken& operator=(const CallToken&) = delete;

  // Aborts the call in flight, if any. Thread-safe.
  void Cancel();
  bool IsCancelled() const;

  // For implementations: abort is run by Cancel until Detach returns.
  // Returns false, without attaching, if the token was already cancelled.
  bool Attach(std::function<void()> abort);
  void Detach();

 private:
  mutable absl::Mutex mutex_;
  bool cancelled_ ABSL_GUARDED_BY(mutex_) = false;
  std::function<void()> abort_ ABSL_GUARDED_BY(mutex_);
};

// Contract of the language model provider. Implementations never throw for
// provider problems: a failed call returns a response with the failure set,
// and with the usage of whatever tokens were consumed. token may be null.
class Gateway {
 public:
  virtual proto::GatewayResponse Call(const proto::GatewayRequest& request,
                                      CallToken* token) = 0;

  Gateway() = default;
  virtual ~Gateway() = default;
  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;
  Gateway(Gateway&&) = delete;
  Gateway& operator=(Gateway&&) = delete;
};

// Returns a response carrying only a failure of the given kind.
proto::GatewayResponse MakeFailure(proto::FailureKind kind,
                                   const std::string& message);

}  // namespace gateway

#endif

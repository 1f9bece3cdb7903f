#ifndef GATEWAY_SCREENING_GATEWAY_HPP
#define GATEWAY_SCREENING_GATEWAY_HPP

#include <string>

#include "gateway/gateway.hpp"
#include "gateway/hardcoding_policy.hpp"

namespace gateway {

// Checks the responses of another gateway. A payload that does not match the
// request kind or is not usable becomes a MALFORMED_OUTPUT failure, keeping
// the usage. Generated code importing modules that reach the host (os, sys,
// subprocess, sockets, http clients) is rejected too. Accepted code is
// inspected by the hardcoding policy, if any.
// Malformed output is rejected as is, never repaired.
class ScreeningGateway : public Gateway {
 public:
  ScreeningGateway(Gateway* inner, const HardcodingPolicy* policy)
      : inner_(inner), policy_(policy) {}
  proto::GatewayResponse Call(const proto::GatewayRequest& request,
                              CallToken* token) override;

  // Returns a description of what is wrong with the response, or an empty
  // string if it can be used.
  static std::string Check(proto::RequestKind kind,
                           const proto::GatewayResponse& response);

 private:
  Gateway* inner_;
  const HardcodingPolicy* policy_;
};

}  // namespace gateway

#endif

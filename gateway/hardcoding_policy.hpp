#ifndef GATEWAY_HARDCODING_POLICY_HPP
#define GATEWAY_HARDCODING_POLICY_HPP

#include <string>
#include <vector>

#include "proto/test_case.pb.h"

namespace gateway {

// Decides whether a candidate program looks like it returns the expected
// answers of the tests instead of computing them.
class HardcodingPolicy {
 public:
  // Returns one human readable finding per suspicious pattern; an empty
  // result means the code is not suspected.
  virtual std::vector<std::string> Inspect(
      const std::string& code,
      const std::vector<proto::TestCase>& tests) const = 0;

  HardcodingPolicy() = default;
  virtual ~HardcodingPolicy() = default;
  HardcodingPolicy(const HardcodingPolicy&) = delete;
  HardcodingPolicy& operator=(const HardcodingPolicy&) = delete;
};

// Textual heuristics over Python source:
//  - list, dict or set literals with more than 20 elements;
//  - more than 5 lines comparing something to a string literal in an if;
//  - more than 3 returns of a bare number or string literal;
//  - numbers from the inputs of the first 5 tests appearing as string
//    literals;
//  - the expected outputs of at least 2 tests returned verbatim.
class HeuristicHardcodingPolicy : public HardcodingPolicy {
 public:
  static const constexpr size_t kMaxLiteralElements = 20;
  static const constexpr int kMaxStringComparisons = 5;
  static const constexpr int kMaxLiteralReturns = 3;
  static const constexpr size_t kInspectedTestInputs = 5;
  static const constexpr int kMaxVerbatimOutputs = 1;

  std::vector<std::string> Inspect(
      const std::string& code,
      const std::vector<proto::TestCase>& tests) const override;
};

// Python literal for a value, as a program returning it would spell it
// (None, True, 12, 1.5, "abc", [1, 2], {"k": 1}).
std::string PythonLiteral(const google::protobuf::Value& value);

}  // namespace gateway

#endif

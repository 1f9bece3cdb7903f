#include "manager/validation.hpp"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "glog/logging.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/util/message_differencer.h"

namespace manager {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

std::string KindName(const Value& value) {
  switch (value.kind_case()) {
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return "null";
    case Value::kNumberValue:
      return "a number";
    case Value::kStringValue:
      return "a string";
    case Value::kBoolValue:
      return "a boolean";
    case Value::kStructValue:
      return "an object";
    case Value::kListValue:
      return "a list";
  }
  return "null";
}

std::string ToJson(const Value& value) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(value, &json).ok()) {
    return "<unprintable>";
  }
  return json;
}

// Unset and null values are the same thing for the comparison.
bool IsNull(const Value& value) {
  return value.kind_case() == Value::kNullValue ||
         value.kind_case() == Value::KIND_NOT_SET;
}

}  // namespace

proto::ValidationResult Validate(const proto::ExecutionResult& execution,
                                 const std::vector<proto::TestCase>& tests,
                                 const std::string& marker) {
  std::vector<absl::optional<Struct>> reports(tests.size());
  // A test with more than one result line fails: only the harness may write
  // them.
  std::vector<bool> repeated(tests.size(), false);
  bool any_marker = false;
  std::string prefix = absl::StrCat(marker, " ");
  for (absl::string_view line : absl::StrSplit(execution.output(), '\n')) {
    size_t pos = line.find(prefix);
    if (marker.empty() || pos == absl::string_view::npos) continue;
    line.remove_prefix(pos + prefix.size());
    any_marker = true;
    Struct report;
    if (!google::protobuf::util::JsonStringToMessage(std::string(line),
                                                     &report)
             .ok()) {
      continue;
    }
    auto index = report.fields().find("index");
    if (index == report.fields().end() ||
        index->second.kind_case() != Value::kNumberValue) {
      continue;
    }
    double position = index->second.number_value();
    if (position < 0 || position >= tests.size() ||
        position != static_cast<size_t>(position)) {
      continue;
    }
    size_t test = static_cast<size_t>(position);
    if (reports[test].has_value()) {
      repeated[test] = true;
    } else {
      reports[test] = std::move(report);
    }
  }

  bool short_circuit = execution.timed_out() || execution.cancelled() ||
                       (!execution.success() && !any_marker);
  std::string execution_error =
      execution.error().empty() ? "Execution failed" : execution.error();

  proto::ValidationResult result;
  result.set_total(tests.size());
  for (size_t i = 0; i < tests.size(); i++) {
    const proto::TestCase& test = tests[i];
    proto::TestResult* test_result = result.add_results();
    test_result->set_description(test.description());
    test_result->set_expected_output(ToJson(test.expected_output()));
    test_result->set_passed(false);

    if (short_circuit) {
      test_result->set_error(execution_error);
    } else if (repeated[i]) {
      test_result->set_error("More than one result reported");
    } else if (!reports[i].has_value()) {
      test_result->set_error(
          execution.success()
              ? "No result reported"
              : absl::StrCat("No result reported: ", execution_error));
    } else {
      const auto& fields = reports[i]->fields();
      auto success = fields.find("success");
      auto value = fields.find("result");
      if (success == fields.end() || !success->second.bool_value()) {
        auto error = fields.find("error");
        test_result->set_error(error == fields.end()
                                   ? "Unknown error"
                                   : error->second.string_value());
      } else {
        Value actual;
        if (value != fields.end()) actual = value->second;
        test_result->set_actual_output(ToJson(actual));
        const Value& expected = test.expected_output();
        if (IsNull(actual) && IsNull(expected)) {
          test_result->set_passed(true);
        } else if (actual.kind_case() != expected.kind_case()) {
          test_result->set_error(absl::StrCat("expected ", KindName(expected),
                                              ", got ", KindName(actual)));
        } else if (google::protobuf::util::MessageDifferencer::Equals(
                       actual, expected)) {
          test_result->set_passed(true);
        } else {
          test_result->set_error(absl::StrCat("Expected ", ToJson(expected),
                                              ", got ", ToJson(actual)));
        }
      }
    }
    if (test_result->passed()) {
      result.set_passed(result.passed() + 1);
    } else {
      result.set_failed(result.failed() + 1);
    }
  }
  CHECK_EQ(result.passed() + result.failed(), result.total());
  return result;
}

}  // namespace manager

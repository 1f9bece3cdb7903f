#include "gateway/screening_gateway.hpp"

#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"

namespace gateway {

namespace {
const constexpr size_t kMinCodeLength = 10;

// Modules giving the program access to the host: processes, the interpreter,
// files outside the box and the network.
const char* const kForbiddenModules[] = {
    "os",     "subprocess", "sys",    "socket",   "requests",
    "urllib", "http",       "ftplib", "telnetlib"};

bool IsForbidden(absl::string_view module) {
  absl::string_view package = module.substr(0, module.find('.'));
  for (const char* forbidden : kForbiddenModules) {
    if (package == forbidden) return true;
  }
  return false;
}

// Forbidden modules named by import statements, in order of appearance.
std::vector<std::string> ForbiddenImports(absl::string_view source) {
  std::vector<std::string> found;
  for (absl::string_view line : absl::StrSplit(source, '\n')) {
    line = line.substr(0, line.find('#'));
    // Statements after ';' or after the ':' of a compound statement.
    for (absl::string_view statement :
         absl::StrSplit(line, absl::ByAnyChar(";:"))) {
      statement = absl::StripAsciiWhitespace(statement);
      std::vector<absl::string_view> modules;
      if (absl::ConsumePrefix(&statement, "import ")) {
        for (absl::string_view name : absl::StrSplit(statement, ',')) {
          name = absl::StripAsciiWhitespace(name);
          modules.push_back(name.substr(0, name.find_first_of(" \t")));
        }
      } else if (absl::ConsumePrefix(&statement, "from ")) {
        statement = absl::StripLeadingAsciiWhitespace(statement);
        modules.push_back(statement.substr(0, statement.find_first_of(" \t")));
      }
      for (absl::string_view module : modules) {
        if (IsForbidden(module)) found.emplace_back(module);
      }
    }
  }
  return found;
}

std::string CheckCode(const proto::CodePayload& code) {
  if (!code.filename().empty() && !absl::EndsWith(code.filename(), ".py")) {
    return absl::StrCat("Filename must end with .py, got: ", code.filename());
  }
  absl::string_view source = absl::StripAsciiWhitespace(code.code());
  if (absl::StartsWith(source, "```") ||
      absl::StrContains(source, "```python")) {
    return "Code contains markdown formatting (```)";
  }
  if (source.size() < kMinCodeLength) {
    return absl::StrCat("Code is too short or empty: ", source.size(),
                        " characters");
  }
  std::vector<std::string> imports = ForbiddenImports(source);
  if (!imports.empty()) {
    return absl::StrCat("Code imports forbidden modules: ",
                        absl::StrJoin(imports, ", "));
  }
  return "";
}

std::string CheckTests(const proto::TestsPayload& tests) {
  if (tests.test_cases_size() == 0) return "No test cases";
  for (int i = 0; i < tests.test_cases_size(); i++) {
    const proto::TestCase& test = tests.test_cases(i);
    if (!test.has_expected_output() ||
        test.expected_output().kind_case() ==
            google::protobuf::Value::KIND_NOT_SET) {
      return absl::StrCat("Test case ", i + 1, " has no expected output");
    }
  }
  return "";
}
}  // namespace

std::string ScreeningGateway::Check(proto::RequestKind kind,
                                    const proto::GatewayResponse& response) {
  switch (kind) {
    case proto::PLAN:
      if (!response.has_plan()) return "Expected a plan";
      if (response.plan().understanding().empty() ||
          response.plan().approach().empty()) {
        return "The plan has no understanding or no approach";
      }
      return "";
    case proto::INFER_TESTS:
      if (!response.has_tests()) return "Expected test cases";
      return CheckTests(response.tests());
    case proto::GENERATE:
      if (!response.has_code()) return "Expected code";
      return CheckCode(response.code());
    case proto::REPAIR:
      if (!response.has_repair()) return "Expected an error analysis";
      if (response.repair().root_cause().empty() &&
          response.repair().suggested_fix().empty()) {
        return "The error analysis is empty";
      }
      return "";
    default:
      return absl::StrCat("Unknown request kind ",
                          proto::RequestKind_Name(kind));
  }
}

proto::GatewayResponse ScreeningGateway::Call(
    const proto::GatewayRequest& request, CallToken* token) {
  proto::GatewayResponse response = inner_->Call(request, token);
  if (response.has_failure()) return response;

  std::string problem = Check(request.kind(), response);
  if (!problem.empty()) {
    LOG(WARNING) << "Rejected " << proto::RequestKind_Name(request.kind())
                 << " response: " << problem;
    proto::TokenUsage usage = response.usage();
    response = MakeFailure(proto::MALFORMED_OUTPUT, problem);
    *response.mutable_usage() = usage;
    return response;
  }

  if (request.kind() == proto::GENERATE && policy_ != nullptr) {
    std::vector<proto::TestCase> tests(
        request.generate().test_cases().begin(),
        request.generate().test_cases().end());
    std::vector<std::string> findings =
        policy_->Inspect(response.code().code(), tests);
    if (!findings.empty()) {
      LOG(WARNING) << "Suspected hardcoding: " << findings.front();
      response.mutable_code()->set_suspected_hardcoding(true);
      for (std::string& finding : findings) {
        response.mutable_code()->add_hardcoding_findings(std::move(finding));
      }
    }
  }
  return response;
}

}  // namespace gateway

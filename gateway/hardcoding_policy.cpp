#include "gateway/hardcoding_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace {

struct OpenBracket {
  char bracket;
  size_t commas = 0;
  bool nonempty = false;
  char last = 0;
};

// Finds list, dict and set literals with too many elements. Brackets inside
// string literals and comments are ignored.
void FindLargeLiterals(const std::string& code, size_t max_elements,
                       std::vector<std::string>* findings) {
  std::vector<OpenBracket> stack;
  auto mark = [&stack](char c) {
    if (stack.empty()) return;
    stack.back().nonempty = true;
    stack.back().last = c;
  };
  for (size_t i = 0; i < code.size(); i++) {
    char c = code[i];
    if (c == '#') {
      while (i < code.size() && code[i] != '\n') i++;
      continue;
    }
    if (c == '"' || c == '\'') {
      bool triple = code.compare(i, 3, std::string(3, c)) == 0;
      size_t end = i + (triple ? 3 : 1);
      while (end < code.size()) {
        if (code[end] == '\\') {
          end += 2;
          continue;
        }
        if (triple ? code.compare(end, 3, std::string(3, c)) == 0
                   : code[end] == c || code[end] == '\n') {
          break;
        }
        end++;
      }
      i = std::min(code.size(), end + (triple ? 3 : 1)) - 1;
      mark(c);
      continue;
    }
    if (c == '[' || c == '{' || c == '(') {
      mark(c);
      stack.push_back(OpenBracket{c});
      continue;
    }
    if (c == ']' || c == '}' || c == ')') {
      if (stack.empty()) continue;
      OpenBracket open = stack.back();
      stack.pop_back();
      if (open.bracket == '(' || !open.nonempty) continue;
      size_t elements = open.last == ',' ? open.commas : open.commas + 1;
      if (elements > max_elements) {
        findings->push_back(absl::StrCat(open.bracket == '['
                                             ? "Large list literal ("
                                             : "Large dict or set literal (",
                                         elements, " items)"));
      }
      continue;
    }
    if (c == ',' && !stack.empty()) stack.back().commas++;
    if (!isspace(static_cast<unsigned char>(c))) mark(c);
  }
}

bool IsStringLiteral(absl::string_view s) {
  return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') &&
         s.back() == s.front();
}

bool IsNumberLiteral(absl::string_view s) {
  static const std::regex number(R"(-?\d+(\.\d+)?([eE][-+]?\d+)?)");
  return std::regex_match(s.begin(), s.end(), number);
}

// Strips a trailing comment, ignoring # characters in strings.
absl::string_view StripComment(absl::string_view line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quote) {
      if (c == '\\') {
        i++;
      } else if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Quote(const std::string& s, char quote) {
  std::string out(1, quote);
  for (char c : s) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == quote) out += '\\';
        out += c;
    }
  }
  out += quote;
  return out;
}

std::string Literal(const google::protobuf::Value& value, char quote) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return "None";
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "True" : "False";
    case google::protobuf::Value::kNumberValue: {
      double number = value.number_value();
      if (std::isfinite(number) && number == std::floor(number) &&
          std::fabs(number) < 1e15) {
        return absl::StrCat(static_cast<int64_t>(number));
      }
      return absl::StrFormat("%.15g", number);
    }
    case google::protobuf::Value::kStringValue:
      return Quote(value.string_value(), quote);
    case google::protobuf::Value::kListValue: {
      std::vector<std::string> items;
      for (const auto& item : value.list_value().values()) {
        items.push_back(Literal(item, quote));
      }
      return absl::StrCat("[", absl::StrJoin(items, ", "), "]");
    }
    case google::protobuf::Value::kStructValue: {
      std::set<std::string> keys;
      for (const auto& field : value.struct_value().fields()) {
        keys.insert(field.first);
      }
      std::vector<std::string> items;
      for (const std::string& key : keys) {
        items.push_back(absl::StrCat(
            Quote(key, quote), ": ",
            Literal(value.struct_value().fields().at(key), quote)));
      }
      return absl::StrCat("{", absl::StrJoin(items, ", "), "}");
    }
  }
  return "None";
}

// Whether some line of the code is exactly "return <literal>".
bool ReturnsLiteral(const std::vector<absl::string_view>& returned,
                    const std::string& literal) {
  for (absl::string_view value : returned) {
    if (value == literal) return true;
  }
  return false;
}

}  // namespace

namespace gateway {

std::string PythonLiteral(const google::protobuf::Value& value) {
  return Literal(value, '"');
}

std::vector<std::string> HeuristicHardcodingPolicy::Inspect(
    const std::string& code, const std::vector<proto::TestCase>& tests) const {
  std::vector<std::string> findings;
  FindLargeLiterals(code, kMaxLiteralElements, &findings);

  static const std::regex string_comparison(R"(if\s+.*==\s*["'].*["'])");
  int comparisons = 0;
  int literal_returns = 0;
  std::vector<absl::string_view> returned;
  for (absl::string_view line : absl::StrSplit(code, '\n')) {
    if (std::regex_search(line.begin(), line.end(), string_comparison)) {
      comparisons++;
    }
    absl::string_view statement =
        absl::StripAsciiWhitespace(StripComment(line));
    if (!absl::ConsumePrefix(&statement, "return ")) continue;
    statement = absl::StripAsciiWhitespace(statement);
    returned.push_back(statement);
    if (IsStringLiteral(statement) || IsNumberLiteral(statement)) {
      literal_returns++;
    }
  }
  if (comparisons > kMaxStringComparisons) {
    findings.push_back(absl::StrCat("Multiple string equality checks (",
                                    comparisons, ")"));
  }
  if (literal_returns > kMaxLiteralReturns) {
    findings.push_back(absl::StrCat("Multiple literal return statements (",
                                    literal_returns, ")"));
  }

  static const std::regex digits(R"(\d+)");
  for (size_t i = 0; i < tests.size() && i < kInspectedTestInputs; i++) {
    google::protobuf::Value inputs;
    *inputs.mutable_struct_value() = tests[i].inputs();
    std::string rendered = PythonLiteral(inputs);
    for (std::sregex_iterator it(rendered.begin(), rendered.end(), digits), end;
         it != end; ++it) {
      std::string value = it->str();
      if (absl::StrContains(code, absl::StrCat("\"", value, "\"")) ||
          absl::StrContains(code, absl::StrCat("'", value, "'"))) {
        findings.push_back(absl::StrCat("Test value '", value,
                                        "' found as string literal in code"));
        break;
      }
    }
  }

  int verbatim = 0;
  for (const proto::TestCase& test : tests) {
    const google::protobuf::Value& expected = test.expected_output();
    if (expected.kind_case() == google::protobuf::Value::kBoolValue ||
        expected.kind_case() == google::protobuf::Value::kNullValue) {
      continue;
    }
    std::string double_quoted = Literal(expected, '"');
    // Short answers such as 0 or 1 are legitimate base cases.
    if (double_quoted.size() < 2) continue;
    if (ReturnsLiteral(returned, double_quoted) ||
        ReturnsLiteral(returned, Literal(expected, '\''))) {
      verbatim++;
    }
  }
  if (verbatim > kMaxVerbatimOutputs) {
    findings.push_back(absl::StrCat("Expected outputs of ", verbatim,
                                    " tests returned verbatim"));
  }
  return findings;
}

}  // namespace gateway

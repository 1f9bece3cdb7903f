#include "manager/harness.hpp"

#include <stdexcept>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "util/random_id.hpp"

namespace manager {

namespace {

// Python string literal with the given contents.
std::string PythonString(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          absl::StrAppendFormat(&out, "\\x%02x", c);
        } else {
          out += c;
        }
    }
  }
  out += "\"";
  return out;
}

const char* const kDriver = R"(
import json as _json
import os as _os
import sys as _sys


def _run(marker, tests, out_fd):
    solution = {"__name__": "solution"}
    exec(compile(_SOURCE, "solution.py", "exec"), solution)
    for index, inputs in enumerate(tests):
        try:
            line = _json.dumps(
                {"index": index, "success": True,
                 "result": solution["main"](**inputs)},
                allow_nan=False)
        except BaseException as exc:
            line = _json.dumps({
                "index": index,
                "success": False,
                "error": "%s: %s" % (type(exc).__name__, exc),
            })
        try:
            _sys.stdout.flush()
        except (OSError, ValueError):
            pass
        data = ("%s %s\n" % (marker, line)).encode()
        while data:
            data = data[_os.write(out_fd, data):]


_run(_sys.stdin.readline().strip(), _json.loads(_sys.stdin.read()),
     _os.dup(1))
)";

}  // namespace

Harness BuildHarness(const std::string& code,
                     const std::vector<proto::TestCase>& tests) {
  Harness harness;
  harness.program = absl::StrCat("_SOURCE = ", PythonString(code), "\n",
                                 kDriver);
  harness.marker = absl::StrCat("@@codeforge-", util::RandomId(), "@@");

  google::protobuf::ListValue inputs;
  for (const proto::TestCase& test : tests) {
    *inputs.add_values()->mutable_struct_value() = test.inputs();
  }
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(inputs, &json);
  if (!status.ok()) {
    throw std::invalid_argument("Test inputs are not serializable: " +
                                status.ToString());
  }
  harness.stdin_contents = absl::StrCat(harness.marker, "\n", json);
  return harness;
}

std::string StripReports(const std::string& output, const std::string& marker) {
  std::vector<absl::string_view> lines = absl::StrSplit(output, '\n');
  std::string stripped;
  for (size_t i = 0; i < lines.size(); i++) {
    size_t pos = lines[i].find(marker);
    if (pos != absl::string_view::npos) {
      // Keeps what the program printed before the line, without a newline.
      absl::StrAppend(&stripped, lines[i].substr(0, pos));
      continue;
    }
    absl::StrAppend(&stripped, lines[i]);
    if (i + 1 < lines.size()) stripped += '\n';
  }
  return stripped;
}

}  // namespace manager

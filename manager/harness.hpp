#ifndef MANAGER_HARNESS_HPP
#define MANAGER_HARNESS_HPP

#include <string>
#include <vector>

#include "proto/test_case.pb.h"

namespace manager {

struct Harness {
  // Python program that runs the candidate on every test case.
  std::string program;
  // The marker line followed by a JSON array with the inputs of each test,
  // to be fed as standard input.
  std::string stdin_contents;
  // Random prefix of the lines the harness prints, one per test case:
  //   <marker> {"index": 0, "success": true, "result": ...}
  //   <marker> {"index": 1, "success": false, "error": "..."}
  // It is read from standard input before the candidate is loaded, and the
  // lines are written on a copy of the stdout descriptor.
  std::string marker;
};

// Wraps the candidate code in a driver that loads it as a module named
// "solution" (so that its own __main__ block does not run), then calls
// main(**inputs) for each test and reports the result or the exception.
// Throws std::invalid_argument if the inputs cannot be serialized.
Harness BuildHarness(const std::string& code,
                     const std::vector<proto::TestCase>& tests);

// Output of the program without the harness lines.
std::string StripReports(const std::string& output, const std::string& marker);

}  // namespace manager

#endif

#ifndef MANAGER_VALIDATION_HPP
#define MANAGER_VALIDATION_HPP

#include <string>
#include <vector>

#include "proto/execution.pb.h"
#include "proto/test_case.pb.h"

namespace manager {

// Compares the per-test results printed by the harness, on the lines carrying
// marker, against the expected outputs. If the execution timed out, was
// cancelled, or failed without reporting any result, every test fails with
// the execution error. Otherwise each test fails on its own: missing,
// unparsable or repeated result line, exception raised by the candidate, or a
// result that is not structurally equal to the expected value.
// The function is pure: the same inputs always give the same result.
proto::ValidationResult Validate(const proto::ExecutionResult& execution,
                                 const std::vector<proto::TestCase>& tests,
                                 const std::string& marker);

}  // namespace manager

#endif

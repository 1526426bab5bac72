#ifndef CORE_PROBLEM_HPP
#define CORE_PROBLEM_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/comparator.hpp"
#include "core/test_case.hpp"

namespace core {

// A problem of the catalog, as stored in its JSON file:
// {
//   "title": "...",                                    (optional)
//   "functionSignature": "def twoSum(nums, target):",
//   "examples": [{"input": {...}, "output": ...}],
//   "testCases": [{"input": {...}, "expected": ...,
//                  "description": "...", "hidden": false}],
//   "comparison": {"orderIndependent": true, "tolerance": 1e-9},  (optional)
//   "timeoutMillis": 2000                              (optional)
// }
struct Problem {
  std::string title;
  std::string function_signature;
  std::vector<TestCase> examples;
  std::vector<TestCase> test_cases;

  bool order_independent = false;
  // Negative when the problem keeps the default tolerance.
  double tolerance = -1;
  // 0 when the problem keeps the default per-test timeout.
  int64_t timeout_millis = 0;

  // Name of the function solutions must define.
  std::string EntryPoint() const;

  // Comparison settings of this problem.
  ComparisonOptions Comparison() const;

  // Both throw kj::Exception if the problem is malformed.
  static Problem Parse(const std::string& json);
  static Problem Load(const std::string& path);
};

// Returns NAME from a signature like "def NAME(...)", or "solution" if the
// signature does not contain one.
std::string ExtractFunctionName(const std::string& signature);

}  // namespace core

#endif

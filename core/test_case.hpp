#ifndef CORE_TEST_CASE_HPP
#define CORE_TEST_CASE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/execution_backend.hpp"
#include "core/value.hpp"

namespace core {

struct TestCase {
  Value input;  // an object, parameter name -> argument
  Value expected;
  std::string label;
  // Hidden tests never show their data in reports.
  bool hidden = false;

  TestCase() = default;
  TestCase(Value input, Value expected, std::string label = "",
           bool hidden = false)
      : input(std::move(input)),
        expected(std::move(expected)),
        label(std::move(label)),
        hidden(hidden) {}
};

enum class TestStatus {
  PASSED,
  FAILED,  // the returned value is not equivalent to the expected one
  ERROR,   // the code raised an error (or the engine failed)
  TIMEOUT
};

const char* TestStatusName(TestStatus status);

struct TestResult {
  size_t index = 0;  // 0-based position in the suite
  TestStatus status = TestStatus::PASSED;
  int64_t elapsed_millis = 0;
  int64_t memory_kb = 0;
  Value input;
  Value expected;
  // Only meaningful when has_actual is true (PASSED or FAILED).
  Value actual;
  bool has_actual = false;
  std::string message;
  ErrorKind error_kind = ErrorKind::NONE;
  std::string label;
  bool hidden = false;
};

struct SuiteResult {
  bool success = false;
  size_t total = 0;
  size_t passed_count = 0;
  int64_t total_elapsed_millis = 0;
  // Largest memory_kb among the results.
  int64_t memory_kb = 0;
  std::vector<TestResult> results;
  // Set only when the suite could not start, results is then empty.
  std::string fatal_error;
  ErrorKind fatal_kind = ErrorKind::NONE;
  bool suite_timed_out = false;

  bool HasFatalError() const { return fatal_kind != ErrorKind::NONE; }
};

}  // namespace core

#endif

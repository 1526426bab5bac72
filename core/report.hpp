#ifndef CORE_REPORT_HPP
#define CORE_REPORT_HPP

#include <ostream>
#include <string>

#include "core/test_case.hpp"

namespace core {

// Human readable report of a suite, printed one test at a time.
class TextReport {
 public:
  TextReport(std::ostream& out, size_t total, bool colors)
      : out_(out), total_(total), colors_(colors) {}

  // Prints the line of a test and, if it did not pass, the details.
  void PrintResult(const TestResult& result);

  // Prints the fatal error, if any, and the closing summary.
  void PrintSummary(const SuiteResult& suite);

 private:
  const char* Color(const char* color) const { return colors_ ? color : ""; }

  std::ostream& out_;
  size_t total_;
  bool colors_;
};

// JSON encoding of a suite result. Data of hidden tests is omitted.
std::string SuiteResultToJson(const SuiteResult& suite);

}  // namespace core

#endif

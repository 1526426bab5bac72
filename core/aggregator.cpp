#include "core/aggregator.hpp"

#include <kj/debug.h>

#include <algorithm>

namespace core {

const char* TestStatusName(TestStatus status) {
  switch (status) {
    case TestStatus::PASSED:
      return "passed";
    case TestStatus::FAILED:
      return "failed";
    case TestStatus::ERROR:
      return "error";
    case TestStatus::TIMEOUT:
      return "timeout";
  }
  return "unknown";
}

SuiteResult Aggregate(std::vector<TestResult> results, size_t total,
                      bool suite_timed_out) {
  KJ_REQUIRE(results.size() <= total, results.size(), total,
             "More results than tests");
  SuiteResult suite;
  suite.total = total;
  suite.suite_timed_out = suite_timed_out;
  for (size_t i = 0; i < results.size(); i++) {
    KJ_ASSERT(results[i].index == i, results[i].index, i,
              "Results are not a prefix of the suite");
    if (results[i].status == TestStatus::PASSED) suite.passed_count++;
    suite.total_elapsed_millis += results[i].elapsed_millis;
    suite.memory_kb = std::max(suite.memory_kb, results[i].memory_kb);
  }
  suite.results = std::move(results);
  suite.success = suite.results.size() == total && suite.passed_count == total;
  return suite;
}

SuiteResult AbortedSuite(std::string error, ErrorKind kind, size_t total) {
  KJ_REQUIRE(kind != ErrorKind::NONE, "An aborted suite needs an error kind");
  SuiteResult suite;
  suite.total = total;
  suite.fatal_error = std::move(error);
  suite.fatal_kind = kind;
  return suite;
}

}  // namespace core

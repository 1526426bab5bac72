#ifndef CORE_AGGREGATOR_HPP
#define CORE_AGGREGATOR_HPP

#include <string>
#include <vector>

#include "core/test_case.hpp"

namespace core {

// Builds the verdict of a suite of total tests from the results that were
// produced, in order. The suite succeeds only if every test has a result and
// all of them passed.
SuiteResult Aggregate(std::vector<TestResult> results, size_t total,
                      bool suite_timed_out = false);

// Verdict of a suite that could not start.
SuiteResult AbortedSuite(std::string error, ErrorKind kind, size_t total);

}  // namespace core

#endif

#ifndef CORE_ORCHESTRATOR_HPP
#define CORE_ORCHESTRATOR_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/comparator.hpp"
#include "core/execution_backend.hpp"
#include "core/problem.hpp"
#include "core/test_case.hpp"

namespace core {

struct ValidationOptions {
  int64_t per_test_timeout_millis = 5000;
  // Budget for the whole suite, 0 means no budget.
  int64_t suite_timeout_millis = 60000;
  bool stop_on_first_failure = false;
  ComparisonOptions comparison;

  // Options taken from the command line flags.
  static ValidationOptions FromFlags();

  // Returns a copy of these options with the overrides of the problem.
  ValidationOptions ForProblem(const Problem& problem) const;
};

// Called with every result as soon as it is available.
using ResultObserver = std::function<void(const TestResult&)>;

// Runs a suite of tests against a piece of code, one test at a time, and
// builds its verdict. The code is first checked for a valid definition of the
// entry point: if that fails no test is run. Every call of Validate owns all
// of its state, so the same Orchestrator can be used from several threads as
// long as the backend allows it.
class Orchestrator {
 public:
  explicit Orchestrator(ExecutionBackend* backend) : backend_(backend) {}

  // Never throws because of the backend: its failures are reported as
  // internal errors in the result.
  SuiteResult Validate(const std::string& code,
                       const std::vector<TestCase>& tests,
                       const std::string& entry_point,
                       const ValidationOptions& options,
                       const ResultObserver& observer = nullptr) const;

  // Runs the public examples of the problem.
  SuiteResult ValidateExamplesOnly(
      const std::string& code, const Problem& problem,
      const ValidationOptions& options,
      const ResultObserver& observer = nullptr) const;

  // Runs the full test list of the problem.
  SuiteResult ValidateAll(const std::string& code, const Problem& problem,
                          const ValidationOptions& options,
                          const ResultObserver& observer = nullptr) const;

 private:
  ExecutionBackend* backend_;
};

}  // namespace core

#endif

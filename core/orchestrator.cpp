#include "core/orchestrator.hpp"

#include <kj/debug.h>
#include <kj/exception.h>

#include <algorithm>
#include <chrono>
#include <exception>

#include "core/aggregator.hpp"
#include "util/flags.hpp"

namespace core {

namespace {

const constexpr char* kSuiteTimeoutMessage = "Suite time limit exceeded";
const constexpr char* kMismatchMessage = "Wrong answer";

// Calls the backend, turning anything it throws into an internal error.
template <typename F>
ExecutionOutcome Guarded(const char* what, F call) {
  try {
    return call();
  } catch (kj::Exception& exc) {
    KJ_LOG(ERROR, what, exc);
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL,
        std::string(what) + " failed: " + exc.getDescription().cStr());
  } catch (std::exception& exc) {
    KJ_LOG(ERROR, what, exc.what());
    return ExecutionOutcome::Error(ErrorKind::INTERNAL,
                                   std::string(what) + " failed: " + exc.what());
  }
}

// State of a single call of Validate.
class ValidationRun {
 public:
  enum State {
    READY,
    VALIDATING_DEFINITION,
    ABORTED,
    RUNNING,
    AGGREGATING,
    DONE
  };

  ValidationRun(ExecutionBackend* backend, const std::string& code,
                const std::vector<TestCase>& tests,
                const std::string& entry_point,
                const ValidationOptions& options,
                const ResultObserver& observer)
      : backend_(backend),
        code_(code),
        tests_(tests),
        entry_point_(entry_point),
        options_(options),
        observer_(observer),
        start_(std::chrono::steady_clock::now()) {}

  SuiteResult Execute() {
    KJ_ASSERT(state_ == READY);
    state_ = VALIDATING_DEFINITION;
    ExecutionOutcome probe = ValidateDefinition();
    if (probe.kind != ExecutionOutcome::VALUE) {
      state_ = ABORTED;
      ErrorKind kind = probe.error_kind == ErrorKind::INTERNAL
                           ? ErrorKind::INTERNAL
                           : ErrorKind::DEFINITION;
      std::string message = probe.message;
      if (probe.kind == ExecutionOutcome::TIMEOUT) {
        message = "The code did not finish loading: " + probe.message;
      }
      KJ_LOG(INFO, "Suite aborted", message);
      SuiteResult result = AbortedSuite(message, kind, tests_.size());
      state_ = DONE;
      return result;
    }

    state_ = RUNNING;
    for (size_t i = 0; i < tests_.size(); i++) {
      if (options_.suite_timeout_millis > 0 && RemainingMillis() <= 0) {
        KJ_LOG(INFO, "Suite time budget exhausted", i);
        suite_timed_out_ = true;
        break;
      }
      results_.push_back(RunTest(i));
      const TestResult& result = results_.back();
      if (observer_) observer_(result);
      if (suite_timed_out_) break;
      if (options_.stop_on_first_failure &&
          result.status != TestStatus::PASSED) {
        break;
      }
    }

    state_ = AGGREGATING;
    SuiteResult result =
        Aggregate(std::move(results_), tests_.size(), suite_timed_out_);
    state_ = DONE;
    return result;
  }

 private:
  int64_t ElapsedMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start_)
        .count();
  }

  int64_t RemainingMillis() const {
    return options_.suite_timeout_millis - ElapsedMillis();
  }

  // Timeout of the next invocation. Sets *by_budget if it is bounded by the
  // suite budget rather than by the per-test timeout.
  int64_t NextTimeout(bool* by_budget) const {
    *by_budget = false;
    int64_t timeout = options_.per_test_timeout_millis;
    if (options_.suite_timeout_millis > 0) {
      int64_t remaining = std::max<int64_t>(RemainingMillis(), 1);
      if (remaining < timeout) {
        timeout = remaining;
        *by_budget = true;
      }
    }
    return timeout;
  }

  ExecutionOutcome ValidateDefinition() {
    bool by_budget = false;
    int64_t timeout = NextTimeout(&by_budget);
    return Guarded("Definition check", [&]() {
      return backend_->Probe(code_, entry_point_, timeout);
    });
  }

  TestResult RunTest(size_t index) {
    const TestCase& test = tests_[index];
    TestResult result;
    result.index = index;
    result.input = test.input;
    result.expected = test.expected;
    result.label = test.label;
    result.hidden = test.hidden;

    bool by_budget = false;
    int64_t timeout = NextTimeout(&by_budget);
    ExecutionOutcome outcome = Guarded("Execution", [&]() {
      Invocation invocation;
      invocation.code = code_;
      invocation.entry_point = entry_point_;
      KJ_REQUIRE(test.input.Get().isObject(), index,
                 "The input of a test must be an object");
      for (auto field : test.input.Get().getObject()) {
        invocation.arguments.emplace_back(field.getName().cStr(),
                                          Value::FromReader(field.getValue()));
      }
      return backend_->Run(invocation, timeout);
    });
    result.elapsed_millis = outcome.elapsed_millis;
    result.memory_kb = outcome.memory_kb;

    switch (outcome.kind) {
      case ExecutionOutcome::VALUE:
        result.actual = std::move(outcome.value);
        result.has_actual = true;
        if (Equivalent(result.actual, test.expected, options_.comparison)) {
          result.status = TestStatus::PASSED;
        } else {
          result.status = TestStatus::FAILED;
          result.message = kMismatchMessage;
        }
        break;
      case ExecutionOutcome::RUNTIME_ERROR:
        result.status = TestStatus::ERROR;
        result.error_kind = outcome.error_kind;
        result.message = outcome.message;
        break;
      case ExecutionOutcome::TIMEOUT:
        result.status = TestStatus::TIMEOUT;
        result.message = outcome.message;
        if (by_budget) {
          result.message = kSuiteTimeoutMessage;
          suite_timed_out_ = true;
        }
        break;
    }
    KJ_LOG(INFO, "Test finished", index, TestStatusName(result.status),
           result.elapsed_millis, result.message);
    return result;
  }

  ExecutionBackend* backend_;
  const std::string& code_;
  const std::vector<TestCase>& tests_;
  const std::string& entry_point_;
  const ValidationOptions& options_;
  const ResultObserver& observer_;
  std::chrono::steady_clock::time_point start_;

  State state_ = READY;
  std::vector<TestResult> results_;
  bool suite_timed_out_ = false;
};

std::vector<TestCase> Examples(const Problem& problem) {
  std::vector<TestCase> tests = problem.examples;
  for (size_t i = 0; i < tests.size(); i++) {
    tests[i].label = "Example " + std::to_string(i + 1);
  }
  return tests;
}

}  // namespace

ValidationOptions ValidationOptions::FromFlags() {
  ValidationOptions options;
  options.per_test_timeout_millis = Flags::timeout_millis;
  options.suite_timeout_millis = Flags::suite_timeout_millis;
  options.stop_on_first_failure = Flags::stop_on_first_failure;
  return options;
}

ValidationOptions ValidationOptions::ForProblem(const Problem& problem) const {
  ValidationOptions options = *this;
  options.comparison = problem.Comparison();
  if (problem.timeout_millis > 0) {
    options.per_test_timeout_millis = problem.timeout_millis;
  }
  return options;
}

SuiteResult Orchestrator::Validate(const std::string& code,
                                   const std::vector<TestCase>& tests,
                                   const std::string& entry_point,
                                   const ValidationOptions& options,
                                   const ResultObserver& observer) const {
  KJ_REQUIRE(backend_ != nullptr, "No execution backend");
  KJ_REQUIRE(options.per_test_timeout_millis > 0,
             options.per_test_timeout_millis, "Invalid per-test timeout");
  KJ_REQUIRE(options.suite_timeout_millis >= 0, options.suite_timeout_millis,
             "Invalid suite timeout");
  KJ_LOG(INFO, "Validating", entry_point, tests.size());
  ValidationRun run(backend_, code, tests, entry_point, options, observer);
  return run.Execute();
}

SuiteResult Orchestrator::ValidateExamplesOnly(
    const std::string& code, const Problem& problem,
    const ValidationOptions& options, const ResultObserver& observer) const {
  return Validate(code, Examples(problem), problem.EntryPoint(),
                  options.ForProblem(problem), observer);
}

SuiteResult Orchestrator::ValidateAll(const std::string& code,
                                      const Problem& problem,
                                      const ValidationOptions& options,
                                      const ResultObserver& observer) const {
  return Validate(code, problem.test_cases, problem.EntryPoint(),
                  options.ForProblem(problem), observer);
}

}  // namespace core

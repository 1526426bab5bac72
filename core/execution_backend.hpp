#ifndef CORE_EXECUTION_BACKEND_HPP
#define CORE_EXECUTION_BACKEND_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/value.hpp"

namespace core {

// One call of the submitted code. Arguments are owned by the invocation, the
// backend never hands references to them to the submitted code.
struct Invocation {
  std::string code;
  std::string entry_point;
  // Ordered parameter -> value mapping.
  std::vector<std::pair<std::string, Value>> arguments;
};

// Classification of a failed invocation.
enum class ErrorKind {
  NONE,
  // The code does not parse, fails while loading or does not define the entry
  // point.
  DEFINITION,
  NAME,
  TYPE,
  ZERO_DIVISION,
  // Any other failure raised by the submitted code.
  RUNTIME,
  // Failure of the engine itself, not attributable to the submitted code.
  INTERNAL
};

const char* ErrorKindName(ErrorKind kind);

struct ExecutionOutcome {
  enum Kind { VALUE, RUNTIME_ERROR, TIMEOUT };

  Kind kind = VALUE;
  ErrorKind error_kind = ErrorKind::NONE;
  Value value;
  std::string message;
  int64_t elapsed_millis = 0;
  // Peak resident memory of the worker, 0 if unknown.
  int64_t memory_kb = 0;

  static ExecutionOutcome Error(ErrorKind error_kind, std::string message,
                                int64_t elapsed_millis = 0) {
    ExecutionOutcome outcome;
    outcome.kind = RUNTIME_ERROR;
    outcome.error_kind = error_kind;
    outcome.message = std::move(message);
    outcome.elapsed_millis = elapsed_millis;
    return outcome;
  }
};

// Runs submitted code. Implementations must always return within the given
// timeout (plus a small scheduling overhead) and must not let an invocation
// observe or corrupt the state of another one.
class ExecutionBackend {
 public:
  // Runs the invocation's entry point with its arguments.
  virtual ExecutionOutcome Run(const Invocation& invocation,
                               int64_t timeout_millis) = 0;

  // Checks that the code loads and defines the entry point, without calling
  // it. Returns a VALUE outcome (with a null value) on success.
  virtual ExecutionOutcome Probe(const std::string& code,
                                 const std::string& entry_point,
                                 int64_t timeout_millis) = 0;

  virtual ~ExecutionBackend() = default;
  ExecutionBackend() = default;
  ExecutionBackend(const ExecutionBackend&) = delete;
  ExecutionBackend& operator=(const ExecutionBackend&) = delete;
};

}  // namespace core

#endif

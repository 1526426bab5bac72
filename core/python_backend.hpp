#ifndef CORE_PYTHON_BACKEND_HPP
#define CORE_PYTHON_BACKEND_HPP

#include <cstdint>
#include <string>

#include "core/execution_backend.hpp"
#include "sandbox/sandbox.hpp"

namespace core {

// Runs submitted Python code in a fresh interpreter process for every
// invocation. The process is started by the sandbox in its own temporary
// directory, with resource limits, and is killed when it exceeds its time
// limit. Arguments reach the process only as JSON, so the submitted code can
// never alias the caller's data.
class PythonBackend : public ExecutionBackend {
 public:
  struct Options {
    // Interpreter name or path, looked up in PATH.
    std::string python;
    std::string temp_directory;
    int64_t memory_limit_kb = 0;
    bool keep_sandboxes = false;
  };

  // Options taken from the command line flags.
  static Options DefaultOptions();

  explicit PythonBackend(Options options = DefaultOptions());

  ExecutionOutcome Run(const Invocation& invocation,
                       int64_t timeout_millis) override;
  ExecutionOutcome Probe(const std::string& code,
                         const std::string& entry_point,
                         int64_t timeout_millis) override;

  // Full path of the interpreter, empty if it was not found.
  const std::string& Interpreter() const { return interpreter_; }

 private:
  ExecutionOutcome Execute(const std::string& code,
                           const std::string& entry_point,
                           const std::string& arguments, bool probe,
                           int64_t timeout_millis);

  // Maps the way the harness terminated, and its report, to an outcome.
  static ExecutionOutcome Resolve(const sandbox::ExecutionInfo& info,
                                  int64_t timeout_millis,
                                  const std::string& report_path,
                                  const std::string& stderr_path);

  static const constexpr char* kRequestFile = "request.json";
  static const constexpr char* kReportFile = "report.json";
  static const constexpr char* kStderrFile = "stderr.txt";
  // Maximum size of the report that is read back from the harness.
  static const constexpr int64_t kMaxReportSize = 16 * 1024 * 1024;
  // Bytes of stderr shown when the interpreter dies without a report.
  static const constexpr size_t kStderrTail = 512;

  Options options_;
  std::string interpreter_;
  std::string harness_;
};

}  // namespace core

#endif

#include "core/python_backend.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/exception.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <system_error>

#include "capnp/harness.capnp.h"
#include "core/capability_gate.hpp"
#include "core/harness.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace core {

namespace {

// CPU time granted on top of the wall limit, so that a busy loop is normally
// stopped by the wall clock.
const constexpr int64_t kCpuMarginMillis = 1000;
const constexpr int64_t kMaxFileSizeKb = 64 * 1024;
const constexpr int32_t kMaxFiles = 64;
const constexpr int32_t kMaxProcs = 4096;

std::string EncodeArguments(const Invocation& invocation) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  auto fields =
      root.initObject(static_cast<unsigned>(invocation.arguments.size()));
  for (size_t i = 0; i < invocation.arguments.size(); i++) {
    fields[i].setName(invocation.arguments[i].first.c_str());
    fields[i].setValue(invocation.arguments[i].second.Get());
  }
  capnp::JsonCodec codec;
  return codec.encodeRaw(root.asReader()).cStr();
}

ErrorKind ToErrorKind(capnproto::HarnessReport::Kind kind) {
  using Kind = capnproto::HarnessReport::Kind;
  switch (kind) {
    case Kind::VALUE:
      return ErrorKind::NONE;
    case Kind::DEFINITION_ERROR:
      return ErrorKind::DEFINITION;
    case Kind::NAME_ERROR:
      return ErrorKind::NAME;
    case Kind::TYPE_ERROR:
      return ErrorKind::TYPE;
    case Kind::ZERO_DIVISION:
      return ErrorKind::ZERO_DIVISION;
    case Kind::RUNTIME_ERROR:
      return ErrorKind::RUNTIME;
    case Kind::INTERNAL_ERROR:
      return ErrorKind::INTERNAL;
  }
  return ErrorKind::INTERNAL;
}

}  // namespace

PythonBackend::Options PythonBackend::DefaultOptions() {
  Options options;
  options.python = Flags::python;
  options.temp_directory = Flags::temp_directory;
  options.memory_limit_kb = Flags::memory_limit_kb;
  options.keep_sandboxes = Flags::keep_sandboxes;
  return options;
}

PythonBackend::PythonBackend(Options options)
    : options_(std::move(options)),
      harness_(HarnessSource(BuildRestrictedEnvironment())) {
  interpreter_ = util::which(options_.python);
  if (interpreter_.empty()) {
    KJ_LOG(WARNING, "Python interpreter not found", options_.python);
  }
  util::File::MakeDirs(options_.temp_directory);
}

ExecutionOutcome PythonBackend::Run(const Invocation& invocation,
                                    int64_t timeout_millis) {
  return Execute(invocation.code, invocation.entry_point,
                 EncodeArguments(invocation), /*probe = */ false,
                 timeout_millis);
}

ExecutionOutcome PythonBackend::Probe(const std::string& code,
                                      const std::string& entry_point,
                                      int64_t timeout_millis) {
  return Execute(code, entry_point, "{}", /*probe = */ true, timeout_millis);
}

ExecutionOutcome PythonBackend::Execute(const std::string& code,
                                        const std::string& entry_point,
                                        const std::string& arguments,
                                        bool probe, int64_t timeout_millis) {
  KJ_REQUIRE(timeout_millis > 0, timeout_millis, "Invalid timeout");
  if (util::isBlank(code)) {
    return ExecutionOutcome::Error(ErrorKind::DEFINITION,
                                   "Code cannot be empty");
  }
  if (interpreter_.empty()) {
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL, "Python interpreter not found: " + options_.python);
  }

  auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start]() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count());
  };

  util::TempDir tmp(options_.temp_directory);
  if (options_.keep_sandboxes) {
    tmp.Keep();
    KJ_LOG(INFO, "Keeping sandbox", tmp.Path());
  }
  std::string request_path = util::File::JoinPath(tmp.Path(), kRequestFile);
  std::string report_path = util::File::JoinPath(tmp.Path(), kReportFile);
  std::string stderr_path = util::File::JoinPath(tmp.Path(), kStderrFile);

  capnp::JsonCodec codec;
  try {
    util::File::Write(util::File::JoinPath(tmp.Path(), kSolutionFile), code);
    util::File::Write(util::File::JoinPath(tmp.Path(), kHarnessFile),
                      harness_);
    capnp::MallocMessageBuilder message;
    auto request = message.initRoot<capnproto::HarnessRequest>();
    request.setEntryPoint(entry_point.c_str());
    request.setArguments(arguments.c_str());
    request.setProbe(probe);
    util::File::Write(request_path, codec.encode(request.asReader()).cStr());
  } catch (std::system_error& exc) {
    KJ_LOG(ERROR, "Cannot prepare the sandbox", tmp.Path(), exc.what());
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL,
        std::string("Cannot prepare the sandbox: ") + exc.what(),
        elapsed_millis());
  }

  sandbox::ExecutionOptions exec_options(tmp.Path(), interpreter_);
  // Isolated mode, without site-packages: only the standard library is
  // reachable from the harness.
  exec_options.args = {"-I", "-S", kHarnessFile};
  exec_options.wall_limit_millis = timeout_millis;
  exec_options.cpu_limit_millis = timeout_millis + kCpuMarginMillis;
  exec_options.memory_limit_kb = options_.memory_limit_kb;
  exec_options.max_file_size_kb = kMaxFileSizeKb;
  exec_options.max_files = kMaxFiles;
  // RLIMIT_NPROC counts every process of the user: this only stops runaway
  // forking, the harness drops the limit to zero before loading the code.
  exec_options.max_procs = kMaxProcs;
  exec_options.stdin_file = request_path;
  exec_options.stdout_file = report_path;
  exec_options.stderr_file = stderr_path;

  sandbox::ExecutionInfo info;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    KJ_LOG(ERROR, "Cannot run the interpreter", interpreter_, error_msg);
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL, "Cannot run the interpreter: " + error_msg,
        elapsed_millis());
  }
  KJ_LOG(INFO, "Interpreter finished", info.wall_time_millis,
         info.cpu_time_millis, info.memory_usage_kb, info.message);
  ExecutionOutcome outcome = Resolve(info, timeout_millis, report_path,
                                     stderr_path);
  outcome.memory_kb = info.memory_usage_kb;
  if (outcome.kind != ExecutionOutcome::TIMEOUT) {
    outcome.elapsed_millis = elapsed_millis();
  }
  return outcome;
}

ExecutionOutcome PythonBackend::Resolve(const sandbox::ExecutionInfo& info,
                                        int64_t timeout_millis,
                                        const std::string& report_path,
                                        const std::string& stderr_path) {
  if (info.wall_limit_exceeded || info.signal == SIGXCPU) {
    ExecutionOutcome outcome;
    outcome.kind = ExecutionOutcome::TIMEOUT;
    outcome.message =
        "Time limit exceeded (" + util::formatMillis(timeout_millis) + ")";
    outcome.elapsed_millis = timeout_millis;
    return outcome;
  }
  // The report only counts if the harness exited cleanly.
  if (info.signal != 0) {
    return ExecutionOutcome::Error(
        ErrorKind::RUNTIME, "Process terminated by signal: " + info.message);
  }
  if (info.status_code != 0) {
    std::string errors;
    try {
      errors = util::File::Read(stderr_path, kMaxReportSize);
    } catch (std::system_error& exc) {
      KJ_LOG(WARNING, "Cannot read stderr", exc.what());
    }
    std::string message =
        "Interpreter exited with code " + std::to_string(info.status_code);
    if (!util::isBlank(errors)) {
      message += ": " + util::tail(errors, kStderrTail);
    }
    return ExecutionOutcome::Error(ErrorKind::RUNTIME, message);
  }

  std::string report_text;
  try {
    report_text = util::File::Read(report_path, kMaxReportSize);
  } catch (std::system_error& exc) {
    KJ_LOG(ERROR, "Cannot read the report", exc.what());
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL,
        std::string("Cannot read the report: ") + exc.what());
  }
  if (util::isBlank(report_text)) {
    KJ_LOG(ERROR, "The harness produced no report");
    return ExecutionOutcome::Error(ErrorKind::INTERNAL,
                                   "The harness produced no report");
  }

  try {
    capnp::MallocMessageBuilder message;
    auto report = message.initRoot<capnproto::HarnessReport>();
    capnp::JsonCodec codec;
    codec.decode(kj::ArrayPtr<const char>(report_text.data(),
                                          report_text.size()),
                 report);
    if (report.getKind() != capnproto::HarnessReport::Kind::VALUE) {
      return ExecutionOutcome::Error(ToErrorKind(report.getKind()),
                                     report.getMessage().cStr());
    }
    ExecutionOutcome outcome;
    outcome.kind = ExecutionOutcome::VALUE;
    outcome.value = Value::Parse(report.getValue().cStr());
    return outcome;
  } catch (kj::Exception& exc) {
    KJ_LOG(ERROR, "Malformed report", report_text, exc.getDescription());
    return ExecutionOutcome::Error(
        ErrorKind::INTERNAL,
        std::string("Malformed report: ") + exc.getDescription().cStr());
  }
}

}  // namespace core

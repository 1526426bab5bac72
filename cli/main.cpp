#include "cli/main.hpp"

#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <system_error>

#include "core/aggregator.hpp"
#include "core/orchestrator.hpp"
#include "core/problem.hpp"
#include "core/python_backend.hpp"
#include "core/report.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace cli {

namespace {

std::string ReadSolution(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(path);
}

[[noreturn]] void Exit(int code) {
  std::cout.flush();
  std::exit(code);
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);

  core::Problem problem;
  try {
    problem = core::Problem::Load(problem_path_);
  } catch (kj::Exception& exc) {
    return kj::str("Invalid problem ", problem_path_.c_str(), ": ",
                   exc.getDescription());
  }
  std::string code;
  try {
    code = ReadSolution(solution_path_);
  } catch (std::system_error& exc) {
    return kj::str("Cannot read the solution: ", exc.what());
  }
  if (Flags::timeout_millis <= 0) return "The timeout must be positive";
  if (Flags::suite_timeout_millis < 0) {
    return "The suite timeout cannot be negative";
  }

  const std::vector<core::TestCase>& tests =
      mode_ == EXAMPLES_ONLY ? problem.examples : problem.test_cases;
  core::TextReport report(std::cout, tests.size(), isatty(STDOUT_FILENO));
  core::ResultObserver observer;
  if (!Flags::json) {
    observer = [&report](const core::TestResult& result) {
      report.PrintResult(result);
    };
  }

  core::SuiteResult suite;
  try {
    core::PythonBackend backend;
    core::Orchestrator orchestrator(&backend);
    core::ValidationOptions options = core::ValidationOptions::FromFlags();
    KJ_LOG(INFO, "Running", problem.EntryPoint(), tests.size(),
           backend.Interpreter());
    suite = mode_ == EXAMPLES_ONLY
                ? orchestrator.ValidateExamplesOnly(code, problem, options,
                                                    observer)
                : orchestrator.ValidateAll(code, problem, options, observer);
  } catch (kj::Exception& exc) {
    KJ_LOG(ERROR, "Validation failed", exc);
    suite = core::AbortedSuite(exc.getDescription().cStr(),
                               core::ErrorKind::INTERNAL, tests.size());
  } catch (std::exception& exc) {
    KJ_LOG(ERROR, "Validation failed", exc.what());
    suite = core::AbortedSuite(exc.what(), core::ErrorKind::INTERNAL,
                               tests.size());
  }

  if (Flags::json) {
    std::cout << core::SuiteResultToJson(suite) << std::endl;
  } else {
    report.PrintSummary(suite);
  }
  if (suite.HasFatalError()) Exit(kExitFatal);
  if (!suite.success) Exit(kExitFailure);
  return true;
}

kj::MainFunc Main::getMain() {
  const char* description =
      mode_ == EXAMPLES_ONLY
          ? "Runs a solution against the public examples of a problem"
          : "Runs a solution against all the test cases of a problem";
  return kj::MainBuilder(context, "Codecheck (" + util::version + ")",
                         description)
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({"python"}, util::setString(Flags::python),
                        "<PYTHON>", "Python interpreter to run solutions with")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the sandboxes after evaluation")
      .addOptionWithArg({'t', "timeout"}, util::setInt64(Flags::timeout_millis),
                        "<MILLIS>", "Time limit of each test")
      .addOptionWithArg({"suite-timeout"},
                        util::setInt64(Flags::suite_timeout_millis),
                        "<MILLIS>",
                        "Time limit of the whole suite, 0 means unlimited")
      .addOptionWithArg({'m', "memory-limit"},
                        util::setInt64(Flags::memory_limit_kb), "<KB>",
                        "Address space limit of the interpreter, 0 means "
                        "unlimited")
      .addOption({'x', "stop-on-first-failure"},
                 util::setBool(Flags::stop_on_first_failure),
                 "Stop at the first test that does not pass")
      .addOption({'j', "json"}, util::setBool(Flags::json),
                 "Print the result as JSON")
      .expectArg("<PROBLEM>", util::setString(problem_path_))
      .expectArg("<SOLUTION>", util::setString(solution_path_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace cli

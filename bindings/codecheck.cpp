#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <kj/exception.h>

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "core/capability_gate.hpp"
#include "core/orchestrator.hpp"
#include "core/problem.hpp"
#include "core/python_backend.hpp"
#include "core/report.hpp"

namespace py = pybind11;

namespace {

core::Value ToValue(const py::handle& object) {
  py::object dumps = py::module::import("json").attr("dumps");
  return core::Value::Parse(dumps(object).cast<std::string>());
}

py::object ToPython(const core::SuiteResult& result) {
  py::object loads = py::module::import("json").attr("loads");
  return loads(core::SuiteResultToJson(result));
}

core::ValidationOptions MakeOptions(int64_t timeout_millis,
                                    int64_t suite_timeout_millis,
                                    bool stop_on_first_failure) {
  core::ValidationOptions options;
  options.per_test_timeout_millis = timeout_millis;
  options.suite_timeout_millis = suite_timeout_millis;
  options.stop_on_first_failure = stop_on_first_failure;
  return options;
}

// Each call uses its own backend, so that concurrent calls share nothing.
core::SuiteResult Run(
    const std::function<core::SuiteResult(const core::Orchestrator&)>& call,
    const std::string& python) {
  py::gil_scoped_release release;
  core::PythonBackend::Options backend_options =
      core::PythonBackend::DefaultOptions();
  if (!python.empty()) backend_options.python = python;
  core::PythonBackend backend(backend_options);
  core::Orchestrator orchestrator(&backend);
  return call(orchestrator);
}

}  // namespace

PYBIND11_MODULE(codecheck_py, m) {
  m.doc() = "Validation of solutions to programming problems";

  py::register_exception_translator([](std::exception_ptr exc) {
    try {
      if (exc) std::rethrow_exception(exc);
    } catch (const kj::Exception& e) {
      PyErr_SetString(PyExc_ValueError, e.getDescription().cStr());
    }
  });

  m.def("extract_function_name", &core::ExtractFunctionName);

  m.def("allowed_builtins",
        []() { return core::BuildRestrictedEnvironment().builtins; });
  m.def("allowed_modules",
        []() { return core::BuildRestrictedEnvironment().modules; });

  m.def(
      "validate",
      [](const std::string& code, const py::list& tests,
         const std::string& entry_point, int64_t timeout_millis,
         int64_t suite_timeout_millis, bool stop_on_first_failure,
         bool order_independent, double tolerance, const std::string& python) {
        std::vector<core::TestCase> cases;
        for (const py::handle& test : tests) {
          py::dict entry = py::reinterpret_borrow<py::dict>(test);
          core::TestCase test_case(ToValue(entry["input"]),
                                   ToValue(entry["expected"]));
          if (entry.contains("label")) {
            test_case.label = entry["label"].cast<std::string>();
          }
          if (entry.contains("hidden")) {
            test_case.hidden = entry["hidden"].cast<bool>();
          }
          cases.push_back(std::move(test_case));
        }
        core::ValidationOptions options = MakeOptions(
            timeout_millis, suite_timeout_millis, stop_on_first_failure);
        options.comparison.order_independent = order_independent;
        if (tolerance >= 0) {
          options.comparison.absolute_tolerance = tolerance;
          options.comparison.relative_tolerance = tolerance;
        }
        return ToPython(Run(
            [&](const core::Orchestrator& orchestrator) {
              return orchestrator.Validate(code, cases, entry_point, options);
            },
            python));
      },
      py::arg("code"), py::arg("tests"), py::arg("entry_point"),
      py::arg("timeout_millis") = 5000, py::arg("suite_timeout_millis") = 60000,
      py::arg("stop_on_first_failure") = false,
      py::arg("order_independent") = false, py::arg("tolerance") = -1.0,
      py::arg("python") = "");

  m.def(
      "validate_problem",
      [](const std::string& code, const std::string& problem_path,
         bool examples_only, int64_t timeout_millis,
         int64_t suite_timeout_millis, bool stop_on_first_failure,
         const std::string& python) {
        core::Problem problem = core::Problem::Load(problem_path);
        core::ValidationOptions options = MakeOptions(
            timeout_millis, suite_timeout_millis, stop_on_first_failure);
        return ToPython(Run(
            [&](const core::Orchestrator& orchestrator) {
              return examples_only
                         ? orchestrator.ValidateExamplesOnly(code, problem,
                                                             options)
                         : orchestrator.ValidateAll(code, problem, options);
            },
            python));
      },
      py::arg("code"), py::arg("problem_path"),
      py::arg("examples_only") = false, py::arg("timeout_millis") = 5000,
      py::arg("suite_timeout_millis") = 60000,
      py::arg("stop_on_first_failure") = false, py::arg("python") = "");
}

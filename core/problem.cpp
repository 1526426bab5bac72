#include "core/problem.hpp"

#include <kj/debug.h>

#include <regex>
#include <system_error>

#include "util/file.hpp"

namespace core {

namespace {

using Reader = capnp::JsonValue::Reader;

const constexpr char* kDefaultEntryPoint = "solution";

bool FindField(Reader object, const char* name, Reader* out) {
  for (auto field : object.getObject()) {
    if (field.getName() == name) {
      *out = field.getValue();
      return true;
    }
  }
  return false;
}

Reader RequireField(Reader object, const char* name, const char* where) {
  Reader out;
  KJ_REQUIRE(FindField(object, name, &out), where, name, "Missing field");
  return out;
}

std::string OptionalString(Reader object, const char* name) {
  Reader out;
  if (!FindField(object, name, &out) || out.isNull()) return "";
  KJ_REQUIRE(out.isString(), name, "Expected a string");
  return out.getString().cStr();
}

std::vector<TestCase> ParseTests(Reader list, const char* where,
                                 const char* expected_field, bool examples) {
  KJ_REQUIRE(list.isArray(), where, "Expected an array");
  std::vector<TestCase> tests;
  for (Reader entry : list.getArray()) {
    KJ_REQUIRE(entry.isObject(), where, "Expected an object");
    Reader input = RequireField(entry, "input", where);
    KJ_REQUIRE(input.isObject(), where, "The input must be an object");
    TestCase test(Value::FromReader(input),
                  Value::FromReader(RequireField(entry, expected_field, where)));
    if (examples) {
      test.label = "Example " + std::to_string(tests.size() + 1);
    } else {
      test.label = OptionalString(entry, "description");
      Reader hidden;
      if (FindField(entry, "hidden", &hidden) && !hidden.isNull()) {
        KJ_REQUIRE(hidden.isBoolean(), where, "hidden must be a boolean");
        test.hidden = hidden.getBoolean();
      }
    }
    tests.push_back(std::move(test));
  }
  return tests;
}

}  // namespace

std::string Problem::EntryPoint() const {
  return ExtractFunctionName(function_signature);
}

ComparisonOptions Problem::Comparison() const {
  ComparisonOptions options;
  options.order_independent = order_independent;
  if (tolerance >= 0) {
    options.absolute_tolerance = tolerance;
    options.relative_tolerance = tolerance;
  }
  return options;
}

Problem Problem::Parse(const std::string& json) {
  Value document = Value::Parse(json);
  Reader root = document.Get();
  KJ_REQUIRE(root.isObject(), "The problem must be a JSON object");

  Problem problem;
  problem.title = OptionalString(root, "title");
  problem.function_signature = OptionalString(root, "functionSignature");

  Reader list;
  if (FindField(root, "examples", &list)) {
    problem.examples = ParseTests(list, "examples", "output", true);
  }
  if (FindField(root, "testCases", &list)) {
    problem.test_cases = ParseTests(list, "testCases", "expected", false);
  }

  Reader comparison;
  if (FindField(root, "comparison", &comparison) && !comparison.isNull()) {
    KJ_REQUIRE(comparison.isObject(), "comparison must be an object");
    Reader field;
    if (FindField(comparison, "orderIndependent", &field)) {
      KJ_REQUIRE(field.isBoolean(), "orderIndependent must be a boolean");
      problem.order_independent = field.getBoolean();
    }
    if (FindField(comparison, "tolerance", &field)) {
      KJ_REQUIRE(field.isNumber() && field.getNumber() >= 0,
                 "tolerance must be a non-negative number");
      problem.tolerance = field.getNumber();
    }
  }

  Reader timeout;
  if (FindField(root, "timeoutMillis", &timeout) && !timeout.isNull()) {
    KJ_REQUIRE(timeout.isNumber() && timeout.getNumber() >= 1,
               "timeoutMillis must be a positive number");
    problem.timeout_millis = static_cast<int64_t>(timeout.getNumber());
  }
  return problem;
}

Problem Problem::Load(const std::string& path) {
  std::string content;
  try {
    content = util::File::Read(path);
  } catch (std::system_error& exc) {
    KJ_FAIL_REQUIRE("Cannot read the problem", path, exc.what());
  }
  KJ_CONTEXT(path);
  return Parse(content);
}

std::string ExtractFunctionName(const std::string& signature) {
  static const std::regex kDefinition(R"(def\s+(\w+)\s*\()");
  std::smatch match;
  if (std::regex_search(signature, match, kDefinition)) {
    return match[1].str();
  }
  return kDefaultEntryPoint;
}

}  // namespace core

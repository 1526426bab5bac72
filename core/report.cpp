#include "core/report.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "util/misc.hpp"

namespace core {

namespace {

const constexpr char* kGreen = "\033[0;32m";
const constexpr char* kRed = "\033[0;31m";
const constexpr char* kYellow = "\033[0;33m";
const constexpr char* kBold = "\033[1m";
const constexpr char* kReset = "\033[m";

const char* Glyph(TestStatus status) {
  switch (status) {
    case TestStatus::PASSED:
      return "✓";
    case TestStatus::FAILED:
      return "✗";
    case TestStatus::ERROR:
      return "!";
    case TestStatus::TIMEOUT:
      return "⏱";
  }
  return "?";
}

const char* StatusColor(TestStatus status) {
  switch (status) {
    case TestStatus::PASSED:
      return kGreen;
    case TestStatus::TIMEOUT:
      return kYellow;
    default:
      return kRed;
  }
}

// Fills a JSON object whose number of fields is known in advance.
class ObjectWriter {
 public:
  ObjectWriter(capnp::JsonValue::Builder value, unsigned size)
      : fields_(value.initObject(size)) {}

  capnp::JsonValue::Builder Add(const char* name) {
    KJ_ASSERT(next_ < fields_.size(), name, "Too many fields");
    auto field = fields_[next_++];
    field.setName(name);
    return field.initValue();
  }

  void Copy(const char* name, capnp::JsonValue::Reader value) {
    KJ_ASSERT(next_ < fields_.size(), name, "Too many fields");
    auto field = fields_[next_++];
    field.setName(name);
    field.setValue(value);
  }

  KJ_DISALLOW_COPY(ObjectWriter);

 private:
  capnp::List<capnp::JsonValue::Field>::Builder fields_;
  unsigned next_ = 0;
};

void WriteResult(const TestResult& result, capnp::JsonValue::Builder out) {
  unsigned size = 5;
  if (!result.label.empty()) size++;
  if (!result.message.empty()) size++;
  if (result.error_kind != ErrorKind::NONE) size++;
  if (!result.hidden) size += result.has_actual ? 3 : 2;

  ObjectWriter object(out, size);
  object.Add("index").setNumber(static_cast<double>(result.index));
  object.Add("status").setString(TestStatusName(result.status));
  object.Add("elapsedMillis")
      .setNumber(static_cast<double>(result.elapsed_millis));
  object.Add("memoryKb").setNumber(static_cast<double>(result.memory_kb));
  object.Add("hidden").setBoolean(result.hidden);
  if (!result.label.empty()) {
    object.Add("label").setString(result.label.c_str());
  }
  if (!result.message.empty()) {
    object.Add("message").setString(result.message.c_str());
  }
  if (result.error_kind != ErrorKind::NONE) {
    object.Add("errorKind").setString(ErrorKindName(result.error_kind));
  }
  if (!result.hidden) {
    object.Copy("input", result.input.Get());
    object.Copy("expected", result.expected.Get());
    if (result.has_actual) {
      object.Copy("actual", result.actual.Get());
    }
  }
}

}  // namespace

void TextReport::PrintResult(const TestResult& result) {
  out_ << Color(StatusColor(result.status)) << Glyph(result.status)
       << Color(kReset) << " [" << result.index + 1 << "/" << total_ << "]";
  if (!result.label.empty()) out_ << " " << result.label;
  out_ << " " << Color(StatusColor(result.status))
       << TestStatusName(result.status) << Color(kReset) << " ("
       << util::formatMillis(result.elapsed_millis);
  if (result.memory_kb > 0) out_ << ", " << util::formatKb(result.memory_kb);
  out_ << ")" << std::endl;
  if (result.status == TestStatus::PASSED) return;

  if (!result.hidden) {
    out_ << "    Input:    " << result.input.ToJson() << std::endl;
    out_ << "    Expected: " << result.expected.ToJson() << std::endl;
    if (result.has_actual) {
      out_ << "    Actual:   " << result.actual.ToJson() << std::endl;
    }
  }
  if (result.status != TestStatus::FAILED || result.hidden) {
    out_ << "    " << result.message << std::endl;
  }
}

void TextReport::PrintSummary(const SuiteResult& suite) {
  if (suite.HasFatalError()) {
    out_ << Color(kRed) << "Error" << Color(kReset);
    if (suite.fatal_kind == ErrorKind::INTERNAL) out_ << " (internal)";
    out_ << ": " << suite.fatal_error << std::endl;
    return;
  }
  if (suite.suite_timed_out) {
    out_ << Color(kYellow) << "Suite time limit exceeded, "
         << suite.total - suite.results.size() << " test(s) not run"
         << Color(kReset) << std::endl;
  }
  out_ << Color(kBold) << (suite.success ? Color(kGreen) : Color(kRed))
       << suite.passed_count << "/" << suite.total << " tests passed"
       << Color(kReset) << " in "
       << util::formatMillis(suite.total_elapsed_millis);
  if (suite.memory_kb > 0) {
    out_ << ", peak memory " << util::formatKb(suite.memory_kb);
  }
  out_ << std::endl;
}

std::string SuiteResultToJson(const SuiteResult& suite) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  {
    ObjectWriter object(root, suite.HasFatalError() ? 9 : 7);
    object.Add("success").setBoolean(suite.success);
    object.Add("total").setNumber(static_cast<double>(suite.total));
    object.Add("passedCount")
        .setNumber(static_cast<double>(suite.passed_count));
    object.Add("totalElapsedMillis")
        .setNumber(static_cast<double>(suite.total_elapsed_millis));
    object.Add("memoryKb").setNumber(static_cast<double>(suite.memory_kb));
    object.Add("suiteTimedOut").setBoolean(suite.suite_timed_out);
    if (suite.HasFatalError()) {
      object.Add("fatalError").setString(suite.fatal_error.c_str());
      object.Add("fatalKind").setString(ErrorKindName(suite.fatal_kind));
    }
    auto results = object.Add("results").initArray(
        static_cast<unsigned>(suite.results.size()));
    for (size_t i = 0; i < suite.results.size(); i++) {
      WriteResult(suite.results[i], results[i]);
    }
  }
  capnp::JsonCodec codec;
  codec.setPrettyPrint(true);
  return codec.encodeRaw(root.asReader()).cStr();
}

}  // namespace core

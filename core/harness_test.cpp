#include "core/harness.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

// NOLINTNEXTLINE
TEST(Harness, ListsCapabilities) {
  core::Capabilities caps;
  caps.builtins = {"len", "range"};
  caps.modules = {"math"};
  caps.hidden_attributes = {"operator.attrgetter"};
  caps.denied_attributes = {"gi_frame"};
  caps.public_dunders = {"__init__"};
  std::string source = core::HarnessSource(caps);
  EXPECT_THAT(source, HasSubstr(R"(ALLOWED_BUILTINS = ["len", "range"])"));
  EXPECT_THAT(source, HasSubstr(R"(ALLOWED_MODULES = frozenset(["math"]))"));
  EXPECT_THAT(source, HasSubstr(R"(HIDDEN_ATTRIBUTES = frozenset()"
                                R"(["operator.attrgetter"]))"));
  EXPECT_THAT(source,
              HasSubstr(R"(DENIED_ATTRIBUTES = frozenset(["gi_frame"]))"));
  EXPECT_THAT(source,
              HasSubstr(R"(PUBLIC_DUNDERS = frozenset(["__init__"]))"));
  EXPECT_THAT(source, HasSubstr(R"(SOLUTION_FILE = "solution.py")"));
  EXPECT_THAT(source, Not(HasSubstr("@")));
}

// NOLINTNEXTLINE
TEST(Harness, EmptyCapabilities) {
  std::string source = core::HarnessSource(core::Capabilities());
  EXPECT_THAT(source, HasSubstr("ALLOWED_BUILTINS = []"));
  EXPECT_THAT(source, HasSubstr("ALLOWED_MODULES = frozenset([])"));
  EXPECT_THAT(source, HasSubstr("DENIED_ATTRIBUTES = frozenset([])"));
}

// NOLINTNEXTLINE
TEST(Harness, ReportIsWrittenOutsideTheWorker) {
  std::string source =
      core::HarnessSource(core::BuildRestrictedEnvironment());
  EXPECT_THAT(source, HasSubstr("os.fork()"));
  EXPECT_THAT(source, HasSubstr("os.dup2(devnull, 1)"));
  EXPECT_THAT(source, HasSubstr("RLIMIT_NPROC, (0, 0)"));
  EXPECT_THAT(source, Not(HasSubstr("sys.stdout.write")));
}

// NOLINTNEXTLINE
TEST(Harness, ReportsEveryKind) {
  std::string source =
      core::HarnessSource(core::BuildRestrictedEnvironment());
  for (const char* kind :
       {"\"value\"", "\"definitionError\"", "\"nameError\"", "\"typeError\"",
        "\"zeroDivision\"", "\"runtimeError\"", "\"internalError\""}) {
    EXPECT_THAT(source, HasSubstr(kind));
  }
}

}  // namespace

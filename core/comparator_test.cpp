#include "core/comparator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

bool Equivalent(const char* actual, const char* expected,
                const core::ComparisonOptions& options =
                    core::ComparisonOptions()) {
  return core::Equivalent(core::Value::Parse(actual),
                          core::Value::Parse(expected), options);
}

core::ComparisonOptions OrderIndependent() {
  core::ComparisonOptions options;
  options.order_independent = true;
  return options;
}

/*
 * Scalars
 */

// NOLINTNEXTLINE
TEST(Comparator, Null) {
  EXPECT_TRUE(Equivalent("null", "null"));
  EXPECT_FALSE(Equivalent("0", "null"));
  EXPECT_FALSE(Equivalent("null", "false"));
  EXPECT_FALSE(Equivalent("[]", "null"));
}

// NOLINTNEXTLINE
TEST(Comparator, Booleans) {
  EXPECT_TRUE(Equivalent("true", "true"));
  EXPECT_FALSE(Equivalent("true", "false"));
  EXPECT_FALSE(Equivalent("true", "1"));
  EXPECT_FALSE(Equivalent("0", "false"));
}

// NOLINTNEXTLINE
TEST(Comparator, Numbers) {
  EXPECT_TRUE(Equivalent("3", "3.0"));
  EXPECT_TRUE(Equivalent("0.30000000000000004", "0.3"));
  EXPECT_FALSE(Equivalent("3", "4"));
  EXPECT_FALSE(Equivalent("0.001", "0.002"));
}

// NOLINTNEXTLINE
TEST(Comparator, RelativeTolerance) {
  EXPECT_TRUE(Equivalent("1000000000.5", "1000000000"));
  EXPECT_FALSE(Equivalent("1000002000", "1000000000"));
}

// NOLINTNEXTLINE
TEST(Comparator, CustomTolerance) {
  core::ComparisonOptions options;
  options.absolute_tolerance = 0.01;
  options.relative_tolerance = 0;
  EXPECT_TRUE(Equivalent("0.105", "0.1", options));
  EXPECT_FALSE(Equivalent("0.12", "0.1", options));
}

// NOLINTNEXTLINE
TEST(Comparator, Strings) {
  EXPECT_TRUE(Equivalent(R"("abc")", R"("abc")"));
  EXPECT_FALSE(Equivalent(R"("abc")", R"("abd")"));
  EXPECT_FALSE(Equivalent(R"("1")", "1"));
}

/*
 * Containers
 */

// NOLINTNEXTLINE
TEST(Comparator, ArraysInOrder) {
  EXPECT_TRUE(Equivalent("[0, 1]", "[0, 1]"));
  EXPECT_FALSE(Equivalent("[1, 0]", "[0, 1]"));
  EXPECT_FALSE(Equivalent("[0, 1, 2]", "[0, 1]"));
  EXPECT_TRUE(Equivalent("[]", "[]"));
}

// NOLINTNEXTLINE
TEST(Comparator, NestedArrays) {
  EXPECT_TRUE(Equivalent("[[1, 2], [3]]", "[[1, 2.0000000001], [3]]"));
  EXPECT_FALSE(Equivalent("[[1, 2], [3]]", "[[2, 1], [3]]"));
}

// NOLINTNEXTLINE
TEST(Comparator, OrderIndependent) {
  EXPECT_TRUE(Equivalent("[1, 0]", "[0, 1]", OrderIndependent()));
  EXPECT_TRUE(Equivalent("[[3], [1, 2]]", "[[1, 2], [3]]", OrderIndependent()));
  EXPECT_FALSE(Equivalent("[1, 1, 2]", "[1, 2, 2]", OrderIndependent()));
  EXPECT_FALSE(Equivalent("[1, 2]", "[1, 2, 2]", OrderIndependent()));
}

// NOLINTNEXTLINE
TEST(Comparator, OrderIndependentIsTopLevelOnly) {
  EXPECT_FALSE(
      Equivalent("[[2, 1], [3]]", "[[3], [1, 2]]", OrderIndependent()));
}

// NOLINTNEXTLINE
TEST(Comparator, OrderIndependentNeedsMatching) {
  // Pairing 1.0000005 with 1.000001 leaves nothing for 1.0000015.
  core::ComparisonOptions options = OrderIndependent();
  options.relative_tolerance = 0;
  EXPECT_TRUE(Equivalent("[1.0000005, 1.0000015]", "[1.000001, 1]", options));
}

// NOLINTNEXTLINE
TEST(Comparator, Objects) {
  EXPECT_TRUE(Equivalent(R"({"a": 1, "b": [2]})", R"({"b": [2], "a": 1})"));
  EXPECT_FALSE(Equivalent(R"({"a": 1})", R"({"a": 1, "b": 2})"));
  EXPECT_FALSE(Equivalent(R"({"a": 1, "c": 2})", R"({"a": 1, "b": 2})"));
  EXPECT_FALSE(Equivalent(R"({"a": 1})", R"({"a": 2})"));
}

// NOLINTNEXTLINE
TEST(Comparator, MixedShapes) {
  EXPECT_FALSE(Equivalent("[1]", "1"));
  EXPECT_FALSE(Equivalent(R"({"0": 1})", "[1]"));
  EXPECT_FALSE(Equivalent(R"("null")", "null"));
}

}  // namespace

#include "core/value.hpp"
#include <kj/exception.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(Value, DefaultIsNull) {
  core::Value value;
  EXPECT_TRUE(value.IsNull());
  EXPECT_EQ(value.ToJson(), "null");
}

// NOLINTNEXTLINE
TEST(Value, Parse) {
  core::Value value = core::Value::Parse(R"({"nums": [2, 7, 11], "target": 9})");
  ASSERT_TRUE(value.Get().isObject());
  auto fields = value.Get().getObject();
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(std::string(fields[0].getName().cStr()), "nums");
  EXPECT_EQ(fields[0].getValue().getArray().size(), 3u);
  EXPECT_EQ(fields[1].getValue().getNumber(), 9);
}

// NOLINTNEXTLINE
TEST(Value, ParseInvalid) {
  EXPECT_THROW(core::Value::Parse("[1, 2"), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(Value, CopyIsDeep) {
  core::Value original = core::Value::Parse(R"(["a", [1, 2]])");
  core::Value copy = original;
  EXPECT_NE(copy.Get().getArray()[0].getString().begin(),
            original.Get().getArray()[0].getString().begin());
  original = core::Value::Parse("3");
  EXPECT_EQ(copy.ToJson(), R"(["a",[1,2]])");
  EXPECT_EQ(original.ToJson(), "3");
}

// NOLINTNEXTLINE
TEST(Value, CopyAssignment) {
  core::Value a = core::Value::Parse("[1]");
  core::Value b;
  b = a;
  a = core::Value();
  EXPECT_TRUE(a.IsNull());
  EXPECT_EQ(b.ToJson(), "[1]");
}

// NOLINTNEXTLINE
TEST(Value, FromReader) {
  core::Value outer = core::Value::Parse(R"({"x": {"y": true}})");
  core::Value inner =
      core::Value::FromReader(outer.Get().getObject()[0].getValue());
  outer = core::Value();
  EXPECT_EQ(inner.ToJson(), R"({"y":true})");
}

}  // namespace

#ifndef CORE_VALUE_HPP
#define CORE_VALUE_HPP

#include <string>

#include <capnp/compat/json.capnp.h>
#include <capnp/message.h>
#include <kj/memory.h>

namespace core {

// A JSON-shaped value (test inputs, expected and actual results). Every Value
// owns its own message, so copying a Value is always a deep copy and no data
// is ever shared between two Values.
class Value {
 public:
  // Creates a null value.
  Value();

  // Parses JSON text. Throws kj::Exception if json is not valid JSON.
  static Value Parse(const std::string& json);

  // Makes a deep copy of the given tree.
  static Value FromReader(capnp::JsonValue::Reader reader);

  Value(const Value& other);
  Value& operator=(const Value& other);
  Value(Value&&) = default;
  Value& operator=(Value&&) = default;
  ~Value() = default;

  capnp::JsonValue::Reader Get() const { return root_; }
  bool IsNull() const { return root_.isNull(); }

  // Compact JSON encoding.
  std::string ToJson() const;

 private:
  explicit Value(capnp::JsonValue::Reader reader);

  kj::Own<capnp::MallocMessageBuilder> message_;
  capnp::JsonValue::Reader root_;
};

}  // namespace core

#endif

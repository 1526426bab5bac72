#include "core/value.hpp"

#include <capnp/compat/json.h>
#include <kj/debug.h>

namespace core {

Value::Value() : message_(kj::heap<capnp::MallocMessageBuilder>(16)) {
  auto root = message_->initRoot<capnp::JsonValue>();
  root.setNull();
  root_ = root.asReader();
}

Value::Value(capnp::JsonValue::Reader reader)
    : message_(kj::heap<capnp::MallocMessageBuilder>(
          static_cast<unsigned>(reader.totalSize().wordCount + 1))) {
  message_->setRoot(reader);
  root_ = message_->getRoot<capnp::JsonValue>().asReader();
}

Value Value::Parse(const std::string& json) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  capnp::JsonCodec codec;
  auto root = message->initRoot<capnp::JsonValue>();
  codec.decodeRaw(kj::ArrayPtr<const char>(json.data(), json.size()), root);
  // Re-copy into a tightly sized message.
  return Value(root.asReader());
}

Value Value::FromReader(capnp::JsonValue::Reader reader) {
  return Value(reader);
}

Value::Value(const Value& other) : Value(other.Get()) {}

Value& Value::operator=(const Value& other) {
  if (this != &other) *this = Value(other.Get());
  return *this;
}

std::string Value::ToJson() const {
  capnp::JsonCodec codec;
  kj::String encoded = codec.encodeRaw(root_);
  return std::string(encoded.cStr());
}

}  // namespace core

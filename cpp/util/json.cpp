#include "util/json.hpp"

#include <capnp/compat/json.h>
#include <cmath>

namespace util {

JsonDocument::JsonDocument(kj::StringPtr text)
    : root_(message_.initRoot<capnp::JsonValue>()) {
  capnp::JsonCodec codec;
  codec.decodeRaw(text.asArray(), root_);
}

kj::Maybe<capnp::JsonValue::Reader> GetField(capnp::JsonValue::Reader value,
                                             kj::StringPtr name) {
  if (!value.isObject()) return nullptr;
  // Later duplicates win, as in JSON.parse.
  kj::Maybe<capnp::JsonValue::Reader> found = nullptr;
  for (auto field : value.getObject()) {
    if (field.getName() == name) found = field.getValue();
  }
  return found;
}

kj::Maybe<kj::StringPtr> GetString(capnp::JsonValue::Reader value,
                                   kj::StringPtr name) {
  auto maybe_field = GetField(value, name);
  KJ_IF_MAYBE(field, maybe_field) {
    if (field->isString()) return kj::StringPtr(field->getString());
  }
  return nullptr;
}

bool IsTruthy(capnp::JsonValue::Reader value) {
  switch (value.which()) {
    case capnp::JsonValue::NULL_:
      return false;
    case capnp::JsonValue::BOOLEAN:
      return value.getBoolean();
    case capnp::JsonValue::NUMBER:
      return value.getNumber() != 0 && !std::isnan(value.getNumber());
    case capnp::JsonValue::STRING:
      return value.getString().size() > 0;
    case capnp::JsonValue::ARRAY:
    case capnp::JsonValue::OBJECT:
    case capnp::JsonValue::CALL:
      return true;
  }
  return true;
}

}  // namespace util

#ifndef UTIL_JSON_HPP
#define UTIL_JSON_HPP

#include <capnp/compat/json.capnp.h>
#include <capnp/message.h>
#include <kj/string.h>

namespace util {

// A JSON text decoded into a tree of capnp::JsonValue.
class JsonDocument {
 public:
  // Throws a kj::Exception if text is not valid JSON.
  explicit JsonDocument(kj::StringPtr text);
  KJ_DISALLOW_COPY(JsonDocument);

  capnp::JsonValue::Reader Root() const { return root_.asReader(); }

 private:
  capnp::MallocMessageBuilder message_;
  capnp::JsonValue::Builder root_;
};

// Returns the member called name if value is an object that has one.
kj::Maybe<capnp::JsonValue::Reader> GetField(capnp::JsonValue::Reader value,
                                             kj::StringPtr name);

// Returns the member called name if it exists and is a string.
kj::Maybe<kj::StringPtr> GetString(capnp::JsonValue::Reader value,
                                   kj::StringPtr name);

// JavaScript truthiness: null, false, 0, NaN and "" are false.
bool IsTruthy(capnp::JsonValue::Reader value);

}  // namespace util
#endif

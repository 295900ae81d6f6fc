#include "util/json.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(Json, GetField) {
  util::JsonDocument doc(R"({"language": "python", "code": "print(1)"})");
  auto language = util::GetString(doc.Root(), "language");
  KJ_IF_MAYBE(l, language) { EXPECT_EQ(*l, "python"); }
  else {
    ADD_FAILURE() << "language not found";
  }
  auto missing = util::GetField(doc.Root(), "missing");
  EXPECT_TRUE(missing == nullptr);
}

// NOLINTNEXTLINE
TEST(Json, GetFieldOfNonObject) {
  util::JsonDocument doc("[1, 2, 3]");
  auto field = util::GetField(doc.Root(), "language");
  EXPECT_TRUE(field == nullptr);
}

// NOLINTNEXTLINE
TEST(Json, GetStringOfNonString) {
  util::JsonDocument doc(R"({"code": 42})");
  auto code = util::GetString(doc.Root(), "code");
  EXPECT_TRUE(code == nullptr);
  auto field = util::GetField(doc.Root(), "code");
  EXPECT_TRUE(field != nullptr);
}

// NOLINTNEXTLINE
TEST(Json, DuplicateKeysLastWins) {
  util::JsonDocument doc(R"({"language": "python", "language": "javascript"})");
  auto language = util::GetString(doc.Root(), "language");
  KJ_IF_MAYBE(l, language) { EXPECT_EQ(*l, "javascript"); }
  else {
    ADD_FAILURE() << "language not found";
  }
}

// NOLINTNEXTLINE
TEST(Json, InvalidJson) {
  EXPECT_THROW(util::JsonDocument("{\"language\": "), std::exception);  // NOLINT
  EXPECT_THROW(util::JsonDocument("not json"), std::exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(Json, Truthiness) {
  util::JsonDocument doc(
      R"({"null": null, "false": false, "zero": 0, "empty": "",
          "true": true, "one": 1, "text": "x", "list": [], "obj": {}})");
  auto truthy = [&doc](kj::StringPtr name) {
    auto field = util::GetField(doc.Root(), name);
    KJ_IF_MAYBE(f, field) { return util::IsTruthy(*f); }
    ADD_FAILURE() << "missing field " << name.cStr();
    return false;
  };
  EXPECT_FALSE(truthy("null"));
  EXPECT_FALSE(truthy("false"));
  EXPECT_FALSE(truthy("zero"));
  EXPECT_FALSE(truthy("empty"));
  EXPECT_TRUE(truthy("true"));
  EXPECT_TRUE(truthy("one"));
  EXPECT_TRUE(truthy("text"));
  EXPECT_TRUE(truthy("list"));
  EXPECT_TRUE(truthy("obj"));
}

}  // namespace

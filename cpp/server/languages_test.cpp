#include "server/languages.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;

// NOLINTNEXTLINE
TEST(Languages, Python) {
  auto language = server::FindLanguage("python");
  KJ_IF_MAYBE(l, language) {
    EXPECT_STREQ(l->image, "python:3.9-slim");
    EXPECT_THAT(l->Command("print(1+1)"),
                ElementsAre("python", "-c", "print(1+1)"));
  }
  else {
    ADD_FAILURE() << "python is not supported";
  }
}

// NOLINTNEXTLINE
TEST(Languages, Javascript) {
  auto language = server::FindLanguage("javascript");
  KJ_IF_MAYBE(l, language) {
    EXPECT_STREQ(l->image, "node:18-alpine");
    EXPECT_THAT(l->Command("console.log(2)"),
                ElementsAre("node", "-e", "console.log(2)"));
  }
  else {
    ADD_FAILURE() << "javascript is not supported";
  }
}

// NOLINTNEXTLINE
TEST(Languages, Unsupported) {
  EXPECT_TRUE(server::FindLanguage("ruby") == nullptr);
  EXPECT_TRUE(server::FindLanguage("") == nullptr);
  EXPECT_TRUE(server::FindLanguage("Python") == nullptr);
}

// NOLINTNEXTLINE
TEST(Languages, CommandKeepsCodeAsSingleArgument) {
  auto language = server::FindLanguage("python");
  KJ_IF_MAYBE(l, language) {
    auto command = l->Command("import os\nprint('a b')  # \"quoted\"");
    ASSERT_EQ(command.size(), 3u);
    EXPECT_EQ(command[2], "import os\nprint('a b')  # \"quoted\"");
  }
  else {
    ADD_FAILURE() << "python is not supported";
  }
}

// NOLINTNEXTLINE
TEST(Languages, List) {
  ASSERT_EQ(server::Languages().size(), 2u);
  EXPECT_STREQ(server::Languages()[0].name, "python");
  EXPECT_STREQ(server::Languages()[1].name, "javascript");
}

}  // namespace

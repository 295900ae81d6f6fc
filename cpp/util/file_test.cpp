#include "util/file.hpp"
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

std::string tempPath(const std::string& name) {
  return "/tmp/code_runner_test_" + std::to_string(getpid()) + "_" + name;
}

// NOLINTNEXTLINE
TEST(File, WriteAndRead) {
  std::string path = tempPath("write_read");
  util::File::Write(path, "print(1+1)\n");
  EXPECT_TRUE(util::File::Exists(path));
  EXPECT_EQ(util::File::Size(path), 11);
  EXPECT_EQ(util::File::Read(path), "print(1+1)\n");
  std::remove(path.c_str());
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrites) {
  std::string path = tempPath("overwrite");
  util::File::Write(path, "a much longer content");
  util::File::Write(path, "short");
  EXPECT_EQ(util::File::Read(path), "short");
  std::remove(path.c_str());
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  EXPECT_FALSE(util::File::Exists(tempPath("missing")));
  EXPECT_THROW(util::File::Read(tempPath("missing")), std::exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, BaseName) {
  EXPECT_EQ(util::File::BaseName("cpp/server/executor.cpp"), "executor.cpp");
  EXPECT_EQ(util::File::BaseName("executor.cpp"), "executor.cpp");
  EXPECT_EQ(util::File::BaseName("/"), "");
}

}  // namespace

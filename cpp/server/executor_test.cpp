#include "server/executor.hpp"
#include <kj/async-io.h>
#include <kj/async.h>
#include <string>
#include "docker/fake_runtime.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using docker::FakeRuntime;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ExecutorTest : public ::testing::Test {
 protected:
  ExecutorTest() {
    runtime.images = {"python:3.9-slim", "node:18-alpine"};
  }

  const server::Language& language(kj::StringPtr name) {
    return KJ_ASSERT_NONNULL(server::FindLanguage(name));
  }

  std::string run(kj::StringPtr lang, std::string code) {
    return executor.Execute(language(lang), std::move(code)).wait(waitScope);
  }

  // Description of the error the run fails with.
  std::string errorOf(kj::StringPtr lang, std::string code) {
    auto promise = executor.Execute(language(lang), std::move(code));
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                         [&]() { promise.wait(waitScope); })) {
      return exc->getDescription().cStr();
    }
    ADD_FAILURE() << "the run did not fail";
    return "";
  }

  // Lets the runs detached from dropped promises finish.
  void settle() { waitScope.poll(); }

  kj::AsyncIoContext io = kj::setupAsyncIo();
  kj::WaitScope& waitScope = io.waitScope;
  FakeRuntime runtime;
  server::ExecutionLimits limits;
  server::Executor executor{&runtime, &io.provider->getTimer(), limits};
};

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ReturnsTrimmedOutput) {
  runtime.program = [](const docker::ContainerSpec&) {
    return std::string("  \n\tHello, world!\n  second line\n\n");
  };
  EXPECT_EQ(run("python", "print('Hello, world!')"),
            "Hello, world!\n  second line");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ReplacesInvalidUtf8) {
  runtime.program = [](const docker::ContainerSpec&) {
    return std::string("\xFF\xFEok \xE2\x82\xAC\n\xE2\x82");
  };
  EXPECT_EQ(run("python", "import sys"),
            "\xEF\xBF\xBD\xEF\xBF\xBDok \xE2\x82\xAC\n\xEF\xBF\xBD");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TrimsUnicodeWhitespace) {
  runtime.program = [](const docker::ContainerSpec&) {
    return std::string("\xEF\xBB\xBFx\xC2\xA0\n");
  };
  EXPECT_EQ(run("javascript", "console.log('x\\u00a0')"), "x");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CreatesLimitedContainer) {
  docker::ContainerSpec spec;
  runtime.program = [&spec](const docker::ContainerSpec& s) {
    spec = s;
    return std::string();
  };
  EXPECT_EQ(run("javascript", "console.log(1)"), "");
  EXPECT_EQ(spec.image, "node:18-alpine");
  EXPECT_THAT(spec.command, ElementsAre("node", "-e", "console.log(1)"));
  EXPECT_EQ(spec.cpu_shares, 512);
  EXPECT_EQ(spec.memory_bytes, 256u * 1024 * 1024);
  EXPECT_EQ(spec.network_mode, "none");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RunsStepsInOrder) {
  EXPECT_EQ(run("python", "1"), "1");
  ASSERT_EQ(runtime.created.size(), 1u);
  std::string id = runtime.created[0];
  EXPECT_THAT(runtime.calls,
              ElementsAre("HasImage python:3.9-slim",
                          "CreateContainer python:3.9-slim", "Attach " + id,
                          "Start " + id, "Wait " + id, "Remove " + id));
  EXPECT_THAT(runtime.containers, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, PullsMissingImage) {
  runtime.images.clear();
  runtime.registry = {"python:3.9-slim"};
  EXPECT_EQ(run("python", "pulled"), "pulled");
  EXPECT_THAT(runtime.calls, Contains("PullImage python:3.9-slim"));
  EXPECT_EQ(runtime.images.count("python:3.9-slim"), 1u);
  EXPECT_THAT(runtime.containers, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, PullFailure) {
  runtime.images.clear();
  EXPECT_EQ(errorOf("python", "1"), "Failed to pull image python:3.9-slim");
  EXPECT_THAT(runtime.created, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ImageCheckFailure) {
  runtime.failing = {"HasImage"};
  EXPECT_EQ(errorOf("python", "1"), "HasImage");
  EXPECT_THAT(runtime.created, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CreateFailure) {
  runtime.failing = {"CreateContainer"};
  EXPECT_EQ(errorOf("javascript", "1"), "CreateContainer");
  EXPECT_THAT(runtime.created, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, FailuresAfterCreateRemoveTheContainer) {
  for (const char* step : {"Attach", "Start", "Wait"}) {
    SCOPED_TRACE(step);
    runtime.failing = {step};
    EXPECT_EQ(errorOf("python", "1"), step);
    ASSERT_FALSE(runtime.created.empty());
    EXPECT_EQ(runtime.calls.back(), "Remove " + runtime.created.back());
    EXPECT_THAT(runtime.containers, IsEmpty());
  }
  EXPECT_EQ(runtime.created.size(), 3u);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, Timeout) {
  runtime.mode = FakeRuntime::Mode::HANG;
  server::ExecutionLimits limits;
  limits.timeout_millis = 20;
  server::Executor executor(&runtime, &io.provider->getTimer(), limits);
  auto promise = executor.Execute(language("python"), "while True: pass");
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { promise.wait(waitScope); })) {
    EXPECT_EQ(exc->getDescription(), "Execution timed out.");
  } else {
    ADD_FAILURE() << "the run did not time out";
  }
  ASSERT_EQ(runtime.created.size(), 1u);
  EXPECT_EQ(runtime.calls.back(), "Remove " + runtime.created[0]);
  EXPECT_THAT(runtime.containers, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, NullStatusIsTimeout) {
  runtime.mode = FakeRuntime::Mode::NULL_STATUS;
  EXPECT_EQ(errorOf("javascript", "1"), "Execution timed out.");
  EXPECT_THAT(runtime.containers, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, FailedProgramStillReturnsOutput) {
  runtime.mode = FakeRuntime::Mode::MANUAL;
  runtime.program = [](const docker::ContainerSpec&) {
    return std::string("Traceback (most recent call last):\nNameError\n");
  };
  auto promise = executor.Execute(language("python"), "nope");
  promise = promise.eagerlyEvaluate(nullptr);
  settle();
  runtime.Exit(runtime.IdOf("python:3.9-slim"), 1);
  EXPECT_EQ(promise.wait(waitScope),
            "Traceback (most recent call last):\nNameError");
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RemoveFailureKeepsResult) {
  runtime.failing = {"Remove"};
  EXPECT_EQ(run("python", "ok"), "ok");
  EXPECT_EQ(runtime.calls.back(), "Remove " + runtime.created[0]);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, DroppedRunStillCleansUp) {
  runtime.mode = FakeRuntime::Mode::MANUAL;
  {
    auto promise = executor.Execute(language("python"), "dropped");
    settle();
  }
  std::string id = runtime.IdOf("python:3.9-slim");
  EXPECT_TRUE(runtime.Started(id));
  runtime.Exit(id);
  settle();
  EXPECT_EQ(runtime.calls.back(), "Remove " + id);
  EXPECT_THAT(runtime.containers, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ConcurrentRunsKeepTheirOutput) {
  runtime.mode = FakeRuntime::Mode::MANUAL;
  auto python = executor.Execute(language("python"), "from python")
                    .eagerlyEvaluate(nullptr);
  auto node = executor.Execute(language("javascript"), "from node")
                  .eagerlyEvaluate(nullptr);
  settle();
  ASSERT_EQ(runtime.containers.size(), 2u);
  runtime.Exit(runtime.IdOf("node:18-alpine"));
  EXPECT_EQ(node.wait(waitScope), "from node");
  EXPECT_EQ(runtime.containers.size(), 1u);
  runtime.Exit(runtime.IdOf("python:3.9-slim"));
  EXPECT_EQ(python.wait(waitScope), "from python");
  EXPECT_THAT(runtime.containers, IsEmpty());
}

}  // namespace

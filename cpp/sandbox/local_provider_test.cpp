#include "sandbox/local_provider.hpp"

#include <signal.h>
#include <cerrno>

#include <kj/async-io.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/test_util.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const char* test_tmpdir = "/tmp/sandbox_broker_testdir";

class LocalProviderTest : public ::testing::Test {
 protected:
  LocalProviderTest()
      : io_(kj::setupAsyncIo()),
        provider_(*io_.lowLevelProvider, test_tmpdir) {}

  kj::Own<sandbox::Instance> Create() {
    return provider_.Create("bash").wait(io_.waitScope);
  }

  sandbox::CommandResult Run(sandbox::Instance& instance,
                             const std::string& command) {
    return instance.Execute(command).wait(io_.waitScope);
  }

  kj::AsyncIoContext io_;
  sandbox::LocalProvider provider_;
};

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, CapturesOutput) {
  auto instance = Create();
  EXPECT_THAT(instance->Id(), StartsWith("local-"));
  auto result = Run(*instance, "echo hello; echo oops >&2");
  EXPECT_EQ(result.stdout_text, "hello\n");
  EXPECT_EQ(result.stderr_text, "oops\n");
  EXPECT_EQ(result.exit_code, 0);
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, ExitCodes) {
  auto instance = Create();
  EXPECT_EQ(Run(*instance, "exit 3").exit_code, 3);
  EXPECT_EQ(Run(*instance, "kill -9 $$").exit_code, 128 + SIGKILL);
  EXPECT_EQ(Run(*instance, "definitely-not-a-command").exit_code, 127);
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, RunsInPrivateDirectory) {
  auto instance = Create();
  instance->WriteFile("sub/input.txt", "content").wait(io_.waitScope);
  EXPECT_EQ(Run(*instance, "cat sub/input.txt").stdout_text, "content");
  auto pwd = Run(*instance, "pwd").stdout_text;
  EXPECT_THAT(pwd, StartsWith(test_tmpdir));
  EXPECT_EQ(Run(*instance, "echo $HOME").stdout_text, pwd);
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, RejectsEscapingPaths) {
  auto instance = Create();
  for (const char* path : {"../escape", "/etc/passwd", ""}) {
    EXPECT_EQ(util::ErrorOf([&]() {
                instance->WriteFile(path, "x").wait(io_.waitScope);
              }),
              util::NameOf(util::ErrorKind::INVALID_REQUEST))
        << path;
  }
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, InstancesAreIsolated) {
  auto first = Create();
  auto second = Create();
  EXPECT_NE(first->Id(), second->Id());
  Run(*first, "echo secret > mine.txt");
  EXPECT_EQ(Run(*second, "ls").stdout_text, "");
  EXPECT_EQ(Run(*first, "ls").stdout_text, "mine.txt\n");
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, ResetRemovesFiles) {
  auto instance = Create();
  Run(*instance, "mkdir -p a/b && touch a/b/c .hidden");
  instance->Reset().wait(io_.waitScope);
  EXPECT_EQ(Run(*instance, "ls -A").stdout_text, "");
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, CancellationKillsTheCommand) {
  auto instance = Create();
  auto& timer = io_.provider->getTimer();
  auto timed_out =
      instance->Execute("echo $$ > pid; sleep 30")
          .then([](sandbox::CommandResult) { return false; })
          .exclusiveJoin(timer.afterDelay(500 * kj::MILLISECONDS).then([]() {
            return true;
          }))
          .wait(io_.waitScope);
  EXPECT_TRUE(timed_out);
  std::string pid = Run(*instance, "cat pid").stdout_text;
  ASSERT_FALSE(pid.empty());
  EXPECT_EQ(kill(std::stoi(pid), 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, InterruptKillsTheCommandAndKeepsFiles) {
  auto instance = Create();
  instance->WriteFile("notes.txt", "kept").wait(io_.waitScope);
  auto running = instance->Execute("touch started; sleep 30");
  io_.provider->getTimer()
      .afterDelay(300 * kj::MILLISECONDS)
      .wait(io_.waitScope);
  instance->Interrupt().wait(io_.waitScope);
  EXPECT_EQ(running.wait(io_.waitScope).exit_code, 128 + SIGKILL);
  EXPECT_EQ(Run(*instance, "ls").stdout_text, "notes.txt\nstarted\n");
  EXPECT_EQ(Run(*instance, "echo again").stdout_text, "again\n");
}

// NOLINTNEXTLINE
TEST_F(LocalProviderTest, DestroyRemovesTheDirectory) {
  auto instance = Create();
  auto pwd = Run(*instance, "pwd").stdout_text;
  pwd.pop_back();
  ASSERT_TRUE(util::File::Exists(pwd));
  instance->Destroy().wait(io_.waitScope);
  EXPECT_FALSE(util::File::Exists(pwd));
  EXPECT_EQ(util::ErrorOf([&]() { Run(*instance, "true"); }),
            util::NameOf(util::ErrorKind::INFRASTRUCTURE));
}

}  // namespace

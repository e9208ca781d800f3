#include "server/server.hpp"

#include <kj/async-io.h>
#include <iostream>

#include "gtest/gtest.h"
#include "sandbox/local_provider.hpp"
#include "util/test_util.hpp"
#include "util/which.hpp"

namespace {

using util::ErrorKind;

const char* test_tmpdir = "/tmp/sandbox_broker_testdir";

// Goes through the Cap'n Proto interface with real local sandboxes.
class ServerTest : public ::testing::Test {
 protected:
  ServerTest()
      : io_(kj::setupAsyncIo()),
        provider_(*io_.lowLevelProvider, test_tmpdir),
        registry_(language::Registry::Builtin({"bash", "python"})),
        pool_(provider_, Options()),
        sessions_(&pool_),
        orchestrator_(registry_, &pool_, &sessions_, io_.provider->getTimer(),
                      pool::OrchestratorOptions()),
        broker_(kj::heap<server::Server>(&orchestrator_)) {}

  ~ServerTest() override { orchestrator_.Shutdown().wait(io_.waitScope); }

  static pool::PoolOptions Options() {
    pool::PoolOptions options;
    options.capacity = 3;
    options.languages = {"bash", "python"};
    return options;
  }

  capnp::Response<capnproto::Broker::RunCodeResults> RunCode(
      const std::string& language, const std::string& source,
      const std::string& session_id = "", uint32_t timeout = 0) {
    auto req = broker_.runCodeRequest();
    auto request = req.initRequest();
    request.setLanguage(language);
    request.setSource(source);
    request.setSessionId(session_id);
    request.setTimeoutSeconds(timeout);
    return req.send().wait(io_.waitScope);
  }

  std::string OpenSession(const std::string& language) {
    auto req = broker_.openSessionRequest();
    req.setLanguage(language);
    req.setPrincipal("alice");
    return req.send().wait(io_.waitScope).getSessionId();
  }

  kj::AsyncIoContext io_;
  sandbox::LocalProvider provider_;
  language::Registry registry_;
  pool::SandboxPool pool_;
  pool::SessionRegistry sessions_;
  pool::Orchestrator orchestrator_;
  capnproto::Broker::Client broker_;
};

// NOLINTNEXTLINE
TEST_F(ServerTest, RunsBash) {
  auto res = RunCode("bash", "echo hello; echo oops >&2; exit 3");
  auto outcome = res.getOutcome();
  EXPECT_EQ(std::string(outcome.getOutput()), "hello\n");
  EXPECT_EQ(std::string(outcome.getError()), "oops\n");
  EXPECT_EQ(outcome.getExitCode(), 3);
  EXPECT_TRUE(outcome.getFailure().isNone());
  EXPECT_EQ(outcome.getExecutionId().size(), 32u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, RunsPython) {
  if (util::which("python3").empty()) {
    std::cerr << "python3 is not installed, skipping" << std::endl;
    return;
  }
  auto res = RunCode("python", "print(1+1)");
  EXPECT_EQ(std::string(res.getOutcome().getOutput()), "2\n");
  EXPECT_EQ(res.getOutcome().getExitCode(), 0);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, InputFiles) {
  auto req = broker_.runCodeRequest();
  auto request = req.initRequest();
  request.setLanguage("sh");
  request.setSource("cat data/in.txt");
  auto files = request.initFiles(1);
  files[0].setPath("data/in.txt");
  const char content[] = "from the client";
  files[0].setContent(kj::arrayPtr(
      reinterpret_cast<const kj::byte*>(content),  // NOLINT
      sizeof(content) - 1));
  auto res = req.send().wait(io_.waitScope);
  EXPECT_EQ(std::string(res.getOutcome().getOutput()), "from the client");
}

// NOLINTNEXTLINE
TEST_F(ServerTest, Timeout) {
  auto res = RunCode("bash", "echo started; sleep 30", "", 1);
  EXPECT_TRUE(res.getOutcome().getFailure().isTimeout());
  EXPECT_GE(res.getOutcome().getDurationMs(), 1000u);
  pool_.OnSettled().wait(io_.waitScope);
  EXPECT_EQ(pool_.Stats().languages["bash"].ephemeral, 0u);
  EXPECT_EQ(pool_.Stats().languages["bash"].idle, 1u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SessionKeepsFiles) {
  std::string id = OpenSession("bash");
  EXPECT_EQ(RunCode("bash", "echo kept > state.txt", id)
                .getOutcome()
                .getExitCode(),
            0);
  auto res = RunCode("bash", "cat state.txt", id);
  EXPECT_EQ(std::string(res.getOutcome().getOutput()), "kept\n");
  EXPECT_EQ(std::string(res.getOutcome().getSessionId()), id);

  // One-shot runs do not see the session files.
  EXPECT_NE(RunCode("bash", "cat state.txt").getOutcome().getExitCode(), 0);

  auto list = broker_.listSessionsRequest();
  list.setPrincipal("alice");
  auto sessions = list.send().wait(io_.waitScope).getSessions();
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(std::string(sessions[0].getSessionId()), id);
  EXPECT_EQ(std::string(sessions[0].getLanguage()), "bash");

  auto close = broker_.closeSessionRequest();
  close.setSessionId(id);
  close.send().wait(io_.waitScope);
  EXPECT_EQ(util::ErrorOf([&]() { RunCode("bash", "true", id); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ErrorsKeepTheirKind) {
  EXPECT_EQ(util::ErrorOf([&]() { RunCode("cobol", "DISPLAY 'HI'."); }),
            util::NameOf(ErrorKind::UNSUPPORTED_LANGUAGE));
  EXPECT_EQ(util::ErrorOf([&]() { RunCode("bash", "true", "nope"); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
}

// NOLINTNEXTLINE
TEST_F(ServerTest, Stats) {
  OpenSession("bash");
  auto stats = broker_.statsRequest().send().wait(io_.waitScope).getStats();
  EXPECT_EQ(stats.getCapacity(), 3u);
  EXPECT_FALSE(stats.getDraining());
  ASSERT_EQ(stats.getLanguages().size(), 2u);
  EXPECT_EQ(std::string(stats.getLanguages()[0].getLanguage()), "bash");
  EXPECT_EQ(stats.getLanguages()[0].getSession(), 1u);
  EXPECT_EQ(std::string(stats.getLanguages()[1].getLanguage()), "python");
}

}  // namespace

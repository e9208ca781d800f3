#include "pool/session_registry.hpp"

#include <kj/async-io.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/fake_provider.hpp"
#include "util/test_util.hpp"

namespace {

using ::testing::MatchesRegex;
using util::ErrorKind;

class SessionRegistryTest : public ::testing::Test {
 protected:
  SessionRegistryTest()
      : io_(kj::setupAsyncIo()),
        provider_(io_.provider->getTimer()),
        pool_(provider_, Options()),
        sessions_(&pool_) {}

  static pool::PoolOptions Options() {
    pool::PoolOptions options;
    options.capacity = 3;
    options.languages = {"python"};
    return options;
  }

  const pool::Session* Create(const std::string& principal) {
    return sessions_.Create("python", principal).wait(io_.waitScope);
  }

  kj::AsyncIoContext io_;
  sandbox::FakeProvider provider_;
  pool::SandboxPool pool_;
  pool::SessionRegistry sessions_;
};

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, CreateBindsASandbox) {
  const pool::Session* session = Create("alice");
  EXPECT_THAT(session->id, MatchesRegex("[0-9a-f]{32}"));
  EXPECT_EQ(session->principal, "alice");
  EXPECT_EQ(session->language, "python");
  EXPECT_EQ(session->handle->state, pool::HandleState::ACTIVE_SESSION);
  EXPECT_EQ(session->handle->session_id, session->id);
  EXPECT_EQ(pool_.Stats().languages["python"].session, 1u);
  EXPECT_EQ(&sessions_.Resolve(session->id), session);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, SessionsGetDistinctSandboxes) {
  const pool::Session* first = Create("alice");
  const pool::Session* second = Create("alice");
  EXPECT_NE(first->id, second->id);
  EXPECT_NE(first->handle, second->handle);
  EXPECT_NE(first->handle->RemoteId(), second->handle->RemoteId());
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, EndResetsAndReturnsTheSandbox) {
  const pool::Session* session = Create("alice");
  std::string id = session->id;
  sessions_.End(id);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Resolve(id); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.End(id); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  pool_.OnSettled().wait(io_.waitScope);
  EXPECT_EQ(provider_.state().resets, 1u);
  EXPECT_EQ(pool_.Stats().languages["python"].idle, 1u);
  EXPECT_EQ(pool_.Stats().languages["python"].session, 0u);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, PrincipalMustMatch) {
  const pool::Session* session = Create("alice");
  EXPECT_EQ(&sessions_.Resolve(session->id, "alice"), session);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Resolve(session->id, "bob"); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, CreateFailsAtCapacity) {
  Create("alice");
  Create("alice");
  Create("bob");
  EXPECT_EQ(util::ErrorOf([&]() { Create("carol"); }),
            util::NameOf(ErrorKind::CAPACITY_EXHAUSTED));
  EXPECT_EQ(sessions_.Size(), 3u);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, ListByPrincipal) {
  Create("alice");
  Create("bob");
  Create("alice");
  EXPECT_EQ(sessions_.List("alice").size(), 2u);
  EXPECT_EQ(sessions_.List("bob").size(), 1u);
  EXPECT_EQ(sessions_.List("carol").size(), 0u);
  EXPECT_EQ(sessions_.List().size(), 3u);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, CheckoutIsExclusive) {
  const pool::Session* session = Create("alice");
  pool::Session* running = sessions_.Checkout(session->id);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Checkout(session->id); }),
            util::NameOf(ErrorKind::SESSION_BUSY));
  sessions_.Checkin(running, true);
  sessions_.Checkin(sessions_.Checkout(session->id), true);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, CheckoutChecksThePrincipal) {
  const pool::Session* session = Create("alice");
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Checkout(session->id, "bob"); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  EXPECT_FALSE(session->busy);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Checkout("missing", "alice"); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  pool::Session* running = sessions_.Checkout(session->id, "alice");
  EXPECT_EQ(running, session);
  EXPECT_TRUE(running->busy);
  sessions_.Checkin(running, true);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, EndWhileBusyWaitsForTheRun) {
  const pool::Session* session = Create("alice");
  std::string id = session->id;
  pool::Session* running = sessions_.Checkout(id);
  sessions_.End(id);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Resolve(id); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  // The run still owns the sandbox.
  EXPECT_EQ(pool_.Stats().languages["python"].session, 1u);
  EXPECT_EQ(running->handle->state, pool::HandleState::ACTIVE_SESSION);
  sessions_.Checkin(running, true);
  pool_.OnSettled().wait(io_.waitScope);
  EXPECT_EQ(pool_.Stats().languages["python"].session, 0u);
  EXPECT_EQ(pool_.Stats().languages["python"].idle, 1u);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, UnhealthyRunInvalidatesTheSession) {
  const pool::Session* session = Create("alice");
  std::string id = session->id;
  sessions_.Checkin(sessions_.Checkout(id), false);
  EXPECT_EQ(util::ErrorOf([&]() { sessions_.Resolve(id); }),
            util::NameOf(ErrorKind::SESSION_NOT_FOUND));
  pool_.OnSettled().wait(io_.waitScope);
  EXPECT_EQ(provider_.Alive(), 0u);
  EXPECT_EQ(pool_.Stats().Total(), 0u);
}

// NOLINTNEXTLINE
TEST_F(SessionRegistryTest, ClearEndsEverySession) {
  Create("alice");
  Create("bob");
  sessions_.Clear();
  EXPECT_EQ(sessions_.Size(), 0u);
  pool_.OnSettled().wait(io_.waitScope);
  EXPECT_EQ(pool_.Stats().languages["python"].idle, 2u);
}

}  // namespace

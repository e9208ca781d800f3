#include "util/error.hpp"
#include "gtest/gtest.h"

namespace {

using util::ErrorKind;

// NOLINTNEXTLINE
TEST(Error, KindSurvivesDescription) {
  kj::Exception exc = BROKER_ERROR(SESSION_NOT_FOUND, "abc123");
  EXPECT_EQ(util::ClassifyError(exc), ErrorKind::SESSION_NOT_FOUND);
  EXPECT_EQ(util::ErrorMessage(exc), "abc123");
  EXPECT_EQ(exc.getType(), kj::Exception::Type::FAILED);
}

// NOLINTNEXTLINE
TEST(Error, RetryableKindsAreOverloaded) {
  kj::Exception exc = BROKER_ERROR(CAPACITY_EXHAUSTED, "pool full");
  EXPECT_EQ(exc.getType(), kj::Exception::Type::OVERLOADED);
  EXPECT_TRUE(util::IsRetryable(util::ClassifyError(exc)));
  EXPECT_FALSE(util::IsClientError(util::ClassifyError(exc)));
}

// NOLINTNEXTLINE
TEST(Error, RemotePrefixIsIgnored) {
  kj::Exception exc(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                    kj::str("remote exception: [unsupported language] cobol"));
  EXPECT_EQ(util::ClassifyError(exc), ErrorKind::UNSUPPORTED_LANGUAGE);
  EXPECT_EQ(util::ErrorMessage(exc), "cobol");
  EXPECT_TRUE(util::IsClientError(util::ClassifyError(exc)));
}

// NOLINTNEXTLINE
TEST(Error, OnlyTheLeadingTagCounts) {
  kj::Exception exc = BROKER_ERROR(SESSION_NOT_FOUND, "[invalid request] x");
  EXPECT_EQ(util::ClassifyError(exc), ErrorKind::SESSION_NOT_FOUND);
  EXPECT_EQ(util::ErrorMessage(exc), "[invalid request] x");

  kj::Exception quoted(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str("cannot parse \"[session busy] \""));
  EXPECT_EQ(util::ClassifyError(quoted), ErrorKind::INTERNAL);
  EXPECT_EQ(util::ErrorMessage(quoted), "cannot parse \"[session busy] \"");
}

// NOLINTNEXTLINE
TEST(Error, NestedRemotePrefixesAreIgnored) {
  kj::Exception exc(
      kj::Exception::Type::OVERLOADED, __FILE__, __LINE__,
      kj::str("remote exception: remote exception: [session busy] running"));
  EXPECT_EQ(util::ClassifyError(exc), ErrorKind::SESSION_BUSY);
  EXPECT_EQ(util::ErrorMessage(exc), "running");
}

// NOLINTNEXTLINE
TEST(Error, UntaggedExceptions) {
  kj::Exception lost(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__,
                     kj::str("connection reset"));
  EXPECT_EQ(util::ClassifyError(lost), ErrorKind::INFRASTRUCTURE);
  kj::Exception bug(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                    kj::str("oops"));
  EXPECT_EQ(util::ClassifyError(bug), ErrorKind::INTERNAL);
  EXPECT_EQ(util::ErrorMessage(bug), "oops");
}

}  // namespace

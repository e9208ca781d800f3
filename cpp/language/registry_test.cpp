#include "language/registry.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/test_util.hpp"

namespace {

using ::testing::ElementsAre;

// NOLINTNEXTLINE
TEST(RegistryTest, AliasesResolveToTheSameAdapter) {
  auto registry = language::Registry::Builtin();
  EXPECT_EQ(&registry.Resolve("node"), &registry.Resolve("javascript"));
  EXPECT_EQ(registry.Resolve("node").adapter.get(),
            registry.Resolve("js").adapter.get());
  EXPECT_EQ(&registry.Resolve("bash"), &registry.Resolve("shell"));
  EXPECT_EQ(registry.Resolve("py").name, "python");
  EXPECT_EQ(registry.Resolve("gcc").name, "c");
}

// NOLINTNEXTLINE
TEST(RegistryTest, ResolutionIsCaseInsensitive) {
  auto registry = language::Registry::Builtin();
  EXPECT_EQ(&registry.Resolve("Python"), &registry.Resolve("PYTHON3"));
  EXPECT_EQ(registry.Resolve("JavaScript").name, "node");
}

// NOLINTNEXTLINE
TEST(RegistryTest, UnknownLanguage) {
  auto registry = language::Registry::Builtin();
  for (int i = 0; i < 2; i++) {
    EXPECT_EQ(util::ErrorOf([&]() { registry.Resolve("cobol"); }),
              util::NameOf(util::ErrorKind::UNSUPPORTED_LANGUAGE));
  }
  EXPECT_EQ(util::ErrorOf([&]() { registry.Resolve(""); }),
            util::NameOf(util::ErrorKind::UNSUPPORTED_LANGUAGE));
}

// NOLINTNEXTLINE
TEST(RegistryTest, BuiltinLanguages) {
  auto registry = language::Registry::Builtin();
  EXPECT_THAT(registry.Languages(), ElementsAre("python", "node", "bash", "c"));
}

// NOLINTNEXTLINE
TEST(RegistryTest, RestrictedToEnabledLanguages) {
  auto registry = language::Registry::Builtin({"JS", "python"});
  EXPECT_THAT(registry.Languages(), ElementsAre("python", "node"));
  EXPECT_EQ(registry.Resolve("javascript").name, "node");
  EXPECT_EQ(util::ErrorOf([&]() { registry.Resolve("bash"); }),
            util::NameOf(util::ErrorKind::UNSUPPORTED_LANGUAGE));
  EXPECT_EQ(util::ErrorOf([&]() { language::Registry::Builtin({"cobol"}); }),
            util::NameOf(util::ErrorKind::UNSUPPORTED_LANGUAGE));
}

// NOLINTNEXTLINE
TEST(RegistryTest, DuplicateRegistration) {
  language::Registry registry;
  registry.Register("ruby", {"rb"}, nullptr);
  EXPECT_NE(util::ErrorOf([&]() { registry.Register("RB", {}, nullptr); }),
            "no error");
  EXPECT_NE(util::ErrorOf([&]() {
              registry.Register("crystal", {"ruby"}, nullptr);
            }),
            "no error");
  EXPECT_EQ(registry.Resolve("RUBY").name, "ruby");
}

}  // namespace

#include "util/which.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/sandbox_broker_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) saved_path_ = path;
  }
  void TearDown() override { setenv("PATH", saved_path_.c_str(), 1); }

 private:
  std::string saved_path_;
};

// NOLINTNEXTLINE
TEST_F(WhichTest, FindsFirstMatch) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/interp");
  createExecutable(tmpdir2.Path() + "/interp");
  createExecutable(tmpdir2.Path() + "/compiler");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("interp", false), tmpdir1.Path() + "/interp");
  EXPECT_EQ(util::which("compiler", false), tmpdir2.Path() + "/compiler");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, IgnoresNonExecutables) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  { std::ofstream os(tmpdir.Path() + "/plain"); }
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("plain", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, EmptyPath) {
  unsetenv("PATH");
  EXPECT_EQ(util::which("sh", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, UsesCache) {
  std::string path;
  {
    util::TempDir tmpdir(test_tmpdir + "/which");
    createExecutable(tmpdir.Path() + "/cached-tool");
    setenv("PATH", tmpdir.Path().c_str(), 1);
    path = util::which("cached-tool");
    EXPECT_EQ(path, tmpdir.Path() + "/cached-tool");
  }
  EXPECT_EQ(util::which("cached-tool"), path);
  EXPECT_EQ(util::which("cached-tool", false), "");
}

}  // namespace

#include "util/which.hpp"

#include <stdlib.h>
#include <sys/stat.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using namespace util;

TEST(WhichTest, TestFindsSh) {
  std::string sh = which("sh");
  EXPECT_FALSE(sh.empty());
  EXPECT_EQ(sh[0], '/');
}

TEST(WhichTest, TestMissingCommand) {
  EXPECT_EQ(which("codebox-no-such-command"), "");
  EXPECT_EQ(which(""), "");
}

TEST(WhichTest, TestPath) {
  EXPECT_EQ(which("/bin/sh"), "/bin/sh");
  EXPECT_EQ(which("/nonexistent-codebox-dir/sh"), "");
  // Directories are not executables.
  EXPECT_EQ(which("/tmp"), "");
}

TEST(WhichTest, TestReadsPathOnEachCall) {
  TempDir tmp("/tmp");
  std::string tool = File::JoinPath(tmp.Path(), "codebox-test-tool");
  File::Write(tool, "#!/bin/sh\n");
  ASSERT_EQ(chmod(tool.c_str(), 0755), 0);
  EXPECT_EQ(which("codebox-test-tool", false), "");

  std::string old_path = getenv("PATH");
  setenv("PATH", (tmp.Path() + ":" + old_path).c_str(), 1);
  EXPECT_EQ(which("codebox-test-tool", false), tool);
  setenv("PATH", old_path.c_str(), 1);
}

}  // namespace

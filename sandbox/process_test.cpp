#include "sandbox/process.hpp"

#include <chrono>
#include <fstream>
#include <string>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/which.hpp"

namespace {

using ::testing::StartsWith;

using namespace sandbox;

ProcessOptions Shell(const std::string& script) {
  ProcessOptions options("/tmp", "/bin/sh");
  options.args = {"-c", script};
  return options;
}

// A zombie waiting for its (non-reaping) parent counts as dead.
bool IsAlive(int pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line)) return false;
  size_t pos = line.rfind(')');
  if (pos == std::string::npos || pos + 2 >= line.size()) return false;
  return line[pos + 2] != 'Z' && line[pos + 2] != 'X';
}

TEST(ProcessTest, TestNoDir) {
  ProcessOptions options("/nonexistent-codebox-dir", "/bin/sh");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_FALSE(process.Run(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

TEST(ProcessTest, TestNoFile) {
  ProcessOptions options("/tmp", "/nonexistent-codebox-dir/foo");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_FALSE(process.Run(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST(ProcessTest, TestExitCode) {
  ProcessOptions options = Shell("exit 15");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.timed_out);
  EXPECT_FALSE(info.cancelled);
}

TEST(ProcessTest, TestSignal) {
  ProcessOptions options = Shell("kill -ABRT $$");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
}

TEST(ProcessTest, TestOutputs) {
  ProcessOptions options = Shell("echo out; echo err >&2; pwd; cat");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.stdout_data, "out\n/tmp\n");
  EXPECT_EQ(info.stderr_data, "err\n");
  EXPECT_FALSE(info.stdout_truncated);
  EXPECT_FALSE(info.stderr_truncated);
}

TEST(ProcessTest, TestEnvironment) {
  ProcessOptions options = Shell("echo $CODEBOX_TEST_VAR");
  options.env.push_back("CODEBOX_TEST_VAR=42");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.stdout_data, "42\n");
}

TEST(ProcessTest, TestTruncation) {
  // 1000 bytes on stdout.
  ProcessOptions options = Shell(
      "i=0; while [ $i -lt 100 ]; do printf 0123456789; i=$((i+1)); done; "
      "echo err >&2");
  options.max_output_bytes = 100;
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.stdout_data.size(), 100u);
  EXPECT_THAT(info.stdout_data, StartsWith("0123456789"));
  EXPECT_TRUE(info.stdout_truncated);
  EXPECT_EQ(info.stderr_data, "err\n");
  EXPECT_FALSE(info.stderr_truncated);
  EXPECT_EQ(info.status_code, 0);
}

TEST(ProcessTest, TestOutputAtLimitIsNotTruncated) {
  ProcessOptions options = Shell("printf 0123456789");
  options.max_output_bytes = 10;
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.stdout_data, "0123456789");
  EXPECT_FALSE(info.stdout_truncated);
}

TEST(ProcessTest, TestTimeout) {
  ProcessOptions options = Shell("sleep 30");
  options.wall_limit_millis = 200;
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  EXPECT_FALSE(info.cancelled);
  EXPECT_EQ(info.signal, 9);
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LT(info.wall_time_millis, 5000);
}

TEST(ProcessTest, TestTimeoutKillsDescendants) {
  ProcessOptions options = Shell("sleep 30 & echo $!; sleep 30");
  options.wall_limit_millis = 300;
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  int pid = std::stoi(info.stdout_data);
  EXPECT_FALSE(IsAlive(pid));
}

TEST(ProcessTest, TestExitKillsDescendants) {
  ProcessOptions options = Shell("sleep 30 >/dev/null 2>&1 & echo $!");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_FALSE(info.timed_out);
  EXPECT_EQ(info.status_code, 0);
  int pid = std::stoi(info.stdout_data);
  EXPECT_FALSE(IsAlive(pid));
}

TEST(ProcessTest, TestNewSessionDoesNotEscape) {
  if (util::which("setsid").empty()) GTEST_SKIP() << "setsid not installed";
  ProcessOptions options = Shell(
      "setsid sh -c 'echo $$; exec sleep 30' >&2 & sleep 0.5; echo done");
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.stdout_data, "done\n");
  int pid = std::stoi(info.stderr_data);
  EXPECT_FALSE(IsAlive(pid));
}

TEST(ProcessTest, TestTimeoutKillsNewSession) {
  if (util::which("setsid").empty()) GTEST_SKIP() << "setsid not installed";
  ProcessOptions options =
      Shell("setsid sh -c 'echo $$; exec sleep 30' & sleep 30");
  options.wall_limit_millis = 500;
  ProcessInfo info;
  std::string error_msg;
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  EXPECT_TRUE(info.timed_out);
  EXPECT_LT(info.wall_time_millis, 5000);
  int pid = std::stoi(info.stdout_data);
  EXPECT_FALSE(IsAlive(pid));
}

TEST(ProcessTest, TestCancel) {
  CancellationToken token;
  ProcessOptions options = Shell("sleep 30");
  options.cancel = &token;
  ProcessInfo info;
  std::string error_msg;
  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.Cancel();
  });
  Process process;
  EXPECT_TRUE(process.Run(options, &info, &error_msg));
  canceller.join();
  EXPECT_TRUE(info.cancelled);
  EXPECT_FALSE(info.timed_out);
  EXPECT_LT(info.wall_time_millis, 5000);
}

TEST(ProcessTest, TestResultOfExit) {
  ProcessInfo info;
  info.status_code = 3;
  info.stdout_data = "out";
  ExecutionResult result = ToExecutionResult(info);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.stdout_data, "out");
  EXPECT_EQ(result.stderr_data, "");
  EXPECT_EQ(result.meta["timed_out"], "false");
  EXPECT_EQ(result.meta["truncated"], "false");
  EXPECT_EQ(result.meta.count("signal"), 0);
  EXPECT_FALSE(result.TimedOut());
}

TEST(ProcessTest, TestResultOfSignal) {
  ProcessInfo info;
  info.signal = 11;
  ExecutionResult result = ToExecutionResult(info);
  EXPECT_EQ(result.exit_code, 139);
  EXPECT_EQ(result.meta.count("signal"), 1);
}

TEST(ProcessTest, TestResultOfTimeout) {
  ProcessInfo info;
  info.signal = 9;
  info.timed_out = true;
  info.stdout_data = "partial";
  ExecutionResult result = ToExecutionResult(info);
  EXPECT_EQ(result.exit_code, kTimeoutExitCode);
  EXPECT_TRUE(result.TimedOut());
  EXPECT_EQ(result.stdout_data, "partial");
  EXPECT_EQ(result.meta["timed_out"], "true");
  EXPECT_EQ(result.meta.count("signal"), 0);
}

TEST(ProcessTest, TestResultOfCancel) {
  ProcessInfo info;
  info.signal = 9;
  info.cancelled = true;
  ExecutionResult result = ToExecutionResult(info);
  EXPECT_EQ(result.exit_code, kCancelledExitCode);
  EXPECT_TRUE(result.Cancelled());
  EXPECT_EQ(result.meta["cancelled"], "true");
}

TEST(ProcessTest, TestResultOfTruncation) {
  ProcessInfo info;
  info.stderr_data = "abc";
  info.stderr_truncated = true;
  ExecutionResult result = ToExecutionResult(info);
  EXPECT_EQ(result.stderr_data, std::string("abc") + kTruncationMarker);
  EXPECT_EQ(result.meta["stderr_truncated"], "true");
  EXPECT_EQ(result.meta["stdout_truncated"], "false");
  EXPECT_TRUE(result.Truncated());
}

}  // namespace

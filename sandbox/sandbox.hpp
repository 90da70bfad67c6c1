#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "sandbox/config.hpp"
#include "util/file.hpp"

namespace sandbox {

// Exit code reported when the payload was killed for exceeding its timeout.
static const constexpr int kTimeoutExitCode = -1;
// Exit code reported when the payload was killed because the caller cancelled
// the execution.
static const constexpr int kCancelledExitCode = -2;
// Exit codes of payloads killed by a signal are 128 + signal number, so a
// SIGKILL (as sent by the OOM killer) is 137.
static const constexpr int kSignalExitCodeBase = 128;
static const constexpr int kOomExitCode = kSignalExitCodeBase + 9;

// Appended to stdout or stderr when they were cut at the output limit.
static const constexpr char* kTruncationMarker = "\n[... output truncated]\n";

// The sandbox mechanism itself failed: the backend could not be reached, a
// binary is missing, the scratch directory could not be created... Never
// raised because of what the executed code did.
class infrastructure_error : public std::runtime_error {
 public:
  explicit infrastructure_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Allows a caller to abort an execution that is still running. The process
// or container is killed within a few milliseconds of Cancel being called.
class CancellationToken {
 public:
  void Cancel() { cancelled_ = true; }
  bool IsCancelled() const { return cancelled_; }

 private:
  std::atomic<bool> cancelled_{false};
};

// Code to run in the sandbox.
struct ExecutionRequest {
  std::string code;
  // Must be one of the keys of SandboxConfig::languages.
  std::string language;
  // Wall-clock limit, must be positive.
  int timeout_sec = 0;
  // Optional.
  std::shared_ptr<const CancellationToken> cancel;

  ExecutionRequest(std::string code, std::string language, int timeout_sec)
      : code(std::move(code)),
        language(std::move(language)),
        timeout_sec(timeout_sec) {}
};

// Outcome of an execution. Whatever the code did, this is what is returned.
struct ExecutionResult {
  int exit_code = 0;
  std::string stdout_data;
  std::string stderr_data;
  // Seconds.
  double duration = 0;
  // Backend-specific details; "backend", "timed_out", "truncated",
  // "stdout_truncated" and "stderr_truncated" are always set.
  std::map<std::string, std::string> meta;

  bool TimedOut() const { return exit_code == kTimeoutExitCode; }
  bool Cancelled() const { return exit_code == kCancelledExitCode; }
  bool Truncated() const {
    auto it = meta.find("truncated");
    return it != meta.end() && it->second == "true";
  }
};

// Sandbox interface. Implementations receive their configuration when they
// are constructed and keep no state between executions, so a single instance
// can serve concurrent calls to Execute.
// Implementations are usually obtained through SandboxFactory.
class Sandbox {
 public:
  // Runs the code in the request and returns the outcome. Throws
  // std::invalid_argument if the request is malformed and
  // infrastructure_error if the backend cannot run anything; any failure of
  // the code itself is reported in the result.
  ExecutionResult Execute(const ExecutionRequest& request);

  // A string that identifies the backend.
  virtual std::string Name() const = 0;

  const SandboxConfig& Config() const { return config_; }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  explicit Sandbox(SandboxConfig config) : config_(std::move(config)) {}
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

 protected:
  // Called with a validated request and its resolved interpreter.
  virtual ExecutionResult ExecuteInternal(const ExecutionRequest& request,
                                          const Interpreter& interpreter) = 0;

  // Creates a new scratch directory and writes the code in it. Throws
  // infrastructure_error on failure.
  util::TempDir PrepareScratchDir(const ExecutionRequest& request,
                                  const Interpreter& interpreter) const;

  // Maximum size of each output stream, in bytes.
  size_t MaxOutputBytes() const {
    return static_cast<size_t>(config_.max_output_kb) * 1024;
  }

 private:
  const SandboxConfig config_;
};

}  // namespace sandbox

#endif

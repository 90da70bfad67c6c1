#ifndef SANDBOX_PROCESS_HPP
#define SANDBOX_PROCESS_HPP

#include <signal.h>
#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Settings to run a program.
struct ProcessOptions {
  // Optional values
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  // Maximum number of bytes kept from stdout and stderr, each.
  size_t max_output_bytes = 0;
  std::vector<std::string> args;
  // VAR=value entries added to (or replacing the ones of) the environment of
  // the current process.
  std::vector<std::string> env;
  const CancellationToken* cancel = nullptr;

  // Required values
  std::string root;
  // Must be a path, it is not looked up in PATH.
  std::string executable;
  ProcessOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ProcessInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  // Largest resident set of the program and its descendants.
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The process was killed because of the wall time limit.
  bool timed_out = false;
  // The process was killed because the execution was cancelled.
  bool cancelled = false;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Runs a program under a supervisor process. The supervisor starts a new
// session, becomes the reaper of every orphaned descendant, runs the program
// as its child and reports its exit status. As soon as the program terminates,
// or is told to stop, the supervisor kills and reaps all the processes left
// behind, including the ones that started their own session, and exits.
// stdin is /dev/null, stdout and stderr are captured through pipes.
// A Process object can only be used for a single run; create one per
// execution.
class Process {
 public:
  // Runs the program and waits for it and all its descendants to terminate,
  // killing them if the program exceeds the wall time limit or the execution
  // is cancelled.
  // Returns true if the program was started, and sets fields in info.
  // Otherwise, returns false and sets error_msg.
  bool Run(const ProcessOptions& options, ProcessInfo* info,
           std::string* error_msg);

  Process() = default;
  ~Process();
  Process(const Process&) = delete;
  Process(Process&&) = delete;
  Process& operator=(const Process&) = delete;
  Process& operator=(Process&&) = delete;

 private:
  // Output stream of the child being collected.
  struct Stream {
    int* fd;
    std::string* data;
    bool* truncated;
  };

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates the supervisor and saves its PID in child_pid_. The supervisor
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the supervisor. Must not use dynamic memory
  // allocation.
  [[noreturn]] void Child();

  // Main loop of the supervisor, once the program is started.
  [[noreturn]] void Supervise(pid_t program, const sigset_t& signals);

  // Waits for the termination of the supervisor, collecting the output and
  // the exit status of the program and possibly stopping it.
  bool Wait(ProcessInfo* info, std::string* error_msg);

  // Reads whatever is available on the streams, waiting at most
  // timeout_millis for something to happen.
  void Collect(Stream* streams, size_t num_streams, int timeout_millis);

  // Asks the supervisor to kill everything. The supervisor cannot be reaped
  // by anyone else, so its PID is always valid here.
  void Terminate();

  static void CloseFd(int* fd);

  const ProcessOptions* options_ = nullptr;
  int error_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  // Carries the wait status of the program from the supervisor.
  int status_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  bool reaped_ = false;
  bool terminated_ = false;
  std::chrono::steady_clock::time_point start_;

  // Arguments and environment of the child, prepared before forking.
  std::vector<std::vector<char>> storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

// Converts the outcome of a run into the result of an execution: exit code
// (or sentinel), outputs with truncation markers, and the matching "meta"
// entries. The duration is left to the caller.
ExecutionResult ToExecutionResult(const ProcessInfo& info);

}  // namespace sandbox

#endif

#include "sandbox/process.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <thread>

#include "glog/logging.h"

extern char** environ;

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

const constexpr size_t kStrErrorBufSize = 2048;
const constexpr size_t kReadBufSize = 64 * 1024;
// Maximum number of reads from a single stream in one Collect call, so that a
// program flooding its output cannot delay the time limit checks.
const constexpr int kMaxReadsPerCollect = 16;
// Length of a slice of the supervising loops.
const constexpr int kPollMillis = 10;
// Output is still collected for this long after the supervisor terminated.
const constexpr int64_t kDrainMillis = 500;
// Time the supervisor has to kill everything before being killed itself.
const constexpr int64_t kSupervisorGraceMillis = 5000;

// Async-signal-safe, used in the child.
void WriteAll(int fd, const char* data, size_t len) {
  while (len > 0) {
    ssize_t written = write(fd, data, len);
    if (written == -1 && errno == EINTR) continue;
    if (written <= 0) return;
    data += written;
    len -= written;
  }
}

// Returns the parent of the process whose PID is the given string, or -1.
// Async-signal-safe.
pid_t ParentOf(const char* pid) {
  char path[64] = "/proc/";
  strncat(path, pid, 32);
  strncat(path, "/stat", 6);
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  char buf[512];
  ssize_t len = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (len <= 0) return -1;
  buf[len] = 0;
  // "pid (comm) state ppid ...", comm can contain parentheses.
  const char* end = strrchr(buf, ')');
  if (end == nullptr || end[1] != ' ' || end[2] == 0 || end[3] != ' ') {
    return -1;
  }
  pid_t ppid = 0;
  for (const char* c = end + 4; *c >= '0' && *c <= '9'; c++) {
    ppid = ppid * 10 + (*c - '0');
  }
  return ppid;
}

// Sends SIGKILL to every child of the calling process. Async-signal-safe,
// used by the supervisor. Only the caller can reap its children, so their
// PIDs cannot be reused before they are killed.
void KillChildren() {
  pid_t self = getpid();
  int dir = open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir == -1) return;
  alignas(struct dirent64) char buf[4096];
  ssize_t len = 0;
  while ((len = getdents64(dir, buf, sizeof(buf))) > 0) {
    for (ssize_t pos = 0; pos < len;) {
      const auto* entry = reinterpret_cast<const struct dirent64*>(buf + pos);
      pos += entry->d_reclen;
      pid_t pid = 0;
      const char* c = entry->d_name;
      for (; *c >= '0' && *c <= '9'; c++) pid = pid * 10 + (*c - '0');
      if (pid == 0 || *c != 0) continue;
      if (ParentOf(entry->d_name) == self) kill(pid, SIGKILL);
    }
  }
  close(dir);
}

void Append(const char* buf, size_t len, size_t max, std::string* data,
            bool* truncated) {
  size_t keep = len;
  if (max != 0) {
    keep = std::min(len, max > data->size() ? max - data->size() : 0);
  }
  data->append(buf, keep);
  if (keep < len) *truncated = true;
}

std::string EnvName(const std::string& entry) {
  return entry.substr(0, entry.find('='));
}
}  // namespace

namespace sandbox {

Process::~Process() {
  if (child_pid_ > 0 && !reaped_) {
    Terminate();
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
  }
  for (int* fds : {error_fds_, stdout_fds_, stderr_fds_, status_fds_}) {
    CloseFd(&fds[0]);
    CloseFd(&fds[1]);
  }
}

void Process::CloseFd(int* fd) {
  if (*fd == -1) return;
  close(*fd);
  *fd = -1;
}

bool Process::Run(const ProcessOptions& options, ProcessInfo* info,
                  std::string* error_msg) {
  CHECK(options_ == nullptr) << "A Process can only be run once";
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  return Wait(info, error_msg);
}

bool Process::Setup(std::string* error_msg) {
  // Prepare args and environment, the child cannot allocate memory.
  auto add = [this](const std::string& s) {
    storage_.emplace_back(s.begin(), s.end());
    storage_.back().push_back(0);
  };
  add(options_->executable);
  for (const std::string& arg : options_->args) add(arg);
  size_t num_args = storage_.size();
  for (char** var = environ; var != nullptr && *var != nullptr; var++) {
    std::string entry = *var;
    std::string name = EnvName(entry);
    bool overridden =
        std::any_of(options_->env.begin(), options_->env.end(),
                    [&name](const std::string& e) { return EnvName(e) == name; });
    if (!overridden) add(entry);
  }
  for (const std::string& entry : options_->env) add(entry);
  for (size_t i = 0; i < storage_.size(); i++) {
    (i < num_args ? argv_ : envp_).push_back(storage_[i].data());
  }
  argv_.push_back(nullptr);
  envp_.push_back(nullptr);

  // All the pipes are close-on-exec, so that children started concurrently by
  // other threads do not keep them open.
  char buf[kStrErrorBufSize] = {};
  for (int* fds : {error_fds_, stdout_fds_, stderr_fds_, status_fds_}) {
    if (pipe2(fds, O_CLOEXEC) == -1) {
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  return true;
}

bool Process::DoFork(std::string* error_msg) {
  start_ = std::chrono::steady_clock::now();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Process::Child() {
  // The supervisor handles these itself; the program gets the original mask
  // back.
  sigset_t signals;
  sigset_t old_mask;
  sigemptyset(&signals);
  sigaddset(&signals, SIGCHLD);
  sigaddset(&signals, SIGTERM);
  sigprocmask(SIG_BLOCK, &signals, &old_mask);

  close(error_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  close(status_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    WriteAll(error_fds_[1], reinterpret_cast<const char*>(&len), sizeof(len));
    WriteAll(error_fds_[1], buf, len);
    close(error_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Clean up if the thread that started us goes away.
  if (prctl(PR_SET_PDEATHSIG, SIGTERM) == -1) die("prctl", errno);

  // New session, so that we do not receive Ctrl-Cs from the terminal.
  if (setsid() == -1) die("setsid", errno);

  // Orphaned descendants are reparented to us instead of init, even if they
  // started their own session, so that they can be found and killed.
  if (prctl(PR_SET_CHILD_SUBREAPER, 1) == -1) die("prctl", errno);

  int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);

  // Handle I/O redirection.
#define DUP(fd, target)                          \
  if (dup2(fd, target) == -1) {                  \
    die("redir " #target, errno);                \
  }
  DUP(stdin_fd, STDIN_FILENO);
  DUP(stdout_fds_[1], STDOUT_FILENO);
  DUP(stderr_fds_[1], STDERR_FILENO);
#undef DUP

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  pid_t program = fork();
  if (program == -1) die("fork", errno);
  if (program == 0) {
    close(status_fds_[1]);
    sigprocmask(SIG_SETMASK, &old_mask, nullptr);
    int count = 0;
    do {
      execve(options_->executable.c_str(), argv_.data(), envp_.data());
      usleep(100);
      // We try at most 16 times to avoid livelocks.
    } while (errno == ETXTBSY && count++ < 16);
    die("exec", errno);
    // [[noreturn]] does not work on lambdas...
    _Exit(1);
  }

  // Only the program and its descendants may keep the pipes open.
  close(error_fds_[1]);
  close(stdout_fds_[1]);
  close(stderr_fds_[1]);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);
  Supervise(program, signals);
}

void Process::Supervise(pid_t program, const sigset_t& signals) {
  bool program_done = false;
  bool terminate = false;
  while (true) {
    int status = 0;
    pid_t pid = 0;
    while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
      if (pid != program) continue;
      WriteAll(status_fds_[1], reinterpret_cast<const char*>(&status),
               sizeof(status));
      close(status_fds_[1]);
      program_done = true;
    }
    // Nothing is left.
    if (pid == -1 && errno == ECHILD) _Exit(0);
    // Children of killed processes become our children, and are killed in
    // the next rounds.
    if (program_done || terminate) KillChildren();
    struct timespec tick = {0, kPollMillis * 1000 * 1000};
    if (sigtimedwait(&signals, nullptr, &tick) == SIGTERM) terminate = true;
  }
}

void Process::Terminate() {
  if (child_pid_ <= 0 || reaped_ || terminated_) return;
  terminated_ = true;
  if (kill(child_pid_, SIGTERM) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << child_pid_;
  }
}

void Process::Collect(Stream* streams, size_t num_streams,
                      int timeout_millis) {
  struct pollfd fds[2] = {};
  Stream* polled[2] = {};
  nfds_t nfds = 0;
  for (size_t i = 0; i < num_streams && nfds < 2; i++) {
    if (*streams[i].fd == -1) continue;
    fds[nfds].fd = *streams[i].fd;
    fds[nfds].events = POLLIN;
    polled[nfds++] = &streams[i];
  }
  if (nfds == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_millis));
    return;
  }
  if (poll(fds, nfds, timeout_millis) <= 0) return;

  char buf[kReadBufSize];
  for (nfds_t i = 0; i < nfds; i++) {
    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
    Stream* stream = polled[i];
    for (int reads = 0; reads < kMaxReadsPerCollect; reads++) {
      ssize_t amount = read(*stream->fd, buf, kReadBufSize);
      if (amount > 0) {
        Append(buf, amount, options_->max_output_bytes, stream->data,
               stream->truncated);
        continue;
      }
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
      // EOF or error: nothing more will come from this stream.
      CloseFd(stream->fd);
      break;
    }
  }
}

bool Process::Wait(ProcessInfo* info, std::string* error_msg) {
  CloseFd(&error_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
  CloseFd(&status_fds_[1]);

  // The error pipe is closed by exec, or receives the reason of a failure.
  int error_len = 0;
  ssize_t ret = 0;
  while ((ret = read(error_fds_[0], &error_len, sizeof(error_len))) == -1 &&
         errno == EINTR) {
  }
  if (ret == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    size_t len = std::min<size_t>(std::max(error_len, 0), PIPE_BUF - 1);
    ssize_t got = read(error_fds_[0], error, len);
    *error_msg = got > 0 ? std::string(error, got) : "exec: unknown error";
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
    return false;
  }
  CloseFd(&error_fds_[0]);

  for (int fd : {stdout_fds_[0], stderr_fds_[0], status_fds_[0]}) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "fcntl: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }

  auto elapsed_millis = [this]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start_)
        .count();
  };

  Stream streams[2] = {
      {&stdout_fds_[0], &info->stdout_data, &info->stdout_truncated},
      {&stderr_fds_[0], &info->stderr_data, &info->stderr_truncated}};
  auto streams_open = [&streams]() {
    return *streams[0].fd != -1 || *streams[1].fd != -1;
  };

  // Status of the program, as sent by the supervisor.
  int program_status = 0;
  bool status_known = false;
  int64_t exit_millis = -1;
  auto read_status = [&]() {
    ssize_t got = read(status_fds_[0], &program_status, sizeof(program_status));
    if (got == -1) return;
    // Nothing is sent if the supervisor itself was killed.
    status_known = got == sizeof(program_status);
    exit_millis = elapsed_millis();
    CloseFd(&status_fds_[0]);
  };

  int supervisor_status = 0;
  struct rusage rusage {};
  int64_t reaped_millis = 0;
  // When the supervisor started killing everything.
  int64_t stop_millis = -1;
  bool force_killed = false;

  while (true) {
    if (status_fds_[0] != -1) read_status();
    if (!reaped_) {
      pid_t pid = wait4(child_pid_, &supervisor_status, WNOHANG, &rusage);
      if (pid == -1 && errno != EINTR) {
        char buf[kStrErrorBufSize] = {};
        *error_msg = "wait4: ";
        *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
        return false;
      }
      if (pid == child_pid_) {
        reaped_ = true;
        reaped_millis = elapsed_millis();
        continue;
      }
      if (exit_millis < 0 && !terminated_) {
        bool timed_out = options_->wall_limit_millis != 0 &&
                         elapsed_millis() >= options_->wall_limit_millis;
        bool cancelled =
            options_->cancel != nullptr && options_->cancel->IsCancelled();
        if (timed_out || cancelled) {
          info->timed_out = timed_out;
          info->cancelled = !timed_out;
          Terminate();
        }
      }
      if (stop_millis < 0 && (terminated_ || exit_millis >= 0)) {
        stop_millis = elapsed_millis();
      }
      if (stop_millis >= 0 && !force_killed &&
          elapsed_millis() - stop_millis >= kSupervisorGraceMillis) {
        LOG(ERROR) << "The supervisor of " << options_->executable
                   << " is not terminating, some processes may survive";
        if (kill(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
          PLOG(WARNING) << "kill " << child_pid_;
        }
        force_killed = true;
      }
    } else if (!streams_open() ||
               elapsed_millis() - reaped_millis >= kDrainMillis) {
      break;
    }
    Collect(streams, 2, kPollMillis);
  }
  // The status may have been sent right before the supervisor exited.
  if (status_fds_[0] != -1) read_status();
  if (streams_open()) {
    LOG(WARNING) << "Some process still holds the output of "
                 << options_->executable << ", output may be incomplete";
  }
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stderr_fds_[0]);

  int status = program_status;
  if (!status_known) {
    LOG(WARNING) << "The supervisor of " << options_->executable
                 << " died before the program";
    status = supervisor_status;
  }
  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  info->wall_time_millis = exit_millis >= 0 ? exit_millis : reaped_millis;
  // The supervisor usage includes the one of every process it reaped.
  info->cpu_time_millis = static_cast<int64_t>(rusage.ru_utime.tv_sec) * 1000 +
                          rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis = static_cast<int64_t>(rusage.ru_stime.tv_sec) * 1000 +
                          rusage.ru_stime.tv_usec / 1000;
  return true;
}

ExecutionResult ToExecutionResult(const ProcessInfo& info) {
  ExecutionResult result;
  if (info.timed_out) {
    result.exit_code = kTimeoutExitCode;
  } else if (info.cancelled) {
    result.exit_code = kCancelledExitCode;
  } else if (info.signal != 0) {
    result.exit_code = kSignalExitCodeBase + info.signal;
  } else {
    result.exit_code = info.status_code;
  }
  result.stdout_data = info.stdout_data;
  if (info.stdout_truncated) result.stdout_data += kTruncationMarker;
  result.stderr_data = info.stderr_data;
  if (info.stderr_truncated) result.stderr_data += kTruncationMarker;

  auto flag = [](bool value) { return value ? "true" : "false"; };
  result.meta["timed_out"] = flag(info.timed_out);
  result.meta["stdout_truncated"] = flag(info.stdout_truncated);
  result.meta["stderr_truncated"] = flag(info.stderr_truncated);
  result.meta["truncated"] = flag(info.stdout_truncated || info.stderr_truncated);
  if (info.cancelled) result.meta["cancelled"] = "true";
  if (info.signal != 0 && !info.timed_out && !info.cancelled) {
    result.meta["signal"] = strsignal(info.signal);
  }
  return result;
}

}  // namespace sandbox

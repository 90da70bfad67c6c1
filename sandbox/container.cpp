#include "sandbox/container.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/which.hpp"

namespace {
// Limits for the client invocations that do not run the code.
const constexpr int64_t kInspectTimeoutMillis = 10 * 1000;
const constexpr int64_t kRemoveTimeoutMillis = 30 * 1000;
const constexpr size_t kClientOutputBytes = 64 * 1024;

const constexpr char* kLabel = "codebox.sandbox=1";
const constexpr int kNobody = 65534;

std::atomic<uint64_t> container_counter{0};

// Unique among the containers created by every process on this host.
std::string ContainerName(const std::string& scratch_dir) {
  std::string suffix = scratch_dir.substr(scratch_dir.find_last_of('-') + 1);
  return absl::StrCat("codebox-", getpid(), "-", container_counter++, "-",
                      suffix);
}

std::string ClientError(const sandbox::ProcessInfo& info) {
  std::string message(absl::StripAsciiWhitespace(info.stderr_data));
  if (message.empty()) message = absl::StrCat("exit code ", info.status_code);
  return message;
}
}  // namespace

namespace sandbox {

std::string ContainerSandbox::User() const {
  if (!Config().container.user.empty()) return Config().container.user;
  if (getuid() == 0) return absl::StrCat(kNobody, ":", kNobody);
  return absl::StrCat(getuid(), ":", getgid());
}

std::vector<std::string> ContainerSandbox::CreateArgs(
    const std::string& name, const std::string& host_dir,
    const Interpreter& interpreter) const {
  const ContainerConfig& config = Config().container;
  std::vector<std::string> args = {"create", "--name", name, "--label",
                                   kLabel};
  args.push_back("--read-only");
  args.push_back("--tmpfs");
  args.push_back("/tmp:rw,nosuid,nodev,size=64m");
  if (!config.network_enabled) {
    args.push_back("--network");
    args.push_back("none");
  }
  args.push_back("--cpus");
  args.push_back(absl::StrFormat("%.2f", config.cpu_limit));
  // Same value for memory and memory+swap: no swap.
  args.push_back("--memory");
  args.push_back(absl::StrCat(config.memory_limit_mb, "m"));
  args.push_back("--memory-swap");
  args.push_back(absl::StrCat(config.memory_limit_mb, "m"));
  if (config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(config.pids_limit));
  }
  args.push_back("--cap-drop");
  args.push_back("ALL");
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");
  args.push_back("--user");
  args.push_back(User());
  args.push_back("--env");
  args.push_back("HOME=" + config.workdir);
  args.push_back("--env");
  args.push_back("TMPDIR=/tmp");
  args.push_back("--volume");
  args.push_back(absl::StrCat(host_dir, ":", config.workdir, ":rw"));
  args.push_back("--workdir");
  args.push_back(config.workdir);
  args.push_back(config.image);
  args.push_back(interpreter.command);
  args.push_back(interpreter.file_name);
  return args;
}

bool ContainerSandbox::RunClient(const std::string& client,
                                 const std::vector<std::string>& args,
                                 int64_t wall_limit_millis,
                                 size_t max_output_bytes,
                                 const CancellationToken* cancel,
                                 ProcessInfo* info,
                                 std::string* error_msg) const {
  VLOG(1) << "Running " << client << " " << absl::StrJoin(args, " ");
  ProcessOptions options("/", client);
  options.args = args;
  options.wall_limit_millis = std::max<int64_t>(wall_limit_millis, 1);
  options.max_output_bytes = max_output_bytes;
  options.cancel = cancel;
  Process process;
  return process.Run(options, info, error_msg);
}

ContainerSandbox::ContainerGuard::~ContainerGuard() {
  if (!removed_) Remove();
}

void ContainerSandbox::ContainerGuard::Remove() {
  removed_ = true;
  ProcessInfo info;
  std::string error_msg;
  if (!sandbox_->RunClient(client_, {"rm", "--force", "--volumes", name_},
                           kRemoveTimeoutMillis, kClientOutputBytes, nullptr,
                           &info, &error_msg)) {
    LOG(ERROR) << "Unable to remove container " << name_ << ": " << error_msg;
    return;
  }
  if (info.timed_out) {
    LOG(ERROR) << "Timed out removing container " << name_;
  } else if (info.status_code != 0 &&
             !absl::StrContains(info.stderr_data, "No such container")) {
    LOG(ERROR) << "Unable to remove container " << name_ << ": "
               << ClientError(info);
  }
}

ExecutionResult ContainerSandbox::ExecuteInternal(
    const ExecutionRequest& request, const Interpreter& interpreter) {
  // Everything, including pulling the image, must fit in the timeout.
  auto start = std::chrono::steady_clock::now();
  const int64_t budget_millis = request.timeout_sec * 1000LL;
  auto remaining_millis = [&start, budget_millis]() {
    return budget_millis -
           std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
               .count();
  };
  const CancellationToken* cancel = request.cancel.get();

  const ContainerConfig& config = Config().container;
  std::string client = util::which(config.docker_binary);
  if (client.empty()) {
    throw infrastructure_error(absl::StrCat("Container runtime client ",
                                            config.docker_binary,
                                            " not found"));
  }

  util::TempDir scratch = PrepareScratchDir(request, interpreter);
  if (User() != absl::StrCat(getuid(), ":", getgid())) {
    try {
      util::File::MakeWorldWritable(scratch.Path());
    } catch (const std::system_error& exc) {
      throw infrastructure_error(exc.what());
    }
  }

  const std::string name = ContainerName(scratch.Path());
  ContainerGuard guard(this, client, name);
  std::string error_msg;

  // The container could not be started in time: report what happened to the
  // setup step, without its output.
  auto interrupted = [&](ProcessInfo info) {
    info.stdout_data.clear();
    info.stderr_data.clear();
    guard.Remove();
    ExecutionResult result = ToExecutionResult(info);
    result.meta["container_id"] = name;
    result.meta["image"] = config.image;
    result.meta["oom_killed"] = "false";
    return result;
  };

  ProcessInfo create_info;
  if (!RunClient(client, CreateArgs(name, scratch.Path(), interpreter),
                 remaining_millis(), kClientOutputBytes, cancel, &create_info,
                 &error_msg)) {
    throw infrastructure_error(
        absl::StrCat("Unable to run ", client, ": ", error_msg));
  }
  if (create_info.cancelled) {
    LOG(WARNING) << "Execution cancelled while creating container " << name;
    return interrupted(create_info);
  }
  if (create_info.timed_out) {
    LOG(WARNING) << "Container " << name << " not ready in time, is the image "
                 << config.image << " being pulled?";
    return interrupted(create_info);
  }
  if (create_info.status_code != 0 || create_info.signal != 0) {
    throw infrastructure_error(absl::StrCat(
        "Unable to create the container: ", ClientError(create_info)));
  }
  std::string container_id(absl::StripAsciiWhitespace(create_info.stdout_data));
  if (remaining_millis() <= 0) {
    ProcessInfo info;
    info.timed_out = true;
    return interrupted(info);
  }

  ProcessInfo run_info;
  if (!RunClient(client, {"start", "--attach", name}, remaining_millis(),
                 MaxOutputBytes(), cancel, &run_info, &error_msg)) {
    throw infrastructure_error(
        absl::StrCat("Unable to run ", client, ": ", error_msg));
  }
  ExecutionResult result = ToExecutionResult(run_info);
  result.meta["container_id"] = container_id.empty() ? name : container_id;
  result.meta["image"] = config.image;
  result.meta["oom_killed"] = "false";
  if (run_info.timed_out || run_info.cancelled) {
    // The client is dead but the container may still be running; removing it
    // stops it.
    guard.Remove();
    return result;
  }
  // The client exit code mixes its own errors with the ones of the container,
  // the state of the container tells them apart.
  ProcessInfo inspect_info;
  if (!RunClient(client,
                 {"inspect", "--format",
                  "{{.State.OOMKilled}} {{.State.ExitCode}} {{.State.Error}}",
                  name},
                 kInspectTimeoutMillis, kClientOutputBytes, nullptr,
                 &inspect_info, &error_msg)) {
    throw infrastructure_error(
        absl::StrCat("Unable to run ", client, ": ", error_msg));
  }
  guard.Remove();
  if (inspect_info.timed_out || inspect_info.status_code != 0) {
    throw infrastructure_error(absl::StrCat(
        "Unable to inspect the container: ", ClientError(inspect_info)));
  }
  std::vector<std::string> state = absl::StrSplit(
      absl::StripAsciiWhitespace(inspect_info.stdout_data),
      absl::MaxSplits(' ', 2));
  int exit_code = 0;
  if (state.size() < 2 || !absl::SimpleAtoi(state[1], &exit_code)) {
    throw infrastructure_error(absl::StrCat("Unexpected container state: ",
                                            inspect_info.stdout_data));
  }
  if (state.size() == 3 && !state[2].empty()) {
    throw infrastructure_error(
        absl::StrCat("Unable to start the container: ", state[2]));
  }
  // A signal received by the client says nothing about the container.
  result.meta.erase("signal");
  if (state[0] == "true") {
    LOG(WARNING) << "Container " << name << " killed for exceeding "
                 << config.memory_limit_mb << "MiB of memory";
    result.exit_code = kOomExitCode;
    result.meta["oom_killed"] = "true";
  } else {
    result.exit_code = exit_code;
  }
  return result;
}

}  // namespace sandbox

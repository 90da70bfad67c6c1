#include "sandbox/local.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sandbox/process.hpp"
#include "util/which.hpp"

namespace sandbox {

ExecutionResult LocalSandbox::ExecuteInternal(const ExecutionRequest& request,
                                              const Interpreter& interpreter) {
  std::string executable = util::which(interpreter.command);
  if (executable.empty()) {
    throw infrastructure_error(absl::StrCat(
        "Interpreter ", interpreter.command, " for ", request.language,
        " not found"));
  }
  util::TempDir scratch = PrepareScratchDir(request, interpreter);

  ProcessOptions options(scratch.Path(), executable);
  options.args.push_back(interpreter.file_name);
  options.env.push_back("HOME=" + scratch.Path());
  options.env.push_back("TMPDIR=" + scratch.Path());
  options.wall_limit_millis = request.timeout_sec * 1000LL;
  options.memory_limit_kb = Config().local_memory_limit_mb * 1024LL;
  options.max_output_bytes = MaxOutputBytes();
  options.cancel = request.cancel.get();

  Process process;
  ProcessInfo info;
  std::string error_msg;
  if (!process.Run(options, &info, &error_msg)) {
    throw infrastructure_error(
        absl::StrCat("Unable to run ", executable, ": ", error_msg));
  }
  VLOG(1) << executable << " used " << info.cpu_time_millis << "ms of cpu, "
          << info.memory_usage_kb << "KiB of memory";

  ExecutionResult result = ToExecutionResult(info);
  result.meta["cpu_time_ms"] =
      std::to_string(info.cpu_time_millis + info.sys_time_millis);
  result.meta["memory_kb"] = std::to_string(info.memory_usage_kb);
  return result;
}

}  // namespace sandbox

#include "sandbox/sandbox.hpp"

#include <chrono>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace sandbox {

ExecutionResult Sandbox::Execute(const ExecutionRequest& request) {
  if (request.code.empty()) {
    throw std::invalid_argument("No code to execute");
  }
  if (request.timeout_sec <= 0) {
    throw std::invalid_argument(absl::StrCat(
        "Invalid timeout ", request.timeout_sec, ", must be positive"));
  }
  const Interpreter* interpreter = config_.FindInterpreter(request.language);
  if (interpreter == nullptr) {
    throw std::invalid_argument(
        absl::StrCat("Unsupported language \"", request.language, "\""));
  }

  LOG(INFO) << "Executing " << request.code.size() << " bytes of "
            << request.language << " code with the " << Name()
            << " backend, timeout " << request.timeout_sec << "s";
  auto start = std::chrono::steady_clock::now();
  ExecutionResult result = ExecuteInternal(request, *interpreter);
  result.duration = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - start)
                        .count();
  result.meta["backend"] = Name();

  if (result.TimedOut()) {
    LOG(WARNING) << "Execution killed after " << request.timeout_sec
                 << "s timeout";
  } else if (result.Cancelled()) {
    LOG(WARNING) << "Execution cancelled after " << result.duration << "s";
  }
  if (result.Truncated()) {
    LOG(WARNING) << "Output truncated at " << config_.max_output_kb << " KiB";
  }
  LOG(INFO) << "Execution finished with exit code " << result.exit_code
            << " in " << result.duration << "s";
  return result;
}

util::TempDir Sandbox::PrepareScratchDir(const ExecutionRequest& request,
                                         const Interpreter& interpreter) const {
  try {
    util::TempDir scratch(config_.scratch_root, "codebox-");
    util::File::Write(
        util::File::JoinPath(scratch.Path(), interpreter.file_name),
        request.code);
    return scratch;
  } catch (const std::system_error& exc) {
    throw infrastructure_error(
        absl::StrCat("Unable to prepare the scratch directory: ", exc.what()));
  }
}

}  // namespace sandbox

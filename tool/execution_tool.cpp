#include "tool/execution_tool.hpp"

#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"

namespace {
std::string MetaValue(const sandbox::ExecutionResult& result,
                      const std::string& key) {
  auto it = result.meta.find(key);
  return it == result.meta.end() ? "" : it->second;
}

void AppendStream(const std::string& name, const std::string& data,
                  std::string* text) {
  absl::StrAppend(text, "--- ", name, " ---\n");
  if (data.empty()) {
    absl::StrAppend(text, "(empty)\n");
    return;
  }
  absl::StrAppend(text, data);
  if (data.back() != '\n') absl::StrAppend(text, "\n");
}
}  // namespace

namespace tool {

absl::optional<int> TimeoutArgument(int seconds) {
  if (seconds == 0) return absl::nullopt;
  return seconds;
}

ToolResponse ExecutionTool::Execute(
    const std::string& code, const std::string& language,
    absl::optional<int> timeout_sec,
    std::shared_ptr<const sandbox::CancellationToken> cancel) const {
  ToolResponse response;
  int timeout = timeout_sec.value_or(sandbox_->Config().default_timeout_sec);
  sandbox::ExecutionRequest request(code, language, timeout);
  request.cancel = std::move(cancel);
  try {
    response.text = Format(sandbox_->Execute(request), timeout);
  } catch (const sandbox::infrastructure_error& exc) {
    LOG(ERROR) << "Sandbox failure: " << exc.what();
    response.is_error = true;
    response.text = absl::StrCat("Sandbox error: ", exc.what());
  } catch (const sandbox::config_error& exc) {
    LOG(ERROR) << "Sandbox misconfigured: " << exc.what();
    response.is_error = true;
    response.text = absl::StrCat("Sandbox configuration error: ", exc.what());
  } catch (const std::invalid_argument& exc) {
    response.is_error = true;
    response.text = absl::StrCat("Invalid request: ", exc.what());
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Unexpected sandbox failure: " << exc.what();
    response.is_error = true;
    response.text = absl::StrCat("Internal sandbox error: ", exc.what());
  }
  return response;
}

std::string ExecutionTool::Format(const sandbox::ExecutionResult& result,
                                  int timeout_sec) {
  std::string text;
  if (result.TimedOut()) {
    absl::StrAppend(&text, "Exit code: ", result.exit_code, " (timed out after ",
                    timeout_sec, "s, execution killed)\n");
  } else if (result.Cancelled()) {
    absl::StrAppend(&text, "Exit code: ", result.exit_code,
                    " (cancelled, execution killed)\n");
  } else if (MetaValue(result, "oom_killed") == "true") {
    absl::StrAppend(&text, "Exit code: ", result.exit_code,
                    " (killed: out of memory)\n");
  } else if (!MetaValue(result, "signal").empty()) {
    absl::StrAppend(&text, "Exit code: ", result.exit_code, " (",
                    MetaValue(result, "signal"), ")\n");
  } else {
    absl::StrAppend(&text, "Exit code: ", result.exit_code, "\n");
  }
  absl::StrAppend(&text, absl::StrFormat("Duration: %.2fs\n", result.duration));
  absl::StrAppend(&text, "Backend: ", MetaValue(result, "backend"), "\n");
  for (const char* stream : {"stdout", "stderr"}) {
    if (MetaValue(result, absl::StrCat(stream, "_truncated")) == "true") {
      absl::StrAppend(&text, "Note: ", stream, " was truncated\n");
    }
  }
  AppendStream("stdout", result.stdout_data, &text);
  AppendStream("stderr", result.stderr_data, &text);
  return text;
}

}  // namespace tool

#ifndef TOOL_EXECUTION_TOOL_HPP
#define TOOL_EXECUTION_TOOL_HPP

#include <memory>
#include <string>

#include "absl/types/optional.h"
#include "sandbox/sandbox.hpp"

namespace tool {

// What is handed back to the agent.
struct ToolResponse {
  // True if the code could not be run at all; text then explains why.
  bool is_error = false;
  std::string text;
};

// Converts a timeout given on the command line, where 0 stands for the
// configured default. Other values are passed on as they are, so that invalid
// ones are rejected with the request.
absl::optional<int> TimeoutArgument(int seconds);

// Exposes a sandbox to an agent as execute(code, language, timeout), with
// plain text answers. Never throws: sandbox failures become short
// diagnostics, failures of the code are rendered with its output.
class ExecutionTool {
 public:
  explicit ExecutionTool(std::shared_ptr<sandbox::Sandbox> sandbox)
      : sandbox_(std::move(sandbox)) {}

  // Runs the code, with the configured default timeout if none is given.
  ToolResponse Execute(
      const std::string& code, const std::string& language,
      absl::optional<int> timeout_sec = absl::nullopt,
      std::shared_ptr<const sandbox::CancellationToken> cancel = nullptr) const;

  // Renders the result of an execution that had the given timeout.
  static std::string Format(const sandbox::ExecutionResult& result,
                            int timeout_sec);

 private:
  std::shared_ptr<sandbox::Sandbox> sandbox_;
};

}  // namespace tool

#endif

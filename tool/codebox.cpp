#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "sandbox/config.hpp"
#include "sandbox/sandbox_factory.hpp"
#include "tool/execution_tool.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(code_file, "",
              "File with the code to execute, the standard input if empty");
DEFINE_string(language, "python", "Language of the code");
DEFINE_int32(timeout, 0,
             "Timeout of the execution in seconds, 0 means --default_timeout");

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs untrusted code in a sandbox.\nUsage: " +
                          std::string(argv[0]) + " [--code_file=FILE]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::string code;
  try {
    if (FLAGS_code_file.empty()) {
      code.assign(std::istreambuf_iterator<char>(std::cin),
                  std::istreambuf_iterator<char>());
    } else {
      code = util::File::Read(FLAGS_code_file);
    }
  } catch (const std::system_error& exc) {
    std::cerr << "Cannot read " << FLAGS_code_file << ": " << exc.what()
              << std::endl;
    return 1;
  }

  std::shared_ptr<sandbox::Sandbox> sandbox;
  try {
    sandbox = sandbox::SandboxFactory::Get(sandbox::SandboxConfig::FromFlags());
  } catch (const sandbox::config_error& exc) {
    std::cerr << "Invalid configuration: " << exc.what() << std::endl;
    return 1;
  }

  tool::ExecutionTool execution_tool(sandbox);
  tool::ToolResponse response = execution_tool.Execute(
      code, FLAGS_language, tool::TimeoutArgument(FLAGS_timeout));
  std::cout << response.text;
  if (!response.text.empty() && response.text.back() != '\n')
    std::cout << std::endl;
  return response.is_error ? 1 : 0;
}

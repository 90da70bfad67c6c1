#ifndef SANDBOX_CONFIG_HPP
#define SANDBOX_CONFIG_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace sandbox {

// The configuration is invalid: unknown backend, non-positive limits...
class config_error : public std::runtime_error {
 public:
  explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Smallest cpu limit of a container, in cores.
static const constexpr double kMinCpuLimit = 0.01;

// How to run the code of a given language.
struct Interpreter {
  // Name (looked up in PATH) or path of the interpreter.
  std::string command;
  // Name of the file, inside the scratch directory, the code is written to.
  // The interpreter is invoked with it as the only argument.
  std::string file_name;
};

// Settings of the container backend.
struct ContainerConfig {
  std::string image = "python:3.12-slim";
  bool network_enabled = false;
  // Number of cores, may be fractional but not below kMinCpuLimit.
  double cpu_limit = 0.5;
  int32_t memory_limit_mb = 256;
  // uid:gid inside the container. If empty, the uid:gid of the current
  // process, or nobody (65534:65534) if the current process is root.
  std::string user;
  // 0 means no limit.
  int32_t pids_limit = 64;
  std::string docker_binary = "docker";
  // Where the scratch directory is mounted inside the container.
  std::string workdir = "/workspace";
};

// Settings shared by all the backends. Values are never modified after a
// sandbox has been created with them.
struct SandboxConfig {
  std::string backend = "local";
  int32_t default_timeout_sec = 30;
  int32_t max_output_kb = 10;
  // Where scratch directories are created.
  std::string scratch_root = "/tmp";
  std::map<std::string, Interpreter> languages = {
      {"python", {"python3", "main.py"}}};
  // Address space limit of the local backend, 0 means no limit.
  int32_t local_memory_limit_mb = 0;
  ContainerConfig container;

  // Builds the configuration from the command line flags (and so from the
  // environment variables that provide their defaults). Throws config_error
  // if the language list cannot be parsed.
  static SandboxConfig FromFlags();

  // Parses a comma-separated list of language=command:file_name entries.
  // The :file_name part is optional and defaults to "main".
  static std::map<std::string, Interpreter> ParseLanguages(
      const std::string& list);

  // Throws config_error if some value is out of range.
  void Validate() const;

  // Returns nullptr if the language is not configured.
  const Interpreter* FindInterpreter(const std::string& language) const;
};

}  // namespace sandbox

#endif

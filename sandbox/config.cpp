#include "sandbox/config.hpp"

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "util/flags.hpp"

namespace sandbox {

SandboxConfig SandboxConfig::FromFlags() {
  SandboxConfig config;
  config.backend = FLAGS_backend;
  config.default_timeout_sec = FLAGS_default_timeout;
  config.max_output_kb = FLAGS_max_output_kb;
  config.scratch_root = FLAGS_temp_directory;
  config.languages = ParseLanguages(FLAGS_languages);
  config.local_memory_limit_mb = FLAGS_local_memory_limit_mb;

  config.container.image = FLAGS_container_image;
  config.container.network_enabled = FLAGS_container_network;
  config.container.cpu_limit = FLAGS_container_cpus;
  config.container.memory_limit_mb = FLAGS_container_memory_mb;
  config.container.user = FLAGS_container_user;
  config.container.pids_limit = FLAGS_container_pids_limit;
  config.container.docker_binary = FLAGS_docker_binary;
  return config;
}

std::map<std::string, Interpreter> SandboxConfig::ParseLanguages(
    const std::string& list) {
  std::map<std::string, Interpreter> languages;
  for (absl::string_view entry : absl::StrSplit(list, ',', absl::SkipEmpty())) {
    entry = absl::StripAsciiWhitespace(entry);
    if (entry.empty()) continue;
    std::vector<absl::string_view> parts = absl::StrSplit(entry, '=');
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
      throw config_error(absl::StrCat("Invalid language entry \"", entry,
                                      "\", expected language=command"));
    }
    std::vector<std::string> command = absl::StrSplit(parts[1], ':');
    if (command.size() > 2 || command[0].empty()) {
      throw config_error(absl::StrCat("Invalid interpreter \"", parts[1],
                                      "\" for language ", parts[0]));
    }
    Interpreter interpreter;
    interpreter.command = command[0];
    interpreter.file_name = command.size() == 2 ? command[1] : "main";
    if (interpreter.file_name.empty() ||
        interpreter.file_name.find('/') != std::string::npos ||
        interpreter.file_name == "." || interpreter.file_name == "..") {
      throw config_error(absl::StrCat("Invalid file name \"",
                                      interpreter.file_name,
                                      "\" for language ", parts[0]));
    }
    if (!languages.emplace(std::string(parts[0]), interpreter).second) {
      throw config_error(
          absl::StrCat("Language ", parts[0], " specified more than once"));
    }
  }
  return languages;
}

void SandboxConfig::Validate() const {
  if (default_timeout_sec <= 0) {
    throw config_error(absl::StrCat("Invalid default timeout ",
                                    default_timeout_sec, ", must be positive"));
  }
  if (max_output_kb <= 0) {
    throw config_error(absl::StrCat("Invalid output limit ", max_output_kb,
                                    " KiB, must be positive"));
  }
  if (scratch_root.empty()) {
    throw config_error("No directory given for the scratch directories");
  }
  if (languages.empty()) throw config_error("No language configured");
  if (local_memory_limit_mb < 0) {
    throw config_error(absl::StrCat("Invalid local memory limit ",
                                    local_memory_limit_mb, " MiB"));
  }
  if (container.image.empty()) throw config_error("No container image given");
  if (container.cpu_limit < kMinCpuLimit) {
    throw config_error(absl::StrCat("Invalid container cpu limit ",
                                    container.cpu_limit, ", must be at least ",
                                    kMinCpuLimit));
  }
  if (container.memory_limit_mb <= 0) {
    throw config_error(absl::StrCat("Invalid container memory limit ",
                                    container.memory_limit_mb,
                                    " MiB, must be positive"));
  }
  if (container.pids_limit < 0) {
    throw config_error(absl::StrCat("Invalid container pids limit ",
                                    container.pids_limit));
  }
  if (container.docker_binary.empty()) {
    throw config_error("No container runtime client given");
  }
  if (container.workdir.empty() || container.workdir[0] != '/') {
    throw config_error(absl::StrCat("Invalid container working directory \"",
                                    container.workdir,
                                    "\", must be an absolute path"));
  }
}

const Interpreter* SandboxConfig::FindInterpreter(
    const std::string& language) const {
  auto it = languages.find(language);
  if (it == languages.end()) return nullptr;
  return &it->second;
}

}  // namespace sandbox

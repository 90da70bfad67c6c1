#include "util/flags.hpp"

#include <cstdio>

#include "sandbox/config.hpp"

namespace {
bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) return true;
  fprintf(stderr, "Invalid value for --%s: %d, must be positive\n",  // NOLINT
          flagname, value);
  return false;
}

bool ValidateNonNegative(const char* flagname, int32_t value) {
  if (value >= 0) return true;
  fprintf(stderr, "Invalid value for --%s: %d, must not be negative\n",  // NOLINT
          flagname, value);
  return false;
}

bool ValidateCpus(const char* flagname, double value) {
  if (value >= sandbox::kMinCpuLimit) return true;
  fprintf(stderr, "Invalid value for --%s: %g, must be at least %g\n",  // NOLINT
          flagname, value, sandbox::kMinCpuLimit);
  return false;
}
}  // namespace

DEFINE_string(backend, gflags::StringFromEnv("SANDBOX_BACKEND", "local"),
              "Sandbox backend to use: local or container ($SANDBOX_BACKEND)");
DEFINE_int32(default_timeout, gflags::Int32FromEnv("SANDBOX_TIMEOUT", 30),
             "Wall-clock limit in seconds for executions that do not specify "
             "one ($SANDBOX_TIMEOUT)");
DEFINE_validator(default_timeout, &ValidatePositive);
DEFINE_int32(max_output_kb, gflags::Int32FromEnv("SANDBOX_MAX_OUTPUT_KB", 10),
             "Maximum size of stdout and stderr, each, in KiB "
             "($SANDBOX_MAX_OUTPUT_KB)");
DEFINE_validator(max_output_kb, &ValidatePositive);
DEFINE_string(temp_directory, gflags::StringFromEnv("SANDBOX_TEMP_DIR", "/tmp"),
              "Where the scratch directories should be created "
              "($SANDBOX_TEMP_DIR)");
DEFINE_string(languages,
              gflags::StringFromEnv("SANDBOX_LANGUAGES",
                                    "python=python3:main.py"),
              "Supported languages, as a comma-separated list of "
              "language=interpreter:file_name ($SANDBOX_LANGUAGES)");
DEFINE_int32(local_memory_limit_mb,
             gflags::Int32FromEnv("SANDBOX_LOCAL_MEMORY_LIMIT_MB", 0),
             "Address space limit for the local backend in MiB, 0 for no "
             "limit ($SANDBOX_LOCAL_MEMORY_LIMIT_MB)");
DEFINE_validator(local_memory_limit_mb, &ValidateNonNegative);

DEFINE_string(container_image,
              gflags::StringFromEnv("SANDBOX_DOCKER_IMAGE", "python:3.12-slim"),
              "Image used by the container backend ($SANDBOX_DOCKER_IMAGE)");
DEFINE_bool(container_network,
            gflags::BoolFromEnv("SANDBOX_NETWORK_ENABLED", false),
            "Whether containers get network access "
            "($SANDBOX_NETWORK_ENABLED)");
DEFINE_double(container_cpus, gflags::DoubleFromEnv("SANDBOX_CPU_LIMIT", 0.5),
              "CPU cores available to each container ($SANDBOX_CPU_LIMIT)");
DEFINE_validator(container_cpus, &ValidateCpus);
DEFINE_int32(container_memory_mb,
             gflags::Int32FromEnv("SANDBOX_MEMORY_LIMIT_MB", 256),
             "Memory limit of each container in MiB "
             "($SANDBOX_MEMORY_LIMIT_MB)");
DEFINE_validator(container_memory_mb, &ValidatePositive);
DEFINE_string(container_user, gflags::StringFromEnv("SANDBOX_CONTAINER_USER", ""),
              "uid:gid to run as inside the container; if empty, the current "
              "user, or nobody when running as root "
              "($SANDBOX_CONTAINER_USER)");
DEFINE_int32(container_pids_limit,
             gflags::Int32FromEnv("SANDBOX_PIDS_LIMIT", 64),
             "Maximum number of processes inside each container, 0 for no "
             "limit ($SANDBOX_PIDS_LIMIT)");
DEFINE_validator(container_pids_limit, &ValidateNonNegative);
DEFINE_string(docker_binary,
              gflags::StringFromEnv("SANDBOX_DOCKER_BINARY", "docker"),
              "Container runtime command line client ($SANDBOX_DOCKER_BINARY)");

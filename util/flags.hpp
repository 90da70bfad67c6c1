#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Every flag takes its default from the environment variable named in its
// description, so that the configuration can be set either way.

DECLARE_string(backend);
DECLARE_int32(default_timeout);
DECLARE_int32(max_output_kb);
DECLARE_string(temp_directory);
DECLARE_string(languages);
DECLARE_int32(local_memory_limit_mb);

// Container backend
DECLARE_string(container_image);
DECLARE_bool(container_network);
DECLARE_double(container_cpus);
DECLARE_int32(container_memory_mb);
DECLARE_string(container_user);
DECLARE_int32(container_pids_limit);
DECLARE_string(docker_binary);

#endif

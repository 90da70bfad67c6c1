#include "util/which.hpp"

#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
std::mutex cmd_cache_mutex;

bool is_executable(const std::string& path) {
  return access(path.c_str(), X_OK) == 0 && !util::File::Exists(path + "/.");
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }

  if (use_cache) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    auto it = cmd_cache.find(cmd);
    if (it != cmd_cache.end()) return it->second;
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  const std::vector<std::string> dirs =
      absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) {
      std::lock_guard<std::mutex> lck(cmd_cache_mutex);
      return cmd_cache[cmd] = fullpath;
    }
  }
  return "";
}

}  // namespace util

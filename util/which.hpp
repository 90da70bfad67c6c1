#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if
// the command cannot be found. Commands containing a slash are returned as-is
// when they point to an executable file.
// Found commands are cached, unless use_cache is false; any later request
// for the same command is answered from the cache even if the file has
// disappeared in the meantime. The cache is safe to use from many threads.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif

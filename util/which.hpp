#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if
// the command is not found in any of the directories in PATH. Throws if PATH
// is not set.
// Found commands are cached, unless the cache is explicitly disabled; a
// cached entry is returned even if the file has since disappeared.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif

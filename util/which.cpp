#include "util/which.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "util/file.hpp"

namespace {
absl::Mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache
    ABSL_GUARDED_BY(cache_mutex);
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  if (use_cache) {
    absl::MutexLock lock(&cache_mutex);
    auto it = cmd_cache.find(cmd);
    if (it != cmd_cache.end()) return it->second;
  }

  std::vector<std::string> dirs =
      absl::StrSplit(path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) {
      absl::MutexLock lock(&cache_mutex);
      cmd_cache[cmd] = fullpath;
      return fullpath;
    }
  }
  return "";
}

}  // namespace util

#include "util/random_id.hpp"

#include <cstdint>

#include "absl/random/random.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"

namespace util {

std::string RandomId() {
  static absl::Mutex mutex;
  static absl::BitGen* gen = new absl::BitGen();
  uint64_t high, low;
  {
    absl::MutexLock lock(&mutex);
    high = absl::Uniform<uint64_t>(*gen);
    low = absl::Uniform<uint64_t>(*gen);
  }
  return absl::StrFormat("%016x%016x", high, low);
}

}  // namespace util

#ifndef UTIL_RANDOM_ID_HPP
#define UTIL_RANDOM_ID_HPP

#include <string>

namespace util {

// Random identifier of 32 lowercase hexadecimal digits (128 bits), usable as
// a file name. Thread-safe.
std::string RandomId();

}  // namespace util

#endif

#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// named cmd found in the directories of $PATH, or an empty string.
// Positive lookups are cached unless use_cache is false.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif

#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// named cmd found in the directories listed in PATH, or an empty string.
// If cmd contains a slash it is returned as is when it is executable.
// Throws if PATH is not set.
std::string which(const std::string& cmd);

}  // namespace util

#endif

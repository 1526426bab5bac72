#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Returns true if s contains only whitespace characters.
bool isBlank(const std::string& s);

// Returns the last max_size bytes of s, prefixed by "..." if truncated.
std::string tail(const std::string& s, size_t max_size);

// Formats a duration in milliseconds as "123 ms" or "1.234 s".
std::string formatMillis(int64_t millis);

// Formats an amount of memory, e.g. "512 KiB" or "12.3 MiB".
std::string formatKb(int64_t kb);

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);
std::function<bool(kj::StringPtr)> setInt64(int64_t& var);

}  // namespace util
#endif

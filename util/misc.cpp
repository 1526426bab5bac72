#include "util/misc.hpp"

#include <cctype>
#include <cstdio>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

bool isBlank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

std::string tail(const std::string& s, size_t max_size) {
  if (s.size() <= max_size) return s;
  return "..." + s.substr(s.size() - max_size);
}

std::string formatMillis(int64_t millis) {
  if (millis < 1000) return std::to_string(millis) + " ms";
  char buf[32] = {};
  snprintf(buf, sizeof(buf), "%.3f s", millis / 1000.0);  // NOLINT
  return buf;
}

std::string formatKb(int64_t kb) {
  if (kb < 1024) return std::to_string(kb) + " KiB";
  char buf[32] = {};
  snprintf(buf, sizeof(buf), "%.1f MiB", kb / 1024.0);  // NOLINT
  return buf;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoi(std::string(p));
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt64(int64_t& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoll(std::string(p));
    return true;
  };
};

}  // namespace util

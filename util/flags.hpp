#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Execution backend
  static std::string python;
  static std::string temp_directory;
  static bool keep_sandboxes;
  static int64_t memory_limit_kb;

  // Validation
  static int64_t timeout_millis;
  static int64_t suite_timeout_millis;
  static bool stop_on_first_failure;

  // Output
  static bool json;
};

#endif

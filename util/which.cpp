#include "util/which.hpp"
#include <cstdlib>
#include <string>
#include <vector>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace util {

std::string which(const std::string& cmd) {
  if (cmd.find('/') != std::string::npos) {
    return File::IsExecutable(cmd) ? cmd : "";
  }
  const char* path = std::getenv("PATH");
  KJ_REQUIRE(path != nullptr, "PATH is not set");
  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::IsExecutable(fullpath)) return fullpath;
  }
  return "";
}

}  // namespace util

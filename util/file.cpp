#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  KJ_ASSERT(nftw(path.c_str(),
                 [](const char* fpath, const struct stat* /*sb*/,
                    int typeflags, struct FTW* /*ftwbuf*/) {
                   if (typeflags != FTW_F) return 0;
                   files.emplace_back(fpath);
                   return 0;
                 },
                 64, FTW_DEPTH | FTW_PHYS) != -1);
  std::vector<std::string> ret = std::move(files);
  files.clear();
  std::sort(ret.begin(), ret.end());
  return ret;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back('\0');
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

}  // namespace

namespace util {

std::vector<std::string> File::ListFiles(const std::string& path) {
  MakeDirs(path);
  return OsListFiles(path);
}

std::string File::Read(const std::string& path, int64_t limit) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[32 * 1024];
  while (static_cast<int64_t>(content.size()) < limit) {
    size_t to_read = std::min<int64_t>(sizeof(buf), limit - content.size());
    ssize_t amount = read(fd, buf, to_read);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    content.append(buf, amount);
  }
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  if (!overwrite && Exists(path)) {
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  MakeDirs(BaseDir(path));
  std::string temp_file;
  kj::AutoCloseFd fd = OsTempFile(path, &temp_file);
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      OsRemove(temp_file);
      throw std::system_error(error, std::system_category(),
                              "write " + temp_file);
    }
    pos += written;
  }
  if (rename(temp_file.c_str(), path.c_str()) == -1) {
    int error = errno;
    OsRemove(temp_file);
    throw std::system_error(error, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (keep_ || moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    KJ_LOG(WARNING, "Could not remove temporary directory", path_, e.what());
  }
}

}  // namespace util

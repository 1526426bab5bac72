#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <kj/common.h>

namespace util {

// Files larger than this are never loaded in memory.
static const constexpr int64_t kMaxReadSize = 64 * 1024 * 1024;

class File {
 public:
  // Lists all the files in a directory.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Reads the whole file specified by path. At most limit bytes are read.
  static std::string Read(const std::string& path,
                          int64_t limit = kMaxReadSize);

  // Writes content to the file specified by path. The file is first written
  // to a temporary file in the same folder and then moved in place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path is a regular file that the current user can execute.
  static bool IsExecutable(const std::string& path);
};

class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    moved_ = other.moved_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif

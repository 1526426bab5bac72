#include "util/file.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::IsEmpty;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAreArray;

const std::string test_tmpdir = "/tmp/codecheck_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * ListFiles
 */

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  std::string testdir = makeTestDir("list_files");
  std::vector<std::string> files;
  for (auto name : {"file42", "file12", "file68"}) {
    files.push_back(testdir + "/" + name);
  }

  for (const auto& file : files) {
    writeFile(file, "fooo");
  }
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(files, UnorderedElementsAreArray(foundFiles));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  std::string testdir = makeTestDir("list_files");
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(foundFiles, IsEmpty());
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(100 * 1024 + 1, 'x');
  writeFile(filepath, content);
  EXPECT_EQ(util::File::Read(filepath), content);
}

// NOLINTNEXTLINE
TEST(File, ReadLimit) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "0123456789");
  EXPECT_EQ(util::File::Read(filepath, 4), "0123");
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), std::system_error);  // NOLINT
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content = "wowowow\n";
  util::File::Write(filepath, content);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesDirs) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/a/b/file";
  util::File::Write(filepath, "x");
  ASSERT_EQ("x", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"alsdasdl"};
  writeFile(filepath, "this should not be here");
  util::File::Write(filepath, content);
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteExistsNotOk) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content{"this should stay here"};
  writeFile(filepath, content);
  EXPECT_THROW(util::File::Write(filepath, "nope", false),  // NOLINT
               std::system_error);
  ASSERT_EQ(content, readFile(filepath));
}

/*
 * MakeDirs
 */

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("make_dirs");
  std::string path = testdir + "/a/b/c";
  util::File::MakeDirs(path);
  EXPECT_TRUE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(File, MakeDirsCannot) {
  std::string testdir = makeTestDir("make_dirs");
  writeFile(testdir + "/file", "");
  EXPECT_THROW(util::File::MakeDirs(testdir + "/file/dir"),  // NOLINT
               std::system_error);
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
  EXPECT_EQ(util::File::JoinPath("a", ""), "a");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/tmp/dir/file.py"), "/tmp/dir");
  EXPECT_EQ(util::File::BaseName("/tmp/dir/file.py"), "file.py");
  EXPECT_EQ(util::File::BaseDir("file.py"), "");
  EXPECT_EQ(util::File::BaseName("file.py"), "file.py");
}

// NOLINTNEXTLINE
TEST(File, SizeAndExists) {
  std::string testdir = makeTestDir("size");
  writeFile(testdir + "/file", "12345");
  EXPECT_EQ(util::File::Size(testdir + "/file"), 5);
  EXPECT_TRUE(util::File::Exists(testdir + "/file"));
  EXPECT_LT(util::File::Size(testdir + "/nope"), 0);
  EXPECT_FALSE(util::File::Exists(testdir + "/nope"));
}

// NOLINTNEXTLINE
TEST(File, IsExecutable) {
  std::string testdir = makeTestDir("executable");
  writeFile(testdir + "/script", "#!/bin/sh\n");
  EXPECT_FALSE(util::File::IsExecutable(testdir + "/script"));
  chmod((testdir + "/script").c_str(), S_IRWXU);
  EXPECT_TRUE(util::File::IsExecutable(testdir + "/script"));
  EXPECT_FALSE(util::File::IsExecutable(testdir));
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(File, TempDirIsRemoved) {
  std::string testdir = makeTestDir("temp_dir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(testdir + "/"));
    writeFile(path + "/file", "content");
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(File, TempDirKeep) {
  std::string testdir = makeTestDir("temp_dir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(File, TempDirMove) {
  std::string testdir = makeTestDir("temp_dir");
  std::string path;
  {
    util::TempDir outer(testdir);
    path = outer.Path();
    {
      util::TempDir inner(std::move(outer));
      EXPECT_EQ(inner.Path(), path);
      EXPECT_TRUE(dirExists(path));
    }
    EXPECT_FALSE(dirExists(path));
  }
}

}  // namespace

#include "util/file.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <dirent.h>

namespace {

using ::testing::ElementsAre;

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> names;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return names;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") names.push_back(name);
  }
  closedir(dir);
  return names;
}

// NOLINTNEXTLINE
TEST(File, WriteThenRead) {
  util::TempDir dir("/tmp");
  std::string path = util::File::JoinPath(dir.Path(), "a/b/out.csv");
  util::File::Write(path, "id,answer\n");
  EXPECT_EQ(util::File::Read(path), "id,answer\n");
  EXPECT_EQ(util::File::Size(path), 10);
  util::File::Write(path, "id,answer\np1,4\n");
  EXPECT_EQ(util::File::Read(path), "id,answer\np1,4\n");
}

// NOLINTNEXTLINE
TEST(File, WriteLeavesNoTemporaryFiles) {
  util::TempDir dir("/tmp");
  std::string path = util::File::JoinPath(dir.Path(), "out.csv");
  util::File::Write(path, "x");
  EXPECT_THAT(ListDir(dir.Path()), ElementsAre("out.csv"));
}

// NOLINTNEXTLINE
TEST(File, FailedWriteLeavesNoTemporaryFiles) {
  util::TempDir dir("/tmp");
  std::string path = util::File::JoinPath(dir.Path(), "out.csv");
  util::File::MakeDirs(util::File::JoinPath(path, "busy"));
  EXPECT_THROW(util::File::Write(path, "x"), std::system_error);
  EXPECT_THAT(ListDir(dir.Path()), ElementsAre("out.csv"));
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  EXPECT_THROW(util::File::Read("/nonexistent/file"), util::file_not_found);
  EXPECT_LT(util::File::Size("/nonexistent/file"), 0);
}

// NOLINTNEXTLINE
TEST(File, Paths) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b");
  EXPECT_EQ(util::File::BaseDir("c"), "");
}

// NOLINTNEXTLINE
TEST(File, TempDirRemoved) {
  std::string removed;
  {
    util::TempDir dir("/tmp");
    removed = dir.Path();
    util::File::Write(util::File::JoinPath(removed, "a/f"), "x");
  }
  EXPECT_LT(util::File::Size(util::File::JoinPath(removed, "a/f")), 0);
  EXPECT_EQ(opendir(removed.c_str()), nullptr);
}

}  // namespace

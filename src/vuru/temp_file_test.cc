// SPDX-License-Identifier: MIT
#include "vuru/temp_file.hh"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace {

std::string Slurp(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST(TempFileTest, HoldsContentUntilDestroyed) {
  fs::path path;
  {
    auto file = vuru::TempFile::Create("foo.new", "A\nC\n");
    ASSERT_TRUE(file.ok()) << file.status();

    path = (*file)->path();
    EXPECT_TRUE(fs::is_regular_file(path));
    EXPECT_EQ(Slurp(path), "A\nC\n");
    EXPECT_NE(path.filename().string().find("foo.new"), std::string::npos);
  }

  EXPECT_FALSE(fs::exists(path));
}

TEST(TempFileTest, NamesAreUnique) {
  auto a = vuru::TempFile::Create("foo", "");
  auto b = vuru::TempFile::Create("foo", "");
  ASSERT_TRUE(a.ok()) << a.status();
  ASSERT_TRUE(b.ok()) << b.status();

  EXPECT_NE((*a)->path(), (*b)->path());
  EXPECT_EQ(fs::file_size((*a)->path()), 0u);
}

TEST(TempFileTest, FailsInMissingDirectory) {
  const char* saved = getenv("TMPDIR");
  std::string restore = saved ? saved : "";

  setenv("TMPDIR", "/nonexistent/vuru-test", 1);
  auto file = vuru::TempFile::Create("foo", "bar");
  if (saved) {
    setenv("TMPDIR", restore.c_str(), 1);
  } else {
    unsetenv("TMPDIR");
  }

  EXPECT_FALSE(file.ok());
}

}  // namespace

/***
 * Name: test_fs
 * Purpose: ReadFile/ReadStream/WriteFile success and failure reporting.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "jflow/support/fs.h"

namespace fs = std::filesystem;

TEST(Fs, WriteThenReadKeepsBytes) {
  const auto path = (fs::temp_directory_path() / "jflow_fs_roundtrip.java").string();
  const std::string data = "class A {\r\n}\n";
  std::string err;
  ASSERT_TRUE(jflow::support::WriteFile(path, data, err)) << err;
  std::string back;
  ASSERT_TRUE(jflow::support::ReadFile(path, back, err)) << err;
  EXPECT_EQ(back, data);
  fs::remove(path);
}

TEST(Fs, ReadMissingFileReportsPath) {
  std::string out;
  std::string err;
  EXPECT_FALSE(jflow::support::ReadFile("/nonexistent/jflow/none.java", out, err));
  EXPECT_NE(err.find("/nonexistent/jflow/none.java"), std::string::npos);
}

TEST(Fs, WriteIntoMissingDirectoryFails) {
  std::string err;
  EXPECT_FALSE(jflow::support::WriteFile("/nonexistent/jflow/out.mmd", "x", err));
  EXPECT_NE(err.find("failed to open file for write"), std::string::npos);
  EXPECT_NE(err.find("no directory '/nonexistent/jflow'"), std::string::npos);
}

TEST(Fs, ReadDirectoryIsRejected) {
  std::string out;
  std::string err;
  const auto dir = fs::temp_directory_path().string();
  EXPECT_FALSE(jflow::support::ReadFile(dir, out, err));
  EXPECT_NE(err.find("is a directory"), std::string::npos);
}

TEST(Fs, ReadStreamDrainsEverything) {
  std::istringstream in("class A {}\n");
  std::string out;
  std::string err;
  ASSERT_TRUE(jflow::support::ReadStream(in, "<stdin>", out, err)) << err;
  EXPECT_EQ(out, "class A {}\n");
}

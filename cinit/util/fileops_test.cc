// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cinit/util/fileops.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "cinit/testing.h"
#include "cinit/util/file_helpers.h"
#include "cinit/util/status_matchers.h"

namespace cinit::file_util {
namespace {

using ::cinit::IsOk;
using ::testing::Eq;
using ::testing::Ge;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::SizeIs;
using ::testing::StrEq;

class FileOpsTest : public testing::Test {
 protected:
  static void SetUpTestSuite() {
    ASSERT_THAT(chdir(GetTestTempPath().c_str()), Eq(0));
  }

  // Creates foo/bar/baz/quux plus a couple of regular files.
  static void SetupDirectory() {
    ASSERT_THAT(mkdir("foo", 0755), Eq(0));
    ASSERT_THAT(mkdir("foo/bar", 0755), Eq(0));
    ASSERT_THAT(mkdir("foo/bar/baz", 0755), Eq(0));
    ASSERT_THAT(file::SetContents("foo/bar/baz/quux", "x"), IsOk());
    ASSERT_THAT(file::SetContents("foo/top", "y"), IsOk());
  }
};

TEST_F(FileOpsTest, FDCloserTest) {
  int fds[2];
  ASSERT_THAT(pipe2(fds, O_CLOEXEC), Eq(0));
  {
    fileops::FDCloser read_end(fds[0]);
    fileops::FDCloser write_end(fds[1]);
    fileops::FDCloser moved(std::move(write_end));
    EXPECT_THAT(write_end.get(), Eq(-1));
    EXPECT_THAT(moved.get(), Eq(fds[1]));
  }
  EXPECT_THAT(fcntl(fds[0], F_GETFD), Eq(-1));
  EXPECT_THAT(fcntl(fds[1], F_GETFD), Eq(-1));
}

TEST_F(FileOpsTest, ExistsTest) {
  ASSERT_THAT(file::SetContents("exists_test", ""), IsOk());
  EXPECT_THAT(fileops::Exists("exists_test", false), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test", true), IsTrue());

  ASSERT_THAT(symlink("exists_test", "exists_test_link"), Eq(0));
  EXPECT_THAT(fileops::Exists("exists_test_link", false), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test_link", true), IsTrue());

  ASSERT_THAT(unlink("exists_test"), Eq(0));
  EXPECT_THAT(fileops::Exists("exists_test_link", false), IsTrue());
  EXPECT_THAT(fileops::Exists("exists_test_link", true), IsFalse());

  ASSERT_THAT(unlink("exists_test_link"), Eq(0));
  EXPECT_THAT(fileops::Exists("exists_test_link", false), IsFalse());
}

TEST_F(FileOpsTest, ListDirectoryEntriesFailTest) {
  std::vector<std::string> files;
  std::string error;

  EXPECT_THAT(fileops::ListDirectoryEntries("new_dir", &files, &error),
              IsFalse());
  EXPECT_THAT(files, IsEmpty());
  EXPECT_THAT(error, StrEq("opendir(new_dir): No such file or directory"));
}

TEST_F(FileOpsTest, ListDirectoryEntriesTest) {
  ASSERT_THAT(mkdir("new_dir", 0700), Eq(0));
  constexpr int kNumFiles = 10;
  for (int i = 0; i < kNumFiles; ++i) {
    ASSERT_THAT(file::SetContents(absl::StrCat("new_dir/file", i), ""),
                IsOk());
  }

  std::vector<std::string> files;
  std::string error;
  EXPECT_THAT(fileops::ListDirectoryEntries("new_dir", &files, &error),
              IsTrue());

  fileops::DeleteRecursively("new_dir");

  ASSERT_THAT(files, SizeIs(kNumFiles));
  std::sort(files.begin(), files.end());
  for (int i = 0; i < kNumFiles; ++i) {
    EXPECT_THAT(files[i], StrEq(absl::StrCat("file", i)));
  }
}

TEST_F(FileOpsTest, DeleteRecursivelyTest) {
  EXPECT_THAT(fileops::DeleteRecursively("foo"), IsTrue());
  EXPECT_THAT(fileops::DeleteRecursively("/not_there"), IsTrue());

  SetupDirectory();
  EXPECT_THAT(fileops::DeleteRecursively("foo/bar/baz/quux"), IsTrue());
  EXPECT_THAT(fileops::Exists("foo/bar/baz", false), IsTrue());

  EXPECT_THAT(fileops::DeleteRecursively("foo"), IsTrue());
  struct stat64 st;
  EXPECT_THAT(lstat64("foo", &st), Ne(0));
}

TEST_F(FileOpsTest, DeleteDirectoryContentsKeepsDirectory) {
  SetupDirectory();
  ASSERT_THAT(symlink("/", "foo/root_link"), Eq(0));

  std::string error;
  ASSERT_THAT(fileops::DeleteDirectoryContents("foo", &error), IsTrue())
      << error;

  EXPECT_THAT(fileops::Exists("foo", false), IsTrue());
  std::vector<std::string> files;
  ASSERT_THAT(fileops::ListDirectoryEntries("foo", &files, &error), IsTrue());
  EXPECT_THAT(files, IsEmpty());
  // The link target must be left alone.
  EXPECT_THAT(fileops::Exists("/", false), IsTrue());

  EXPECT_THAT(fileops::DeleteRecursively("foo"), IsTrue());
}

TEST_F(FileOpsTest, DeleteDirectoryContentsMissingDirectory) {
  std::string error;
  EXPECT_THAT(fileops::DeleteDirectoryContents("not_a_dir", &error),
              IsFalse());
  EXPECT_THAT(error, StrEq("opendir(not_a_dir): No such file or directory"));
}

TEST_F(FileOpsTest, CopyFDTest) {
  const std::string content(200000, 'z');
  ASSERT_THAT(file::SetContents("copy_src", content), IsOk());

  fileops::FDCloser in(open("copy_src", O_RDONLY | O_CLOEXEC));
  ASSERT_THAT(in.get(), Ge(0));
  fileops::FDCloser out(
      open("copy_dst", O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  ASSERT_THAT(out.get(), Ge(0));

  EXPECT_THAT(fileops::CopyFD(in.get(), out.get()), Eq(static_cast<ssize_t>(content.size())));
  out.Close();

  std::string copied;
  ASSERT_THAT(file::GetContents("copy_dst", &copied), IsOk());
  EXPECT_THAT(copied, StrEq(content));

  unlink("copy_src");
  unlink("copy_dst");
}

TEST_F(FileOpsTest, CopyFDFailsOnBadDescriptor) {
  EXPECT_THAT(fileops::CopyFD(-1, STDOUT_FILENO), Eq(-1));
  EXPECT_THAT(errno, Eq(EBADF));
}

}  // namespace
}  // namespace cinit::file_util

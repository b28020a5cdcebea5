// Copyright 2024 Google LLC
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

#include "cinit/handlers.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "cinit/comms.h"
#include "cinit/testing.h"
#include "cinit/util/file_helpers.h"
#include "cinit/util/fileops.h"
#include "cinit/util/status_matchers.h"
#include "cinit/wire.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::StrEq;

class HandlersTest : public testing::Test {
 protected:
  void SetUp() override {
    CINIT_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
    controller_ = std::move(pair.first);
    init_ = std::move(pair.second);
  }

  // Path of a fresh scratch file or directory for the current test.
  static std::string TestPath(absl::string_view name) {
    const testing::TestInfo* info =
        testing::UnitTest::GetInstance()->current_test_info();
    return GetTestTempPath(
        absl::StrCat(info->test_suite_name(), ".", info->name(), ".", name));
  }

  // Returns a read end of a pipe that yields content and then end of file.
  static FDCloser PipeWithContent(absl::string_view content) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
      ADD_FAILURE() << "pipe2() failed";
      return FDCloser();
    }
    FDCloser write_end(fds[1]);
    EXPECT_TRUE(file_util::fileops::WriteToFD(write_end.get(), content.data(),
                                              content.size()));
    return FDCloser(fds[0]);
  }

  ReceivedReply ReadReply() {
    absl::StatusOr<ReceivedReply> reply = RecvReply(controller_.get());
    EXPECT_THAT(reply, IsOk());
    return reply.ok() ? *std::move(reply) : ReceivedReply();
  }

  std::unique_ptr<Comms> controller_;
  std::unique_ptr<Comms> init_;
};

TEST_F(HandlersTest, PingRepliesSuccess) {
  ASSERT_THAT(HandlePing(init_.get()), IsOk());
  ReceivedReply reply = ReadReply();
  EXPECT_THAT(reply.reply.error(), IsEmpty());
  EXPECT_THAT(reply.fds, IsEmpty());
}

TEST_F(HandlersTest, CopyInWritesFile) {
  const std::string path = TestPath("copy");
  std::vector<FDCloser> fds;
  fds.push_back(PipeWithContent("hello, sandbox"));
  ASSERT_THAT(HandleCopyIn(init_.get(), path, std::move(fds)), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), IsEmpty());

  std::string contents;
  ASSERT_THAT(file::GetContents(path, &contents), IsOk());
  EXPECT_THAT(contents, StrEq("hello, sandbox"));
}

TEST_F(HandlersTest, CopyInTruncatesExistingFile) {
  const std::string path = TestPath("copy");
  ASSERT_THAT(file::SetContents(path, "a much longer previous content"),
              IsOk());
  std::vector<FDCloser> fds;
  fds.push_back(PipeWithContent("short"));
  ASSERT_THAT(HandleCopyIn(init_.get(), path, std::move(fds)), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), IsEmpty());

  std::string contents;
  ASSERT_THAT(file::GetContents(path, &contents), IsOk());
  EXPECT_THAT(contents, StrEq("short"));
}

TEST_F(HandlersTest, CopyInWithoutDescriptorFails) {
  const std::string path = TestPath("copy");
  ASSERT_THAT(HandleCopyIn(init_.get(), path, {}), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), HasSubstr("exactly one descriptor"));
  EXPECT_THAT(file_util::fileops::Exists(path, false), IsFalse());
}

TEST_F(HandlersTest, CopyInWithTwoDescriptorsClosesBoth) {
  const std::string path = TestPath("copy");
  std::vector<FDCloser> fds;
  fds.push_back(PipeWithContent("one"));
  fds.push_back(PipeWithContent("two"));
  const int first = fds[0].get();
  const int second = fds[1].get();
  ASSERT_THAT(HandleCopyIn(init_.get(), path, std::move(fds)), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), HasSubstr("got 2"));
  EXPECT_THAT(file_util::fileops::Exists(path, false), IsFalse());
  EXPECT_THAT(fcntl(first, F_GETFD), Eq(-1));
  EXPECT_THAT(fcntl(second, F_GETFD), Eq(-1));
}

TEST_F(HandlersTest, CopyInToMissingDirectoryFails) {
  std::vector<FDCloser> fds;
  fds.push_back(PipeWithContent("data"));
  ASSERT_THAT(HandleCopyIn(init_.get(), TestPath("missing/file"),
                           std::move(fds)),
              IsOk());
  EXPECT_THAT(ReadReply().reply.error(), HasSubstr("open("));
}

TEST_F(HandlersTest, OpenSendsDescriptorAndReleasesLocalCopy) {
  const std::string path = TestPath("open");
  ASSERT_THAT(file::SetContents(path, "payload"), IsOk());

  const int open_before = CountOpenFDs();
  ASSERT_THAT(HandleOpen(init_.get(), path), IsOk());
  {
    ReceivedReply reply = ReadReply();
    EXPECT_THAT(reply.reply.error(), IsEmpty());
    ASSERT_THAT(reply.fds, SizeIs(1));
    char buffer[16] = {};
    EXPECT_THAT(read(reply.fds[0].get(), buffer, sizeof(buffer)), Eq(7));
    EXPECT_THAT(buffer, StrEq("payload"));
  }
  EXPECT_THAT(CountOpenFDs(), Eq(open_before));
}

TEST_F(HandlersTest, OpenMissingFileFails) {
  ASSERT_THAT(HandleOpen(init_.get(), TestPath("missing")), IsOk());
  ReceivedReply reply = ReadReply();
  EXPECT_THAT(reply.reply.error(), HasSubstr("No such file or directory"));
  EXPECT_THAT(reply.fds, IsEmpty());
}

TEST_F(HandlersTest, DeleteRemovesFile) {
  const std::string path = TestPath("delete");
  ASSERT_THAT(file::SetContents(path, "x"), IsOk());
  ASSERT_THAT(HandleDelete(init_.get(), path), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), IsEmpty());
  EXPECT_THAT(file_util::fileops::Exists(path, false), IsFalse());
}

TEST_F(HandlersTest, DeleteMissingFileFails) {
  ASSERT_THAT(HandleDelete(init_.get(), TestPath("missing")), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), HasSubstr("remove("));
}

TEST_F(HandlersTest, ResetEmptiesBothDirectories) {
  InitOptions options;
  options.tmp_dir = TestPath("tmp");
  options.work_dir = TestPath("w");
  for (const std::string& dir : {options.tmp_dir, options.work_dir}) {
    ASSERT_THAT(mkdir(dir.c_str(), 0755), Eq(0));
    ASSERT_THAT(mkdir((dir + "/nested").c_str(), 0755), Eq(0));
    ASSERT_THAT(file::SetContents(dir + "/nested/file", "x"), IsOk());
    ASSERT_THAT(file::SetContents(dir + "/file", "y"), IsOk());
  }

  ASSERT_THAT(HandleReset(init_.get(), options), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), IsEmpty());

  for (const std::string& dir : {options.tmp_dir, options.work_dir}) {
    EXPECT_THAT(file_util::fileops::Exists(dir, false), IsTrue());
    std::vector<std::string> entries;
    std::string error;
    ASSERT_TRUE(
        file_util::fileops::ListDirectoryEntries(dir, &entries, &error));
    EXPECT_THAT(entries, IsEmpty()) << dir;
  }
}

TEST_F(HandlersTest, ResetStopsAtMissingDirectory) {
  InitOptions options;
  options.tmp_dir = TestPath("missing_tmp");
  options.work_dir = TestPath("w");
  ASSERT_THAT(mkdir(options.work_dir.c_str(), 0755), Eq(0));
  ASSERT_THAT(file::SetContents(options.work_dir + "/file", "y"), IsOk());

  ASSERT_THAT(HandleReset(init_.get(), options), IsOk());
  EXPECT_THAT(ReadReply().reply.error(), HasSubstr("opendir("));
  // The work directory is left alone.
  EXPECT_THAT(file_util::fileops::Exists(options.work_dir + "/file", false),
              IsTrue());
}

TEST_F(HandlersTest, SendFailureIsReported) {
  controller_.reset();
  EXPECT_THAT(HandlePing(init_.get()), Not(IsOk()));
}

}  // namespace
}  // namespace cinit

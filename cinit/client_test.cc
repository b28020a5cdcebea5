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

#include "cinit/client.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "cinit/init.h"
#include "cinit/process_reaper.h"
#include "cinit/runner.h"
#include "cinit/testing.h"
#include "cinit/util/file_helpers.h"
#include "cinit/util/fileops.h"
#include "cinit/util/status_matchers.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;
using ::testing::Eq;
using ::testing::Gt;
using ::testing::HasSubstr;
using ::testing::Ne;
using ::testing::StrEq;

// Runs an init loop on the other end of the client's channel.
class ClientTest : public testing::Test {
 protected:
  void SetUp() override {
    auto pair = InMemoryChannel::CreatePair();
    controller_ = std::move(pair.first);
    init_ = std::move(pair.second);
    options_.tmp_dir = GetTestTempPath(Name("tmp"));
    options_.work_dir = GetTestTempPath(Name("w"));
    ASSERT_THAT(mkdir(options_.tmp_dir.c_str(), 0755), Eq(0));
    ASSERT_THAT(mkdir(options_.work_dir.c_str(), 0755), Eq(0));
    client_ = std::make_unique<Client>(controller_.get());
    loop_ = std::thread([this] {
      loop_status_ = RunInitLoop(init_.get(), options_, &runner_, &reaper_);
    });
  }

  void TearDown() override {
    controller_->Close();
    loop_.join();
    EXPECT_THAT(loop_status_, IsOk());
  }

  static std::string Name(absl::string_view suffix) {
    const testing::TestInfo* info =
        testing::UnitTest::GetInstance()->current_test_info();
    return absl::StrCat(info->name(), ".", suffix);
  }

  std::unique_ptr<InMemoryChannel> controller_;
  std::unique_ptr<InMemoryChannel> init_;
  std::unique_ptr<Client> client_;
  InitOptions options_;
  ForkExecRunner runner_;
  ProcessReaper reaper_;
  std::thread loop_;
  absl::Status loop_status_;
};

TEST_F(ClientTest, Ping) { EXPECT_THAT(client_->Ping(), IsOk()); }

TEST_F(ClientTest, CopyInOpenDelete) {
  const std::string path = options_.work_dir + "/input";
  const std::string source = GetTestTempPath(Name("source"));
  ASSERT_THAT(file::SetContents(source, "3 4\n"), IsOk());
  FDCloser source_fd(open(source.c_str(), O_RDONLY | O_CLOEXEC));
  ASSERT_THAT(source_fd.get(), Ne(-1));

  ASSERT_THAT(client_->CopyIn(source_fd.get(), path), IsOk());
  CINIT_ASSERT_OK_AND_ASSIGN(FDCloser opened, client_->Open(path));
  char buffer[16] = {};
  EXPECT_THAT(read(opened.get(), buffer, sizeof(buffer)), Eq(4));
  EXPECT_THAT(buffer, StrEq("3 4\n"));

  EXPECT_THAT(client_->Delete(path), IsOk());
  EXPECT_THAT(client_->Open(path), StatusIs(absl::StatusCode::kInternal,
                                            HasSubstr("open(")));
  EXPECT_THAT(client_->Delete(path), StatusIs(absl::StatusCode::kInternal));
}

TEST_F(ClientTest, Reset) {
  ASSERT_THAT(file::SetContents(options_.work_dir + "/a", "x"), IsOk());
  ASSERT_THAT(file::SetContents(options_.tmp_dir + "/b", "y"), IsOk());
  EXPECT_THAT(client_->Reset(), IsOk());
  EXPECT_FALSE(file_util::fileops::Exists(options_.work_dir + "/a", false));
  EXPECT_FALSE(file_util::fileops::Exists(options_.tmp_dir + "/b", false));
}

TEST_F(ClientTest, ExecveReportsExitStatus) {
  ExecveRequest request;
  request.args = {"/bin/sh", "-c", "exit 7"};
  pid_t started_pid = -1;
  CINIT_ASSERT_OK_AND_ASSIGN(
      ExecveResult result,
      client_->Execve(request, {}, [&started_pid](pid_t pid) {
        started_pid = pid;
        return absl::OkStatus();
      }));
  EXPECT_THAT(result.pid, Gt(0));
  EXPECT_THAT(result.pid, Eq(started_pid));
  EXPECT_THAT(result.exit_status, Eq(7));
  EXPECT_THAT(result.outcome, Eq(OUTCOME_NORMAL));
  // The channel is ready for the next exchange.
  EXPECT_THAT(client_->Ping(), IsOk());
}

TEST_F(ClientTest, ExecveRunsInWorkDirWithDescriptors) {
  int pipe_fds[2];
  ASSERT_THAT(pipe2(pipe_fds, O_CLOEXEC), Eq(0));
  FDCloser read_end(pipe_fds[0]);
  FDCloser write_end(pipe_fds[1]);
  FDCloser dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));

  ExecveRequest request;
  request.args = {"/bin/sh", "-c", "pwd"};
  CINIT_ASSERT_OK_AND_ASSIGN(
      ExecveResult result,
      client_->Execve(request,
                      {dev_null.get(), write_end.get(), write_end.get()}));
  EXPECT_THAT(result.exit_status, Eq(0));
  write_end.Close();

  char buffer[4096] = {};
  ASSERT_THAT(read(read_end.get(), buffer, sizeof(buffer) - 1), Gt(0));
  EXPECT_THAT(buffer, StrEq(options_.work_dir + "\n"));
}

TEST_F(ClientTest, ExecveFromDescriptor) {
  FDCloser program(open("/bin/true", O_RDONLY | O_CLOEXEC));
  ASSERT_THAT(program.get(), Ne(-1));
  ExecveRequest request;
  request.args = {"true"};
  request.fd_exec = true;
  CINIT_ASSERT_OK_AND_ASSIGN(ExecveResult result,
                             client_->Execve(request, {program.get()}));
  EXPECT_THAT(result.exit_status, Eq(0));
}

TEST_F(ClientTest, ExecveClassifiesCpuLimit) {
  ExecveRequest request;
  request.args = {"/bin/sh", "-c", "while :; do :; done"};
  request.limits.set_rlimit_cpu(1);
  CINIT_ASSERT_OK_AND_ASSIGN(ExecveResult result,
                             client_->Execve(request, {}));
  EXPECT_THAT(result.outcome, Eq(OUTCOME_TIME_LIMIT_EXCEEDED));
}

TEST_F(ClientTest, ExecveStartFailure) {
  ExecveRequest request;
  request.args = {"/nonexistent/program"};
  EXPECT_THAT(client_->Execve(request, {}),
              StatusIs(absl::StatusCode::kInternal,
                       HasSubstr("/nonexistent/program")));
  EXPECT_THAT(client_->Ping(), IsOk());
}

TEST_F(ClientTest, ExecveAbortedByCallback) {
  ExecveRequest request;
  request.args = {"/bin/sleep", "100"};
  EXPECT_THAT(client_->Execve(request, {},
                              [](pid_t) {
                                return absl::CancelledError("not today");
                              }),
              StatusIs(absl::StatusCode::kCancelled));
  EXPECT_THAT(client_->Ping(), IsOk());
}

TEST_F(ClientTest, KillFromAnotherThread) {
  ExecveRequest request;
  request.args = {"/bin/sleep", "100"};
  EXPECT_THAT(client_->Kill(),
              StatusIs(absl::StatusCode::kFailedPrecondition));

  std::thread killer;
  absl::StatusOr<ExecveResult> result =
      client_->Execve(request, {}, [this, &killer](pid_t) {
        killer = std::thread([this] {
          // Retry until the program is known to be running.
          while (!client_->Kill().ok()) {
            absl::SleepFor(absl::Milliseconds(10));
          }
        });
        return absl::OkStatus();
      });
  killer.join();
  ASSERT_THAT(result, IsOk());
  EXPECT_THAT(result->outcome, Eq(OUTCOME_TIME_LIMIT_EXCEEDED));
  EXPECT_THAT(client_->Ping(), IsOk());
}

}  // namespace
}  // namespace cinit

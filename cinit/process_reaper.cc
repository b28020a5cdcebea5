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

#include "cinit/process_reaper.h"

#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "cinit/util.h"
#include "cinit/util/raw_logging.h"

namespace cinit {

namespace {

class OsSyscalls : public ProcessReaper::SyscallInterface {
 public:
  pid_t WaitPid(pid_t pid, int* status, int flags) override {
    return wait4(pid, status, flags, nullptr);
  }
  int Kill(pid_t pid, int sig) override { return kill(pid, sig); }
};

}  // namespace

ProcessReaper::ProcessReaper()
    : ProcessReaper(std::make_unique<OsSyscalls>()) {}

absl::StatusOr<int> ProcessReaper::Wait(pid_t pid) {
  int status = 0;
  for (;;) {
    pid_t ret = syscalls_->WaitPid(pid, &status, __WALL);
    if (ret == pid) {
      break;
    }
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret == -1) {
      return absl::ErrnoToStatus(errno, absl::StrCat("wait4(", pid, ")"));
    }
    return absl::InternalError(
        absl::StrCat("wait4(", pid, ") returned unexpected pid ", ret));
  }
  CINIT_RAW_VLOG(1, "PID %d %s", pid, util::DescribeWaitStatus(status).c_str());
  return status;
}

absl::Status ProcessReaper::KillProcessGroup(pid_t pgid) {
  if (pgid <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid process group: ", pgid));
  }
  if (syscalls_->Kill(-pgid, SIGKILL) == -1 && errno != ESRCH) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("kill(-", pgid, ", SIGKILL)"));
  }
  return absl::OkStatus();
}

absl::Status ProcessReaper::KillAll() {
  if (syscalls_->Kill(-1, SIGKILL) == -1 && errno != ESRCH) {
    return absl::ErrnoToStatus(errno, "kill(-1, SIGKILL)");
  }
  return absl::OkStatus();
}

int ProcessReaper::ReapZombies() {
  int reaped = 0;
  for (;;) {
    int status;
    pid_t pid = syscalls_->WaitPid(-1, &status, __WALL | WNOHANG);
    if (pid == -1 && errno == EINTR) {
      continue;
    }
    if (pid <= 0) {
      break;
    }
    CINIT_RAW_VLOG(2, "Reaped PID %d", pid);
    ++reaped;
  }
  return reaped;
}

}  // namespace cinit

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

// Implementation of the fork() and execve() based runner.
//
// The child reports its progress over a close-on-exec SOCK_SEQPACKET
// socketpair. It sends a "ready" record once it is fully set up and then
// blocks until the parent has run the sync callback. After that, end of file
// on the socket means the program image was replaced, while a record means a
// step failed. Everything the child needs is prepared before fork(), so that
// the child does not allocate.

#include "cinit/runner.h"

#include <fcntl.h>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cinit/util.h"
#include "cinit/util/fileops.h"
#include "cinit/util/raw_logging.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;

// Steps of the child's setup, in order. Reported together with errno when the
// step fails.
enum class Stage : int32_t {
  kReady = 0,
  kSignalMask,
  kProcessGroup,
  kMoveFds,
  kChdir,
  kRlimit,
  kNoNewPrivs,
  kDropCaps,
  kWaitForParent,
  kExecve,
};

struct ABSL_ATTRIBUTE_PACKED ChildReport {
  int32_t stage;
  int32_t error;
};

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::kReady:
      return "setup";
    case Stage::kSignalMask:
      return "sigprocmask()";
    case Stage::kProcessGroup:
      return "setpgid()";
    case Stage::kMoveFds:
      return "moving descriptors";
    case Stage::kChdir:
      return "chdir()";
    case Stage::kRlimit:
      return "setrlimit()";
    case Stage::kNoNewPrivs:
      return "prctl(PR_SET_NO_NEW_PRIVS)";
    case Stage::kDropCaps:
      return "dropping capabilities";
    case Stage::kWaitForParent:
      return "waiting for parent";
    case Stage::kExecve:
      return "execve()";
  }
  return "unknown stage";
}

// Everything the child needs, prepared before fork().
struct ChildPlan {
  const char* const* argv;
  const char* const* envp;
  const char* work_dir;
  int exec_fd;
  // Scratch copy of the inherited descriptors, modified in place.
  int* fds;
  size_t num_fds;
  const Rlimit* limits;
  size_t num_limits;
  bool no_new_privs;
  bool drop_caps;
};

void Report(int status_fd, Stage stage, int error) {
  ChildReport report = {static_cast<int32_t>(stage), error};
  // A failed send shows up as end of file in the parent.
  if (TEMP_FAILURE_RETRY(
          send(status_fd, &report, sizeof(report), MSG_NOSIGNAL)) == -1) {
    return;
  }
}

[[noreturn]] void Fail(int status_fd, Stage stage, int error) {
  Report(status_fd, stage, error);
  _exit(127);
}

// Marks every descriptor from first_fd upwards as close-on-exec.
bool MarkCloseOnExecFrom(int first_fd) {
  if (close_range(first_fd, ~0U, CLOSE_RANGE_CLOEXEC) == 0) {
    return true;
  }
  // Kernels before 5.11 lack CLOSE_RANGE_CLOEXEC.
  rlimit64 nofile;
  if (getrlimit64(RLIMIT_NOFILE, &nofile) == -1) {
    return false;
  }
  int max_fd = nofile.rlim_cur == RLIM64_INFINITY || nofile.rlim_cur > (1 << 20)
                   ? 1 << 20
                   : static_cast<int>(nofile.rlim_cur);
  for (int fd = first_fd; fd < max_fd; ++fd) {
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) == -1 && errno != EBADF) {
      return false;
    }
  }
  return true;
}

// Moves the inherited descriptors to 0..n-1 and makes sure nothing else
// survives the exec. status_fd is moved out of the way first, so that errors
// can still be reported. Returns false with errno set on failure.
bool MoveFds(int* status_fd, ChildPlan* plan) {
  const int n = static_cast<int>(plan->num_fds);
  // Get everything out of the target range first.
  int new_status_fd = fcntl(*status_fd, F_DUPFD_CLOEXEC, n);
  if (new_status_fd == -1) {
    return false;
  }
  *status_fd = new_status_fd;
  if (plan->exec_fd != -1) {
    plan->exec_fd = fcntl(plan->exec_fd, F_DUPFD_CLOEXEC, n);
    if (plan->exec_fd == -1) {
      return false;
    }
  }
  for (int i = 0; i < n; ++i) {
    plan->fds[i] = fcntl(plan->fds[i], F_DUPFD_CLOEXEC, n);
    if (plan->fds[i] == -1) {
      return false;
    }
  }
  // dup2() clears close-on-exec on exactly the target descriptor.
  for (int i = 0; i < n; ++i) {
    if (dup2(plan->fds[i], i) == -1) {
      return false;
    }
    close(plan->fds[i]);
  }
  return MarkCloseOnExecFrom(n);
}

[[noreturn]] void RunChild(int status_fd, ChildPlan* plan) {
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1) {
    Fail(status_fd, Stage::kSignalMask, errno);
  }
  if (setpgid(0, 0) == -1) {
    Fail(status_fd, Stage::kProcessGroup, errno);
  }
  if (!MoveFds(&status_fd, plan)) {
    Fail(status_fd, Stage::kMoveFds, errno);
  }
  if (plan->work_dir != nullptr && chdir(plan->work_dir) == -1) {
    Fail(status_fd, Stage::kChdir, errno);
  }
  for (size_t i = 0; i < plan->num_limits; ++i) {
    if (setrlimit64(plan->limits[i].resource, &plan->limits[i].value) == -1) {
      Fail(status_fd, Stage::kRlimit, errno);
    }
  }
  if (plan->no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    Fail(status_fd, Stage::kNoNewPrivs, errno);
  }
  if (plan->drop_caps) {
    cap_t caps = cap_init();
    if (caps == nullptr) {
      Fail(status_fd, Stage::kDropCaps, errno);
    }
    int rc = cap_set_proc(caps);
    int saved_errno = errno;
    cap_free(caps);
    if (rc != 0) {
      Fail(status_fd, Stage::kDropCaps, saved_errno);
    }
  }

  Report(status_fd, Stage::kReady, 0);
  char go;
  if (TEMP_FAILURE_RETRY(read(status_fd, &go, 1)) != 1) {
    // The parent aborted the start.
    _exit(127);
  }

  if (plan->exec_fd != -1) {
    syscall(__NR_execveat, plan->exec_fd, "", plan->argv, plan->envp,
            AT_EMPTY_PATH);
  } else {
    execve(plan->argv[0], const_cast<char* const*>(plan->argv),
           const_cast<char* const*>(plan->envp));
  }
  Fail(status_fd, Stage::kExecve, errno);
}

// Reads one report. Returns std::nullopt on end of file.
absl::StatusOr<std::optional<ChildReport>> ReadReport(int status_fd) {
  ChildReport report;
  ssize_t len = TEMP_FAILURE_RETRY(read(status_fd, &report, sizeof(report)));
  if (len == -1) {
    return absl::ErrnoToStatus(errno, "reading child status");
  }
  if (len == 0) {
    return std::nullopt;
  }
  if (len != sizeof(report)) {
    return absl::InternalError(
        absl::StrCat("short child status record: ", len, " bytes"));
  }
  return report;
}

absl::Status ReportToStatus(const ChildReport& report,
                            const RunRequest& request) {
  Stage stage = static_cast<Stage>(report.stage);
  std::string what = StageName(stage);
  if (stage == Stage::kChdir) {
    what = absl::StrCat("chdir(", request.work_dir, ")");
  } else if (stage == Stage::kExecve) {
    what = request.exec_fd != -1
               ? absl::StrCat("execveat(fd ", request.exec_fd, ")")
               : absl::StrCat("execve(", request.args[0], ")");
  }
  return absl::ErrnoToStatus(report.error, absl::StrCat(what, " failed"));
}

// Collects the child and passes status through.
absl::Status Reap(pid_t pid, absl::Status status) {
  int wstatus;
  if (TEMP_FAILURE_RETRY(waitpid(pid, &wstatus, __WALL)) == -1) {
    CINIT_RAW_PLOG(ERROR, "waitpid(%d)", pid);
  }
  return status;
}

absl::Status KillAndReap(pid_t pid, absl::Status status) {
  if (kill(pid, SIGKILL) == -1) {
    CINIT_RAW_PLOG(ERROR, "kill(%d, SIGKILL)", pid);
  }
  return Reap(pid, std::move(status));
}

}  // namespace

absl::StatusOr<pid_t> ForkExecRunner::Start(const RunRequest& request) {
  if (request.args.empty()) {
    return absl::InvalidArgumentError("empty argument list");
  }

  util::CharPtrArray argv = util::CharPtrArray::FromStringVector(request.args);
  util::CharPtrArray envp = util::CharPtrArray::FromStringVector(request.envs);
  std::vector<int> fds = request.fds;
  ChildPlan plan = {
      .argv = argv.data(),
      .envp = envp.data(),
      .work_dir =
          request.work_dir.empty() ? nullptr : request.work_dir.c_str(),
      .exec_fd = request.exec_fd,
      .fds = fds.data(),
      .num_fds = fds.size(),
      .limits = request.limits.data(),
      .num_limits = request.limits.size(),
      .no_new_privs = request.no_new_privs,
      .drop_caps = request.drop_caps,
  };
  CINIT_RAW_VLOG(1, "Will execute args:['%s'], environment:['%s']",
                 absl::StrJoin(request.args, "', '").c_str(),
                 absl::StrJoin(request.envs, "', '").c_str());

  int sv[2];
  if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, sv) == -1) {
    return absl::ErrnoToStatus(errno, "socketpair()");
  }
  FDCloser parent_end(sv[0]);
  FDCloser child_end(sv[1]);

  pid_t pid = fork();
  if (pid == -1) {
    return absl::ErrnoToStatus(errno, "fork()");
  }
  if (pid == 0) {
    close(sv[0]);
    RunChild(sv[1], &plan);
  }
  child_end.Close();

  absl::StatusOr<std::optional<ChildReport>> ready =
      ReadReport(parent_end.get());
  if (!ready.ok()) {
    return KillAndReap(pid, ready.status());
  }
  if (!ready->has_value()) {
    return Reap(pid, absl::InternalError("child exited during setup"));
  }
  if ((*ready)->stage != static_cast<int32_t>(Stage::kReady)) {
    return Reap(pid, ReportToStatus(**ready, request));
  }

  if (request.sync_func) {
    if (absl::Status status = request.sync_func(pid); !status.ok()) {
      CINIT_RAW_VLOG(1, "Start of PID %d aborted: %s", pid,
                     std::string(status.message()).c_str());
      return KillAndReap(pid, std::move(status));
    }
  }

  const char go = 'G';
  if (TEMP_FAILURE_RETRY(send(parent_end.get(), &go, 1, MSG_NOSIGNAL)) != 1) {
    return KillAndReap(pid, absl::ErrnoToStatus(errno, "releasing child"));
  }
  absl::StatusOr<std::optional<ChildReport>> result =
      ReadReport(parent_end.get());
  if (!result.ok()) {
    return KillAndReap(pid, result.status());
  }
  if (result->has_value()) {
    return Reap(pid, ReportToStatus(**result, request));
  }
  CINIT_RAW_VLOG(1, "Started PID %d", pid);
  return pid;
}

}  // namespace cinit

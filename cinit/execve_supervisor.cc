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

#include "cinit/execve_supervisor.h"

#include <unistd.h>
#include <sys/wait.h>

#include <csignal>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/synchronization/notification.h"
#include "cinit/limits.h"
#include "cinit/util.h"
#include "cinit/util/raw_logging.h"
#include "cinit/util/status_macros.h"
#include "cinit/util/thread.h"
#include "cinit/wire.h"

namespace cinit {

using ::cinit::file_util::fileops::FDCloser;

Outcome ClassifySignal(int signo) {
  switch (signo) {
    case SIGXCPU:
    case SIGKILL:
      return OUTCOME_TIME_LIMIT_EXCEEDED;
    case SIGXFSZ:
      return OUTCOME_OUTPUT_LIMIT_EXCEEDED;
    case SIGSYS:
      return OUTCOME_BANNED;
    default:
      return OUTCOME_RUNTIME_ERROR;
  }
}

Reply ClassifyWaitStatus(int wait_status) {
  Reply reply;
  if (WIFEXITED(wait_status)) {
    reply.set_exit_status(WEXITSTATUS(wait_status));
  } else if (WIFSIGNALED(wait_status)) {
    reply.set_outcome(ClassifySignal(WTERMSIG(wait_status)));
  } else {
    reply.set_error(absl::StrCat("unexpected wait status: ",
                                 util::DescribeWaitStatus(wait_status)));
  }
  return reply;
}

absl::StatusOr<pid_t> ExecveSupervisor::Start(const Command& command,
                                              std::vector<FDCloser> fds) {
  RunRequest request;
  request.args.assign(command.argv().begin(), command.argv().end());
  request.envs.assign(command.envv().begin(), command.envv().end());
  CINIT_ASSIGN_OR_RETURN(request.limits, ParseLimits(command.limits()));

  size_t first_inherited = 0;
  if (command.fd_exec()) {
    if (fds.empty()) {
      return absl::InvalidArgumentError(
          "fd-exec mode requires the program descriptor");
    }
    request.exec_fd = fds[0].get();
    first_inherited = 1;
  }
  for (size_t i = first_inherited; i < fds.size(); ++i) {
    request.fds.push_back(fds[i].get());
  }
  request.work_dir = options_->work_dir;
  request.no_new_privs = true;
  request.drop_caps = true;
  request.sync_func = [this](pid_t pid) { return Rendezvous(pid); };
  return runner_->Start(request);
}

absl::Status ExecveSupervisor::Rendezvous(pid_t pid) {
  channel_status_ =
      SendReply(channel_, Reply(), {}, Credentials{pid, getuid(), getgid()});
  CINIT_RETURN_IF_ERROR(channel_status_);
  absl::StatusOr<ReceivedCommand> next = RecvCommand(channel_);
  if (!next.ok()) {
    channel_status_ = next.status();
    return channel_status_;
  }
  if (next->command.type() == COMMAND_KILL) {
    return absl::CancelledError("killed before the program started");
  }
  return absl::OkStatus();
}

absl::Status ExecveSupervisor::ListenForKill(
    const absl::StatusOr<pid_t>& pid, absl::Notification* wait_done) {
  absl::Status status = RecvCommand(channel_).status();
  if (pid.ok()) {
    if (absl::Status kill_status = reaper_->KillProcessGroup(*pid);
        !kill_status.ok()) {
      CINIT_RAW_LOG(WARNING, "%s", kill_status.ToString().c_str());
    }
  }
  if (options_->kill_all_processes) {
    if (absl::Status kill_status = reaper_->KillAll(); !kill_status.ok()) {
      CINIT_RAW_LOG(WARNING, "%s", kill_status.ToString().c_str());
    }
  }
  // Reaping before the primary wait collected the program could steal its
  // status.
  wait_done->WaitForNotification();
  int reaped = reaper_->ReapZombies();
  CINIT_RAW_VLOG(2, "Reaped %d leftover processes", reaped);
  return status;
}

absl::Status ExecveSupervisor::Run(const Command& command,
                                   std::vector<FDCloser> fds) {
  channel_status_ = absl::OkStatus();
  absl::StatusOr<pid_t> pid = Start(command, std::move(fds));
  if (!channel_status_.ok()) {
    // The runner already killed and reaped the prepared child.
    CINIT_RAW_LOG(ERROR, "Channel failed during rendezvous: %s",
                  channel_status_.ToString().c_str());
    return channel_status_;
  }
  if (pid.ok()) {
    CINIT_RAW_VLOG(1, "Started [%s] as PID %d",
                   absl::StrJoin(command.argv(), ", ").c_str(), *pid);
  } else {
    CINIT_RAW_VLOG(1, "Start failed: %s", pid.status().ToString().c_str());
  }

  absl::Notification wait_done;
  absl::Status listener_status;
  Thread kill_listener(
      [this, &pid, &wait_done, &listener_status] {
        // Exceptions must not escape the thread.
        try {
          listener_status = ListenForKill(pid, &wait_done);
        } catch (const std::exception& e) {
          listener_status = absl::InternalError(
              absl::StrCat("kill listener failed: ", e.what()));
        } catch (...) {
          listener_status =
              absl::InternalError("kill listener failed: unknown exception");
        }
      },
      "cinit-kill");

  Reply terminal;
  if (pid.ok()) {
    absl::StatusOr<int> wait_status = reaper_->Wait(*pid);
    wait_done.Notify();
    if (wait_status.ok()) {
      terminal = ClassifyWaitStatus(*wait_status);
    } else {
      terminal.set_error(std::string(wait_status.status().message()));
    }
  } else {
    wait_done.Notify();
    terminal.set_error(std::string(pid.status().message()));
  }
  absl::Status send_status = SendReply(channel_, terminal);

  kill_listener.Join();
  CINIT_RETURN_IF_ERROR(send_status);
  CINIT_RETURN_IF_ERROR(listener_status);
  return SendReply(channel_, Reply());
}

}  // namespace cinit

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

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "cinit/util/raw_logging.h"
#include "cinit/util/status_macros.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;

absl::Status ReplyStatus(const Reply& reply) {
  if (!reply.error().empty()) {
    return absl::InternalError(reply.error());
  }
  return absl::OkStatus();
}

Command MakeCommand(CommandType type, const std::string& path = "") {
  Command command;
  command.set_type(type);
  if (!path.empty()) {
    command.set_path(path);
  }
  return command;
}

}  // namespace

absl::StatusOr<ReceivedReply> Client::Call(const Command& command,
                                           absl::Span<const int> fds) {
  CINIT_RETURN_IF_ERROR(SendCommand(channel_, command, fds));
  return RecvReply(channel_);
}

absl::Status Client::Ping() {
  CINIT_ASSIGN_OR_RETURN(ReceivedReply received,
                         Call(MakeCommand(COMMAND_PING)));
  return ReplyStatus(received.reply);
}

absl::Status Client::CopyIn(int fd, const std::string& path) {
  CINIT_ASSIGN_OR_RETURN(ReceivedReply received,
                         Call(MakeCommand(COMMAND_COPY_IN, path), {fd}));
  return ReplyStatus(received.reply);
}

absl::StatusOr<FDCloser> Client::Open(const std::string& path) {
  CINIT_ASSIGN_OR_RETURN(ReceivedReply received,
                         Call(MakeCommand(COMMAND_OPEN, path)));
  CINIT_RETURN_IF_ERROR(ReplyStatus(received.reply));
  if (received.fds.size() != 1) {
    return absl::DataLossError(absl::StrCat(
        "Open(", path, ") returned ", received.fds.size(), " descriptors"));
  }
  return std::move(received.fds[0]);
}

absl::Status Client::Delete(const std::string& path) {
  CINIT_ASSIGN_OR_RETURN(ReceivedReply received,
                         Call(MakeCommand(COMMAND_DELETE, path)));
  return ReplyStatus(received.reply);
}

absl::Status Client::Reset() {
  CINIT_ASSIGN_OR_RETURN(ReceivedReply received,
                         Call(MakeCommand(COMMAND_RESET)));
  return ReplyStatus(received.reply);
}

absl::Status Client::Kill() {
  absl::MutexLock lock(&mutex_);
  if (state_ != ExecveState::kRunning) {
    return absl::FailedPreconditionError("no program running");
  }
  state_ = ExecveState::kKilled;
  return SendCommand(channel_, MakeCommand(COMMAND_KILL));
}

absl::Status Client::Finish() {
  {
    absl::MutexLock lock(&mutex_);
    ExecveState state = state_;
    state_ = ExecveState::kIdle;
    if (state == ExecveState::kRunning) {
      CINIT_RETURN_IF_ERROR(SendCommand(channel_, MakeCommand(COMMAND_KILL)));
    }
  }
  CINIT_ASSIGN_OR_RETURN(ReceivedReply completion, RecvReply(channel_));
  return ReplyStatus(completion.reply);
}

absl::StatusOr<ExecveResult> Client::Execve(const ExecveRequest& request,
                                            absl::Span<const int> fds,
                                            StartedCallback on_started) {
  Command command = MakeCommand(COMMAND_EXECVE);
  for (const std::string& arg : request.args) {
    command.add_argv(arg);
  }
  for (const std::string& env : request.envs) {
    command.add_envv(env);
  }
  command.set_fd_exec(request.fd_exec);
  request.limits.AddToCommand(&command);

  CINIT_ASSIGN_OR_RETURN(ReceivedReply first, Call(command, fds));
  if (!first.reply.error().empty()) {
    // Nothing was started, this is the terminal reply.
    {
      absl::MutexLock lock(&mutex_);
      state_ = ExecveState::kRunning;
    }
    CINIT_RETURN_IF_ERROR(Finish());
    return ReplyStatus(first.reply);
  }
  if (!first.creds.has_value()) {
    return absl::DataLossError("rendezvous reply without credentials");
  }

  ExecveResult result;
  result.pid = first.creds->pid;
  CINIT_RAW_VLOG(1, "Program started as PID %d", result.pid);
  absl::Status started = on_started ? on_started(result.pid)
                                    : absl::OkStatus();
  {
    absl::MutexLock lock(&mutex_);
    CINIT_RETURN_IF_ERROR(SendCommand(
        channel_, MakeCommand(started.ok() ? COMMAND_PING : COMMAND_KILL)));
    state_ = ExecveState::kRunning;
  }

  CINIT_ASSIGN_OR_RETURN(ReceivedReply terminal, RecvReply(channel_));
  CINIT_RETURN_IF_ERROR(Finish());
  CINIT_RETURN_IF_ERROR(started);
  CINIT_RETURN_IF_ERROR(ReplyStatus(terminal.reply));
  result.exit_status = terminal.reply.exit_status();
  result.outcome = terminal.reply.outcome();
  return result;
}

}  // namespace cinit

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

#include "cinit/dispatcher.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cinit/cinit.pb.h"
#include "cinit/execve_supervisor.h"
#include "cinit/handlers.h"
#include "cinit/util/raw_logging.h"

namespace cinit {

absl::Status Dispatcher::Dispatch(ReceivedCommand received) {
  const Command& command = received.command;
  CINIT_RAW_VLOG(1, "Command %s", CommandType_Name(command.type()).c_str());
  switch (command.type()) {
    case COMMAND_PING:
      return HandlePing(channel_);
    case COMMAND_COPY_IN:
      return HandleCopyIn(channel_, command.path(), std::move(received.fds));
    case COMMAND_OPEN:
      return HandleOpen(channel_, command.path());
    case COMMAND_DELETE:
      return HandleDelete(channel_, command.path());
    case COMMAND_RESET:
      return HandleReset(channel_, *options_);
    case COMMAND_EXECVE:
      return ExecveSupervisor(channel_, runner_, reaper_, options_)
          .Run(command, std::move(received.fds));
    case COMMAND_KILL:
      return SendResult(channel_, absl::FailedPreconditionError(
                                      "no running program to kill"));
    default:
      break;
  }
  // DecodeCommand() lets no other type through.
  return absl::InvalidArgumentError(
      absl::StrCat("invalid command type: ", command.type()));
}

}  // namespace cinit

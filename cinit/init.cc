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

#include "cinit/init.h"

#include <sys/prctl.h>
#include <unistd.h>

#include <cstring>
#include <exception>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "cinit/dispatcher.h"
#include "cinit/sanitizer.h"
#include "cinit/util/raw_logging.h"
#include "cinit/util/status_macros.h"
#include "cinit/wire.h"

namespace cinit {
namespace {

// Runs the init process proper. Returns the exit code.
int ServeControlChannel(const InitOptions& options) {
  // Close all non-essential FDs, nothing should leak into the programs.
  absl::Status status =
      sanitizer::CloseAllFDsExcept({0, 1, 2, options.comms_fd});
  if (!status.ok()) {
    CINIT_RAW_LOG(WARNING, "Closing non-essential FDs failed: %s",
                  status.ToString().c_str());
  }
  // Only the descriptors explicitly handed to a program may reach it.
  status = sanitizer::MarkAllFDsAsCOEExcept({0, 1, 2});
  if (!status.ok()) {
    CINIT_RAW_LOG(ERROR, "%s", status.ToString().c_str());
    return 1;
  }

  // Make the process' name easily recognizable with ps/pstree.
  if (prctl(PR_SET_NAME, "cinit", 0, 0, 0) != 0) {
    CINIT_RAW_PLOG(WARNING, "prctl(PR_SET_NAME, 'cinit')");
  }

  Comms comms(options.comms_fd);
  ForkExecRunner runner;
  ProcessReaper reaper;
  status = RunInitLoop(&comms, options, &runner, &reaper);
  if (!status.ok()) {
    CINIT_RAW_LOG(ERROR, "cinit exiting: %s", status.ToString().c_str());
    return 1;
  }
  CINIT_RAW_VLOG(1, "cinit exiting: control channel closed");
  return 0;
}

}  // namespace

bool IsInitInvocation(pid_t pid, int argc, const char* const argv[]) {
  return pid == 1 && argc == 2 && strcmp(argv[1], kInitArg) == 0;
}

absl::Status RunInitLoop(MessageChannel* channel, const InitOptions& options,
                         Runner* runner, ProcessReaper* reaper) {
  Dispatcher dispatcher(channel, runner, reaper, &options);
  for (;;) {
    absl::StatusOr<ReceivedCommand> received = RecvCommand(channel);
    if (!received.ok()) {
      if (channel->PeerClosed()) {
        return absl::OkStatus();
      }
      return received.status();
    }
    CINIT_RETURN_IF_ERROR(dispatcher.Dispatch(*std::move(received)));
  }
}

void Init(int argc, const char* const argv[], const InitOptions& options) {
  if (!IsInitInvocation(getpid(), argc, argv)) {
    return;
  }
  int exit_code = 1;
  try {
    exit_code = ServeControlChannel(options);
  } catch (const std::exception& e) {
    CINIT_RAW_LOG(ERROR, "cinit panic: %s", e.what());
  } catch (...) {
    CINIT_RAW_LOG(ERROR, "cinit panic: unknown exception");
  }
  _exit(exit_code);
}

void Init(int argc, const char* const argv[]) {
  Init(argc, argv, InitOptions::FromFlags());
}

}  // namespace cinit

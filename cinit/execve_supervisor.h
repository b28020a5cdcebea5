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

// The cinit::ExecveSupervisor class runs one Execve exchange: it starts the
// program, hands its credentials to the controller before the program image
// takes over, waits for it while listening for the controller's kill
// request, cleans up every descendant and reports how the program ended.
//
// Replies of one exchange, in order:
//   1. rendezvous: no error, credentials (pid, uid, gid) attached. Only sent
//      if a process was created.
//   2. terminal: the exit status or outcome, or an error.
//   3. completion: empty, sent after the follow-up command arrived and every
//      descendant was reaped.

#ifndef CINIT_EXECVE_SUPERVISOR_H_
#define CINIT_EXECVE_SUPERVISOR_H_

#include <sys/types.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "cinit/cinit.pb.h"
#include "cinit/comms.h"
#include "cinit/options.h"
#include "cinit/process_reaper.h"
#include "cinit/runner.h"
#include "cinit/util/fileops.h"

namespace cinit {

// Maps a terminating signal to the outcome reported to the controller.
Outcome ClassifySignal(int signo);

// Builds the terminal reply for a raw wait status.
Reply ClassifyWaitStatus(int wait_status);

class ExecveSupervisor {
 public:
  // None of the pointers are owned, all must outlive the supervisor.
  ExecveSupervisor(MessageChannel* channel, Runner* runner,
                   ProcessReaper* reaper, const InitOptions* options)
      : channel_(channel),
        runner_(runner),
        reaper_(reaper),
        options_(options) {}

  ExecveSupervisor(const ExecveSupervisor&) = delete;
  ExecveSupervisor& operator=(const ExecveSupervisor&) = delete;

  // Runs the exchange for command. fds are the descriptors received with it
  // and are closed once the program has been started (or failed to start).
  // Returns a non-OK status only on channel errors, in which case no further
  // replies are sent.
  absl::Status Run(const Command& command,
                   std::vector<file_util::fileops::FDCloser> fds);

 private:
  // Validates the request and creates the process.
  absl::StatusOr<pid_t> Start(const Command& command,
                              std::vector<file_util::fileops::FDCloser> fds);

  // Sends the credentials of pid and waits for the controller's decision.
  // Channel failures are also kept in channel_status_.
  absl::Status Rendezvous(pid_t pid);

  // Waits for the follow-up command, kills what is left of the program and
  // reaps every descendant once the primary wait is done. Returns the receive
  // status of the follow-up.
  absl::Status ListenForKill(const absl::StatusOr<pid_t>& pid,
                             absl::Notification* wait_done);

  MessageChannel* channel_;
  Runner* runner_;
  ProcessReaper* reaper_;
  const InitOptions* options_;

  // Channel error seen during the rendezvous of the current exchange.
  absl::Status channel_status_;
};

}  // namespace cinit

#endif  // CINIT_EXECVE_SUPERVISOR_H_

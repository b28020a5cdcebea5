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

// The cinit::Client class drives the init process of a sandbox from the
// controller's side of the control channel.
//
// Operations that fail inside the sandbox return absl::InternalError with the
// message reported by the init process. Channel failures are returned as is;
// the client is unusable afterwards.

#ifndef CINIT_CLIENT_H_
#define CINIT_CLIENT_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "cinit/cinit.pb.h"
#include "cinit/comms.h"
#include "cinit/limits.h"
#include "cinit/util/fileops.h"
#include "cinit/wire.h"

namespace cinit {

struct ExecveRequest {
  std::vector<std::string> args;
  std::vector<std::string> envs;
  // If set, the first descriptor passed to Execve() is the program image.
  bool fd_exec = false;
  Limits limits;
};

struct ExecveResult {
  pid_t pid = -1;
  // Meaningful if the program exited.
  int exit_status = 0;
  // OUTCOME_NORMAL if the program exited, the signal class otherwise.
  Outcome outcome = OUTCOME_NORMAL;
};

class Client {
 public:
  // Called with the pid of the started program before its image replaces the
  // init's child. A non-OK status kills the program instead of letting it run.
  using StartedCallback = absl::AnyInvocable<absl::Status(pid_t)>;

  // Does not take ownership of channel.
  explicit Client(MessageChannel* channel) : channel_(channel) {}

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  absl::Status Ping();

  // Stores everything readable from fd in path inside the sandbox.
  absl::Status CopyIn(int fd, const std::string& path);

  // Returns a read-only descriptor for path inside the sandbox.
  absl::StatusOr<file_util::fileops::FDCloser> Open(const std::string& path);

  absl::Status Delete(const std::string& path);

  // Empties the temporary and work directories of the sandbox.
  absl::Status Reset();

  // Runs a program to completion. fds become its descriptors 0..n-1 (after
  // the program image in fd-exec mode). Blocks until the program terminated
  // and the sandbox has been cleaned up. If on_started fails, its status is
  // returned once the exchange is over.
  absl::StatusOr<ExecveResult> Execve(const ExecveRequest& request,
                                      absl::Span<const int> fds,
                                      StartedCallback on_started = nullptr);

  // Kills the program started by a concurrent Execve() call, which then
  // completes. Fails if no program is running.
  absl::Status Kill();

 private:
  // Sends a command and waits for its reply.
  absl::StatusOr<ReceivedReply> Call(const Command& command,
                                     absl::Span<const int> fds = {});

  // Finishes an Execve exchange after the terminal reply: sends the
  // follow-up and waits for the completion reply.
  absl::Status Finish();

  enum class ExecveState {
    kIdle,
    // Waiting for the terminal reply, the follow-up is still due.
    kRunning,
    // Kill() sent the follow-up.
    kKilled,
  };

  MessageChannel* channel_;
  absl::Mutex mutex_;
  ExecveState state_ ABSL_GUARDED_BY(mutex_) = ExecveState::kIdle;
};

}  // namespace cinit

#endif  // CINIT_CLIENT_H_

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

#ifndef CINIT_PROCESS_REAPER_H_
#define CINIT_PROCESS_REAPER_H_

#include <sys/types.h>

#include <memory>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace cinit {

// Waits for, kills and reaps the descendants of the init process.
//
// Wait() and ReapZombies() must never run concurrently for the same child:
// whichever call collects the status first releases the pid, which the kernel
// may hand out again.
class ProcessReaper {
 public:
  // Interface for the process syscalls to allow mocking them in tests.
  class SyscallInterface {
   public:
    virtual pid_t WaitPid(pid_t pid, int* status, int flags) = 0;
    virtual int Kill(pid_t pid, int sig) = 0;
    virtual ~SyscallInterface() = default;
  };

  ProcessReaper();
  explicit ProcessReaper(std::unique_ptr<SyscallInterface> syscalls)
      : syscalls_(std::move(syscalls)) {}

  ProcessReaper(const ProcessReaper&) = delete;
  ProcessReaper& operator=(const ProcessReaper&) = delete;

  ~ProcessReaper() = default;

  // Blocks until pid terminates and returns its raw wait status.
  absl::StatusOr<int> Wait(pid_t pid);

  // Sends SIGKILL to every member of the process group. A group that is
  // already gone is not an error.
  absl::Status KillProcessGroup(pid_t pgid);

  // Sends SIGKILL to every process the caller may signal. Only meaningful as
  // the PID 1 of a namespace, where this covers the whole namespace.
  absl::Status KillAll();

  // Collects every terminated descendant without blocking. Returns the number
  // of processes reaped.
  int ReapZombies();

 private:
  std::unique_ptr<SyscallInterface> syscalls_;
};

}  // namespace cinit

#endif  // CINIT_PROCESS_REAPER_H_

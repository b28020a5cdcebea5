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

// Process creation for the programs run by Execve.

#ifndef CINIT_RUNNER_H_
#define CINIT_RUNNER_H_

#include <sys/types.h>

#include <string>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "cinit/limits.h"

namespace cinit {

struct RunRequest {
  std::vector<std::string> args;
  std::vector<std::string> envs;
  // Descriptor of the program image, or -1 to execute args[0].
  int exec_fd = -1;
  std::vector<Rlimit> limits;
  // Become descriptors 0..n-1 of the new program. Nothing else is inherited.
  std::vector<int> fds;
  // Working directory of the new program. Left unchanged if empty.
  std::string work_dir;
  bool no_new_privs = true;
  bool drop_caps = true;
  // Called with the pid of the new process after it has been fully set up but
  // before the program image replaces it. A non-OK status aborts the start:
  // the process is killed and reaped and the status is returned by Start().
  absl::AnyInvocable<absl::Status(pid_t) const> sync_func;
};

class Runner {
 public:
  virtual ~Runner() = default;

  // Starts the program described by request. On success the returned pid is
  // a child of the caller whose program image has been replaced, and which
  // leads its own process group.
  virtual absl::StatusOr<pid_t> Start(const RunRequest& request) = 0;
};

// Runner based on fork() and execve().
class ForkExecRunner : public Runner {
 public:
  absl::StatusOr<pid_t> Start(const RunRequest& request) override;
};

}  // namespace cinit

#endif  // CINIT_RUNNER_H_

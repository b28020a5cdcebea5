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

// Entry point of the init process of a sandbox.
//
// The sandbox creator starts a binary calling Init() as PID 1 of a fresh PID
// namespace with the single argument "init" and the control channel on
// descriptor 3. Init() then serves commands until the controller closes the
// channel and terminates the process. In every other invocation Init()
// returns and the binary does whatever it normally does.

#ifndef CINIT_INIT_H_
#define CINIT_INIT_H_

#include <sys/types.h>

#include "absl/status/status.h"
#include "cinit/comms.h"
#include "cinit/options.h"
#include "cinit/process_reaper.h"
#include "cinit/runner.h"

namespace cinit {

// Argument marking an init invocation.
inline constexpr char kInitArg[] = "init";

// Whether a process with the given pid and arguments is meant to serve as the
// init process.
bool IsInitInvocation(pid_t pid, int argc, const char* const argv[]);

// Receives and dispatches commands until the peer closes the channel, which
// yields OK. Any other receive error and channel errors of the handlers end
// the loop and are returned.
absl::Status RunInitLoop(MessageChannel* channel, const InitOptions& options,
                         Runner* runner, ProcessReaper* reaper);

// Serves the control channel and exits with 0 after an orderly close, with 1
// after an error, if this is an init invocation. Returns otherwise.
void Init(int argc, const char* const argv[], const InitOptions& options);
void Init(int argc, const char* const argv[]);

}  // namespace cinit

#endif  // CINIT_INIT_H_

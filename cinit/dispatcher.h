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

#ifndef CINIT_DISPATCHER_H_
#define CINIT_DISPATCHER_H_

#include "absl/status/status.h"
#include "cinit/comms.h"
#include "cinit/options.h"
#include "cinit/process_reaper.h"
#include "cinit/runner.h"
#include "cinit/wire.h"

namespace cinit {

// Routes decoded commands to their handlers.
class Dispatcher {
 public:
  // None of the pointers are owned, all must outlive the dispatcher.
  Dispatcher(MessageChannel* channel, Runner* runner, ProcessReaper* reaper,
             const InitOptions* options)
      : channel_(channel),
        runner_(runner),
        reaper_(reaper),
        options_(options) {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Handles one command. Returns a non-OK status only if the channel failed.
  absl::Status Dispatch(ReceivedCommand received);

 private:
  MessageChannel* channel_;
  Runner* runner_;
  ProcessReaper* reaper_;
  const InitOptions* options_;
};

}  // namespace cinit

#endif  // CINIT_DISPATCHER_H_

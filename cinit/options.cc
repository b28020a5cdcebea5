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

#include "cinit/options.h"

#include "absl/flags/flag.h"
#include "cinit/flags.h"

namespace cinit {

InitOptions InitOptions::FromFlags() {
  InitOptions options;
  options.comms_fd = absl::GetFlag(FLAGS_cinit_comms_fd);
  options.tmp_dir = absl::GetFlag(FLAGS_cinit_tmp_dir);
  options.work_dir = absl::GetFlag(FLAGS_cinit_work_dir);
  options.kill_all_processes = absl::GetFlag(FLAGS_cinit_kill_all_processes);
  return options;
}

}  // namespace cinit

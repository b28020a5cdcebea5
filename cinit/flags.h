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

// Command line flags of the init process.

#ifndef CINIT_FLAGS_H_
#define CINIT_FLAGS_H_

#include <string>

#include "absl/flags/declare.h"

ABSL_DECLARE_FLAG(int, cinit_comms_fd);
ABSL_DECLARE_FLAG(std::string, cinit_tmp_dir);
ABSL_DECLARE_FLAG(std::string, cinit_work_dir);
ABSL_DECLARE_FLAG(bool, cinit_kill_all_processes);

#endif  // CINIT_FLAGS_H_

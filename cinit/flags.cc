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

#include "cinit/flags.h"

#include <string>

#include "absl/flags/flag.h"

ABSL_FLAG(int, cinit_comms_fd, 3,
          "Descriptor of the pre-connected control channel");
ABSL_FLAG(std::string, cinit_tmp_dir, "/tmp",
          "Directory for temporary files, emptied by Reset");
ABSL_FLAG(std::string, cinit_work_dir, "/w",
          "Working directory of executed programs, emptied by Reset");
ABSL_FLAG(bool, cinit_kill_all_processes, true,
          "When killing a program, also kill every other process the init "
          "process can signal. Only safe as PID 1 of a namespace");

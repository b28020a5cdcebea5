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

#ifndef CINIT_OPTIONS_H_
#define CINIT_OPTIONS_H_

#include <string>

namespace cinit {

// Settings of one init process.
struct InitOptions {
  // Returns the options set on the command line, or their defaults.
  static InitOptions FromFlags();

  int comms_fd = 3;
  std::string tmp_dir = "/tmp";
  std::string work_dir = "/w";
  // Send SIGKILL to every process in the namespace, not only to the program's
  // process group, when an Execve exchange ends.
  bool kill_all_processes = false;
};

}  // namespace cinit

#endif  // CINIT_OPTIONS_H_

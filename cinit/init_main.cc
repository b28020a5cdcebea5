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

// Init process of a sandbox. Started as PID 1 of a new PID namespace with the
// single argument "init" and the control channel on descriptor 3.

#include <cstdio>
#include <vector>

#include "absl/flags/parse.h"
#include "cinit/init.h"

int main(int argc, char* argv[]) {
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  cinit::Init(static_cast<int>(args.size()), args.data());

  fprintf(stderr, "usage: %s [flags] %s (as PID 1 only)\n", args[0],
          cinit::kInitArg);
  return 1;
}

// Copyright 2019 Google LLC
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

// The cinit::util namespace provides various, uncategorized, functions
// shared by the init process and its controller.

#ifndef CINIT_UTIL_H_
#define CINIT_UTIL_H_

#include <string>
#include <vector>

namespace cinit::util {

// A char ptr array limited by the terminating nullptr entry (like environ
// or argv). All strings are stored in a single allocation, so the array can be
// built before fork() and used afterwards without touching the heap.
class CharPtrArray {
 public:
  static CharPtrArray FromStringVector(const std::vector<std::string>& vec);

  const std::vector<const char*>& array() const { return array_; }

  const char* const* data() const { return array_.data(); }

  std::vector<std::string> ToStringVector() const;

 private:
  explicit CharPtrArray(const std::vector<std::string>& vec);

  const std::string content_;
  std::vector<const char*> array_;
};

// Returns signal description.
std::string GetSignalName(int signo);

// Returns rlimit resource name.
std::string GetRlimitName(int resource);

// Returns a human readable description of a waitpid() status.
std::string DescribeWaitStatus(int status);

}  // namespace cinit::util

#endif  // CINIT_UTIL_H_

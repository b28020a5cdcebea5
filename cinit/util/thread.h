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

#ifndef CINIT_UTIL_THREAD_H_
#define CINIT_UTIL_THREAD_H_

#include <pthread.h>

#include <thread>  // NOLINT(build/c++11)
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"

namespace cinit {

class Thread {
 public:
  Thread() = default;

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  Thread(Thread&&) = default;
  Thread& operator=(Thread&&) = default;

  explicit Thread(absl::AnyInvocable<void() &&> functor,
                  absl::string_view name = "") {
    thread_ = std::thread(std::move(functor));
    if (!name.empty()) {
      // Kernel task names are limited to 16 bytes including the terminator.
      char short_name[16] = {};
      name.copy(short_name, sizeof(short_name) - 1);
      pthread_setname_np(thread_.native_handle(), short_name);
    }
  }

  pthread_t handle() { return thread_.native_handle(); }

  void Join() { thread_.join(); }

  bool IsJoinable() { return thread_.joinable(); }

 private:
  std::thread thread_;
};

}  // namespace cinit

#endif  // CINIT_UTIL_THREAD_H_

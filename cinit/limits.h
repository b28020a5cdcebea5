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

// The cinit::Limits class collects the rlimits a controller wants applied to
// a program started with Execve. On the init side the list is validated and
// turned into plain (resource, value) pairs for the runner.

#ifndef CINIT_LIMITS_H_
#define CINIT_LIMITS_H_

#include <sys/resource.h>

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "cinit/cinit.pb.h"
#include "google/protobuf/repeated_ptr_field.h"

namespace cinit {

// A single rlimit, ready to be passed to setrlimit64().
struct Rlimit {
  int resource;
  rlimit64 value;
};

class Limits final {
 public:
  Limits() = default;

  Limits(const Limits&) = delete;
  Limits& operator=(const Limits&) = delete;

  // rlimits getters/setters.
  //
  // Use RLIM64_INFINITY for unlimited values, but remember that some of those
  // cannot exceed system limits (e.g. RLIMIT_NOFILE).
  const rlimit64& rlimit_as() const { return rlimit_as_; }
  Limits& set_rlimit_as(const rlimit64& value) {
    rlimit_as_ = value;
    return *this;
  }
  Limits& set_rlimit_as(uint64_t value) {
    rlimit_as_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_cpu() const { return rlimit_cpu_; }
  Limits& set_rlimit_cpu(const rlimit64& value) {
    rlimit_cpu_ = value;
    return *this;
  }
  Limits& set_rlimit_cpu(uint64_t value) {
    rlimit_cpu_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_fsize() const { return rlimit_fsize_; }
  Limits& set_rlimit_fsize(const rlimit64& value) {
    rlimit_fsize_ = value;
    return *this;
  }
  Limits& set_rlimit_fsize(uint64_t value) {
    rlimit_fsize_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_nofile() const { return rlimit_nofile_; }
  Limits& set_rlimit_nofile(const rlimit64& value) {
    rlimit_nofile_ = value;
    return *this;
  }
  Limits& set_rlimit_nofile(uint64_t value) {
    rlimit_nofile_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_core() const { return rlimit_core_; }
  Limits& set_rlimit_core(const rlimit64& value) {
    rlimit_core_ = value;
    return *this;
  }
  Limits& set_rlimit_core(uint64_t value) {
    rlimit_core_ = MakeRlimit64(value);
    return *this;
  }

  const rlimit64& rlimit_stack() const { return rlimit_stack_; }
  Limits& set_rlimit_stack(const rlimit64& value) {
    rlimit_stack_ = value;
    return *this;
  }
  Limits& set_rlimit_stack(uint64_t value) {
    rlimit_stack_ = MakeRlimit64(value);
    return *this;
  }

  // Appends every limit to the Execve command.
  void AddToCommand(Command* command) const;

 private:
  static constexpr rlimit64 MakeRlimit64(uint64_t value) {
    return {.rlim_cur = value, .rlim_max = value};
  }

  // Address space size of a process, if big enough (say, above 512M), this
  // will be a rough approximation of the maximum RAM usage by the program.
  rlimit64 rlimit_as_ = MakeRlimit64(RLIM64_INFINITY);

  // CPU time, measured in seconds. Exceeding the soft limit raises SIGXCPU,
  // the hard limit SIGKILL; both are reported as a time limit violation.
  rlimit64 rlimit_cpu_ = MakeRlimit64(1024 /* seconds */);

  // Total number of bytes that can be written to a single file by the
  // process. Exceeding it raises SIGXFSZ.
  rlimit64 rlimit_fsize_ = MakeRlimit64(8ULL << 30 /* 8GiB */);

  // Number of NEW file descriptors which can be obtained by a process. 0
  // means that no new descriptors (files, sockets) can be created.
  rlimit64 rlimit_nofile_ = MakeRlimit64(1024);

  // Size of a core file which is allowed to be created. The default value of
  // zero disables the creation of core files.
  rlimit64 rlimit_core_ = MakeRlimit64(0);

  rlimit64 rlimit_stack_ = MakeRlimit64(8ULL << 20 /* 8MiB */);
};

// Validates the limits carried by an Execve command. Unknown resources and
// soft limits above the hard limit are rejected.
absl::StatusOr<std::vector<Rlimit>> ParseLimits(
    const google::protobuf::RepeatedPtrField<ResourceLimit>& limits);

}  // namespace cinit

#endif  // CINIT_LIMITS_H_

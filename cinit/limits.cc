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

#include "cinit/limits.h"

#include <sys/resource.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "cinit/cinit.pb.h"
#include "cinit/util.h"

namespace cinit {
namespace {

void AddLimit(int resource, const rlimit64& value, Command* command) {
  ResourceLimit* limit = command->add_limits();
  limit->set_resource(resource);
  limit->set_soft(value.rlim_cur);
  limit->set_hard(value.rlim_max);
}

}  // namespace

void Limits::AddToCommand(Command* command) const {
  AddLimit(RLIMIT_AS, rlimit_as_, command);
  AddLimit(RLIMIT_CPU, rlimit_cpu_, command);
  AddLimit(RLIMIT_FSIZE, rlimit_fsize_, command);
  AddLimit(RLIMIT_NOFILE, rlimit_nofile_, command);
  AddLimit(RLIMIT_CORE, rlimit_core_, command);
  AddLimit(RLIMIT_STACK, rlimit_stack_, command);
}

absl::StatusOr<std::vector<Rlimit>> ParseLimits(
    const google::protobuf::RepeatedPtrField<ResourceLimit>& limits) {
  std::vector<Rlimit> result;
  result.reserve(limits.size());
  for (const ResourceLimit& limit : limits) {
    if (limit.resource() < 0 || limit.resource() >= RLIM_NLIMITS) {
      return absl::InvalidArgumentError(
          absl::StrCat("invalid rlimit resource: ", limit.resource()));
    }
    if (limit.soft() > limit.hard()) {
      return absl::InvalidArgumentError(
          absl::StrCat(util::GetRlimitName(limit.resource()), ": soft limit ",
                       limit.soft(), " exceeds hard limit ", limit.hard()));
    }
    result.push_back({limit.resource(), {limit.soft(), limit.hard()}});
  }
  return result;
}

}  // namespace cinit

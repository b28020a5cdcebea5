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

#ifndef CINIT_UTIL_STATUS_MATCHERS_H_
#define CINIT_UTIL_STATUS_MATCHERS_H_

#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "cinit/util/status_macros.h"  // IWYU pragma: keep

#define CINIT_ASSERT_OK(expr) ASSERT_THAT(expr, ::cinit::IsOk())

#define CINIT_ASSERT_OK_AND_ASSIGN(lhs, rexpr) \
  CINIT_ASSERT_OK_AND_ASSIGN_IMPL(             \
      CINIT_MACROS_IMPL_CONCAT(_cinit_statusor, __LINE__), lhs, rexpr)

#define CINIT_ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                    \
  ASSERT_THAT(statusor.status(), ::cinit::IsOk());            \
  lhs = std::move(statusor).value()

namespace cinit {
namespace internal {

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace internal

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  return ::cinit::internal::GetStatus(arg).ok();
}

MATCHER_P(StatusIs, code,
          ::testing::PrintToString(code) + (negation ? " (negated)" : "")) {
  const absl::Status& status = ::cinit::internal::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code;
}

MATCHER_P2(StatusIs, code, message_matcher,
           ::testing::PrintToString(code) + (negation ? " (negated)" : "")) {
  const absl::Status& status = ::cinit::internal::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code &&
         ::testing::Matches(message_matcher)(std::string(status.message()));
}

}  // namespace cinit

#endif  // CINIT_UTIL_STATUS_MATCHERS_H_

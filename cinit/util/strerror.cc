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


#include "cinit/util/strerror.h"

#include <string.h>

#include <cerrno>
#include <cstddef>
#include <string>

#include "absl/strings/str_format.h"

namespace cinit {

const char* RawStrError(int errnum, char* buf, size_t buflen) {
  const int saved_errno = errno;
  // The descriptions are static, unlike the result of strerror().
  const char* str = strerrordesc_np(errnum);
  if (str == nullptr) {
    absl::SNPrintF(buf, buflen, "Unknown error %d", errnum);
    str = buf;
  }
  errno = saved_errno;
  return str;
}

std::string StrError(int errnum) {
  char buf[32];
  return RawStrError(errnum, buf, sizeof(buf));
}

}  // namespace cinit

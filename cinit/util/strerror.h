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

#ifndef CINIT_UTIL_STRERROR_H_
#define CINIT_UTIL_STRERROR_H_

#include <cstddef>
#include <string>

namespace cinit {

// Thread-safe description of errnum, "Unknown error nnn" for unknown codes.
std::string StrError(int errnum);

// Allocation free variant for the raw logger. buf is only used for unknown
// codes. Preserves errno.
const char* RawStrError(int errnum, char* buf, size_t buflen);

}  // namespace cinit

#endif  // CINIT_UTIL_STRERROR_H_

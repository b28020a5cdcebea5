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

#ifndef CINIT_UTIL_FILE_HELPERS_H_
#define CINIT_UTIL_FILE_HELPERS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace cinit::file {

absl::Status GetContents(absl::string_view path, std::string* output);

absl::Status SetContents(absl::string_view path, absl::string_view content);

}  // namespace cinit::file

#endif  // CINIT_UTIL_FILE_HELPERS_H_

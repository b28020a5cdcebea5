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

// Handlers of the single round-trip commands.
//
// Every handler sends exactly one Reply. Failures of the requested operation
// are reported in Reply.error and do not affect the returned status, which is
// non-OK only if the reply could not be sent.

#ifndef CINIT_HANDLERS_H_
#define CINIT_HANDLERS_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "cinit/comms.h"
#include "cinit/options.h"
#include "cinit/util/fileops.h"

namespace cinit {

// Sends an empty Reply if result is OK, a Reply carrying its message
// otherwise. fds are attached to successful replies only.
absl::Status SendResult(MessageChannel* channel, const absl::Status& result,
                        absl::Span<const int> fds = {});

absl::Status HandlePing(MessageChannel* channel);

// Copies everything readable from the single received descriptor into path.
// All descriptors are closed before this returns.
absl::Status HandleCopyIn(MessageChannel* channel, const std::string& path,
                          std::vector<file_util::fileops::FDCloser> fds);

// Replies with a read-only descriptor for path.
absl::Status HandleOpen(MessageChannel* channel, const std::string& path);

absl::Status HandleDelete(MessageChannel* channel, const std::string& path);

// Empties the temporary and the work directory.
absl::Status HandleReset(MessageChannel* channel, const InitOptions& options);

}  // namespace cinit

#endif  // CINIT_HANDLERS_H_

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

#include "cinit/handlers.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cinit/cinit.pb.h"
#include "cinit/util/raw_logging.h"
#include "cinit/wire.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;

absl::Status CopyIn(const std::string& path, std::vector<FDCloser> fds) {
  if (fds.size() != 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "CopyIn(", path, ") expects exactly one descriptor, got ",
        fds.size()));
  }
  FDCloser in_fd = std::move(fds[0]);
  FDCloser out_fd(
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0777));
  if (out_fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  if (file_util::fileops::CopyFD(in_fd.get(), out_fd.get()) == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("copying to ", path));
  }
  if (!out_fd.Close()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("close(", path, ")"));
  }
  return absl::OkStatus();
}

absl::Status Reset(const InitOptions& options) {
  for (const std::string* dir : {&options.tmp_dir, &options.work_dir}) {
    std::string error;
    if (!file_util::fileops::DeleteDirectoryContents(*dir, &error)) {
      return absl::InternalError(error);
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status SendResult(MessageChannel* channel, const absl::Status& result,
                        absl::Span<const int> fds) {
  Reply reply;
  if (!result.ok()) {
    CINIT_RAW_VLOG(1, "Command failed: %s", result.ToString().c_str());
    reply.set_error(std::string(result.message()));
    fds = {};
  }
  return SendReply(channel, reply, fds);
}

absl::Status HandlePing(MessageChannel* channel) {
  return SendResult(channel, absl::OkStatus());
}

absl::Status HandleCopyIn(MessageChannel* channel, const std::string& path,
                          std::vector<FDCloser> fds) {
  return SendResult(channel, CopyIn(path, std::move(fds)));
}

absl::Status HandleOpen(MessageChannel* channel, const std::string& path) {
  FDCloser fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) {
    return SendResult(
        channel, absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")")));
  }
  // The peer gets its own copy, ours is closed either way.
  return SendResult(channel, absl::OkStatus(), {fd.get()});
}

absl::Status HandleDelete(MessageChannel* channel, const std::string& path) {
  // Removes files and empty directories alike.
  if (remove(path.c_str()) == -1) {
    return SendResult(channel, absl::ErrnoToStatus(
                                   errno, absl::StrCat("remove(", path, ")")));
  }
  return SendResult(channel, absl::OkStatus());
}

absl::Status HandleReset(MessageChannel* channel, const InitOptions& options) {
  return SendResult(channel, Reset(options));
}

}  // namespace cinit

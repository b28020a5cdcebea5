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

// Implementation of cinit::Comms class.

#include "cinit/comms.h"

#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/dynamic_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "cinit/util/fileops.h"
#include "cinit/util/raw_logging.h"

namespace cinit {
namespace {

using ::cinit::file_util::fileops::FDCloser;

bool IsFatalError(int saved_errno) {
  return saved_errno != EAGAIN && saved_errno != EWOULDBLOCK &&
         saved_errno != EFAULT && saved_errno != EINTR &&
         saved_errno != EINVAL && saved_errno != ENOMEM;
}

// Large enough for kMaxFds descriptors plus one credential triple.
constexpr size_t kControlSize =
    CMSG_SPACE(sizeof(int) * MessageChannel::kMaxFds) +
    CMSG_SPACE(sizeof(ucred));

}  // namespace

Comms::Comms(int fd) : connection_fd_(fd) {
  // Credentials are only delivered to sockets that asked for them.
  int enable = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_PASSCRED, &enable, sizeof(enable)) == -1) {
    CINIT_RAW_PLOG(WARNING, "setsockopt(SO_PASSCRED) on fd %d", fd);
  }
}

absl::StatusOr<std::pair<std::unique_ptr<Comms>, std::unique_ptr<Comms>>>
Comms::CreatePair() {
  int sv[2];
  if (socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, sv) == -1) {
    return absl::ErrnoToStatus(errno, "socketpair()");
  }
  return std::make_pair(std::make_unique<Comms>(sv[0]),
                        std::make_unique<Comms>(sv[1]));
}

absl::Status Comms::SendMsg(absl::Span<const uint8_t> payload,
                            absl::Span<const int> fds,
                            const std::optional<Credentials>& creds) {
  if (fds.size() > kMaxFds) {
    return absl::InvalidArgumentError(
        absl::StrCat("too many descriptors: ", fds.size(), " > ", kMaxFds));
  }
  if (IsTerminated()) {
    return absl::UnavailableError("SendMsg: connection terminated");
  }

  alignas(cmsghdr) char control[kControlSize];
  memset(control, 0, sizeof(control));

  iovec iov = {.iov_base = const_cast<uint8_t*>(payload.data()),
               .iov_len = payload.size()};
  msghdr msg = {};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  msg.msg_control = control;

  size_t control_len = 0;
  if (!fds.empty()) {
    control_len += CMSG_SPACE(sizeof(int) * fds.size());
  }
  if (creds.has_value()) {
    control_len += CMSG_SPACE(sizeof(ucred));
  }
  msg.msg_controllen = control_len;

  cmsghdr* cmsg = control_len > 0 ? CMSG_FIRSTHDR(&msg) : nullptr;
  if (!fds.empty()) {
    cmsg->cmsg_level = SOL_SOCKET;
    cmsg->cmsg_type = SCM_RIGHTS;
    cmsg->cmsg_len = CMSG_LEN(sizeof(int) * fds.size());
    memcpy(CMSG_DATA(cmsg), fds.data(), sizeof(int) * fds.size());
    cmsg = CMSG_NXTHDR(&msg, cmsg);
  }
  if (creds.has_value()) {
    ucred uc = {.pid = creds->pid, .uid = creds->uid, .gid = creds->gid};
    cmsg->cmsg_level = SOL_SOCKET;
    cmsg->cmsg_type = SCM_CREDENTIALS;
    cmsg->cmsg_len = CMSG_LEN(sizeof(uc));
    memcpy(CMSG_DATA(cmsg), &uc, sizeof(uc));
  }
  if (control_len == 0) {
    msg.msg_control = nullptr;
  }

  absl::MutexLock lock(&send_mutex_);
  ssize_t len = TEMP_FAILURE_RETRY(
      sendmsg(connection_fd_.get(), &msg, MSG_NOSIGNAL));
  if (len == -1 && errno == EPIPE) {
    Terminate();
    CINIT_RAW_LOG(ERROR, "sendmsg: Peer disconnected");
    return absl::UnavailableError("SendMsg: peer disconnected");
  }
  if (len < 0) {
    int saved_errno = errno;
    if (IsFatalError(saved_errno)) {
      Terminate();
    }
    CINIT_RAW_PLOG(ERROR, "sendmsg()");
    return absl::ErrnoToStatus(saved_errno, "sendmsg()");
  }
  if (static_cast<size_t>(len) != payload.size()) {
    CINIT_RAW_LOG(ERROR, "Expected to send %zu bytes, sent %zd",
                  payload.size(), len);
    return absl::DataLossError(absl::StrCat(
        "short send: ", len, " of ", payload.size(), " bytes"));
  }
  CINIT_RAW_VLOG(3, "Sent %zu bytes, %zu fds%s", payload.size(), fds.size(),
                 creds.has_value() ? ", credentials" : "");
  return absl::OkStatus();
}

absl::StatusOr<ReceivedMessage> Comms::RecvMsg(absl::Span<uint8_t> buffer) {
  if (IsTerminated()) {
    return absl::UnavailableError("RecvMsg: connection terminated");
  }

  alignas(cmsghdr) char control[kControlSize];
  iovec iov = {.iov_base = buffer.data(), .iov_len = buffer.size()};
  msghdr msg = {};
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  msg.msg_control = control;
  msg.msg_controllen = sizeof(control);

  ssize_t len;
  {
    absl::MutexLock lock(&recv_mutex_);
    len = TEMP_FAILURE_RETRY(
        recvmsg(connection_fd_.get(), &msg, MSG_CMSG_CLOEXEC));
  }
  if (len < 0) {
    int saved_errno = errno;
    if (IsFatalError(saved_errno)) {
      Terminate();
    }
    CINIT_RAW_PLOG(ERROR, "recvmsg()");
    return absl::ErrnoToStatus(saved_errno, "recvmsg()");
  }
  ABSL_ANNOTATE_MEMORY_IS_INITIALIZED(&msg, sizeof(msg));

  // Take ownership of whatever arrived before looking at the flags, so that
  // nothing leaks on the error paths below.
  ReceivedMessage received;
  received.size = len;
  for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr;
       cmsg = CMSG_NXTHDR(&msg, cmsg)) {
    ABSL_ANNOTATE_MEMORY_IS_INITIALIZED(cmsg, sizeof(cmsghdr));
    if (cmsg->cmsg_level != SOL_SOCKET) {
      continue;
    }
    if (cmsg->cmsg_type == SCM_RIGHTS) {
      size_t count = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
      const unsigned char* data = CMSG_DATA(cmsg);
      for (size_t i = 0; i < count; ++i) {
        int fd;
        memcpy(&fd, data + i * sizeof(int), sizeof(fd));
        received.fds.emplace_back(fd);
      }
    } else if (cmsg->cmsg_type == SCM_CREDENTIALS &&
               cmsg->cmsg_len == CMSG_LEN(sizeof(ucred))) {
      ucred uc;
      memcpy(&uc, CMSG_DATA(cmsg), sizeof(uc));
      received.creds = Credentials{uc.pid, uc.uid, uc.gid};
    }
  }

  if (len == 0 && received.fds.empty()) {
    peer_closed_ = true;
    Terminate();
    CINIT_RAW_VLOG(1, "RecvMsg: end-point terminated the connection.");
    return absl::UnavailableError("RecvMsg: connection terminated");
  }
  if (msg.msg_flags & MSG_TRUNC) {
    CINIT_RAW_LOG(ERROR, "recvmsg(): payload truncated (buffer: %zu bytes)",
                  buffer.size());
    return absl::ResourceExhaustedError("message payload truncated");
  }
  if (msg.msg_flags & MSG_CTRUNC) {
    CINIT_RAW_LOG(ERROR,
                  "recvmsg(): control data truncated, too many descriptors "
                  "or out of free file descriptors");
    return absl::ResourceExhaustedError("message control data truncated");
  }
  CINIT_RAW_VLOG(3, "Received %zd bytes, %zu fds%s", len, received.fds.size(),
                 received.creds.has_value() ? ", credentials" : "");
  return received;
}

}  // namespace cinit

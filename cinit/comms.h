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

// The cinit::Comms class sends whole messages over a connected AF_UNIX
// SOCK_SEQPACKET socket. Every message is a byte payload plus optional
// ancillary data: a list of file descriptors (SCM_RIGHTS) and/or a process
// credential triple (SCM_CREDENTIALS).
//
// One thread may send while another one receives. Concurrent senders (or
// concurrent receivers) are serialized.

#ifndef CINIT_COMMS_H_
#define CINIT_COMMS_H_

#include <sys/types.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "cinit/util/fileops.h"

namespace cinit {

// Process credentials attached to a message.
struct Credentials {
  pid_t pid = 0;
  uid_t uid = 0;
  gid_t gid = 0;
};

// Result of a single receive. The descriptors are owned by the message and
// are closed when it goes out of scope unless released.
struct ReceivedMessage {
  size_t size = 0;
  std::vector<file_util::fileops::FDCloser> fds;
  std::optional<Credentials> creds;
};

// A bidirectional, message-oriented channel with descriptor and credential
// passing.
class MessageChannel {
 public:
  // Maximum number of descriptors per message.
  static constexpr size_t kMaxFds = 16;

  virtual ~MessageChannel() = default;

  // Sends one message. The descriptors stay owned by the caller; the peer
  // receives duplicates of them.
  virtual absl::Status SendMsg(absl::Span<const uint8_t> payload,
                               absl::Span<const int> fds,
                               const std::optional<Credentials>& creds) = 0;

  // Receives one message into buffer. A message larger than the buffer is an
  // error. An orderly shutdown of the peer yields an error too, after which
  // PeerClosed() returns true.
  virtual absl::StatusOr<ReceivedMessage> RecvMsg(
      absl::Span<uint8_t> buffer) = 0;

  // Whether the channel can no longer be used, either because the peer
  // closed it or because of a fatal socket error.
  virtual bool IsTerminated() const = 0;

  // Whether the peer shut the channel down in an orderly way.
  virtual bool PeerClosed() const = 0;
};

class Comms : public MessageChannel {
 public:
  // Descriptor the control channel is conventionally handed over on.
  static constexpr int kDefaultCommsFd = 3;

  // Instantiates a pre-connected object.
  // Takes ownership over fd, which will be closed on object's destruction.
  explicit Comms(int fd);

  Comms(const Comms&) = delete;
  Comms& operator=(const Comms&) = delete;

  ~Comms() override = default;

  // Creates two connected, close-on-exec end-points.
  static absl::StatusOr<std::pair<std::unique_ptr<Comms>, std::unique_ptr<Comms>>>
  CreatePair();

  absl::Status SendMsg(absl::Span<const uint8_t> payload,
                       absl::Span<const int> fds,
                       const std::optional<Credentials>& creds) override;

  absl::StatusOr<ReceivedMessage> RecvMsg(absl::Span<uint8_t> buffer) override;

  bool IsTerminated() const override { return terminated_; }
  bool PeerClosed() const override { return peer_closed_; }

  // Marks the channel as terminated. The descriptor itself is closed on
  // destruction only, as another thread might still be using it.
  void Terminate() { terminated_ = true; }

  // Returns the already connected FD.
  int GetConnectionFD() const { return connection_fd_.get(); }

 private:
  file_util::fileops::FDCloser connection_fd_;

  // Serializes whole messages in each direction.
  absl::Mutex send_mutex_;
  absl::Mutex recv_mutex_;

  std::atomic<bool> terminated_{false};
  std::atomic<bool> peer_closed_{false};
};

}  // namespace cinit

#endif  // CINIT_COMMS_H_

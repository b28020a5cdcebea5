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

// Framing of Command and Reply messages on the control channel.
//
// Every payload is a TLV frame: a 32-bit tag, a 32-bit body length and the
// serialized protobuf body. The byte order is the host's, as the channel is a
// local AF_UNIX socket.

#ifndef CINIT_WIRE_H_
#define CINIT_WIRE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "cinit/buffer_pool.h"
#include "cinit/cinit.pb.h"
#include "cinit/comms.h"
#include "cinit/util/fileops.h"

namespace cinit {

inline constexpr uint32_t kTagCommand = 0x80000401;
inline constexpr uint32_t kTagReply = 0x80000402;

absl::StatusOr<std::string> EncodeCommand(const Command& command);
absl::StatusOr<std::string> EncodeReply(const Reply& reply);

// Parses a frame. Any mismatch in the tag, the length or the body is an error
// and nothing is returned, so callers never see a partially parsed message.
// A command with an unknown or unspecified type is rejected as well.
absl::StatusOr<Command> DecodeCommand(absl::Span<const uint8_t> payload);
absl::StatusOr<Reply> DecodeReply(absl::Span<const uint8_t> payload);

struct ReceivedCommand {
  Command command;
  std::vector<file_util::fileops::FDCloser> fds;
};

struct ReceivedReply {
  Reply reply;
  std::vector<file_util::fileops::FDCloser> fds;
  std::optional<Credentials> creds;
};

// Receives and decodes one command using a buffer leased from pool. The
// buffer goes back to the pool before this returns, on every path.
absl::StatusOr<ReceivedCommand> RecvCommand(MessageChannel* channel,
                                            BufferPool* pool);
absl::StatusOr<ReceivedCommand> RecvCommand(MessageChannel* channel);

absl::StatusOr<ReceivedReply> RecvReply(MessageChannel* channel,
                                        BufferPool* pool);
absl::StatusOr<ReceivedReply> RecvReply(MessageChannel* channel);

absl::Status SendCommand(MessageChannel* channel, const Command& command,
                         absl::Span<const int> fds = {});

absl::Status SendReply(MessageChannel* channel, const Reply& reply,
                       absl::Span<const int> fds = {},
                       const std::optional<Credentials>& creds = std::nullopt);

}  // namespace cinit

#endif  // CINIT_WIRE_H_

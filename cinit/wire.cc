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

#include "cinit/wire.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "google/protobuf/message_lite.h"
#include "cinit/buffer_pool.h"
#include "cinit/cinit.pb.h"
#include "cinit/comms.h"
#include "cinit/util/raw_logging.h"
#include "cinit/util/status_macros.h"

namespace cinit {
namespace {

struct ABSL_ATTRIBUTE_PACKED FrameHeader {
  uint32_t tag;
  uint32_t len;
};

absl::StatusOr<std::string> Encode(uint32_t tag,
                                   const google::protobuf::MessageLite& msg) {
  size_t body_size = msg.ByteSizeLong();
  if (body_size > BufferPool::kBufferSize - sizeof(FrameHeader)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "message too large: ", body_size, " bytes, limit ",
        BufferPool::kBufferSize - sizeof(FrameHeader)));
  }
  FrameHeader header = {tag, static_cast<uint32_t>(body_size)};
  std::string payload(sizeof(header) + body_size, '\0');
  memcpy(&payload[0], &header, sizeof(header));
  if (!msg.SerializeToArray(&payload[sizeof(header)], body_size)) {
    return absl::InternalError(
        absl::StrCat("failed to serialize ", msg.GetTypeName()));
  }
  return payload;
}

absl::Status Decode(uint32_t expected_tag, absl::Span<const uint8_t> payload,
                    google::protobuf::MessageLite* msg) {
  FrameHeader header;
  if (payload.size() < sizeof(header)) {
    return absl::DataLossError(absl::StrCat(
        "truncated frame header: ", payload.size(), " bytes"));
  }
  memcpy(&header, payload.data(), sizeof(header));
  if (header.tag != expected_tag) {
    return absl::DataLossError(absl::StrFormat(
        "unexpected frame tag: 0x%x, expected 0x%x", header.tag,
        expected_tag));
  }
  size_t body_size = payload.size() - sizeof(header);
  if (header.len != body_size) {
    return absl::DataLossError(absl::StrCat("frame length mismatch: header says ",
                                            header.len, ", body has ",
                                            body_size));
  }
  if (body_size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
      !msg->ParseFromArray(payload.data() + sizeof(header), body_size)) {
    msg->Clear();
    return absl::DataLossError(
        absl::StrCat("failed to parse ", msg->GetTypeName()));
  }
  return absl::OkStatus();
}

absl::Span<const uint8_t> AsBytes(const std::string& s) {
  return absl::MakeConstSpan(reinterpret_cast<const uint8_t*>(s.data()),
                             s.size());
}

}  // namespace

absl::StatusOr<std::string> EncodeCommand(const Command& command) {
  return Encode(kTagCommand, command);
}

absl::StatusOr<std::string> EncodeReply(const Reply& reply) {
  return Encode(kTagReply, reply);
}

absl::StatusOr<Command> DecodeCommand(absl::Span<const uint8_t> payload) {
  Command command;
  CINIT_RETURN_IF_ERROR(Decode(kTagCommand, payload, &command));
  if (command.type() == COMMAND_UNSPECIFIED ||
      !CommandType_IsValid(command.type())) {
    return absl::DataLossError(
        absl::StrCat("invalid command type: ", command.type()));
  }
  return command;
}

absl::StatusOr<Reply> DecodeReply(absl::Span<const uint8_t> payload) {
  Reply reply;
  CINIT_RETURN_IF_ERROR(Decode(kTagReply, payload, &reply));
  return reply;
}

absl::StatusOr<ReceivedCommand> RecvCommand(MessageChannel* channel,
                                            BufferPool* pool) {
  BufferPool::Lease lease = pool->Acquire();
  CINIT_ASSIGN_OR_RETURN(ReceivedMessage msg, channel->RecvMsg(lease.span()));
  CINIT_ASSIGN_OR_RETURN(
      Command command,
      DecodeCommand(absl::MakeConstSpan(lease.data(), msg.size)));
  CINIT_RAW_VLOG(2, "Received command %s with %zu fds",
                 CommandType_Name(command.type()).c_str(), msg.fds.size());
  return ReceivedCommand{std::move(command), std::move(msg.fds)};
}

absl::StatusOr<ReceivedCommand> RecvCommand(MessageChannel* channel) {
  return RecvCommand(channel, &BufferPool::Shared());
}

absl::StatusOr<ReceivedReply> RecvReply(MessageChannel* channel,
                                        BufferPool* pool) {
  BufferPool::Lease lease = pool->Acquire();
  CINIT_ASSIGN_OR_RETURN(ReceivedMessage msg, channel->RecvMsg(lease.span()));
  CINIT_ASSIGN_OR_RETURN(
      Reply reply, DecodeReply(absl::MakeConstSpan(lease.data(), msg.size)));
  return ReceivedReply{std::move(reply), std::move(msg.fds), msg.creds};
}

absl::StatusOr<ReceivedReply> RecvReply(MessageChannel* channel) {
  return RecvReply(channel, &BufferPool::Shared());
}

absl::Status SendCommand(MessageChannel* channel, const Command& command,
                         absl::Span<const int> fds) {
  CINIT_ASSIGN_OR_RETURN(std::string payload, EncodeCommand(command));
  return channel->SendMsg(AsBytes(payload), fds, std::nullopt);
}

absl::Status SendReply(MessageChannel* channel, const Reply& reply,
                       absl::Span<const int> fds,
                       const std::optional<Credentials>& creds) {
  CINIT_ASSIGN_OR_RETURN(std::string payload, EncodeReply(reply));
  return channel->SendMsg(AsBytes(payload), fds, creds);
}

}  // namespace cinit

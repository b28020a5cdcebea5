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

#include "cinit/comms.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "cinit/util/fileops.h"
#include "cinit/util/status_matchers.h"

namespace cinit {
namespace {

using ::cinit::IsOk;
using ::cinit::StatusIs;
using ::cinit::file_util::fileops::FDCloser;
using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::Not;
using ::testing::SizeIs;

using CommunicationHandler = std::function<void(Comms* comms)>;

absl::Span<const uint8_t> AsBytes(absl::string_view s) {
  return absl::MakeConstSpan(reinterpret_cast<const uint8_t*>(s.data()),
                             s.size());
}

// Helper function that handles the communication between the two handler
// functions.
void HandleCommunication(const CommunicationHandler& a,
                         const CommunicationHandler& b) {
  CINIT_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
  std::unique_ptr<Comms> remote_comms = std::move(pair.second);

  // Start handler a.
  std::thread remote([&remote_comms, &a]() { a(remote_comms.get()); });

  // Run handler b.
  b(pair.first.get());
  remote.join();
}

TEST(CommsTest, PayloadIsDeliveredAsOneMessage) {
  constexpr absl::string_view kPayload("test\0\n\r\t\x01\x02", 10);
  auto a = [&](Comms* comms) {
    ASSERT_THAT(comms->SendMsg(AsBytes(kPayload), {}, std::nullopt), IsOk());
  };
  auto b = [&](Comms* comms) {
    std::vector<uint8_t> buffer(128);
    CINIT_ASSERT_OK_AND_ASSIGN(ReceivedMessage msg,
                               comms->RecvMsg(absl::MakeSpan(buffer)));
    ASSERT_THAT(msg.size, Eq(kPayload.size()));
    EXPECT_THAT(absl::string_view(reinterpret_cast<char*>(buffer.data()),
                                  msg.size),
                Eq(kPayload));
    EXPECT_THAT(msg.fds, SizeIs(0));
  };
  HandleCommunication(a, b);
}

TEST(CommsTest, DescriptorsArePassedInOrder) {
  int first[2];
  int second[2];
  ASSERT_THAT(pipe2(first, O_CLOEXEC), Eq(0));
  ASSERT_THAT(pipe2(second, O_CLOEXEC), Eq(0));
  FDCloser first_read(first[0]);
  FDCloser first_write(first[1]);
  FDCloser second_read(second[0]);
  FDCloser second_write(second[1]);

  auto a = [&](Comms* comms) {
    const int fds[] = {first_write.get(), second_write.get()};
    ASSERT_THAT(comms->SendMsg(AsBytes("fds"), fds, std::nullopt), IsOk());
  };
  auto b = [&](Comms* comms) {
    std::vector<uint8_t> buffer(128);
    CINIT_ASSERT_OK_AND_ASSIGN(ReceivedMessage msg,
                               comms->RecvMsg(absl::MakeSpan(buffer)));
    ASSERT_THAT(msg.fds, SizeIs(2));
    for (const FDCloser& fd : msg.fds) {
      // Received descriptors must never leak into an exec'd program.
      EXPECT_THAT(fcntl(fd.get(), F_GETFD) & FD_CLOEXEC, Ne(0));
    }
    ASSERT_THAT(write(msg.fds[0].get(), "1", 1), Eq(1));
    ASSERT_THAT(write(msg.fds[1].get(), "2", 1), Eq(1));
  };
  HandleCommunication(a, b);

  char c;
  ASSERT_THAT(read(first_read.get(), &c, 1), Eq(1));
  EXPECT_THAT(c, Eq('1'));
  ASSERT_THAT(read(second_read.get(), &c, 1), Eq(1));
  EXPECT_THAT(c, Eq('2'));
}

TEST(CommsTest, CredentialsArePassed) {
  auto a = [](Comms* comms) {
    Credentials creds{getpid(), getuid(), getgid()};
    ASSERT_THAT(comms->SendMsg(AsBytes("creds"), {}, creds), IsOk());
  };
  auto b = [](Comms* comms) {
    std::vector<uint8_t> buffer(128);
    CINIT_ASSERT_OK_AND_ASSIGN(ReceivedMessage msg,
                               comms->RecvMsg(absl::MakeSpan(buffer)));
    ASSERT_THAT(msg.creds.has_value(), IsTrue());
    EXPECT_THAT(msg.creds->pid, Eq(getpid()));
    EXPECT_THAT(msg.creds->uid, Eq(getuid()));
    EXPECT_THAT(msg.creds->gid, Eq(getgid()));
  };
  HandleCommunication(a, b);
}

TEST(CommsTest, OversizedPayloadIsAnError) {
  const std::string payload(256, 'x');
  auto a = [&](Comms* comms) {
    ASSERT_THAT(comms->SendMsg(AsBytes(payload), {}, std::nullopt), IsOk());
  };
  auto b = [](Comms* comms) {
    std::vector<uint8_t> buffer(16);
    EXPECT_THAT(comms->RecvMsg(absl::MakeSpan(buffer)),
                StatusIs(absl::StatusCode::kResourceExhausted));
    EXPECT_THAT(comms->IsTerminated(), IsFalse());
  };
  HandleCommunication(a, b);
}

TEST(CommsTest, TooManyDescriptorsAreRejected) {
  CINIT_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
  std::vector<int> fds(MessageChannel::kMaxFds + 1, STDERR_FILENO);
  EXPECT_THAT(pair.first->SendMsg(AsBytes("x"), fds, std::nullopt),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CommsTest, PeerCloseTerminates) {
  CINIT_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
  pair.second.reset();

  std::vector<uint8_t> buffer(16);
  EXPECT_THAT(pair.first->RecvMsg(absl::MakeSpan(buffer)),
              StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_THAT(pair.first->IsTerminated(), IsTrue());
  EXPECT_THAT(pair.first->PeerClosed(), IsTrue());
  EXPECT_THAT(pair.first->SendMsg(AsBytes("x"), {}, std::nullopt),
              StatusIs(absl::StatusCode::kUnavailable));
}

TEST(CommsTest, SocketErrorIsNotAnOrderlyClose) {
  int fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  ASSERT_THAT(fd, Ne(-1));
  Comms comms(fd);

  std::vector<uint8_t> buffer(16);
  EXPECT_THAT(comms.RecvMsg(absl::MakeSpan(buffer)), Not(IsOk()));
  EXPECT_THAT(comms.IsTerminated(), IsTrue());
  EXPECT_THAT(comms.PeerClosed(), IsFalse());
}

TEST(CommsTest, SendWhileAnotherThreadReceives) {
  CINIT_ASSERT_OK_AND_ASSIGN(auto pair, Comms::CreatePair());
  Comms* local = pair.first.get();
  Comms* remote = pair.second.get();

  std::thread receiver([local]() {
    std::vector<uint8_t> buffer(16);
    CINIT_ASSERT_OK_AND_ASSIGN(ReceivedMessage msg,
                               local->RecvMsg(absl::MakeSpan(buffer)));
    EXPECT_THAT(msg.size, Eq(4));
  });

  // The receiver blocks holding the receive lock; sending must not wait on it.
  ASSERT_THAT(local->SendMsg(AsBytes("ping"), {}, std::nullopt), IsOk());
  std::vector<uint8_t> buffer(16);
  CINIT_ASSERT_OK_AND_ASSIGN(ReceivedMessage msg,
                             remote->RecvMsg(absl::MakeSpan(buffer)));
  EXPECT_THAT(msg.size, Eq(4));
  ASSERT_THAT(remote->SendMsg(AsBytes("pong"), {}, std::nullopt), IsOk());
  receiver.join();
}

}  // namespace
}  // namespace cinit

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

#include "cinit/testing.h"

#include <fcntl.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "cinit/util/fileops.h"
#include "cinit/util/raw_logging.h"
#include "cinit/util/temp_file.h"

namespace cinit {

std::string GetTestTempPath(absl::string_view name) {
  // Test runners may provide a scratch directory. Otherwise one is created
  // per process.
  static const std::string* base = new std::string([] {
    if (const char* test_tmpdir = getenv("TEST_TMPDIR");
        test_tmpdir != nullptr && *test_tmpdir != '\0') {
      return std::string(test_tmpdir);
    }
    absl::StatusOr<std::string> dir = CreateTempDir("/tmp/cinit_test.");
    CINIT_RAW_CHECK(dir.ok(), "could not create a test temp directory");
    return *std::move(dir);
  }());
  if (name.empty()) {
    return *base;
  }
  return absl::StrCat(*base, "/", name);
}

int CountOpenFDs() {
  std::vector<std::string> entries;
  std::string error;
  if (!file_util::fileops::ListDirectoryEntries("/proc/self/fd", &entries,
                                                &error)) {
    CINIT_RAW_LOG(ERROR, "%s", error.c_str());
    return -1;
  }
  // Do not count the descriptor used for listing.
  return static_cast<int>(entries.size()) - 1;
}

std::pair<std::unique_ptr<InMemoryChannel>, std::unique_ptr<InMemoryChannel>>
InMemoryChannel::CreatePair() {
  auto a_to_b = std::make_shared<Queue>();
  auto b_to_a = std::make_shared<Queue>();
  return std::make_pair(
      std::unique_ptr<InMemoryChannel>(new InMemoryChannel(b_to_a, a_to_b)),
      std::unique_ptr<InMemoryChannel>(new InMemoryChannel(a_to_b, b_to_a)));
}

InMemoryChannel::~InMemoryChannel() { Close(); }

void InMemoryChannel::CloseQueue(Queue* queue) {
  absl::MutexLock lock(&queue->mutex);
  queue->closed = true;
}

void InMemoryChannel::Close() {
  CloseQueue(inbox_.get());
  CloseQueue(outbox_.get());
}

absl::Status InMemoryChannel::SendMsg(absl::Span<const uint8_t> payload,
                                      absl::Span<const int> fds,
                                      const std::optional<Credentials>& creds) {
  if (fds.size() > kMaxFds) {
    return absl::InvalidArgumentError(
        absl::StrCat("too many descriptors: ", fds.size(), " > ", kMaxFds));
  }
  Message message;
  message.payload.assign(payload.begin(), payload.end());
  for (int fd : fds) {
    int copy = fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy == -1) {
      return absl::ErrnoToStatus(errno, absl::StrCat("duplicating fd ", fd));
    }
    message.fds.emplace_back(copy);
  }
  message.creds = creds;

  absl::MutexLock lock(&outbox_->mutex);
  if (outbox_->closed) {
    return absl::UnavailableError("SendMsg: peer disconnected");
  }
  outbox_->messages.push_back(std::move(message));
  return absl::OkStatus();
}

absl::StatusOr<ReceivedMessage> InMemoryChannel::RecvMsg(
    absl::Span<uint8_t> buffer) {
  Message message;
  {
    absl::MutexLock lock(&inbox_->mutex);
    Queue* queue = inbox_.get();
    inbox_->mutex.Await(absl::Condition(
        +[](Queue* q) { return !q->messages.empty() || q->closed; }, queue));
    if (queue->messages.empty()) {
      terminated_ = true;
      return absl::UnavailableError("RecvMsg: connection terminated");
    }
    message = std::move(queue->messages.front());
    queue->messages.pop_front();
  }
  if (message.payload.size() > buffer.size()) {
    return absl::ResourceExhaustedError("message payload truncated");
  }
  memcpy(buffer.data(), message.payload.data(), message.payload.size());
  ReceivedMessage received;
  received.size = message.payload.size();
  received.fds = std::move(message.fds);
  received.creds = message.creds;
  return received;
}

}  // namespace cinit

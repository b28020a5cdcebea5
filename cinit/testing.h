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

#ifndef CINIT_TESTING_H_
#define CINIT_TESTING_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "cinit/comms.h"
#include "cinit/util/fileops.h"

namespace cinit {

// Returns a writable path usable in tests. If the name argument is specified,
// returns a name under that path. This can then be used for creating temporary
// test files and/or directories.
std::string GetTestTempPath(absl::string_view name = {});

// Returns the number of descriptors currently open in this process, or -1 if
// they cannot be listed.
int CountOpenFDs();

// One end of a connected pair of in-process channels. Descriptors are
// duplicated on send. Credentials are delivered exactly as attached, without
// the permission checks the kernel applies to SCM_CREDENTIALS, so tests need
// no privileges to pass the pid of a child.
class InMemoryChannel : public MessageChannel {
 public:
  static std::pair<std::unique_ptr<InMemoryChannel>,
                   std::unique_ptr<InMemoryChannel>>
  CreatePair();

  InMemoryChannel(const InMemoryChannel&) = delete;
  InMemoryChannel& operator=(const InMemoryChannel&) = delete;

  // Closes the channel in both directions.
  ~InMemoryChannel() override;

  absl::Status SendMsg(absl::Span<const uint8_t> payload,
                       absl::Span<const int> fds,
                       const std::optional<Credentials>& creds) override;

  absl::StatusOr<ReceivedMessage> RecvMsg(absl::Span<uint8_t> buffer) override;

  bool IsTerminated() const override { return terminated_; }
  bool PeerClosed() const override { return terminated_; }

  // Same as destroying this end, but keeps the object around.
  void Close();

 private:
  struct Message {
    std::vector<uint8_t> payload;
    std::vector<file_util::fileops::FDCloser> fds;
    std::optional<Credentials> creds;
  };

  struct Queue {
    absl::Mutex mutex;
    std::deque<Message> messages ABSL_GUARDED_BY(mutex);
    bool closed ABSL_GUARDED_BY(mutex) = false;
  };

  InMemoryChannel(std::shared_ptr<Queue> inbox, std::shared_ptr<Queue> outbox)
      : inbox_(std::move(inbox)), outbox_(std::move(outbox)) {}

  static void CloseQueue(Queue* queue);

  std::shared_ptr<Queue> inbox_;
  std::shared_ptr<Queue> outbox_;
  std::atomic<bool> terminated_{false};
};

}  // namespace cinit

#endif  // CINIT_TESTING_H_

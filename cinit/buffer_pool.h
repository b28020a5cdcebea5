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

// A small pool of fixed-size receive buffers. Buffers are handed out as
// move-only leases which give the memory back to the pool when destroyed, so a
// buffer can never outlive the scope that acquired it.

#ifndef CINIT_BUFFER_POOL_H_
#define CINIT_BUFFER_POOL_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"

namespace cinit {

class BufferPool {
 public:
  // Size of every buffer handed out by the pool.
  static constexpr size_t kBufferSize = 64 << 10;
  // Released buffers beyond this count are freed instead of being cached.
  static constexpr size_t kMaxCached = 8;

  class Lease {
   public:
    Lease(Lease&& other) noexcept
        : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
      other.pool_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease();

    uint8_t* data() const { return buffer_.get(); }
    size_t size() const { return buffer_ ? kBufferSize : 0; }
    absl::Span<uint8_t> span() const { return {data(), size()}; }

   private:
    friend class BufferPool;

    Lease(BufferPool* pool, std::unique_ptr<uint8_t[]> buffer)
        : pool_(pool), buffer_(std::move(buffer)) {}

    void Return();

    BufferPool* pool_;
    std::unique_ptr<uint8_t[]> buffer_;
  };

  BufferPool() = default;
  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Returns the process-wide pool used by the control channel.
  static BufferPool& Shared();

  // Hands out a cached buffer or allocates a new one.
  Lease Acquire();

  // Number of buffers currently waiting in the pool.
  size_t cached() const;

 private:
  void Release(std::unique_ptr<uint8_t[]> buffer);

  mutable absl::Mutex mu_;
  std::vector<std::unique_ptr<uint8_t[]>> free_ ABSL_GUARDED_BY(mu_);
};

}  // namespace cinit

#endif  // CINIT_BUFFER_POOL_H_

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

#include "cinit/buffer_pool.h"

#include <cstdint>
#include <memory>
#include <utility>

#include "absl/synchronization/mutex.h"

namespace cinit {

BufferPool::Lease& BufferPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    Return();
    pool_ = other.pool_;
    buffer_ = std::move(other.buffer_);
    other.pool_ = nullptr;
  }
  return *this;
}

BufferPool::Lease::~Lease() { Return(); }

void BufferPool::Lease::Return() {
  if (pool_ != nullptr && buffer_ != nullptr) {
    pool_->Release(std::move(buffer_));
  }
  pool_ = nullptr;
  buffer_.reset();
}

BufferPool& BufferPool::Shared() {
  static BufferPool* pool = new BufferPool();
  return *pool;
}

BufferPool::Lease BufferPool::Acquire() {
  {
    absl::MutexLock lock(&mu_);
    if (!free_.empty()) {
      std::unique_ptr<uint8_t[]> buffer = std::move(free_.back());
      free_.pop_back();
      return Lease(this, std::move(buffer));
    }
  }
  return Lease(this, std::make_unique<uint8_t[]>(kBufferSize));
}

size_t BufferPool::cached() const {
  absl::MutexLock lock(&mu_);
  return free_.size();
}

void BufferPool::Release(std::unique_ptr<uint8_t[]> buffer) {
  absl::MutexLock lock(&mu_);
  if (free_.size() < kMaxCached) {
    free_.push_back(std::move(buffer));
  }
}

}  // namespace cinit

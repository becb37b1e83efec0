// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "omeslice/tiff/tiff_handle_pool.h"

#include <algorithm>
#include <thread>
#include <utility>

#include "absl/log/log.h"
#include "omeslice/core/errors.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

TIFFHandleGuard::~TIFFHandleGuard() noexcept {
  Release();
}

void TIFFHandleGuard::Release() {
  if (handle_ != nullptr && pool_ != nullptr) {
    pool_->Release(handle_);
  }
  handle_ = nullptr;
  pool_ = nullptr;
}

absl::StatusOr<std::unique_ptr<TIFFHandlePool>> TIFFHandlePool::Create(
    const std::filesystem::path& path, unsigned pool_size) {
  // "rm": read-only, no memory mapping; handles see the same bytes.
  TIFF* initial = TIFFOpen(path.string().c_str(), "rm");
  if (initial == nullptr) {
    return TRACE_STATUS(
        SourceReadError("Cannot open TIFF file: " + path.string()));
  }

  auto pool = std::unique_ptr<TIFFHandlePool>(
      new TIFFHandlePool(path, pool_size));
  absl::MutexLock lock(&pool->mutex_);
  pool->free_.push_back(initial);
  pool->opened_ = 1;
  return pool;
}

TIFFHandlePool::TIFFHandlePool(std::filesystem::path path, unsigned pool_size)
    : path_(std::move(path)),
      c_path_(path_.string()),
      max_pool_size_(pool_size) {
  if (max_pool_size_ == 0) {
    max_pool_size_ = std::max(1U, std::thread::hardware_concurrency());
  }
}

TIFFHandlePool::~TIFFHandlePool() {
  absl::MutexLock lock(&mutex_);
  if (free_.size() != opened_) {
    LOG(ERROR) << "TIFF handle pool for " << c_path_ << " destroyed with "
               << (opened_ - free_.size()) << " handle(s) still lent out";
  }
  for (TIFF* handle : free_) {
    TIFFClose(handle);
  }
  free_.clear();
}

TIFFHandleGuard TIFFHandlePool::Acquire() {
  absl::MutexLock lock(&mutex_);
  mutex_.Await(absl::Condition(this, &TIFFHandlePool::CanAcquire));

  if (!free_.empty()) {
    TIFF* handle = free_.back();
    free_.pop_back();
    return {handle, this};
  }

  TIFF* handle = TIFFOpen(c_path_.c_str(), "rm");
  if (handle == nullptr) {
    LOG(WARNING) << "Failed to open additional TIFF handle on " << c_path_;
    return {nullptr, this};
  }
  ++opened_;
  VLOG(2) << "Opened TIFF handle " << opened_ << "/" << max_pool_size_
          << " on " << c_path_;
  return {handle, this};
}

void TIFFHandlePool::Release(TIFF* handle) {
  absl::MutexLock lock(&mutex_);
  free_.push_back(handle);
}

TIFFHandlePool::Stats TIFFHandlePool::GetStats() const {
  absl::MutexLock lock(&mutex_);
  return {max_pool_size_, opened_, free_.size()};
}

}  // namespace omeslice

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

/**
 * @file tiff_handle_pool.h
 * @brief Pool of libtiff handles onto one file
 *
 * libtiff handles carry the current directory as mutable state, so a handle
 * must never be shared between threads. The pool keeps up to `pool_size`
 * independent handles on the same path and lends them out through an RAII
 * guard; a borrower blocks while every handle is lent out.
 */

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_HANDLE_POOL_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_HANDLE_POOL_H_

#include <tiffio.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

namespace omeslice {

class TIFFHandlePool;

/**
 * @brief RAII loan of a TIFF handle
 *
 * The handle goes back to its pool when the guard is destroyed.
 *
 * @note Movable, not copyable
 */
class TIFFHandleGuard {
 public:
  TIFFHandleGuard(TIFF* handle, TIFFHandlePool* pool)
      : handle_(handle), pool_(pool) {}

  ~TIFFHandleGuard() noexcept;

  TIFFHandleGuard(const TIFFHandleGuard&) = delete;
  TIFFHandleGuard& operator=(const TIFFHandleGuard&) = delete;

  TIFFHandleGuard(TIFFHandleGuard&& other) noexcept
      : handle_(other.handle_), pool_(other.pool_) {
    other.handle_ = nullptr;
    other.pool_ = nullptr;
  }

  TIFFHandleGuard& operator=(TIFFHandleGuard&& other) noexcept {
    if (this != &other) {
      Release();
      handle_ = other.handle_;
      pool_ = other.pool_;
      other.handle_ = nullptr;
      other.pool_ = nullptr;
    }
    return *this;
  }

  [[nodiscard]] TIFF* Get() const { return handle_; }

  /// @brief Whether the guard holds a handle
  [[nodiscard]] bool Valid() const { return handle_ != nullptr; }

 private:
  void Release();

  TIFF* handle_;
  TIFFHandlePool* pool_;
};

/**
 * @brief Thread-safe pool of read handles onto one TIFF file
 *
 * Handles are opened lazily, up to the pool size. The pool must outlive
 * every guard it hands out.
 */
class TIFFHandlePool {
 public:
  /// @brief Open the first handle and create the pool
  ///
  /// @param path Path to the TIFF file
  /// @param pool_size Maximum number of handles (0 = hardware concurrency)
  /// @return Pool, or SourceReadError when the file cannot be opened
  static absl::StatusOr<std::unique_ptr<TIFFHandlePool>> Create(
      const std::filesystem::path& path, unsigned pool_size = 0);

  ~TIFFHandlePool();

  TIFFHandlePool(const TIFFHandlePool&) = delete;
  TIFFHandlePool& operator=(const TIFFHandlePool&) = delete;

  /// @brief Borrow a handle, blocking while all handles are lent out
  ///
  /// @return Guard; invalid only when a new handle could not be opened
  TIFFHandleGuard Acquire();

  struct Stats {
    size_t max_handles;        ///< Pool size
    size_t total_opened;       ///< Handles opened so far
    size_t available_handles;  ///< Handles idle in the pool
  };

  Stats GetStats() const;

  [[nodiscard]] const std::filesystem::path& GetPath() const { return path_; }

 private:
  friend class TIFFHandleGuard;

  TIFFHandlePool(std::filesystem::path path, unsigned pool_size);

  void Release(TIFF* handle);

  bool CanAcquire() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return !free_.empty() || opened_ < max_pool_size_;
  }

  const std::filesystem::path path_;
  const std::string c_path_;
  size_t max_pool_size_;

  mutable absl::Mutex mutex_;
  std::vector<TIFF*> free_ ABSL_GUARDED_BY(mutex_);
  size_t opened_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_HANDLE_POOL_H_

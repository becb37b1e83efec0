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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_DECODE_CACHE_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_DECODE_CACHE_H_

#include <cstddef>
#include <cstdint>
#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_buffer.h"

/**
 * @file decode_cache.h
 * @brief Per-pass cache of decoded source tiles
 *
 * A decode cache guarantees that every source tile is decoded at most once
 * within one (level, plane) pass, including when several callers ask for
 * the same tile while its decode is still running. A failed decode is
 * remembered and returned to every later caller; it is never retried.
 */

namespace omeslice {

/// @brief Decode-once cache keyed by tile address
class DecodeCache {
 public:
  using DecodeFn = absl::FunctionRef<absl::StatusOr<PixelBuffer>()>;

  /// @brief Cache statistics
  struct Stats {
    size_t decodes = 0;    ///< Calls of a decode function
    size_t hits = 0;       ///< Lookups served from a finished decode
    size_t coalesced = 0;  ///< Lookups that waited on an in-flight decode
    size_t evicted = 0;    ///< Entries dropped by EvictRowsBefore
    size_t resident = 0;   ///< Entries currently held
  };

  virtual ~DecodeCache() = default;

  /// @brief Return the decoded tile, running `decode` only on first request
  virtual absl::StatusOr<std::shared_ptr<const PixelBuffer>> GetOrDecode(
      const TileAddress& address, DecodeFn decode) = 0;

  /// @brief Drop finished entries whose tile row is below `row`
  virtual void EvictRowsBefore(uint32_t row) = 0;

  [[nodiscard]] virtual Stats GetStats() const = 0;

  /// @brief Whether GetOrDecode may be called from several threads
  [[nodiscard]] virtual bool IsThreadSafe() const = 0;
};

/// @brief Single-threaded decode cache (no locking)
class SerialDecodeCache final : public DecodeCache {
 public:
  absl::StatusOr<std::shared_ptr<const PixelBuffer>> GetOrDecode(
      const TileAddress& address, DecodeFn decode) override;
  void EvictRowsBefore(uint32_t row) override;
  [[nodiscard]] Stats GetStats() const override;
  [[nodiscard]] bool IsThreadSafe() const override { return false; }

 private:
  struct Entry {
    absl::Status status;
    std::shared_ptr<const PixelBuffer> buffer;
  };

  absl::flat_hash_map<TileAddress, Entry> entries_;
  Stats stats_;
};

/// @brief Thread-safe decode cache that coalesces in-flight decodes
///
/// The first caller for an address decodes outside the lock; concurrent
/// callers for the same address block until that decode finishes and share
/// its result.
class CoalescingDecodeCache final : public DecodeCache {
 public:
  absl::StatusOr<std::shared_ptr<const PixelBuffer>> GetOrDecode(
      const TileAddress& address, DecodeFn decode) override;
  void EvictRowsBefore(uint32_t row) override;
  [[nodiscard]] Stats GetStats() const override;
  [[nodiscard]] bool IsThreadSafe() const override { return true; }

 private:
  /// Result slot; immutable once `ready` is set.
  struct Slot {
    bool ready = false;
    absl::Status status;
    std::shared_ptr<const PixelBuffer> buffer;
  };

  static absl::StatusOr<std::shared_ptr<const PixelBuffer>> ResultOf(
      const Slot& slot);

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<TileAddress, std::shared_ptr<Slot>> slots_
      ABSL_GUARDED_BY(mutex_);
  Stats stats_ ABSL_GUARDED_BY(mutex_);
};

/// @brief Decode cache implementations
enum class DecodeCacheKind {
  kSerial,      ///< SerialDecodeCache
  kCoalescing,  ///< CoalescingDecodeCache
};

std::unique_ptr<DecodeCache> CreateDecodeCache(DecodeCacheKind kind);

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_DECODE_CACHE_H_

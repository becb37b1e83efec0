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

#include "omeslice/engine/decode_cache.h"

#include <memory>
#include <utility>
#include <vector>

namespace omeslice {

// ============================================================================
// SerialDecodeCache
// ============================================================================

absl::StatusOr<std::shared_ptr<const PixelBuffer>>
SerialDecodeCache::GetOrDecode(const TileAddress& address, DecodeFn decode) {
  auto iter = entries_.find(address);
  if (iter != entries_.end()) {
    ++stats_.hits;
    if (!iter->second.status.ok()) {
      return iter->second.status;
    }
    return iter->second.buffer;
  }

  ++stats_.decodes;
  absl::StatusOr<PixelBuffer> decoded = decode();
  Entry entry;
  if (decoded.ok()) {
    entry.buffer = std::make_shared<const PixelBuffer>(*std::move(decoded));
  } else {
    entry.status = decoded.status();
  }
  const Entry& stored =
      entries_.emplace(address, std::move(entry)).first->second;
  if (!stored.status.ok()) {
    return stored.status;
  }
  return stored.buffer;
}

void SerialDecodeCache::EvictRowsBefore(uint32_t row) {
  std::vector<TileAddress> stale;
  for (const auto& [address, entry] : entries_) {
    if (address.row < row) {
      stale.push_back(address);
    }
  }
  for (const TileAddress& address : stale) {
    entries_.erase(address);
  }
  stats_.evicted += stale.size();
}

DecodeCache::Stats SerialDecodeCache::GetStats() const {
  Stats stats = stats_;
  stats.resident = entries_.size();
  return stats;
}

// ============================================================================
// CoalescingDecodeCache
// ============================================================================

absl::StatusOr<std::shared_ptr<const PixelBuffer>>
CoalescingDecodeCache::ResultOf(const Slot& slot) {
  if (!slot.status.ok()) {
    return slot.status;
  }
  return slot.buffer;
}

absl::StatusOr<std::shared_ptr<const PixelBuffer>>
CoalescingDecodeCache::GetOrDecode(const TileAddress& address,
                                   DecodeFn decode) {
  std::shared_ptr<Slot> slot;
  {
    absl::MutexLock lock(&mutex_);
    auto [iter, inserted] = slots_.try_emplace(address, nullptr);
    if (!inserted) {
      slot = iter->second;
      if (slot->ready) {
        ++stats_.hits;
      } else {
        ++stats_.coalesced;
        mutex_.Await(absl::Condition(&slot->ready));
      }
      return ResultOf(*slot);
    }
    iter->second = std::make_shared<Slot>();
    slot = iter->second;
    ++stats_.decodes;
  }

  // Decode outside the lock; other callers for this address wait on `ready`.
  absl::StatusOr<PixelBuffer> decoded = decode();

  absl::MutexLock lock(&mutex_);
  if (decoded.ok()) {
    slot->buffer = std::make_shared<const PixelBuffer>(*std::move(decoded));
  } else {
    slot->status = decoded.status();
  }
  slot->ready = true;
  return ResultOf(*slot);
}

void CoalescingDecodeCache::EvictRowsBefore(uint32_t row) {
  absl::MutexLock lock(&mutex_);
  std::vector<TileAddress> stale;
  for (const auto& [address, slot] : slots_) {
    if (address.row < row && slot->ready) {
      stale.push_back(address);
    }
  }
  for (const TileAddress& address : stale) {
    slots_.erase(address);
  }
  stats_.evicted += stale.size();
}

DecodeCache::Stats CoalescingDecodeCache::GetStats() const {
  absl::MutexLock lock(&mutex_);
  Stats stats = stats_;
  stats.resident = slots_.size();
  return stats;
}

std::unique_ptr<DecodeCache> CreateDecodeCache(DecodeCacheKind kind) {
  switch (kind) {
    case DecodeCacheKind::kSerial:
      return std::make_unique<SerialDecodeCache>();
    case DecodeCacheKind::kCoalescing:
      return std::make_unique<CoalescingDecodeCache>();
  }
  return std::make_unique<SerialDecodeCache>();
}

}  // namespace omeslice

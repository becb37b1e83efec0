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

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "omeslice/core/errors.h"

namespace omeslice {
namespace {

PixelBuffer MakeTile(uint8_t value) {
  PixelBuffer buffer(2, 2, {1, 8});
  for (uint8_t& byte : buffer.GetMutableData()) {
    byte = value;
  }
  return buffer;
}

class DecodeCacheTest : public ::testing::TestWithParam<DecodeCacheKind> {
 protected:
  std::unique_ptr<DecodeCache> cache_ = CreateDecodeCache(GetParam());
};

TEST_P(DecodeCacheTest, DecodesEachAddressOnce) {
  int calls = 0;
  auto decode = [&]() -> absl::StatusOr<PixelBuffer> {
    ++calls;
    return MakeTile(7);
  };

  const TileAddress address{0, 0, 1, 2};
  auto first = cache_->GetOrDecode(address, decode);
  auto second = cache_->GetOrDecode(address, decode);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(first->get(), second->get());
  EXPECT_EQ((*first)->GetData()[0], 7);

  const DecodeCache::Stats stats = cache_->GetStats();
  EXPECT_EQ(stats.decodes, 1);
  EXPECT_EQ(stats.hits, 1);
  EXPECT_EQ(stats.resident, 1);
}

TEST_P(DecodeCacheTest, FailuresAreRememberedNotRetried) {
  int calls = 0;
  auto decode = [&]() -> absl::StatusOr<PixelBuffer> {
    ++calls;
    return SourceReadError("corrupt tile");
  };

  const TileAddress address{0, 0, 0, 0};
  EXPECT_EQ(GetErrorKind(cache_->GetOrDecode(address, decode).status()),
            ErrorKind::kSourceRead);
  EXPECT_EQ(GetErrorKind(cache_->GetOrDecode(address, decode).status()),
            ErrorKind::kSourceRead);
  EXPECT_EQ(calls, 1);
}

TEST_P(DecodeCacheTest, EvictRowsBeforeDropsOnlyEarlierRows) {
  auto decode = []() -> absl::StatusOr<PixelBuffer> { return MakeTile(1); };
  for (uint32_t row = 0; row < 3; ++row) {
    ASSERT_TRUE(cache_->GetOrDecode({0, 0, row, 0}, decode).ok());
  }
  cache_->EvictRowsBefore(2);
  const DecodeCache::Stats stats = cache_->GetStats();
  EXPECT_EQ(stats.evicted, 2);
  EXPECT_EQ(stats.resident, 1);

  // Evicted buffers stay alive for holders.
  auto held = cache_->GetOrDecode({0, 0, 2, 0}, decode);
  ASSERT_TRUE(held.ok());
  cache_->EvictRowsBefore(3);
  EXPECT_EQ((*held)->GetData()[0], 1);
}

INSTANTIATE_TEST_SUITE_P(AllKinds, DecodeCacheTest,
                         ::testing::Values(DecodeCacheKind::kSerial,
                                           DecodeCacheKind::kCoalescing));

TEST(CoalescingDecodeCacheTest, ConcurrentRequestsShareOneDecode) {
  CoalescingDecodeCache cache;
  std::atomic<int> calls{0};
  auto decode = [&]() -> absl::StatusOr<PixelBuffer> {
    calls.fetch_add(1);
    absl::SleepFor(absl::Milliseconds(50));
    return MakeTile(42);
  };

  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  std::vector<const PixelBuffer*> results(kThreads, nullptr);
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto result = cache.GetOrDecode({1, 0, 3, 3}, decode);
      if (result.ok()) {
        results[i] = result->get();
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(calls.load(), 1);
  for (const PixelBuffer* result : results) {
    EXPECT_EQ(result, results[0]);
    EXPECT_NE(result, nullptr);
  }
  const DecodeCache::Stats stats = cache.GetStats();
  EXPECT_EQ(stats.decodes, 1);
  EXPECT_EQ(stats.hits + stats.coalesced, kThreads - 1);
}

TEST(CoalescingDecodeCacheTest, DistinctAddressesDecodeInParallel) {
  CoalescingDecodeCache cache;
  std::atomic<int> calls{0};
  auto decode = [&]() -> absl::StatusOr<PixelBuffer> {
    calls.fetch_add(1);
    return MakeTile(3);
  };

  std::vector<std::thread> threads;
  for (uint32_t col = 0; col < 4; ++col) {
    threads.emplace_back([&, col]() {
      EXPECT_TRUE(cache.GetOrDecode({0, 0, 0, col}, decode).ok());
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(calls.load(), 4);
  EXPECT_TRUE(cache.IsThreadSafe());
}

}  // namespace
}  // namespace omeslice

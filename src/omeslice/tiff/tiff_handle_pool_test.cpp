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

#include <gtest/gtest.h>
#include <tiffio.h>

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <utility>
#include <vector>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "omeslice/core/errors.h"

namespace fs = std::filesystem;

namespace omeslice {
namespace {

/// @brief Test fixture for TIFFHandlePool tests
class TIFFHandlePoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = fs::temp_directory_path() / "omeslice_tiff_pool_test";
    fs::create_directories(temp_dir_);
    test_tiff_path_ = temp_dir_ / "test.tiff";
    CreateTestTIFF(test_tiff_path_);
    nonexistent_path_ = temp_dir_ / "nonexistent.tiff";
  }

  void TearDown() override {
    if (fs::exists(temp_dir_)) {
      fs::remove_all(temp_dir_);
    }
  }

  /// @brief Create a minimal single-strip grayscale TIFF
  static void CreateTestTIFF(const fs::path& path) {
    TIFF* tif = TIFFOpen(path.string().c_str(), "w");
    ASSERT_NE(tif, nullptr) << "Failed to create test TIFF file";
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, 100);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, 80);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, 80);
    std::vector<uint8_t> row(100, 42);
    for (uint32_t y = 0; y < 80; ++y) {
      TIFFWriteScanline(tif, row.data(), y);
    }
    TIFFClose(tif);
  }

  fs::path temp_dir_;
  fs::path test_tiff_path_;
  fs::path nonexistent_path_;
};

TEST_F(TIFFHandlePoolTest, CreateOpensOneHandle) {
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_);
  ASSERT_TRUE(pool_result.ok()) << pool_result.status();
  auto pool = std::move(pool_result.value());

  auto stats = pool->GetStats();
  EXPECT_GT(stats.max_handles, 0);
  EXPECT_EQ(stats.total_opened, 1);
  EXPECT_EQ(stats.available_handles, 1);
  EXPECT_EQ(pool->GetPath(), test_tiff_path_);
}

TEST_F(TIFFHandlePoolTest, CreateWithCustomSize) {
  constexpr unsigned kPoolSize = 5;
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_, kPoolSize);
  ASSERT_TRUE(pool_result.ok()) << pool_result.status();
  EXPECT_EQ((*pool_result)->GetStats().max_handles, kPoolSize);
}

TEST_F(TIFFHandlePoolTest, MissingFileIsSourceReadError) {
  auto pool_result = TIFFHandlePool::Create(nonexistent_path_);
  EXPECT_FALSE(pool_result.ok());
  EXPECT_EQ(GetErrorKind(pool_result.status()), ErrorKind::kSourceRead);
  EXPECT_EQ(pool_result.status().code(), absl::StatusCode::kDataLoss);
}

TEST_F(TIFFHandlePoolTest, GuardReturnsHandleOnDestruction) {
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_, 2);
  ASSERT_TRUE(pool_result.ok());
  auto pool = std::move(pool_result.value());

  {
    auto guard = pool->Acquire();
    ASSERT_TRUE(guard.Valid());
    uint32_t width = 0;
    TIFFGetField(guard.Get(), TIFFTAG_IMAGEWIDTH, &width);
    EXPECT_EQ(width, 100);
    EXPECT_EQ(pool->GetStats().available_handles, 0);

    auto moved = std::move(guard);
    EXPECT_FALSE(guard.Valid());
    EXPECT_TRUE(moved.Valid());
  }
  EXPECT_EQ(pool->GetStats().available_handles, 1);
  EXPECT_EQ(pool->GetStats().total_opened, 1);
}

TEST_F(TIFFHandlePoolTest, MoveAssignmentReleasesPreviousHandle) {
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_, 2);
  ASSERT_TRUE(pool_result.ok());
  auto pool = std::move(pool_result.value());

  auto first = pool->Acquire();
  auto second = pool->Acquire();
  TIFF* second_handle = second.Get();
  EXPECT_EQ(pool->GetStats().total_opened, 2);
  EXPECT_EQ(pool->GetStats().available_handles, 0);

  first = std::move(second);
  EXPECT_EQ(first.Get(), second_handle);
  EXPECT_EQ(pool->GetStats().available_handles, 1);
}

TEST_F(TIFFHandlePoolTest, OpensLazilyUpToPoolSize) {
  constexpr unsigned kPoolSize = 3;
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_, kPoolSize);
  ASSERT_TRUE(pool_result.ok());
  auto pool = std::move(pool_result.value());

  std::vector<TIFFHandleGuard> guards;
  for (unsigned i = 0; i < kPoolSize; ++i) {
    guards.push_back(pool->Acquire());
    EXPECT_TRUE(guards.back().Valid()) << "Failed to acquire handle " << i;
  }
  auto stats = pool->GetStats();
  EXPECT_EQ(stats.available_handles, 0);
  EXPECT_EQ(stats.total_opened, kPoolSize);
}

TEST_F(TIFFHandlePoolTest, BlockingAcquireNeverExceedsPoolSize) {
  constexpr unsigned kPoolSize = 2;
  constexpr unsigned kNumThreads = 6;
  auto pool_result = TIFFHandlePool::Create(test_tiff_path_, kPoolSize);
  ASSERT_TRUE(pool_result.ok());
  auto pool = std::move(pool_result.value());

  std::atomic<int> concurrent{0};
  std::atomic<int> max_concurrent{0};
  std::vector<std::future<bool>> futures;
  for (unsigned i = 0; i < kNumThreads; ++i) {
    futures.push_back(std::async(std::launch::async, [&]() {
      auto guard = pool->Acquire();
      if (!guard.Valid()) {
        return false;
      }
      const int current = concurrent.fetch_add(1) + 1;
      int expected = max_concurrent.load();
      while (current > expected &&
             !max_concurrent.compare_exchange_weak(expected, current)) {
      }
      absl::SleepFor(absl::Milliseconds(20));
      concurrent.fetch_sub(1);
      return true;
    }));
  }

  int successful = 0;
  for (auto& future : futures) {
    successful += future.get() ? 1 : 0;
  }
  EXPECT_EQ(successful, kNumThreads);
  EXPECT_LE(max_concurrent.load(), kPoolSize);
  EXPECT_LE(pool->GetStats().total_opened, kPoolSize);
  EXPECT_EQ(pool->GetStats().available_handles,
            pool->GetStats().total_opened);
}

}  // namespace
}  // namespace omeslice

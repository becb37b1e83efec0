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

#include "omeslice/tiff/tiff_file.h"

#include <gtest/gtest.h>
#include <tiffio.h>

#include <filesystem>
#include <memory>
#include <utility>

#include "omeslice/core/errors.h"
#include "omeslice/testing/ome_tiff_builder.h"
#include "omeslice/testing/synthetic_source.h"
#include "omeslice/tiff/tiff_handle_pool.h"

namespace fs = std::filesystem;

namespace omeslice {
namespace {

class TiffFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = fs::temp_directory_path() / "omeslice_tiff_file_test";
    fs::create_directories(temp_dir_);
    path_ = temp_dir_ / "pyramid.ome.tiff";

    testing::SyntheticImageOptions options;
    options.width = 200;
    options.height = 120;
    options.tile_width = 64;
    options.tile_height = 32;
    options.downsamples = {1.0, 2.0};
    options.channels = 2;
    descriptor_ = testing::MakeSyntheticDescriptor(options);
    ASSERT_TRUE(testing::WriteSyntheticOmeTiff(path_, descriptor_).ok());

    auto pool = TIFFHandlePool::Create(path_, 2);
    ASSERT_TRUE(pool.ok()) << pool.status();
    pool_ = std::move(pool).value();
  }

  void TearDown() override {
    pool_.reset();
    if (fs::exists(temp_dir_)) {
      fs::remove_all(temp_dir_);
    }
  }

  fs::path temp_dir_;
  fs::path path_;
  ImageDescriptor descriptor_;
  std::unique_ptr<TIFFHandlePool> pool_;
};

TEST_F(TiffFileTest, CreateRejectsNullPool) {
  auto file = TiffFile::Create(nullptr);
  EXPECT_EQ(file.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(TiffFileTest, ReadsPageInfo) {
  auto file = TiffFile::Create(pool_.get());
  ASSERT_TRUE(file.ok()) << file.status();
  ASSERT_TRUE(file->SetDirectory(0).ok());

  auto info = file->GetPageInfo();
  ASSERT_TRUE(info.ok()) << info.status();
  EXPECT_EQ(info->width, 200);
  EXPECT_EQ(info->height, 120);
  EXPECT_TRUE(info->tiled);
  EXPECT_EQ(info->tile_width, 64);
  EXPECT_EQ(info->tile_height, 32);
  EXPECT_EQ(info->samples_per_pixel, 1);
  EXPECT_EQ(info->bits_per_sample, 8);
  EXPECT_FALSE(info->IsReducedImage());

  // One top-level IFD per plane; levels live in SubIFDs.
  EXPECT_EQ(file->GetDirectoryCount().value(), 2);
}

TEST_F(TiffFileTest, FollowsSubIfds) {
  auto file = TiffFile::Create(pool_.get());
  ASSERT_TRUE(file.ok()) << file.status();
  ASSERT_TRUE(file->SetDirectory(1).ok());

  auto offsets = file->GetSubIfdOffsets();
  ASSERT_TRUE(offsets.ok()) << offsets.status();
  ASSERT_EQ(offsets->size(), 1);
  ASSERT_TRUE(file->SetSubDirectory(offsets->front()).ok());

  auto info = file->GetPageInfo();
  ASSERT_TRUE(info.ok()) << info.status();
  EXPECT_EQ(info->width, 100);
  EXPECT_EQ(info->height, 60);
  EXPECT_TRUE(info->IsReducedImage());
  EXPECT_TRUE(file->GetSubIfdOffsets()->empty());
}

TEST_F(TiffFileTest, ImageDescriptionOnlyOnFirstPage) {
  auto file = TiffFile::Create(pool_.get());
  ASSERT_TRUE(file.ok()) << file.status();
  ASSERT_TRUE(file->SetDirectory(0).ok());
  auto description = file->GetImageDescription();
  ASSERT_TRUE(description.ok()) << description.status();
  EXPECT_NE(description->find("SizeX=\"200\""), std::string::npos);

  ASSERT_TRUE(file->SetDirectory(1).ok());
  EXPECT_EQ(file->GetImageDescription().status().code(),
            absl::StatusCode::kNotFound);
}

TEST_F(TiffFileTest, ReadsFullTileBytes) {
  auto file = TiffFile::Create(pool_.get());
  ASSERT_TRUE(file.ok()) << file.status();
  ASSERT_TRUE(file->SetDirectory(0).ok());

  // Bottom-right tile is partial but stored at nominal size.
  auto bytes = file->ReadTile(192, 96);
  ASSERT_TRUE(bytes.ok()) << bytes.status();
  ASSERT_EQ(bytes->size(), 64 * 32);
  EXPECT_EQ((*bytes)[0], testing::SyntheticByte(0, 0, 192, 96, 0));
  EXPECT_EQ((*bytes)[64 * 23 + 7], testing::SyntheticByte(0, 0, 199, 119, 0));
}

TEST_F(TiffFileTest, SeekFailuresAreSourceReadErrors) {
  auto file = TiffFile::Create(pool_.get());
  ASSERT_TRUE(file.ok()) << file.status();
  EXPECT_EQ(GetErrorKind(file->SetDirectory(7)), ErrorKind::kSourceRead);
  ASSERT_TRUE(file->SetDirectory(0).ok());
  EXPECT_EQ(GetErrorKind(file->ReadTile(0, 500).status()),
            ErrorKind::kSourceRead);
}

}  // namespace
}  // namespace omeslice

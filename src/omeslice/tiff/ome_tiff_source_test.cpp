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

#include "omeslice/tiff/ome_tiff_source.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_replace.h"
#include "omeslice/core/errors.h"
#include "omeslice/engine/tile_stream.h"
#include "omeslice/metadata/ome_xml.h"
#include "omeslice/testing/ome_tiff_builder.h"
#include "omeslice/testing/synthetic_source.h"

namespace fs = std::filesystem;

namespace omeslice {
namespace {

using testing::MakeSyntheticDescriptor;
using testing::OmeTiffBuildOptions;
using testing::SyntheticImageOptions;
using testing::WriteSyntheticOmeTiff;

class OmeTiffPixelSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = fs::temp_directory_path() / "omeslice_ome_tiff_source_test";
    fs::create_directories(temp_dir_);
  }

  void TearDown() override {
    if (fs::exists(temp_dir_)) {
      fs::remove_all(temp_dir_);
    }
  }

  fs::path Write(const ImageDescriptor& descriptor,
                 const OmeTiffBuildOptions& options = {},
                 const std::string& name = "image.ome.tiff") {
    const fs::path path = temp_dir_ / name;
    const absl::Status status = WriteSyntheticOmeTiff(path, descriptor, options);
    EXPECT_TRUE(status.ok()) << status;
    return path;
  }

  static SyntheticImageOptions PyramidOptions() {
    SyntheticImageOptions options;
    options.width = 640;
    options.height = 480;
    options.tile_width = 128;
    options.tile_height = 128;
    options.downsamples = {1.0, 2.0, 4.0};
    options.channels = 2;
    options.size_z = 2;
    return options;
  }

  fs::path temp_dir_;
};

TEST_F(OmeTiffPixelSourceTest, OpensPyramid) {
  const ImageDescriptor descriptor = MakeSyntheticDescriptor(PyramidOptions());
  auto source = OmeTiffPixelSource::Open(Write(descriptor));
  ASSERT_TRUE(source.ok()) << source.status();

  auto levels = (*source)->ReadLevels();
  ASSERT_TRUE(levels.ok()) << levels.status();
  EXPECT_EQ(*levels, descriptor.levels);

  auto text = (*source)->ReadRawMetadataText();
  ASSERT_TRUE(text.ok());
  auto parsed = OmeXmlCodec::Parse(*text);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->GetPlaneCount(), 4);
  for (uint32_t plane = 0; plane < 4; ++plane) {
    EXPECT_EQ((*source)->GetPlaneIfd(plane), plane);
  }
}

TEST_F(OmeTiffPixelSourceTest, StreamsEveryLevelAndPlane) {
  ImageDescriptor descriptor = MakeSyntheticDescriptor(PyramidOptions());
  auto source = OmeTiffPixelSource::Open(Write(descriptor), 2);
  ASSERT_TRUE(source.ok()) << source.status();
  const std::shared_ptr<const PixelSource> shared = std::move(*source);
  const auto decoder = std::make_shared<RawSampleDecoder>();

  const CropRectangle crop{100, 70, 401, 333};
  for (uint32_t level = 0; level < 3; ++level) {
    for (uint32_t plane = 0; plane < 4; ++plane) {
      auto stream = TileStream::Open(shared, decoder, descriptor, crop,
                                     level, plane);
      ASSERT_TRUE(stream.ok()) << stream.status();
      const PixelRect region = stream->GetGeometryMap().level_region;
      const TileGrid grid = stream->GetOutputGrid();
      while (true) {
        auto next = stream->Next();
        ASSERT_TRUE(next.ok()) << next.status();
        if (!next->has_value()) {
          break;
        }
        const OutputTile& tile = **next;
        const PixelRect rect{region.x + tile.address.col * grid.tile_width,
                             region.y + tile.address.row * grid.tile_height,
                             tile.pixels.GetWidth(), tile.pixels.GetHeight()};
        EXPECT_EQ(tile.pixels,
                  testing::ExpectedRegion(descriptor, level, plane, rect))
            << tile.address.ToString();
      }
    }
  }
}

TEST_F(OmeTiffPixelSourceTest, ReadTileReportsStoredLayout) {
  SyntheticImageOptions options = PyramidOptions();
  options.channels = 1;
  options.samples_per_pixel = 3;
  options.size_z = 1;
  options.pixel_type = PixelType::kUInt16;
  auto source = OmeTiffPixelSource::Open(Write(MakeSyntheticDescriptor(options)));
  ASSERT_TRUE(source.ok()) << source.status();

  // Level 1 is 320x240; its bottom-right tile is 64x112.
  auto tile = (*source)->ReadTile({1, 0, 1, 2});
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_EQ(tile->layout, (SampleLayout{3, 16}));
  EXPECT_EQ(tile->nominal_width, 128);
  EXPECT_EQ(tile->valid_width, 64);
  EXPECT_EQ(tile->valid_height, 112);
  EXPECT_EQ(tile->bytes.size(), 128 * 128 * 6);
}

TEST_F(OmeTiffPixelSourceTest, ReadTileReportsSampleFormat) {
  SyntheticImageOptions options = PyramidOptions();
  options.channels = 1;
  options.size_z = 1;
  options.pixel_type = PixelType::kInt16;
  auto source =
      OmeTiffPixelSource::Open(Write(MakeSyntheticDescriptor(options)));
  ASSERT_TRUE(source.ok()) << source.status();

  auto tile = (*source)->ReadTile({0, 0, 0, 0});
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_EQ(tile->layout, (SampleLayout{1, 16, SampleFormat::kSigned}));

  // Decoding the signed tile as unsigned samples is a layout mismatch.
  RawSampleDecoder decoder;
  EXPECT_EQ(GetErrorKind(decoder.Decode(*tile, SampleLayout{1, 16}).status()),
            ErrorKind::kChannelMismatch);
}

TEST_F(OmeTiffPixelSourceTest, ReadTileOutsideGridFails) {
  auto source = OmeTiffPixelSource::Open(
      Write(MakeSyntheticDescriptor(PyramidOptions())));
  ASSERT_TRUE(source.ok()) << source.status();
  EXPECT_EQ(GetErrorKind((*source)->ReadTile({0, 0, 0, 5}).status()),
            ErrorKind::kSourceRead);
  EXPECT_EQ(GetErrorKind((*source)->ReadTile({3, 0, 0, 0}).status()),
            ErrorKind::kSourceRead);
  EXPECT_EQ(GetErrorKind((*source)->ReadTile({0, 4, 0, 0}).status()),
            ErrorKind::kSourceRead);
}

TEST_F(OmeTiffPixelSourceTest, FollowsTiffDataMapping) {
  SyntheticImageOptions options = PyramidOptions();
  options.size_z = 1;
  const ImageDescriptor descriptor = MakeSyntheticDescriptor(options);
  // Store channel 1 first.
  auto text = OmeXmlCodec::Serialize(descriptor);
  ASSERT_TRUE(text.ok());
  const std::string swapped = absl::StrReplaceAll(
      *text, {{R"(IFD="0" FirstC="0")", R"(IFD="1" FirstC="0")"},
              {R"(IFD="1" FirstC="1")", R"(IFD="0" FirstC="1")"}});
  ASSERT_NE(swapped, *text);

  OmeTiffBuildOptions build;
  build.metadata_text = swapped;
  auto source = OmeTiffPixelSource::Open(Write(descriptor, build));
  ASSERT_TRUE(source.ok()) << source.status();
  EXPECT_EQ((*source)->GetPlaneIfd(0), 1);
  EXPECT_EQ((*source)->GetPlaneIfd(1), 0);
}

TEST_F(OmeTiffPixelSourceTest, RejectsNonOmeTiff) {
  OmeTiffBuildOptions build;
  build.metadata_text = "Aperio Image Library v11.2.1";
  auto source = OmeTiffPixelSource::Open(
      Write(MakeSyntheticDescriptor(PyramidOptions()), build));
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kMalformedMetadata);
}

TEST_F(OmeTiffPixelSourceTest, RejectsMissingFile) {
  auto source = OmeTiffPixelSource::Open(temp_dir_ / "missing.ome.tiff");
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kSourceRead);
}

TEST_F(OmeTiffPixelSourceTest, RejectsStrippedPages) {
  OmeTiffBuildOptions build;
  build.tiled = false;
  SyntheticImageOptions options = PyramidOptions();
  options.downsamples = {1.0};
  auto source =
      OmeTiffPixelSource::Open(Write(MakeSyntheticDescriptor(options), build));
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kSourceRead);
}

TEST_F(OmeTiffPixelSourceTest, RejectsSeparateSamplePlanes) {
  OmeTiffBuildOptions build;
  build.planar_separate = true;
  SyntheticImageOptions options = PyramidOptions();
  options.channels = 1;
  options.size_z = 1;
  options.samples_per_pixel = 3;
  auto source =
      OmeTiffPixelSource::Open(Write(MakeSyntheticDescriptor(options), build));
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kChannelMismatch);
}

TEST_F(OmeTiffPixelSourceTest, RejectsDimensionDisagreement) {
  const ImageDescriptor descriptor = MakeSyntheticDescriptor(PyramidOptions());
  ImageDescriptor declared = descriptor;
  declared.width = 641;
  declared.levels.clear();
  auto text = OmeXmlCodec::Serialize(declared);
  ASSERT_TRUE(text.ok());

  OmeTiffBuildOptions build;
  build.metadata_text = *text;
  auto source = OmeTiffPixelSource::Open(Write(descriptor, build));
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kMalformedMetadata);
}

TEST_F(OmeTiffPixelSourceTest, RejectsPlanesBeyondTheFile) {
  SyntheticImageOptions options = PyramidOptions();
  options.size_z = 1;
  const ImageDescriptor descriptor = MakeSyntheticDescriptor(options);
  auto text = OmeXmlCodec::Serialize(descriptor);
  ASSERT_TRUE(text.ok());

  OmeTiffBuildOptions build;
  build.metadata_text =
      absl::StrReplaceAll(*text, {{R"(IFD="1")", R"(IFD="9")"}});
  auto source = OmeTiffPixelSource::Open(Write(descriptor, build));
  EXPECT_EQ(GetErrorKind(source.status()), ErrorKind::kMalformedMetadata);
}

TEST_F(OmeTiffPixelSourceTest, OpensBigTiff) {
  OmeTiffBuildOptions build;
  build.bigtiff = true;
  const ImageDescriptor descriptor = MakeSyntheticDescriptor(PyramidOptions());
  auto source = OmeTiffPixelSource::Open(Write(descriptor, build));
  ASSERT_TRUE(source.ok()) << source.status();
  EXPECT_EQ((*source)->ReadLevels()->size(), 3);
}

TEST(EstimateDownsampleTest, SnapsNearIntegers) {
  EXPECT_EQ(*EstimateDownsample(20000, 15000, 5000, 3750), 4.0);
  EXPECT_EQ(*EstimateDownsample(20000, 15000, 1250, 938), 16.0);
  EXPECT_EQ(*EstimateDownsample(1000, 1000, 333, 333), 3.0);
  EXPECT_NEAR(*EstimateDownsample(1000, 1000, 400, 400), 2.5, 1e-9);
  EXPECT_EQ(*EstimateDownsample(1000, 1000, 0, 10), 1.0);
}

TEST(EstimateDownsampleTest, UsesTheLongerAxisForThinLevels) {
  // The short axis rounds 10 / 16 up to a single pixel.
  EXPECT_EQ(*EstimateDownsample(1000, 10, 63, 1), 16.0);
  EXPECT_EQ(*EstimateDownsample(10, 1000, 1, 63), 16.0);
}

TEST(EstimateDownsampleTest, RejectsAnisotropicLevels) {
  EXPECT_EQ(GetErrorKind(EstimateDownsample(1000, 1000, 500, 250).status()),
            ErrorKind::kUnsupportedGeometry);
  EXPECT_EQ(GetErrorKind(EstimateDownsample(2000, 1000, 1000, 1000).status()),
            ErrorKind::kUnsupportedGeometry);
}

TEST(MapPlanesToIfdsTest, DefaultsToLinearIndex) {
  const std::string bare = R"(<OME><Image ID="Image:0"><Pixels ID="Pixels:0" DimensionOrder="XYCZT" Type="uint8" SizeX="8" SizeY="8" SizeZ="3" SizeC="2" SizeT="1"><Channel ID="Channel:0:0"/><Channel ID="Channel:0:1"/></Pixels></Image></OME>)";
  auto bare_descriptor = OmeXmlCodec::Parse(bare);
  ASSERT_TRUE(bare_descriptor.ok()) << bare_descriptor.status();
  auto ifds = MapPlanesToIfds(*bare_descriptor, bare);
  ASSERT_TRUE(ifds.ok()) << ifds.status();
  EXPECT_EQ(*ifds, (std::vector<uint32_t>{0, 1, 2, 3, 4, 5}));
}

TEST(MapPlanesToIfdsTest, ExpandsPlaneCountRuns) {
  const std::string xml = R"(<OME><Image ID="Image:0"><Pixels ID="Pixels:0" DimensionOrder="XYZCT" Type="uint8" SizeX="8" SizeY="8" SizeZ="2" SizeC="2" SizeT="1"><Channel ID="Channel:0:0"/><Channel ID="Channel:0:1"/><TiffData IFD="10" PlaneCount="2"/><TiffData IFD="3" FirstC="1" PlaneCount="2"/></Pixels></Image></OME>)";
  auto descriptor = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(descriptor.ok()) << descriptor.status();
  auto ifds = MapPlanesToIfds(*descriptor, xml);
  ASSERT_TRUE(ifds.ok()) << ifds.status();
  // XYZCT: (c0,z0) (c0,z1) (c1,z0) (c1,z1)
  EXPECT_EQ(*ifds, (std::vector<uint32_t>{10, 11, 3, 4}));
}

TEST(MapPlanesToIfdsTest, RejectsBlocksOutsideTheImage) {
  const std::string xml = R"(<OME><Image ID="Image:0"><Pixels ID="Pixels:0" DimensionOrder="XYZCT" Type="uint8" SizeX="8" SizeY="8" SizeZ="1" SizeC="1" SizeT="1"><Channel ID="Channel:0:0"/><TiffData IFD="0" FirstZ="4"/></Pixels></Image></OME>)";
  auto descriptor = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(descriptor.ok()) << descriptor.status();
  EXPECT_EQ(GetErrorKind(MapPlanesToIfds(*descriptor, xml).status()),
            ErrorKind::kMalformedMetadata);
}

}  // namespace
}  // namespace omeslice

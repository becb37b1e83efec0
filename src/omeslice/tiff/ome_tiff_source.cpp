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

#include <tiffio.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "absl/log/log.h"
#include "omeslice/core/errors.h"
#include "omeslice/metadata/ome_xml.h"
#include "omeslice/status/status_macros.h"
#include "omeslice/tiff/tiff_file.h"

namespace omeslice {

namespace {

ResolutionLevel LevelFromPage(uint32_t index, double downsample,
                              const TiffPageInfo& page) {
  ResolutionLevel level;
  level.index = index;
  level.downsample = downsample;
  level.width = page.width;
  level.height = page.height;
  level.tile_width = page.tile_width;
  level.tile_height = page.tile_height;
  return level;
}

SampleFormat SampleFormatFromTiff(uint16_t sample_format) {
  switch (sample_format) {
    case SAMPLEFORMAT_INT:
      return SampleFormat::kSigned;
    case SAMPLEFORMAT_IEEEFP:
      return SampleFormat::kFloat;
    default:
      return SampleFormat::kUnsigned;
  }
}

/// Pages the reader can stream from.
absl::Status CheckPageReadable(const TiffPageInfo& page, uint32_t ifd) {
  if (!page.tiled || page.tile_width == 0 || page.tile_height == 0) {
    return TRACE_STATUS(SourceReadError(
        fmt::format("IFD {} is not tiled; only tiled pyramids can be "
                    "streamed",
                    ifd)));
  }
  if (page.planar_config == PLANARCONFIG_SEPARATE &&
      page.samples_per_pixel > 1) {
    return TRACE_STATUS(ChannelMismatchError(fmt::format(
        "IFD {} stores {} samples in separate planes; interleaved storage "
        "is required",
        ifd, page.samples_per_pixel)));
  }
  return absl::OkStatus();
}

/// Whether `factor` reduces `base` pixels to `level` pixels up to rounding.
bool FitsAxis(double factor, uint32_t base, uint32_t level) {
  return std::abs(static_cast<double>(base) / factor -
                  static_cast<double>(level)) < 1.0;
}

}  // namespace

absl::StatusOr<double> EstimateDownsample(uint32_t base_width,
                                          uint32_t base_height,
                                          uint32_t level_width,
                                          uint32_t level_height) {
  if (level_width == 0 || level_height == 0) {
    return 1.0;
  }
  const double ratio =
      level_width >= level_height
          ? static_cast<double>(base_width) / static_cast<double>(level_width)
          : static_cast<double>(base_height) /
                static_cast<double>(level_height);

  double factor = ratio;
  const double nearest = std::round(ratio);
  if (nearest >= 1.0 && std::abs(ratio - nearest) <= 0.01 * nearest &&
      FitsAxis(nearest, base_width, level_width) &&
      FitsAxis(nearest, base_height, level_height)) {
    factor = nearest;
  }
  if (!FitsAxis(factor, base_width, level_width) ||
      !FitsAxis(factor, base_height, level_height)) {
    return UnsupportedGeometryError(fmt::format(
        "Level {}x{} of a {}x{} image is not an isotropic reduction",
        level_width, level_height, base_width, base_height));
  }
  return factor;
}

absl::StatusOr<std::vector<uint32_t>> MapPlanesToIfds(
    const ImageDescriptor& descriptor, const std::string& metadata_text) {
  DECLARE_ASSIGN_OR_RETURN(std::vector<TiffDataBlock>, blocks,
                           OmeXmlCodec::ParseTiffData(metadata_text));

  const auto channel_count =
      static_cast<uint32_t>(descriptor.GetChannelCount());
  const size_t dense = descriptor.GetDensePlaneCount();
  std::vector<std::optional<uint32_t>> linear_to_ifd(dense);

  for (const TiffDataBlock& block : blocks) {
    if (block.first_c >= channel_count || block.first_z >= descriptor.size_z ||
        block.first_t >= descriptor.size_time) {
      return TRACE_STATUS(MalformedMetadataError(fmt::format(
          "TiffData block (IFD {}) starts at C={} Z={} T={}, outside the "
          "image",
          block.ifd, block.first_c, block.first_z, block.first_t)));
    }
    const size_t start = LinearPlaneIndex(
        descriptor.dimension_order, descriptor.size_z, channel_count,
        descriptor.size_time, block.first_c, block.first_z, block.first_t);
    const size_t count = block.plane_count.value_or(dense - start);
    for (size_t k = 0; k < count && start + k < dense; ++k) {
      linear_to_ifd[start + k] = block.ifd + static_cast<uint32_t>(k);
    }
  }

  std::vector<uint32_t> plane_ifds;
  plane_ifds.reserve(descriptor.GetPlaneCount());
  for (const PlaneDescriptor& plane : descriptor.planes) {
    const size_t linear = LinearPlaneIndex(
        descriptor.dimension_order, descriptor.size_z, channel_count,
        descriptor.size_time, plane.the_c, plane.the_z, plane.the_t);
    plane_ifds.push_back(
        linear_to_ifd[linear].value_or(static_cast<uint32_t>(linear)));
  }
  return plane_ifds;
}

absl::StatusOr<std::unique_ptr<OmeTiffPixelSource>> OmeTiffPixelSource::Open(
    const std::filesystem::path& path, unsigned pool_size) {
  DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<TIFFHandlePool>, pool,
                           TIFFHandlePool::Create(path, pool_size));
  auto file_result = TiffFile::Create(pool.get());
  if (!file_result.ok()) {
    return TRACE_STATUS(file_result.status());
  }
  TiffFile file = std::move(file_result).value();

  RETURN_IF_ERROR(file.SetDirectory(0), "Reading first IFD");
  auto description = file.GetImageDescription();
  if (!description.ok() || !OmeXmlCodec::IsOmeXml(*description)) {
    return TRACE_STATUS(MalformedMetadataError(
        "No OME-XML found in the ImageDescription of " + path.string()));
  }
  std::string metadata_text = *std::move(description);

  DECLARE_ASSIGN_OR_RETURN(ImageDescriptor, descriptor,
                           OmeXmlCodec::Parse(metadata_text));
  DECLARE_ASSIGN_OR_RETURN(std::vector<uint32_t>, plane_ifds,
                           MapPlanesToIfds(descriptor, metadata_text));
  DECLARE_ASSIGN_OR_RETURN(uint32_t, directory_count,
                           file.GetDirectoryCount());

  std::vector<std::vector<uint64_t>> sub_ifds;
  sub_ifds.reserve(plane_ifds.size());
  std::vector<ResolutionLevel> levels;

  for (size_t plane = 0; plane < plane_ifds.size(); ++plane) {
    const uint32_t ifd = plane_ifds[plane];
    if (ifd >= directory_count) {
      return TRACE_STATUS(MalformedMetadataError(fmt::format(
          "Plane {} is mapped to IFD {} but the file has {} IFD(s)", plane,
          ifd, directory_count)));
    }
    RETURN_IF_ERROR(file.SetDirectory(ifd), "");
    DECLARE_ASSIGN_OR_RETURN(TiffPageInfo, page, file.GetPageInfo());
    RETURN_IF_ERROR(CheckPageReadable(page, ifd), "");
    if (page.width != descriptor.width || page.height != descriptor.height) {
      return TRACE_STATUS(MalformedMetadataError(fmt::format(
          "IFD {} is {}x{} but the metadata declares {}x{}", ifd, page.width,
          page.height, descriptor.width, descriptor.height)));
    }
    DECLARE_ASSIGN_OR_RETURN(std::vector<uint64_t>, offsets,
                             file.GetSubIfdOffsets());

    if (plane == 0) {
      levels.push_back(LevelFromPage(0, 1.0, page));
      for (size_t i = 0; i < offsets.size(); ++i) {
        RETURN_IF_ERROR(file.SetSubDirectory(offsets[i]),
                        fmt::format("Reading level {}", i + 1));
        DECLARE_ASSIGN_OR_RETURN(TiffPageInfo, reduced, file.GetPageInfo());
        RETURN_IF_ERROR(CheckPageReadable(reduced, ifd), "");
        DECLARE_ASSIGN_OR_RETURN(
            double, downsample,
            EstimateDownsample(page.width, page.height, reduced.width,
                               reduced.height),
            fmt::format("Level {} of IFD {}", i + 1, ifd));
        levels.push_back(
            LevelFromPage(static_cast<uint32_t>(i + 1), downsample, reduced));
      }
    } else if (offsets.size() + 1 < levels.size()) {
      LOG(WARNING) << "Plane " << plane << " has " << offsets.size() + 1
                   << " pyramid level(s), plane 0 has " << levels.size()
                   << "; truncating the pyramid";
      levels.resize(offsets.size() + 1);
    }
    sub_ifds.push_back(std::move(offsets));
  }

  VLOG(1) << "Opened " << path.string() << ": " << plane_ifds.size()
          << " plane(s), " << levels.size() << " level(s)";

  return std::unique_ptr<OmeTiffPixelSource>(new OmeTiffPixelSource(
      std::move(pool), std::move(metadata_text), std::move(levels),
      std::move(plane_ifds), std::move(sub_ifds)));
}

OmeTiffPixelSource::OmeTiffPixelSource(
    std::unique_ptr<TIFFHandlePool> pool, std::string metadata_text,
    std::vector<ResolutionLevel> levels, std::vector<uint32_t> plane_ifds,
    std::vector<std::vector<uint64_t>> sub_ifds)
    : pool_(std::move(pool)),
      metadata_text_(std::move(metadata_text)),
      levels_(std::move(levels)),
      plane_ifds_(std::move(plane_ifds)),
      sub_ifds_(std::move(sub_ifds)) {}

absl::StatusOr<std::string> OmeTiffPixelSource::ReadRawMetadataText() const {
  return metadata_text_;
}

absl::StatusOr<std::vector<ResolutionLevel>> OmeTiffPixelSource::ReadLevels()
    const {
  return levels_;
}

absl::StatusOr<RawTile> OmeTiffPixelSource::ReadTile(
    const TileAddress& address) const {
  if (address.plane >= plane_ifds_.size() ||
      address.level >= levels_.size()) {
    return TRACE_STATUS(
        SourceReadError("No such tile in file: " + address.ToString()));
  }
  const ResolutionLevel& level = levels_[address.level];
  if (address.row >= level.TilesDown() || address.col >= level.TilesAcross()) {
    return TRACE_STATUS(SourceReadError(
        "Tile lies outside the level grid: " + address.ToString()));
  }

  auto file_result = TiffFile::Create(pool_.get());
  if (!file_result.ok()) {
    return TRACE_STATUS(file_result.status());
  }
  TiffFile file = std::move(file_result).value();
  RETURN_IF_ERROR(file.SetDirectory(plane_ifds_[address.plane]), "");
  if (address.level > 0) {
    RETURN_IF_ERROR(
        file.SetSubDirectory(sub_ifds_[address.plane][address.level - 1]), "");
  }

  DECLARE_ASSIGN_OR_RETURN(TiffPageInfo, page, file.GetPageInfo());
  if (page.width != level.width || page.height != level.height ||
      page.tile_width != level.tile_width ||
      page.tile_height != level.tile_height) {
    return TRACE_STATUS(SourceReadError(fmt::format(
        "Plane {} level {} geometry {}x{} (tiles {}x{}) differs from the "
        "pyramid of plane 0",
        address.plane, address.level, page.width, page.height,
        page.tile_width, page.tile_height)));
  }

  RawTile raw;
  ASSIGN_OR_RETURN(raw.bytes, file.ReadTile(address.col * level.tile_width,
                                            address.row * level.tile_height),
                   "Reading " + address.ToString());
  raw.nominal_width = level.tile_width;
  raw.nominal_height = level.tile_height;
  raw.valid_width = level.ValidTileWidth(address.col);
  raw.valid_height = level.ValidTileHeight(address.row);
  raw.layout = {page.samples_per_pixel, page.bits_per_sample,
                SampleFormatFromTiff(page.sample_format)};
  return raw;
}

}  // namespace omeslice

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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_SOURCE_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_SOURCE_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_source.h"
#include "omeslice/tiff/tiff_handle_pool.h"

/**
 * @file ome_tiff_source.h
 * @brief PixelSource over a pyramidal OME-TIFF file
 *
 * Layout expected on disk: one top-level IFD per plane holding the full
 * resolution image, with the reduced resolutions of that plane stored as
 * its SubIFDs, largest first. The OME-XML document sits in the
 * ImageDescription of the first IFD; its TiffData blocks bind planes to
 * IFDs.
 */

namespace omeslice {

/// @brief Tiled OME-TIFF reader
///
/// ReadTile is thread-safe: each call borrows its own libtiff handle from
/// the pool.
class OmeTiffPixelSource : public PixelSource {
 public:
  /// @brief Open an OME-TIFF file
  ///
  /// @param path File to open
  /// @param pool_size Maximum concurrent libtiff handles (0 = hardware
  ///        concurrency)
  /// @return Source; SourceReadError when the file cannot be read,
  ///         MalformedMetadataError when it carries no usable OME-XML or
  ///         its TiffData names missing IFDs
  static absl::StatusOr<std::unique_ptr<OmeTiffPixelSource>> Open(
      const std::filesystem::path& path, unsigned pool_size = 0);

  absl::StatusOr<std::string> ReadRawMetadataText() const override;
  absl::StatusOr<std::vector<ResolutionLevel>> ReadLevels() const override;
  absl::StatusOr<RawTile> ReadTile(const TileAddress& address) const override;

  /// @brief Top-level IFD holding a plane's full resolution image
  [[nodiscard]] uint32_t GetPlaneIfd(uint32_t plane) const {
    return plane_ifds_.at(plane);
  }

  [[nodiscard]] const std::filesystem::path& GetPath() const {
    return pool_->GetPath();
  }

 private:
  OmeTiffPixelSource(std::unique_ptr<TIFFHandlePool> pool,
                     std::string metadata_text,
                     std::vector<ResolutionLevel> levels,
                     std::vector<uint32_t> plane_ifds,
                     std::vector<std::vector<uint64_t>> sub_ifds);

  std::unique_ptr<TIFFHandlePool> pool_;
  std::string metadata_text_;
  std::vector<ResolutionLevel> levels_;
  /// Top-level IFD index per plane (descriptor order).
  std::vector<uint32_t> plane_ifds_;
  /// SubIFD offsets per plane; entry i holds level i + 1.
  std::vector<std::vector<uint64_t>> sub_ifds_;
};

/// @brief Downsample factor of a level relative to the base
///
/// Taken from the longer level axis and snapped to the nearest integer when
/// within 1% of it (dimensions of reduced levels are rounded, so ratios are
/// rarely exact). The factor must reproduce both level dimensions to within
/// one pixel.
///
/// @return UnsupportedGeometryError for an anisotropic level
absl::StatusOr<double> EstimateDownsample(uint32_t base_width,
                                          uint32_t base_height,
                                          uint32_t level_width,
                                          uint32_t level_height);

/// @brief Top-level IFD of every plane of a descriptor
///
/// Planes not covered by any TiffData block fall back to their
/// rasterization index.
absl::StatusOr<std::vector<uint32_t>> MapPlanesToIfds(
    const ImageDescriptor& descriptor, const std::string& metadata_text);

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_SOURCE_H_

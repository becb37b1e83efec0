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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_OME_SLICER_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_OME_SLICER_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_source.h"
#include "omeslice/engine/tile_sink.h"
#include "omeslice/engine/tile_stream.h"
#include "omeslice/metadata/metadata_synchronizer.h"
#include "omeslice/tiff/ome_tiff_writer.h"

/**
 * @file ome_slicer.h
 * @brief Load, crop and save pyramidal OME-TIFF images
 *
 * Example:
 * @code
 *   auto slicer = omeslice::OmeSlicer::Load("slide.ome.tiff");
 *   auto cropped = slicer->Crop(10000, 10000, 5000, 5000);
 *   auto status = cropped->Save("region.ome.tiff");
 * @endcode
 */

namespace omeslice {

/// @brief Options shared by a slicer and every handle cropped from it
struct SlicerOptions {
  /// Handling of pyramid levels that become empty after a crop.
  SynchronizerOptions sync;
  /// Decode the source tiles of each output row on the shared thread pool.
  bool parallel_decode = true;
  /// Output container settings used by Save.
  TiffWriterOptions writer;
  /// Concurrent libtiff handles on the source (0 = hardware concurrency).
  unsigned handle_pool_size = 0;
};

/// @brief Width, height and logical channel count of an image
struct ImageDimensions {
  uint32_t width = 0;
  uint32_t height = 0;
  size_t channels = 0;

  bool operator==(const ImageDimensions&) const = default;
};

/**
 * @brief Handle on an OME image, optionally cropped
 *
 * Handles are immutable. Crop returns a new handle; the source container
 * and the uncropped descriptor are shared read-only between all handles
 * derived from one Load, nothing mutable is.
 */
class OmeSlicer {
 public:
  /// @brief Open an OME-TIFF file
  /// @return Handle, or the SourceReadError/MalformedMetadataError raised
  ///         while reading the container and its metadata
  static absl::StatusOr<OmeSlicer> Load(const std::filesystem::path& path,
                                        SlicerOptions options = {});

  /// @brief Build a handle over an arbitrary container and codec
  static absl::StatusOr<OmeSlicer> FromSource(
      std::shared_ptr<const PixelSource> source,
      std::shared_ptr<const TileDecoder> decoder, SlicerOptions options = {});

  /// @brief Crop relative to this handle
  ///
  /// Coordinates are in this handle's level 0 pixels, so cropping a
  /// cropped handle narrows it further.
  ///
  /// @return New handle; OutOfBoundsError when the rectangle is empty or
  ///         leaves the image, UnsupportedGeometryError when a level
  ///         degenerates under DegenerateLevelPolicy::kFail
  absl::StatusOr<OmeSlicer> Crop(uint32_t x, uint32_t y, uint32_t width,
                                 uint32_t height) const;
  absl::StatusOr<OmeSlicer> Crop(const CropRectangle& crop) const;

  /// @brief Write the cropped image as OME-TIFF
  ///
  /// The file appears at `path` only when everything has been written.
  /// @return kFailedPrecondition when this handle has never been cropped
  absl::Status Save(const std::filesystem::path& path) const;

  /// @brief Stream every output tile and the metadata into a sink
  ///
  /// Passes run plane by plane, levels in ascending order. The sink is
  /// committed on success and aborted on any failure.
  absl::Status Emit(TileSink& sink) const;

  /// @brief Open one output pass
  ///
  /// @param level Output level index
  /// @param plane Plane index
  absl::StatusOr<TileStream> OpenStream(uint32_t level, uint32_t plane) const;

  [[nodiscard]] ImageDimensions GetDimensions() const;
  [[nodiscard]] size_t GetChannelCount() const;
  [[nodiscard]] PixelType GetPixelType() const;

  /// @brief OME-XML of this handle (synchronized to the crop)
  [[nodiscard]] const std::string& GetMetadataText() const {
    return metadata_text_;
  }

  [[nodiscard]] const ImageDescriptor& GetDescriptor() const {
    return descriptor_;
  }

  /// @brief Crop in the level 0 pixels of the loaded image; nullopt when
  /// uncropped
  [[nodiscard]] const std::optional<CropRectangle>& GetCropRectangle() const {
    return crop_;
  }

  /// @brief Source level each output level is read from
  [[nodiscard]] const std::vector<uint32_t>& GetSourceLevels() const {
    return source_levels_;
  }

 private:
  OmeSlicer(std::shared_ptr<const PixelSource> source,
            std::shared_ptr<const TileDecoder> decoder,
            std::shared_ptr<const ImageDescriptor> source_descriptor,
            SlicerOptions options);

  [[nodiscard]] CropRectangle EffectiveCrop() const;
  [[nodiscard]] StreamOptions GetStreamOptions() const;

  std::shared_ptr<const PixelSource> source_;
  std::shared_ptr<const TileDecoder> decoder_;
  std::shared_ptr<const ImageDescriptor> source_descriptor_;
  SlicerOptions options_;

  std::optional<CropRectangle> crop_;
  ImageDescriptor descriptor_;
  std::vector<uint32_t> source_levels_;
  std::string metadata_text_;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_OME_SLICER_H_

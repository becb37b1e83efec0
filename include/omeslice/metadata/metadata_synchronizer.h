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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_METADATA_SYNCHRONIZER_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_METADATA_SYNCHRONIZER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"

namespace omeslice {

/// @brief What to do with a pyramid level that holds no pixels after a crop
enum class DegenerateLevelPolicy {
  kDrop,  ///< Remove the level from the output pyramid (logged)
  kFail,  ///< Fail with UnsupportedGeometryError
};

constexpr const char* GetName(DegenerateLevelPolicy policy) {
  switch (policy) {
    case DegenerateLevelPolicy::kDrop:
      return "drop";
    case DegenerateLevelPolicy::kFail:
      return "fail";
  }
  return "unknown";
}

absl::StatusOr<DegenerateLevelPolicy> ParseDegenerateLevelPolicy(
    std::string_view name);

/// @brief Options for metadata derivation
struct SynchronizerOptions {
  DegenerateLevelPolicy degenerate_levels = DegenerateLevelPolicy::kDrop;
};

/// @brief Derived descriptor together with its level mapping
struct CroppedDescriptor {
  ImageDescriptor descriptor;
  /// Output level i is read from source level source_levels[i].
  std::vector<uint32_t> source_levels;
  /// Source levels removed by the degenerate-level policy.
  std::vector<uint32_t> dropped_levels;
};

/// @brief Derives the metadata of a cropped image
class MetadataSynchronizer {
 public:
  /// @brief Derive the descriptor of `source` cropped to `crop`
  ///
  /// Level 0 becomes crop.width x crop.height. Every other level is sized
  /// by scaling the crop with that level's own downsample factor, exactly
  /// as GeometryResolver::ScaleToLevel selects its pixels, so each level
  /// stays consistent with the data streamed for it. Tile sizes,
  /// downsample factors, physical calibration, channels and planes are
  /// carried over unchanged. The source descriptor is not modified.
  ///
  /// @param source Descriptor of the uncropped image
  /// @param crop Crop rectangle in level 0 pixels
  /// @param options Degenerate-level policy
  /// @return Derived descriptor; OutOfBoundsError for an invalid crop,
  ///         UnsupportedGeometryError for a degenerate level under kFail
  static absl::StatusOr<CroppedDescriptor> DeriveCropped(
      const ImageDescriptor& source, const CropRectangle& crop,
      const SynchronizerOptions& options = {});

  /// @brief OME-XML text of a derived descriptor
  static absl::StatusOr<std::string> Synchronize(
      const ImageDescriptor& derived);
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_METADATA_SYNCHRONIZER_H_

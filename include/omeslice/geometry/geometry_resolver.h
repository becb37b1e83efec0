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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_GEOMETRY_GEOMETRY_RESOLVER_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_GEOMETRY_GEOMETRY_RESOLVER_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "omeslice/core/geometry_map.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"

namespace omeslice {

/// @brief Maps level 0 crop rectangles onto resolution level tile grids
///
/// Stateless; all methods are pure functions of their arguments.
class GeometryResolver {
 public:
  /// @brief Scale a level 0 crop into level pixel coordinates
  ///
  /// The origin is rounded down and the far edge rounded up, then clipped
  /// to the level's valid area, so the result covers the exact fractional
  /// target. The same rule sizes every level of a cropped pyramid.
  ///
  /// @param crop Crop in level 0 pixels
  /// @param level Target level
  /// @return Level-local rectangle, or OutOfBoundsError when it is empty
  static absl::StatusOr<PixelRect> ScaleToLevel(const CropRectangle& crop,
                                                const ResolutionLevel& level);

  /// @brief Compute the tile coverage of a crop at one level
  ///
  /// @param descriptor Image with its resolution levels
  /// @param crop Crop in level 0 pixels (validated against the image)
  /// @param level Level index
  /// @return Geometry map whose contributions tile the scaled region
  ///         exactly once
  static absl::StatusOr<GeometryMap> Resolve(const ImageDescriptor& descriptor,
                                             const CropRectangle& crop,
                                             uint32_t level);

  /// @brief Tile a level-local region with the level's source tiles
  ///
  /// Only tiles whose valid extent intersects the region are returned, row
  /// major. Destination rectangles are relative to the region's origin.
  /// The region must lie inside the level.
  static std::vector<TileContribution> CoverRegion(const ResolutionLevel& level,
                                                   const PixelRect& region);
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_GEOMETRY_GEOMETRY_RESOLVER_H_

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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_GEOMETRY_MAP_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_GEOMETRY_MAP_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "omeslice/core/tile_address.h"

/**
 * @file geometry_map.h
 * @brief Result of mapping a crop rectangle onto one resolution level
 *
 * A GeometryMap is pure data: it says which source tiles are needed and
 * where their pixels land, without touching the container. It is computed
 * per request and never persisted.
 */

namespace omeslice {
namespace core {

/// @brief One source tile's share of an assembled region
///
/// `source` is relative to the tile's top-left corner and lies within its
/// valid extent. `dest` is relative to the assembled buffer and always has
/// the same size as `source` (no resampling).
struct TileContribution {
  TileCoordinate tile;  ///< Source tile in the level grid
  PixelRect source;     ///< Region inside the source tile
  PixelRect dest;       ///< Region inside the destination buffer

  bool operator==(const TileContribution&) const = default;
};

/// @brief Tile coverage of a crop at one resolution level
///
/// Contributions are ordered row-major by source tile and tile the
/// destination buffer of size `level_region` exactly once.
struct GeometryMap {
  CropRectangle crop;      ///< Requested crop (level 0 pixels)
  uint32_t level = 0;      ///< Resolution level index
  double downsample = 1.0; ///< Level scale factor
  PixelRect level_region;  ///< Crop scaled into level pixels
  uint32_t tile_width = 0;
  uint32_t tile_height = 0;
  std::vector<TileContribution> contributions;

  /// @brief Number of source tiles touched
  [[nodiscard]] size_t GetTileCount() const { return contributions.size(); }

  /// @brief Number of pixels copied (equals level_region area)
  [[nodiscard]] uint64_t GetPixelCount() const {
    uint64_t total = 0;
    for (const auto& contribution : contributions) {
      total += contribution.dest.Area();
    }
    return total;
  }

  [[nodiscard]] TileAddress AddressOf(const TileContribution& contribution,
                                      uint32_t plane) const {
    return {level, plane, contribution.tile.row, contribution.tile.col};
  }
};

}  // namespace core

using core::GeometryMap;
using core::TileContribution;

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_GEOMETRY_MAP_H_

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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_TILE_ADDRESS_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_TILE_ADDRESS_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"

/**
 * @file tile_address.h
 * @brief Crop rectangles, pixel rectangles and tile addresses
 */

namespace omeslice {
namespace core {

/// @brief Requested crop in level 0 pixel coordinates
///
/// This is an aggregate type to support designated initializers in C++20.
struct CropRectangle {
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t width = 0;
  uint32_t height = 0;

  [[nodiscard]] bool IsEmpty() const noexcept {
    return width == 0 || height == 0;
  }

  /// @brief Exclusive right edge
  [[nodiscard]] uint64_t Right() const noexcept {
    return static_cast<uint64_t>(x) + width;
  }

  /// @brief Exclusive bottom edge
  [[nodiscard]] uint64_t Bottom() const noexcept {
    return static_cast<uint64_t>(y) + height;
  }

  [[nodiscard]] std::string ToString() const;

  bool operator==(const CropRectangle&) const = default;
};

/// @brief Check a crop against image bounds
///
/// Fails with OutOfBoundsError for empty rectangles and for rectangles that
/// extend past the image. Nothing is clamped.
absl::Status ValidateCropRectangle(const CropRectangle& crop,
                                   uint32_t image_width,
                                   uint32_t image_height);

/// @brief Rectangle in some pixel space (tile-local, level-local or buffer)
struct PixelRect {
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t width = 0;
  uint32_t height = 0;

  [[nodiscard]] bool IsEmpty() const noexcept {
    return width == 0 || height == 0;
  }

  [[nodiscard]] uint64_t Right() const noexcept {
    return static_cast<uint64_t>(x) + width;
  }

  [[nodiscard]] uint64_t Bottom() const noexcept {
    return static_cast<uint64_t>(y) + height;
  }

  [[nodiscard]] uint64_t Area() const noexcept {
    return static_cast<uint64_t>(width) * height;
  }

  bool operator==(const PixelRect&) const = default;
};

/// @brief Intersection of two rectangles (empty when disjoint)
PixelRect Intersect(const PixelRect& a, const PixelRect& b);

/// @brief Tile position within a level's grid
struct TileCoordinate {
  uint32_t row = 0;
  uint32_t col = 0;

  bool operator==(const TileCoordinate&) const = default;
};

/// @brief Unit of lazy fetch: (level, plane, row, col)
struct TileAddress {
  uint32_t level = 0;
  uint32_t plane = 0;
  uint32_t row = 0;
  uint32_t col = 0;

  bool operator==(const TileAddress&) const = default;

  template <typename H>
  friend H AbslHashValue(H h, const TileAddress& address) {
    return H::combine(std::move(h), address.level, address.plane,
                      address.row, address.col);
  }

  [[nodiscard]] std::string ToString() const;
};

}  // namespace core

using core::CropRectangle;
using core::PixelRect;
using core::TileAddress;
using core::TileCoordinate;

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_TILE_ADDRESS_H_

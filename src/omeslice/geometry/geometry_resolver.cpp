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

#include "omeslice/geometry/geometry_resolver.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

namespace {

/// Scaled [begin, end) span of one axis, clipped to `limit`.
struct Span {
  uint64_t begin;
  uint64_t end;
};

Span ScaleSpan(uint64_t begin, uint64_t end, double downsample,
               uint32_t limit) {
  if (downsample == 1.0) {
    return {begin, std::min<uint64_t>(end, limit)};
  }
  const auto scaled_begin =
      static_cast<uint64_t>(std::floor(static_cast<double>(begin) / downsample));
  const auto scaled_end =
      static_cast<uint64_t>(std::ceil(static_cast<double>(end) / downsample));
  return {scaled_begin, std::min<uint64_t>(scaled_end, limit)};
}

}  // namespace

absl::StatusOr<PixelRect> GeometryResolver::ScaleToLevel(
    const CropRectangle& crop, const ResolutionLevel& level) {
  if (crop.IsEmpty()) {
    return TRACE_STATUS(OutOfBoundsError(
        absl::StrFormat("Crop rectangle %s has zero area", crop.ToString())));
  }
  if (level.downsample < 1.0) {
    return TRACE_STATUS(OutOfBoundsError(absl::StrFormat(
        "Level %u has invalid downsample %g", level.index, level.downsample)));
  }

  const Span xs = ScaleSpan(crop.x, crop.Right(), level.downsample,
                            level.width);
  const Span ys = ScaleSpan(crop.y, crop.Bottom(), level.downsample,
                            level.height);
  if (xs.end <= xs.begin || ys.end <= ys.begin) {
    return TRACE_STATUS(OutOfBoundsError(absl::StrFormat(
        "Crop %s maps to no pixels at level %u (%ux%u, downsample %g)",
        crop.ToString(), level.index, level.width, level.height,
        level.downsample)));
  }

  return PixelRect{static_cast<uint32_t>(xs.begin),
                   static_cast<uint32_t>(ys.begin),
                   static_cast<uint32_t>(xs.end - xs.begin),
                   static_cast<uint32_t>(ys.end - ys.begin)};
}

absl::StatusOr<GeometryMap> GeometryResolver::Resolve(
    const ImageDescriptor& descriptor, const CropRectangle& crop,
    uint32_t level) {
  if (level >= descriptor.levels.size()) {
    return TRACE_STATUS(OutOfBoundsError(
        absl::StrFormat("Invalid level: %u (image has %zu levels)", level,
                        descriptor.levels.size())));
  }
  RETURN_IF_ERROR(
      ValidateCropRectangle(crop, descriptor.width, descriptor.height),
      "Crop rectangle rejected");

  const ResolutionLevel& level_info = descriptor.levels[level];
  if (level_info.tile_width == 0 || level_info.tile_height == 0) {
    return TRACE_STATUS(MalformedMetadataError(
        absl::StrFormat("Level %u has no tile geometry", level)));
  }

  GeometryMap map;
  map.crop = crop;
  map.level = level;
  map.downsample = level_info.downsample;
  map.tile_width = level_info.tile_width;
  map.tile_height = level_info.tile_height;
  ASSIGN_OR_RETURN(map.level_region, ScaleToLevel(crop, level_info));
  map.contributions = CoverRegion(level_info, map.level_region);
  return map;
}

std::vector<TileContribution> GeometryResolver::CoverRegion(
    const ResolutionLevel& level, const PixelRect& region) {
  std::vector<TileContribution> contributions;
  if (region.IsEmpty() || level.tile_width == 0 || level.tile_height == 0) {
    return contributions;
  }

  const uint32_t tile_w = level.tile_width;
  const uint32_t tile_h = level.tile_height;
  const auto first_col = static_cast<uint32_t>(region.x / tile_w);
  const auto last_col = static_cast<uint32_t>((region.Right() - 1) / tile_w);
  const auto first_row = static_cast<uint32_t>(region.y / tile_h);
  const auto last_row = static_cast<uint32_t>((region.Bottom() - 1) / tile_h);

  contributions.reserve(static_cast<size_t>(last_col - first_col + 1) *
                        (last_row - first_row + 1));

  for (uint32_t row = first_row; row <= last_row; ++row) {
    for (uint32_t col = first_col; col <= last_col; ++col) {
      // Tile bounds in level coordinates, clipped to the valid extent
      const PixelRect tile_rect{col * tile_w, row * tile_h,
                                level.ValidTileWidth(col),
                                level.ValidTileHeight(row)};
      const PixelRect overlap = core::Intersect(tile_rect, region);
      if (overlap.IsEmpty()) {
        continue;
      }

      TileContribution contribution;
      contribution.tile = {row, col};
      contribution.source = {overlap.x - tile_rect.x, overlap.y - tile_rect.y,
                             overlap.width, overlap.height};
      contribution.dest = {overlap.x - region.x, overlap.y - region.y,
                           overlap.width, overlap.height};
      contributions.push_back(contribution);
    }
  }

  return contributions;
}

}  // namespace omeslice

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

#include "omeslice/core/image_descriptor.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"

namespace omeslice {
namespace core {

namespace {

/// Axis sizes and indices ordered fastest-varying first.
struct AxisOrder {
  std::array<char, 3> axes;
};

AxisOrder GetAxisOrder(DimensionOrder order) {
  switch (order) {
    case DimensionOrder::kXYZCT:
      return {{'Z', 'C', 'T'}};
    case DimensionOrder::kXYZTC:
      return {{'Z', 'T', 'C'}};
    case DimensionOrder::kXYCTZ:
      return {{'C', 'T', 'Z'}};
    case DimensionOrder::kXYCZT:
      return {{'C', 'Z', 'T'}};
    case DimensionOrder::kXYTCZ:
      return {{'T', 'C', 'Z'}};
    case DimensionOrder::kXYTZC:
      return {{'T', 'Z', 'C'}};
  }
  return {{'Z', 'C', 'T'}};
}

constexpr std::array<PixelType, 8> kPixelTypes = {
    PixelType::kInt8,  PixelType::kUInt8,  PixelType::kInt16,
    PixelType::kUInt16, PixelType::kInt32, PixelType::kUInt32,
    PixelType::kFloat, PixelType::kDouble};

constexpr std::array<DimensionOrder, 6> kDimensionOrders = {
    DimensionOrder::kXYZCT, DimensionOrder::kXYZTC, DimensionOrder::kXYCTZ,
    DimensionOrder::kXYCZT, DimensionOrder::kXYTCZ, DimensionOrder::kXYTZC};

}  // namespace

absl::StatusOr<PixelType> ParsePixelType(std::string_view name) {
  for (PixelType type : kPixelTypes) {
    if (name == GetName(type)) {
      return type;
    }
  }
  return MalformedMetadataError(
      absl::StrFormat("Unsupported pixel type '%s'", name));
}

absl::StatusOr<DimensionOrder> ParseDimensionOrder(std::string_view name) {
  for (DimensionOrder order : kDimensionOrders) {
    if (name == GetName(order)) {
      return order;
    }
  }
  return MalformedMetadataError(
      absl::StrFormat("Invalid dimension order '%s'", name));
}

uint32_t ResolutionLevel::ValidTileWidth(uint32_t col) const {
  const uint64_t left = static_cast<uint64_t>(col) * tile_width;
  if (left >= width) {
    return 0;
  }
  return static_cast<uint32_t>(
      std::min<uint64_t>(tile_width, width - left));
}

uint32_t ResolutionLevel::ValidTileHeight(uint32_t row) const {
  const uint64_t top = static_cast<uint64_t>(row) * tile_height;
  if (top >= height) {
    return 0;
  }
  return static_cast<uint32_t>(
      std::min<uint64_t>(tile_height, height - top));
}

std::optional<size_t> ImageDescriptor::FindPlane(uint32_t c, uint32_t z,
                                                 uint32_t t) const {
  for (size_t i = 0; i < planes.size(); ++i) {
    const PlaneDescriptor& plane = planes[i];
    if (plane.the_c == c && plane.the_z == z && plane.the_t == t) {
      return i;
    }
  }
  return std::nullopt;
}

absl::StatusOr<SampleLayout> ImageDescriptor::GetPlaneLayout(
    size_t plane) const {
  if (plane >= planes.size()) {
    return OutOfBoundsError(absl::StrFormat(
        "Plane index %zu out of range (%zu planes)", plane, planes.size()));
  }
  const uint32_t channel = planes[plane].the_c;
  if (channel >= channels.size()) {
    return MalformedMetadataError(absl::StrFormat(
        "Plane %zu references channel %u of %zu", plane, channel,
        channels.size()));
  }
  SampleLayout layout = channels[channel].GetSampleLayout();
  layout.sample_format = GetSampleFormat(pixel_type);
  return layout;
}

size_t LinearPlaneIndex(DimensionOrder order, uint32_t size_z,
                        uint32_t channel_count, uint32_t size_time,
                        uint32_t c, uint32_t z, uint32_t t) {
  size_t index = 0;
  size_t stride = 1;
  for (char axis : GetAxisOrder(order).axes) {
    switch (axis) {
      case 'Z':
        index += z * stride;
        stride *= size_z;
        break;
      case 'C':
        index += c * stride;
        stride *= channel_count;
        break;
      default:
        index += t * stride;
        stride *= size_time;
        break;
    }
  }
  return index;
}

std::vector<PlaneDescriptor> RasterizePlanes(DimensionOrder order,
                                             uint32_t size_z,
                                             uint32_t channel_count,
                                             uint32_t size_time) {
  const size_t count =
      static_cast<size_t>(size_z) * channel_count * size_time;
  std::vector<PlaneDescriptor> planes(count);
  for (uint32_t t = 0; t < size_time; ++t) {
    for (uint32_t c = 0; c < channel_count; ++c) {
      for (uint32_t z = 0; z < size_z; ++z) {
        PlaneDescriptor& plane = planes[LinearPlaneIndex(
            order, size_z, channel_count, size_time, c, z, t)];
        plane.the_c = c;
        plane.the_z = z;
        plane.the_t = t;
      }
    }
  }
  return planes;
}

absl::Status Validate(const ImageDescriptor& descriptor) {
  if (descriptor.width == 0 || descriptor.height == 0) {
    return MalformedMetadataError(
        absl::StrFormat("Image dimensions must be positive, got %ux%u",
                        descriptor.width, descriptor.height));
  }
  if (descriptor.size_z == 0 || descriptor.size_time == 0) {
    return MalformedMetadataError(
        absl::StrFormat("SizeZ and SizeT must be positive, got %u and %u",
                        descriptor.size_z, descriptor.size_time));
  }
  if (descriptor.channels.empty()) {
    return MalformedMetadataError("Image declares no channels");
  }

  uint32_t total_samples = 0;
  for (size_t i = 0; i < descriptor.channels.size(); ++i) {
    const ChannelDescriptor& channel = descriptor.channels[i];
    if (channel.samples_per_pixel == 0 || channel.bits_per_sample == 0) {
      return MalformedMetadataError(
          absl::StrFormat("Channel %zu has an empty sample layout", i));
    }
    total_samples += channel.samples_per_pixel;
  }
  if (total_samples != descriptor.size_c) {
    return MalformedMetadataError(absl::StrFormat(
        "SizeC is %u but channels declare %u samples", descriptor.size_c,
        total_samples));
  }

  // Every plane must reference valid indices, once.
  std::set<std::tuple<uint32_t, uint32_t, uint32_t>> seen;
  for (size_t i = 0; i < descriptor.planes.size(); ++i) {
    const PlaneDescriptor& plane = descriptor.planes[i];
    if (plane.the_c >= descriptor.channels.size() ||
        plane.the_z >= descriptor.size_z ||
        plane.the_t >= descriptor.size_time) {
      return MalformedMetadataError(absl::StrFormat(
          "Plane %zu references (C=%u, Z=%u, T=%u) outside (%zu, %u, %u)", i,
          plane.the_c, plane.the_z, plane.the_t, descriptor.channels.size(),
          descriptor.size_z, descriptor.size_time));
    }
    if (!seen.emplace(plane.the_c, plane.the_z, plane.the_t).second) {
      return MalformedMetadataError(absl::StrFormat(
          "Plane %zu duplicates (C=%u, Z=%u, T=%u)", i, plane.the_c,
          plane.the_z, plane.the_t));
    }
  }
  if (descriptor.planes.empty()) {
    return MalformedMetadataError("Image declares no planes");
  }
  if (!descriptor.planes_declared &&
      descriptor.planes.size() != descriptor.GetDensePlaneCount()) {
    return MalformedMetadataError(absl::StrFormat(
        "Expected %zu planes, found %zu", descriptor.GetDensePlaneCount(),
        descriptor.planes.size()));
  }

  for (size_t i = 0; i < descriptor.levels.size(); ++i) {
    const ResolutionLevel& level = descriptor.levels[i];
    if (level.index != i) {
      return MalformedMetadataError(
          absl::StrFormat("Level %zu carries index %u", i, level.index));
    }
    if (level.width == 0 || level.height == 0 || level.tile_width == 0 ||
        level.tile_height == 0) {
      return MalformedMetadataError(
          absl::StrFormat("Level %zu has an empty geometry", i));
    }
    if (i == 0 && (level.width != descriptor.width ||
                   level.height != descriptor.height ||
                   level.downsample != 1.0)) {
      return MalformedMetadataError(absl::StrFormat(
          "Level 0 is %ux%u (x%g), image is %ux%u", level.width, level.height,
          level.downsample, descriptor.width, descriptor.height));
    }
    if (i > 0 && level.downsample <= descriptor.levels[i - 1].downsample) {
      return MalformedMetadataError(absl::StrFormat(
          "Level %zu downsample %g does not exceed level %zu", i,
          level.downsample, i - 1));
    }
  }

  return absl::OkStatus();
}

}  // namespace core
}  // namespace omeslice

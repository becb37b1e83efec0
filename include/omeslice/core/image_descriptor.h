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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_IMAGE_DESCRIPTOR_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_IMAGE_DESCRIPTOR_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

/**
 * @file image_descriptor.h
 * @brief In-memory model of an OME image: dimensions, calibration, channels,
 * planes and the resolution pyramid
 *
 * These are plain data types. They are built once when an image is opened
 * and are never mutated afterwards; cropping derives a new descriptor.
 */

namespace omeslice {
namespace core {

/// @brief Pixel type enumeration (OME Pixels@Type)
enum class PixelType {
  kInt8,    ///< 8-bit signed integer
  kUInt8,   ///< 8-bit unsigned integer
  kInt16,   ///< 16-bit signed integer
  kUInt16,  ///< 16-bit unsigned integer
  kInt32,   ///< 32-bit signed integer
  kUInt32,  ///< 32-bit unsigned integer
  kFloat,   ///< 32-bit floating point
  kDouble   ///< 64-bit floating point
};

/// @brief Get size in bytes of one sample of the given pixel type
constexpr uint32_t GetBytesPerSample(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
    case PixelType::kUInt8:
      return 1;
    case PixelType::kInt16:
    case PixelType::kUInt16:
      return 2;
    case PixelType::kInt32:
    case PixelType::kUInt32:
    case PixelType::kFloat:
      return 4;
    case PixelType::kDouble:
      return 8;
  }
  return 0;
}

/// @brief Get the OME name of a pixel type
constexpr const char* GetName(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
      return "int8";
    case PixelType::kUInt8:
      return "uint8";
    case PixelType::kInt16:
      return "int16";
    case PixelType::kUInt16:
      return "uint16";
    case PixelType::kInt32:
      return "int32";
    case PixelType::kUInt32:
      return "uint32";
    case PixelType::kFloat:
      return "float";
    case PixelType::kDouble:
      return "double";
  }
  return "unknown";
}

constexpr bool IsSigned(PixelType type) {
  return type == PixelType::kInt8 || type == PixelType::kInt16 ||
         type == PixelType::kInt32;
}

constexpr bool IsFloatingPoint(PixelType type) {
  return type == PixelType::kFloat || type == PixelType::kDouble;
}

/// @brief Parse an OME pixel type name
/// @return MalformedMetadataError for unknown or unsupported types
absl::StatusOr<PixelType> ParsePixelType(std::string_view name);

/// @brief Rasterization order of the Z, C and T axes (OME DimensionOrder)
///
/// The first axis after XY varies fastest.
enum class DimensionOrder { kXYZCT, kXYZTC, kXYCTZ, kXYCZT, kXYTCZ, kXYTZC };

constexpr const char* GetName(DimensionOrder order) {
  switch (order) {
    case DimensionOrder::kXYZCT:
      return "XYZCT";
    case DimensionOrder::kXYZTC:
      return "XYZTC";
    case DimensionOrder::kXYCTZ:
      return "XYCTZ";
    case DimensionOrder::kXYCZT:
      return "XYCZT";
    case DimensionOrder::kXYTCZ:
      return "XYTCZ";
    case DimensionOrder::kXYTZC:
      return "XYTZC";
  }
  return "unknown";
}

absl::StatusOr<DimensionOrder> ParseDimensionOrder(std::string_view name);

/// @brief Interpretation of sample bits (TIFF SampleFormat)
enum class SampleFormat { kUnsigned, kSigned, kFloat };

constexpr const char* GetName(SampleFormat format) {
  switch (format) {
    case SampleFormat::kUnsigned:
      return "unsigned";
    case SampleFormat::kSigned:
      return "signed";
    case SampleFormat::kFloat:
      return "float";
  }
  return "unknown";
}

constexpr SampleFormat GetSampleFormat(PixelType type) {
  if (IsFloatingPoint(type)) {
    return SampleFormat::kFloat;
  }
  return IsSigned(type) ? SampleFormat::kSigned : SampleFormat::kUnsigned;
}

/// @brief Physical layout of one sample group as stored in tiles
struct SampleLayout {
  uint32_t samples_per_pixel = 1;  ///< Interleaved samples per pixel
  uint32_t bits_per_sample = 8;    ///< Bits per sample
  SampleFormat sample_format = SampleFormat::kUnsigned;

  [[nodiscard]] uint32_t BytesPerPixel() const {
    return samples_per_pixel * ((bits_per_sample + 7) / 8);
  }

  bool operator==(const SampleLayout&) const = default;
};

/// @brief Physical pixel size with per-axis units
///
/// Units are kept as written; an empty unit means the attribute was absent
/// (OME then implies micrometres).
struct PhysicalSize {
  std::optional<double> x;
  std::optional<double> y;
  std::optional<double> z;
  std::string x_unit;
  std::string y_unit;
  std::string z_unit;

  bool operator==(const PhysicalSize&) const = default;
};

/// @brief One logical channel (OME Channel)
struct ChannelDescriptor {
  std::string id;                  ///< Channel ID (e.g., "Channel:0:0")
  std::string name;                ///< Channel name (e.g., "DAPI")
  uint32_t samples_per_pixel = 1;  ///< Interleaved samples per pixel
  uint32_t bits_per_sample = 8;    ///< Sample bit depth
  std::optional<int32_t> color;    ///< Packed RGBA display color

  [[nodiscard]] SampleLayout GetSampleLayout() const {
    return {samples_per_pixel, bits_per_sample};
  }

  bool operator==(const ChannelDescriptor&) const = default;
};

/// @brief One 2D plane bound to a (C, Z, T) coordinate (OME Plane)
struct PlaneDescriptor {
  uint32_t the_c = 0;
  uint32_t the_z = 0;
  uint32_t the_t = 0;
  std::optional<double> position_x;
  std::optional<double> position_y;
  std::optional<double> position_z;
  std::string position_x_unit;
  std::string position_y_unit;
  std::string position_z_unit;

  bool operator==(const PlaneDescriptor&) const = default;
};

/// @brief Tile grid of a resolution level
struct TileGrid {
  uint32_t tile_width = 0;
  uint32_t tile_height = 0;
  uint32_t tiles_across = 0;
  uint32_t tiles_down = 0;

  bool operator==(const TileGrid&) const = default;
};

/// @brief One level of the resolution pyramid
///
/// The last tile column and row may be partial: their valid extent is given
/// by ValidTileWidth/ValidTileHeight, never by the nominal tile size.
struct ResolutionLevel {
  uint32_t index = 0;        ///< 0 = full resolution
  double downsample = 1.0;   ///< Scale factor relative to level 0
  uint32_t width = 0;        ///< Level width in pixels
  uint32_t height = 0;       ///< Level height in pixels
  uint32_t tile_width = 0;   ///< Nominal tile width
  uint32_t tile_height = 0;  ///< Nominal tile height

  [[nodiscard]] uint32_t TilesAcross() const {
    return tile_width == 0 ? 0 : (width + tile_width - 1) / tile_width;
  }

  [[nodiscard]] uint32_t TilesDown() const {
    return tile_height == 0 ? 0 : (height + tile_height - 1) / tile_height;
  }

  [[nodiscard]] TileGrid GetTileGrid() const {
    return {tile_width, tile_height, TilesAcross(), TilesDown()};
  }

  /// @brief Valid pixel width of the tile in the given column
  [[nodiscard]] uint32_t ValidTileWidth(uint32_t col) const;

  /// @brief Valid pixel height of the tile in the given row
  [[nodiscard]] uint32_t ValidTileHeight(uint32_t row) const;

  bool operator==(const ResolutionLevel&) const = default;
};

/// @brief Complete description of one OME image
///
/// `width`/`height` always equal the level 0 dimensions when levels are
/// present. `extension` holds the source OME-XML document so that content
/// the model does not track survives serialization.
struct ImageDescriptor {
  std::string image_id;
  std::string image_name;
  std::string pixels_id;

  uint32_t width = 0;   ///< Base resolution width (SizeX)
  uint32_t height = 0;  ///< Base resolution height (SizeY)
  uint32_t size_z = 1;
  uint32_t size_c = 1;  ///< Total samples across channels (SizeC)
  uint32_t size_time = 1;

  DimensionOrder dimension_order = DimensionOrder::kXYZCT;
  PixelType pixel_type = PixelType::kUInt16;
  std::optional<uint32_t> significant_bits;
  PhysicalSize physical_size;

  std::vector<ChannelDescriptor> channels;
  std::vector<PlaneDescriptor> planes;
  bool planes_declared = false;  ///< Planes came from Plane elements

  std::vector<ResolutionLevel> levels;

  std::shared_ptr<const std::string> extension;

  [[nodiscard]] size_t GetChannelCount() const { return channels.size(); }
  [[nodiscard]] size_t GetPlaneCount() const { return planes.size(); }
  [[nodiscard]] size_t GetLevelCount() const { return levels.size(); }

  /// @brief Number of planes a dense image has (Z x T x channels)
  [[nodiscard]] size_t GetDensePlaneCount() const {
    return static_cast<size_t>(size_z) * size_time * channels.size();
  }

  /// @brief Locate the plane bound to (c, z, t)
  [[nodiscard]] std::optional<size_t> FindPlane(uint32_t c, uint32_t z,
                                                uint32_t t) const;

  /// @brief Sample layout of the channel a plane belongs to, with the
  /// sample format of the pixel type
  absl::StatusOr<SampleLayout> GetPlaneLayout(size_t plane) const;

  friend bool operator==(const ImageDescriptor&,
                         const ImageDescriptor&) = default;
};

/// @brief Rasterization index of (c, z, t) in the given dimension order
///
/// `channel_count` counts logical channels, so an RGB channel stored with
/// three interleaved samples occupies a single index.
size_t LinearPlaneIndex(DimensionOrder order, uint32_t size_z,
                        uint32_t channel_count, uint32_t size_time,
                        uint32_t c, uint32_t z, uint32_t t);

/// @brief Dense plane list in dimension order
std::vector<PlaneDescriptor> RasterizePlanes(DimensionOrder order,
                                             uint32_t size_z,
                                             uint32_t channel_count,
                                             uint32_t size_time);

/// @brief Check the structural invariants of a descriptor
/// @return MalformedMetadataError describing the first violation
absl::Status Validate(const ImageDescriptor& descriptor);

}  // namespace core

using core::ChannelDescriptor;
using core::DimensionOrder;
using core::ImageDescriptor;
using core::PhysicalSize;
using core::PixelType;
using core::PlaneDescriptor;
using core::ResolutionLevel;
using core::SampleFormat;
using core::SampleLayout;
using core::TileGrid;

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_IMAGE_DESCRIPTOR_H_

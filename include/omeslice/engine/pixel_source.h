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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_SOURCE_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_SOURCE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_buffer.h"

/**
 * @file pixel_source.h
 * @brief Contracts of the container reader and the tile codec
 *
 * The engine never opens files itself. A PixelSource hands out raw tiles by
 * address and a TileDecoder turns them into pixel buffers; both may be
 * replaced, e.g. by in-memory fakes in tests.
 */

namespace omeslice {

/// @brief Tile bytes as delivered by the container
///
/// Rows are `nominal_width` pixels apart even when only `valid_width`
/// pixels of a row carry image data (edge tiles).
struct RawTile {
  std::vector<uint8_t> bytes;
  uint32_t nominal_width = 0;
  uint32_t nominal_height = 0;
  uint32_t valid_width = 0;
  uint32_t valid_height = 0;
  SampleLayout layout;  ///< Layout as physically stored
};

/// @brief Read-only access to a tiled, pyramidal pixel container
///
/// Implementations must allow concurrent ReadTile calls.
class PixelSource {
 public:
  virtual ~PixelSource() = default;

  /// @brief Embedded structured metadata (OME-XML)
  virtual absl::StatusOr<std::string> ReadRawMetadataText() const = 0;

  /// @brief Pyramid geometry, level 0 first
  virtual absl::StatusOr<std::vector<ResolutionLevel>> ReadLevels() const = 0;

  /// @brief Read one tile
  /// @return SourceReadError on I/O failure or an unknown address
  virtual absl::StatusOr<RawTile> ReadTile(const TileAddress& address) const = 0;
};

/// @brief Tile codec contract
class TileDecoder {
 public:
  virtual ~TileDecoder() = default;

  /// @brief Decode a raw tile into its valid pixels
  ///
  /// @param raw Tile as read from the container
  /// @param expected Layout declared by the plane's channel
  /// @return Buffer of valid_width x valid_height pixels;
  ///         ChannelMismatchError when the stored layout differs from
  ///         `expected`, SourceReadError when the bytes are truncated
  virtual absl::StatusOr<PixelBuffer> Decode(
      const RawTile& raw, const SampleLayout& expected) const = 0;
};

/// @brief Decoder for tiles whose bytes already hold raw samples
///
/// Containers that decompress on read (libtiff's TIFFReadEncodedTile) pair
/// with this decoder; it checks the layout and drops edge padding.
class RawSampleDecoder : public TileDecoder {
 public:
  absl::StatusOr<PixelBuffer> Decode(
      const RawTile& raw, const SampleLayout& expected) const override;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_SOURCE_H_

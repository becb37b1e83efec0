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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_STREAM_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_STREAM_H_

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include <BS_thread_pool.hpp>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omeslice/core/geometry_map.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/decode_cache.h"
#include "omeslice/engine/pixel_buffer.h"
#include "omeslice/engine/pixel_source.h"
#include "omeslice/engine/tile_sink.h"

/**
 * @file tile_stream.h
 * @brief Lazy, pull-based assembly of output tiles for one (level, plane)
 *
 * A TileStream walks the output tile grid of a cropped level in row-major
 * order. Each call to Next() assembles one output tile completely from the
 * source tiles the geometry map names and returns it. Source tiles pass
 * through a per-pass DecodeCache, so a source tile shared by neighbouring
 * output tiles is read and decoded once. Tiles outside the crop are never
 * requested, and rows of source tiles that later output rows cannot touch
 * are evicted as the walk moves down.
 *
 * Streams are one-pass. Re-reading a pass means opening a new stream.
 */

namespace omeslice {

/// @brief Options for one stream pass
struct StreamOptions {
  /// Output tile size; 0 selects the source level's tile size.
  uint32_t output_tile_width = 0;
  uint32_t output_tile_height = 0;

  /// When set, the source tiles of each output row are decoded on this pool
  /// ahead of assembly. Null means fully serial.
  BS::light_thread_pool* pool = nullptr;
};

/// @brief Lazy sequence of assembled output tiles for one pass
///
/// The stream shares ownership of its PixelSource and TileDecoder, so it
/// stays usable after the handle that opened it is gone.
class TileStream {
 public:
  /// @brief Open a pass over a resolved geometry map
  ///
  /// @param source Container to read source tiles from
  /// @param decoder Codec for the source tiles
  /// @param descriptor Source image (levels, channels, planes)
  /// @param map Geometry map of the crop at the pass level
  /// @param plane Plane index to stream
  /// @param options Stream options
  static absl::StatusOr<TileStream> Open(
      std::shared_ptr<const PixelSource> source,
      std::shared_ptr<const TileDecoder> decoder,
      const ImageDescriptor& descriptor, GeometryMap map, uint32_t plane,
      StreamOptions options = {});

  /// @brief Resolve the crop at `level` and open a pass over it
  static absl::StatusOr<TileStream> Open(
      std::shared_ptr<const PixelSource> source,
      std::shared_ptr<const TileDecoder> decoder,
      const ImageDescriptor& descriptor, const CropRectangle& crop,
      uint32_t level, uint32_t plane, StreamOptions options = {});

  TileStream(TileStream&& other) noexcept = default;
  TileStream& operator=(TileStream&& other) noexcept;
  TileStream(const TileStream&) = delete;
  TileStream& operator=(const TileStream&) = delete;

  /// @brief Waits for outstanding prefetch work
  ~TileStream();

  /// @brief Assemble and return the next output tile
  ///
  /// Tiles come in row-major order of the output grid; their addresses use
  /// the source level index. Edge tiles hold only their valid pixels.
  ///
  /// @return The tile, nullopt once the pass is exhausted, or the error
  ///         that ended the pass (returned again on every later call)
  absl::StatusOr<std::optional<OutputTile>> Next();

  /// @brief Whether the pass has been exhausted or has failed
  [[nodiscard]] bool Done() const;

  [[nodiscard]] const GeometryMap& GetGeometryMap() const { return map_; }
  [[nodiscard]] uint32_t GetPlane() const { return plane_; }

  /// @brief Output tile grid of this pass
  [[nodiscard]] TileGrid GetOutputGrid() const;

  [[nodiscard]] DecodeCache::Stats GetCacheStats() const;

 private:
  TileStream(std::shared_ptr<const PixelSource> source,
             std::shared_ptr<const TileDecoder> decoder, GeometryMap map,
             ResolutionLevel level, uint32_t plane,
             SampleLayout layout, StreamOptions options,
             std::shared_ptr<DecodeCache> cache);

  /// Level-local region covered by output tile (row, col).
  [[nodiscard]] PixelRect OutputRegion(uint32_t row, uint32_t col) const;

  absl::Status BeginOutputRow(uint32_t row);
  void StartPrefetch(uint32_t row);
  absl::Status FinishPrefetch();
  absl::StatusOr<OutputTile> Assemble(uint32_t row, uint32_t col);

  std::shared_ptr<const PixelSource> source_;
  std::shared_ptr<const TileDecoder> decoder_;
  GeometryMap map_;
  ResolutionLevel level_;
  uint32_t plane_;
  SampleLayout layout_;
  StreamOptions options_;
  uint32_t tiles_across_ = 0;
  uint32_t tiles_down_ = 0;
  uint64_t next_index_ = 0;
  absl::Status failure_;
  std::shared_ptr<DecodeCache> cache_;
  std::vector<std::future<absl::Status>> prefetch_;
};

/// @brief Read and decode one source tile
///
/// I/O failures and codec failures without an error kind are reported as
/// SourceReadError; a tile whose valid extent disagrees with the level
/// geometry is a SourceReadError too.
absl::StatusOr<PixelBuffer> FetchAndDecodeTile(const PixelSource& source,
                                               const TileDecoder& decoder,
                                               const ResolutionLevel& level,
                                               const TileAddress& address,
                                               const SampleLayout& layout);

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_STREAM_H_

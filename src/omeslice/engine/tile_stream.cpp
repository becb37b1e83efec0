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

#include "omeslice/engine/tile_stream.h"

#include <algorithm>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"
#include "omeslice/geometry/geometry_resolver.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

absl::StatusOr<PixelBuffer> FetchAndDecodeTile(const PixelSource& source,
                                               const TileDecoder& decoder,
                                               const ResolutionLevel& level,
                                               const TileAddress& address,
                                               const SampleLayout& layout) {
  absl::StatusOr<RawTile> raw = source.ReadTile(address);
  if (!raw.ok()) {
    return TRACE_STATUS(AsErrorKind(raw.status(), ErrorKind::kSourceRead));
  }

  const uint32_t expected_width = level.ValidTileWidth(address.col);
  const uint32_t expected_height = level.ValidTileHeight(address.row);
  if (raw->valid_width != expected_width ||
      raw->valid_height != expected_height) {
    return TRACE_STATUS(SourceReadError(absl::StrFormat(
        "Tile %s declares valid extent %ux%u, level geometry gives %ux%u",
        address.ToString(), raw->valid_width, raw->valid_height,
        expected_width, expected_height)));
  }

  absl::StatusOr<PixelBuffer> decoded = decoder.Decode(*raw, layout);
  if (!decoded.ok()) {
    return TRACE_STATUS(
        AsErrorKind(decoded.status(), ErrorKind::kSourceRead));
  }
  if (decoded->GetWidth() != expected_width ||
      decoded->GetHeight() != expected_height ||
      decoded->GetLayout() != layout) {
    return TRACE_STATUS(SourceReadError(absl::StrFormat(
        "Decoder returned %ux%u pixels for tile %s, expected %ux%u",
        decoded->GetWidth(), decoded->GetHeight(), address.ToString(),
        expected_width, expected_height)));
  }
  return decoded;
}

absl::StatusOr<TileStream> TileStream::Open(
    std::shared_ptr<const PixelSource> source,
    std::shared_ptr<const TileDecoder> decoder,
    const ImageDescriptor& descriptor, GeometryMap map, uint32_t plane,
    StreamOptions options) {
  if (source == nullptr || decoder == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Pixel source and tile decoder are required");
  }
  if (map.level >= descriptor.levels.size()) {
    return TRACE_STATUS(OutOfBoundsError(
        absl::StrFormat("Invalid level: %u (image has %zu levels)", map.level,
                        descriptor.levels.size())));
  }
  if (map.level_region.IsEmpty()) {
    return TRACE_STATUS(OutOfBoundsError(absl::StrFormat(
        "Geometry map for level %u covers no pixels", map.level)));
  }
  DECLARE_ASSIGN_OR_RETURN(SampleLayout, layout,
                           descriptor.GetPlaneLayout(plane));

  const ResolutionLevel& level = descriptor.levels[map.level];
  if (options.output_tile_width == 0) {
    options.output_tile_width = level.tile_width;
  }
  if (options.output_tile_height == 0) {
    options.output_tile_height = level.tile_height;
  }
  if (options.output_tile_width == 0 || options.output_tile_height == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Output tile size must be positive");
  }

  auto cache = std::shared_ptr<DecodeCache>(CreateDecodeCache(
      options.pool != nullptr ? DecodeCacheKind::kCoalescing
                              : DecodeCacheKind::kSerial));
  return TileStream(std::move(source), std::move(decoder), std::move(map),
                    level, plane, layout, options, std::move(cache));
}

absl::StatusOr<TileStream> TileStream::Open(
    std::shared_ptr<const PixelSource> source,
    std::shared_ptr<const TileDecoder> decoder,
    const ImageDescriptor& descriptor, const CropRectangle& crop,
    uint32_t level, uint32_t plane, StreamOptions options) {
  DECLARE_ASSIGN_OR_RETURN(GeometryMap, map,
                           GeometryResolver::Resolve(descriptor, crop, level));
  return Open(std::move(source), std::move(decoder), descriptor,
              std::move(map), plane, options);
}

TileStream::TileStream(std::shared_ptr<const PixelSource> source,
                       std::shared_ptr<const TileDecoder> decoder,
                       GeometryMap map, ResolutionLevel level, uint32_t plane,
                       SampleLayout layout, StreamOptions options,
                       std::shared_ptr<DecodeCache> cache)
    : source_(std::move(source)),
      decoder_(std::move(decoder)),
      map_(std::move(map)),
      level_(level),
      plane_(plane),
      layout_(layout),
      options_(options),
      cache_(std::move(cache)) {
  const PixelRect& region = map_.level_region;
  tiles_across_ = (region.width + options_.output_tile_width - 1) /
                  options_.output_tile_width;
  tiles_down_ = (region.height + options_.output_tile_height - 1) /
                options_.output_tile_height;
}

TileStream& TileStream::operator=(TileStream&& other) noexcept {
  if (this != &other) {
    // Outstanding prefetch tasks hold our cache; let them settle first.
    for (auto& future : prefetch_) {
      if (future.valid()) {
        future.wait();
      }
    }
    source_ = std::move(other.source_);
    decoder_ = std::move(other.decoder_);
    map_ = std::move(other.map_);
    level_ = other.level_;
    plane_ = other.plane_;
    layout_ = other.layout_;
    options_ = other.options_;
    tiles_across_ = other.tiles_across_;
    tiles_down_ = other.tiles_down_;
    next_index_ = other.next_index_;
    failure_ = std::move(other.failure_);
    cache_ = std::move(other.cache_);
    prefetch_ = std::move(other.prefetch_);
  }
  return *this;
}

TileStream::~TileStream() {
  for (auto& future : prefetch_) {
    if (future.valid()) {
      future.wait();
    }
  }
}

bool TileStream::Done() const {
  return !failure_.ok() ||
         next_index_ >= static_cast<uint64_t>(tiles_across_) * tiles_down_;
}

TileGrid TileStream::GetOutputGrid() const {
  return {options_.output_tile_width, options_.output_tile_height,
          tiles_across_, tiles_down_};
}

DecodeCache::Stats TileStream::GetCacheStats() const {
  return cache_ ? cache_->GetStats() : DecodeCache::Stats{};
}

PixelRect TileStream::OutputRegion(uint32_t row, uint32_t col) const {
  const PixelRect& region = map_.level_region;
  const uint32_t offset_x = col * options_.output_tile_width;
  const uint32_t offset_y = row * options_.output_tile_height;
  return {region.x + offset_x, region.y + offset_y,
          std::min(options_.output_tile_width, region.width - offset_x),
          std::min(options_.output_tile_height, region.height - offset_y)};
}

absl::StatusOr<std::optional<OutputTile>> TileStream::Next() {
  if (!failure_.ok()) {
    return failure_;
  }
  const uint64_t total = static_cast<uint64_t>(tiles_across_) * tiles_down_;
  if (next_index_ >= total) {
    return std::optional<OutputTile>();
  }

  const auto row = static_cast<uint32_t>(next_index_ / tiles_across_);
  const auto col = static_cast<uint32_t>(next_index_ % tiles_across_);

  if (col == 0) {
    const absl::Status status = BeginOutputRow(row);
    if (!status.ok()) {
      failure_ = TRACE_STATUS(status);
      return failure_;
    }
  }

  absl::StatusOr<OutputTile> tile = Assemble(row, col);
  if (!tile.ok()) {
    failure_ = TRACE_STATUS(tile.status());
    return failure_;
  }
  ++next_index_;

  if (next_index_ == total) {
    const absl::Status status = FinishPrefetch();
    if (!status.ok()) {
      failure_ = TRACE_STATUS(status);
      return failure_;
    }
    const DecodeCache::Stats stats = cache_->GetStats();
    VLOG(1) << "Pass level " << map_.level << " plane " << plane_ << ": "
            << stats.decodes << " decodes, " << stats.hits << " hits, "
            << stats.coalesced << " coalesced";
  }
  return std::optional<OutputTile>(*std::move(tile));
}

absl::Status TileStream::BeginOutputRow(uint32_t row) {
  RETURN_IF_ERROR(FinishPrefetch(), "Prefetch of previous row failed");

  // Source rows above this output row are never needed again.
  const PixelRect region = OutputRegion(row, 0);
  cache_->EvictRowsBefore(region.y / level_.tile_height);

  if (options_.pool != nullptr) {
    StartPrefetch(row);
  }
  return absl::OkStatus();
}

void TileStream::StartPrefetch(uint32_t row) {
  const PixelRect first = OutputRegion(row, 0);
  const PixelRect row_region{first.x, first.y, map_.level_region.width,
                             first.height};

  for (const TileContribution& contribution :
       GeometryResolver::CoverRegion(level_, row_region)) {
    const TileAddress address = map_.AddressOf(contribution, plane_);
    prefetch_.push_back(options_.pool->submit_task(
        [cache = cache_, source = source_, decoder = decoder_,
         level = level_, layout = layout_, address]() -> absl::Status {
          return cache
              ->GetOrDecode(address,
                            [&]() {
                              return FetchAndDecodeTile(*source, *decoder,
                                                        level, address,
                                                        layout);
                            })
              .status();
        }));
  }
}

absl::Status TileStream::FinishPrefetch() {
  absl::Status first_error;
  for (auto& future : prefetch_) {
    const absl::Status status = future.get();
    if (first_error.ok() && !status.ok()) {
      first_error = status;
    }
  }
  prefetch_.clear();
  return first_error;
}

absl::StatusOr<OutputTile> TileStream::Assemble(uint32_t row, uint32_t col) {
  const PixelRect region = OutputRegion(row, col);

  OutputTile tile;
  tile.address = {map_.level, plane_, row, col};
  tile.pixels = PixelBuffer(region.width, region.height, layout_);

  for (const TileContribution& contribution :
       GeometryResolver::CoverRegion(level_, region)) {
    const TileAddress address = map_.AddressOf(contribution, plane_);
    DECLARE_ASSIGN_OR_RETURN(
        std::shared_ptr<const PixelBuffer>, source_tile,
        cache_->GetOrDecode(address, [&]() {
          return FetchAndDecodeTile(*source_, *decoder_, level_, address,
                                    layout_);
        }),
        absl::StrFormat("Reading source tile %s", address.ToString()));
    RETURN_IF_ERROR(tile.pixels.CopyRegion(*source_tile, contribution.source,
                                           contribution.dest.x,
                                           contribution.dest.y),
                    "Copying source tile into output tile");
  }
  return tile;
}

}  // namespace omeslice

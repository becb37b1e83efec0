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

#include "omeslice/ome_slicer.h"

#include <cstdint>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "absl/log/log.h"
#include "omeslice/core/errors.h"
#include "omeslice/metadata/ome_xml.h"
#include "omeslice/status/status_macros.h"
#include "omeslice/tiff/ome_tiff_source.h"
#include "omeslice/utilities/thread_pool.h"

namespace omeslice {

absl::StatusOr<OmeSlicer> OmeSlicer::Load(const std::filesystem::path& path,
                                          SlicerOptions options) {
  DECLARE_ASSIGN_OR_RETURN(
      std::unique_ptr<OmeTiffPixelSource>, source,
      OmeTiffPixelSource::Open(path, options.handle_pool_size),
      "Loading " + path.string());
  return FromSource(std::move(source), std::make_shared<RawSampleDecoder>(),
                    std::move(options));
}

absl::StatusOr<OmeSlicer> OmeSlicer::FromSource(
    std::shared_ptr<const PixelSource> source,
    std::shared_ptr<const TileDecoder> decoder, SlicerOptions options) {
  if (source == nullptr || decoder == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Pixel source and tile decoder are required");
  }

  DECLARE_ASSIGN_OR_RETURN(std::string, text, source->ReadRawMetadataText());
  DECLARE_ASSIGN_OR_RETURN(ImageDescriptor, descriptor,
                           OmeXmlCodec::Parse(text));
  ASSIGN_OR_RETURN(descriptor.levels, source->ReadLevels());
  RETURN_IF_ERROR(Validate(descriptor),
                  "Container pyramid disagrees with its metadata");

  LOG(INFO) << "Loaded image " << descriptor.width << "x" << descriptor.height
            << ", " << descriptor.GetChannelCount() << " channel(s), "
            << descriptor.GetPlaneCount() << " plane(s), "
            << descriptor.GetLevelCount() << " level(s), "
            << GetName(descriptor.pixel_type);

  auto source_descriptor =
      std::make_shared<const ImageDescriptor>(std::move(descriptor));
  OmeSlicer slicer(std::move(source), std::move(decoder), source_descriptor,
                   std::move(options));
  slicer.descriptor_ = *source_descriptor;
  slicer.source_levels_.resize(source_descriptor->GetLevelCount());
  std::iota(slicer.source_levels_.begin(), slicer.source_levels_.end(), 0U);
  slicer.metadata_text_ = std::move(text);
  return slicer;
}

OmeSlicer::OmeSlicer(std::shared_ptr<const PixelSource> source,
                     std::shared_ptr<const TileDecoder> decoder,
                     std::shared_ptr<const ImageDescriptor> source_descriptor,
                     SlicerOptions options)
    : source_(std::move(source)),
      decoder_(std::move(decoder)),
      source_descriptor_(std::move(source_descriptor)),
      options_(std::move(options)) {}

absl::StatusOr<OmeSlicer> OmeSlicer::Crop(uint32_t x, uint32_t y,
                                          uint32_t width,
                                          uint32_t height) const {
  return Crop(CropRectangle{x, y, width, height});
}

absl::StatusOr<OmeSlicer> OmeSlicer::Crop(const CropRectangle& crop) const {
  RETURN_IF_ERROR(
      ValidateCropRectangle(crop, descriptor_.width, descriptor_.height), "");

  const CropRectangle base = EffectiveCrop();
  const CropRectangle absolute{base.x + crop.x, base.y + crop.y, crop.width,
                               crop.height};

  DECLARE_ASSIGN_OR_RETURN(
      CroppedDescriptor, derived,
      MetadataSynchronizer::DeriveCropped(*source_descriptor_, absolute,
                                          options_.sync));
  DECLARE_ASSIGN_OR_RETURN(std::string, text,
                           MetadataSynchronizer::Synchronize(
                               derived.descriptor));

  OmeSlicer cropped(source_, decoder_, source_descriptor_, options_);
  cropped.crop_ = absolute;
  cropped.descriptor_ = std::move(derived.descriptor);
  cropped.source_levels_ = std::move(derived.source_levels);
  cropped.metadata_text_ = std::move(text);

  VLOG(1) << "Cropped to " << absolute.ToString() << " with "
          << cropped.source_levels_.size() << " level(s)";
  return cropped;
}

CropRectangle OmeSlicer::EffectiveCrop() const {
  if (crop_.has_value()) {
    return *crop_;
  }
  return {0, 0, source_descriptor_->width, source_descriptor_->height};
}

StreamOptions OmeSlicer::GetStreamOptions() const {
  StreamOptions options;
  if (options_.parallel_decode) {
    options.pool = &ThreadPoolManager::GetInstance();
  }
  return options;
}

absl::StatusOr<TileStream> OmeSlicer::OpenStream(uint32_t level,
                                                 uint32_t plane) const {
  if (level >= source_levels_.size()) {
    return TRACE_STATUS(OutOfBoundsError(fmt::format(
        "Level {} does not exist; the image has {} level(s)", level,
        source_levels_.size())));
  }
  if (plane >= descriptor_.GetPlaneCount()) {
    return TRACE_STATUS(OutOfBoundsError(fmt::format(
        "Plane {} does not exist; the image has {} plane(s)", plane,
        descriptor_.GetPlaneCount())));
  }

  auto stream_result =
      TileStream::Open(source_, decoder_, *source_descriptor_,
                       EffectiveCrop(), source_levels_[level], plane,
                       GetStreamOptions());
  if (!stream_result.ok()) {
    return TRACE_STATUS(stream_result.status());
  }
  TileStream stream = std::move(stream_result).value();

  const ResolutionLevel& expected = descriptor_.levels[level];
  const PixelRect& region = stream.GetGeometryMap().level_region;
  if (region.width != expected.width || region.height != expected.height) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        fmt::format("Level {} streams {}x{} pixels but is described as {}x{}",
                    level, region.width, region.height, expected.width,
                    expected.height));
  }
  return stream;
}

absl::Status OmeSlicer::Emit(TileSink& sink) const {
  auto run = [&]() -> absl::Status {
    RETURN_IF_ERROR(sink.Begin(descriptor_, metadata_text_), "");

    const auto plane_count = static_cast<uint32_t>(descriptor_.GetPlaneCount());
    const auto level_count = static_cast<uint32_t>(source_levels_.size());
    for (uint32_t plane = 0; plane < plane_count; ++plane) {
      for (uint32_t level = 0; level < level_count; ++level) {
        LOG(INFO) << "Processing plane " << plane + 1 << "/" << plane_count
                  << ", level " << level + 1 << "/" << level_count;
        auto stream_result = OpenStream(level, plane);
        if (!stream_result.ok()) {
          return TRACE_STATUS(stream_result.status());
        }
        TileStream stream = std::move(stream_result).value();
        RETURN_IF_ERROR(sink.BeginPass(level, plane), "");

        while (true) {
          DECLARE_ASSIGN_OR_RETURN(std::optional<OutputTile>, tile,
                                   stream.Next());
          if (!tile.has_value()) {
            break;
          }
          tile->address.level = level;
          RETURN_IF_ERROR(sink.WriteTile(*tile), "");
        }

        RETURN_IF_ERROR(sink.EndPass(), "");
        const DecodeCache::Stats stats = stream.GetCacheStats();
        VLOG(1) << "Plane " << plane << " level " << level << ": "
                << stats.decodes << " tile decode(s), " << stats.hits
                << " cache hit(s)";
      }
    }
    return sink.Commit();
  };

  absl::Status result = run();
  if (!result.ok()) {
    LOG(ERROR) << "Aborting output: "
               << status::RootMessage(result.message());
    sink.Abort();
  }
  return result;
}

absl::Status OmeSlicer::Save(const std::filesystem::path& path) const {
  if (!crop_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "This image has not been cropped; nothing to save");
  }
  OmeTiffWriter writer(path, options_.writer);
  RETURN_IF_ERROR(Emit(writer), "Saving " + path.string());
  return absl::OkStatus();
}

ImageDimensions OmeSlicer::GetDimensions() const {
  return {descriptor_.width, descriptor_.height,
          descriptor_.GetChannelCount()};
}

size_t OmeSlicer::GetChannelCount() const {
  return descriptor_.GetChannelCount();
}

PixelType OmeSlicer::GetPixelType() const {
  return descriptor_.pixel_type;
}

}  // namespace omeslice

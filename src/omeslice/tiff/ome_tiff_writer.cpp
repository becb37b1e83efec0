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

#include "omeslice/tiff/ome_tiff_writer.h"

#include <tiffio.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "absl/log/log.h"
#include "omeslice/core/errors.h"
#include "omeslice/engine/pixel_buffer.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

namespace {

uint16_t SampleFormatFor(PixelType type) {
  if (IsFloatingPoint(type)) {
    return SAMPLEFORMAT_IEEEFP;
  }
  return IsSigned(type) ? SAMPLEFORMAT_INT : SAMPLEFORMAT_UINT;
}

std::filesystem::path StagingPathFor(const std::filesystem::path& destination) {
  std::filesystem::path staging = destination.parent_path();
  staging /= "." + destination.filename().string() + ".partial";
  return staging;
}

}  // namespace

OmeTiffWriter::OmeTiffWriter(std::filesystem::path destination,
                             TiffWriterOptions options)
    : destination_(std::move(destination)),
      staging_(StagingPathFor(destination_)),
      options_(std::move(options)) {}

OmeTiffWriter::~OmeTiffWriter() {
  if (!committed_) {
    Abort();
  }
}

absl::Status OmeTiffWriter::Begin(const ImageDescriptor& output,
                                  const std::string& metadata_text) {
  if (tif_ != nullptr || committed_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Writer has already been started");
  }
  RETURN_IF_ERROR(Validate(output), "Invalid output descriptor");
  if (output.levels.empty()) {
    return TRACE_STATUS(
        UnsupportedGeometryError("Output image has no resolution levels"));
  }
  for (const ResolutionLevel& level : output.levels) {
    if (level.tile_width % 16 != 0 || level.tile_height % 16 != 0) {
      return TRACE_STATUS(UnsupportedGeometryError(fmt::format(
          "Level {} tile size {}x{} is not a multiple of 16", level.index,
          level.tile_width, level.tile_height)));
    }
  }

  tif_ = TIFFOpen(staging_.string().c_str(), options_.bigtiff ? "w8" : "w");
  if (tif_ == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Cannot create " + staging_.string());
  }
  staged_ = true;
  output_ = output;
  metadata_text_ = metadata_text;
  passes_done_ = 0;
  VLOG(1) << "Staging " << destination_.string() << " in "
          << staging_.string();
  return absl::OkStatus();
}

absl::Status OmeTiffWriter::WriteDirectoryFields(const ResolutionLevel& level,
                                                 uint32_t plane,
                                                 const SampleLayout& layout) {
  const auto spp = static_cast<uint16_t>(layout.samples_per_pixel);
  const auto bps = static_cast<uint16_t>(layout.bits_per_sample);
  const uint16_t photometric =
      (spp == 3 && bps == 8) ? PHOTOMETRIC_RGB : PHOTOMETRIC_MINISBLACK;
  const uint16_t color_samples = photometric == PHOTOMETRIC_RGB ? 3 : 1;

  bool ok = true;
  // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg)
  ok &= TIFFSetField(tif_, TIFFTAG_SUBFILETYPE,
                     level.index == 0 ? 0U
                                      : static_cast<uint32_t>(
                                            FILETYPE_REDUCEDIMAGE)) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_IMAGEWIDTH, level.width) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_IMAGELENGTH, level.height) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_TILEWIDTH, level.tile_width) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_TILELENGTH, level.tile_height) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_SAMPLESPERPIXEL, spp) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_BITSPERSAMPLE, bps) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_SAMPLEFORMAT,
                     SampleFormatFor(output_.pixel_type)) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_PHOTOMETRIC, photometric) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_COMPRESSION, options_.compression) == 1;
  ok &= TIFFSetField(tif_, TIFFTAG_SOFTWARE, options_.software.c_str()) == 1;
  if (spp > color_samples) {
    const std::vector<uint16_t> extra(spp - color_samples,
                                      EXTRASAMPLE_UNSPECIFIED);
    ok &= TIFFSetField(tif_, TIFFTAG_EXTRASAMPLES,
                       static_cast<uint16_t>(extra.size()),
                       extra.data()) == 1;
  }
  if (level.index == 0) {
    if (output_.levels.size() > 1) {
      // libtiff fills in the offsets as the following directories are
      // written.
      std::vector<toff_t> offsets(output_.levels.size() - 1, 0);
      ok &= TIFFSetField(tif_, TIFFTAG_SUBIFD,
                         static_cast<uint16_t>(offsets.size()),
                         offsets.data()) == 1;
    }
    if (plane == 0) {
      ok &= TIFFSetField(tif_, TIFFTAG_IMAGEDESCRIPTION,
                         metadata_text_.c_str()) == 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-type-vararg)

  if (!ok) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Failed to set TIFF fields for plane {} "
                                   "level {}",
                                   plane, level.index));
  }
  return absl::OkStatus();
}

absl::Status OmeTiffWriter::BeginPass(uint32_t level, uint32_t plane) {
  if (tif_ == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "BeginPass called before Begin");
  }
  if (pass_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Previous pass has not been ended");
  }
  const uint64_t level_count = output_.levels.size();
  const uint64_t expected = static_cast<uint64_t>(plane) * level_count + level;
  if (level >= level_count || plane >= output_.GetPlaneCount() ||
      expected != passes_done_) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        fmt::format("Pass (level {}, plane {}) is out of order; passes must "
                    "run plane by plane with ascending levels",
                    level, plane));
  }

  DECLARE_ASSIGN_OR_RETURN(SampleLayout, layout,
                           output_.GetPlaneLayout(plane));
  RETURN_IF_ERROR(WriteDirectoryFields(output_.levels[level], plane, layout),
                  "");
  pass_ = Pass{level, plane, layout, 0};
  return absl::OkStatus();
}

absl::Status OmeTiffWriter::WriteTile(const OutputTile& tile) {
  if (!pass_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "WriteTile called outside a pass");
  }
  const TileAddress& address = tile.address;
  if (address.level != pass_->level || address.plane != pass_->plane) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tile " + address.ToString() +
                           " does not belong to the current pass");
  }
  const ResolutionLevel& level = output_.levels[address.level];
  if (address.row >= level.TilesDown() || address.col >= level.TilesAcross()) {
    return TRACE_STATUS(
        OutOfBoundsError("Tile outside the output grid: " + address.ToString()));
  }
  if (tile.pixels.GetLayout() != pass_->layout) {
    return TRACE_STATUS(ChannelMismatchError(
        "Tile sample layout differs from its channel: " + address.ToString()));
  }
  const uint32_t valid_width = level.ValidTileWidth(address.col);
  const uint32_t valid_height = level.ValidTileHeight(address.row);
  if (tile.pixels.GetWidth() != valid_width ||
      tile.pixels.GetHeight() != valid_height) {
    return TRACE_STATUS(OutOfBoundsError(fmt::format(
        "Tile {} is {}x{}, expected {}x{}", address.ToString(),
        tile.pixels.GetWidth(), tile.pixels.GetHeight(), valid_width,
        valid_height)));
  }

  // TIFF tiles are always stored at nominal size; edge tiles are zero
  // padded.
  PixelBuffer padded(level.tile_width, level.tile_height, pass_->layout);
  RETURN_IF_ERROR(padded.CopyRegion(tile.pixels,
                                    {0, 0, valid_width, valid_height}, 0, 0),
                  "");

  const ttile_t index =
      TIFFComputeTile(tif_, address.col * level.tile_width,
                      address.row * level.tile_height, 0, 0);
  std::span<uint8_t> bytes = padded.GetMutableData();
  if (TIFFWriteEncodedTile(tif_, index, bytes.data(),
                           static_cast<tmsize_t>(bytes.size())) < 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to write tile " + address.ToString());
  }
  ++pass_->tiles_written;
  return absl::OkStatus();
}

absl::Status OmeTiffWriter::EndPass() {
  if (!pass_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "EndPass called outside a pass");
  }
  const ResolutionLevel& level = output_.levels[pass_->level];
  const uint64_t expected =
      static_cast<uint64_t>(level.TilesAcross()) * level.TilesDown();
  if (pass_->tiles_written != expected) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        fmt::format("Pass (level {}, plane {}) wrote {} of {} tiles",
                    pass_->level, pass_->plane, pass_->tiles_written,
                    expected));
  }
  if (TIFFWriteDirectory(tif_) != 1) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Failed to write directory for plane {} "
                                   "level {}",
                                   pass_->plane, pass_->level));
  }
  pass_.reset();
  ++passes_done_;
  return absl::OkStatus();
}

absl::Status OmeTiffWriter::Commit() {
  if (tif_ == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Commit called before Begin");
  }
  const uint64_t expected =
      static_cast<uint64_t>(output_.GetPlaneCount()) * output_.levels.size();
  if (pass_.has_value() || passes_done_ != expected) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       fmt::format("Commit after {} of {} passes",
                                   passes_done_, expected));
  }

  if (TIFFFlush(tif_) != 1) {
    Abort();
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Failed to flush {}", staging_.string()));
  }
  TIFFClose(tif_);
  tif_ = nullptr;

  std::error_code error;
  std::filesystem::rename(staging_, destination_, error);
  if (error) {
    Abort();
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       fmt::format("Cannot move {} to {}: {}",
                                   staging_.string(), destination_.string(),
                                   error.message()));
  }
  staged_ = false;
  committed_ = true;
  LOG(INFO) << "Wrote " << destination_.string() << " ("
            << output_.GetPlaneCount() << " plane(s), "
            << output_.levels.size() << " level(s))";
  return absl::OkStatus();
}

void OmeTiffWriter::Abort() {
  if (tif_ != nullptr) {
    TIFFClose(tif_);
    tif_ = nullptr;
  }
  pass_.reset();
  if (staged_) {
    std::error_code error;
    std::filesystem::remove(staging_, error);
    if (error) {
      LOG(WARNING) << "Cannot remove " << staging_.string() << ": "
                   << error.message();
    }
    staged_ = false;
  }
}

}  // namespace omeslice

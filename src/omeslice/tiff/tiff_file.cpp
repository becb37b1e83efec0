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

#include "omeslice/tiff/tiff_file.h"

#include <tiffio.h>

#include <string>
#include <utility>

#include <fmt/format.h>

#include "omeslice/core/errors.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

absl::StatusOr<TiffFile> TiffFile::Create(TIFFHandlePool* pool) {
  if (pool == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "TIFFHandlePool cannot be null");
  }

  auto handle_guard = pool->Acquire();
  if (!handle_guard.Valid()) {
    return TRACE_STATUS(SourceReadError(
        "Failed to acquire TIFF handle for " + pool->GetPath().string()));
  }

  return TiffFile(std::move(handle_guard));
}

TiffFile::TiffFile(TIFFHandleGuard handle_guard)
    : handle_guard_(std::move(handle_guard)) {}

absl::Status TiffFile::CheckValid() const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  return absl::OkStatus();
}

absl::StatusOr<uint32_t> TiffFile::GetDirectoryCount() const {
  RETURN_IF_ERROR(CheckValid(), "");
  return static_cast<uint32_t>(TIFFNumberOfDirectories(handle_guard_.Get()));
}

absl::Status TiffFile::SetDirectory(uint32_t dir_index) {
  RETURN_IF_ERROR(CheckValid(), "");
  // Always seek: pooled handles come back on arbitrary directories.
  if (TIFFSetDirectory(handle_guard_.Get(), static_cast<tdir_t>(dir_index)) ==
      0) {
    return TRACE_STATUS(SourceReadError(
        fmt::format("Failed to set directory to {}", dir_index)));
  }
  return absl::OkStatus();
}

absl::Status TiffFile::SetSubDirectory(uint64_t offset) {
  RETURN_IF_ERROR(CheckValid(), "");
  if (TIFFSetSubDirectory(handle_guard_.Get(), static_cast<toff_t>(offset)) ==
      0) {
    return TRACE_STATUS(SourceReadError(
        fmt::format("Failed to set sub-directory at offset {}", offset)));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<uint64_t>> TiffFile::GetSubIfdOffsets() const {
  RETURN_IF_ERROR(CheckValid(), "");
  uint16_t count = 0;
  toff_t* offsets = nullptr;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), TIFFTAG_SUBIFD, &count, &offsets) !=
          1 ||
      offsets == nullptr) {
    return std::vector<uint64_t>{};
  }
  return std::vector<uint64_t>(offsets, offsets + count);
}

template <typename T>
absl::StatusOr<T> TiffFile::GetRequiredField(ttag_t tag) const {
  T value{};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), tag, &value) != 1) {
    return TRACE_STATUS(SourceReadError(
        fmt::format("Required TIFF tag {} is missing", tag)));
  }
  return value;
}

template <typename T>
T TiffFile::GetFieldOr(ttag_t tag, T fallback) const {
  T value{};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetFieldDefaulted(handle_guard_.Get(), tag, &value) != 1) {
    return fallback;
  }
  return value;
}

absl::StatusOr<TiffPageInfo> TiffFile::GetPageInfo() const {
  RETURN_IF_ERROR(CheckValid(), "");
  TIFF* tif = handle_guard_.Get();

  TiffPageInfo info;
  ASSIGN_OR_RETURN(info.width, GetRequiredField<uint32_t>(TIFFTAG_IMAGEWIDTH));
  ASSIGN_OR_RETURN(info.height,
                   GetRequiredField<uint32_t>(TIFFTAG_IMAGELENGTH));
  info.tiled = TIFFIsTiled(tif) != 0;
  if (info.tiled) {
    ASSIGN_OR_RETURN(info.tile_width,
                     GetRequiredField<uint32_t>(TIFFTAG_TILEWIDTH));
    ASSIGN_OR_RETURN(info.tile_height,
                     GetRequiredField<uint32_t>(TIFFTAG_TILELENGTH));
  }
  info.samples_per_pixel =
      GetFieldOr<uint16_t>(TIFFTAG_SAMPLESPERPIXEL, uint16_t{1});
  info.bits_per_sample =
      GetFieldOr<uint16_t>(TIFFTAG_BITSPERSAMPLE, uint16_t{1});
  info.sample_format =
      GetFieldOr<uint16_t>(TIFFTAG_SAMPLEFORMAT, uint16_t{SAMPLEFORMAT_UINT});
  info.planar_config = GetFieldOr<uint16_t>(TIFFTAG_PLANARCONFIG,
                                            uint16_t{PLANARCONFIG_CONTIG});
  info.compression =
      GetFieldOr<uint16_t>(TIFFTAG_COMPRESSION, uint16_t{COMPRESSION_NONE});
  info.subfile_type = GetFieldOr<uint32_t>(TIFFTAG_SUBFILETYPE, 0U);
  return info;
}

absl::StatusOr<std::string> TiffFile::GetImageDescription() const {
  RETURN_IF_ERROR(CheckValid(), "");
  char* description = nullptr;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), TIFFTAG_IMAGEDESCRIPTION,
                   &description) != 1 ||
      description == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "TIFF directory has no ImageDescription");
  }
  return std::string(description);
}

absl::StatusOr<std::vector<uint8_t>> TiffFile::ReadTile(uint32_t x, uint32_t y,
                                                        uint16_t sample) const {
  RETURN_IF_ERROR(CheckValid(), "");
  TIFF* tif = handle_guard_.Get();
  if (TIFFIsTiled(tif) == 0) {
    return TRACE_STATUS(SourceReadError("Image is not tiled"));
  }

  const tmsize_t tile_size = TIFFTileSize(tif);
  if (tile_size <= 0) {
    return TRACE_STATUS(SourceReadError("Invalid TIFF tile size"));
  }

  const ttile_t tile = TIFFComputeTile(tif, x, y, 0, sample);
  if (tile >= TIFFNumberOfTiles(tif)) {
    return TRACE_STATUS(SourceReadError(
        fmt::format("Tile at ({}, {}) is outside the directory", x, y)));
  }

  std::vector<uint8_t> bytes(static_cast<size_t>(tile_size));
  const tmsize_t read =
      TIFFReadEncodedTile(tif, tile, bytes.data(), tile_size);
  if (read < 0) {
    return TRACE_STATUS(SourceReadError(fmt::format(
        "Failed to read tile {} at ({}, {}) sample {}", tile, x, y, sample)));
  }
  return bytes;
}

}  // namespace omeslice

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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_FILE_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_FILE_H_

#include <tiffio.h>

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omeslice/tiff/tiff_handle_pool.h"

namespace omeslice {

/// @brief Structural fields of the current TIFF directory
struct TiffPageInfo {
  uint32_t width = 0;
  uint32_t height = 0;
  bool tiled = false;
  uint32_t tile_width = 0;   ///< 0 when not tiled
  uint32_t tile_height = 0;  ///< 0 when not tiled
  uint16_t samples_per_pixel = 1;
  uint16_t bits_per_sample = 1;
  uint16_t sample_format = SAMPLEFORMAT_UINT;
  uint16_t planar_config = PLANARCONFIG_CONTIG;
  uint16_t compression = COMPRESSION_NONE;
  uint32_t subfile_type = 0;

  /// @brief Whether the page is marked as a reduced-resolution image
  [[nodiscard]] bool IsReducedImage() const {
    return (subfile_type & FILETYPE_REDUCEDIMAGE) != 0;
  }
};

/**
 * @brief Read access to one TIFF file through a pooled handle
 *
 * A TiffFile owns its handle for its whole lifetime, so directory changes
 * made through it are not observed by other TiffFile instances.
 *
 * @note Not thread-safe; create one TiffFile per thread
 */
class TiffFile {
 public:
  /// @brief Borrow a handle from the pool
  static absl::StatusOr<TiffFile> Create(TIFFHandlePool* pool);

  TiffFile(const TiffFile&) = delete;
  TiffFile& operator=(const TiffFile&) = delete;
  TiffFile(TiffFile&& other) noexcept = default;
  TiffFile& operator=(TiffFile&& other) noexcept = default;

  /// @brief Number of top-level directories (IFDs)
  absl::StatusOr<uint32_t> GetDirectoryCount() const;

  /// @brief Select a top-level directory by index
  absl::Status SetDirectory(uint32_t dir_index);

  /// @brief Select a directory by file offset (used for SubIFDs)
  absl::Status SetSubDirectory(uint64_t offset);

  /// @brief SubIFD offsets of the current directory; empty when there are
  /// none
  absl::StatusOr<std::vector<uint64_t>> GetSubIfdOffsets() const;

  absl::StatusOr<TiffPageInfo> GetPageInfo() const;

  /// @brief ImageDescription tag of the current directory
  /// @return kNotFound when the tag is absent
  absl::StatusOr<std::string> GetImageDescription() const;

  /// @brief Read and decompress the tile containing pixel (x, y)
  ///
  /// @param x Column of any pixel inside the tile
  /// @param y Row of any pixel inside the tile
  /// @param sample Sample plane (0 for contiguous storage)
  /// @return Full tile bytes (nominal tile size, row padding included)
  absl::StatusOr<std::vector<uint8_t>> ReadTile(uint32_t x, uint32_t y,
                                                uint16_t sample = 0) const;

  [[nodiscard]] bool IsValid() const { return handle_guard_.Valid(); }

 private:
  explicit TiffFile(TIFFHandleGuard handle_guard);

  template <typename T>
  absl::StatusOr<T> GetRequiredField(ttag_t tag) const;

  template <typename T>
  T GetFieldOr(ttag_t tag, T fallback) const;

  absl::Status CheckValid() const;

  TIFFHandleGuard handle_guard_;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_TIFF_FILE_H_

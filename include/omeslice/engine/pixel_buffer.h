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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_BUFFER_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"

namespace omeslice {

/// @brief Dense, row-major, sample-interleaved pixel buffer
///
/// Rows are tightly packed: the stride is width x bytes-per-pixel.
class PixelBuffer {
 public:
  PixelBuffer() = default;

  /// @brief Allocate a zero-filled buffer
  PixelBuffer(uint32_t width, uint32_t height, SampleLayout layout);

  /// @brief Adopt existing bytes (size must be width*height*bpp)
  PixelBuffer(uint32_t width, uint32_t height, SampleLayout layout,
              std::vector<uint8_t> data);

  [[nodiscard]] uint32_t GetWidth() const { return width_; }
  [[nodiscard]] uint32_t GetHeight() const { return height_; }
  [[nodiscard]] const SampleLayout& GetLayout() const { return layout_; }
  [[nodiscard]] size_t GetStride() const {
    return static_cast<size_t>(width_) * layout_.BytesPerPixel();
  }
  [[nodiscard]] size_t GetByteSize() const { return data_.size(); }
  [[nodiscard]] bool IsEmpty() const { return data_.empty(); }

  [[nodiscard]] std::span<const uint8_t> GetData() const { return data_; }
  [[nodiscard]] std::span<uint8_t> GetMutableData() { return data_; }

  /// @brief Bytes of row y
  [[nodiscard]] std::span<const uint8_t> GetRow(uint32_t y) const;

  /// @brief Copy a rectangle of another buffer into this one
  ///
  /// @param source Buffer to read from (same sample layout)
  /// @param source_rect Region of `source` to copy
  /// @param dest_x Left edge in this buffer
  /// @param dest_y Top edge in this buffer
  /// @return ChannelMismatchError if layouts differ, OutOfBoundsError if a
  ///         rectangle falls outside its buffer
  absl::Status CopyRegion(const PixelBuffer& source,
                          const PixelRect& source_rect, uint32_t dest_x,
                          uint32_t dest_y);

  /// @brief Copy of a sub-rectangle as a new buffer
  absl::StatusOr<PixelBuffer> Crop(const PixelRect& rect) const;

  bool operator==(const PixelBuffer&) const = default;

 private:
  uint32_t width_ = 0;
  uint32_t height_ = 0;
  SampleLayout layout_;
  std::vector<uint8_t> data_;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_PIXEL_BUFFER_H_

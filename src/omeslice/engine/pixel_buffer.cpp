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

#include "omeslice/engine/pixel_buffer.h"

#include <cstring>
#include <span>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"

namespace omeslice {

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height, SampleLayout layout)
    : width_(width),
      height_(height),
      layout_(layout),
      data_(static_cast<size_t>(width) * height * layout.BytesPerPixel(), 0) {}

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height, SampleLayout layout,
                         std::vector<uint8_t> data)
    : width_(width), height_(height), layout_(layout), data_(std::move(data)) {
  data_.resize(static_cast<size_t>(width) * height * layout.BytesPerPixel());
}

std::span<const uint8_t> PixelBuffer::GetRow(uint32_t y) const {
  const size_t stride = GetStride();
  return std::span<const uint8_t>(data_).subspan(y * stride, stride);
}

absl::Status PixelBuffer::CopyRegion(const PixelBuffer& source,
                                     const PixelRect& source_rect,
                                     uint32_t dest_x, uint32_t dest_y) {
  if (source.layout_ != layout_) {
    return ChannelMismatchError(absl::StrFormat(
        "Cannot copy %u-sample %u-bit pixels into a %u-sample %u-bit buffer",
        source.layout_.samples_per_pixel, source.layout_.bits_per_sample,
        layout_.samples_per_pixel, layout_.bits_per_sample));
  }
  if (source_rect.Right() > source.width_ ||
      source_rect.Bottom() > source.height_) {
    return OutOfBoundsError(absl::StrFormat(
        "Source rectangle (%u, %u, %ux%u) exceeds %ux%u buffer", source_rect.x,
        source_rect.y, source_rect.width, source_rect.height, source.width_,
        source.height_));
  }
  if (static_cast<uint64_t>(dest_x) + source_rect.width > width_ ||
      static_cast<uint64_t>(dest_y) + source_rect.height > height_) {
    return OutOfBoundsError(absl::StrFormat(
        "Destination (%u, %u, %ux%u) exceeds %ux%u buffer", dest_x, dest_y,
        source_rect.width, source_rect.height, width_, height_));
  }

  const size_t bpp = layout_.BytesPerPixel();
  const size_t row_bytes = static_cast<size_t>(source_rect.width) * bpp;
  const size_t src_stride = source.GetStride();
  const size_t dst_stride = GetStride();

  for (uint32_t row = 0; row < source_rect.height; ++row) {
    const uint8_t* src = source.data_.data() +
                         (source_rect.y + row) * src_stride +
                         source_rect.x * bpp;
    uint8_t* dst = data_.data() + (dest_y + row) * dst_stride + dest_x * bpp;
    std::memcpy(dst, src, row_bytes);
  }
  return absl::OkStatus();
}

absl::StatusOr<PixelBuffer> PixelBuffer::Crop(const PixelRect& rect) const {
  PixelBuffer out(rect.width, rect.height, layout_);
  const absl::Status status = out.CopyRegion(*this, rect, 0, 0);
  if (!status.ok()) {
    return status;
  }
  return out;
}

}  // namespace omeslice

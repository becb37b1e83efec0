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

#include "omeslice/engine/pixel_source.h"

#include <cstring>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"

namespace omeslice {

absl::StatusOr<PixelBuffer> RawSampleDecoder::Decode(
    const RawTile& raw, const SampleLayout& expected) const {
  if (raw.layout != expected) {
    return ChannelMismatchError(absl::StrFormat(
        "Tile stores %u samples x %u bits (%s), channel declares %u x %u (%s)",
        raw.layout.samples_per_pixel, raw.layout.bits_per_sample,
        GetName(raw.layout.sample_format), expected.samples_per_pixel,
        expected.bits_per_sample, GetName(expected.sample_format)));
  }
  if (raw.valid_width == 0 || raw.valid_height == 0 ||
      raw.valid_width > raw.nominal_width ||
      raw.valid_height > raw.nominal_height) {
    return SourceReadError(absl::StrFormat(
        "Tile valid extent %ux%u inconsistent with nominal size %ux%u",
        raw.valid_width, raw.valid_height, raw.nominal_width,
        raw.nominal_height));
  }

  const size_t bpp = expected.BytesPerPixel();
  const size_t src_stride = static_cast<size_t>(raw.nominal_width) * bpp;
  const size_t row_bytes = static_cast<size_t>(raw.valid_width) * bpp;
  const size_t required = (raw.valid_height - 1) * src_stride + row_bytes;
  if (raw.bytes.size() < required) {
    return SourceReadError(absl::StrFormat(
        "Truncated tile: %zu bytes, need %zu", raw.bytes.size(), required));
  }

  std::vector<uint8_t> pixels(row_bytes * raw.valid_height);
  for (uint32_t row = 0; row < raw.valid_height; ++row) {
    std::memcpy(pixels.data() + row * row_bytes,
                raw.bytes.data() + row * src_stride, row_bytes);
  }
  return PixelBuffer(raw.valid_width, raw.valid_height, expected,
                     std::move(pixels));
}

}  // namespace omeslice

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

#include "omeslice/core/tile_address.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"

namespace omeslice {
namespace core {

std::string CropRectangle::ToString() const {
  return absl::StrFormat("(%u, %u, %u x %u)", x, y, width, height);
}

absl::Status ValidateCropRectangle(const CropRectangle& crop,
                                   uint32_t image_width,
                                   uint32_t image_height) {
  if (crop.IsEmpty()) {
    return OutOfBoundsError(absl::StrFormat(
        "Crop rectangle %s has zero area", crop.ToString()));
  }
  if (crop.Right() > image_width || crop.Bottom() > image_height) {
    return OutOfBoundsError(absl::StrFormat(
        "Crop rectangle %s exceeds image bounds %ux%u", crop.ToString(),
        image_width, image_height));
  }
  return absl::OkStatus();
}

PixelRect Intersect(const PixelRect& a, const PixelRect& b) {
  const uint64_t left = std::max<uint64_t>(a.x, b.x);
  const uint64_t top = std::max<uint64_t>(a.y, b.y);
  const uint64_t right = std::min(a.Right(), b.Right());
  const uint64_t bottom = std::min(a.Bottom(), b.Bottom());
  if (right <= left || bottom <= top) {
    return {};
  }
  return {static_cast<uint32_t>(left), static_cast<uint32_t>(top),
          static_cast<uint32_t>(right - left),
          static_cast<uint32_t>(bottom - top)};
}

std::string TileAddress::ToString() const {
  return absl::StrFormat("(level %u, plane %u, row %u, col %u)", level, plane,
                         row, col);
}

}  // namespace core
}  // namespace omeslice

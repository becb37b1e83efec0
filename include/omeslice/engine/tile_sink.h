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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_SINK_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_SINK_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_buffer.h"

namespace omeslice {

/// @brief A fully assembled output tile
///
/// `pixels` holds only the valid extent; edge tiles are smaller than the
/// nominal tile size.
struct OutputTile {
  TileAddress address;
  PixelBuffer pixels;
};

/// @brief Contract of the output container writer
///
/// Call order: Begin, then for every (plane, level) pass BeginPass,
/// WriteTile..., EndPass, and finally Commit. Abort may be called at any
/// point and must leave nothing at the destination.
class TileSink {
 public:
  virtual ~TileSink() = default;

  /// @brief Start an output image
  /// @param output Descriptor of the image being written
  /// @param metadata_text Synchronized OME-XML for the output
  virtual absl::Status Begin(const ImageDescriptor& output,
                             const std::string& metadata_text) = 0;

  /// @brief Start the pass for one (level, plane)
  virtual absl::Status BeginPass(uint32_t level, uint32_t plane) = 0;

  virtual absl::Status WriteTile(const OutputTile& tile) = 0;

  /// @brief Close the current pass; all its tiles must have been written
  virtual absl::Status EndPass() = 0;

  /// @brief Make the output visible at its destination
  virtual absl::Status Commit() = 0;

  /// @brief Discard everything written so far
  virtual void Abort() = 0;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_ENGINE_TILE_SINK_H_

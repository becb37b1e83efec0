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

#include "omeslice/metadata/metadata_synchronizer.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"
#include "omeslice/geometry/geometry_resolver.h"
#include "omeslice/metadata/ome_xml.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

absl::StatusOr<DegenerateLevelPolicy> ParseDegenerateLevelPolicy(
    std::string_view name) {
  if (name == GetName(DegenerateLevelPolicy::kDrop)) {
    return DegenerateLevelPolicy::kDrop;
  }
  if (name == GetName(DegenerateLevelPolicy::kFail)) {
    return DegenerateLevelPolicy::kFail;
  }
  return MAKE_STATUS(
      absl::StatusCode::kInvalidArgument,
      absl::StrFormat("Unknown degenerate level policy '%s'", name));
}

absl::StatusOr<CroppedDescriptor> MetadataSynchronizer::DeriveCropped(
    const ImageDescriptor& source, const CropRectangle& crop,
    const SynchronizerOptions& options) {
  RETURN_IF_ERROR(ValidateCropRectangle(crop, source.width, source.height),
                  "Cannot derive cropped metadata");

  CroppedDescriptor result;
  ImageDescriptor& derived = result.descriptor;
  derived = source;
  derived.width = crop.width;
  derived.height = crop.height;
  derived.levels.clear();

  for (const ResolutionLevel& level : source.levels) {
    absl::StatusOr<PixelRect> region =
        GeometryResolver::ScaleToLevel(crop, level);
    if (!region.ok() || level.tile_width == 0 || level.tile_height == 0) {
      const std::string message = absl::StrFormat(
          "Level %u (downsample %g) has no tiles after crop %s", level.index,
          level.downsample, crop.ToString());
      if (options.degenerate_levels == DegenerateLevelPolicy::kFail) {
        return TRACE_STATUS(UnsupportedGeometryError(message));
      }
      LOG(WARNING) << message << "; dropping it from the output pyramid";
      result.dropped_levels.push_back(level.index);
      continue;
    }

    ResolutionLevel cropped = level;
    cropped.index = static_cast<uint32_t>(derived.levels.size());
    cropped.width = region->width;
    cropped.height = region->height;
    derived.levels.push_back(cropped);
    result.source_levels.push_back(level.index);
  }

  RETURN_IF_ERROR(Validate(derived), "Derived descriptor is inconsistent");
  return result;
}

absl::StatusOr<std::string> MetadataSynchronizer::Synchronize(
    const ImageDescriptor& derived) {
  return OmeXmlCodec::Serialize(derived);
}

}  // namespace omeslice

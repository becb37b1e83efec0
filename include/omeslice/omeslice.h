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

/**
 * @file omeslice.h
 * @brief Umbrella header for the omeslice library
 */

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_OMESLICE_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_OMESLICE_H_

#include "omeslice/core/errors.h"
#include "omeslice/core/geometry_map.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/core/tile_address.h"
#include "omeslice/engine/pixel_buffer.h"
#include "omeslice/engine/pixel_source.h"
#include "omeslice/engine/tile_sink.h"
#include "omeslice/engine/tile_stream.h"
#include "omeslice/geometry/geometry_resolver.h"
#include "omeslice/metadata/metadata_synchronizer.h"
#include "omeslice/metadata/ome_xml.h"
#include "omeslice/ome_slicer.h"
#include "omeslice/tiff/ome_tiff_source.h"
#include "omeslice/tiff/ome_tiff_writer.h"

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_OMESLICE_H_

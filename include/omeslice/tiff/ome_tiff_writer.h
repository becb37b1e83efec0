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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_WRITER_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_WRITER_H_

#include <tiffio.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "omeslice/core/image_descriptor.h"
#include "omeslice/engine/tile_sink.h"

namespace omeslice {

/// @brief Output container options
struct TiffWriterOptions {
  uint16_t compression = COMPRESSION_LZW;  ///< libtiff compression scheme
  bool bigtiff = true;                     ///< 64-bit offsets
  std::string software = "omeslice";       ///< Software tag
};

/**
 * @brief TileSink writing a pyramidal OME-TIFF
 *
 * Output layout mirrors what OmeTiffPixelSource reads: plane i is IFD i,
 * its reduced levels are SubIFDs, and the OME-XML is the ImageDescription
 * of IFD 0. Passes must therefore arrive plane by plane, each plane's
 * levels in ascending order.
 *
 * Everything is written to a hidden temporary file next to the
 * destination. Commit renames it into place, so the destination either
 * keeps its previous content or holds the complete new image. A writer
 * destroyed without Commit removes its temporary file.
 *
 * Tile sizes must be multiples of 16, as the TIFF format requires.
 */
class OmeTiffWriter : public TileSink {
 public:
  explicit OmeTiffWriter(std::filesystem::path destination,
                         TiffWriterOptions options = {});
  ~OmeTiffWriter() override;

  OmeTiffWriter(const OmeTiffWriter&) = delete;
  OmeTiffWriter& operator=(const OmeTiffWriter&) = delete;

  absl::Status Begin(const ImageDescriptor& output,
                     const std::string& metadata_text) override;
  absl::Status BeginPass(uint32_t level, uint32_t plane) override;
  absl::Status WriteTile(const OutputTile& tile) override;
  absl::Status EndPass() override;
  absl::Status Commit() override;
  void Abort() override;

  [[nodiscard]] const std::filesystem::path& GetDestination() const {
    return destination_;
  }

  /// @brief Temporary file the image is staged in
  [[nodiscard]] const std::filesystem::path& GetStagingPath() const {
    return staging_;
  }

 private:
  struct Pass {
    uint32_t level = 0;
    uint32_t plane = 0;
    SampleLayout layout;
    uint64_t tiles_written = 0;
  };

  absl::Status WriteDirectoryFields(const ResolutionLevel& level,
                                    uint32_t plane, const SampleLayout& layout);

  std::filesystem::path destination_;
  std::filesystem::path staging_;
  TiffWriterOptions options_;

  TIFF* tif_ = nullptr;
  ImageDescriptor output_;
  std::string metadata_text_;
  std::optional<Pass> pass_;
  uint64_t passes_done_ = 0;
  bool staged_ = false;  ///< The staging file is ours to remove
  bool committed_ = false;
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_TIFF_OME_TIFF_WRITER_H_

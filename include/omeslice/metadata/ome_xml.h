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

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_OME_XML_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_OME_XML_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "omeslice/core/image_descriptor.h"

namespace pugi {
class xml_node;
}

namespace omeslice {

/// @brief One OME TiffData block: planes stored from a given IFD onwards
struct TiffDataBlock {
  uint32_t ifd = 0;
  uint32_t first_c = 0;
  uint32_t first_z = 0;
  uint32_t first_t = 0;
  std::optional<uint32_t> plane_count;  ///< nullopt = all remaining planes
};

/// @brief OME-XML reader and writer for the first Image of a document
///
/// Elements are matched by local name, so both default-namespace and
/// prefixed (`ome:Pixels`) documents are accepted.
class OmeXmlCodec {
 public:
  /// @brief Parse OME-XML into an image descriptor
  ///
  /// Resolution levels are left empty; they belong to the container. The
  /// document itself is kept in `extension`.
  ///
  /// @param xml OME-XML text
  /// @return Descriptor, or MalformedMetadataError when the document is not
  ///         well-formed, lacks dimensions or channels, or is inconsistent
  static absl::StatusOr<ImageDescriptor> Parse(std::string_view xml);

  /// @brief Serialize a descriptor to OME-XML
  ///
  /// When the descriptor carries its source document, the tracked fields
  /// are written into a copy of it and everything else is kept verbatim.
  /// TiffData blocks are regenerated: plane i is stored in IFD i.
  static absl::StatusOr<std::string> Serialize(
      const ImageDescriptor& descriptor);

  /// @brief Cheap check for an OME-XML root element
  static bool IsOmeXml(std::string_view text);

  /// @brief TiffData blocks of the first Image, in document order
  static absl::StatusOr<std::vector<TiffDataBlock>> ParseTiffData(
      std::string_view xml);

 private:
  static absl::Status ParsePixels(const pugi::xml_node& pixels,
                                  ImageDescriptor& descriptor);
  static absl::Status ParseChannels(const pugi::xml_node& pixels,
                                    ImageDescriptor& descriptor);
  static absl::Status ParsePlanes(const pugi::xml_node& pixels,
                                  ImageDescriptor& descriptor);

  static void WritePixels(const ImageDescriptor& descriptor,
                          pugi::xml_node& pixels);
  static void WriteChannels(const ImageDescriptor& descriptor,
                            pugi::xml_node& pixels);
  static void WriteTiffData(const ImageDescriptor& descriptor,
                            pugi::xml_node& pixels);
  static void WritePlanes(const ImageDescriptor& descriptor,
                          pugi::xml_node& pixels);
};

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_METADATA_OME_XML_H_

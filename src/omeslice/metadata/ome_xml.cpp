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

#include "omeslice/metadata/ome_xml.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <pugixml.hpp>

#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "omeslice/core/errors.h"
#include "omeslice/status/status_macros.h"

namespace omeslice {

namespace {

constexpr const char* kOmeNamespace =
    "http://www.openmicroscopy.org/Schemas/OME/2016-06";
constexpr const char* kXsiNamespace =
    "http://www.w3.org/2001/XMLSchema-instance";
constexpr const char* kSchemaLocation =
    "http://www.openmicroscopy.org/Schemas/OME/2016-06 "
    "http://www.openmicroscopy.org/Schemas/OME/2016-06/ome.xsd";

// ============================================================================
// Node helpers
// ============================================================================

std::string_view LocalName(const pugi::xml_node& node) {
  const std::string_view name(node.name());
  const auto pos = name.rfind(':');
  return pos == std::string_view::npos ? name : name.substr(pos + 1);
}

/// Element name for a new child, using the parent's namespace prefix.
std::string QualifiedName(const pugi::xml_node& parent,
                          std::string_view local) {
  const std::string_view name(parent.name());
  const auto pos = name.rfind(':');
  if (pos == std::string_view::npos) {
    return std::string(local);
  }
  return absl::StrFormat("%s:%s", name.substr(0, pos), local);
}

pugi::xml_node FindChild(const pugi::xml_node& parent,
                         std::string_view local) {
  for (pugi::xml_node child : parent.children()) {
    if (child.type() == pugi::node_element && LocalName(child) == local) {
      return child;
    }
  }
  return {};
}

std::vector<pugi::xml_node> FindChildren(const pugi::xml_node& parent,
                                         std::string_view local) {
  std::vector<pugi::xml_node> nodes;
  for (pugi::xml_node child : parent.children()) {
    if (child.type() == pugi::node_element && LocalName(child) == local) {
      nodes.push_back(child);
    }
  }
  return nodes;
}

absl::StatusOr<pugi::xml_node> FindPixels(const pugi::xml_document& doc) {
  const pugi::xml_node ome = FindChild(doc, "OME");
  if (ome.empty()) {
    return MalformedMetadataError("Missing OME root element");
  }
  const pugi::xml_node image = FindChild(ome, "Image");
  if (image.empty()) {
    return MalformedMetadataError("OME document contains no Image");
  }
  const pugi::xml_node pixels = FindChild(image, "Pixels");
  if (pixels.empty()) {
    return MalformedMetadataError("Image has no Pixels element");
  }
  return pixels;
}

absl::Status LoadDocument(std::string_view xml, pugi::xml_document& doc) {
  const pugi::xml_parse_result result =
      doc.load_buffer(xml.data(), xml.size());
  if (!result) {
    return MalformedMetadataError(
        absl::StrFormat("OME-XML is not well-formed: %s at offset %d",
                        result.description(), result.offset));
  }
  return absl::OkStatus();
}

// ============================================================================
// Attribute readers
// ============================================================================

std::string GetString(const pugi::xml_node& node, const char* name) {
  return node.attribute(name).as_string();
}

absl::StatusOr<std::optional<uint32_t>> GetUint(const pugi::xml_node& node,
                                                const char* name) {
  const pugi::xml_attribute attr = node.attribute(name);
  if (attr.empty()) {
    return std::optional<uint32_t>();
  }
  uint32_t value = 0;
  if (!absl::SimpleAtoi(attr.value(), &value)) {
    return MalformedMetadataError(absl::StrFormat(
        "%s@%s is not a non-negative integer: '%s'", LocalName(node), name,
        attr.value()));
  }
  return std::optional<uint32_t>(value);
}

absl::StatusOr<std::optional<int32_t>> GetInt(const pugi::xml_node& node,
                                              const char* name) {
  const pugi::xml_attribute attr = node.attribute(name);
  if (attr.empty()) {
    return std::optional<int32_t>();
  }
  int32_t value = 0;
  if (!absl::SimpleAtoi(attr.value(), &value)) {
    return MalformedMetadataError(absl::StrFormat(
        "%s@%s is not an integer: '%s'", LocalName(node), name, attr.value()));
  }
  return std::optional<int32_t>(value);
}

absl::StatusOr<std::optional<double>> GetDouble(const pugi::xml_node& node,
                                                const char* name) {
  const pugi::xml_attribute attr = node.attribute(name);
  if (attr.empty()) {
    return std::optional<double>();
  }
  double value = 0.0;
  if (!absl::SimpleAtod(attr.value(), &value)) {
    return MalformedMetadataError(absl::StrFormat(
        "%s@%s is not a number: '%s'", LocalName(node), name, attr.value()));
  }
  return std::optional<double>(value);
}

absl::StatusOr<uint32_t> GetRequiredUint(const pugi::xml_node& node,
                                         const char* name) {
  DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, value,
                           GetUint(node, name));
  if (!value.has_value()) {
    return MalformedMetadataError(absl::StrFormat(
        "%s is missing required attribute %s", LocalName(node), name));
  }
  return *value;
}

// ============================================================================
// Attribute writers
// ============================================================================

pugi::xml_attribute Attribute(pugi::xml_node& node, const char* name) {
  pugi::xml_attribute attr = node.attribute(name);
  return attr.empty() ? node.append_attribute(name) : attr;
}

void SetUint(pugi::xml_node& node, const char* name, uint32_t value) {
  Attribute(node, name).set_value(std::to_string(value).c_str());
}

void SetString(pugi::xml_node& node, const char* name,
               const std::string& value) {
  if (value.empty()) {
    node.remove_attribute(name);
    return;
  }
  Attribute(node, name).set_value(value.c_str());
}

template <typename T>
void SetOptional(pugi::xml_node& node, const char* name,
                 const std::optional<T>& value) {
  if (!value.has_value()) {
    node.remove_attribute(name);
    return;
  }
  // Shortest representation that parses back to the same value
  Attribute(node, name).set_value(fmt::format("{}", *value).c_str());
}

/// New child named `local` after `anchor`, or as first child without one.
pugi::xml_node InsertAfter(pugi::xml_node& parent, pugi::xml_node anchor,
                           std::string_view local) {
  const std::string name = QualifiedName(parent, local);
  if (anchor.empty()) {
    return parent.prepend_child(name.c_str());
  }
  return parent.insert_child_after(name.c_str(), anchor);
}

pugi::xml_node LastOf(const std::vector<pugi::xml_node>& nodes) {
  return nodes.empty() ? pugi::xml_node() : nodes.back();
}

/// Replace the pixel references of every Image except `kept` with
/// MetadataOnly; the output container holds pixels for `kept` alone.
void DetachOtherImages(const pugi::xml_node& kept) {
  for (const pugi::xml_node& image : FindChildren(kept.parent(), "Image")) {
    if (image == kept) {
      continue;
    }
    pugi::xml_node pixels = FindChild(image, "Pixels");
    if (pixels.empty()) {
      continue;
    }
    for (const char* local : {"TiffData", "BinData", "MetadataOnly"}) {
      for (const pugi::xml_node& node : FindChildren(pixels, local)) {
        pixels.remove_child(node);
      }
    }
    InsertAfter(pixels, LastOf(FindChildren(pixels, "Channel")),
                "MetadataOnly");
  }
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

bool OmeXmlCodec::IsOmeXml(std::string_view text) {
  return text.find("<OME") != std::string_view::npos ||
         text.find(":OME") != std::string_view::npos;
}

absl::StatusOr<ImageDescriptor> OmeXmlCodec::Parse(std::string_view xml) {
  pugi::xml_document doc;
  RETURN_IF_ERROR(LoadDocument(xml, doc), "Parsing OME-XML");
  DECLARE_ASSIGN_OR_RETURN(pugi::xml_node, pixels, FindPixels(doc));

  ImageDescriptor descriptor;
  const pugi::xml_node image = pixels.parent();
  descriptor.image_id = GetString(image, "ID");
  descriptor.image_name = GetString(image, "Name");

  RETURN_IF_ERROR(ParsePixels(pixels, descriptor), "Parsing Pixels");
  RETURN_IF_ERROR(ParseChannels(pixels, descriptor), "Parsing Channels");
  RETURN_IF_ERROR(ParsePlanes(pixels, descriptor), "Parsing Planes");
  RETURN_IF_ERROR(Validate(descriptor), "Inconsistent OME-XML");

  descriptor.extension = std::make_shared<const std::string>(xml);
  return descriptor;
}

absl::Status OmeXmlCodec::ParsePixels(const pugi::xml_node& pixels,
                                      ImageDescriptor& descriptor) {
  descriptor.pixels_id = GetString(pixels, "ID");
  ASSIGN_OR_RETURN(descriptor.width, GetRequiredUint(pixels, "SizeX"));
  ASSIGN_OR_RETURN(descriptor.height, GetRequiredUint(pixels, "SizeY"));

  DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, size_z,
                           GetUint(pixels, "SizeZ"));
  DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, size_c,
                           GetUint(pixels, "SizeC"));
  DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, size_t_attr,
                           GetUint(pixels, "SizeT"));
  descriptor.size_z = size_z.value_or(1);
  descriptor.size_c = size_c.value_or(0);
  descriptor.size_time = size_t_attr.value_or(1);

  const std::string type = GetString(pixels, "Type");
  if (!type.empty()) {
    ASSIGN_OR_RETURN(descriptor.pixel_type, ParsePixelType(type));
  }
  const std::string order = GetString(pixels, "DimensionOrder");
  if (!order.empty()) {
    ASSIGN_OR_RETURN(descriptor.dimension_order, ParseDimensionOrder(order));
  }
  ASSIGN_OR_RETURN(descriptor.significant_bits,
                   GetUint(pixels, "SignificantBits"));

  PhysicalSize& physical = descriptor.physical_size;
  ASSIGN_OR_RETURN(physical.x, GetDouble(pixels, "PhysicalSizeX"));
  ASSIGN_OR_RETURN(physical.y, GetDouble(pixels, "PhysicalSizeY"));
  ASSIGN_OR_RETURN(physical.z, GetDouble(pixels, "PhysicalSizeZ"));
  physical.x_unit = GetString(pixels, "PhysicalSizeXUnit");
  physical.y_unit = GetString(pixels, "PhysicalSizeYUnit");
  physical.z_unit = GetString(pixels, "PhysicalSizeZUnit");
  return absl::OkStatus();
}

absl::Status OmeXmlCodec::ParseChannels(const pugi::xml_node& pixels,
                                        ImageDescriptor& descriptor) {
  const uint32_t bits = 8 * GetBytesPerSample(descriptor.pixel_type);
  for (const pugi::xml_node& node : FindChildren(pixels, "Channel")) {
    ChannelDescriptor channel;
    channel.id = GetString(node, "ID");
    channel.name = GetString(node, "Name");
    DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, samples,
                             GetUint(node, "SamplesPerPixel"));
    channel.samples_per_pixel = samples.value_or(1);
    channel.bits_per_sample = bits;
    ASSIGN_OR_RETURN(channel.color, GetInt(node, "Color"));
    descriptor.channels.push_back(std::move(channel));
  }
  if (descriptor.channels.empty()) {
    return MalformedMetadataError("Pixels declares no Channel elements");
  }

  // SizeC may be omitted by lenient writers; derive it from the channels.
  if (descriptor.size_c == 0) {
    for (const ChannelDescriptor& channel : descriptor.channels) {
      descriptor.size_c += channel.samples_per_pixel;
    }
  }
  return absl::OkStatus();
}

absl::Status OmeXmlCodec::ParsePlanes(const pugi::xml_node& pixels,
                                      ImageDescriptor& descriptor) {
  const std::vector<pugi::xml_node> nodes = FindChildren(pixels, "Plane");
  if (nodes.empty()) {
    descriptor.planes = RasterizePlanes(
        descriptor.dimension_order, descriptor.size_z,
        static_cast<uint32_t>(descriptor.channels.size()),
        descriptor.size_time);
    descriptor.planes_declared = false;
    return absl::OkStatus();
  }

  descriptor.planes_declared = true;
  for (const pugi::xml_node& node : nodes) {
    PlaneDescriptor plane;
    ASSIGN_OR_RETURN(plane.the_c, GetRequiredUint(node, "TheC"));
    ASSIGN_OR_RETURN(plane.the_z, GetRequiredUint(node, "TheZ"));
    ASSIGN_OR_RETURN(plane.the_t, GetRequiredUint(node, "TheT"));
    ASSIGN_OR_RETURN(plane.position_x, GetDouble(node, "PositionX"));
    ASSIGN_OR_RETURN(plane.position_y, GetDouble(node, "PositionY"));
    ASSIGN_OR_RETURN(plane.position_z, GetDouble(node, "PositionZ"));
    plane.position_x_unit = GetString(node, "PositionXUnit");
    plane.position_y_unit = GetString(node, "PositionYUnit");
    plane.position_z_unit = GetString(node, "PositionZUnit");
    descriptor.planes.push_back(std::move(plane));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<TiffDataBlock>> OmeXmlCodec::ParseTiffData(
    std::string_view xml) {
  pugi::xml_document doc;
  RETURN_IF_ERROR(LoadDocument(xml, doc), "Parsing OME-XML");
  DECLARE_ASSIGN_OR_RETURN(pugi::xml_node, pixels, FindPixels(doc));

  std::vector<TiffDataBlock> blocks;
  for (const pugi::xml_node& node : FindChildren(pixels, "TiffData")) {
    TiffDataBlock block;
    DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, ifd,
                             GetUint(node, "IFD"));
    DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, first_c,
                             GetUint(node, "FirstC"));
    DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, first_z,
                             GetUint(node, "FirstZ"));
    DECLARE_ASSIGN_OR_RETURN(std::optional<uint32_t>, first_t,
                             GetUint(node, "FirstT"));
    ASSIGN_OR_RETURN(block.plane_count, GetUint(node, "PlaneCount"));
    block.ifd = ifd.value_or(0);
    block.first_c = first_c.value_or(0);
    block.first_z = first_z.value_or(0);
    block.first_t = first_t.value_or(0);
    // An explicit IFD without a count addresses a single plane.
    if (!block.plane_count.has_value() && ifd.has_value()) {
      block.plane_count = 1;
    }
    blocks.push_back(block);
  }
  return blocks;
}

// ============================================================================
// Serialization
// ============================================================================

absl::StatusOr<std::string> OmeXmlCodec::Serialize(
    const ImageDescriptor& descriptor) {
  RETURN_IF_ERROR(Validate(descriptor), "Refusing to serialize descriptor");

  pugi::xml_document doc;
  pugi::xml_node pixels;
  if (descriptor.extension != nullptr) {
    RETURN_IF_ERROR(LoadDocument(*descriptor.extension, doc),
                    "Reloading source document");
    ASSIGN_OR_RETURN(pixels, FindPixels(doc));
  } else {
    pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version").set_value("1.0");
    declaration.append_attribute("encoding").set_value("UTF-8");
    pugi::xml_node ome = doc.append_child("OME");
    ome.append_attribute("xmlns").set_value(kOmeNamespace);
    ome.append_attribute("xmlns:xsi").set_value(kXsiNamespace);
    ome.append_attribute("xsi:schemaLocation").set_value(kSchemaLocation);
    pugi::xml_node image = ome.append_child("Image");
    image.append_attribute("ID").set_value("Image:0");
    pixels = image.append_child("Pixels");
    pixels.append_attribute("ID").set_value("Pixels:0");
  }

  pugi::xml_node image = pixels.parent();
  DetachOtherImages(image);
  SetString(image, "ID", descriptor.image_id);
  SetString(image, "Name", descriptor.image_name);

  WritePixels(descriptor, pixels);
  WriteChannels(descriptor, pixels);
  WriteTiffData(descriptor, pixels);
  WritePlanes(descriptor, pixels);

  std::ostringstream out;
  doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
  return out.str();
}

void OmeXmlCodec::WritePixels(const ImageDescriptor& descriptor,
                              pugi::xml_node& pixels) {
  SetString(pixels, "ID", descriptor.pixels_id);
  SetString(pixels, "DimensionOrder", GetName(descriptor.dimension_order));
  SetString(pixels, "Type", GetName(descriptor.pixel_type));
  SetOptional(pixels, "SignificantBits", descriptor.significant_bits);
  SetUint(pixels, "SizeX", descriptor.width);
  SetUint(pixels, "SizeY", descriptor.height);
  SetUint(pixels, "SizeZ", descriptor.size_z);
  SetUint(pixels, "SizeC", descriptor.size_c);
  SetUint(pixels, "SizeT", descriptor.size_time);

  const PhysicalSize& physical = descriptor.physical_size;
  SetOptional(pixels, "PhysicalSizeX", physical.x);
  SetOptional(pixels, "PhysicalSizeY", physical.y);
  SetOptional(pixels, "PhysicalSizeZ", physical.z);
  SetString(pixels, "PhysicalSizeXUnit", physical.x_unit);
  SetString(pixels, "PhysicalSizeYUnit", physical.y_unit);
  SetString(pixels, "PhysicalSizeZUnit", physical.z_unit);
}

void OmeXmlCodec::WriteChannels(const ImageDescriptor& descriptor,
                                pugi::xml_node& pixels) {
  std::vector<pugi::xml_node> nodes = FindChildren(pixels, "Channel");
  for (size_t i = descriptor.channels.size(); i < nodes.size(); ++i) {
    pixels.remove_child(nodes[i]);
  }
  nodes.resize(std::min(nodes.size(), descriptor.channels.size()));

  for (size_t i = 0; i < descriptor.channels.size(); ++i) {
    if (i == nodes.size()) {
      nodes.push_back(InsertAfter(pixels, LastOf(nodes), "Channel"));
    }
    pugi::xml_node& node = nodes[i];
    const ChannelDescriptor& channel = descriptor.channels[i];
    SetString(node, "ID", channel.id);
    SetString(node, "Name", channel.name);
    SetUint(node, "SamplesPerPixel", channel.samples_per_pixel);
    SetOptional(node, "Color", channel.color);
  }
}

void OmeXmlCodec::WriteTiffData(const ImageDescriptor& descriptor,
                                pugi::xml_node& pixels) {
  for (const char* local : {"TiffData", "BinData", "MetadataOnly"}) {
    for (const pugi::xml_node& node : FindChildren(pixels, local)) {
      pixels.remove_child(node);
    }
  }

  pugi::xml_node anchor = LastOf(FindChildren(pixels, "Channel"));
  for (size_t i = 0; i < descriptor.planes.size(); ++i) {
    const PlaneDescriptor& plane = descriptor.planes[i];
    anchor = InsertAfter(pixels, anchor, "TiffData");
    SetUint(anchor, "IFD", static_cast<uint32_t>(i));
    SetUint(anchor, "FirstC", plane.the_c);
    SetUint(anchor, "FirstZ", plane.the_z);
    SetUint(anchor, "FirstT", plane.the_t);
    SetUint(anchor, "PlaneCount", 1);
  }
}

void OmeXmlCodec::WritePlanes(const ImageDescriptor& descriptor,
                              pugi::xml_node& pixels) {
  std::vector<pugi::xml_node> nodes = FindChildren(pixels, "Plane");
  const size_t wanted =
      descriptor.planes_declared ? descriptor.planes.size() : 0;
  for (size_t i = wanted; i < nodes.size(); ++i) {
    pixels.remove_child(nodes[i]);
  }
  nodes.resize(std::min(nodes.size(), wanted));

  pugi::xml_node anchor = LastOf(nodes);
  if (anchor.empty()) {
    anchor = LastOf(FindChildren(pixels, "TiffData"));
  }
  for (size_t i = 0; i < wanted; ++i) {
    if (i == nodes.size()) {
      anchor = InsertAfter(pixels, anchor, "Plane");
      nodes.push_back(anchor);
    }
    pugi::xml_node& node = nodes[i];
    const PlaneDescriptor& plane = descriptor.planes[i];
    SetUint(node, "TheZ", plane.the_z);
    SetUint(node, "TheT", plane.the_t);
    SetUint(node, "TheC", plane.the_c);
    SetOptional(node, "PositionX", plane.position_x);
    SetOptional(node, "PositionY", plane.position_y);
    SetOptional(node, "PositionZ", plane.position_z);
    SetString(node, "PositionXUnit", plane.position_x_unit);
    SetString(node, "PositionYUnit", plane.position_y_unit);
    SetString(node, "PositionZUnit", plane.position_z_unit);
  }
}

}  // namespace omeslice

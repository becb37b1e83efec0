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

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "absl/strings/str_replace.h"
#include "omeslice/core/errors.h"
#include "omeslice/testing/synthetic_source.h"

namespace omeslice {
namespace {

constexpr const char* kSlideXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<OME xmlns="http://www.openmicroscopy.org/Schemas/OME/2016-06" Creator="scanner 1.2">
  <Instrument ID="Instrument:0">
    <Objective ID="Objective:0:0" NominalMagnification="40"/>
  </Instrument>
  <Image ID="Image:0" Name="slide">
    <Pixels ID="Pixels:0" DimensionOrder="XYCZT" Type="uint16" SizeX="2048" SizeY="1536" SizeZ="1" SizeC="2" SizeT="1" PhysicalSizeX="0.25" PhysicalSizeXUnit="µm" PhysicalSizeY="0.25" PhysicalSizeYUnit="µm">
      <Channel ID="Channel:0:0" Name="DAPI" SamplesPerPixel="1" Color="-16776961"/>
      <Channel ID="Channel:0:1" Name="FITC" SamplesPerPixel="1"/>
      <TiffData IFD="0" PlaneCount="2"/>
      <Plane TheZ="0" TheT="0" TheC="0" PositionX="10.5" PositionXUnit="mm"/>
      <Plane TheZ="0" TheT="0" TheC="1" PositionX="10.5" PositionXUnit="mm"/>
    </Pixels>
  </Image>
  <StructuredAnnotations>
    <XMLAnnotation ID="Annotation:0"><Value><Scanner>Custom</Scanner></Value></XMLAnnotation>
  </StructuredAnnotations>
</OME>
)";

/// Compare every modelled field; the source document is not part of it.
void ExpectSameModel(ImageDescriptor actual, ImageDescriptor expected) {
  actual.extension = nullptr;
  expected.extension = nullptr;
  EXPECT_EQ(actual, expected);
}

TEST(OmeXmlCodecTest, ParsesModelledFields) {
  auto parsed = OmeXmlCodec::Parse(kSlideXml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  const ImageDescriptor& descriptor = *parsed;

  EXPECT_EQ(descriptor.image_id, "Image:0");
  EXPECT_EQ(descriptor.image_name, "slide");
  EXPECT_EQ(descriptor.width, 2048);
  EXPECT_EQ(descriptor.height, 1536);
  EXPECT_EQ(descriptor.size_c, 2);
  EXPECT_EQ(descriptor.pixel_type, PixelType::kUInt16);
  EXPECT_EQ(descriptor.dimension_order, DimensionOrder::kXYCZT);
  EXPECT_EQ(descriptor.physical_size.x, 0.25);
  EXPECT_EQ(descriptor.physical_size.x_unit, "µm");
  EXPECT_FALSE(descriptor.physical_size.z.has_value());

  ASSERT_EQ(descriptor.GetChannelCount(), 2);
  EXPECT_EQ(descriptor.channels[0].name, "DAPI");
  EXPECT_EQ(descriptor.channels[0].color, -16776961);
  EXPECT_EQ(descriptor.channels[1].bits_per_sample, 16);
  EXPECT_FALSE(descriptor.channels[1].color.has_value());

  ASSERT_EQ(descriptor.GetPlaneCount(), 2);
  EXPECT_TRUE(descriptor.planes_declared);
  EXPECT_EQ(descriptor.planes[1].the_c, 1);
  EXPECT_EQ(descriptor.planes[1].position_x, 10.5);
  EXPECT_EQ(descriptor.planes[1].position_x_unit, "mm");

  EXPECT_TRUE(descriptor.levels.empty());
  ASSERT_NE(descriptor.extension, nullptr);
}

TEST(OmeXmlCodecTest, AcceptsPrefixedNamespace) {
  const std::string xml = R"(<ome:OME xmlns:ome="http://www.openmicroscopy.org/Schemas/OME/2016-06">
  <ome:Image ID="Image:0">
    <ome:Pixels ID="Pixels:0" DimensionOrder="XYZCT" Type="uint8" SizeX="64" SizeY="32" SizeZ="1" SizeC="3" SizeT="1">
      <ome:Channel ID="Channel:0:0" SamplesPerPixel="3"/>
    </ome:Pixels>
  </ome:Image>
</ome:OME>)";
  EXPECT_TRUE(OmeXmlCodec::IsOmeXml(xml));
  auto parsed = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->channels[0].GetSampleLayout(), (SampleLayout{3, 8}));
  EXPECT_EQ(parsed->GetPlaneCount(), 1);
}

TEST(OmeXmlCodecTest, RasterizesUndeclaredPlanes) {
  const std::string xml = absl::StrReplaceAll(
      kSlideXml, {{R"(SizeZ="1")", R"(SizeZ="3")"},
                  {R"(DimensionOrder="XYCZT")", R"(DimensionOrder="XYZCT")"},
                  {R"(<Plane TheZ="0" TheT="0" TheC="0" PositionX="10.5" PositionXUnit="mm"/>)", ""},
                  {R"(<Plane TheZ="0" TheT="0" TheC="1" PositionX="10.5" PositionXUnit="mm"/>)", ""}});
  auto parsed = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_FALSE(parsed->planes_declared);
  ASSERT_EQ(parsed->GetPlaneCount(), 6);
  // Z varies fastest in XYZCT.
  EXPECT_EQ(parsed->planes[1].the_z, 1);
  EXPECT_EQ(parsed->planes[1].the_c, 0);
  EXPECT_EQ(parsed->planes[3].the_c, 1);
}

TEST(OmeXmlCodecTest, DerivesMissingSizeC) {
  const std::string xml =
      absl::StrReplaceAll(kSlideXml, {{R"(SizeC="2" )", ""}});
  auto parsed = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->size_c, 2);
}

TEST(OmeXmlCodecTest, RejectsMalformedDocuments) {
  const std::vector<std::string> bad = {
      "<OME><Image",
      "<NotOme/>",
      absl::StrReplaceAll(kSlideXml, {{R"(SizeX="2048" )", ""}}),
      absl::StrReplaceAll(kSlideXml, {{R"(SizeY="1536")", R"(SizeY="-3")"}}),
      absl::StrReplaceAll(kSlideXml, {{R"(Type="uint16")", R"(Type="uint12")"}}),
      // SizeC disagrees with the channels
      absl::StrReplaceAll(kSlideXml, {{R"(SizeC="2")", R"(SizeC="3")"}}),
      // Plane points at a missing channel
      absl::StrReplaceAll(kSlideXml, {{R"(TheC="1")", R"(TheC="4")"}}),
      // Duplicate plane
      absl::StrReplaceAll(kSlideXml, {{R"(TheC="1")", R"(TheC="0")"}}),
  };
  for (const std::string& xml : bad) {
    auto parsed = OmeXmlCodec::Parse(xml);
    EXPECT_EQ(GetErrorKind(parsed.status()), ErrorKind::kMalformedMetadata)
        << parsed.status();
  }
}

TEST(OmeXmlCodecTest, RejectsDocumentWithoutChannels) {
  std::string xml = kSlideXml;
  xml = absl::StrReplaceAll(
      xml, {{R"(<Channel ID="Channel:0:0" Name="DAPI" SamplesPerPixel="1" Color="-16776961"/>)", ""},
            {R"(<Channel ID="Channel:0:1" Name="FITC" SamplesPerPixel="1"/>)", ""}});
  auto parsed = OmeXmlCodec::Parse(xml);
  EXPECT_EQ(GetErrorKind(parsed.status()), ErrorKind::kMalformedMetadata);
}

TEST(OmeXmlCodecTest, SerializeRoundTripsModelledFields) {
  auto parsed = OmeXmlCodec::Parse(kSlideXml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  auto text = OmeXmlCodec::Serialize(*parsed);
  ASSERT_TRUE(text.ok()) << text.status();
  auto reparsed = OmeXmlCodec::Parse(*text);
  ASSERT_TRUE(reparsed.ok()) << reparsed.status();
  ExpectSameModel(*reparsed, *parsed);
}

TEST(OmeXmlCodecTest, SerializeKeepsUnmodelledElements) {
  auto parsed = OmeXmlCodec::Parse(kSlideXml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  ImageDescriptor cropped = *parsed;
  cropped.width = 100;
  cropped.height = 50;

  auto text = OmeXmlCodec::Serialize(cropped);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_NE(text->find("NominalMagnification=\"40\""), std::string::npos);
  EXPECT_NE(text->find("<Scanner>Custom</Scanner>"), std::string::npos);
  EXPECT_NE(text->find("Creator=\"scanner 1.2\""), std::string::npos);
  EXPECT_NE(text->find("SizeX=\"100\""), std::string::npos);
  EXPECT_EQ(text->find("SizeX=\"2048\""), std::string::npos);
}

TEST(OmeXmlCodecTest, SerializeRegeneratesTiffData) {
  auto parsed = OmeXmlCodec::Parse(kSlideXml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  auto text = OmeXmlCodec::Serialize(*parsed);
  ASSERT_TRUE(text.ok()) << text.status();

  auto blocks = OmeXmlCodec::ParseTiffData(*text);
  ASSERT_TRUE(blocks.ok()) << blocks.status();
  ASSERT_EQ(blocks->size(), 2);
  for (uint32_t i = 0; i < 2; ++i) {
    EXPECT_EQ((*blocks)[i].ifd, i);
    EXPECT_EQ((*blocks)[i].first_c, parsed->planes[i].the_c);
    EXPECT_EQ((*blocks)[i].plane_count, 1);
  }
}

size_t CountOccurrences(const std::string& text, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

TEST(OmeXmlCodecTest, SerializeDetachesPixelsOfOtherImages) {
  const std::string xml = absl::StrReplaceAll(
      kSlideXml,
      {{"  </Image>\n",
        R"(  </Image>
  <Image ID="Image:1" Name="overview">
    <Pixels ID="Pixels:1" DimensionOrder="XYCZT" Type="uint8" SizeX="640" SizeY="480" SizeZ="1" SizeC="3" SizeT="1">
      <Channel ID="Channel:1:0" SamplesPerPixel="3"/>
      <TiffData IFD="2" PlaneCount="1"/>
    </Pixels>
  </Image>
)"}});
  auto parsed = OmeXmlCodec::Parse(xml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->image_id, "Image:0");

  ImageDescriptor cropped = *parsed;
  cropped.width = 1000;
  cropped.height = 500;
  auto text = OmeXmlCodec::Serialize(cropped);
  ASSERT_TRUE(text.ok()) << text.status();

  // The second image keeps its metadata but no longer points at IFDs.
  EXPECT_NE(text->find(R"(Name="overview")"), std::string::npos);
  EXPECT_NE(text->find(R"(SizeX="640")"), std::string::npos);
  EXPECT_EQ(text->find(R"(IFD="2")"), std::string::npos);
  EXPECT_EQ(CountOccurrences(*text, "<MetadataOnly"), 1);
  EXPECT_EQ(CountOccurrences(*text, "<TiffData"), cropped.GetPlaneCount());

  auto reparsed = OmeXmlCodec::Parse(*text);
  ASSERT_TRUE(reparsed.ok()) << reparsed.status();
  ExpectSameModel(*reparsed, cropped);

  auto again = OmeXmlCodec::Serialize(*reparsed);
  ASSERT_TRUE(again.ok()) << again.status();
  EXPECT_EQ(*again, *text);
}

TEST(OmeXmlCodecTest, SerializeBuildsDocumentFromScratch) {
  testing::SyntheticImageOptions options;
  options.channels = 3;
  options.size_z = 2;
  ImageDescriptor descriptor = testing::MakeSyntheticDescriptor(options);
  descriptor.significant_bits = 12;
  descriptor.levels.clear();

  auto text = OmeXmlCodec::Serialize(descriptor);
  ASSERT_TRUE(text.ok()) << text.status();
  EXPECT_TRUE(OmeXmlCodec::IsOmeXml(*text));
  // Undeclared planes stay undeclared.
  EXPECT_EQ(text->find("<Plane"), std::string::npos);

  auto reparsed = OmeXmlCodec::Parse(*text);
  ASSERT_TRUE(reparsed.ok()) << reparsed.status();
  ExpectSameModel(*reparsed, descriptor);
}

TEST(OmeXmlCodecTest, SerializeRefusesInconsistentDescriptor) {
  auto parsed = OmeXmlCodec::Parse(kSlideXml);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  ImageDescriptor broken = *parsed;
  broken.channels.clear();
  EXPECT_EQ(GetErrorKind(OmeXmlCodec::Serialize(broken).status()),
            ErrorKind::kMalformedMetadata);
}

TEST(OmeXmlCodecTest, ParseTiffDataDefaults) {
  const std::string xml = absl::StrReplaceAll(
      kSlideXml,
      {{R"(<TiffData IFD="0" PlaneCount="2"/>)",
        R"(<TiffData/><TiffData IFD="4" FirstC="1"/>)"}});
  auto blocks = OmeXmlCodec::ParseTiffData(xml);
  ASSERT_TRUE(blocks.ok()) << blocks.status();
  ASSERT_EQ(blocks->size(), 2);
  EXPECT_EQ((*blocks)[0].ifd, 0);
  EXPECT_FALSE((*blocks)[0].plane_count.has_value());
  EXPECT_EQ((*blocks)[1].ifd, 4);
  EXPECT_EQ((*blocks)[1].first_c, 1);
  EXPECT_EQ((*blocks)[1].plane_count, 1);
}

}  // namespace
}  // namespace omeslice

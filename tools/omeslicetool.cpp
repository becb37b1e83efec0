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

#include <tiffio.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "omeslice/omeslice.h"
#include "omeslice/utilities/thread_pool.h"

// Common flags
ABSL_FLAG(std::string, input, "", "Path to the OME-TIFF file");

// Info command flags
ABSL_FLAG(bool, verbose, false, "Also print the OME-XML metadata");

// Crop command flags
ABSL_FLAG(uint32_t, x, 0, "Crop origin X in full-resolution pixels");
ABSL_FLAG(uint32_t, y, 0, "Crop origin Y in full-resolution pixels");
ABSL_FLAG(uint32_t, width, 0, "Crop width in full-resolution pixels");
ABSL_FLAG(uint32_t, height, 0, "Crop height in full-resolution pixels");
ABSL_FLAG(std::string, output, "", "Path of the cropped OME-TIFF");
ABSL_FLAG(std::string, degenerate_levels, "drop",
          "Pyramid levels left empty by the crop: drop or fail");
ABSL_FLAG(std::string, compression, "lzw",
          "Output tile compression: lzw, deflate or none");
ABSL_FLAG(bool, bigtiff, true, "Write 64-bit BigTIFF offsets");
ABSL_FLAG(uint32_t, threads, 0,
          "Decode threads (0 = hardware concurrency)");

namespace {

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintSubHeader(const std::string& title) {
  std::cout << '\n';
  std::cout << "--- " << title << " ---\n";
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, double value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << std::fixed
            << std::setprecision(6) << value << '\n';
}

void PrintKeyValue(const std::string& key, size_t value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintImageInfo(const omeslice::OmeSlicer& slicer) {
  PrintHeader("Image Information");

  const omeslice::ImageDescriptor& descriptor = slicer.GetDescriptor();
  const omeslice::ImageDimensions dims = slicer.GetDimensions();
  PrintKeyValue("Dimensions",
                absl::StrFormat("%u x %u", dims.width, dims.height));
  PrintKeyValue("Pixel Type", omeslice::GetName(slicer.GetPixelType()));
  PrintKeyValue("Dimension Order",
                omeslice::GetName(descriptor.dimension_order));
  PrintKeyValue("Size Z", static_cast<size_t>(descriptor.size_z));
  PrintKeyValue("Size T", static_cast<size_t>(descriptor.size_time));
  PrintKeyValue("Planes", descriptor.GetPlaneCount());

  const omeslice::PhysicalSize& physical = descriptor.physical_size;
  if (physical.x.has_value()) {
    PrintKeyValue("Physical Size X", *physical.x);
  }
  if (physical.y.has_value()) {
    PrintKeyValue("Physical Size Y", *physical.y);
  }
  if (!physical.x_unit.empty()) {
    PrintKeyValue("Physical Unit", physical.x_unit);
  }
}

void PrintLevelInfo(const omeslice::OmeSlicer& slicer) {
  const omeslice::ImageDescriptor& descriptor = slicer.GetDescriptor();
  PrintHeader("Pyramid Levels");
  PrintKeyValue("Number of Levels", descriptor.GetLevelCount());

  for (const omeslice::ResolutionLevel& level : descriptor.levels) {
    PrintSubHeader("Level " + std::to_string(level.index));
    PrintKeyValue("  Dimensions",
                  absl::StrFormat("%u x %u", level.width, level.height), 25);
    PrintKeyValue("  Downsample Factor", level.downsample, 25);
    PrintKeyValue("  Tile Size",
                  absl::StrFormat("%u x %u", level.tile_width,
                                  level.tile_height),
                  25);
    PrintKeyValue("  Tile Grid",
                  absl::StrFormat("%u x %u", level.TilesAcross(),
                                  level.TilesDown()),
                  25);
  }
}

void PrintChannelInfo(const omeslice::OmeSlicer& slicer) {
  const omeslice::ImageDescriptor& descriptor = slicer.GetDescriptor();
  PrintHeader("Channel Information");
  PrintKeyValue("Number of Channels", slicer.GetChannelCount());

  for (size_t i = 0; i < descriptor.channels.size(); ++i) {
    const omeslice::ChannelDescriptor& channel = descriptor.channels[i];
    PrintSubHeader("Channel " + std::to_string(i));
    if (!channel.name.empty()) {
      PrintKeyValue("  Name", channel.name, 25);
    }
    PrintKeyValue("  Samples Per Pixel",
                  static_cast<size_t>(channel.samples_per_pixel), 25);
    PrintKeyValue("  Bits Per Sample",
                  static_cast<size_t>(channel.bits_per_sample), 25);
    if (channel.color.has_value()) {
      PrintKeyValue("  Color",
                    absl::StrFormat("0x%08X",
                                    static_cast<uint32_t>(*channel.color)),
                    25);
    }
  }
}

absl::StatusOr<uint16_t> ParseCompression(const std::string& name) {
  if (name == "lzw") {
    return static_cast<uint16_t>(COMPRESSION_LZW);
  }
  if (name == "deflate") {
    return static_cast<uint16_t>(COMPRESSION_ADOBE_DEFLATE);
  }
  if (name == "none") {
    return static_cast<uint16_t>(COMPRESSION_NONE);
  }
  return absl::InvalidArgumentError("Unknown compression '" + name + "'");
}

int InfoCommand(const std::string& input_file, bool verbose) {
  std::cout << "Opening image: " << input_file << '\n';
  auto slicer_or = omeslice::OmeSlicer::Load(input_file);
  if (!slicer_or.ok()) {
    std::cerr << "\nError: Failed to open image\n";
    std::cerr << "Status: " << slicer_or.status() << '\n';
    return 1;
  }

  PrintImageInfo(*slicer_or);
  PrintLevelInfo(*slicer_or);
  PrintChannelInfo(*slicer_or);

  if (verbose) {
    PrintHeader("OME-XML");
    std::cout << slicer_or->GetMetadataText() << '\n';
  }

  std::cout << '\n';
  PrintSeparator('=');
  std::cout << "Successfully read image information!\n";
  PrintSeparator('=');
  std::cout << '\n';
  return 0;
}

int CropCommand(const std::string& input_file, const std::string& output_file,
                const omeslice::CropRectangle& crop,
                const omeslice::SlicerOptions& options) {
  std::cout << "Opening image: " << input_file << '\n';
  auto slicer_or = omeslice::OmeSlicer::Load(input_file, options);
  if (!slicer_or.ok()) {
    std::cerr << "Error: Failed to open image\n";
    std::cerr << "Status: " << slicer_or.status() << '\n';
    return 1;
  }

  std::cout << "Cropping " << crop.ToString() << '\n';
  auto cropped_or = slicer_or->Crop(crop);
  if (!cropped_or.ok()) {
    std::cerr << "Error: Invalid crop\n";
    std::cerr << "Status: " << cropped_or.status() << '\n';
    return 1;
  }

  const omeslice::ImageDimensions dims = cropped_or->GetDimensions();
  std::cout << "Output: " << dims.width << " x " << dims.height << " pixels, "
            << dims.channels << " channel(s), "
            << cropped_or->GetDescriptor().GetLevelCount() << " level(s)\n";

  std::cout << "Saving to: " << output_file << '\n';
  const absl::Status save_status = cropped_or->Save(output_file);
  if (!save_status.ok()) {
    std::cerr << "Error: Failed to save crop\n";
    std::cerr << "Status: " << save_status << '\n';
    return 1;
  }

  std::cout << "Successfully saved crop!\n";
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  info     Show image information\n";
  std::cerr << "  crop     Crop the image and save it as OME-TIFF\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>              Path to OME-TIFF (required)\n";
  std::cerr << "\n";
  std::cerr << "Info command options:\n";
  std::cerr << "  --verbose                   Print the OME-XML\n";
  std::cerr << "\n";
  std::cerr << "Crop command options:\n";
  std::cerr << "  --x=<pixels>                Crop origin X (default: 0)\n";
  std::cerr << "  --y=<pixels>                Crop origin Y (default: 0)\n";
  std::cerr << "  --width=<pixels>            Crop width (required)\n";
  std::cerr << "  --height=<pixels>           Crop height (required)\n";
  std::cerr << "  --output=<path>             Output file (required)\n";
  std::cerr << "  --degenerate_levels=<p>     drop or fail (default: drop)\n";
  std::cerr << "  --compression=<c>           lzw, deflate or none "
               "(default: lzw)\n";
  std::cerr << "  --bigtiff                   BigTIFF output (default: true)\n";
  std::cerr << "  --threads=<n>               Decode threads (default: 0)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " info --input=slide.ome.tiff\n";
  std::cerr << "  " << program_name
            << " crop --input=slide.ome.tiff --x=10000 --y=10000 "
               "--width=5000 --height=5000 --output=crop.ome.tiff\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string input_file = absl::GetFlag(FLAGS_input);
  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "info") {
    return InfoCommand(input_file, absl::GetFlag(FLAGS_verbose));
  }
  if (command != "crop") {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  const std::string output = absl::GetFlag(FLAGS_output);
  if (output.empty()) {
    std::cerr << "Error: --output flag is required for crop\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  omeslice::SlicerOptions options;
  auto policy = omeslice::ParseDegenerateLevelPolicy(
      absl::GetFlag(FLAGS_degenerate_levels));
  if (!policy.ok()) {
    std::cerr << "Error: " << policy.status().message() << '\n';
    return 1;
  }
  options.sync.degenerate_levels = *policy;

  auto compression = ParseCompression(absl::GetFlag(FLAGS_compression));
  if (!compression.ok()) {
    std::cerr << "Error: " << compression.status().message() << '\n';
    return 1;
  }
  options.writer.compression = *compression;
  options.writer.bigtiff = absl::GetFlag(FLAGS_bigtiff);

  const uint32_t threads = absl::GetFlag(FLAGS_threads);
  if (threads > 0) {
    omeslice::ThreadPoolManager::SetThreadCount(threads);
  }

  const omeslice::CropRectangle crop{
      absl::GetFlag(FLAGS_x), absl::GetFlag(FLAGS_y),
      absl::GetFlag(FLAGS_width), absl::GetFlag(FLAGS_height)};
  return CropCommand(input_file, output, crop, options);
}

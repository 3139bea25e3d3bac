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

#include <fmt/core.h>

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidestream/slidestream.h"

// Pyramid flags (levels, plan)
ABSL_FLAG(int64_t, width, 0, "Base image width in pixels");
ABSL_FLAG(int64_t, height, 0, "Base image height in pixels");
ABSL_FLAG(int32_t, tile_size, 240, "Tile edge length in pixels");
ABSL_FLAG(int32_t, overlap, 0, "Tile overlap in pixels");
ABSL_FLAG(double, magnification, 0.0,
          "Native objective magnification (0 = unknown)");
ABSL_FLAG(double, mpp, 0.0, "Native microns per pixel (0 = unknown)");

// Plan command flags
ABSL_FLAG(int32_t, level, -1, "Pyramid level to plan on (-1 = select)");
ABSL_FLAG(int64_t, approx_width, 0, "Select the smallest level this wide");
ABSL_FLAG(double, target_magnification, 0.0,
          "Select the level closest to this magnification");
ABSL_FLAG(double, target_mpp, 0.0,
          "Select the level closest to this microns per pixel");
ABSL_FLAG(bool, prefer_higher_res, false,
          "With --target_mpp, never pick a coarser level than requested");
ABSL_FLAG(int64_t, x, 0, "Region left edge in level pixels");
ABSL_FLAG(int64_t, y, 0, "Region top edge in level pixels");
ABSL_FLAG(int64_t, region_width, 0, "Region width (0 = whole level)");
ABSL_FLAG(int64_t, region_height, 0, "Region height (0 = whole level)");
ABSL_FLAG(std::string, slide_id, "slide", "Slide id used in tile paths");
ABSL_FLAG(std::string, extension, "jpg", "Tile file extension");
ABSL_FLAG(int, focal_plane, -1, "Focal plane in tile paths (-1 = none)");

// Split command flags
ABSL_FLAG(std::string, input, "", "Path to a stored multipart body");
ABSL_FLAG(std::string, output_dir, ".", "Directory receiving the parts");
ABSL_FLAG(std::string, boundary, "", "Multipart boundary token");
ABSL_FLAG(std::string, content_type, "",
          "Response Content-Type to take the boundary from");
ABSL_FLAG(uint64_t, chunk_size,
          slidestream::multipart::FileChunkSource::kDefaultChunkSize,
          "Read size in bytes");

namespace {

using slidestream::Level;
using slidestream::PyramidDescriptor;
using slidestream::TilePlacement;
using slidestream::multipart::Bytes;
using slidestream::multipart::FileChunkSource;
using slidestream::multipart::MultipartDecoder;
using slidestream::multipart::Part;

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, double value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << std::fixed
            << std::setprecision(6) << value << '\n';
}

void PrintKeyValue(const std::string& key, int64_t value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

std::optional<double> OptionalPositive(double value) {
  if (value > 0.0) {
    return value;
  }
  return std::nullopt;
}

absl::StatusOr<PyramidDescriptor> DescriptorFromFlags() {
  return PyramidDescriptor::Create(
      absl::GetFlag(FLAGS_width), absl::GetFlag(FLAGS_height),
      absl::GetFlag(FLAGS_tile_size), absl::GetFlag(FLAGS_overlap),
      OptionalPositive(absl::GetFlag(FLAGS_magnification)),
      OptionalPositive(absl::GetFlag(FLAGS_mpp)));
}

/// Picks a level from the first selector flag that is set.
absl::StatusOr<Level> SelectLevel(const PyramidDescriptor& dzi) {
  if (const int32_t level = absl::GetFlag(FLAGS_level); level >= 0) {
    return dzi.GetLevel(level);
  }
  if (const int64_t width = absl::GetFlag(FLAGS_approx_width); width > 0) {
    return dzi.LevelApproxWidth(width);
  }
  if (const double mag = absl::GetFlag(FLAGS_target_magnification);
      mag > 0.0) {
    return dzi.LevelAtMagnification(mag);
  }
  if (const double mpp = absl::GetFlag(FLAGS_target_mpp); mpp > 0.0) {
    auto match =
        dzi.LevelAtResolution(mpp, absl::GetFlag(FLAGS_prefer_higher_res));
    if (!match.ok()) {
      return match.status();
    }
    std::cout << "Selected resolution " << match->resolution
              << " mpp (ratio to requested " << match->ratio << ")\n";
    return match->level;
  }
  return dzi.GetBaseLevel();
}

void PrintLevel(const Level& level) {
  std::cout << "\n--- Level " << level.GetLevel() << " ---\n";
  PrintKeyValue("  Dimensions",
                fmt::format("{} x {}", level.GetWidth(), level.GetHeight()),
                25);
  PrintKeyValue("  Tiles", fmt::format("{} x {} ({})", level.Cols(),
                                       level.Rows(), level.NumTiles()),
                25);
  PrintKeyValue("  Downsample Factor", level.Downsample(), 25);
  if (auto magnification = level.Magnification()) {
    PrintKeyValue("  Magnification", *magnification, 25);
  }
  if (auto resolution = level.Resolution()) {
    PrintKeyValue("  MPP", *resolution, 25);
  }
}

int LevelsCommand() {
  auto dzi_or = DescriptorFromFlags();
  if (!dzi_or.ok()) {
    std::cerr << "Error: Invalid pyramid description\n";
    std::cerr << "Status: " << dzi_or.status() << '\n';
    return 1;
  }
  const PyramidDescriptor& dzi = *dzi_or;

  PrintHeader("Pyramid");
  PrintKeyValue("Dimensions",
                fmt::format("{} x {}", dzi.GetWidth(), dzi.GetHeight()));
  PrintKeyValue("Tile Size", int64_t{dzi.GetTileSize()});
  PrintKeyValue("Tile Overlap", int64_t{dzi.GetTileOverlap()});
  PrintKeyValue("Base Level", int64_t{dzi.BaseLevel()});

  PrintHeader("Levels");
  for (const Level& level : dzi.Levels()) {
    PrintLevel(level);
  }
  std::cout << '\n';
  return 0;
}

int PlanCommand() {
  auto dzi_or = DescriptorFromFlags();
  if (!dzi_or.ok()) {
    std::cerr << "Error: Invalid pyramid description\n";
    std::cerr << "Status: " << dzi_or.status() << '\n';
    return 1;
  }
  auto level_or = SelectLevel(*dzi_or);
  if (!level_or.ok()) {
    std::cerr << "Error: Failed to select level\n";
    std::cerr << "Status: " << level_or.status() << '\n';
    return 1;
  }
  const Level& level = *level_or;
  PrintLevel(level);

  const int64_t region_width = absl::GetFlag(FLAGS_region_width);
  const int64_t region_height = absl::GetFlag(FLAGS_region_height);
  const bool whole_level = region_width <= 0 || region_height <= 0;
  const std::vector<TilePlacement> placements =
      whole_level ? level.TilePlacementsForLevel()
                  : level.TilePlacementsForRegion(
                        absl::GetFlag(FLAGS_x), absl::GetFlag(FLAGS_y),
                        region_width, region_height);

  const std::string slide_id = absl::GetFlag(FLAGS_slide_id);
  const std::string extension = absl::GetFlag(FLAGS_extension);
  const int focal_plane_flag = absl::GetFlag(FLAGS_focal_plane);
  const std::optional<int> focal_plane =
      focal_plane_flag >= 0 ? std::optional<int>(focal_plane_flag)
                            : std::nullopt;

  PrintHeader(fmt::format("Tile Placements ({})", placements.size()));
  for (const TilePlacement& placement : placements) {
    const slidestream::core::Rect& crop = placement.crop;
    std::cout << fmt::format(
        "{:<40} crop=[{}, {}, {}, {}] at ({}, {})\n",
        slidestream::pyramid::TileResourcePath(slide_id, placement.tile,
                                               extension, focal_plane),
        crop.left, crop.top, crop.right, crop.bottom,
        placement.place_point.x, placement.place_point.y);
  }
  return 0;
}

int SplitCommand(const std::string& input_file) {
  std::string boundary = absl::GetFlag(FLAGS_boundary);
  if (boundary.empty()) {
    auto boundary_or = slidestream::multipart::ParseMultipartBoundary(
        absl::GetFlag(FLAGS_content_type));
    if (!boundary_or.ok()) {
      std::cerr << "Error: Need --boundary or a multipart --content_type\n";
      std::cerr << "Status: " << boundary_or.status() << '\n';
      return 1;
    }
    boundary = *std::move(boundary_or);
  }

  auto source_or = FileChunkSource::Open(
      input_file, static_cast<size_t>(absl::GetFlag(FLAGS_chunk_size)));
  if (!source_or.ok()) {
    std::cerr << "Error: Failed to open input\n";
    std::cerr << "Status: " << source_or.status() << '\n';
    return 1;
  }
  if (auto total = (*source_or)->GetTotalSize()) {
    std::cout << "Splitting " << input_file << " (" << *total
              << " bytes, boundary '" << boundary << "')\n";
  }
  auto decoder_or =
      MultipartDecoder::Create(*std::move(source_or), boundary);
  if (!decoder_or.ok()) {
    std::cerr << "Error: Failed to create decoder\n";
    std::cerr << "Status: " << decoder_or.status() << '\n';
    return 1;
  }
  MultipartDecoder& decoder = **decoder_or;

  const fs::path output_dir = absl::GetFlag(FLAGS_output_dir);
  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "Error: Cannot create " << output_dir << ": " << ec.message()
              << '\n';
    return 1;
  }

  int64_t written = 0;
  int64_t skipped = 0;
  while (true) {
    auto part_or = decoder.NextPart();
    if (!part_or.ok()) {
      if (slidestream::core::IsFieldMissing(part_or.status())) {
        LOG(WARNING) << "Skipping part without filename: "
                     << part_or.status().message();
        ++skipped;
        continue;
      }
      LOG(ERROR) << "Failed to decode multipart body: " << part_or.status();
      return 1;
    }
    if (!part_or->has_value()) {
      break;
    }
    Part& part = **part_or;

    // Never write outside the output directory.
    const fs::path destination =
        output_dir / fs::path(part.filename).filename();
    if (fs::exists(destination)) {
      LOG(WARNING) << "Skipping existing file " << destination;
      ++skipped;
      continue;
    }
    auto size_or =
        slidestream::multipart::WritePartBody(part.body, destination);
    if (!size_or.ok()) {
      LOG(ERROR) << "Failed to write " << destination << ": "
                 << size_or.status();
      return 1;
    }
    std::cout << "Wrote " << destination.string() << " (" << *size_or
              << " bytes)\n";
    ++written;
  }

  PrintHeader("Split Summary");
  PrintKeyValue("Parts Written", written);
  PrintKeyValue("Parts Skipped", skipped);
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  levels   List the levels of a Deep Zoom pyramid\n";
  std::cerr << "  plan     Print the tiles needed for a region\n";
  std::cerr << "  split    Write each part of a multipart body to a file\n";
  std::cerr << "\n";
  std::cerr << "Pyramid options (levels, plan):\n";
  std::cerr << "  --width, --height    Base image size (required)\n";
  std::cerr << "  --tile_size=<n>      Tile size (default: 240)\n";
  std::cerr << "  --overlap=<n>        Tile overlap (default: 0)\n";
  std::cerr << "  --magnification=<m>  Native magnification\n";
  std::cerr << "  --mpp=<r>            Native microns per pixel\n";
  std::cerr << "\n";
  std::cerr << "Plan options (first selector set wins):\n";
  std::cerr << "  --level=<n>                  Explicit level\n";
  std::cerr << "  --approx_width=<px>          Smallest level this wide\n";
  std::cerr << "  --target_magnification=<m>   Level near a magnification\n";
  std::cerr << "  --target_mpp=<r>             Level near a resolution\n";
  std::cerr << "  --x, --y, --region_width, --region_height\n";
  std::cerr << "                               Region (default: whole level)\n";
  std::cerr << "\n";
  std::cerr << "Split options:\n";
  std::cerr << "  --input=<path>       Stored multipart body (required)\n";
  std::cerr << "  --boundary=<token>   Boundary, or\n";
  std::cerr << "  --content_type=<v>   Content-Type carrying the boundary\n";
  std::cerr << "  --output_dir=<dir>   Destination (default: .)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name
            << " levels --width=87647 --height=76723 --tile_size=240\n";
  std::cerr << "  " << program_name
            << " plan --width=87647 --height=76723 --mpp=0.25"
               " --target_mpp=8 --x=512 --y=418 --region_width=1212"
               " --region_height=400\n";
  std::cerr << "  " << program_name
            << " split --input=body.bin --boundary=X --output_dir=wsi_files\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  // Get command
  std::string command = argv[1];

  // Parse remaining flags
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (command == "levels") {
    return LevelsCommand();
  } else if (command == "plan") {
    return PlanCommand();
  } else if (command == "split") {
    std::string input_file = absl::GetFlag(FLAGS_input);
    if (input_file.empty()) {
      std::cerr << "Error: --input flag is required\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    return SplitCommand(input_file);
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}

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

#include "slidestream/pyramid/pyramid_descriptor.h"

#include <fmt/core.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidestream/core/errors.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace pyramid {

namespace {

/// @brief ceil(log2(n)) for n >= 1, computed exactly on integers
int32_t CeilLog2(int64_t n) {
  return static_cast<int32_t>(std::bit_width(static_cast<uint64_t>(n - 1)));
}

/// @brief floor(a / b) for b > 0, also for negative a
int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if (a % b != 0 && a < 0) {
    --q;
  }
  return q;
}

/// @brief ceil(a / b) for a >= 0, b > 0
int64_t CeilDiv(int64_t a, int64_t b) {
  return a / b + (a % b != 0 ? 1 : 0);
}

int64_t SaturatingAdd(int64_t a, int64_t b) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if (b > 0 && a > kMax - b) {
    return kMax;
  }
  if (b < 0 && a < kMin - b) {
    return kMin;
  }
  return a + b;
}

int64_t SaturatingSub(int64_t a, int64_t b) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if (b < 0 && a > kMax + b) {
    return kMax;
  }
  if (b > 0 && a < kMin + b) {
    return kMin;
  }
  return a - b;
}

/// @brief Round half to even, matching IEEE-754 default rounding
int64_t RoundHalfEven(double value) {
  return static_cast<int64_t>(std::nearbyint(value));
}

}  // namespace

// ============================================================================
// Tile
// ============================================================================

std::string Tile::ToPath() const {
  return fmt::format("{}/{}_{}", level_, col_, row_);
}

std::string Tile::ToString() const {
  return fmt::format("<Tile level:{} col:{} row:{} size:({}, {}) />", level_,
                     col_, row_, pixel_width_, pixel_height_);
}

std::string TileResourcePath(const std::string& slide_id, const Tile& tile,
                             const std::string& extension,
                             std::optional<int> focal_plane) {
  if (focal_plane.has_value()) {
    return fmt::format("{}_files/{}/{}_{}_{}.{}", slide_id, tile.GetLevel(),
                       tile.GetCol(), tile.GetRow(), *focal_plane, extension);
  }
  return fmt::format("{}_files/{}/{}_{}.{}", slide_id, tile.GetLevel(),
                     tile.GetCol(), tile.GetRow(), extension);
}

// ============================================================================
// PyramidDescriptor
// ============================================================================

PyramidDescriptor::PyramidDescriptor(int64_t width, int64_t height,
                                     int32_t tile_size, int32_t tile_overlap,
                                     std::optional<double> magnification,
                                     std::optional<double> resolution)
    : width_(width),
      height_(height),
      tile_size_(tile_size),
      tile_overlap_(tile_overlap),
      magnification_(magnification),
      resolution_(resolution),
      base_level_(CeilLog2(std::max(width, height))) {}

absl::StatusOr<PyramidDescriptor> PyramidDescriptor::Create(
    int64_t width, int64_t height, int32_t tile_size, int32_t tile_overlap,
    std::optional<double> magnification, std::optional<double> resolution) {
  if (width <= 0 || height <= 0) {
    return MAKE_STATUS(core::kInvalidArgument,
                       fmt::format("Image size must be positive, got {} x {}",
                                   width, height));
  }
  if (tile_size <= 0) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Tile size must be positive, got {}", tile_size));
  }
  if (tile_overlap < 0) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Tile overlap must not be negative, got {}", tile_overlap));
  }
  if (magnification.has_value() &&
      !(*magnification > 0.0 && std::isfinite(*magnification))) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Magnification must be positive and finite, got {}",
                    *magnification));
  }
  if (resolution.has_value() &&
      !(*resolution > 0.0 && std::isfinite(*resolution))) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Resolution must be positive and finite, got {}",
                    *resolution));
  }
  return PyramidDescriptor(width, height, tile_size, tile_overlap,
                           magnification, resolution);
}

absl::StatusOr<Level> PyramidDescriptor::GetLevel(int32_t level) const {
  if (level < 0 || level > base_level_) {
    return MAKE_STATUS(core::kOutOfRange,
                       fmt::format("Level {} out of range [0, {}]", level,
                                   base_level_));
  }
  return Level(*this, level);
}

Level PyramidDescriptor::GetBaseLevel() const {
  return Level(*this, base_level_);
}

Level PyramidDescriptor::ClampedLevel(int64_t level) const {
  return Level(*this, static_cast<int32_t>(std::clamp<int64_t>(
                          level, 0, base_level_)));
}

double PyramidDescriptor::ClampLevelDiff(double level_diff) const {
  return std::clamp(level_diff, 0.0, static_cast<double>(base_level_) + 1.0);
}

Level PyramidDescriptor::LevelApproxWidth(int64_t target_width) const {
  if (target_width >= width_) {
    return GetBaseLevel();
  }
  // Ascending scan: the first hit is the smallest sufficient level. The base
  // level always qualifies here, so the loop cannot fall through.
  for (const Level& level : Levels()) {
    if (level.GetWidth() >= target_width) {
      return level;
    }
  }
  return GetBaseLevel();
}

absl::StatusOr<Level> PyramidDescriptor::LevelAtMagnification(
    double magnification) const {
  if (!magnification_.has_value()) {
    return MAKE_STATUS(
        core::kCalibrationMissing,
        "Magnification not set on this descriptor, lookup not available");
  }
  if (!(magnification > 0.0 && std::isfinite(magnification))) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Requested magnification must be positive and finite, "
                    "got {}",
                    magnification));
  }
  if (magnification > *magnification_) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Requested magnification {} is larger than slide's max {}",
                    magnification, *magnification_));
  }
  // The ratio can overflow to infinity for tiny requests.
  const int64_t level_diff =
      RoundHalfEven(ClampLevelDiff(std::log2(*magnification_ / magnification)));
  return ClampedLevel(base_level_ - level_diff);
}

absl::StatusOr<ResolutionMatch> PyramidDescriptor::LevelAtResolution(
    double microns_per_pixel, bool prefer_higher_res) const {
  if (!resolution_.has_value()) {
    return MAKE_STATUS(
        core::kCalibrationMissing,
        "Resolution not set on this descriptor, lookup not available");
  }
  if (!(microns_per_pixel > 0.0 && std::isfinite(microns_per_pixel))) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        fmt::format("Requested resolution must be positive and finite, got {}",
                    microns_per_pixel));
  }
  const double ratio = microns_per_pixel / *resolution_;
  const double log_ratio = ClampLevelDiff(std::log2(ratio));
  int64_t level_diff = prefer_higher_res
                           ? static_cast<int64_t>(std::floor(log_ratio))
                           : RoundHalfEven(log_ratio);
  if (ratio < 1.0) {
    // No level finer than native exists; callers always get the base level.
    level_diff = 0;
  }
  Level level = ClampedLevel(base_level_ - level_diff);
  const double actual = *level.Resolution();
  return ResolutionMatch{std::move(level), actual, actual / microns_per_pixel};
}

std::string PyramidDescriptor::ToString() const {
  return fmt::format(
      "<PyramidDescriptor width:{} height:{} tile_size:{} overlap:{} "
      "base_level:{} />",
      width_, height_, tile_size_, tile_overlap_, base_level_);
}

// ============================================================================
// Level
// ============================================================================

Level::Level(const PyramidDescriptor& descriptor, int32_t level)
    : descriptor_(descriptor), level_(level) {
  const int shift = descriptor_.base_level_ - level_;
  width_ = std::max<int64_t>(1, descriptor_.width_ >> shift);
  height_ = std::max<int64_t>(1, descriptor_.height_ >> shift);
  cols_ = CeilDiv(width_, descriptor_.tile_size_);
  rows_ = CeilDiv(height_, descriptor_.tile_size_);
}

double Level::Scale() const {
  return std::ldexp(1.0, level_ - descriptor_.base_level_);
}

double Level::Downsample() const {
  return std::ldexp(1.0, descriptor_.base_level_ - level_);
}

std::optional<double> Level::Magnification() const {
  if (!descriptor_.magnification_.has_value()) {
    return std::nullopt;
  }
  return *descriptor_.magnification_ * Scale();
}

std::optional<double> Level::Resolution() const {
  if (!descriptor_.resolution_.has_value()) {
    return std::nullopt;
  }
  return *descriptor_.resolution_ * Downsample();
}

absl::StatusOr<Tile> Level::GetTile(int64_t col, int64_t row) const {
  if (col < 0 || col >= cols_) {
    return MAKE_STATUS(
        core::kOutOfRange,
        fmt::format("Column {} out of bounds for level {} ({} cols)", col,
                    level_, cols_));
  }
  if (row < 0 || row >= rows_) {
    return MAKE_STATUS(
        core::kOutOfRange,
        fmt::format("Row {} out of bounds for level {} ({} rows)", row,
                    level_, rows_));
  }
  return MakeTile(col, row);
}

Tile Level::MakeTile(int64_t col, int64_t row) const {
  const int64_t tile_size = descriptor_.tile_size_;
  const int32_t overlap = descriptor_.tile_overlap_;
  const bool last_col = col == cols_ - 1;
  const bool last_row = row == rows_ - 1;

  TileOverlap edges;
  if (overlap > 0) {
    edges.left = col == 0 ? 0 : overlap;
    edges.right = last_col ? 0 : overlap;
    edges.top = row == 0 ? 0 : overlap;
    edges.bottom = last_row ? 0 : overlap;
  }

  // The final column/row only holds the remainder of the level. A remainder
  // of 0 means the level is an exact multiple of the tile size.
  int64_t core_width = tile_size;
  if (last_col) {
    const int64_t remainder = width_ % tile_size;
    core_width = remainder == 0 ? tile_size : remainder;
  }
  int64_t core_height = tile_size;
  if (last_row) {
    const int64_t remainder = height_ % tile_size;
    core_height = remainder == 0 ? tile_size : remainder;
  }
  const int64_t pixel_width = core_width + edges.left + edges.right;
  const int64_t pixel_height = core_height + edges.top + edges.bottom;

  const core::Rect payload{0, 0, pixel_width, pixel_height};
  const core::Point crop_end =
      payload.Clip({tile_size + edges.left, tile_size + edges.top});
  const core::Rect crop{edges.left, edges.top, crop_end.x, crop_end.y};

  return Tile(level_, col, row, edges, pixel_width, pixel_height,
              {col * tile_size, row * tile_size}, crop);
}

Level::TileRange Level::RangeFor(int64_t x, int64_t y, int64_t width,
                                 int64_t height) const {
  const int64_t tile_size = descriptor_.tile_size_;
  TileRange range;
  const int64_t last_col = FloorDiv(SaturatingAdd(x, width), tile_size);
  const int64_t last_row = FloorDiv(SaturatingAdd(y, height), tile_size);
  range.col_start = std::clamp<int64_t>(FloorDiv(x, tile_size), 0, cols_);
  range.col_end = std::clamp<int64_t>(last_col, -1, cols_ - 1) + 1;
  range.row_start = std::clamp<int64_t>(FloorDiv(y, tile_size), 0, rows_);
  range.row_end = std::clamp<int64_t>(last_row, -1, rows_ - 1) + 1;
  return range;
}

std::vector<TilePlacement> Level::TilePlacementsForRegion(
    int64_t x, int64_t y, int64_t width, int64_t height) const {
  std::vector<TilePlacement> placements;
  const TileRange range = RangeFor(x, y, width, height);
  placements.reserve(static_cast<size_t>(range.Cols() * range.Rows()));

  for (const Tile& tile : TilesIntersecting(x, y, width, height)) {
    core::Point dest{SaturatingSub(tile.GetTopLeft().x, x),
                     SaturatingSub(tile.GetTopLeft().y, y)};
    core::Rect crop = tile.GetCrop();
    // Tiles starting before the region: skip the leading pixels and paste
    // at the canvas edge instead.
    if (dest.x < 0) {
      crop.left = std::min(crop.left - dest.x, crop.right);
      dest.x = 0;
    }
    if (dest.y < 0) {
      crop.top = std::min(crop.top - dest.y, crop.bottom);
      dest.y = 0;
    }
    placements.push_back(TilePlacement{tile, crop, dest});
  }
  return placements;
}

std::string Level::ToString() const {
  return fmt::format(
      "<Level level:{} cols(x):{} rows(y):{} width,height:({}, {}) />", level_,
      cols_, rows_, width_, height_);
}

}  // namespace pyramid
}  // namespace slidestream

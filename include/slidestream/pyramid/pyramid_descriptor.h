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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_PYRAMID_PYRAMID_DESCRIPTOR_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_PYRAMID_PYRAMID_DESCRIPTOR_H_

#include <algorithm>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "slidestream/core/geometry.h"

/**
 * @file pyramid_descriptor.h
 * @brief Deep Zoom (power-of-two) pyramid addressing
 *
 * A PyramidDescriptor describes an entire zoomable image. Levels are fixed
 * zoom steps: the base level is the native resolution and every lower level
 * halves both dimensions. Each level is cut into a grid of square tiles that
 * are at most tile_size pixels (plus overlap), smaller at the right and
 * bottom edges.
 *
 *   PyramidDescriptor        <-- whole image, optional calibration
 *     +---- Level            <-- one zoom step, cols x rows tiles
 *           +---- Tile       <-- fetchable unit, with its crop rectangle
 *
 * All types are immutable values. A Level carries a copy of its descriptor
 * and a Tile carries only its own geometry, so there are no back-pointers
 * and everything is safe to share between threads.
 *
 * Example:
 * @code
 * auto dzi = PyramidDescriptor::Create(87647, 76723, 240);
 * if (!dzi.ok()) return dzi.status();
 * Level level = dzi->LevelApproxWidth(2000);
 * for (const TilePlacement& p : level.TilePlacementsForRegion(512, 418,
 *                                                             1212, 400)) {
 *   // fetch p.tile, crop to p.crop, paste at p.place_point
 * }
 * @endcode
 */

namespace slidestream {
namespace pyramid {

class Level;

/// @brief Per-edge overlap of a tile, in pixels
///
/// Overlap is only present on interior edges; the outermost tiles of a level
/// have zero overlap on the image border.
struct TileOverlap {
  int32_t top = 0;
  int32_t left = 0;
  int32_t right = 0;
  int32_t bottom = 0;

  bool operator==(const TileOverlap& other) const {
    return top == other.top && left == other.left && right == other.right &&
           bottom == other.bottom;
  }
};

/// @brief A single tile within a pyramid level
///
/// Only obtainable through Level, which validates the grid position.
class Tile {
 public:
  [[nodiscard]] int32_t GetLevel() const { return level_; }
  [[nodiscard]] int64_t GetCol() const { return col_; }
  [[nodiscard]] int64_t GetRow() const { return row_; }
  [[nodiscard]] const TileOverlap& GetOverlap() const { return overlap_; }

  /// @brief Width of the raw tile payload, overlap included
  [[nodiscard]] int64_t GetPixelWidth() const { return pixel_width_; }

  /// @brief Height of the raw tile payload, overlap included
  [[nodiscard]] int64_t GetPixelHeight() const { return pixel_height_; }

  /// @brief Position of the tile in level coordinates, overlap ignored
  [[nodiscard]] const core::Point& GetTopLeft() const { return top_left_; }

  /// @brief Non-overlapping part of the payload, in tile-local coordinates
  [[nodiscard]] const core::Rect& GetCrop() const { return crop_; }

  /// @brief Relative DZI path "<level>/<col>_<row>"
  [[nodiscard]] std::string ToPath() const;

  [[nodiscard]] std::string ToString() const;

  bool operator==(const Tile& other) const {
    return level_ == other.level_ && col_ == other.col_ && row_ == other.row_;
  }
  bool operator!=(const Tile& other) const { return !(*this == other); }

 private:
  friend class Level;

  Tile(int32_t level, int64_t col, int64_t row, TileOverlap overlap,
       int64_t pixel_width, int64_t pixel_height, core::Point top_left,
       core::Rect crop)
      : level_(level),
        col_(col),
        row_(row),
        overlap_(overlap),
        pixel_width_(pixel_width),
        pixel_height_(pixel_height),
        top_left_(top_left),
        crop_(crop) {}

  int32_t level_;
  int64_t col_;
  int64_t row_;
  TileOverlap overlap_;
  int64_t pixel_width_;
  int64_t pixel_height_;
  core::Point top_left_;
  core::Rect crop_;
};

/// @brief How one fetched tile contributes to a requested region
///
/// First crop the tile payload to `crop`, then paste the result into the
/// destination canvas at `place_point`.
struct TilePlacement {
  Tile tile;                ///< Tile to fetch
  core::Rect crop;          ///< Sub-rectangle of the payload to keep
  core::Point place_point;  ///< Destination of crop's top-left corner
};

/// @brief Result of a resolution-based level lookup
struct ResolutionMatch;

/// @brief Describes an entire Deep Zoom image pyramid
class PyramidDescriptor {
 public:
  /// @brief Create a descriptor
  /// @param width Base image width in pixels (> 0)
  /// @param height Base image height in pixels (> 0)
  /// @param tile_size Tile edge length in pixels (> 0)
  /// @param tile_overlap Overlap on interior tile edges (>= 0)
  /// @param magnification Nominal magnification of the base level, if known
  /// @param resolution Microns per pixel of the base level, if known
  /// @return Descriptor, or InvalidArgument for out-of-domain inputs
  static absl::StatusOr<PyramidDescriptor> Create(
      int64_t width, int64_t height, int32_t tile_size,
      int32_t tile_overlap = 0,
      std::optional<double> magnification = std::nullopt,
      std::optional<double> resolution = std::nullopt);

  [[nodiscard]] int64_t GetWidth() const { return width_; }
  [[nodiscard]] int64_t GetHeight() const { return height_; }
  [[nodiscard]] int32_t GetTileSize() const { return tile_size_; }
  [[nodiscard]] int32_t GetTileOverlap() const { return tile_overlap_; }
  [[nodiscard]] std::optional<double> GetMagnification() const {
    return magnification_;
  }
  [[nodiscard]] std::optional<double> GetResolution() const {
    return resolution_;
  }

  /// @brief ceil(log2(max(width, height))), also the highest valid level
  [[nodiscard]] int32_t BaseLevel() const { return base_level_; }

  /// @brief Level accessor, strict
  /// @retval kOutOfRange if level is outside [0, BaseLevel()]
  [[nodiscard]] absl::StatusOr<Level> GetLevel(int32_t level) const;

  /// @brief The base (full resolution) level
  [[nodiscard]] Level GetBaseLevel() const;

  /// @brief Lazy, restartable view over levels [start, BaseLevel()], ascending
  ///
  /// A start below 0 is treated as 0; a start above BaseLevel() gives an
  /// empty view.
  [[nodiscard]] auto LevelsFrom(int32_t start) const;

  /// @brief All levels, coarsest first
  [[nodiscard]] auto Levels() const;

  /// @brief Smallest level whose width is at least target_width
  ///
  /// Returns the base level when target_width >= GetWidth().
  [[nodiscard]] Level LevelApproxWidth(int64_t target_width) const;

  /// @brief Level closest to a nominal magnification
  ///
  /// The level difference to the base is round(log2(M / magnification)).
  /// Levels that would fall below 0 are clamped to level 0.
  /// @retval kCalibrationMissing without a configured magnification
  /// @retval kInvalidArgument if magnification is not positive or exceeds
  ///         the slide's native magnification
  [[nodiscard]] absl::StatusOr<Level> LevelAtMagnification(
      double magnification) const;

  /// @brief Level closest to a resolution in microns per pixel
  ///
  /// With prefer_higher_res the level difference is floor(log2(ratio)), so
  /// the returned level is never coarser than requested. A requested
  /// resolution finer than native always maps to the base level.
  /// @retval kCalibrationMissing without a configured resolution
  /// @retval kInvalidArgument if microns_per_pixel is not positive
  [[nodiscard]] absl::StatusOr<ResolutionMatch> LevelAtResolution(
      double microns_per_pixel, bool prefer_higher_res = false) const;

  [[nodiscard]] std::string ToString() const;

  bool operator==(const PyramidDescriptor& other) const {
    return width_ == other.width_ && height_ == other.height_ &&
           tile_size_ == other.tile_size_ &&
           tile_overlap_ == other.tile_overlap_ &&
           magnification_ == other.magnification_ &&
           resolution_ == other.resolution_;
  }

 private:
  friend class Level;

  PyramidDescriptor(int64_t width, int64_t height, int32_t tile_size,
                    int32_t tile_overlap, std::optional<double> magnification,
                    std::optional<double> resolution);

  [[nodiscard]] Level ClampedLevel(int64_t level) const;
  /// Clamps a log2 level distance to [0, base_level + 1] before it is
  /// converted to an integer.
  [[nodiscard]] double ClampLevelDiff(double level_diff) const;

  int64_t width_;
  int64_t height_;
  int32_t tile_size_;
  int32_t tile_overlap_;
  std::optional<double> magnification_;
  std::optional<double> resolution_;
  int32_t base_level_;
};

/// @brief One zoom step of a PyramidDescriptor
///
/// A read-only view; cheap to rebuild from (descriptor, level).
class Level {
 public:
  [[nodiscard]] const PyramidDescriptor& GetDescriptor() const {
    return descriptor_;
  }
  [[nodiscard]] int32_t GetLevel() const { return level_; }
  [[nodiscard]] int64_t GetWidth() const { return width_; }
  [[nodiscard]] int64_t GetHeight() const { return height_; }
  [[nodiscard]] int64_t Cols() const { return cols_; }
  [[nodiscard]] int64_t Rows() const { return rows_; }
  [[nodiscard]] int64_t NumTiles() const { return cols_ * rows_; }

  /// @brief 2^(level - base), at most 1
  [[nodiscard]] double Scale() const;

  /// @brief 2^(base - level), the inverse of Scale()
  [[nodiscard]] double Downsample() const;

  /// @brief Magnification at this level, if the descriptor has one
  [[nodiscard]] std::optional<double> Magnification() const;

  /// @brief Microns per pixel at this level, if the descriptor has one
  [[nodiscard]] std::optional<double> Resolution() const;

  /// @brief Tile accessor, strict
  /// @retval kOutOfRange if col or row is outside the grid
  [[nodiscard]] absl::StatusOr<Tile> GetTile(int64_t col, int64_t row) const;

  /// @brief Tiles row by row (col varies fastest)
  [[nodiscard]] auto TilesRowMajor() const;

  /// @brief Tiles column by column (row varies fastest)
  [[nodiscard]] auto TilesColumnMajor() const;

  /// @brief Default tile order, column by column
  ///
  /// Images are usually written in stripes, so emitting by column is the
  /// faster write pattern for downstream consumers.
  [[nodiscard]] auto Tiles() const;

  /// @brief Tiles intersecting a pixel rectangle, row-major
  ///
  /// x, y is the top-left corner of the box in level pixels. The column
  /// range is [floor(x / T), floor((x + width) / T)] clipped to the grid,
  /// rows likewise.
  [[nodiscard]] auto TilesIntersecting(int64_t x, int64_t y, int64_t width,
                                       int64_t height) const;

  /// @brief Fetch, crop and paste instructions that rebuild a pixel rectangle
  ///
  /// Output order follows TilesIntersecting().
  [[nodiscard]] std::vector<TilePlacement> TilePlacementsForRegion(
      int64_t x, int64_t y, int64_t width, int64_t height) const;

  /// @brief Placements that rebuild the whole level
  [[nodiscard]] std::vector<TilePlacement> TilePlacementsForLevel() const {
    return TilePlacementsForRegion(0, 0, width_, height_);
  }

  [[nodiscard]] std::string ToString() const;

  bool operator==(const Level& other) const {
    return level_ == other.level_ && descriptor_ == other.descriptor_;
  }

 private:
  friend class PyramidDescriptor;

  Level(const PyramidDescriptor& descriptor, int32_t level);

  /// @brief Build a tile without bounds checks
  [[nodiscard]] Tile MakeTile(int64_t col, int64_t row) const;

  /// @brief Clipped [start, end) column and row ranges of a pixel box
  struct TileRange {
    int64_t col_start;
    int64_t col_end;
    int64_t row_start;
    int64_t row_end;

    [[nodiscard]] int64_t Cols() const {
      return std::max<int64_t>(0, col_end - col_start);
    }
    [[nodiscard]] int64_t Rows() const {
      return std::max<int64_t>(0, row_end - row_start);
    }
  };
  [[nodiscard]] TileRange RangeFor(int64_t x, int64_t y, int64_t width,
                                   int64_t height) const;

  PyramidDescriptor descriptor_;
  int32_t level_;
  int64_t width_;
  int64_t height_;
  int64_t cols_;
  int64_t rows_;
};

struct ResolutionMatch {
  Level level;        ///< Selected level
  double resolution;  ///< Actual microns per pixel of that level
  double ratio;       ///< resolution / requested resolution
};

/// @brief Resource path of a tile in a DZI tile service
///
/// Formats "<slide_id>_files/<level>/<col>_<row>[_<focal_plane>].<extension>".
[[nodiscard]] std::string TileResourcePath(
    const std::string& slide_id, const Tile& tile, const std::string& extension,
    std::optional<int> focal_plane = std::nullopt);

// ----------------------------------------------------------------------------
// Lazy views. Each view owns a copy of the level/descriptor it walks, so it
// stays valid after the object it was obtained from is gone, and it can be
// iterated any number of times.
// ----------------------------------------------------------------------------

inline auto PyramidDescriptor::LevelsFrom(int32_t start) const {
  const int32_t first = std::clamp(start, 0, base_level_ + 1);
  return std::views::iota(first, base_level_ + 1) |
         std::views::transform(
             [self = *this](int32_t level) { return Level(self, level); });
}

inline auto PyramidDescriptor::Levels() const {
  return LevelsFrom(0);
}

inline auto Level::TilesRowMajor() const {
  const int64_t cols = cols_;
  return std::views::iota(int64_t{0}, NumTiles()) |
         std::views::transform([self = *this, cols](int64_t index) {
           return self.MakeTile(index % cols, index / cols);
         });
}

inline auto Level::TilesColumnMajor() const {
  const int64_t rows = rows_;
  return std::views::iota(int64_t{0}, NumTiles()) |
         std::views::transform([self = *this, rows](int64_t index) {
           return self.MakeTile(index / rows, index % rows);
         });
}

inline auto Level::Tiles() const {
  return TilesColumnMajor();
}

inline auto Level::TilesIntersecting(int64_t x, int64_t y, int64_t width,
                                     int64_t height) const {
  const TileRange range = RangeFor(x, y, width, height);
  return std::views::iota(int64_t{0}, range.Cols() * range.Rows()) |
         std::views::transform([self = *this, range](int64_t index) {
           return self.MakeTile(range.col_start + index % range.Cols(),
                                range.row_start + index / range.Cols());
         });
}

}  // namespace pyramid

using pyramid::Level;
using pyramid::PyramidDescriptor;
using pyramid::ResolutionMatch;
using pyramid::Tile;
using pyramid::TilePlacement;

}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_PYRAMID_PYRAMID_DESCRIPTOR_H_

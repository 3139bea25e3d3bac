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

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>

#include "slidestream/core/errors.h"

namespace slidestream {
namespace pyramid {

namespace {

PyramidDescriptor MakeDescriptor(
    int64_t width, int64_t height, int32_t tile_size, int32_t overlap = 0,
    std::optional<double> magnification = std::nullopt,
    std::optional<double> resolution = std::nullopt) {
  auto descriptor = PyramidDescriptor::Create(width, height, tile_size, overlap,
                                              magnification, resolution);
  EXPECT_TRUE(descriptor.ok()) << descriptor.status();
  return descriptor.value();
}

template <typename View>
std::vector<Tile> Collect(View&& view) {
  std::vector<Tile> tiles;
  for (const Tile& tile : view) {
    tiles.push_back(tile);
  }
  return tiles;
}

}  // namespace

// ============================================================================
// Construction Tests
// ============================================================================

TEST(PyramidDescriptorTest, BaseLevelIsCeilLog2OfLongestSide) {
  EXPECT_EQ(MakeDescriptor(1, 1, 256).BaseLevel(), 0);
  EXPECT_EQ(MakeDescriptor(2, 1, 256).BaseLevel(), 1);
  EXPECT_EQ(MakeDescriptor(1000, 1000, 256).BaseLevel(), 10);
  EXPECT_EQ(MakeDescriptor(1024, 10, 256).BaseLevel(), 10);
  EXPECT_EQ(MakeDescriptor(10, 1025, 256).BaseLevel(), 11);
  EXPECT_EQ(MakeDescriptor(87647, 76723, 240).BaseLevel(), 17);
}

TEST(PyramidDescriptorTest, RejectsInvalidParameters) {
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(0, 100, 256).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, -1, 256).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 0).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, -1).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, 0, 0.0).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, 0, std::nullopt, -0.25)
          .status()));
}

TEST(PyramidDescriptorTest, ToString) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 500, 256, 1);
  EXPECT_EQ(dzi.ToString(),
            "<PyramidDescriptor width:1000 height:500 tile_size:256 overlap:1 "
            "base_level:10 />");
}

// ============================================================================
// Level Tests
// ============================================================================

TEST(LevelTest, BaseLevelHasNativeSize) {
  const std::vector<std::pair<int64_t, int64_t>> sizes = {
      {1, 1}, {255, 256}, {257, 3}, {1000, 1000}, {4096, 4096},
      {87647, 76723}};
  for (const auto& [width, height] : sizes) {
    const PyramidDescriptor dzi = MakeDescriptor(width, height, 256);
    const Level base = dzi.GetBaseLevel();
    EXPECT_EQ(base.GetWidth(), width);
    EXPECT_EQ(base.GetHeight(), height);

    auto lowest = dzi.GetLevel(0);
    ASSERT_TRUE(lowest.ok()) << lowest.status();
    EXPECT_LE(lowest->GetWidth(), dzi.GetTileSize());
    EXPECT_LE(lowest->GetHeight(), dzi.GetTileSize());
    EXPECT_EQ(lowest->NumTiles(), 1);
  }
}

TEST(LevelTest, DimensionsHalvePerLevel) {
  const PyramidDescriptor dzi = MakeDescriptor(87647, 76723, 240);
  auto level = dzi.GetLevel(9);
  ASSERT_TRUE(level.ok()) << level.status();
  EXPECT_EQ(level->GetWidth(), 342);
  EXPECT_EQ(level->GetHeight(), 299);
  EXPECT_EQ(level->Cols(), 2);
  EXPECT_EQ(level->Rows(), 2);
  EXPECT_DOUBLE_EQ(level->Scale(), 1.0 / 256.0);
  EXPECT_DOUBLE_EQ(level->Downsample(), 256.0);
  EXPECT_EQ(level->ToString(),
            "<Level level:9 cols(x):2 rows(y):2 width,height:(342, 299) />");
}

TEST(LevelTest, GetLevelIsStrict) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256);
  EXPECT_TRUE(core::IsOutOfRange(dzi.GetLevel(-1).status()));
  EXPECT_TRUE(core::IsOutOfRange(dzi.GetLevel(11).status()));
  EXPECT_TRUE(dzi.GetLevel(10).ok());
  EXPECT_TRUE(dzi.GetLevel(0).ok());
}

TEST(LevelTest, LevelsFromIsAscendingAndRestartable) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256);
  auto levels = dzi.LevelsFrom(8);

  std::vector<int32_t> first;
  for (const Level& level : levels) {
    first.push_back(level.GetLevel());
  }
  std::vector<int32_t> second;
  for (const Level& level : levels) {
    second.push_back(level.GetLevel());
  }
  EXPECT_EQ(first, (std::vector<int32_t>{8, 9, 10}));
  EXPECT_EQ(first, second);

  EXPECT_EQ(std::ranges::distance(dzi.Levels()), 11);
  EXPECT_EQ(std::ranges::distance(dzi.LevelsFrom(11)), 0);
  EXPECT_EQ(std::ranges::distance(dzi.LevelsFrom(-3)), 11);
}

TEST(LevelTest, ApproxWidthPicksSmallestSufficientLevel) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256);
  // Widths per level: 1 1 3 7 15 31 62 125 250 500 1000
  EXPECT_EQ(dzi.LevelApproxWidth(250).GetLevel(), 8);
  EXPECT_EQ(dzi.LevelApproxWidth(251).GetLevel(), 9);
  EXPECT_EQ(dzi.LevelApproxWidth(300).GetLevel(), 9);
  EXPECT_EQ(dzi.LevelApproxWidth(1).GetLevel(), 0);
  EXPECT_EQ(dzi.LevelApproxWidth(1000).GetLevel(), 10);
  EXPECT_EQ(dzi.LevelApproxWidth(5000).GetLevel(), 10);

  for (int64_t target = 1; target <= 1000; target += 37) {
    const Level level = dzi.LevelApproxWidth(target);
    EXPECT_GE(level.GetWidth(), target);
    if (level.GetLevel() > 0) {
      auto below = dzi.GetLevel(level.GetLevel() - 1);
      ASSERT_TRUE(below.ok());
      EXPECT_LT(below->GetWidth(), target);
    }
  }
}

// ============================================================================
// Calibration Tests
// ============================================================================

TEST(CalibrationTest, LevelAtMagnification) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256, 0, 40.0);

  auto native = dzi.LevelAtMagnification(40.0);
  ASSERT_TRUE(native.ok()) << native.status();
  EXPECT_EQ(native->GetLevel(), 10);

  auto half = dzi.LevelAtMagnification(20.0);
  ASSERT_TRUE(half.ok()) << half.status();
  EXPECT_EQ(half->GetLevel(), 9);
  EXPECT_DOUBLE_EQ(*half->Magnification(), 20.0);

  // log2(40 / 30) rounds to 0
  auto near_native = dzi.LevelAtMagnification(30.0);
  ASSERT_TRUE(near_native.ok()) << near_native.status();
  EXPECT_EQ(near_native->GetLevel(), 10);

  // Far below the coarsest level still yields level 0
  auto tiny = dzi.LevelAtMagnification(0.001);
  ASSERT_TRUE(tiny.ok()) << tiny.status();
  EXPECT_EQ(tiny->GetLevel(), 0);
}

TEST(CalibrationTest, MagnificationErrors) {
  const PyramidDescriptor calibrated = MakeDescriptor(1000, 1000, 256, 0, 40.0);
  EXPECT_TRUE(
      core::IsInvalidArgument(calibrated.LevelAtMagnification(80.0).status()));
  EXPECT_TRUE(
      core::IsInvalidArgument(calibrated.LevelAtMagnification(0.0).status()));

  const PyramidDescriptor plain = MakeDescriptor(1000, 1000, 256);
  EXPECT_TRUE(
      core::IsCalibrationMissing(plain.LevelAtMagnification(10.0).status()));
  EXPECT_TRUE(
      core::IsCalibrationMissing(plain.LevelAtResolution(1.0).status()));
}

TEST(CalibrationTest, LevelAtResolution) {
  const PyramidDescriptor dzi =
      MakeDescriptor(1000, 1000, 256, 0, std::nullopt, 0.25);

  auto native = dzi.LevelAtResolution(0.25);
  ASSERT_TRUE(native.ok()) << native.status();
  EXPECT_EQ(native->level.GetLevel(), 10);
  EXPECT_DOUBLE_EQ(native->resolution, 0.25);
  EXPECT_DOUBLE_EQ(native->ratio, 1.0);

  auto coarse = dzi.LevelAtResolution(1.0);
  ASSERT_TRUE(coarse.ok()) << coarse.status();
  EXPECT_EQ(coarse->level.GetLevel(), 8);
  EXPECT_DOUBLE_EQ(coarse->resolution, 1.0);

  // ratio 3: round(log2 3) = 2, floor(log2 3) = 1
  auto rounded = dzi.LevelAtResolution(0.75);
  ASSERT_TRUE(rounded.ok()) << rounded.status();
  EXPECT_EQ(rounded->level.GetLevel(), 8);
  auto finer = dzi.LevelAtResolution(0.75, /*prefer_higher_res=*/true);
  ASSERT_TRUE(finer.ok()) << finer.status();
  EXPECT_EQ(finer->level.GetLevel(), 9);
  EXPECT_DOUBLE_EQ(finer->resolution, 0.5);
}

TEST(CalibrationTest, ResolutionFinerThanNativeClampsToBase) {
  const PyramidDescriptor dzi =
      MakeDescriptor(1000, 1000, 256, 0, std::nullopt, 0.25);
  auto match = dzi.LevelAtResolution(0.1);
  ASSERT_TRUE(match.ok()) << match.status();
  EXPECT_EQ(match->level.GetLevel(), dzi.BaseLevel());
  EXPECT_DOUBLE_EQ(match->resolution, 0.25);
  EXPECT_DOUBLE_EQ(match->ratio, 2.5);
}

TEST(CalibrationTest, SelectionIsMonotone) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256, 0, 40.0, 0.25);

  int32_t previous = dzi.BaseLevel();
  for (double magnification = 40.0; magnification > 0.01;
       magnification *= 0.7) {
    auto level = dzi.LevelAtMagnification(magnification);
    ASSERT_TRUE(level.ok()) << level.status();
    EXPECT_LE(level->GetLevel(), previous);
    previous = level->GetLevel();
  }

  previous = dzi.BaseLevel();
  for (double mpp = 0.05; mpp < 500.0; mpp *= 1.3) {
    auto match = dzi.LevelAtResolution(mpp);
    ASSERT_TRUE(match.ok()) << match.status();
    EXPECT_LE(match->level.GetLevel(), previous);
    previous = match->level.GetLevel();
  }
}

TEST(CalibrationTest, NonFiniteValuesAreRejected) {
  constexpr double kInf = std::numeric_limits<double>::infinity();
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, 0, kInf).status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, 0, std::nullopt, kInf)
          .status()));
  EXPECT_TRUE(core::IsInvalidArgument(
      PyramidDescriptor::Create(100, 100, 256, 0, kNaN).status()));

  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256, 0, 40.0, 0.25);
  EXPECT_TRUE(core::IsInvalidArgument(dzi.LevelAtMagnification(kNaN).status()));
  EXPECT_TRUE(core::IsInvalidArgument(dzi.LevelAtResolution(kInf).status()));
  EXPECT_TRUE(
      core::IsInvalidArgument(dzi.LevelAtResolution(kInf, true).status()));
  EXPECT_TRUE(core::IsInvalidArgument(dzi.LevelAtResolution(kNaN).status()));
}

TEST(CalibrationTest, ExtremeRequestsClampToPyramid) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256, 0, 40.0, 0.25);

  // 40 / 1e-320 overflows to infinity.
  auto tiny_magnification = dzi.LevelAtMagnification(1e-320);
  ASSERT_TRUE(tiny_magnification.ok()) << tiny_magnification.status();
  EXPECT_EQ(tiny_magnification->GetLevel(), 0);

  for (const bool prefer_higher_res : {false, true}) {
    auto coarse = dzi.LevelAtResolution(1e300, prefer_higher_res);
    ASSERT_TRUE(coarse.ok()) << coarse.status();
    EXPECT_EQ(coarse->level.GetLevel(), 0);
    EXPECT_DOUBLE_EQ(coarse->resolution, 0.25 * 1024);

    auto fine = dzi.LevelAtResolution(1e-320, prefer_higher_res);
    ASSERT_TRUE(fine.ok()) << fine.status();
    EXPECT_EQ(fine->level.GetLevel(), dzi.BaseLevel());
  }
}

// ============================================================================
// Tile Tests
// ============================================================================

TEST(TileTest, EdgeTilesHoldRemainder) {
  const PyramidDescriptor dzi = MakeDescriptor(1000, 1000, 256);
  const Level base = dzi.GetBaseLevel();
  EXPECT_EQ(base.Cols(), 4);
  EXPECT_EQ(base.Rows(), 4);

  auto corner = base.GetTile(3, 3);
  ASSERT_TRUE(corner.ok()) << corner.status();
  EXPECT_EQ(corner->GetPixelWidth(), 232);
  EXPECT_EQ(corner->GetPixelHeight(), 232);
  EXPECT_EQ(corner->GetTopLeft(), (core::Point{768, 768}));
  EXPECT_EQ(corner->GetCrop(), (core::Rect{0, 0, 232, 232}));

  auto inner = base.GetTile(1, 2);
  ASSERT_TRUE(inner.ok()) << inner.status();
  EXPECT_EQ(inner->GetPixelWidth(), 256);
  EXPECT_EQ(inner->GetPixelHeight(), 256);
}

TEST(TileTest, ExactMultipleGivesFullEdgeTile) {
  const PyramidDescriptor dzi = MakeDescriptor(512, 300, 256);
  auto tile = dzi.GetBaseLevel().GetTile(1, 1);
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_EQ(tile->GetPixelWidth(), 256);
  EXPECT_EQ(tile->GetPixelHeight(), 44);
}

TEST(TileTest, GetTileIsStrict) {
  const Level base = MakeDescriptor(1000, 1000, 256).GetBaseLevel();
  EXPECT_TRUE(core::IsOutOfRange(base.GetTile(4, 0).status()));
  EXPECT_TRUE(core::IsOutOfRange(base.GetTile(0, 4).status()));
  EXPECT_TRUE(core::IsOutOfRange(base.GetTile(-1, 0).status()));
  EXPECT_TRUE(base.GetTile(3, 3).ok());
}

TEST(TileTest, OverlapOnlyOnInteriorEdges) {
  const Level base = MakeDescriptor(1000, 1000, 256, 1).GetBaseLevel();

  auto first = base.GetTile(0, 0);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first->GetOverlap(), (TileOverlap{0, 0, 1, 1}));
  EXPECT_EQ(first->GetPixelWidth(), 257);
  EXPECT_EQ(first->GetCrop(), (core::Rect{0, 0, 256, 256}));

  auto inner = base.GetTile(1, 1);
  ASSERT_TRUE(inner.ok());
  EXPECT_EQ(inner->GetOverlap(), (TileOverlap{1, 1, 1, 1}));
  EXPECT_EQ(inner->GetPixelWidth(), 258);
  EXPECT_EQ(inner->GetCrop(), (core::Rect{1, 1, 257, 257}));

  auto last = base.GetTile(3, 3);
  ASSERT_TRUE(last.ok());
  EXPECT_EQ(last->GetOverlap(), (TileOverlap{1, 1, 0, 0}));
  EXPECT_EQ(last->GetPixelWidth(), 233);
  EXPECT_EQ(last->GetCrop(), (core::Rect{1, 1, 233, 233}));
}

TEST(TileTest, CropsTileEveryLevelExactly) {
  for (const int32_t overlap : {0, 1, 4}) {
    const PyramidDescriptor dzi = MakeDescriptor(1000, 700, 128, overlap);
    for (const Level& level : dzi.Levels()) {
      int64_t area = 0;
      std::vector<core::Rect> placed;
      for (const Tile& tile : level.Tiles()) {
        const core::Rect& crop = tile.GetCrop();
        const core::Point& origin = tile.GetTopLeft();
        EXPECT_EQ(origin.x, tile.GetCol() * dzi.GetTileSize());
        EXPECT_EQ(origin.y, tile.GetRow() * dzi.GetTileSize());
        EXPECT_LE(origin.x + crop.Width(), level.GetWidth());
        EXPECT_LE(origin.y + crop.Height(), level.GetHeight());
        if (tile.GetCol() + 1 < level.Cols()) {
          EXPECT_EQ(crop.Width(), dzi.GetTileSize());
        }
        if (tile.GetRow() + 1 < level.Rows()) {
          EXPECT_EQ(crop.Height(), dzi.GetTileSize());
        }
        EXPECT_LE(crop.right, tile.GetPixelWidth());
        EXPECT_LE(crop.bottom, tile.GetPixelHeight());
        area += crop.Width() * crop.Height();

        const core::Rect footprint = core::Rect::FromBox(
            origin.x, origin.y, crop.Width(), crop.Height());
        EXPECT_FALSE(footprint.IsEmpty());
        for (const core::Rect& other : placed) {
          EXPECT_FALSE(footprint.Overlaps(other))
              << footprint << " overlaps " << other;
        }
        placed.push_back(footprint);
      }
      EXPECT_EQ(area, level.GetWidth() * level.GetHeight())
          << level.ToString() << " overlap " << overlap;
    }
  }
}

TEST(TileTest, IterationOrders) {
  const Level base = MakeDescriptor(600, 300, 256).GetBaseLevel();
  ASSERT_EQ(base.Cols(), 3);
  ASSERT_EQ(base.Rows(), 2);

  std::vector<std::pair<int64_t, int64_t>> row_major;
  for (const Tile& tile : base.TilesRowMajor()) {
    row_major.emplace_back(tile.GetCol(), tile.GetRow());
  }
  EXPECT_EQ(row_major, (std::vector<std::pair<int64_t, int64_t>>{
                           {0, 0}, {1, 0}, {2, 0}, {0, 1}, {1, 1}, {2, 1}}));

  std::vector<std::pair<int64_t, int64_t>> column_major;
  for (const Tile& tile : base.Tiles()) {
    column_major.emplace_back(tile.GetCol(), tile.GetRow());
  }
  EXPECT_EQ(column_major, (std::vector<std::pair<int64_t, int64_t>>{
                              {0, 0}, {0, 1}, {1, 0}, {1, 1}, {2, 0}, {2, 1}}));
}

TEST(TileTest, Paths) {
  auto tile = MakeDescriptor(1000, 1000, 256).GetBaseLevel().GetTile(3, 2);
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(tile->ToPath(), "10/3_2");
  EXPECT_EQ(TileResourcePath("slide", *tile, "jpg"), "slide_files/10/3_2.jpg");
  EXPECT_EQ(TileResourcePath("slide", *tile, "jpg", 0),
            "slide_files/10/3_2_0.jpg");
  EXPECT_EQ(tile->ToString(), "<Tile level:10 col:3 row:2 size:(232, 256) />");
}

// ============================================================================
// Region Tests
// ============================================================================

TEST(RegionTest, TilesIntersectingIsRowMajorAndClipped) {
  const Level base = MakeDescriptor(1000, 1000, 256).GetBaseLevel();

  const std::vector<Tile> tiles =
      Collect(base.TilesIntersecting(300, 300, 400, 100));
  ASSERT_EQ(tiles.size(), 2u);
  EXPECT_EQ(tiles[0].GetCol(), 1);
  EXPECT_EQ(tiles[0].GetRow(), 1);
  EXPECT_EQ(tiles[1].GetCol(), 2);
  EXPECT_EQ(tiles[1].GetRow(), 1);

  // Regions reaching past the level are clipped to the grid
  EXPECT_EQ(Collect(base.TilesIntersecting(-500, -500, 5000, 5000)).size(),
            16u);
  EXPECT_TRUE(Collect(base.TilesIntersecting(2000, 0, 10, 10)).empty());
}

TEST(RegionTest, TilesIntersectingIsRestartable) {
  const Level base = MakeDescriptor(1000, 1000, 256).GetBaseLevel();
  auto view = base.TilesIntersecting(100, 200, 600, 500);
  const std::vector<Tile> first = Collect(view);
  const std::vector<Tile> second = Collect(view);
  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, Collect(base.TilesIntersecting(100, 200, 600, 500)));
}

TEST(RegionTest, PlacementsCropTilesBeforeRegion) {
  const Level base = MakeDescriptor(1000, 1000, 256).GetBaseLevel();
  const std::vector<TilePlacement> placements =
      base.TilePlacementsForRegion(100, 300, 300, 100);
  ASSERT_EQ(placements.size(), 2u);

  EXPECT_EQ(placements[0].tile.GetCol(), 0);
  EXPECT_EQ(placements[0].tile.GetRow(), 1);
  EXPECT_EQ(placements[0].crop, (core::Rect{100, 44, 256, 256}));
  EXPECT_EQ(placements[0].place_point, (core::Point{0, 0}));

  EXPECT_EQ(placements[1].tile.GetCol(), 1);
  EXPECT_EQ(placements[1].tile.GetRow(), 1);
  EXPECT_EQ(placements[1].crop, (core::Rect{0, 44, 256, 256}));
  EXPECT_EQ(placements[1].place_point, (core::Point{156, 0}));
}

TEST(RegionTest, ExtremeCoordinatesSaturate) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  const Level base = MakeDescriptor(1000, 1000, 256).GetBaseLevel();

  EXPECT_EQ(Collect(base.TilesIntersecting(0, 0, kMax, kMax)).size(), 16u);
  EXPECT_TRUE(Collect(base.TilesIntersecting(kMax - 10, 0, kMax, 10)).empty());
  EXPECT_TRUE(Collect(base.TilesIntersecting(kMin, kMin, 10, 10)).empty());
  EXPECT_TRUE(Collect(base.TilesIntersecting(kMax, kMax, kMin, kMin)).empty());
  EXPECT_TRUE(base.TilePlacementsForRegion(kMin, 0, kMax, 10).empty());

  const std::vector<TilePlacement> far_left =
      base.TilePlacementsForRegion(-kMax, 0, kMax, 10);
  ASSERT_EQ(far_left.size(), 1u);
  EXPECT_EQ(far_left[0].place_point, (core::Point{kMax, 0}));
  EXPECT_EQ(far_left[0].crop, (core::Rect{0, 0, 256, 256}));
}

TEST(RegionTest, HugeLevelHasExactTileCount) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  const PyramidDescriptor dzi = MakeDescriptor(kMax, 1, 256);
  EXPECT_EQ(dzi.BaseLevel(), 63);
  const Level base = dzi.GetBaseLevel();
  EXPECT_EQ(base.Cols(), kMax / 256 + 1);
  EXPECT_EQ(base.Rows(), 1);
  auto last = base.GetTile(base.Cols() - 1, 0);
  ASSERT_TRUE(last.ok()) << last.status();
  EXPECT_EQ(last->GetPixelWidth(), kMax % 256);
}

TEST(RegionTest, PlacementsForWholeLevel) {
  auto level = MakeDescriptor(87647, 76723, 240).GetLevel(9);
  ASSERT_TRUE(level.ok());
  const std::vector<TilePlacement> placements = level->TilePlacementsForLevel();
  // The inclusive end column pulls in no extra tiles at the level border
  ASSERT_EQ(placements.size(), 4u);
  EXPECT_EQ(placements[3].tile.GetCol(), 1);
  EXPECT_EQ(placements[3].tile.GetRow(), 1);
  EXPECT_EQ(placements[3].place_point, (core::Point{240, 240}));
  EXPECT_EQ(placements[3].crop, (core::Rect{0, 0, 102, 59}));
}

}  // namespace pyramid
}  // namespace slidestream

/**
 * @file test_mosaic_builder.cpp
 * @brief VRT mosaic tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MosaicBuilder.hpp"
#include "RasterError.hpp"
#include "RasterTile.hpp"
#include "ResolutionGrouper.hpp"
#include "TestRasters.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace demforge;
using namespace demforge::test;

namespace {

MosaicBuilder::Options nearest_options(bool fallback = false) {
    MosaicBuilder::Options options;
    options.resample = ResampleAlgorithm::NEAREST;
    options.fallback_to_coarser = fallback;
    return options;
}

} // namespace

TEST(MosaicBuilderTest, LaterTileWinsWhereTilesOverlap) {
    TempDir dir;
    GridSpec left;
    GridSpec right;
    right.origin_x = left.origin_x + 2.0;

    auto a = inspect_tile(write_constant(dir.file("a.tif"), left, 1.0));
    auto b = inspect_tile(write_constant(dir.file("b.tif"), right, 2.0));

    MosaicSurface surface = MosaicBuilder(nearest_options()).build({a, b}, dir.file("m.vrt"));

    EXPECT_EQ(surface.width, 6);
    EXPECT_EQ(surface.height, 4);
    EXPECT_DOUBLE_EQ(surface.pixel_size, 1.0);
    EXPECT_EQ(surface.member_paths, (std::vector<std::string>{a.path, b.path}));
    ASSERT_TRUE(std::filesystem::exists(surface.vrt_path));

    auto values = read_band(surface.vrt_path);
    for (int col = 0; col < 6; ++col) {
        double expected = col < 2 ? 1.0 : 2.0;
        EXPECT_DOUBLE_EQ(values[col], expected) << "column " << col;
    }

    // Reversed order: the first tile now wins the overlap
    MosaicSurface reversed = MosaicBuilder(nearest_options()).build({b, a}, dir.file("r.vrt"));
    auto reversed_values = read_band(reversed.vrt_path);
    EXPECT_DOUBLE_EQ(reversed_values[2], 1.0);
    EXPECT_DOUBLE_EQ(reversed_values[3], 1.0);
    EXPECT_DOUBLE_EQ(reversed_values[4], 2.0);
}

TEST(MosaicBuilderTest, EmptyInputIsRejected) {
    TempDir dir;
    try {
        MosaicBuilder().build(std::vector<RasterTile>{}, dir.file("m.vrt"));
        FAIL() << "expected EmptyMosaicInput";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::EMPTY_MOSAIC_INPUT);
    }
    EXPECT_FALSE(std::filesystem::exists(dir.file("m.vrt")));
}

TEST(MosaicBuilderTest, BandCountMismatchIsRejected) {
    TempDir dir;
    GridSpec one_band;
    GridSpec two_bands;
    two_bands.bands = 2;

    auto a = inspect_tile(write_constant(dir.file("a.tif"), one_band, 1.0));
    auto b = inspect_tile(write_constant(dir.file("b.tif"), two_bands, 1.0));

    try {
        MosaicBuilder().build({a, b}, dir.file("m.vrt"));
        FAIL() << "expected BandCountMismatch";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::BAND_COUNT_MISMATCH);
        EXPECT_EQ(e.path(), b.path);
    }
}

TEST(MosaicBuilderTest, MixedCoordinateSystemsAreRejected) {
    TempDir dir;
    GridSpec zone12;
    GridSpec zone13;
    zone13.crs = "EPSG:26913";

    auto a = inspect_tile(write_constant(dir.file("a.tif"), zone12, 1.0));
    auto b = inspect_tile(write_constant(dir.file("b.tif"), zone13, 1.0));

    try {
        MosaicBuilder().build({a, b}, dir.file("m.vrt"));
        FAIL() << "expected CrsMismatch";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::CRS_MISMATCH);
    }
}

TEST(MosaicBuilderTest, SelectMembersUsesFinestGroupByDefault) {
    std::vector<ResolutionGroup> groups = {
        {0.5, {"fine_a.tif", "fine_b.tif"}},
        {1.0, {"mid.tif"}},
        {3.0, {"coarse.tif"}},
    };

    EXPECT_EQ(MosaicBuilder().select_members(groups),
              (std::vector<std::string>{"fine_a.tif", "fine_b.tif"}));

    EXPECT_EQ(MosaicBuilder(nearest_options(true)).select_members(groups),
              (std::vector<std::string>{"coarse.tif", "mid.tif", "fine_a.tif", "fine_b.tif"}));

    EXPECT_TRUE(MosaicBuilder().select_members({}).empty());
}

TEST(MosaicBuilderTest, FallbackFillsGapsFromCoarserTiles) {
    TempDir dir;
    GridSpec fine;                 // 4 m x 4 m at 1 m
    GridSpec coarse;               // 8 m x 8 m at 2 m
    coarse.pixel_size = 2.0;

    auto fine_tile = inspect_tile(write_constant(dir.file("fine.tif"), fine, 5.0));
    auto coarse_tile = inspect_tile(write_constant(dir.file("coarse.tif"), coarse, 9.0));
    std::vector<RasterTile> tiles = {coarse_tile, fine_tile};
    auto groups = ResolutionGrouper::group(tiles);
    ASSERT_EQ(groups.size(), 2u);

    MosaicSurface finest_only =
        MosaicBuilder(nearest_options()).build(groups, tiles, dir.file("finest.vrt"));
    EXPECT_EQ(finest_only.width, 4);
    EXPECT_EQ(finest_only.height, 4);
    EXPECT_EQ(finest_only.member_paths, std::vector<std::string>{fine_tile.path});

    MosaicSurface stacked =
        MosaicBuilder(nearest_options(true)).build(groups, tiles, dir.file("stacked.vrt"));
    EXPECT_EQ(stacked.width, 8);
    EXPECT_EQ(stacked.height, 8);
    EXPECT_DOUBLE_EQ(stacked.pixel_size, 1.0);

    auto values = read_band(stacked.vrt_path);
    EXPECT_DOUBLE_EQ(values[0], 5.0);           // Fine tile on top
    EXPECT_DOUBLE_EQ(values[3 * 8 + 3], 5.0);
    EXPECT_DOUBLE_EQ(values[7 * 8 + 7], 9.0);   // Gap filled from the coarse tile
    EXPECT_DOUBLE_EQ(values[0 * 8 + 6], 9.0);
}

TEST(MosaicBuilderTest, ExplicitResolutionOverridesFinest) {
    TempDir dir;
    GridSpec spec;
    auto tile = inspect_tile(write_constant(dir.file("a.tif"), spec, 3.0));

    MosaicBuilder::Options options = nearest_options();
    options.resolution = 2.0;
    MosaicSurface surface = MosaicBuilder(options).build({tile}, dir.file("m.vrt"));

    EXPECT_DOUBLE_EQ(surface.pixel_size, 2.0);
    EXPECT_EQ(surface.width, 2);
    EXPECT_EQ(surface.height, 2);
}

TEST(MosaicBuilderTest, UninspectedGroupMemberIsRejected) {
    TempDir dir;
    std::vector<ResolutionGroup> groups = {{1.0, {"never_inspected.tif"}}};
    try {
        MosaicBuilder().build(groups, {}, dir.file("m.vrt"));
        FAIL() << "expected InvalidArgument";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::INVALID_ARGUMENT);
    }
}

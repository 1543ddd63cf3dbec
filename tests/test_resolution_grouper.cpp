/**
 * @file test_resolution_grouper.cpp
 * @brief Resolution grouping tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ResolutionGrouper.hpp"
#include "RasterError.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace demforge;

namespace {

RasterTile make_tile(const std::string& path, double resolution) {
    RasterTile tile;
    tile.path = path;
    tile.resolution = resolution;
    return tile;
}

} // namespace

TEST(ResolutionGrouperTest, GroupsAreOrderedFinestFirst) {
    auto groups = ResolutionGrouper::group({
        make_tile("c.tif", 10.0),
        make_tile("a.tif", 0.5),
        make_tile("b.tif", 1.0),
    });

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_DOUBLE_EQ(groups[0].resolution, 0.5);
    EXPECT_DOUBLE_EQ(groups[1].resolution, 1.0);
    EXPECT_DOUBLE_EQ(groups[2].resolution, 10.0);
}

TEST(ResolutionGrouperTest, EveryTileLandsInExactlyOneGroup) {
    std::vector<RasterTile> tiles;
    for (int i = 0; i < 12; ++i) {
        tiles.push_back(make_tile("tile_" + std::to_string(i) + ".tif", (i % 3 + 1) * 0.5));
    }

    auto groups = ResolutionGrouper::group(tiles);

    std::vector<std::string> seen;
    for (const auto& group : groups) {
        seen.insert(seen.end(), group.tile_paths.begin(), group.tile_paths.end());
    }
    ASSERT_EQ(seen.size(), tiles.size());
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(std::adjacent_find(seen.begin(), seen.end()), seen.end());
    EXPECT_EQ(groups.size(), 3u);
}

TEST(ResolutionGrouperTest, TilesWithinAGroupKeepInputOrder) {
    auto groups = ResolutionGrouper::group({
        make_tile("first.tif", 1.0),
        make_tile("coarse.tif", 3.0),
        make_tile("second.tif", 1.0),
        make_tile("third.tif", 1.0),
    });

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].tile_paths,
              (std::vector<std::string>{"first.tif", "second.tif", "third.tif"}));
    EXPECT_EQ(groups[1].tile_paths, std::vector<std::string>{"coarse.tif"});
}

TEST(ResolutionGrouperTest, FloatingPointNoiseDoesNotSplitGroups) {
    ResolutionGrouper grouper;
    grouper.add("a.tif", 0.1 * 3.0);
    grouper.add("b.tif", 0.3);

    ASSERT_EQ(grouper.groups().size(), 1u);
    EXPECT_EQ(grouper.groups()[0].tile_paths.size(), 2u);
    EXPECT_EQ(grouper.tile_count(), 2u);
}

TEST(ResolutionGrouperTest, CustomToleranceMergesNearbyResolutions) {
    ResolutionGrouper strict;
    strict.add("a.tif", 1.0);
    strict.add("b.tif", 1.01);
    EXPECT_EQ(strict.groups().size(), 2u);

    ResolutionGrouper loose(0.05);
    loose.add("a.tif", 1.0);
    loose.add("b.tif", 1.01);
    EXPECT_EQ(loose.groups().size(), 1u);
}

TEST(ResolutionGrouperTest, EmptyInputGivesNoGroups) {
    ResolutionGrouper grouper;
    EXPECT_TRUE(grouper.empty());
    EXPECT_TRUE(ResolutionGrouper::group({}).empty());
}

TEST(ResolutionGrouperTest, InvalidResolutionIsRejected) {
    ResolutionGrouper grouper;
    for (double bad : {0.0, -1.0, std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity()}) {
        try {
            grouper.add("bad.tif", bad);
            FAIL() << "accepted resolution " << bad;
        } catch (const RasterError& e) {
            EXPECT_EQ(e.code(), RasterErrorCode::INVALID_ARGUMENT);
            EXPECT_EQ(e.path(), "bad.tif");
        }
    }
    EXPECT_TRUE(grouper.empty());
}

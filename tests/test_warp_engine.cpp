/**
 * @file test_warp_engine.cpp
 * @brief Clip and reprojection tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "WarpEngine.hpp"
#include "AoiBounds.hpp"
#include "GdalUtils.hpp"
#include "RasterError.hpp"
#include "TestRasters.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <iomanip>

using namespace demforge;
using namespace demforge::test;

namespace {

WarpConfig nearest_config() {
    WarpConfig config;
    config.resample = ResampleAlgorithm::NEAREST;
    return config;
}

std::vector<double> ramp(int width, int height) {
    std::vector<double> values;
    for (int i = 0; i < width * height; ++i) {
        values.push_back(100.0 + i);
    }
    return values;
}

std::string utm_wkt() {
    return to_wkt(make_spatial_reference("EPSG:26912", "test"));
}

Extent geographic(const Extent& utm) {
    return transform_bounds(utm, "EPSG:26912", "EPSG:4326");
}

// GeoJSON polygon in WGS84 longitude/latitude
std::string write_aoi(const std::string& path, const Extent& bounds) {
    std::ofstream out(path, std::ios::trunc);
    out << std::setprecision(17)
        << "{\"type\":\"FeatureCollection\",\"features\":[{\"type\":\"Feature\","
        << "\"properties\":{},\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[["
        << "[" << bounds.min_x << "," << bounds.min_y << "],"
        << "[" << bounds.max_x << "," << bounds.min_y << "],"
        << "[" << bounds.max_x << "," << bounds.max_y << "],"
        << "[" << bounds.min_x << "," << bounds.max_y << "],"
        << "[" << bounds.min_x << "," << bounds.min_y << "]]]}}]}";
    return path;
}

class WarpEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = write_raster(dir_.file("source.tif"), spec_, ramp(spec_.width, spec_.height));
    }

    // Columns 1-2, rows 1-2 of the source grid
    Extent inner_window() const {
        return Extent(spec_.origin_x + 1, spec_.origin_y - 3,
                      spec_.origin_x + 3, spec_.origin_y - 1);
    }

    TempDir dir_;
    GridSpec spec_;
    std::string source_;
};

} // namespace

TEST_F(WarpEngineTest, NoClipKeepsTheSourceGrid) {
    WarpedRaster result = WarpEngine(nearest_config()).warp(source_, dir_.file("out.tif"));

    EXPECT_EQ(result.width, spec_.width);
    EXPECT_EQ(result.height, spec_.height);
    EXPECT_DOUBLE_EQ(result.pixel_size_x, 1.0);
    EXPECT_DOUBLE_EQ(result.pixel_size_y, -1.0);
    EXPECT_EQ(read_band(result.path), ramp(spec_.width, spec_.height));
}

TEST_F(WarpEngineTest, ClipToFullExtentMatchesNoClip) {
    WarpConfig config = nearest_config();
    config.clip_bounds = Extent(spec_.origin_x, spec_.origin_y - spec_.height,
                                spec_.origin_x + spec_.width, spec_.origin_y);

    WarpedRaster clipped = WarpEngine(config).warp(source_, dir_.file("clipped.tif"));
    WarpedRaster unclipped = WarpEngine(nearest_config()).warp(source_, dir_.file("plain.tif"));

    EXPECT_EQ(clipped.width, unclipped.width);
    EXPECT_EQ(clipped.height, unclipped.height);
    EXPECT_EQ(clipped.extent, unclipped.extent);
    EXPECT_EQ(read_band(clipped.path), read_band(unclipped.path));
}

TEST_F(WarpEngineTest, ClipBoundsSelectTheRequestedWindow) {
    WarpConfig config = nearest_config();
    // Columns 1-2, rows 1-2
    config.clip_bounds = Extent(spec_.origin_x + 1, spec_.origin_y - 3,
                                spec_.origin_x + 3, spec_.origin_y - 1);

    WarpedRaster result = WarpEngine(config).warp(source_, dir_.file("window.tif"));

    ASSERT_EQ(result.width, 2);
    ASSERT_EQ(result.height, 2);
    auto values = read_band(result.path);
    EXPECT_DOUBLE_EQ(values[0], 100.0 + 1 * 4 + 1);
    EXPECT_DOUBLE_EQ(values[1], 100.0 + 1 * 4 + 2);
    EXPECT_DOUBLE_EQ(values[2], 100.0 + 2 * 4 + 1);
    EXPECT_DOUBLE_EQ(values[3], 100.0 + 2 * 4 + 2);
}

TEST_F(WarpEngineTest, EpsgCodeAndWktAreEquivalent) {
    WarpConfig by_code = nearest_config();
    by_code.target_crs = "EPSG:26912";
    WarpConfig by_wkt = nearest_config();
    by_wkt.target_crs = to_wkt(make_spatial_reference("EPSG:26912", "test"));

    WarpedRaster a = WarpEngine(by_code).warp(source_, dir_.file("code.tif"));
    WarpedRaster b = WarpEngine(by_wkt).warp(source_, dir_.file("wkt.tif"));

    EXPECT_EQ(a.width, b.width);
    EXPECT_EQ(a.height, b.height);
    EXPECT_EQ(a.extent, b.extent);
    EXPECT_EQ(read_band(a.path), read_band(b.path));
}

TEST_F(WarpEngineTest, ReprojectsToGeographic) {
    WarpConfig config = nearest_config();
    config.target_crs = "EPSG:4326";

    WarpedRaster result = WarpEngine(config).warp(source_, dir_.file("geo.tif"));

    ASSERT_FALSE(result.crs_wkt.empty());
    OGRSpatialReference srs;
    ASSERT_EQ(srs.importFromWkt(result.crs_wkt.c_str()), OGRERR_NONE);
    EXPECT_TRUE(srs.IsGeographic());
    EXPECT_GT(result.width, 0);
    // UTM zone 12 near the central meridian
    EXPECT_GT(result.extent.min_x, -114.0);
    EXPECT_LT(result.extent.max_x, -110.0);
}

TEST_F(WarpEngineTest, InvalidTargetCrsIsAReprojectionError) {
    WarpConfig config = nearest_config();
    config.target_crs = "NOT_A_CRS";

    try {
        WarpEngine(config).warp(source_, dir_.file("out.tif"));
        FAIL() << "expected ReprojectionError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::REPROJECTION_ERROR);
    }
}

TEST_F(WarpEngineTest, SourceWithoutCrsCannotBeReprojected) {
    GridSpec bare = spec_;
    bare.crs.clear();
    std::string path = write_constant(dir_.file("bare.tif"), bare, 1.0);

    WarpConfig config = nearest_config();
    config.target_crs = "EPSG:4326";
    try {
        WarpEngine(config).warp(path, dir_.file("out.tif"));
        FAIL() << "expected ReprojectionError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::REPROJECTION_ERROR);
        EXPECT_EQ(e.path(), path);
    }
}

TEST_F(WarpEngineTest, RecordsResamplingInMetadata) {
    WarpConfig config = nearest_config();
    config.resample = ResampleAlgorithm::CUBIC;

    WarpedRaster result = WarpEngine(config).warp(source_, dir_.file("meta.tif"));

    auto dataset = open_raster(result.path, false, "test");
    const char* value = dataset->GetMetadataItem("DEMFORGE_RESAMPLING");
    ASSERT_NE(value, nullptr);
    EXPECT_STREQ(value, "cubic");
}

TEST_F(WarpEngineTest, ClipBoundsInTheOutputCrsAreUnchanged) {
    WarpConfig config = nearest_config();
    config.clip_bounds = Extent(spec_.origin_x, spec_.origin_y - spec_.height,
                                spec_.origin_x + spec_.width, spec_.origin_y);
    config.clip_bounds_crs = "EPSG:26912";

    auto bounds = WarpEngine(config).resolve_clip_bounds(utm_wkt());

    ASSERT_TRUE(bounds.has_value());
    EXPECT_NEAR(bounds->min_x, spec_.origin_x, 1e-6);
    EXPECT_NEAR(bounds->max_y, spec_.origin_y, 1e-6);
}

TEST_F(WarpEngineTest, GeographicClipBoundsAreTransformedToTheOutputCrs) {
    WarpConfig config = nearest_config();
    config.clip_bounds = geographic(inner_window());
    config.clip_bounds_crs = "EPSG:4326";

    auto bounds = WarpEngine(config).resolve_clip_bounds(utm_wkt());

    ASSERT_TRUE(bounds.has_value());
    // Grid convergence widens the round trip by a few centimetres
    const Extent window = inner_window();
    EXPECT_NEAR(bounds->min_x, window.min_x, 0.1);
    EXPECT_NEAR(bounds->min_y, window.min_y, 0.1);
    EXPECT_NEAR(bounds->max_x, window.max_x, 0.1);
    EXPECT_NEAR(bounds->max_y, window.max_y, 0.1);
}

TEST_F(WarpEngineTest, ClipBoundsAreReadInTheTargetCrs) {
    const Extent full = geographic(Extent(spec_.origin_x, spec_.origin_y - spec_.height,
                                          spec_.origin_x + spec_.width, spec_.origin_y));
    // Western half of the footprint, in degrees
    const Extent west(full.min_x, full.min_y, (full.min_x + full.max_x) / 2.0, full.max_y);

    WarpConfig config = nearest_config();
    config.target_crs = "EPSG:4326";
    config.clip_bounds = west;

    WarpedRaster result = WarpEngine(config).warp(source_, dir_.file("west.tif"));

    OGRSpatialReference srs;
    ASSERT_EQ(srs.importFromWkt(result.crs_wkt.c_str()), OGRERR_NONE);
    EXPECT_TRUE(srs.IsGeographic());
    EXPECT_GT(result.width, 0);
    EXPECT_GT(result.height, 0);
    EXPECT_NEAR(result.extent.min_x, west.min_x, 1e-9);
    EXPECT_NEAR(result.extent.min_y, west.min_y, 1e-9);
    EXPECT_NEAR(result.extent.max_x, west.max_x, 1e-9);
    EXPECT_NEAR(result.extent.max_y, west.max_y, 1e-9);
}

TEST_F(WarpEngineTest, GeographicAoiIsResolvedInTheOutputCrs) {
    const Extent window = inner_window();
    std::string aoi = write_aoi(dir_.file("aoi.geojson"), geographic(window));

    WarpConfig config = nearest_config();
    config.aoi_path = aoi;

    auto bounds = WarpEngine(config).resolve_clip_bounds(utm_wkt());
    ASSERT_TRUE(bounds.has_value());
    EXPECT_NEAR(bounds->min_x, window.min_x, 0.1);
    EXPECT_NEAR(bounds->min_y, window.min_y, 0.1);
    EXPECT_NEAR(bounds->max_x, window.max_x, 0.1);
    EXPECT_NEAR(bounds->max_y, window.max_y, 0.1);

    WarpedRaster result = WarpEngine(config).warp(source_, dir_.file("aoi.tif"));
    EXPECT_EQ(result.width, 2);
    EXPECT_EQ(result.height, 2);
}

TEST_F(WarpEngineTest, UnwritableOutputIsAResampleError) {
    // A regular file where the output directory should be
    std::string blocker = write_constant(dir_.file("blocker.tif"), spec_, 0.0);

    try {
        WarpEngine(nearest_config()).warp(source_, blocker + "/out.tif");
        FAIL() << "expected ResampleError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::RESAMPLE_ERROR);
    }
}

TEST_F(WarpEngineTest, ZeroAreaClipIsRejected) {
    WarpConfig config = nearest_config();
    config.clip_bounds = Extent(spec_.origin_x, spec_.origin_y - 2,
                                spec_.origin_x, spec_.origin_y);

    try {
        WarpEngine(config).warp(source_, dir_.file("out.tif"));
        FAIL() << "expected InvalidArgument";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::INVALID_ARGUMENT);
    }
}

TEST_F(WarpEngineTest, MissingSourceIsARasterIoError) {
    try {
        WarpEngine(nearest_config()).warp(dir_.file("missing.tif"), dir_.file("out.tif"));
        FAIL() << "expected RasterIOError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::RASTER_IO_ERROR);
    }
}

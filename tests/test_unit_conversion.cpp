/**
 * @file test_unit_conversion.cpp
 * @brief In-place unit conversion tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "UnitConversion.hpp"
#include "CancellationToken.hpp"
#include "RasterError.hpp"
#include "TestRasters.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace demforge;
using namespace demforge::test;

namespace {

constexpr double NODATA = -9999.0;

ConversionConfig config_for(const std::string& path, double factor) {
    ConversionConfig config;
    config.raster_path = path;
    config.factor = factor;
    return config;
}

} // namespace

TEST(UnitConversionTest, ScalesValidCellsAndLeavesNodata) {
    TempDir dir;
    GridSpec spec;
    spec.width = 3;
    spec.height = 3;
    spec.nodata = NODATA;
    std::vector<double> values = {1, 2, 3, 4, NODATA, 6, 7, 8, 9};
    std::string path = write_raster(dir.file("dem.tif"), spec, values);

    ConversionStats stats = UnitConversion(config_for(path, 3.28084)).run();

    EXPECT_EQ(stats.windows, 1u);
    EXPECT_EQ(stats.converted_cells, 8u);
    EXPECT_EQ(stats.nodata_cells, 1u);

    auto converted = read_band(path);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] == NODATA) {
            EXPECT_EQ(converted[i], NODATA);
        } else {
            EXPECT_NEAR(converted[i], values[i] * 3.28084, 1e-4) << "cell " << i;
        }
    }
    EXPECT_EQ(read_nodata(path), NODATA);
}

TEST(UnitConversionTest, InverseFactorRestoresValues) {
    TempDir dir;
    GridSpec spec;
    spec.type = GDT_Float64;
    spec.width = 5;
    spec.height = 5;
    std::vector<double> values;
    for (int i = 0; i < 25; ++i) {
        values.push_back(1500.0 + i * 0.25);
    }
    std::string path = write_raster(dir.file("dem.tif"), spec, values);

    const double factor = 1.0 / 0.3048;
    UnitConversion(config_for(path, factor)).run();
    UnitConversion(config_for(path, 1.0 / factor)).run();

    auto restored = read_band(path);
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_NEAR(restored[i], values[i], 1e-9);
    }
}

TEST(UnitConversionTest, SmallWindowsCoverTheWholeRaster) {
    TempDir dir;
    GridSpec spec;
    spec.width = 5;
    spec.height = 3;
    std::string path = write_constant(dir.file("dem.tif"), spec, 2.0);

    ConversionConfig config = config_for(path, 0.5);
    config.window_size = 2;
    ConversionStats stats = UnitConversion(config).run();

    EXPECT_EQ(stats.windows, 6u);   // 3 columns x 2 rows of windows
    EXPECT_EQ(stats.converted_cells, 15u);
    for (double value : read_band(path)) {
        EXPECT_DOUBLE_EQ(value, 1.0);
    }
}

TEST(UnitConversionTest, ThinRasterUsesAThinWindow) {
    TempDir dir;
    GridSpec spec;
    spec.width = 300;
    spec.height = 2;
    std::string path = write_constant(dir.file("strip.tif"), spec, 4.0);

    ConversionConfig config = config_for(path, 0.25);
    config.window_size = 1000;
    ConversionStats stats = UnitConversion(config).run();

    EXPECT_EQ(stats.windows, 1u);
    EXPECT_EQ(stats.buffer_cells, 600u);
    EXPECT_EQ(stats.converted_cells, 600u);
    for (double value : read_band(path)) {
        EXPECT_DOUBLE_EQ(value, 1.0);
    }
}

TEST(UnitConversionTest, NanCellsAreLeftAlone) {
    TempDir dir;
    GridSpec spec;
    spec.width = 2;
    spec.height = 1;
    std::string path = write_raster(dir.file("dem.tif"), spec,
                                    {std::numeric_limits<double>::quiet_NaN(), 4.0});

    ConversionStats stats = UnitConversion(config_for(path, 2.0)).run();

    EXPECT_EQ(stats.nodata_cells, 1u);
    auto values = read_band(path);
    EXPECT_TRUE(std::isnan(values[0]));
    EXPECT_DOUBLE_EQ(values[1], 8.0);
}

TEST(UnitConversionTest, CancelledBeforeFirstWindowChangesNothing) {
    TempDir dir;
    GridSpec spec;
    std::string path = write_constant(dir.file("dem.tif"), spec, 10.0);

    CancellationToken cancel;
    cancel.cancel();
    try {
        UnitConversion(config_for(path, 3.0)).run(&cancel);
        FAIL() << "expected Cancelled";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::CANCELLED);
    }

    for (double value : read_band(path)) {
        EXPECT_DOUBLE_EQ(value, 10.0);
    }
}

TEST(UnitConversionTest, InvalidArgumentsAreRejected) {
    TempDir dir;
    GridSpec spec;
    std::string path = write_constant(dir.file("dem.tif"), spec, 1.0);

    ConversionConfig zero_factor = config_for(path, 0.0);
    ConversionConfig zero_window = config_for(path, 2.0);
    zero_window.window_size = 0;
    ConversionConfig bad_band = config_for(path, 2.0);
    bad_band.band = 3;

    for (const auto& config : {zero_factor, zero_window, bad_band}) {
        try {
            UnitConversion(config).run();
            FAIL() << "expected InvalidArgument";
        } catch (const RasterError& e) {
            EXPECT_EQ(e.code(), RasterErrorCode::INVALID_ARGUMENT);
        }
    }
}

TEST(UnitConversionTest, MissingRasterIsARasterIoError) {
    TempDir dir;
    try {
        UnitConversion(config_for(dir.file("missing.tif"), 2.0)).run();
        FAIL() << "expected RasterIOError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::RASTER_IO_ERROR);
    }
}

/**
 * @file test_profile_sampler.cpp
 * @brief Elevation profile sampling tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ProfileSampler.hpp"
#include "GdalUtils.hpp"
#include "RasterError.hpp"
#include "TestRasters.hpp"
#include <gtest/gtest.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

using namespace demforge;
using namespace demforge::test;

namespace {

using Vertices = std::vector<std::pair<double, double>>;

struct LineSpec {
    std::string name;
    Vertices vertices;
    std::string type = "LineString";
};

std::string coordinates(const Vertices& vertices) {
    std::ostringstream text;
    text << std::setprecision(17) << "[";
    for (size_t i = 0; i < vertices.size(); ++i) {
        text << (i ? ", " : "") << "[" << vertices[i].first << ", " << vertices[i].second << "]";
    }
    text << "]";
    return text.str();
}

// GeoJSON lines; `crs` empty means the GeoJSON default (WGS84 longitude/latitude)
std::string write_lines(const std::string& path, const std::vector<LineSpec>& lines,
                        const std::string& crs = "urn:ogc:def:crs:EPSG::26912") {
    std::ofstream file(path);
    file << "{\"type\": \"FeatureCollection\",\n";
    if (!crs.empty()) {
        file << " \"crs\": {\"type\": \"name\", \"properties\": {\"name\": \"" << crs << "\"}},\n";
    }
    file << " \"features\": [\n";
    for (size_t i = 0; i < lines.size(); ++i) {
        const LineSpec& line = lines[i];
        std::string geometry = line.type == "Point"
            ? coordinates(line.vertices).substr(1, coordinates(line.vertices).size() - 2)
            : coordinates(line.vertices);
        file << "  {\"type\": \"Feature\", \"properties\": {\"name\": \"" << line.name
             << "\"}, \"geometry\": {\"type\": \"" << line.type << "\", \"coordinates\": "
             << geometry << "}}" << (i + 1 < lines.size() ? "," : "") << "\n";
    }
    file << " ]}\n";
    return path;
}

class ProfileSamplerTest : public ::testing::Test {
protected:
    // 10x10 west-to-east ramp: column c holds c + 0.5
    std::string write_ramp(std::optional<int> nodata_column = std::nullopt) const {
        GridSpec spec;
        spec.width = 10;
        spec.height = 10;
        if (nodata_column) {
            spec.nodata = -9999.0;
        }
        std::vector<double> values;
        for (int row = 0; row < spec.height; ++row) {
            for (int col = 0; col < spec.width; ++col) {
                values.push_back(nodata_column && col == *nodata_column ? -9999.0 : col + 0.5);
            }
        }
        return write_raster(dir_.file("ramp.tif"), spec, values);
    }

    ProfileConfig config_for(const std::string& lines, const std::string& dem, double step) const {
        ProfileConfig config;
        config.lines_path = lines;
        config.dem_path = dem;
        config.output_path = dir_.file("profiles.csv");
        config.step = step;
        return config;
    }

    // Row 4, pixel centers of columns 0 to 8
    static LineSpec straight_line(const std::string& name) {
        return LineSpec{name, {{400000.5, 4499995.5}, {400008.5, 4499995.5}}};
    }

    TempDir dir_;
};

std::vector<double> distances(const ElevationProfile& profile) {
    std::vector<double> values;
    for (const auto& sample : profile.samples) {
        values.push_back(sample.distance);
    }
    return values;
}

} // namespace

TEST_F(ProfileSamplerTest, StraightLineIsSampledEveryStep) {
    auto lines = write_lines(dir_.file("lines.geojson"), {straight_line("A")});
    auto report = ProfileSampler(config_for(lines, write_ramp(), 2.0)).run();

    ASSERT_EQ(report.success_count(), 1u);
    const ElevationProfile& profile = report.entries()[0].result.value();
    EXPECT_EQ(distances(profile), (std::vector<double>{0.0, 2.0, 4.0, 6.0, 8.0}));
    EXPECT_DOUBLE_EQ(profile.length, 8.0);
    for (const auto& sample : profile.samples) {
        EXPECT_DOUBLE_EQ(sample.elevation, sample.distance + 0.5);
        EXPECT_DOUBLE_EQ(sample.y, 4499995.5);
    }
}

TEST_F(ProfileSamplerTest, DistanceAccumulatesAcrossSegments) {
    LineSpec bent{"bent", {{400000.5, 4499995.5}, {400004.5, 4499995.5}, {400004.5, 4499998.5}}};
    auto lines = write_lines(dir_.file("lines.geojson"), {bent});
    auto report = ProfileSampler(config_for(lines, write_ramp(), 2.0)).run();

    ASSERT_EQ(report.success_count(), 1u);
    const ElevationProfile& profile = report.entries()[0].result.value();
    ASSERT_EQ(profile.samples.size(), 5u);

    const std::vector<std::pair<double, double>> expected = {
        {0.0, 0.5}, {2.0, 2.5}, {4.0, 4.5}, {6.0, 4.5}, {7.0, 4.5}};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_DOUBLE_EQ(profile.samples[i].distance, expected[i].first) << i;
        EXPECT_DOUBLE_EQ(profile.samples[i].elevation, expected[i].second) << i;
    }
    EXPECT_DOUBLE_EQ(profile.samples.back().y, 4499998.5);
    EXPECT_DOUBLE_EQ(profile.length, 7.0);
}

TEST_F(ProfileSamplerTest, NodataSamplesAreDropped) {
    auto lines = write_lines(dir_.file("lines.geojson"), {straight_line("A")});
    auto report = ProfileSampler(config_for(lines, write_ramp(4), 2.0)).run();

    ASSERT_EQ(report.success_count(), 1u);
    EXPECT_EQ(distances(report.entries()[0].result.value()),
              (std::vector<double>{0.0, 2.0, 6.0, 8.0}));
}

TEST_F(ProfileSamplerTest, SamplesOutsideTheDemAreDropped) {
    LineSpec overshoot{"long", {{400000.5, 4499995.5}, {400014.5, 4499995.5}}};
    auto lines = write_lines(dir_.file("lines.geojson"), {overshoot});
    auto report = ProfileSampler(config_for(lines, write_ramp(), 4.0)).run();

    ASSERT_EQ(report.success_count(), 1u);
    const ElevationProfile& profile = report.entries()[0].result.value();
    EXPECT_EQ(distances(profile), (std::vector<double>{0.0, 4.0, 8.0}));
    EXPECT_DOUBLE_EQ(profile.length, 14.0);
}

TEST_F(ProfileSamplerTest, GeographicLinesAreReprojectedIntoTheDemCrs) {
    OGRSpatialReference utm = make_spatial_reference("EPSG:26912", "test");
    OGRSpatialReference wgs84 = make_spatial_reference("EPSG:4326", "test");
    CoordinateTransformationPtr to_geographic(OGRCreateCoordinateTransformation(&utm, &wgs84));
    ASSERT_TRUE(to_geographic);

    Vertices vertices = straight_line("A").vertices;
    for (auto& vertex : vertices) {
        ASSERT_TRUE(to_geographic->Transform(1, &vertex.first, &vertex.second));
    }
    auto lines = write_lines(dir_.file("lines.geojson"), {LineSpec{"A", vertices}}, "");
    auto report = ProfileSampler(config_for(lines, write_ramp(), 2.0)).run();

    ASSERT_EQ(report.success_count(), 1u);
    const ElevationProfile& profile = report.entries()[0].result.value();
    ASSERT_GE(profile.samples.size(), 5u);
    EXPECT_NEAR(profile.samples.front().x, 400000.5, 1e-3);
    EXPECT_NEAR(profile.samples.front().y, 4499995.5, 1e-3);
    EXPECT_DOUBLE_EQ(profile.samples.front().elevation, 0.5);
    EXPECT_NEAR(profile.length, 8.0, 1e-3);
    EXPECT_DOUBLE_EQ(profile.samples.back().elevation, 8.5);
}

TEST_F(ProfileSamplerTest, ProfilesAreOrderedByNameField) {
    auto lines = write_lines(dir_.file("lines.geojson"),
                             {straight_line("B"), straight_line("A")});
    ProfileConfig config = config_for(lines, write_ramp(), 2.0);
    config.name_field = "name";
    auto report = ProfileSampler(config).run();

    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report.entries()[0].item_id, "A");
    EXPECT_EQ(report.entries()[1].item_id, "B");
}

TEST_F(ProfileSamplerTest, MissingNameFieldIsFieldNotFound) {
    auto lines = write_lines(dir_.file("lines.geojson"), {straight_line("A")});
    ProfileConfig config = config_for(lines, write_ramp(), 2.0);
    config.name_field = "route";

    try {
        ProfileSampler(config).run();
        FAIL() << "expected FieldNotFound";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::FIELD_NOT_FOUND);
    }
}

TEST_F(ProfileSamplerTest, NonLineFeatureFailsAlone) {
    LineSpec point{"P", {{400002.5, 4499995.5}}, "Point"};
    auto lines = write_lines(dir_.file("lines.geojson"), {straight_line("A"), point});
    ProfileConfig config = config_for(lines, write_ramp(), 2.0);
    config.name_field = "name";
    auto report = ProfileSampler(config).run();

    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report.success_count(), 1u);
    EXPECT_EQ(report.failure_count(), 1u);
    EXPECT_EQ(report.entries()[1].item_id, "P");
    EXPECT_EQ(report.entries()[1].result.error().code, RasterErrorCode::INVALID_ARGUMENT);
}

TEST_F(ProfileSamplerTest, TableHasOneRowPerSample) {
    auto lines = write_lines(dir_.file("lines.geojson"),
                             {straight_line("B"), straight_line("A")});
    ProfileConfig config = config_for(lines, write_ramp(), 4.0);
    config.name_field = "name";
    ProfileSampler(config).run();

    GDALDatasetPtr table = open_csv_table(config.output_path, "test");
    OGRLayer* layer = table->GetLayer(0);
    ASSERT_NE(layer, nullptr);
    OGRFeatureDefn* definition = layer->GetLayerDefn();
    ASSERT_EQ(definition->GetFieldCount(), 5);
    EXPECT_STREQ(definition->GetFieldDefn(0)->GetNameRef(), "name");
    EXPECT_STREQ(definition->GetFieldDefn(1)->GetNameRef(), "distance");
    EXPECT_STREQ(definition->GetFieldDefn(2)->GetNameRef(), "elevation");

    std::vector<std::string> names;
    std::vector<double> elevations;
    for (const auto& feature : *layer) {
        names.push_back(feature->GetFieldAsString("name"));
        elevations.push_back(CPLAtof(feature->GetFieldAsString("elevation")));
    }
    EXPECT_EQ(names, (std::vector<std::string>{"A", "A", "A", "B", "B", "B"}));
    EXPECT_EQ(elevations, (std::vector<double>{0.5, 4.5, 8.5, 0.5, 4.5, 8.5}));
}

TEST_F(ProfileSamplerTest, NonPositiveStepIsInvalidArgument) {
    auto lines = write_lines(dir_.file("lines.geojson"), {straight_line("A")});
    for (double step : {0.0, -2.0}) {
        try {
            ProfileSampler(config_for(lines, write_ramp(), step)).run();
            ADD_FAILURE() << "expected InvalidArgument for step " << step;
        } catch (const RasterError& e) {
            EXPECT_EQ(e.code(), RasterErrorCode::INVALID_ARGUMENT);
        }
    }
}

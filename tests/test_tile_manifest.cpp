/**
 * @file test_tile_manifest.cpp
 * @brief Manifest and field schema tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TileManifest.hpp"
#include "FieldSchema.hpp"
#include "GdalUtils.hpp"
#include "RasterError.hpp"
#include "TestRasters.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace demforge;
using namespace demforge::test;

namespace {

std::string write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

// In-memory attribute table of string fields
class StringTable {
public:
    explicit StringTable(const std::vector<std::string>& names)
        : definition_(new OGRFeatureDefn("table")) {
        definition_->Reference();
        for (const auto& name : names) {
            OGRFieldDefn field(name.c_str(), OFTString);
            definition_->AddFieldDefn(&field);
        }
    }
    ~StringTable() { definition_->Release(); }

    StringTable(const StringTable&) = delete;
    StringTable& operator=(const StringTable&) = delete;

    const OGRFeatureDefn& definition() const { return *definition_; }

    OGRFeatureUniquePtr row(const std::vector<std::string>& values) const {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(definition_));
        for (size_t i = 0; i < values.size(); ++i) {
            feature->SetField(static_cast<int>(i), values[i].c_str());
        }
        return feature;
    }

private:
    OGRFeatureDefn* definition_;
};

} // namespace

TEST(FieldSchemaTest, ResolvesColumnsCaseInsensitively) {
    FieldSchema schema({{"local_path", FieldType::STRING, true},
                        {"dem_gsd_meters", FieldType::REAL, true},
                        {"tile_count", FieldType::INTEGER, false}});
    StringTable table({"DEM_GSD_METERS", " Local_Path "});

    schema.resolve(table.definition(), "test.csv");

    EXPECT_TRUE(schema.is_resolved());
    EXPECT_EQ(schema.index_of("local_path"), 1);
    EXPECT_EQ(schema.index_of("dem_gsd_meters"), 0);
    EXPECT_FALSE(schema.find("tile_count").has_value());

    auto row = table.row({"0.5", "tiles/a.tif"});
    EXPECT_EQ(schema.text(*row, "local_path"), "tiles/a.tif");
    EXPECT_EQ(schema.real(*row, "dem_gsd_meters"), 0.5);
    EXPECT_FALSE(schema.integer(*row, "tile_count").has_value());
}

TEST(FieldSchemaTest, MissingRequiredFieldIsFieldNotFound) {
    FieldSchema schema({{"local_path", FieldType::STRING, true}});
    StringTable table({"url", "status"});
    try {
        schema.resolve(table.definition(), "tiles.csv");
        FAIL() << "expected FieldNotFound";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::FIELD_NOT_FOUND);
        EXPECT_EQ(e.path(), "tiles.csv");
    }
}

TEST(FieldSchemaTest, UnknownFieldNameIsFieldNotFound) {
    FieldSchema schema({{"local_path", FieldType::STRING, true}});
    StringTable table({"local_path"});
    schema.resolve(table.definition(), "tiles.csv");
    try {
        schema.index_of("elevation");
        FAIL() << "expected FieldNotFound";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::FIELD_NOT_FOUND);
    }
}

TEST(FieldSchemaTest, TypedValuesAreValidated) {
    FieldSchema schema({{"gsd", FieldType::REAL, true}, {"count", FieldType::INTEGER, true}});
    StringTable table({"gsd", "count"});
    schema.resolve(table.definition(), "test.csv");

    EXPECT_NO_THROW(schema.validate(*table.row({"1.5", "3"})));
    EXPECT_THROW(schema.validate(*table.row({"fine", "3"})), RasterError);
    EXPECT_THROW(schema.validate(*table.row({"1.5", "3.5"})), RasterError);
    EXPECT_THROW(schema.real(*table.row({"inf", "3"}), "gsd"), RasterError);
    EXPECT_EQ(schema.integer(*table.row({"1.5", " 42 "}), "count"), 42);
}

TEST(FieldSchemaTest, RenamedOutputFieldIsFieldNotFound) {
    ensure_gdal_registered();
    TempDir dir;
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
    ASSERT_NE(driver, nullptr);
    GDALDatasetPtr dataset(driver->Create(dir.file("points.shp").c_str(), 0, 0, 0,
                                          GDT_Unknown, nullptr));
    ASSERT_TRUE(dataset);
    OGRLayer* layer = dataset->CreateLayer("points", nullptr, wkbPoint, nullptr);
    ASSERT_NE(layer, nullptr);

    // Shapefile field names are limited to 10 characters
    FieldSchema schema({{"elevation_feet", FieldType::REAL, true}});
    try {
        schema.create_fields(*layer, "points.shp");
        FAIL() << "expected FieldNotFound";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::FIELD_NOT_FOUND);
    }
}

TEST(TileManifestTest, MissingLocalPathColumnIsFieldNotFound) {
    TempDir dir;
    auto path = write_text(dir.file("manifest.csv"), "workunit,dem_gsd_meters,url\nUT_1,1.0,http://x\n");
    try {
        TileManifest::read(path);
        FAIL() << "expected FieldNotFound";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::FIELD_NOT_FOUND);
    }
}

TEST(TileManifestTest, BadRowsAreReportedIndividually) {
    TempDir dir;
    auto path = write_text(dir.file("manifest.csv"),
        "\xEF\xBB\xBFworkunit,project,ql,dem_gsd_meters,url,local_path,metadata_link,status\r\n"
        "good,P,QL1,0.5,http://a,tiles/good.tif,,success\r\n"
        "failed,P,QL1,0.5,http://b,tiles/failed.tif,,error\r\n"
        "badgsd,P,QL1,fine,http://c,tiles/badgsd.tif,,success\r\n"
        "nopath,P,QL1,1.0,http://d,,,success\r\n"
        "zerogsd,P,QL1,0,http://e,tiles/zero.tif,,success\r\n"
        "\r\n");

    auto report = TileManifest::read(path);

    EXPECT_EQ(report.size(), 5u);
    EXPECT_EQ(report.success_count(), 1u);
    EXPECT_EQ(report.failure_count(), 4u);

    const auto& entries = report.entries();
    EXPECT_EQ(entries[0].item_id, "good");
    ASSERT_TRUE(entries[0].result.is_ok());
    EXPECT_EQ(entries[0].result.value().local_path,
              (dir.path() / "tiles" / "good.tif").string());
    EXPECT_EQ(entries[0].result.value().dem_gsd_meters, 0.5);

    EXPECT_EQ(entries[1].result.error().code, RasterErrorCode::RASTER_IO_ERROR);
    EXPECT_EQ(entries[2].result.error().code, RasterErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(entries[3].result.error().code, RasterErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(entries[4].result.error().code, RasterErrorCode::INVALID_ARGUMENT);

    std::string summary = report.summary();
    EXPECT_NE(summary.find("1 succeeded, 4 failed"), std::string::npos);
    EXPECT_NE(summary.find("badgsd"), std::string::npos);
}

TEST(TileManifestTest, WrittenManifestReadsBack) {
    TempDir dir;
    ManifestEntry entry;
    entry.workunit = "UT_Wasatch_2020";
    entry.project = "UT_Wasatch, Phase 2\nNorth \"B\" block";
    entry.quality_level = "QL1";
    entry.dem_gsd_meters = 0.5;
    entry.url = "https://example.org/tile.tif";
    entry.metadata_link = "https://example.org/meta.xml";
    entry.local_path = (dir.path() / "tile.tif").string();
    entry.status = "success";

    ManifestEntry second = entry;
    second.workunit = "UT_Wasatch_2021";
    second.dem_gsd_meters.reset();

    auto path = dir.file("manifest.csv");
    write_text(path, "stale contents\n");
    TileManifest::write(path, {entry, second});
    auto report = TileManifest::read(path);

    ASSERT_EQ(report.size(), 2u);
    ASSERT_EQ(report.success_count(), 2u);
    const ManifestEntry& read = report.entries()[0].result.value();
    EXPECT_EQ(read.workunit, entry.workunit);
    EXPECT_EQ(read.project, entry.project);
    EXPECT_EQ(read.dem_gsd_meters, entry.dem_gsd_meters);
    EXPECT_EQ(read.url, entry.url);
    EXPECT_EQ(read.metadata_link, entry.metadata_link);
    EXPECT_EQ(read.local_path, entry.local_path);
    EXPECT_EQ(read.status, entry.status);

    const ManifestEntry& without_gsd = report.entries()[1].result.value();
    EXPECT_EQ(without_gsd.workunit, "UT_Wasatch_2021");
    EXPECT_FALSE(without_gsd.dem_gsd_meters.has_value());
}

TEST(TileManifestTest, MissingFileIsARasterIoError) {
    TempDir dir;
    try {
        TileManifest::read(dir.file("missing.csv"));
        FAIL() << "expected RasterIOError";
    } catch (const RasterError& e) {
        EXPECT_EQ(e.code(), RasterErrorCode::RASTER_IO_ERROR);
    }
}

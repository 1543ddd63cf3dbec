/**
 * @file TileManifest.cpp
 * @brief Manifest reading and writing through the OGR CSV driver
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TileManifest.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <cpl_string.h>
#include <filesystem>

namespace demforge {

namespace {

const char* const FIELD_WORKUNIT = "workunit";
const char* const FIELD_PROJECT = "project";
const char* const FIELD_QL = "ql";
const char* const FIELD_GSD = "dem_gsd_meters";
const char* const FIELD_URL = "url";
const char* const FIELD_LOCAL_PATH = "local_path";
const char* const FIELD_METADATA = "metadata_link";
const char* const FIELD_STATUS = "status";

std::string resolve_local_path(const std::string& local_path,
                               const std::filesystem::path& manifest_dir) {
    std::filesystem::path tile(local_path);
    std::error_code ec;
    if (tile.is_absolute() || std::filesystem::exists(tile, ec)) {
        return local_path;
    }
    return (manifest_dir / tile).lexically_normal().string();
}

} // namespace

FieldSchema TileManifest::schema() {
    return FieldSchema({
        {FIELD_WORKUNIT, FieldType::STRING, false},
        {FIELD_PROJECT, FieldType::STRING, false},
        {FIELD_QL, FieldType::STRING, false},
        {FIELD_GSD, FieldType::REAL, true},
        {FIELD_URL, FieldType::STRING, false},
        {FIELD_LOCAL_PATH, FieldType::STRING, true},
        {FIELD_METADATA, FieldType::STRING, false},
        {FIELD_STATUS, FieldType::STRING, false},
    });
}

BatchReport<ManifestEntry> TileManifest::read(const std::string& path) {
    Logger logger("TileManifest");

    GDALDatasetPtr dataset = open_csv_table(path, "read_manifest");
    OGRLayer* layer = dataset->GetLayerCount() > 0 ? dataset->GetLayer(0) : nullptr;
    if (!layer) {
        throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "read_manifest",
                          "manifest has no header row", path);
    }

    FieldSchema fields = schema();
    fields.resolve(*layer->GetLayerDefn(), path);

    const std::filesystem::path manifest_dir = std::filesystem::path(path).parent_path();
    BatchReport<ManifestEntry> report;

    layer->ResetReading();
    for (const auto& feature : *layer) {
        ManifestEntry entry;
        entry.workunit = fields.text(*feature, FIELD_WORKUNIT);
        entry.project = fields.text(*feature, FIELD_PROJECT);
        entry.quality_level = fields.text(*feature, FIELD_QL);
        entry.url = fields.text(*feature, FIELD_URL);
        entry.local_path = fields.text(*feature, FIELD_LOCAL_PATH);
        entry.metadata_link = fields.text(*feature, FIELD_METADATA);
        entry.status = fields.text(*feature, FIELD_STATUS);

        std::string item_id = entry.workunit.empty()
            ? path + ":" + std::to_string(feature->GetFID())
            : entry.workunit;

        try {
            fields.validate(*feature);
            entry.dem_gsd_meters = fields.real(*feature, FIELD_GSD);
        } catch (const RasterError& e) {
            report.add(item_id, ItemResult<ManifestEntry>::failure(e));
            continue;
        }

        if (entry.status == "error") {
            report.add(item_id, ItemResult<ManifestEntry>::failure(
                RasterErrorCode::RASTER_IO_ERROR, "tile download failed"));
            continue;
        }
        if (entry.local_path.empty()) {
            report.add(item_id, ItemResult<ManifestEntry>::failure(
                RasterErrorCode::INVALID_ARGUMENT, "no local path"));
            continue;
        }
        if (entry.dem_gsd_meters && !(*entry.dem_gsd_meters > 0.0)) {
            report.add(item_id, ItemResult<ManifestEntry>::failure(
                RasterErrorCode::INVALID_ARGUMENT,
                "invalid GSD " + format_number(*entry.dem_gsd_meters)));
            continue;
        }

        entry.local_path = resolve_local_path(entry.local_path, manifest_dir);
        report.add(item_id, ItemResult<ManifestEntry>::ok(entry));
    }

    logger.info("Manifest " + path + ": " + std::to_string(report.success_count()) +
                " usable tile(s), " + std::to_string(report.failure_count()) + " rejected");
    if (report.failure_count() > 0) {
        logger.detailed(report.summary());
    }
    return report;
}

void TileManifest::write(const std::string& path, const std::vector<ManifestEntry>& entries) {
    Logger logger("TileManifest");

    GDALDatasetPtr dataset = create_csv_table(path, "write_manifest");

    CPLStringList layer_options;
    layer_options.SetNameValue("LINEFORMAT", "CRLF");
    const std::string layer_name = std::filesystem::path(path).stem().string();
    OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), nullptr,
                                           wkbNone, layer_options.List());
    if (!layer) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_manifest",
                         "cannot create manifest layer", path);
    }

    FieldSchema fields = schema();
    fields.create_fields(*layer, path);

    for (const auto& entry : entries) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetField(fields.index_of(FIELD_WORKUNIT), entry.workunit.c_str());
        feature->SetField(fields.index_of(FIELD_PROJECT), entry.project.c_str());
        feature->SetField(fields.index_of(FIELD_QL), entry.quality_level.c_str());
        if (entry.dem_gsd_meters) {
            feature->SetField(fields.index_of(FIELD_GSD), *entry.dem_gsd_meters);
        }
        feature->SetField(fields.index_of(FIELD_URL), entry.url.c_str());
        feature->SetField(fields.index_of(FIELD_LOCAL_PATH), entry.local_path.c_str());
        feature->SetField(fields.index_of(FIELD_METADATA), entry.metadata_link.c_str());
        feature->SetField(fields.index_of(FIELD_STATUS), entry.status.c_str());

        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_manifest",
                             "write failed for " + entry.workunit, path);
        }
    }

    CPLErrorReset();
    dataset.reset();
    if (CPLGetLastErrorType() == CE_Failure) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_manifest",
                         "flush failed", path);
    }
    logger.info("Manifest written: " + path);
}

} // namespace demforge

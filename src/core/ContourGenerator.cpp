/**
 * @file ContourGenerator.cpp
 * @brief GDALContourGenerateEx into an OGR layer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ContourGenerator.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <cpl_string.h>
#include <cmath>
#include <filesystem>
#include <utility>
#include <vector>

namespace demforge {

ContourGenerator::ContourGenerator(const ContourConfig& config) : config_(config) {}

ContourResult ContourGenerator::generate(const CancellationToken* cancel) const {
    Logger logger("ContourGenerator");

    if (!(config_.interval > 0.0) || !std::isfinite(config_.interval)) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "generate_contours",
                          "contour interval must be positive");
    }

    auto dataset = open_raster(config_.input_path, false, "generate_contours");
    if (config_.band < 1 || config_.band > dataset->GetRasterCount()) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "generate_contours",
                          "band " + std::to_string(config_.band) + " does not exist",
                          config_.input_path);
    }
    GDALRasterBand* band = dataset->GetRasterBand(config_.band);

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(config_.driver.c_str());
    if (!driver || !driver->GetMetadataItem(GDAL_DCAP_VECTOR)) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "generate_contours",
                          "'" + config_.driver + "' is not a vector driver");
    }

    std::error_code ec;
    std::filesystem::path output_path(config_.output_path);
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
    }
    if (std::filesystem::exists(output_path, ec)) {
        if (driver->Delete(config_.output_path.c_str()) != CE_None) {
            logger.warning("Could not delete existing " + config_.output_path);
            CPLErrorReset();
        }
    }

    GDALDatasetPtr output(driver->Create(config_.output_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!output) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "generate_contours",
                         "cannot create vector output", config_.output_path);
    }

    OGRSpatialReference* srs = nullptr;
    OGRSpatialReference srs_copy;
    if (const OGRSpatialReference* source_srs = dataset->GetSpatialRef()) {
        srs_copy = *source_srs;
        srs = &srs_copy;
    }

    OGRLayer* layer = output->CreateLayer("contour", srs,
                                          config_.three_d ? wkbLineString25D : wkbLineString,
                                          nullptr);
    if (!layer) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "generate_contours",
                         "cannot create contour layer", config_.output_path);
    }

    OGRFieldDefn id_field("ID", OFTInteger);
    id_field.SetWidth(8);
    OGRFieldDefn elevation_field(config_.elevation_field.c_str(), OFTReal);
    elevation_field.SetWidth(12);
    elevation_field.SetPrecision(3);
    if (layer->CreateField(&id_field) != OGRERR_NONE ||
        layer->CreateField(&elevation_field) != OGRERR_NONE) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "generate_contours",
                         "cannot create attribute fields", config_.output_path);
    }

    OGRFeatureDefn* layer_defn = layer->GetLayerDefn();
    const int id_index = layer_defn->GetFieldIndex("ID");
    const int elevation_index = layer_defn->GetFieldIndex(config_.elevation_field.c_str());
    // Drivers may truncate or launder names (shapefiles keep 10 characters)
    const std::vector<std::pair<std::string, int>> field_indices = {
        {"ID", id_index}, {config_.elevation_field, elevation_index}};
    for (const auto& [name, index] : field_indices) {
        if (index < 0) {
            throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "generate_contours",
                              "field '" + name + "' was renamed by the " + config_.driver +
                              " driver", config_.output_path);
        }
    }
    logger.debug("ID field " + std::to_string(id_index) + ", elevation field " +
                 std::to_string(elevation_index));

    CPLStringList contour_options;
    contour_options.SetNameValue("LEVEL_INTERVAL", format_number(config_.interval).c_str());
    contour_options.SetNameValue("LEVEL_BASE", format_number(config_.offset).c_str());
    contour_options.SetNameValue("ID_FIELD", std::to_string(id_index).c_str());
    contour_options.SetNameValue("ELEV_FIELD", std::to_string(elevation_index).c_str());

    int has_nodata = FALSE;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        contour_options.SetNameValue("NODATA", format_number(nodata).c_str());
    }

    logger.info("Generating contours every " + format_number(config_.interval) +
                " from " + config_.input_path);

    CPLErr err = GDALContourGenerateEx(GDALRasterBand::ToHandle(band),
                                       layer,
                                       contour_options.List(), cancellation_progress,
                                       const_cast<CancellationToken*>(cancel));
    if (err != CE_None) {
        throw_if_cancelled(cancel, "generate_contours");
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "generate_contours",
                         "contour generation failed", config_.input_path);
    }

    ContourResult result;
    result.output_path = config_.output_path;
    result.feature_count = layer->GetFeatureCount();

    output.reset();

    logger.info("Wrote " + std::to_string(result.feature_count) + " contour line(s) to " +
                config_.output_path);
    return result;
}

} // namespace demforge

/**
 * @file GdalUtils.hpp
 * @brief RAII handles and shared helpers for GDAL/OGR
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <memory>
#include <string>

namespace demforge {

// RAII wrapper for GDAL datasets
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* transform) const {
        OGRCoordinateTransformation::DestroyCT(transform);
    }
};

using CoordinateTransformationPtr =
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

/**
 * @brief Register all GDAL/OGR drivers once per process
 */
void ensure_gdal_registered();

/**
 * @brief Route GDAL's CPLError output into the "GDAL" logging facility
 */
void install_gdal_log_handler();

/**
 * @brief Open a raster dataset, throwing RasterIOError on failure
 * @param operation Name of the calling operation for the error context
 */
GDALDatasetPtr open_raster(const std::string& path, bool update, const std::string& operation);

/**
 * @brief Open a CSV table through the OGR CSV driver, first row as header
 * @throws RasterError (RasterIOError)
 */
GDALDatasetPtr open_csv_table(const std::string& path, const std::string& operation);

/**
 * @brief Create an empty CSV dataset, replacing an existing file
 * @throws RasterError (RasterIOError)
 */
GDALDatasetPtr create_csv_table(const std::string& path, const std::string& operation);

/**
 * @brief Build a spatial reference from an authority code ("EPSG:26912") or WKT
 *
 * Axis order is forced to traditional GIS order (x = easting/longitude).
 * @throws RasterError (ReprojectionError) when the definition is not understood
 */
OGRSpatialReference make_spatial_reference(const std::string& definition,
                                           const std::string& operation);

/**
 * @brief WKT of a spatial reference, empty when unavailable
 */
std::string to_wkt(const OGRSpatialReference& srs);

/**
 * @brief GDAL progress callback that aborts when the CancellationToken is tripped
 *
 * Pass the token (or nullptr) as the progress argument.
 */
int CPL_STDCALL cancellation_progress(double complete, const char* message, void* token);

/**
 * @brief Throw RasterError (Cancelled) if the token is set
 */
void throw_if_cancelled(const CancellationToken* cancel, const std::string& operation);

/**
 * @brief Format a double without trailing zeros, full precision
 */
std::string format_number(double value);

} // namespace demforge

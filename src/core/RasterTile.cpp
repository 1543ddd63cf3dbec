/**
 * @file RasterTile.cpp
 * @brief Raster header inspection and band statistics
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterTile.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <algorithm>
#include <cmath>

namespace demforge {

Extent RasterTile::extent() const {
    double x0 = origin_x;
    double x1 = origin_x + pixel_size_x * width;
    double y0 = origin_y;
    double y1 = origin_y + pixel_size_y * height;
    return Extent(std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1));
}

RasterTile inspect_tile(const std::string& path) {
    Logger logger("RasterTile");
    auto dataset = open_raster(path, false, "inspect_tile");

    RasterTile tile;
    tile.path = path;
    tile.width = dataset->GetRasterXSize();
    tile.height = dataset->GetRasterYSize();
    tile.band_count = dataset->GetRasterCount();

    if (tile.band_count < 1) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "inspect_tile",
                          "raster has no bands", path);
    }

    double geotransform[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    if (dataset->GetGeoTransform(geotransform) != CE_None) {
        logger.warning("No geotransform in " + path + ", using pixel coordinates");
    }
    if (geotransform[2] != 0.0 || geotransform[4] != 0.0) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "inspect_tile",
                          "rotated geotransforms are not supported", path);
    }

    tile.origin_x = geotransform[0];
    tile.pixel_size_x = geotransform[1];
    tile.origin_y = geotransform[3];
    tile.pixel_size_y = geotransform[5];
    tile.resolution = std::abs(geotransform[1]);

    if (const OGRSpatialReference* srs = dataset->GetSpatialRef()) {
        tile.crs_wkt = to_wkt(*srs);
    }

    int has_nodata = FALSE;
    double nodata = dataset->GetRasterBand(1)->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        tile.nodata = nodata;
    }

    logger.debug("Inspected " + path + ": " + std::to_string(tile.width) + "x" +
                 std::to_string(tile.height) + " px, " + std::to_string(tile.band_count) +
                 " band(s), GSD " + format_number(tile.resolution));
    return tile;
}

std::optional<RasterStatistics> compute_statistics(const std::string& path, int band) {
    auto dataset = open_raster(path, false, "compute_statistics");

    if (band < 1 || band > dataset->GetRasterCount()) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "compute_statistics",
                          "band " + std::to_string(band) + " does not exist", path);
    }

    RasterStatistics stats;
    CPLErrorReset();
    CPLErr err = dataset->GetRasterBand(band)->ComputeStatistics(
        FALSE, &stats.minimum, &stats.maximum, &stats.mean, &stats.std_dev,
        nullptr, nullptr);

    if (err != CE_None) {
        // GDAL reports a failure for bands that hold only nodata
        std::string message = CPLGetLastErrorMsg();
        CPLErrorReset();
        if (message.find("valid") != std::string::npos) {
            return std::nullopt;
        }
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "compute_statistics",
                          "cannot compute statistics", path, message);
    }
    return stats;
}

} // namespace demforge

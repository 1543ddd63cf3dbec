/**
 * @file UnitConversion.cpp
 * @brief Windowed read-scale-write over a GDAL band
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "UnitConversion.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace demforge {

UnitConversion::UnitConversion(const ConversionConfig& config) : config_(config) {}

ConversionStats UnitConversion::run(const CancellationToken* cancel) const {
    Logger logger("UnitConversion");

    if (!std::isfinite(config_.factor) || config_.factor == 0.0) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "convert_units",
                          "factor must be finite and non-zero", config_.raster_path);
    }
    if (config_.window_size == 0) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "convert_units",
                          "window size must be positive", config_.raster_path);
    }

    auto dataset = open_raster(config_.raster_path, true, "convert_units");
    if (config_.band < 1 || config_.band > dataset->GetRasterCount()) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "convert_units",
                          "band " + std::to_string(config_.band) + " does not exist",
                          config_.raster_path);
    }

    GDALRasterBand* band = dataset->GetRasterBand(config_.band);
    int has_nodata = FALSE;
    const double nodata = band->GetNoDataValue(&has_nodata);

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    // Clamp each axis separately; a thin strip needs a thin buffer
    const int window_x = static_cast<int>(
        std::min<size_t>(config_.window_size, static_cast<size_t>(width)));
    const int window_y = static_cast<int>(
        std::min<size_t>(config_.window_size, static_cast<size_t>(height)));

    logger.info("Converting " + config_.raster_path + " by factor " +
                format_number(config_.factor) + " (" + std::to_string(width) + "x" +
                std::to_string(height) + " px)");

    ConversionStats stats;
    stats.buffer_cells = static_cast<size_t>(window_x) * window_y;
    std::vector<double> buffer(stats.buffer_cells);

    for (int y_off = 0; y_off < height; y_off += window_y) {
        for (int x_off = 0; x_off < width; x_off += window_x) {
            throw_if_cancelled(cancel, "convert_units");

            const int cols = std::min(window_x, width - x_off);
            const int rows = std::min(window_y, height - y_off);
            const std::string where = "window at (" + std::to_string(x_off) + ", " +
                                      std::to_string(y_off) + ")";

            if (band->RasterIO(GF_Read, x_off, y_off, cols, rows, buffer.data(),
                               cols, rows, GDT_Float64, 0, 0) != CE_None) {
                throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "convert_units",
                                 "read failed for " + where, config_.raster_path);
            }

            const size_t count = static_cast<size_t>(cols) * rows;
            for (size_t i = 0; i < count; ++i) {
                double& value = buffer[i];
                if (std::isnan(value) || (has_nodata && value == nodata)) {
                    ++stats.nodata_cells;
                    continue;
                }
                value *= config_.factor;
                ++stats.converted_cells;
            }

            if (band->RasterIO(GF_Write, x_off, y_off, cols, rows, buffer.data(),
                               cols, rows, GDT_Float64, 0, 0) != CE_None) {
                throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "convert_units",
                                 "write failed for " + where, config_.raster_path);
            }
            ++stats.windows;
            logger.trace("Converted " + where);
        }
    }

    CPLErrorReset();
    dataset->FlushCache();
    if (CPLGetLastErrorType() == CE_Failure) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "convert_units",
                         "flush failed", config_.raster_path);
    }

    logger.info("Converted " + std::to_string(stats.converted_cells) + " cells in " +
                std::to_string(stats.windows) + " window(s), " +
                std::to_string(stats.nodata_cells) + " nodata cells untouched");
    return stats;
}

} // namespace demforge

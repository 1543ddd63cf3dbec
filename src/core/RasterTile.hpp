/**
 * @file RasterTile.hpp
 * @brief Metadata of a georeferenced raster file
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <optional>
#include <string>

namespace demforge {

/**
 * @brief Immutable description of one raster tile
 *
 * Captured once from the file header. The tile itself is never modified.
 */
struct RasterTile {
    std::string path;
    double origin_x = 0.0;
    double origin_y = 0.0;
    double pixel_size_x = 0.0;
    double pixel_size_y = 0.0;     // Negative for north-up rasters
    int width = 0;
    int height = 0;
    int band_count = 0;
    std::string crs_wkt;
    std::optional<double> nodata;
    double resolution = 0.0;       // Native ground sample distance

    /**
     * @brief Bounding rectangle of the tile in its CRS
     */
    Extent extent() const;
};

/**
 * @brief Summary statistics of valid cells of one band
 */
struct RasterStatistics {
    double minimum = 0.0;
    double maximum = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

/**
 * @brief Read a tile's georeferencing and band metadata
 * @throws RasterError (RasterIOError) if the file cannot be opened or has no bands
 */
RasterTile inspect_tile(const std::string& path);

/**
 * @brief Exact statistics of a band, nodata excluded
 * @return nullopt when the band has no valid cells
 * @throws RasterError (RasterIOError) if the file cannot be read
 */
std::optional<RasterStatistics> compute_statistics(const std::string& path, int band = 1);

} // namespace demforge

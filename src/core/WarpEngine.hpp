/**
 * @file WarpEngine.hpp
 * @brief Materialization of a mosaic with clipping and reprojection
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <string>

namespace demforge {

/**
 * @brief Georeferencing of a file written by the warper
 */
struct WarpedRaster {
    std::string path;
    int width = 0;
    int height = 0;
    double pixel_size_x = 0.0;
    double pixel_size_y = 0.0;
    Extent extent;
    std::string crs_wkt;
};

/**
 * @brief Writes a GeoTIFF from any readable raster (usually a VRT mosaic)
 *
 * Target CRS, clip rectangle and resampling are independent: any may be
 * left at its default. Clip bounds are in the target CRS (or the source CRS
 * when no target is given). Without reprojection the output keeps the
 * source pixel size, so a clip equal to the full extent reproduces the
 * unclipped output. The source is never modified.
 */
class WarpEngine {
public:
    explicit WarpEngine(const WarpConfig& config);

    /**
     * @throws RasterError RasterIOError (source unreadable), ReprojectionError
     *         (bad target CRS or no transformation), ResampleError (warp failed),
     *         InvalidArgument (empty clip), Cancelled
     */
    WarpedRaster warp(const std::string& source_path, const std::string& output_path,
                      const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Clip rectangle in the output CRS, if any
     *
     * Resolves aoi_path and clip_bounds_crs against the output CRS.
     */
    std::optional<Extent> resolve_clip_bounds(const std::string& output_crs) const;

private:
    WarpConfig config_;
};

} // namespace demforge

#pragma once

/**
 * @file demforge.hpp
 * @brief Main header for the demforge terrain toolkit
 *
 * Resolution-priority mosaicking of elevation tiles, clipping and
 * reprojection, in-place unit conversion, cut/fill volume integration
 * and contour extraction, built on GDAL/OGR.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demforge {

class CancellationToken;

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Axis-aligned rectangle in a raster's coordinate reference system
 */
struct Extent {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    Extent() = default;
    Extent(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return is_empty() ? 0.0 : width() * height(); }

    // Zero-area rectangles count as empty
    bool is_empty() const { return !(max_x > min_x) || !(max_y > min_y); }

    Extent intersect(const Extent& other) const {
        return Extent(std::max(min_x, other.min_x), std::max(min_y, other.min_y),
                      std::min(max_x, other.max_x), std::min(max_y, other.max_y));
    }

    Extent unite(const Extent& other) const {
        return Extent(std::min(min_x, other.min_x), std::min(min_y, other.min_y),
                      std::max(max_x, other.max_x), std::max(max_y, other.max_y));
    }

    bool operator==(const Extent& other) const {
        return min_x == other.min_x && min_y == other.min_y &&
               max_x == other.max_x && max_y == other.max_y;
    }
};

// ============================================================================
// Resampling
// ============================================================================

/**
 * @brief Resampling kernels understood by the VRT builder and the warper
 *
 * Elevation surfaces default to BILINEAR; NEAREST produces staircasing
 * on smooth terrain.
 */
enum class ResampleAlgorithm {
    NEAREST,
    BILINEAR,
    CUBIC,
    CUBIC_SPLINE,
    LANCZOS,
    AVERAGE
};

/**
 * @brief GDAL name of a resampling kernel ("near", "bilinear", ...)
 */
std::string resample_to_string(ResampleAlgorithm algorithm);

/**
 * @brief Parse a GDAL resampling name
 * @throws RasterError (InvalidArgument) for unknown names
 */
ResampleAlgorithm parse_resample(const std::string& name);

// ============================================================================
// Job configuration
// ============================================================================

/**
 * @brief Materialization settings for a virtual mosaic
 */
struct WarpConfig {
    std::optional<std::string> target_crs;       // EPSG/authority code or WKT
    std::optional<Extent> clip_bounds;           // In target CRS unless clip_bounds_crs is set
    std::optional<std::string> clip_bounds_crs;  // CRS of clip_bounds when it differs from target
    std::optional<std::string> aoi_path;         // Vector AOI; its extent becomes clip_bounds
    ResampleAlgorithm resample = ResampleAlgorithm::BILINEAR;
    std::optional<double> output_resolution;
    std::optional<double> dst_nodata;
    std::vector<std::string> creation_options = {
        "COMPRESS=LZW", "TILED=YES", "BIGTIFF=IF_SAFER"
    };
};

/**
 * @brief Settings for the tile mosaic job
 */
struct MosaicConfig {
    std::vector<std::string> tile_paths;
    std::optional<std::string> manifest_path;
    std::string output_path = "dem_mosaic.tif";
    ResampleAlgorithm vrt_resample = ResampleAlgorithm::BILINEAR;
    std::optional<double> resolution_override;
    bool fallback_to_coarser = false;
    bool keep_vrt = false;
    WarpConfig warp;
    std::optional<double> unit_factor;          // Applied in place after warping
    std::string elevation_units = "m";          // Label for the summary
    size_t conversion_window = 1024;
};

/**
 * @brief Settings for an in-place unit conversion
 */
struct ConversionConfig {
    std::string raster_path;
    double factor = 3.28084;
    int band = 1;
    size_t window_size = 1024;
};

/**
 * @brief Settings for the existing/proposed surface comparison
 */
struct CutFillConfig {
    std::string existing_path;
    std::string proposed_path;
    std::string output_path = "difference.tif";
    ResampleAlgorithm resample = ResampleAlgorithm::NEAREST;
    double volume_divisor = 27.0;                // Cubic feet per cubic yard
    std::string volume_units = "cubic yards";
    double nodata = -9999.0;
    int strip_rows = 256;
    std::vector<std::string> creation_options = {
        "COMPRESS=LZW", "TILED=YES", "BIGTIFF=IF_SAFER"
    };
};

/**
 * @brief Settings for contour extraction
 */
struct ContourConfig {
    std::string input_path;
    std::string output_path = "contours.shp";
    std::string driver = "ESRI Shapefile";
    double interval = 1.0;
    double offset = 0.0;
    int band = 1;
    std::string elevation_field = "ELEV";
    bool three_d = false;
};

/**
 * @brief Settings for elevation profiles along vector lines
 */
struct ProfileConfig {
    std::string lines_path;
    std::string dem_path;
    std::string output_path = "profiles.csv";
    std::optional<std::string> layer_name;      // First layer when unset
    std::optional<std::string> name_field;      // Profiles are ordered by this field
    double step = 4.0;                          // Sample spacing in DEM CRS units
    int band = 1;
};

} // namespace demforge

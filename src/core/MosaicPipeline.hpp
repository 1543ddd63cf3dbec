/**
 * @file MosaicPipeline.hpp
 * @brief End-to-end mosaic job: inspect, group, VRT, warp, convert
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include "BatchReport.hpp"
#include "RasterTile.hpp"
#include <optional>
#include <string>

namespace demforge {

struct MosaicSummary {
    std::string output_path;
    int width = 0;
    int height = 0;
    double pixel_size = 0.0;
    size_t resolution_groups = 0;
    double finest_resolution = 0.0;
    size_t tiles_used = 0;
    size_t tiles_skipped = 0;
    std::optional<RasterStatistics> statistics;
    double file_size_mb = 0.0;
    std::string elevation_units;
};

/**
 * @brief Runs a MosaicConfig from tile list to finished GeoTIFF
 *
 * Unreadable tiles are skipped and reported; only when no tile is left
 * does the job fail with EmptyMosaicInput. The intermediate VRT is written
 * beside the output as <stem>_temp.vrt and removed afterwards unless
 * keep_vrt is set.
 */
class MosaicPipeline {
public:
    explicit MosaicPipeline(const MosaicConfig& config);

    MosaicSummary run(const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Inspect every input tile (manifest rows first, then tile_paths)
     *
     * Manifest GSD values replace the resolution read from the file.
     */
    BatchReport<RasterTile> inspect_tiles(const CancellationToken* cancel = nullptr) const;

    static std::string temp_vrt_path(const std::string& output_path);

private:
    MosaicConfig config_;
};

} // namespace demforge

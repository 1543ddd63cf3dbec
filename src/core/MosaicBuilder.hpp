/**
 * @file MosaicBuilder.hpp
 * @brief Virtual (VRT) mosaic over resolution-grouped tiles
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include "RasterTile.hpp"
#include "ResolutionGrouper.hpp"
#include <string>
#include <vector>

namespace demforge {

/**
 * @brief A virtual raster overlaying its member tiles
 *
 * Only the small VRT descriptor exists on disk; pixels are read from the
 * members on demand.
 */
struct MosaicSurface {
    std::string vrt_path;
    std::vector<std::string> member_paths;  // Source order, last wins
    double pixel_size = 0.0;
    Extent extent;
    int band_count = 0;
    int width = 0;
    int height = 0;
};

class MosaicBuilder {
public:
    struct Options {
        ResampleAlgorithm resample = ResampleAlgorithm::BILINEAR;
        std::optional<double> resolution;       // Default: finest member pixel size
        bool fallback_to_coarser = false;       // Fill gaps in the finest group from coarser groups
    };

    MosaicBuilder();
    explicit MosaicBuilder(const Options& options);

    /**
     * @brief Ordered member list for a set of resolution groups
     *
     * Only the finest group unless fallback_to_coarser is set, in which case
     * all groups are listed coarsest first so finer data is stacked on top.
     */
    std::vector<std::string> select_members(const std::vector<ResolutionGroup>& groups) const;

    /**
     * @brief Build the VRT from tiles in priority order
     *
     * Where tiles overlap, the one listed LAST supplies the value.
     * @throws RasterError EmptyMosaicInput, BandCountMismatch, CrsMismatch, RasterIOError
     */
    MosaicSurface build(const std::vector<RasterTile>& tiles,
                        const std::string& vrt_path,
                        const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Select members from inspected, grouped tiles and build the VRT
     */
    MosaicSurface build(const std::vector<ResolutionGroup>& groups,
                        const std::vector<RasterTile>& tiles,
                        const std::string& vrt_path,
                        const CancellationToken* cancel = nullptr) const;

private:
    Options options_;
};

} // namespace demforge

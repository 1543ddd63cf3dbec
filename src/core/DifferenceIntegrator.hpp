/**
 * @file DifferenceIntegrator.hpp
 * @brief Surface differencing and cut/fill volume integration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <cstdint>
#include <string>

namespace demforge {

/**
 * @brief Volumes between an existing and a proposed surface
 *
 * cut is the (negative) sum of removed material, fill the (positive) sum of
 * added material, both in the configured volume units; net = fill + cut.
 */
struct VolumeReport {
    double cut = 0.0;
    double fill = 0.0;
    double net = 0.0;
    double cell_area = 0.0;
    uint64_t valid_cells = 0;
    uint64_t adjusted_cells = 0;    // Valid differences nudged off the nodata value
    double resolution = 0.0;
    Extent extent;                  // Common grid
    int width = 0;
    int height = 0;
    std::string volume_units;
    std::string difference_path;
};

/**
 * @brief Computes proposed - existing on a common grid and integrates volumes
 *
 * Both surfaces must share a CRS and be north-up. The common grid uses the
 * finer of the two pixel sizes over the intersection of the extents; each
 * surface is resampled onto it. Cells undefined in either surface are written
 * as nodata and contribute nothing to the volumes. The nodata value must fit
 * in Float32; a valid difference equal to it is written one step away.
 */
class DifferenceIntegrator {
public:
    explicit DifferenceIntegrator(const CutFillConfig& config);

    /**
     * @throws RasterError CrsMismatch, NoOverlap, RasterIOError, ResampleError,
     *         InvalidArgument, Cancelled
     */
    VolumeReport run(const CancellationToken* cancel = nullptr) const;

private:
    CutFillConfig config_;
};

} // namespace demforge

/**
 * @file ContourGenerator.hpp
 * @brief Contour line extraction from an elevation band
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <cstdint>
#include <string>

namespace demforge {

struct ContourResult {
    std::string output_path;
    int64_t feature_count = 0;
};

/**
 * @brief Writes iso-elevation lines at a fixed interval to a vector file
 *
 * Levels are offset + k * interval. Each feature carries an integer ID and
 * its elevation; with three_d the vertices also carry Z. Nodata cells are
 * excluded from the contouring.
 */
class ContourGenerator {
public:
    explicit ContourGenerator(const ContourConfig& config);

    /**
     * @throws RasterError InvalidArgument (interval, band, driver), RasterIOError, Cancelled
     */
    ContourResult generate(const CancellationToken* cancel = nullptr) const;

private:
    ContourConfig config_;
};

} // namespace demforge

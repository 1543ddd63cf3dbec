/**
 * @file ResolutionGrouper.cpp
 * @brief Resolution grouping of raster tiles
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ResolutionGrouper.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <algorithm>
#include <cmath>

namespace demforge {

ResolutionGrouper::ResolutionGrouper(double relative_tolerance)
    : tolerance_(relative_tolerance) {}

bool ResolutionGrouper::same_resolution(double a, double b) const {
    return std::abs(a - b) <= tolerance_ * std::max(std::abs(a), std::abs(b));
}

void ResolutionGrouper::add(const std::string& path, double resolution) {
    if (!std::isfinite(resolution) || resolution <= 0.0) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "group_by_resolution",
                          "invalid resolution " + format_number(resolution), path);
    }

    // Groups are kept sorted, so the insertion point is also the lookup point
    auto it = std::lower_bound(groups_.begin(), groups_.end(), resolution,
        [this](const ResolutionGroup& group, double value) {
            return group.resolution < value && !same_resolution(group.resolution, value);
        });

    if (it != groups_.end() && same_resolution(it->resolution, resolution)) {
        it->tile_paths.push_back(path);
    } else {
        ResolutionGroup group;
        group.resolution = resolution;
        group.tile_paths.push_back(path);
        groups_.insert(it, std::move(group));
    }
    ++tile_count_;
}

std::vector<ResolutionGroup> ResolutionGrouper::group(const std::vector<RasterTile>& tiles,
                                                      double relative_tolerance) {
    Logger logger("ResolutionGrouper");
    ResolutionGrouper grouper(relative_tolerance);
    for (const auto& tile : tiles) {
        grouper.add(tile);
    }

    for (const auto& group : grouper.groups()) {
        logger.detailed("Resolution " + format_number(group.resolution) + ": " +
                        std::to_string(group.tile_paths.size()) + " tile(s)");
    }
    return grouper.groups();
}

} // namespace demforge

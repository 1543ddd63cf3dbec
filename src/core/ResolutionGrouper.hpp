/**
 * @file ResolutionGrouper.hpp
 * @brief Partition of raster tiles by native ground sample distance
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "RasterTile.hpp"
#include <string>
#include <vector>

namespace demforge {

/**
 * @brief Tiles sharing one native resolution, in input order
 */
struct ResolutionGroup {
    double resolution = 0.0;
    std::vector<std::string> tile_paths;
};

/**
 * @brief Groups tiles by resolution, finest group first
 *
 * Every tile lands in exactly one group. Resolutions that differ by no more
 * than the relative tolerance are treated as equal, which absorbs GSD values
 * that went through a float round trip (0.99999999 vs 1.0).
 */
class ResolutionGrouper {
public:
    static constexpr double DEFAULT_TOLERANCE = 1e-6;

    explicit ResolutionGrouper(double relative_tolerance = DEFAULT_TOLERANCE);

    /**
     * @brief Add one tile
     * @throws RasterError (InvalidArgument) for a non-positive or non-finite resolution
     */
    void add(const std::string& path, double resolution);
    void add(const RasterTile& tile) { add(tile.path, tile.resolution); }

    /**
     * @brief Groups ascending by resolution; tiles keep insertion order
     */
    const std::vector<ResolutionGroup>& groups() const { return groups_; }

    size_t tile_count() const { return tile_count_; }
    bool empty() const { return groups_.empty(); }

    /**
     * @brief Group a list of inspected tiles in one call
     */
    static std::vector<ResolutionGroup> group(const std::vector<RasterTile>& tiles,
                                              double relative_tolerance = DEFAULT_TOLERANCE);

private:
    double tolerance_;
    size_t tile_count_ = 0;
    std::vector<ResolutionGroup> groups_;

    bool same_resolution(double a, double b) const;
};

} // namespace demforge

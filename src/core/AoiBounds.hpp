/**
 * @file AoiBounds.hpp
 * @brief Clip rectangles from area-of-interest layers and foreign CRSs
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <string>

namespace demforge {

/**
 * @brief Extent of every feature of every layer of a vector dataset, in target_crs
 *
 * Layers without a coordinate system are assumed to already be in target_crs.
 * @throws RasterError RasterIOError if the dataset cannot be read or is empty,
 *         ReprojectionError if its extent cannot be transformed
 */
Extent read_aoi_bounds(const std::string& path, const std::string& target_crs);

/**
 * @brief Transform a rectangle between coordinate systems
 *
 * The edges are densified so the result contains the whole curved footprint.
 * @throws RasterError (ReprojectionError)
 */
Extent transform_bounds(const Extent& bounds, const std::string& source_crs,
                        const std::string& target_crs);

} // namespace demforge

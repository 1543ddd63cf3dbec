/**
 * @file ProfileSampler.hpp
 * @brief Elevation profiles sampled along vector lines
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "BatchReport.hpp"
#include "demforge.hpp"
#include <string>
#include <vector>

namespace demforge {

struct ProfileSample {
    double distance = 0.0;          // Along the line, DEM CRS units
    double x = 0.0;
    double y = 0.0;
    double elevation = 0.0;
};

struct ElevationProfile {
    std::string name;
    double length = 0.0;
    std::vector<ProfileSample> samples;
};

/**
 * @brief Samples a DEM every `step` units along each line of a vector layer
 *
 * Lines are reprojected into the DEM's coordinate system. Along every
 * segment a sample is taken at 0, step, 2*step, ... short of the segment
 * end; the last vertex of each part closes the profile. Distance accumulates
 * over segments and parts. Samples outside the DEM, on nodata or NaN are
 * dropped. Each feature is one batch item: non-line geometries and features
 * that cannot be reprojected fail individually.
 */
class ProfileSampler {
public:
    explicit ProfileSampler(const ProfileConfig& config);

    /**
     * @brief Sample every line and write the distance/elevation table
     *
     * The output is a CSV written through OGR with the columns name,
     * distance, elevation, x and y.
     * @throws RasterError RasterIOError (inputs or output), FieldNotFound
     *         (name field), ReprojectionError, InvalidArgument, Cancelled
     */
    BatchReport<ElevationProfile> run(const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Write profiles as rows of name, distance, elevation, x, y
     * @throws RasterError (RasterIOError)
     */
    static void write_table(const std::string& path, const std::vector<ElevationProfile>& profiles);

private:
    ProfileConfig config_;
};

} // namespace demforge

/**
 * @file MosaicBuilder.cpp
 * @brief VRT mosaic construction with GDALBuildVRT
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MosaicBuilder.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <gdal_utils.h>
#include <cpl_string.h>
#include <cmath>
#include <filesystem>
#include <unordered_map>

namespace demforge {

namespace {

bool same_crs(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return a.empty() && b.empty();
    }
    if (a == b) {
        return true;
    }
    OGRSpatialReference srs_a;
    OGRSpatialReference srs_b;
    if (srs_a.importFromWkt(a.c_str()) != OGRERR_NONE ||
        srs_b.importFromWkt(b.c_str()) != OGRERR_NONE) {
        return false;
    }
    return srs_a.IsSame(&srs_b);
}

} // namespace

MosaicBuilder::MosaicBuilder() = default;

MosaicBuilder::MosaicBuilder(const Options& options) : options_(options) {}

std::vector<std::string> MosaicBuilder::select_members(
    const std::vector<ResolutionGroup>& groups) const {
    std::vector<std::string> members;
    if (groups.empty()) {
        return members;
    }

    if (options_.fallback_to_coarser) {
        // groups are finest first; reverse so the finest group is stacked last
        for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
            members.insert(members.end(), it->tile_paths.begin(), it->tile_paths.end());
        }
    } else {
        members = groups.front().tile_paths;
    }
    return members;
}

MosaicSurface MosaicBuilder::build(const std::vector<ResolutionGroup>& groups,
                                   const std::vector<RasterTile>& tiles,
                                   const std::string& vrt_path,
                                   const CancellationToken* cancel) const {
    Logger logger("MosaicBuilder");

    std::unordered_map<std::string, const RasterTile*> by_path;
    for (const auto& tile : tiles) {
        by_path[tile.path] = &tile;
    }

    std::vector<RasterTile> members;
    for (const auto& path : select_members(groups)) {
        auto it = by_path.find(path);
        if (it == by_path.end()) {
            throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "build_mosaic",
                              "grouped tile was never inspected", path);
        }
        members.push_back(*it->second);
    }

    if (groups.size() > 1) {
        if (options_.fallback_to_coarser) {
            logger.info("Stacking " + std::to_string(groups.size()) +
                        " resolution groups, finest on top");
        } else {
            logger.info("Using finest resolution group (" +
                        format_number(groups.front().resolution) + "), ignoring " +
                        std::to_string(tiles.size() - members.size()) + " coarser tile(s)");
        }
    }

    return build(members, vrt_path, cancel);
}

MosaicSurface MosaicBuilder::build(const std::vector<RasterTile>& tiles,
                                   const std::string& vrt_path,
                                   const CancellationToken* cancel) const {
    Logger logger("MosaicBuilder");
    ensure_gdal_registered();

    if (tiles.empty()) {
        throw RasterError(RasterErrorCode::EMPTY_MOSAIC_INPUT, "build_mosaic",
                          "no tiles to mosaic", vrt_path);
    }

    // GDALBuildVRT skips mismatched sources with only a warning, so check up front
    const RasterTile& first = tiles.front();
    for (const auto& tile : tiles) {
        throw_if_cancelled(cancel, "build_mosaic");
        if (tile.band_count != first.band_count) {
            throw RasterError(RasterErrorCode::BAND_COUNT_MISMATCH, "build_mosaic",
                              std::to_string(tile.band_count) + " band(s), expected " +
                              std::to_string(first.band_count) + " like " + first.path,
                              tile.path);
        }
        if (!same_crs(tile.crs_wkt, first.crs_wkt)) {
            throw RasterError(RasterErrorCode::CRS_MISMATCH, "build_mosaic",
                              "coordinate system differs from " + first.path, tile.path);
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(vrt_path, ec)) {
        std::filesystem::remove(vrt_path, ec);
    }

    CPLStringList vrt_args;
    vrt_args.AddString("-r");
    vrt_args.AddString(resample_to_string(options_.resample).c_str());
    if (options_.resolution.has_value()) {
        if (!(*options_.resolution > 0.0)) {
            throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "build_mosaic",
                              "resolution must be positive");
        }
        std::string res = format_number(*options_.resolution);
        vrt_args.AddString("-tr");
        vrt_args.AddString(res.c_str());
        vrt_args.AddString(res.c_str());
    } else {
        vrt_args.AddString("-resolution");
        vrt_args.AddString("highest");
    }

    CPLStringList input_filenames;
    for (const auto& tile : tiles) {
        input_filenames.AddString(tile.path.c_str());
    }

    logger.debug("GDALBuildVRT " + std::to_string(tiles.size()) + " source(s) -> " + vrt_path);

    GDALBuildVRTOptions* build_options = GDALBuildVRTOptionsNew(vrt_args.List(), nullptr);
    if (!build_options) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "build_mosaic",
                         "invalid VRT options", vrt_path);
    }
    GDALBuildVRTOptionsSetProgress(build_options, cancellation_progress,
                                   const_cast<CancellationToken*>(cancel));

    int usage_error = FALSE;
    GDALDatasetPtr vrt_dataset(static_cast<GDALDataset*>(
        GDALBuildVRT(vrt_path.c_str(), input_filenames.Count(), nullptr,
                     input_filenames.List(), build_options, &usage_error)));
    GDALBuildVRTOptionsFree(build_options);

    if (!vrt_dataset) {
        throw_if_cancelled(cancel, "build_mosaic");
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "build_mosaic",
                         "GDALBuildVRT failed", vrt_path);
    }

    MosaicSurface surface;
    surface.vrt_path = vrt_path;
    surface.band_count = vrt_dataset->GetRasterCount();
    surface.width = vrt_dataset->GetRasterXSize();
    surface.height = vrt_dataset->GetRasterYSize();
    for (const auto& tile : tiles) {
        surface.member_paths.push_back(tile.path);
    }

    double geotransform[6];
    if (vrt_dataset->GetGeoTransform(geotransform) == CE_None) {
        surface.pixel_size = std::abs(geotransform[1]);
        surface.extent = Extent(geotransform[0],
                                geotransform[3] + geotransform[5] * surface.height,
                                geotransform[0] + geotransform[1] * surface.width,
                                geotransform[3]);
    }

    // Closing writes the descriptor to disk
    vrt_dataset.reset();

    logger.info("Built VRT mosaic of " + std::to_string(tiles.size()) + " tile(s): " +
                std::to_string(surface.width) + "x" + std::to_string(surface.height) +
                " px at " + format_number(surface.pixel_size));
    return surface;
}

} // namespace demforge

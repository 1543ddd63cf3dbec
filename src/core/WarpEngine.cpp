/**
 * @file WarpEngine.cpp
 * @brief GDALWarp-based clip and reprojection
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "WarpEngine.hpp"
#include "AoiBounds.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <gdal_utils.h>
#include <cpl_string.h>
#include <cmath>

namespace demforge {

namespace {

constexpr const char* RESAMPLING_METADATA_KEY = "DEMFORGE_RESAMPLING";

} // namespace

WarpEngine::WarpEngine(const WarpConfig& config) : config_(config) {}

std::optional<Extent> WarpEngine::resolve_clip_bounds(const std::string& output_crs) const {
    std::optional<Extent> bounds;

    if (config_.aoi_path.has_value()) {
        if (output_crs.empty()) {
            throw RasterError(RasterErrorCode::REPROJECTION_ERROR, "warp",
                              "AOI clipping needs a georeferenced source", *config_.aoi_path);
        }
        bounds = read_aoi_bounds(*config_.aoi_path, output_crs);
    } else if (config_.clip_bounds.has_value()) {
        bounds = *config_.clip_bounds;
        if (config_.clip_bounds_crs.has_value()) {
            if (output_crs.empty()) {
                throw RasterError(RasterErrorCode::REPROJECTION_ERROR, "warp",
                                  "clip bounds CRS given for a source without CRS");
            }
            bounds = transform_bounds(*bounds, *config_.clip_bounds_crs, output_crs);
        }
    }

    if (bounds && bounds->is_empty()) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "warp",
                          "clip bounds have zero area");
    }
    return bounds;
}

WarpedRaster WarpEngine::warp(const std::string& source_path, const std::string& output_path,
                              const CancellationToken* cancel) const {
    Logger logger("WarpEngine");
    throw_if_cancelled(cancel, "warp");

    auto source = open_raster(source_path, false, "warp");

    double geotransform[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    source->GetGeoTransform(geotransform);

    const OGRSpatialReference* source_srs = source->GetSpatialRef();
    std::string output_crs = source_srs ? to_wkt(*source_srs) : "";
    bool reprojecting = false;

    if (config_.target_crs.has_value()) {
        OGRSpatialReference target = make_spatial_reference(*config_.target_crs, "warp");
        if (!source_srs) {
            throw RasterError(RasterErrorCode::REPROJECTION_ERROR, "warp",
                              "source has no coordinate system to reproject from", source_path);
        }

        OGRSpatialReference source_copy(*source_srs);
        source_copy.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        reprojecting = !source_copy.IsSame(&target);
        if (reprojecting) {
            CoordinateTransformationPtr transform(
                OGRCreateCoordinateTransformation(&source_copy, &target));
            if (!transform) {
                throw_gdal_error(RasterErrorCode::REPROJECTION_ERROR, "warp",
                                 "no transformation to " + *config_.target_crs, source_path);
            }
        }
        output_crs = to_wkt(target);
    }

    std::optional<Extent> clip = resolve_clip_bounds(output_crs);

    CPLStringList warp_args;
    warp_args.AddString("-of");
    warp_args.AddString("GTiff");
    warp_args.AddString("-overwrite");
    warp_args.AddString("-r");
    warp_args.AddString(resample_to_string(config_.resample).c_str());

    if (config_.target_crs.has_value()) {
        warp_args.AddString("-t_srs");
        warp_args.AddString(config_.target_crs->c_str());
    }

    if (clip.has_value()) {
        warp_args.AddString("-te");
        warp_args.AddString(format_number(clip->min_x).c_str());
        warp_args.AddString(format_number(clip->min_y).c_str());
        warp_args.AddString(format_number(clip->max_x).c_str());
        warp_args.AddString(format_number(clip->max_y).c_str());
    }

    if (config_.output_resolution.has_value()) {
        if (!(*config_.output_resolution > 0.0)) {
            throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "warp",
                              "output resolution must be positive");
        }
        std::string res = format_number(*config_.output_resolution);
        warp_args.AddString("-tr");
        warp_args.AddString(res.c_str());
        warp_args.AddString(res.c_str());
    } else if (!reprojecting) {
        // Keep the native grid spacing; gdalwarp would otherwise suggest its own
        warp_args.AddString("-tr");
        warp_args.AddString(format_number(std::abs(geotransform[1])).c_str());
        warp_args.AddString(format_number(std::abs(geotransform[5])).c_str());
    }

    if (config_.dst_nodata.has_value()) {
        warp_args.AddString("-dstnodata");
        warp_args.AddString(format_number(*config_.dst_nodata).c_str());
    }

    for (const auto& option : config_.creation_options) {
        warp_args.AddString("-co");
        warp_args.AddString(option.c_str());
    }

    if (logger.shouldOutput(LogLevel::DEBUG)) {
        std::string command = "gdalwarp";
        for (int i = 0; i < warp_args.Count(); ++i) {
            command += " ";
            command += warp_args[i];
        }
        logger.debug(command + " " + source_path + " " + output_path);
    }

    GDALWarpAppOptions* warp_options = GDALWarpAppOptionsNew(warp_args.List(), nullptr);
    if (!warp_options) {
        throw_gdal_error(RasterErrorCode::RESAMPLE_ERROR, "warp", "invalid warp options",
                         source_path);
    }
    GDALWarpAppOptionsSetProgress(warp_options, cancellation_progress,
                                  const_cast<CancellationToken*>(cancel));

    GDALDatasetH source_handle = static_cast<GDALDatasetH>(source.get());
    int usage_error = FALSE;
    GDALDatasetPtr output(static_cast<GDALDataset*>(
        GDALWarp(output_path.c_str(), nullptr, 1, &source_handle, warp_options, &usage_error)));
    GDALWarpAppOptionsFree(warp_options);

    if (!output) {
        throw_if_cancelled(cancel, "warp");
        throw_gdal_error(RasterErrorCode::RESAMPLE_ERROR, "warp", "GDALWarp failed", output_path);
    }

    output->SetMetadataItem(RESAMPLING_METADATA_KEY,
                            resample_to_string(config_.resample).c_str());

    WarpedRaster result;
    result.path = output_path;
    result.width = output->GetRasterXSize();
    result.height = output->GetRasterYSize();
    double out_gt[6];
    if (output->GetGeoTransform(out_gt) == CE_None) {
        result.pixel_size_x = out_gt[1];
        result.pixel_size_y = out_gt[5];
        result.extent = Extent(out_gt[0], out_gt[3] + out_gt[5] * result.height,
                               out_gt[0] + out_gt[1] * result.width, out_gt[3]);
    }
    if (const OGRSpatialReference* srs = output->GetSpatialRef()) {
        result.crs_wkt = to_wkt(*srs);
    }

    output.reset();

    logger.info("Wrote " + output_path + " (" + std::to_string(result.width) + "x" +
                std::to_string(result.height) + " px, " +
                resample_to_string(config_.resample) + ")");
    return result;
}

} // namespace demforge

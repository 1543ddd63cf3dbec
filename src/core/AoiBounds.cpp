/**
 * @file AoiBounds.cpp
 * @brief AOI extent reading and bounds transformation with OGR
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "AoiBounds.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <ogrsf_frmts.h>
#include <optional>

namespace demforge {

namespace {

constexpr int DENSIFY_POINTS = 21;

Extent transform_extent(const Extent& bounds, const OGRSpatialReference& source,
                        const OGRSpatialReference& target, const std::string& operation) {
    if (source.IsSame(&target)) {
        return bounds;
    }

    CoordinateTransformationPtr transform(OGRCreateCoordinateTransformation(&source, &target));
    if (!transform) {
        throw_gdal_error(RasterErrorCode::REPROJECTION_ERROR, operation,
                         "no transformation between coordinate systems");
    }

    Extent result;
    if (!transform->TransformBounds(bounds.min_x, bounds.min_y, bounds.max_x, bounds.max_y,
                                    &result.min_x, &result.min_y, &result.max_x, &result.max_y,
                                    DENSIFY_POINTS)) {
        throw_gdal_error(RasterErrorCode::REPROJECTION_ERROR, operation,
                         "bounds cannot be transformed");
    }
    return result;
}

} // namespace

Extent transform_bounds(const Extent& bounds, const std::string& source_crs,
                        const std::string& target_crs) {
    OGRSpatialReference source = make_spatial_reference(source_crs, "transform_bounds");
    OGRSpatialReference target = make_spatial_reference(target_crs, "transform_bounds");
    return transform_extent(bounds, source, target, "transform_bounds");
}

Extent read_aoi_bounds(const std::string& path, const std::string& target_crs) {
    Logger logger("AoiBounds");
    ensure_gdal_registered();

    OGRSpatialReference target = make_spatial_reference(target_crs, "read_aoi_bounds");

    GDALDatasetPtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_VERBOSE_ERROR,
                                             nullptr, nullptr, nullptr));
    if (!dataset) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "read_aoi_bounds",
                         "cannot open vector dataset", path);
    }

    std::optional<Extent> bounds;
    for (int i = 0; i < dataset->GetLayerCount(); ++i) {
        OGRLayer* layer = dataset->GetLayer(i);
        OGREnvelope envelope;
        if (layer->GetFeatureCount() == 0 || layer->GetExtent(&envelope, TRUE) != OGRERR_NONE) {
            logger.debug("Layer " + std::string(layer->GetName()) + " has no extent");
            continue;
        }

        Extent layer_extent(envelope.MinX, envelope.MinY, envelope.MaxX, envelope.MaxY);
        if (const OGRSpatialReference* layer_srs = layer->GetSpatialRef()) {
            OGRSpatialReference source(*layer_srs);
            source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
            layer_extent = transform_extent(layer_extent, source, target, "read_aoi_bounds");
        } else {
            logger.warning("Layer " + std::string(layer->GetName()) +
                           " has no coordinate system, assuming " + target_crs);
        }

        bounds = bounds ? bounds->unite(layer_extent) : layer_extent;
    }

    if (!bounds) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "read_aoi_bounds",
                          "AOI contains no features", path);
    }

    logger.detailed("AOI bounds: " + format_number(bounds->min_x) + ", " +
                    format_number(bounds->min_y) + ", " + format_number(bounds->max_x) +
                    ", " + format_number(bounds->max_y));
    return *bounds;
}

} // namespace demforge

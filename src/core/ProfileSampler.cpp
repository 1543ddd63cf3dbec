/**
 * @file ProfileSampler.cpp
 * @brief Line walking and nearest-pixel DEM sampling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ProfileSampler.hpp"
#include "CancellationToken.hpp"
#include "FieldSchema.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <ogrsf_frmts.h>
#include <cpl_string.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <optional>

namespace demforge {

namespace {

const char* const FIELD_NAME = "name";
const char* const FIELD_DISTANCE = "distance";
const char* const FIELD_ELEVATION = "elevation";
const char* const FIELD_X = "x";
const char* const FIELD_Y = "y";

struct LineFeature {
    std::string name;
    OGRGeometryUniquePtr geometry;
};

class DemSampler {
public:
    DemSampler(GDALDataset& dataset, GDALRasterBand& band, const std::string& path)
        : band_(band), width_(dataset.GetRasterXSize()), height_(dataset.GetRasterYSize()) {
        double gt[6];
        if (dataset.GetGeoTransform(gt) != CE_None || !GDALInvGeoTransform(gt, inverse_)) {
            throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "sample_profiles",
                              "DEM has no usable geotransform", path);
        }
        int has_nodata = FALSE;
        nodata_ = band.GetNoDataValue(&has_nodata);
        has_nodata_ = has_nodata != FALSE;
    }

    // Elevation of the pixel containing (x, y); nothing outside the grid or on nodata
    std::optional<double> sample(double x, double y) const {
        const double px = inverse_[0] + x * inverse_[1] + y * inverse_[2];
        const double py = inverse_[3] + x * inverse_[4] + y * inverse_[5];
        const double col = std::floor(px);
        const double row = std::floor(py);
        if (!(col >= 0.0 && col < width_ && row >= 0.0 && row < height_)) {
            return std::nullopt;
        }

        double value = 0.0;
        if (band_.RasterIO(GF_Read, static_cast<int>(col), static_cast<int>(row), 1, 1,
                           &value, 1, 1, GDT_Float64, 0, 0, nullptr) != CE_None) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "sample_profiles",
                             "read failed at pixel " + format_number(col) + ", " +
                             format_number(row));
        }
        if (std::isnan(value) || (has_nodata_ && value == nodata_)) {
            return std::nullopt;
        }
        return value;
    }

private:
    GDALRasterBand& band_;
    int width_;
    int height_;
    double inverse_[6] = {0, 0, 0, 0, 0, 0};
    double nodata_ = 0.0;
    bool has_nodata_ = false;
};

// Walks one part; `distance` carries over from the previous part
void walk_part(const OGRLineString& part, double step, const DemSampler& dem,
               double& distance, ElevationProfile& profile) {
    const int count = part.getNumPoints();
    if (count == 0) {
        return;
    }

    auto add_sample = [&](double d, double x, double y) {
        if (auto elevation = dem.sample(x, y)) {
            profile.samples.push_back(ProfileSample{d, x, y, *elevation});
        }
    };

    for (int i = 0; i + 1 < count; ++i) {
        const double x0 = part.getX(i);
        const double y0 = part.getY(i);
        const double dx = part.getX(i + 1) - x0;
        const double dy = part.getY(i + 1) - y0;
        const double length = std::hypot(dx, dy);
        if (length == 0.0) {
            continue;
        }

        const long long num_points = static_cast<long long>(std::ceil(length / step));
        for (long long j = 0; j < num_points; ++j) {
            const double along = static_cast<double>(j) * step;
            const double t = along / length;
            add_sample(distance + along, x0 + t * dx, y0 + t * dy);
        }
        distance += length;
    }

    add_sample(distance, part.getX(count - 1), part.getY(count - 1));
}

} // namespace

ProfileSampler::ProfileSampler(const ProfileConfig& config) : config_(config) {}

BatchReport<ElevationProfile> ProfileSampler::run(const CancellationToken* cancel) const {
    Logger logger("ProfileSampler");

    if (!(config_.step > 0.0) || !std::isfinite(config_.step)) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "sample_profiles",
                          "sample step must be positive");
    }

    auto dem = open_raster(config_.dem_path, false, "sample_profiles");
    if (config_.band < 1 || config_.band > dem->GetRasterCount()) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "sample_profiles",
                          "band " + std::to_string(config_.band) + " does not exist",
                          config_.dem_path);
    }
    DemSampler sampler(*dem, *dem->GetRasterBand(config_.band), config_.dem_path);

    GDALDatasetPtr lines(GDALDataset::Open(config_.lines_path.c_str(),
                                           GDAL_OF_VECTOR | GDAL_OF_VERBOSE_ERROR,
                                           nullptr, nullptr, nullptr));
    if (!lines) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "sample_profiles",
                         "cannot open vector dataset", config_.lines_path);
    }

    OGRLayer* layer = config_.layer_name
        ? lines->GetLayerByName(config_.layer_name->c_str())
        : (lines->GetLayerCount() > 0 ? lines->GetLayer(0) : nullptr);
    if (!layer) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "sample_profiles",
                          config_.layer_name ? "no layer named '" + *config_.layer_name + "'"
                                             : std::string("dataset has no layers"),
                          config_.lines_path);
    }

    FieldSchema fields;
    if (config_.name_field) {
        fields.add({*config_.name_field, FieldType::STRING, true});
    }
    fields.resolve(*layer->GetLayerDefn(), config_.lines_path);

    CoordinateTransformationPtr transform;
    const OGRSpatialReference* dem_srs = dem->GetSpatialRef();
    const OGRSpatialReference* line_srs = layer->GetSpatialRef();
    if (dem_srs && line_srs) {
        OGRSpatialReference source(*line_srs);
        OGRSpatialReference target(*dem_srs);
        source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        if (!source.IsSame(&target)) {
            transform.reset(OGRCreateCoordinateTransformation(&source, &target));
            if (!transform) {
                throw_gdal_error(RasterErrorCode::REPROJECTION_ERROR, "sample_profiles",
                                 "no transformation from the line CRS to the DEM CRS",
                                 config_.lines_path);
            }
            logger.detailed("Reprojecting lines into the DEM coordinate system");
        }
    } else {
        logger.warning("Lines or DEM have no coordinate system, assuming they match");
    }

    std::vector<LineFeature> features;
    layer->ResetReading();
    for (const auto& feature : *layer) {
        LineFeature line;
        line.name = config_.name_field ? fields.text(*feature, *config_.name_field) : "";
        if (line.name.empty()) {
            line.name = "FID " + std::to_string(feature->GetFID());
        }
        if (const OGRGeometry* geometry = feature->GetGeometryRef()) {
            line.geometry.reset(geometry->clone());
        }
        features.push_back(std::move(line));
    }
    if (config_.name_field) {
        std::stable_sort(features.begin(), features.end(),
                         [](const LineFeature& a, const LineFeature& b) { return a.name < b.name; });
    }

    logger.info("Sampling " + std::to_string(features.size()) + " line(s) every " +
                format_number(config_.step) + " units");

    BatchReport<ElevationProfile> report;
    for (auto& line : features) {
        throw_if_cancelled(cancel, "sample_profiles");

        if (!line.geometry) {
            report.add(line.name, ItemResult<ElevationProfile>::failure(
                RasterErrorCode::INVALID_ARGUMENT, "feature has no geometry"));
            continue;
        }
        const OGRwkbGeometryType type = wkbFlatten(line.geometry->getGeometryType());
        if (type != wkbLineString && type != wkbMultiLineString) {
            report.add(line.name, ItemResult<ElevationProfile>::failure(
                RasterErrorCode::INVALID_ARGUMENT,
                std::string("not a line: ") + OGRGeometryTypeToName(type)));
            continue;
        }
        if (transform && line.geometry->transform(transform.get()) != OGRERR_NONE) {
            report.add(line.name, ItemResult<ElevationProfile>::failure(
                RasterErrorCode::REPROJECTION_ERROR, "cannot reproject line"));
            continue;
        }

        ElevationProfile profile;
        profile.name = line.name;
        double distance = 0.0;
        try {
            if (type == wkbLineString) {
                walk_part(*line.geometry->toLineString(), config_.step, sampler, distance, profile);
            } else {
                for (const OGRLineString* part : *line.geometry->toMultiLineString()) {
                    walk_part(*part, config_.step, sampler, distance, profile);
                }
            }
        } catch (const RasterError& e) {
            report.add(line.name, ItemResult<ElevationProfile>::failure(e));
            continue;
        }
        profile.length = distance;

        if (profile.samples.empty()) {
            logger.warning("Profile " + profile.name + " does not cross valid DEM cells");
        }
        logger.debug("Profile " + profile.name + ": " + std::to_string(profile.samples.size()) +
                     " sample(s) over " + format_number(profile.length));
        report.add(line.name, ItemResult<ElevationProfile>::ok(std::move(profile)));
    }

    write_table(config_.output_path, report.successes());

    logger.info("Profiles: " + std::to_string(report.success_count()) + " sampled, " +
                std::to_string(report.failure_count()) + " failed");
    if (report.failure_count() > 0) {
        logger.detailed(report.summary());
    }
    return report;
}

void ProfileSampler::write_table(const std::string& path,
                                 const std::vector<ElevationProfile>& profiles) {
    Logger logger("ProfileSampler");

    GDALDatasetPtr dataset = create_csv_table(path, "write_profiles");

    CPLStringList layer_options;
    layer_options.SetNameValue("LINEFORMAT", "CRLF");
    const std::string layer_name = std::filesystem::path(path).stem().string();
    OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), nullptr,
                                           wkbNone, layer_options.List());
    if (!layer) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_profiles",
                         "cannot create profile layer", path);
    }

    FieldSchema fields({
        {FIELD_NAME, FieldType::STRING, true},
        {FIELD_DISTANCE, FieldType::REAL, true},
        {FIELD_ELEVATION, FieldType::REAL, true},
        {FIELD_X, FieldType::REAL, true},
        {FIELD_Y, FieldType::REAL, true},
    });
    fields.create_fields(*layer, path);

    size_t rows = 0;
    for (const auto& profile : profiles) {
        for (const auto& sample : profile.samples) {
            OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
            feature->SetField(fields.index_of(FIELD_NAME), profile.name.c_str());
            feature->SetField(fields.index_of(FIELD_DISTANCE), sample.distance);
            feature->SetField(fields.index_of(FIELD_ELEVATION), sample.elevation);
            feature->SetField(fields.index_of(FIELD_X), sample.x);
            feature->SetField(fields.index_of(FIELD_Y), sample.y);
            if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
                throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_profiles",
                                 "write failed for " + profile.name, path);
            }
            ++rows;
        }
    }

    CPLErrorReset();
    dataset.reset();
    if (CPLGetLastErrorType() == CE_Failure) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "write_profiles",
                         "flush failed", path);
    }
    logger.info("Profile table written: " + path + " (" + std::to_string(rows) + " rows)");
}

} // namespace demforge

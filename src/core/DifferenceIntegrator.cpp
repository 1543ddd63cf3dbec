/**
 * @file DifferenceIntegrator.cpp
 * @brief Common-grid resampling, strip-wise differencing and volume sums
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "DifferenceIntegrator.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include <gdal_utils.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace demforge {

namespace {

struct CommonGrid {
    double min_x = 0.0;
    double max_y = 0.0;
    double resolution = 0.0;
    int cols = 0;
    int rows = 0;

    Extent extent() const {
        return Extent(min_x, max_y - rows * resolution, min_x + cols * resolution, max_y);
    }
};

// Removes a /vsimem/ file once every dataset reading it has been closed
class VsiMemFile {
public:
    explicit VsiMemFile(const std::string& role) {
        static std::atomic<unsigned> counter{0};
        path_ = "/vsimem/demforge_" + role + "_" + std::to_string(counter++) + ".vrt";
    }
    ~VsiMemFile() { VSIUnlink(path_.c_str()); }

    VsiMemFile(const VsiMemFile&) = delete;
    VsiMemFile& operator=(const VsiMemFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Moves a difference one float step off the nodata sentinel so it still reads back as data
float encode_difference(double difference, float nodata, uint64_t& adjusted) {
    float value = static_cast<float>(difference);
    if (value == nodata) {
        value = std::nextafter(value, value == 0.0f ? 1.0f : 0.0f);
        ++adjusted;
    }
    return value;
}

std::string format_volume(double volume) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << volume;
    return oss.str();
}

Extent north_up_extent(GDALDataset& dataset, const std::string& path, double& pixel_size) {
    double gt[6];
    if (dataset.GetGeoTransform(gt) != CE_None) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "cut_fill",
                          "raster is not georeferenced", path);
    }
    if (gt[2] != 0.0 || gt[4] != 0.0 || gt[1] <= 0.0 || gt[5] >= 0.0) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "cut_fill",
                          "only north-up rasters are supported", path);
    }
    pixel_size = std::min(gt[1], -gt[5]);
    return Extent(gt[0], gt[3] + gt[5] * dataset.GetRasterYSize(),
                  gt[0] + gt[1] * dataset.GetRasterXSize(), gt[3]);
}

// Lazily resampled view of a surface on the common grid; undefined cells read as NaN
GDALDatasetPtr resample_onto_grid(GDALDataset& source, const std::string& vsi_path,
                                  const CommonGrid& grid, ResampleAlgorithm resample,
                                  const CancellationToken* cancel) {
    const Extent extent = grid.extent();

    CPLStringList warp_args;
    warp_args.AddString("-of");
    warp_args.AddString("VRT");
    warp_args.AddString("-ot");
    warp_args.AddString("Float64");
    warp_args.AddString("-r");
    warp_args.AddString(resample_to_string(resample).c_str());
    warp_args.AddString("-te");
    warp_args.AddString(format_number(extent.min_x).c_str());
    warp_args.AddString(format_number(extent.min_y).c_str());
    warp_args.AddString(format_number(extent.max_x).c_str());
    warp_args.AddString(format_number(extent.max_y).c_str());
    warp_args.AddString("-ts");
    warp_args.AddString(std::to_string(grid.cols).c_str());
    warp_args.AddString(std::to_string(grid.rows).c_str());
    warp_args.AddString("-dstnodata");
    warp_args.AddString("nan");

    GDALWarpAppOptions* warp_options = GDALWarpAppOptionsNew(warp_args.List(), nullptr);
    if (!warp_options) {
        throw_gdal_error(RasterErrorCode::RESAMPLE_ERROR, "cut_fill", "invalid warp options");
    }
    GDALWarpAppOptionsSetProgress(warp_options, cancellation_progress,
                                  const_cast<CancellationToken*>(cancel));

    GDALDatasetH source_handle = static_cast<GDALDatasetH>(&source);
    int usage_error = FALSE;
    GDALDatasetPtr resampled(static_cast<GDALDataset*>(
        GDALWarp(vsi_path.c_str(), nullptr, 1, &source_handle, warp_options, &usage_error)));
    GDALWarpAppOptionsFree(warp_options);

    if (!resampled) {
        throw_if_cancelled(cancel, "cut_fill");
        throw_gdal_error(RasterErrorCode::RESAMPLE_ERROR, "cut_fill",
                         "cannot resample onto common grid", source.GetDescription());
    }
    return resampled;
}

} // namespace

DifferenceIntegrator::DifferenceIntegrator(const CutFillConfig& config) : config_(config) {}

VolumeReport DifferenceIntegrator::run(const CancellationToken* cancel) const {
    Logger logger("DifferenceIntegrator");

    if (!(config_.volume_divisor > 0.0) || !std::isfinite(config_.volume_divisor)) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "cut_fill",
                          "volume divisor must be positive");
    }
    if (!std::isnan(config_.nodata) &&
        !(std::abs(config_.nodata) <= std::numeric_limits<float>::max())) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "cut_fill",
                          "nodata value " + format_number(config_.nodata) +
                          " is not representable as Float32");
    }
    if (config_.strip_rows < 1) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "cut_fill",
                          "strip height must be positive");
    }

    auto existing = open_raster(config_.existing_path, false, "cut_fill");
    auto proposed = open_raster(config_.proposed_path, false, "cut_fill");

    // Coordinate systems
    const OGRSpatialReference* existing_srs = existing->GetSpatialRef();
    const OGRSpatialReference* proposed_srs = proposed->GetSpatialRef();
    if (existing_srs && proposed_srs) {
        if (!existing_srs->IsSame(proposed_srs)) {
            throw RasterError(RasterErrorCode::CRS_MISMATCH, "cut_fill",
                              "existing and proposed surfaces use different coordinate systems",
                              config_.proposed_path);
        }
    } else if (existing_srs || proposed_srs) {
        throw RasterError(RasterErrorCode::CRS_MISMATCH, "cut_fill",
                          "only one surface has a coordinate system",
                          existing_srs ? config_.proposed_path : config_.existing_path);
    } else {
        logger.warning("Neither surface has a coordinate system; comparing raw grid coordinates");
    }

    // Common grid
    double existing_res = 0.0;
    double proposed_res = 0.0;
    Extent existing_extent = north_up_extent(*existing, config_.existing_path, existing_res);
    Extent proposed_extent = north_up_extent(*proposed, config_.proposed_path, proposed_res);
    Extent overlap = existing_extent.intersect(proposed_extent);

    CommonGrid grid;
    grid.resolution = std::min(existing_res, proposed_res);
    grid.min_x = overlap.min_x;
    grid.max_y = overlap.max_y;
    if (!overlap.is_empty()) {
        grid.cols = static_cast<int>(std::floor(overlap.width() / grid.resolution + 1e-9));
        grid.rows = static_cast<int>(std::floor(overlap.height() / grid.resolution + 1e-9));
    }
    if (grid.cols < 1 || grid.rows < 1) {
        throw RasterError(RasterErrorCode::NO_OVERLAP, "cut_fill",
                          "surfaces do not overlap by at least one cell",
                          config_.existing_path + ", " + config_.proposed_path);
    }

    logger.info("Common grid: " + std::to_string(grid.cols) + "x" + std::to_string(grid.rows) +
                " cells at " + format_number(grid.resolution));

    VsiMemFile existing_vrt("existing");
    VsiMemFile proposed_vrt("proposed");
    GDALDatasetPtr existing_grid = resample_onto_grid(*existing, existing_vrt.path(), grid,
                                                      config_.resample, cancel);
    GDALDatasetPtr proposed_grid = resample_onto_grid(*proposed, proposed_vrt.path(), grid,
                                                      config_.resample, cancel);

    // Output raster
    std::error_code ec;
    std::filesystem::path output_path(config_.output_path);
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                              "cannot create output directory", config_.output_path, ec.message());
        }
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                          "GTiff driver not available");
    }

    CPLStringList creation_options;
    for (const auto& option : config_.creation_options) {
        creation_options.AddString(option.c_str());
    }

    GDALDatasetPtr difference(driver->Create(config_.output_path.c_str(), grid.cols, grid.rows,
                                             1, GDT_Float32, creation_options.List()));
    if (!difference) {
        throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                         "cannot create difference raster", config_.output_path);
    }

    double out_gt[6] = {grid.min_x, grid.resolution, 0.0, grid.max_y, 0.0, -grid.resolution};
    difference->SetGeoTransform(out_gt);
    if (existing_srs) {
        difference->SetSpatialRef(existing_srs);
    }
    GDALRasterBand* out_band = difference->GetRasterBand(1);
    const float nodata_value = static_cast<float>(config_.nodata);
    out_band->SetNoDataValue(nodata_value);

    // Strip-wise differencing
    GDALRasterBand* existing_band = existing_grid->GetRasterBand(1);
    GDALRasterBand* proposed_band = proposed_grid->GetRasterBand(1);

    const size_t strip_cells = static_cast<size_t>(grid.cols) * config_.strip_rows;
    std::vector<double> existing_values(strip_cells);
    std::vector<double> proposed_values(strip_cells);
    std::vector<float> difference_values(strip_cells);

    double positive_sum = 0.0;
    double negative_sum = 0.0;
    uint64_t valid_cells = 0;
    uint64_t adjusted_cells = 0;

    for (int row = 0; row < grid.rows; row += config_.strip_rows) {
        throw_if_cancelled(cancel, "cut_fill");
        const int rows = std::min(config_.strip_rows, grid.rows - row);

        if (existing_band->RasterIO(GF_Read, 0, row, grid.cols, rows, existing_values.data(),
                                    grid.cols, rows, GDT_Float64, 0, 0) != CE_None) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                             "read failed at row " + std::to_string(row), config_.existing_path);
        }
        if (proposed_band->RasterIO(GF_Read, 0, row, grid.cols, rows, proposed_values.data(),
                                    grid.cols, rows, GDT_Float64, 0, 0) != CE_None) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                             "read failed at row " + std::to_string(row), config_.proposed_path);
        }

        const size_t count = static_cast<size_t>(grid.cols) * rows;
        for (size_t i = 0; i < count; ++i) {
            const double before = existing_values[i];
            const double after = proposed_values[i];
            if (std::isnan(before) || std::isnan(after)) {
                difference_values[i] = nodata_value;
                continue;
            }
            const double diff = after - before;
            if (diff > 0.0) {
                positive_sum += diff;
            } else if (diff < 0.0) {
                negative_sum += diff;
            }
            difference_values[i] = encode_difference(diff, nodata_value, adjusted_cells);
            ++valid_cells;
        }

        if (out_band->RasterIO(GF_Write, 0, row, grid.cols, rows, difference_values.data(),
                               grid.cols, rows, GDT_Float32, 0, 0) != CE_None) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "cut_fill",
                             "write failed at row " + std::to_string(row), config_.output_path);
        }
        logger.trace("Differenced rows " + std::to_string(row) + "-" +
                     std::to_string(row + rows - 1));
    }

    difference.reset();

    VolumeReport report;
    report.resolution = grid.resolution;
    report.cell_area = grid.resolution * grid.resolution;
    report.cut = negative_sum * report.cell_area / config_.volume_divisor;
    report.fill = positive_sum * report.cell_area / config_.volume_divisor;
    report.net = report.fill + report.cut;
    report.valid_cells = valid_cells;
    report.adjusted_cells = adjusted_cells;
    report.extent = grid.extent();
    report.width = grid.cols;
    report.height = grid.rows;
    report.volume_units = config_.volume_units;
    report.difference_path = config_.output_path;

    if (adjusted_cells > 0) {
        logger.warning(std::to_string(adjusted_cells) + " difference value(s) equal to nodata " +
                       format_number(config_.nodata) + " were written one Float32 step away");
    }
    if (valid_cells == 0) {
        logger.warning("No cell is defined in both surfaces");
    }

    logger.info("Cut Volume: " + format_volume(std::abs(report.cut)) + " " + report.volume_units);
    logger.info("Fill Volume: " + format_volume(report.fill) + " " + report.volume_units);
    logger.info("Net Volume: " + format_volume(report.net) + " " + report.volume_units);
    return report;
}

} // namespace demforge

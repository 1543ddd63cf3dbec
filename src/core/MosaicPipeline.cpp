/**
 * @file MosaicPipeline.cpp
 * @brief Mosaic job orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MosaicPipeline.hpp"
#include "CancellationToken.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "MosaicBuilder.hpp"
#include "RasterError.hpp"
#include "ResolutionGrouper.hpp"
#include "TileManifest.hpp"
#include "UnitConversion.hpp"
#include "WarpEngine.hpp"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace demforge {

namespace {

// Deletes the intermediate VRT when the job ends, successfully or not
class TemporaryFile {
public:
    TemporaryFile(const std::string& path, bool keep) : path_(path), keep_(keep) {}

    ~TemporaryFile() {
        if (keep_) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            Logger("MosaicPipeline").warning("Could not remove " + path_ + ": " + ec.message());
        }
    }

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

private:
    std::string path_;
    bool keep_;
};

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace

MosaicPipeline::MosaicPipeline(const MosaicConfig& config) : config_(config) {}

std::string MosaicPipeline::temp_vrt_path(const std::string& output_path) {
    std::filesystem::path output(output_path);
    return (output.parent_path() / (output.stem().string() + "_temp.vrt")).string();
}

BatchReport<RasterTile> MosaicPipeline::inspect_tiles(const CancellationToken* cancel) const {
    Logger logger("MosaicPipeline");
    BatchReport<RasterTile> report;

    std::vector<std::pair<std::string, std::optional<double>>> inputs;
    if (config_.manifest_path.has_value()) {
        auto manifest = TileManifest::read(*config_.manifest_path);
        for (const auto& entry : manifest.entries()) {
            if (entry.result.is_ok()) {
                inputs.emplace_back(entry.result.value().local_path,
                                    entry.result.value().dem_gsd_meters);
            } else {
                report.add(entry.item_id, ItemResult<RasterTile>::failure(
                    entry.result.error().code, entry.result.error().message));
            }
        }
    }
    for (const auto& path : config_.tile_paths) {
        inputs.emplace_back(path, std::nullopt);
    }

    for (const auto& [path, gsd] : inputs) {
        throw_if_cancelled(cancel, "inspect_tiles");
        try {
            RasterTile tile = inspect_tile(path);
            if (gsd.has_value()) {
                tile.resolution = *gsd;
            }
            report.add(path, ItemResult<RasterTile>::ok(tile));
        } catch (const RasterError& e) {
            logger.warning("Skipping tile: " + std::string(e.what()));
            report.add(path, ItemResult<RasterTile>::failure(e));
        }
    }
    return report;
}

MosaicSummary MosaicPipeline::run(const CancellationToken* cancel) const {
    Logger logger("MosaicPipeline");

    // Step 1: inspect tiles
    logger.info("=== Step 1: Inspecting tiles ===");
    BatchReport<RasterTile> inspected = inspect_tiles(cancel);
    std::vector<RasterTile> tiles = inspected.successes();
    if (tiles.empty()) {
        throw RasterError(RasterErrorCode::EMPTY_MOSAIC_INPUT, "mosaic",
                          "no valid tiles to mosaic", config_.output_path,
                          inspected.summary());
    }
    logger.info("Tiles: " + inspected.summary());

    // Step 2: resolution priority
    throw_if_cancelled(cancel, "mosaic");
    logger.info("=== Step 2: Grouping by resolution ===");
    auto groups = ResolutionGrouper::group(tiles);
    logger.info("Resolution priority order:");
    for (const auto& group : groups) {
        logger.info("  " + format_number(group.resolution) + " GSD: " +
                    std::to_string(group.tile_paths.size()) + " tile(s)");
    }

    // Step 3: virtual mosaic
    throw_if_cancelled(cancel, "mosaic");
    logger.info("=== Step 3: Building VRT ===");
    std::error_code ec;
    std::filesystem::path output_path(config_.output_path);
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            throw RasterError(RasterErrorCode::RASTER_IO_ERROR, "mosaic",
                              "cannot create output directory", config_.output_path,
                              ec.message());
        }
    }

    const std::string vrt_path = temp_vrt_path(config_.output_path);
    TemporaryFile vrt_guard(vrt_path, config_.keep_vrt);

    MosaicBuilder::Options builder_options;
    builder_options.resample = config_.vrt_resample;
    builder_options.resolution = config_.resolution_override;
    builder_options.fallback_to_coarser = config_.fallback_to_coarser;
    MosaicSurface surface = MosaicBuilder(builder_options).build(groups, tiles, vrt_path, cancel);

    // Step 4: materialize
    throw_if_cancelled(cancel, "mosaic");
    logger.info("=== Step 4: Creating final mosaic ===");
    WarpedRaster warped = WarpEngine(config_.warp).warp(surface.vrt_path, config_.output_path,
                                                        cancel);

    // Step 5: units
    if (config_.unit_factor.has_value()) {
        throw_if_cancelled(cancel, "mosaic");
        logger.info("=== Step 5: Converting units ===");
        ConversionConfig conversion;
        conversion.raster_path = config_.output_path;
        conversion.factor = *config_.unit_factor;
        conversion.window_size = config_.conversion_window;
        UnitConversion(conversion).run(cancel);
    }

    MosaicSummary summary;
    summary.output_path = config_.output_path;
    summary.width = warped.width;
    summary.height = warped.height;
    summary.pixel_size = std::abs(warped.pixel_size_x);
    summary.resolution_groups = groups.size();
    summary.finest_resolution = groups.front().resolution;
    summary.tiles_used = surface.member_paths.size();
    summary.tiles_skipped = inspected.failure_count() + (tiles.size() - surface.member_paths.size());
    summary.statistics = compute_statistics(config_.output_path);
    summary.elevation_units = config_.elevation_units;

    auto size_bytes = std::filesystem::file_size(config_.output_path, ec);
    if (!ec) {
        summary.file_size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    }

    logger.info("=== Mosaic Summary ===");
    logger.info("  Output: " + summary.output_path);
    logger.info("  Dimensions: " + std::to_string(summary.width) + " x " +
                std::to_string(summary.height) + " pixels");
    logger.info("  Resolution: " + format_fixed(summary.pixel_size, 2));
    if (summary.statistics) {
        logger.info("  Elevation range: " + format_fixed(summary.statistics->minimum, 2) + " to " +
                    format_fixed(summary.statistics->maximum, 2) + " " + summary.elevation_units);
        logger.info("  Mean elevation: " + format_fixed(summary.statistics->mean, 2) + " " +
                    summary.elevation_units);
    } else {
        logger.warning("  Output contains no valid cells");
    }
    logger.info("  File size: " + format_fixed(summary.file_size_mb, 1) + " MB");
    return summary;
}

} // namespace demforge

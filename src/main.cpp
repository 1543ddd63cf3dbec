/**
 * @file main.cpp
 * @brief Main entry point for demforge
 *
 * Builds resolution-priority DEM mosaics from elevation tiles, converts
 * elevation units in place, integrates cut/fill volumes between two
 * surfaces and extracts contours.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "demforge.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/BatchReport.hpp"
#include "core/CancellationToken.hpp"
#include "core/ContourGenerator.hpp"
#include "core/DifferenceIntegrator.hpp"
#include "core/GdalUtils.hpp"
#include "core/Logger.hpp"
#include "core/MosaicPipeline.hpp"
#include "core/ProfileSampler.hpp"
#include "core/RasterError.hpp"
#include "core/RasterTile.hpp"
#include "core/UnitConversion.hpp"
#include "UnitParser.hpp"
#include "version.h"
#include <chrono>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <iostream>

using namespace demforge;

namespace {

CancellationToken g_cancel;

// Windows and tiles check the token between units of work
void handle_interrupt(int) {
    g_cancel.cancel();
}

int run_mosaic(const JobConfig& job) {
    MosaicPipeline pipeline(job.mosaic);
    MosaicSummary summary = pipeline.run(&g_cancel);

    std::cout << "\nMosaic written to " << summary.output_path << " ("
              << summary.width << " x " << summary.height << ", "
              << summary.tiles_used << " tiles used, "
              << summary.tiles_skipped << " skipped)\n";
    return 0;
}

int run_convert(const JobConfig& job) {
    UnitConversion conversion(job.conversion);
    ConversionStats stats = conversion.run(&g_cancel);

    std::cout << "\nConverted " << stats.converted_cells << " cells in "
              << stats.windows << " windows (" << stats.nodata_cells
              << " nodata cells untouched)\n";
    return 0;
}

int run_cutfill(const JobConfig& job) {
    DifferenceIntegrator integrator(job.cutfill);
    VolumeReport report = integrator.run(&g_cancel);

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== Volume Summary ===\n";
    std::cout << "Cut Volume:  " << std::abs(report.cut) << " " << report.volume_units << "\n";
    std::cout << "Fill Volume: " << report.fill << " " << report.volume_units << "\n";
    std::cout << "Net Volume:  " << report.net << " " << report.volume_units << "\n";
    std::cout << "Difference raster: " << report.difference_path << "\n";
    std::cout << "======================\n";
    return 0;
}

int run_contours(const JobConfig& job) {
    ContourGenerator generator(job.contours);
    ContourResult result = generator.generate(&g_cancel);

    std::cout << "\nWrote " << result.feature_count << " contour lines to "
              << result.output_path << "\n";
    return 0;
}

int run_profile(const JobConfig& job) {
    if (job.profile.lines_path.empty() || job.profile.dem_path.empty()) {
        throw ConfigurationError("profile needs LINES and DEM");
    }
    ProfileSampler sampler(job.profile);
    BatchReport<ElevationProfile> report = sampler.run(&g_cancel);

    size_t rows = 0;
    for (const auto& profile : report.successes()) {
        rows += profile.samples.size();
    }
    std::cout << "\nWrote " << rows << " samples from " << report.success_count()
              << " line(s) to " << job.profile.output_path << "\n";
    std::cout << report.summary() << "\n";
    return report.failure_count() == 0 ? 0 : 1;
}

/**
 * @brief Print geometry and statistics of each raster
 *
 * A raster that cannot be read is reported and the rest are still printed.
 */
int run_inspect(const JobConfig& job) {
    Logger logger("Inspect");
    if (job.inspect_paths.empty()) {
        throw ConfigurationError("inspect needs at least one raster");
    }

    BatchReport<RasterTile> report;
    for (const auto& path : job.inspect_paths) {
        throw_if_cancelled(&g_cancel, "inspect");
        try {
            RasterTile tile = inspect_tile(path);
            std::optional<RasterStatistics> stats = compute_statistics(path);

            std::cout << "\n" << path << "\n";
            std::cout << "  Size:        " << tile.width << " x " << tile.height
                      << " (" << tile.band_count << " band" << (tile.band_count == 1 ? "" : "s") << ")\n";
            std::cout << "  Resolution:  " << format_number(tile.resolution) << "\n";
            Extent extent = tile.extent();
            std::cout << "  Extent:      " << format_number(extent.min_x) << ", "
                      << format_number(extent.min_y) << " - " << format_number(extent.max_x)
                      << ", " << format_number(extent.max_y) << "\n";
            if (tile.nodata) {
                std::cout << "  Nodata:      " << format_number(*tile.nodata) << "\n";
            }
            if (stats) {
                std::cout << "  Elevation:   " << stats->minimum << " to " << stats->maximum
                          << " (mean " << stats->mean << ")\n";
            } else {
                std::cout << "  Elevation:   no valid pixels\n";
            }
            report.add(path, ItemResult<RasterTile>::ok(tile));
        } catch (const RasterError& e) {
            logger.error(e.what());
            report.add(path, ItemResult<RasterTile>::failure(e));
        }
    }

    std::cout << "\n" << report.summary() << "\n";
    return report.failure_count() == 0 ? 0 : 1;
}

} // namespace

/**
 * @brief Main entry point
 *
 * Exit codes: 0 success, 1 processing error, 2 usage error, 130 interrupted.
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();
    }

    const JobConfig& job = cli.get_config();
    Logger::parseLogConfig(job.log_config);
    Logger::setGlobalLogFile(job.log_file);
    Logger logger("demforge");

    ensure_gdal_registered();
    install_gdal_log_handler();
    std::signal(SIGINT, handle_interrupt);

    logger.info("demforge v" + std::string(DEMFORGE_VERSION_STRING) + " - " +
                command_to_string(job.command));
    cli.print_config();

    if (cli.is_dry_run()) {
        logger.info("Dry run mode - configuration validated successfully");
        return 0;
    }

    try {
        int status = 0;
        switch (job.command) {
            case Command::MOSAIC:   status = run_mosaic(job); break;
            case Command::CONVERT:  status = run_convert(job); break;
            case Command::CUTFILL:  status = run_cutfill(job); break;
            case Command::CONTOURS: status = run_contours(job); break;
            case Command::PROFILE:  status = run_profile(job); break;
            case Command::INSPECT:  status = run_inspect(job); break;
            case Command::NONE:
                std::cerr << "No command given\n";
                return 2;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logger.info("Finished in " + std::to_string(elapsed.count()) + "ms");
        return status;

    } catch (const RasterError& e) {
        if (e.code() == RasterErrorCode::CANCELLED) {
            std::cerr << "Interrupted: " << e.what() << "\n";
            return 130;
        }
        std::cerr << "Error: " << e.what() << "\n";
        if (!e.detail().empty()) {
            std::cerr << e.detail() << "\n";
        }
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const UnitParseError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

// Example usage:
//
// Mosaic downloaded lidar tiles, clip to a site and convert to feet:
// ./demforge mosaic --manifest downloads/manifest.csv -o site_dem.tif \
//            --target-crs EPSG:6342 --aoi site_boundary.geojson \
//            --convert-units m:ft
//
// Cut/fill between existing ground and a design surface (feet -> cubic yards):
// ./demforge cutfill existing.tif proposed.tif -o difference.tif
//
// One-foot contours:
// ./demforge contours site_dem.tif -o contours.gpkg --driver GPKG --interval 1

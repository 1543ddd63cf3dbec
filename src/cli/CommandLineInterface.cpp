/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "GdalUtils.hpp"
#include "Logger.hpp"
#include "RasterError.hpp"
#include "UnitParser.hpp"
#include "version.h"
#include <iostream>
#include <sstream>

namespace demforge {

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.begin_section("GENERAL OPTIONS");
    parser.add_option("config", "c", "Load job settings from a JSON file");
    parser.add_option("create-config", "", "Write a default JSON job file and exit");
    parser.add_option("output", "o", "Output file (mosaic GeoTIFF, difference GeoTIFF, contour file or profile CSV)");
    parser.add_option("log-level", "", "1=ERROR 2=WARNING 3=INFO 4=DETAILED 5=DEBUG 6=TRACE; "
                                       "per facility: \"3,WarpEngine=6\"", "3");
    parser.add_option("log-file", "", "Also log to file (append if exists)");
    parser.add_flag("verbose", "v", "Trace everything (same as --log-level 6)");
    parser.add_flag("silent", "s", "Errors only (same as --log-level 1)");
    parser.add_flag("dry-run", "", "Parse and validate arguments without processing");
    parser.add_flag("version", "", "Show version information");

    parser.begin_section("MOSAIC OPTIONS");
    parser.add_option("manifest", "m", "Tile manifest CSV (local_path, dem_gsd_meters, status, ...)");
    parser.add_option("vrt-resample", "", "Resampling inside the VRT", "bilinear");
    parser.add_option("resolution", "", "VRT pixel size (default: finest tile)");
    parser.add_flag("fallback-to-coarser", "", "Fill gaps in the finest tiles from coarser tiles");
    parser.add_flag("no-fallback-to-coarser", "", "Use the finest resolution group only (default)");
    parser.add_flag("keep-vrt", "", "Keep the intermediate <output>_temp.vrt");
    parser.add_option("target-crs", "t", "Output CRS: EPSG code (EPSG:6342) or WKT");
    parser.add_option("bounds", "b", "Clip rectangle min_x,min_y,max_x,max_y in the output CRS");
    parser.add_option("bounds-crs", "", "CRS of --bounds when it differs from the output CRS");
    parser.add_option("aoi", "a", "Clip to the extent of a vector AOI (any CRS)");
    parser.add_option("resample", "r", "Warp/cutfill resampling: near, bilinear, cubic, cubicspline, "
                                       "lanczos, average", "bilinear (cutfill: near)");
    parser.add_option("output-resolution", "", "Output pixel size in output CRS units");
    parser.add_option("dst-nodata", "", "Nodata value of the output");
    parser.add_option("creation-options", "", "GeoTIFF creation options, comma separated",
                      "COMPRESS=LZW,TILED=YES,BIGTIFF=IF_SAFER");
    parser.add_option("convert-units", "", "Convert elevations after mosaicking: factor or from:to (m:ft)");
    parser.add_option("elevation-units", "", "Elevation unit label for the summary", "m");

    parser.begin_section("CONVERT OPTIONS");
    parser.add_option("factor", "f", "Multiplier or from:to units (m:ft, ft:m, us-ft:m)", "3.28084");
    parser.add_option("band", "", "Band number", "1");
    parser.add_option("window-size", "", "Processing window edge in pixels", "1024");

    parser.begin_section("CUTFILL OPTIONS");
    parser.add_option("existing", "e", "Existing ground surface");
    parser.add_option("proposed", "p", "Proposed (design) surface");
    parser.add_option("surface-units", "", "Linear unit of both surfaces: m, ft, us-ft", "ft");
    parser.add_option("volume-units", "", "Report volumes in m3, ft3 or yd3", "yd3");
    parser.add_option("volume-divisor", "", "Divide cubic surface units by this value", "27");
    parser.add_option("nodata", "", "Nodata value of the difference raster", "-9999");
    parser.add_option("strip-rows", "", "Rows processed per strip", "256");

    parser.begin_section("CONTOUR OPTIONS");
    parser.add_option("interval", "i", "Contour interval", "1");
    parser.add_option("offset", "", "Level offset", "0");
    parser.add_option("driver", "", "OGR vector driver", "ESRI Shapefile");
    parser.add_option("elevation-field", "", "Elevation attribute name", "ELEV");
    parser.add_flag("3d", "", "Write 3D lines");

    parser.begin_section("PROFILE OPTIONS");
    parser.add_option("step", "", "Sample spacing along each line in DEM units", "4");
    parser.add_option("name-field", "", "Line attribute naming each profile");
    parser.add_option("layer", "", "Line layer (default: first layer)");
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("demforge",
        "DEMFORGE - Resolution-priority DEM mosaics, cut/fill volumes and contours");
    register_options(parser);

    if (!parser.parse(args)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "demforge v" << DEMFORGE_VERSION_STRING << std::endl;
        std::cout << "Built with GDAL " << GDALVersionInfo("RELEASE_NAME") << std::endl;
        exit_code_ = 0;
        return false;
    }

    try {
        if (auto config_path = parser.get("create-config")) {
            JobConfig defaults;
            defaults.command = Command::MOSAIC;
            ConfigurationManager().save_to_file(*config_path, defaults);
            std::cout << "Created default configuration file: " << *config_path << std::endl;
            exit_code_ = 0;
            return false;
        }

        if (auto config_file = parser.get("config")) {
            ConfigurationManager().load_from_file(*config_file, config_);
        }

        apply_positionals(parser.get_positional());
        parse_all_options(parser);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        exit_code_ = 2;
        return false;
    } catch (const UnitParseError& e) {
        std::cerr << e.what() << std::endl;
        exit_code_ = 2;
        return false;
    } catch (const RasterError& e) {
        std::cerr << e.what() << std::endl;
        exit_code_ = 2;
        return false;
    }

    if (config_.command == Command::NONE) {
        std::cerr << "No command given. Run 'demforge --help' for usage." << std::endl;
        exit_code_ = 2;
        return false;
    }

    return true;
}

void CommandLineInterface::apply_positionals(const std::vector<std::string>& positionals) {
    if (positionals.empty()) {
        return;
    }

    config_.command = parse_command(positionals.front());
    std::vector<std::string> files(positionals.begin() + 1, positionals.end());
    if (files.empty()) {
        return;
    }

    switch (config_.command) {
        case Command::MOSAIC:
            config_.mosaic.tile_paths = files;
            break;
        case Command::CONVERT:
            if (files.size() != 1) {
                throw ConfigurationError("convert takes exactly one raster");
            }
            config_.conversion.raster_path = files.front();
            break;
        case Command::CUTFILL:
            if (files.size() != 2) {
                throw ConfigurationError("cutfill takes EXISTING PROPOSED");
            }
            config_.cutfill.existing_path = files[0];
            config_.cutfill.proposed_path = files[1];
            break;
        case Command::CONTOURS:
            if (files.size() != 1) {
                throw ConfigurationError("contours takes exactly one raster");
            }
            config_.contours.input_path = files.front();
            break;
        case Command::PROFILE:
            if (files.size() != 2) {
                throw ConfigurationError("profile takes LINES DEM");
            }
            config_.profile.lines_path = files[0];
            config_.profile.dem_path = files[1];
            break;
        case Command::INSPECT:
            config_.inspect_paths = files;
            break;
        case Command::NONE:
            break;
    }
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Logging
    if (auto value = parser.get("log-level")) {
        config_.log_config = *value;
    }
    if (parser.get_flag("silent")) {
        config_.log_config = "1";
    }
    if (parser.get_flag("verbose")) {
        config_.log_config = "6";
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = *value;
    }
    dry_run_ = parser.get_flag("dry-run");

    // Output path is shared by the commands that write one file
    if (auto value = parser.get("output")) {
        switch (config_.command) {
            case Command::MOSAIC:   config_.mosaic.output_path = *value; break;
            case Command::CUTFILL:  config_.cutfill.output_path = *value; break;
            case Command::CONTOURS: config_.contours.output_path = *value; break;
            case Command::PROFILE:  config_.profile.output_path = *value; break;
            default:
                throw ConfigurationError("--output is not used by this command");
        }
    }

    // Mosaic
    MosaicConfig& mosaic = config_.mosaic;
    WarpConfig& warp = mosaic.warp;
    if (auto value = parser.get("manifest")) mosaic.manifest_path = *value;
    if (auto value = parser.get("vrt-resample")) mosaic.vrt_resample = parse_resample(*value);
    if (parser.get("resolution")) mosaic.resolution_override = parse_number(parser, "resolution");
    parse_boolean_option(parser, "fallback-to-coarser", "no-fallback-to-coarser",
                         mosaic.fallback_to_coarser);
    if (parser.get_flag("keep-vrt")) mosaic.keep_vrt = true;
    if (auto value = parser.get("target-crs")) warp.target_crs = *value;
    if (auto value = parser.get("bounds")) warp.clip_bounds = parse_bounds(*value);
    if (auto value = parser.get("bounds-crs")) warp.clip_bounds_crs = *value;
    if (auto value = parser.get("aoi")) warp.aoi_path = *value;
    if (parser.get("output-resolution")) {
        warp.output_resolution = parse_number(parser, "output-resolution");
    }
    if (parser.get("dst-nodata")) warp.dst_nodata = parse_number(parser, "dst-nodata");
    if (auto value = parser.get("creation-options")) {
        warp.creation_options = split_list(*value);
        config_.cutfill.creation_options = warp.creation_options;
    }
    if (auto value = parser.get("convert-units")) {
        mosaic.unit_factor = UnitParser::parse_conversion_factor(*value);
        auto colon = value->find(':');
        if (colon != std::string::npos && !parser.get("elevation-units")) {
            mosaic.elevation_units = UnitParser::unit_to_string(
                UnitParser::parse_length_unit(value->substr(colon + 1)));
        }
    }
    if (auto value = parser.get("elevation-units")) mosaic.elevation_units = *value;

    if (auto value = parser.get("resample")) {
        ResampleAlgorithm algorithm = parse_resample(*value);
        warp.resample = algorithm;
        config_.cutfill.resample = algorithm;
    }

    // Convert
    if (auto value = parser.get("factor")) {
        config_.conversion.factor = UnitParser::parse_conversion_factor(*value);
    }
    if (parser.get("band")) {
        int band = parse_integer(parser, "band");
        config_.conversion.band = band;
        config_.contours.band = band;
        config_.profile.band = band;
    }
    if (parser.get("window-size")) {
        int window = parse_integer(parser, "window-size");
        if (window < 1) {
            throw ConfigurationError("--window-size must be positive");
        }
        config_.conversion.window_size = static_cast<size_t>(window);
        mosaic.conversion_window = static_cast<size_t>(window);
    }

    // Cut/fill
    CutFillConfig& cutfill = config_.cutfill;
    if (auto value = parser.get("existing")) cutfill.existing_path = *value;
    if (auto value = parser.get("proposed")) cutfill.proposed_path = *value;
    if (parser.get("volume-units") || parser.get("surface-units")) {
        LengthUnit surface_units = UnitParser::parse_length_unit(
            parser.get("surface-units").value_or("ft"));
        VolumeUnit volume_units = UnitParser::parse_volume_unit(
            parser.get("volume-units").value_or("yd3"));
        cutfill.volume_divisor = UnitParser::volume_divisor(surface_units, volume_units);
        cutfill.volume_units = UnitParser::volume_label(volume_units);
    }
    if (parser.get("volume-divisor")) {
        cutfill.volume_divisor = parse_number(parser, "volume-divisor");
        if (!(cutfill.volume_divisor > 0.0)) {
            throw ConfigurationError("--volume-divisor must be positive");
        }
    }
    if (parser.get("nodata")) cutfill.nodata = parse_number(parser, "nodata");
    if (parser.get("strip-rows")) cutfill.strip_rows = parse_integer(parser, "strip-rows");

    // Contours
    ContourConfig& contours = config_.contours;
    if (parser.get("interval")) contours.interval = parse_number(parser, "interval");
    if (parser.get("offset")) contours.offset = parse_number(parser, "offset");
    if (auto value = parser.get("driver")) contours.driver = *value;
    if (auto value = parser.get("elevation-field")) contours.elevation_field = *value;
    if (parser.get_flag("3d")) contours.three_d = true;

    // Profiles
    ProfileConfig& profile = config_.profile;
    if (parser.get("step")) {
        profile.step = parse_number(parser, "step");
        if (!(profile.step > 0.0)) {
            throw ConfigurationError("--step must be positive");
        }
    }
    if (auto value = parser.get("name-field")) profile.name_field = *value;
    if (auto value = parser.get("layer")) profile.layer_name = *value;
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

double CommandLineInterface::parse_number(const SimpleCommandLineParser& parser,
                                          const std::string& name) {
    auto value = parser.get_as<double>(name);
    if (!value) {
        throw ConfigurationError("--" + name + " expects a number, got '" +
                                 parser.get(name).value_or("") + "'");
    }
    return *value;
}

int CommandLineInterface::parse_integer(const SimpleCommandLineParser& parser,
                                        const std::string& name) {
    auto value = parser.get_as<int>(name);
    if (!value) {
        throw ConfigurationError("--" + name + " expects an integer, got '" +
                                 parser.get(name).value_or("") + "'");
    }
    return *value;
}

Extent CommandLineInterface::parse_bounds(const std::string& bounds_str) {
    std::vector<double> values;
    for (const auto& part : split_list(bounds_str)) {
        size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(part, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != part.size()) {
            throw ConfigurationError("invalid bounds value '" + part + "'");
        }
        values.push_back(number);
    }
    if (values.size() != 4) {
        throw ConfigurationError("--bounds needs min_x,min_y,max_x,max_y");
    }
    Extent bounds(values[0], values[1], values[2], values[3]);
    if (bounds.is_empty()) {
        throw ConfigurationError("--bounds must have min < max on both axes");
    }
    return bounds;
}

std::vector<std::string> CommandLineInterface::split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void CommandLineInterface::print_config() const {
    Logger logger("CommandLineInterface");
    if (!logger.shouldOutput(LogLevel::DETAILED)) return;

    logger.detailed("=== demforge configuration ===");
    logger.detailed("Command: " + command_to_string(config_.command));
    if (config_.config_file) {
        logger.detailed("Job file: " + *config_.config_file);
    }
    logger.detailed("Log level: " + config_.log_config);

    switch (config_.command) {
        case Command::MOSAIC: {
            const MosaicConfig& mosaic = config_.mosaic;
            logger.detailed("Tiles: " + std::to_string(mosaic.tile_paths.size()) +
                            (mosaic.manifest_path ? " + manifest " + *mosaic.manifest_path : ""));
            logger.detailed("Output: " + mosaic.output_path);
            logger.detailed("Fallback to coarser: " +
                            std::string(mosaic.fallback_to_coarser ? "yes" : "no"));
            logger.detailed("Target CRS: " + mosaic.warp.target_crs.value_or("(source)"));
            if (mosaic.warp.clip_bounds) {
                const Extent& b = *mosaic.warp.clip_bounds;
                logger.detailed("Bounds: " + format_number(b.min_x) + "," + format_number(b.min_y) +
                                "," + format_number(b.max_x) + "," + format_number(b.max_y));
            }
            if (mosaic.warp.aoi_path) {
                logger.detailed("AOI: " + *mosaic.warp.aoi_path);
            }
            logger.detailed("Resampling: " + resample_to_string(mosaic.warp.resample));
            if (mosaic.unit_factor) {
                logger.detailed("Unit factor: " + format_number(*mosaic.unit_factor));
            }
            break;
        }
        case Command::CONVERT:
            logger.detailed("Raster: " + config_.conversion.raster_path);
            logger.detailed("Factor: " + format_number(config_.conversion.factor));
            break;
        case Command::CUTFILL:
            logger.detailed("Existing: " + config_.cutfill.existing_path);
            logger.detailed("Proposed: " + config_.cutfill.proposed_path);
            logger.detailed("Output: " + config_.cutfill.output_path);
            logger.detailed("Volume divisor: " + format_number(config_.cutfill.volume_divisor) +
                            " (" + config_.cutfill.volume_units + ")");
            break;
        case Command::CONTOURS:
            logger.detailed("Input: " + config_.contours.input_path);
            logger.detailed("Output: " + config_.contours.output_path);
            logger.detailed("Interval: " + format_number(config_.contours.interval));
            break;
        case Command::PROFILE:
            logger.detailed("Lines: " + config_.profile.lines_path);
            logger.detailed("DEM: " + config_.profile.dem_path);
            logger.detailed("Output: " + config_.profile.output_path);
            logger.detailed("Step: " + format_number(config_.profile.step));
            break;
        case Command::INSPECT:
            logger.detailed("Rasters: " + std::to_string(config_.inspect_paths.size()));
            break;
        case Command::NONE:
            break;
    }
}

} // namespace demforge

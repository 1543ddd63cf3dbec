/**
 * @file ConfigurationManager.cpp
 * @brief JSON serialization of job settings
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConfigurationManager.hpp"
#include "GdalUtils.hpp"
#include "RasterError.hpp"
#include "UnitParser.hpp"
#include <fstream>

using json = nlohmann::json;

namespace demforge {

namespace {

// Helpers keep the key name in every error message
template <typename T>
void read_value(const json& section, const std::string& key, T& target) {
    if (!section.contains(key) || section[key].is_null()) return;
    try {
        target = section[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError("invalid value for '" + key + "': " + e.what());
    }
}

template <typename T>
void read_optional(const json& section, const std::string& key, std::optional<T>& target) {
    if (!section.contains(key)) return;
    if (section[key].is_null()) {
        target.reset();
        return;
    }
    try {
        target = section[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError("invalid value for '" + key + "': " + e.what());
    }
}

void read_resample(const json& section, const std::string& key, ResampleAlgorithm& target) {
    std::string name;
    read_value(section, key, name);
    if (name.empty()) return;
    try {
        target = parse_resample(name);
    } catch (const RasterError& e) {
        throw ConfigurationError("invalid value for '" + key + "': " + e.what());
    }
}

void read_bounds(const json& section, const std::string& key, std::optional<Extent>& target) {
    std::optional<std::vector<double>> values;
    read_optional(section, key, values);
    if (!section.contains(key)) return;
    if (!values) {
        target.reset();
        return;
    }
    if (values->size() != 4) {
        throw ConfigurationError("'" + key + "' needs [min_x, min_y, max_x, max_y]");
    }
    target = Extent((*values)[0], (*values)[1], (*values)[2], (*values)[3]);
}

json optional_to_json(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::string command_to_string(Command command) {
    switch (command) {
        case Command::NONE:     return "";
        case Command::MOSAIC:   return "mosaic";
        case Command::CONVERT:  return "convert";
        case Command::CUTFILL:  return "cutfill";
        case Command::CONTOURS: return "contours";
        case Command::PROFILE:  return "profile";
        case Command::INSPECT:  return "inspect";
    }
    return "";
}

Command parse_command(const std::string& name) {
    if (name == "mosaic") return Command::MOSAIC;
    if (name == "convert") return Command::CONVERT;
    if (name == "cutfill" || name == "cut-fill") return Command::CUTFILL;
    if (name == "contours") return Command::CONTOURS;
    if (name == "profile" || name == "profiles") return Command::PROFILE;
    if (name == "inspect") return Command::INSPECT;
    throw ConfigurationError("unknown command '" + name +
                             "' (use mosaic, convert, cutfill, contours, profile or inspect)");
}

void ConfigurationManager::apply_json(const json& document, JobConfig& config) const {
    if (!document.is_object()) {
        throw ConfigurationError("job file must contain a JSON object");
    }

    std::string command;
    read_value(document, "command", command);
    if (!command.empty()) {
        config.command = parse_command(command);
    }
    if (document.contains("log_level") && document["log_level"].is_number_integer()) {
        config.log_config = std::to_string(document["log_level"].get<int>());
    } else {
        read_value(document, "log_level", config.log_config);
    }
    read_optional(document, "log_file", config.log_file);

    if (document.contains("mosaic")) {
        const json& section = document["mosaic"];
        MosaicConfig& mosaic = config.mosaic;
        read_value(section, "tiles", mosaic.tile_paths);
        read_optional(section, "manifest", mosaic.manifest_path);
        read_value(section, "output", mosaic.output_path);
        read_resample(section, "vrt_resample", mosaic.vrt_resample);
        read_optional(section, "resolution", mosaic.resolution_override);
        read_value(section, "fallback_to_coarser", mosaic.fallback_to_coarser);
        read_value(section, "keep_vrt", mosaic.keep_vrt);
        read_value(section, "elevation_units", mosaic.elevation_units);
        read_value(section, "window_size", mosaic.conversion_window);

        if (section.contains("convert_units") && !section["convert_units"].is_null()) {
            const json& units = section["convert_units"];
            try {
                mosaic.unit_factor = units.is_number()
                    ? UnitParser::parse_conversion_factor(format_number(units.get<double>()))
                    : UnitParser::parse_conversion_factor(units.get<std::string>());
            } catch (const UnitParseError& e) {
                throw ConfigurationError("invalid value for 'convert_units': " + std::string(e.what()));
            } catch (const json::exception& e) {
                throw ConfigurationError("invalid value for 'convert_units': " + std::string(e.what()));
            }
        }

        WarpConfig& warp = mosaic.warp;
        read_optional(section, "target_crs", warp.target_crs);
        read_bounds(section, "bounds", warp.clip_bounds);
        read_optional(section, "bounds_crs", warp.clip_bounds_crs);
        read_optional(section, "aoi", warp.aoi_path);
        read_resample(section, "resample", warp.resample);
        read_optional(section, "output_resolution", warp.output_resolution);
        read_optional(section, "dst_nodata", warp.dst_nodata);
        read_value(section, "creation_options", warp.creation_options);
    }

    if (document.contains("convert")) {
        const json& section = document["convert"];
        read_value(section, "raster", config.conversion.raster_path);
        if (section.contains("factor") && section["factor"].is_string()) {
            try {
                config.conversion.factor =
                    UnitParser::parse_conversion_factor(section["factor"].get<std::string>());
            } catch (const UnitParseError& e) {
                throw ConfigurationError("invalid value for 'factor': " + std::string(e.what()));
            }
        } else {
            read_value(section, "factor", config.conversion.factor);
        }
        read_value(section, "band", config.conversion.band);
        read_value(section, "window_size", config.conversion.window_size);
    }

    if (document.contains("cutfill")) {
        const json& section = document["cutfill"];
        CutFillConfig& cutfill = config.cutfill;
        read_value(section, "existing", cutfill.existing_path);
        read_value(section, "proposed", cutfill.proposed_path);
        read_value(section, "output", cutfill.output_path);
        read_resample(section, "resample", cutfill.resample);
        read_value(section, "volume_divisor", cutfill.volume_divisor);
        read_value(section, "volume_units", cutfill.volume_units);
        read_value(section, "nodata", cutfill.nodata);
        read_value(section, "strip_rows", cutfill.strip_rows);
        read_value(section, "creation_options", cutfill.creation_options);
    }

    if (document.contains("contours")) {
        const json& section = document["contours"];
        ContourConfig& contours = config.contours;
        read_value(section, "input", contours.input_path);
        read_value(section, "output", contours.output_path);
        read_value(section, "driver", contours.driver);
        read_value(section, "interval", contours.interval);
        read_value(section, "offset", contours.offset);
        read_value(section, "band", contours.band);
        read_value(section, "elevation_field", contours.elevation_field);
        read_value(section, "three_d", contours.three_d);
    }

    if (document.contains("profile")) {
        const json& section = document["profile"];
        ProfileConfig& profile = config.profile;
        read_value(section, "lines", profile.lines_path);
        read_value(section, "dem", profile.dem_path);
        read_value(section, "output", profile.output_path);
        read_optional(section, "layer", profile.layer_name);
        read_optional(section, "name_field", profile.name_field);
        read_value(section, "step", profile.step);
        read_value(section, "band", profile.band);
    }

    if (document.contains("inspect")) {
        read_value(document["inspect"], "rasters", config.inspect_paths);
    }
}

json ConfigurationManager::to_json(const JobConfig& config) const {
    const MosaicConfig& mosaic = config.mosaic;
    const WarpConfig& warp = mosaic.warp;

    json bounds = nullptr;
    if (warp.clip_bounds) {
        bounds = json::array({warp.clip_bounds->min_x, warp.clip_bounds->min_y,
                              warp.clip_bounds->max_x, warp.clip_bounds->max_y});
    }

    json document;
    document["command"] = command_to_string(config.command);
    document["log_level"] = config.log_config;
    document["log_file"] = optional_to_json(config.log_file);

    document["mosaic"] = {
        {"tiles", mosaic.tile_paths},
        {"manifest", optional_to_json(mosaic.manifest_path)},
        {"output", mosaic.output_path},
        {"vrt_resample", resample_to_string(mosaic.vrt_resample)},
        {"resolution", optional_to_json(mosaic.resolution_override)},
        {"fallback_to_coarser", mosaic.fallback_to_coarser},
        {"keep_vrt", mosaic.keep_vrt},
        {"target_crs", optional_to_json(warp.target_crs)},
        {"bounds", bounds},
        {"bounds_crs", optional_to_json(warp.clip_bounds_crs)},
        {"aoi", optional_to_json(warp.aoi_path)},
        {"resample", resample_to_string(warp.resample)},
        {"output_resolution", optional_to_json(warp.output_resolution)},
        {"dst_nodata", optional_to_json(warp.dst_nodata)},
        {"creation_options", warp.creation_options},
        {"convert_units", optional_to_json(mosaic.unit_factor)},
        {"elevation_units", mosaic.elevation_units},
        {"window_size", mosaic.conversion_window}
    };

    document["convert"] = {
        {"raster", config.conversion.raster_path},
        {"factor", config.conversion.factor},
        {"band", config.conversion.band},
        {"window_size", config.conversion.window_size}
    };

    document["cutfill"] = {
        {"existing", config.cutfill.existing_path},
        {"proposed", config.cutfill.proposed_path},
        {"output", config.cutfill.output_path},
        {"resample", resample_to_string(config.cutfill.resample)},
        {"volume_divisor", config.cutfill.volume_divisor},
        {"volume_units", config.cutfill.volume_units},
        {"nodata", config.cutfill.nodata},
        {"strip_rows", config.cutfill.strip_rows},
        {"creation_options", config.cutfill.creation_options}
    };

    document["contours"] = {
        {"input", config.contours.input_path},
        {"output", config.contours.output_path},
        {"driver", config.contours.driver},
        {"interval", config.contours.interval},
        {"offset", config.contours.offset},
        {"band", config.contours.band},
        {"elevation_field", config.contours.elevation_field},
        {"three_d", config.contours.three_d}
    };

    document["profile"] = {
        {"lines", config.profile.lines_path},
        {"dem", config.profile.dem_path},
        {"output", config.profile.output_path},
        {"layer", optional_to_json(config.profile.layer_name)},
        {"name_field", optional_to_json(config.profile.name_field)},
        {"step", config.profile.step},
        {"band", config.profile.band}
    };

    document["inspect"] = {{"rasters", config.inspect_paths}};
    return document;
}

void ConfigurationManager::load_from_file(const std::string& filename, JobConfig& config) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("could not open config file: " + filename);
    }

    json document;
    try {
        file >> document;
    } catch (const json::exception& e) {
        throw ConfigurationError("error parsing " + filename + ": " + e.what());
    }

    apply_json(document, config);
    config.config_file = filename;
}

void ConfigurationManager::save_to_file(const std::string& filename, const JobConfig& config) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("could not create config file: " + filename);
    }
    file << to_json(config).dump(2) << std::endl;
    if (!file) {
        throw ConfigurationError("could not write config file: " + filename);
    }
}

} // namespace demforge

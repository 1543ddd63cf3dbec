/**
 * @file ConfigurationManager.hpp
 * @brief JSON job files for the demforge commands
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "demforge.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace demforge {

/**
 * @brief Exception thrown when a job file cannot be read or has a bad value
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

enum class Command {
    NONE,
    MOSAIC,
    CONVERT,
    CUTFILL,
    CONTOURS,
    PROFILE,
    INSPECT
};

std::string command_to_string(Command command);

/**
 * @throws ConfigurationError for an unknown command name
 */
Command parse_command(const std::string& name);

/**
 * @brief Everything one invocation needs
 */
struct JobConfig {
    Command command = Command::NONE;
    MosaicConfig mosaic;
    ConversionConfig conversion;
    CutFillConfig cutfill;
    ContourConfig contours;
    ProfileConfig profile;
    std::vector<std::string> inspect_paths;

    std::string log_config = "3";
    std::optional<std::string> log_file;
    std::optional<std::string> config_file;
};

/**
 * @brief Loads and saves JobConfig as JSON
 *
 * Layout: top-level "command", "log_level", "log_file" plus one object per
 * command ("mosaic", "convert", "cutfill", "contours", "profile", "inspect").
 * Keys missing from the file keep their current value, so a file only needs
 * the settings that differ from the defaults.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Apply a job file on top of @p config
     * @throws ConfigurationError if the file is unreadable or a value is invalid
     */
    void load_from_file(const std::string& filename, JobConfig& config) const;

    /**
     * @throws ConfigurationError if the file cannot be written
     */
    void save_to_file(const std::string& filename, const JobConfig& config) const;

    void apply_json(const nlohmann::json& document, JobConfig& config) const;
    nlohmann::json to_json(const JobConfig& config) const;
};

} // namespace demforge

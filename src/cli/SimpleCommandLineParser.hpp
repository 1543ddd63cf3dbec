/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser with subcommand support
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace demforge {

/**
 * @brief Simple command-line argument parser
 *
 * Options are --long, --long=value or -s value. Values that look like
 * negative numbers ("-120.5") are accepted as option values. Everything
 * else is positional; the first positional is the command name.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        std::string section;
        bool has_value;
        std::string default_value;

        Option() : has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, const std::string& section,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              section(section), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Following add_option/add_flag calls are listed under this heading in --help
     */
    void begin_section(const std::string& title) {
        current_section_ = title;
        section_order_.push_back(title);
    }

    /**
     * @brief Register an option taking a value
     *
     * The default is shown in --help only; unset options stay absent so a
     * job file value is not overridden by a command-line default.
     */
    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, current_section_, true,
                               default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, current_section_, false));
    }

    /**
     * @brief Parse command line arguments
     * @return false on a parse error or when help was requested (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    bool parse(const std::vector<std::string>& args) {
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h" || arg == "-?") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::optional<std::string> value;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!value) {
                        if (i + 1 >= args.size() || !is_value(args[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args[++i];
                    }
                    parsed_values_[option_name] = *value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_negative_number(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args.size() || !is_value(args[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " <command> [OPTIONS] [FILES...]\n\n";

        std::cout << "COMMANDS:\n";
        std::cout << "    mosaic     Mosaic tiles (highest resolution first), clip, reproject, convert\n";
        std::cout << "    convert    Multiply a raster's values in place (unit conversion)\n";
        std::cout << "    cutfill    Difference two surfaces and report cut/fill volumes\n";
        std::cout << "    contours   Generate contour lines from a DEM\n";
        std::cout << "    profile    Sample a DEM along vector lines into a CSV table\n";
        std::cout << "    inspect    Print georeferencing and statistics of rasters\n\n";

        for (const auto& section : section_order_) {
            std::cout << section << ":\n";
            for (const auto& name : option_order_) {
                const auto& option = options_.at(name);
                if (option.section == section) {
                    print_help_line(option);
                }
            }
            std::cout << "\n";
        }

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " mosaic tiles/*.tif --output dem.tif --aoi site.shp --convert-units m:ft\n";
        std::cout << "    " << program_name_ << " mosaic --manifest tiles/manifest.csv --target-crs EPSG:6342\n";
        std::cout << "    " << program_name_ << " cutfill --existing eg.tif --proposed fg.tif --output diff.tif\n";
        std::cout << "    " << program_name_ << " contours dem.tif --interval 2 --output contours.shp\n";
        std::cout << "    " << program_name_ << " mosaic --config job.json --log-level 4,WarpEngine=6\n";
    }

private:
    static bool is_negative_number(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    static bool is_value(const std::string& arg) {
        return !arg.starts_with("-") || is_negative_number(arg);
    }

    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            option_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    void print_help_line(const Option& option) const {
        std::string usage = "    ";
        if (!option.short_name.empty()) {
            usage += "-" + option.short_name + ", ";
        }
        usage += "--" + option.long_name;
        if (option.has_value) {
            usage += " VALUE";
        }
        if (usage.size() < 34) {
            usage.append(34 - usage.size(), ' ');
        } else {
            usage += "  ";
        }
        std::cout << usage << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::string current_section_ = "OPTIONS";
    std::vector<std::string> section_order_;
    std::vector<std::string> option_order_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace demforge

/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the demforge commands
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "ConfigurationManager.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace demforge {

/**
 * @brief Parses arguments into a JobConfig
 *
 * Precedence: built-in defaults, then the --config job file, then
 * command-line options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a command should run; otherwise see exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);
    bool parse_arguments(const std::vector<std::string>& args);

    const JobConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit code when parse_arguments returned false
     *
     * 0 after --help, --version or --create-config; 2 for usage errors.
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Log the effective configuration at DETAILED level
     */
    void print_config() const;

private:
    JobConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void register_options(SimpleCommandLineParser& parser) const;
    void parse_all_options(const SimpleCommandLineParser& parser);
    void apply_positionals(const std::vector<std::string>& positionals);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    static double parse_number(const SimpleCommandLineParser& parser, const std::string& name);
    static int parse_integer(const SimpleCommandLineParser& parser, const std::string& name);
    static Extent parse_bounds(const std::string& bounds_str);
    static std::vector<std::string> split_list(const std::string& text);
};

} // namespace demforge

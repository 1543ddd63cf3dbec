/**
 * @file Logger.hpp
 * @brief Facility-based logging with verbosity control
 *
 * Every component owns a Logger named after itself ("MosaicBuilder",
 * "WarpEngine", ...). Output passes through a single verbosity check in
 * outputMessage(); per-facility thresholds override the global default so a
 * run can trace one component while keeping the rest at INFO.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace demforge {

/**
 * @brief Log levels
 *
 * Level 1: Errors (operation failed)
 * Level 2: Warnings (input skipped, cleanup failed)
 * Level 3: Information (stage progress, results)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, GDAL arguments)
 * Level 6: Detailed debugging (per-window values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Short tag printed in front of each message ("ERROR", "WARN", ...)
 */
const char* log_level_tag(LogLevel level);

class Logger {
public:
    Logger();

    /**
     * @brief Construct a logger for a facility
     * @param component_name Facility name used for level lookup and output prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Construct with an explicit level and optional file output
     * @param level Threshold for this instance
     * @param log_file Optional path to a log file (appended)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it passes the effective verbosity level
     *
     * Repeated identical messages are folded into a single
     * "previous message occurred N times" line.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or clear the per-instance log file
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summaries and all output streams
     */
    void flush() const;

    // ========================================================================
    // Facility registry
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Route every logger's output to a shared file as well
     *
     * Used by the command line's --log-file option. Passing nullopt stops
     * shared file output.
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Parse a level given as a number (1-6) or a name ("debug")
     * @throws std::invalid_argument for unrecognized input
     */
    static LogLevel parseLevel(const std::string& text);

    /**
     * @brief Apply a log configuration string
     *
     * "5" sets the default to DEBUG; "4,WarpEngine=6" sets the default to
     * DETAILED and traces the warper; "default=3" is accepted as well.
     */
    static void parseLogConfig(const std::string& config);

    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat folding state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void doOutput(LogLevel level, const std::string& message) const;
    void flushRepeats() const;
};

} // namespace demforge

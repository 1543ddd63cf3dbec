/**
 * @file Logger.cpp
 * @brief Implementation of facility-based logging
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace demforge {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(begin, end - begin + 1);
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
    return stamp;
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?";
}

Logger::Logger()
    : current_level_(LogLevel::WARNING), repeat_count_(0), has_last_message_(false) {}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      repeat_count_(0), has_last_message_(false) {}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), repeat_count_(0), has_last_message_(false) {
    setLogFile(log_file);
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeats();
    std::cout.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    flushRepeats();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flushRepeats() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    log_file_path_ = log_file;
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (log_file.has_value()) {
        file_stream_ = openLogFile(*log_file);
    }
}

std::shared_ptr<std::ofstream> Logger::openLogFile(const std::string& path) {
    try {
        std::filesystem::path log_path(path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!stream->is_open()) {
            // Not routed through outputMessage to avoid recursion
            std::cerr << "Warning: Failed to open log file: " << path << std::endl;
            return nullptr;
        }
        return stream;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Cannot create log directory: " << e.what() << std::endl;
        return nullptr;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    std::ostringstream line;
    line << "[" << timestamp_now() << "] " << log_level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    std::cout << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (global_file_stream_ && global_file_stream_->is_open()) {
        *global_file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeats();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (global_file_stream_) {
        global_file_stream_->flush();
    }
}

// ============================================================================
// Facility registry
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    auto stream = log_file.has_value() ? openLogFile(*log_file) : nullptr;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_file_stream_ = stream;
}

LogLevel Logger::parseLevel(const std::string& text) {
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "detailed" || lower == "detail") return LogLevel::DETAILED;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;

    size_t consumed = 0;
    int value = std::stoi(lower, &consumed);  // throws std::invalid_argument
    if (consumed != lower.size()) {
        throw std::invalid_argument("Invalid log level: " + text);
    }
    return static_cast<LogLevel>(std::clamp(value, 1, 6));
}

void Logger::parseLogConfig(const std::string& config) {
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        try {
            if (equals_pos == std::string::npos) {
                setDefaultLevel(parseLevel(token));
                continue;
            }

            std::string facility = trim(token.substr(0, equals_pos));
            LogLevel level = parseLevel(token.substr(equals_pos + 1));
            if (facility == "default") {
                setDefaultLevel(level);
            } else {
                setFacilityLevel(facility, level);
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Ignoring invalid log setting '" << token << "'" << std::endl;
        }
    }
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    // WARNING is the construction default; anything else was set explicitly
    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }
    return default_level_;
}

} // namespace demforge

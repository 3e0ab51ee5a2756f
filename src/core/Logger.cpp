/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace popaccess {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;
std::mutex Logger::sink_mutex_;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

bool parse_level(const std::string& text, LogLevel& level) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return false;
        level = static_cast<LogLevel>(std::clamp(value, 1, 6));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

Logger::Logger()
    : last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : component_name_(component_name), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    emitRepeatSummary();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    emitRepeatSummary();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    has_last_message_ = true;
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
    }
    repeat_count_ = 0;
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << to_string(level);
    if (!component_name_.empty()) {
        line << " " << component_name_;
    }
    line << ": " << message;

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    std::ostream& console = (level <= LogLevel::WARNING) ? std::cerr : std::cout;
    console << line.str() << std::endl;

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        emitRepeatSummary();
    }

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility-based logging implementation
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

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    bool all_valid = true;
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        LogLevel level;
        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            if (parse_level(token, level)) {
                default_level_ = level;
            } else {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
            }
            continue;
        }

        std::string facility = trim(token.substr(0, equals_pos));
        std::string level_str = trim(token.substr(equals_pos + 1));
        if (!parse_level(level_str, level)) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            default_level_ = level;
        } else {
            facility_levels_[facility] = level;
        }
    }

    return all_valid;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::setLogFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> sink_lock(sink_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!path.has_value() || path->empty()) {
        return true;
    }

    try {
        std::filesystem::path log_path(*path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Cannot create log directory: " << e.what() << std::endl;
        return false;
    }

    file_stream_ = std::make_shared<std::ofstream>(*path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << *path << std::endl;
        file_stream_.reset();
        return false;
    }
    return true;
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    return default_level_;
}

} // namespace popaccess

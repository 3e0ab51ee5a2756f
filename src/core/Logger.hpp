/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component owns a named Logger ("DistanceField", "RegionRollup", ...).
 * A single outputMessage() method performs the verbosity check and writes to
 * the console and, when configured, a process-wide log file.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace popaccess {

/**
 * @brief Log levels
 *
 * Level 1: Errors (scope or run aborted)
 * Level 2: Warnings (data quality issues, skipped scopes)
 * Level 3: Information (high-level progress)
 * Level 4: Detailed information (stage execution, timings)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* to_string(LogLevel level);

/**
 * @brief Named logger with single point of output control
 *
 * Repeated identical messages are folded into one line followed by
 * "The previous message occurred N times.".
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component (facility) name
     * @param component_name Facility name used for level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * THIS IS THE SINGLE POINT OF LOGGING CONTROL
     */
    void outputMessage(LogLevel level, const std::string& message) const;

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
     * @brief Prefix message with a scope name, e.g. "[Kenya] 12 cells"
     */
    void scoped(LogLevel level, const std::string& scope, const std::string& message) const {
        outputMessage(level, "[" + scope + "] " + message);
    }

    /**
     * @brief Flush pending duplicate summary and output buffers
     */
    void flush() const;

    const std::string& component() const { return component_name_; }

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Formats:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "DistanceField=6,RegionRollup=3"
     * - Mixed: "4,AccessPipeline=6"
     * - "default=3" is an alias for the bare level form
     *
     * @return false if any token could not be parsed
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every logger's output to a file as well (append mode)
     * @param path Log file path, or nullopt to stop file logging
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& path);

    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;

    mutable std::mutex state_mutex_;
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    // Shared sink: console writes and the optional log file are serialized
    static std::shared_ptr<std::ofstream> file_stream_;
    static std::mutex sink_mutex_;

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace popaccess

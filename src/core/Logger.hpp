/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every pipeline component owns a Logger named after its facility. All
 * output goes through outputMessage(), which holds the only verbosity check
 * and the only console write in the project.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace opendem {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run terminates)
 * Level 2: Warnings (input ignored or degraded)
 * Level 3: Information (pipeline stages, progress) - default
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (engine calls, paths)
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

/**
 * @brief Facility logger with a single point of output
 */
class Logger {
public:
    /**
     * @brief Logger without facility, follows the global default level
     */
    Logger();

    /**
     * @brief Logger for a named facility
     * @param component_name Facility name used for per-facility levels
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Flushes pending repeat summaries and buffers
     */
    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Identical consecutive messages are collapsed into a single
     * "occurred N times" line.
     *
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "Acquisition=6,OutputExporter=3"
     * - Mixed: "4,Acquisition=6"
     *
     * @param config Configuration string
     * @return false if any token could not be parsed
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every logger's output to an additional append-mode file
     * @param log_file Path, or nullopt to stop file logging
     */
    static void setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Effective level: facility level, then instance level, then default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> shared_file_stream_;
    static std::mutex registry_mutex_;

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace opendem

#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace job_diary {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Console output plus an optional append-mode log file. Safe to call from
 * the event loop, curl worker threads and the audio callback thread.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return fallback when the name is not recognised
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) job_diary::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) job_diary::Logger::info(msg)
#define LOG_WARN(msg) job_diary::Logger::warn(msg)
#define LOG_ERROR(msg) job_diary::Logger::error(msg)

// Component-specific logging macros
#define LOG_BROKER(msg) job_diary::Logger::info(std::string("[Broker] ") + (msg))
#define LOG_TRANSPORT(msg) job_diary::Logger::info(std::string("[Transport] ") + (msg))
#define LOG_PEER(msg) job_diary::Logger::debug(std::string("[Peer] ") + (msg))
#define LOG_AUDIO(msg) job_diary::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_CMD(msg) job_diary::Logger::info(std::string("[Command] ") + (msg))
#define LOG_DRAFT(msg) job_diary::Logger::debug(std::string("[Draft] ") + (msg))
#define LOG_STORE(msg) job_diary::Logger::info(std::string("[Store] ") + (msg))
#define LOG_SESSION(msg) job_diary::Logger::info(std::string("[Session] ") + (msg))

} // namespace job_diary

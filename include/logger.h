#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace voicegate {

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
 * Provides structured logging with levels and optional file output.
 * Thread-safe for concurrent use from session, sweeper and HTTP threads.
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

    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or fallback when the name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) voicegate::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voicegate::Logger::info(msg)
#define LOG_WARN(msg) voicegate::Logger::warn(msg)
#define LOG_ERROR(msg) voicegate::Logger::error(msg)

// Component-specific logging macros
#define LOG_WS(msg) voicegate::Logger::info(std::string("[WS] ") + (msg))
#define LOG_HTTP(msg) voicegate::Logger::debug(std::string("[HTTP] ") + (msg))
#define LOG_SESSION(msg) voicegate::Logger::info(std::string("[Session] ") + (msg))
#define LOG_REGISTRY(msg) voicegate::Logger::info(std::string("[Registry] ") + (msg))
#define LOG_AUDIO(msg) voicegate::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) voicegate::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) voicegate::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) voicegate::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_HEALTH(msg) voicegate::Logger::info(std::string("[Health] ") + (msg))
#define LOG_TRACE(session_id, stage, data) voicegate::Logger::info(std::string("[trace] session=") + (session_id) + " stage=" + (stage) + " " + (data))

} // namespace voicegate

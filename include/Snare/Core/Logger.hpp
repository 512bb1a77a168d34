/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Snare diagnostics
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation,
 * and a user callback for hosts that route log output themselves.
 */

#pragma once

#ifndef SNARE_CORE_LOGGER_HPP
#define SNARE_CORE_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace Snare {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing for deep debugging
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Warning messages for potential issues
    Error = 4,      ///< Error messages for failures
    Critical = 5,   ///< Failures that leave a hook in an unknown state
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to rotating file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Logger setup
 */
struct LoggerOptions {
    LogLevel minLevel = LogLevel::Info;
    LogOutput outputs = LogOutput::Console;
    std::string filePath;           ///< Required when outputs include File
    size_t maxFileSizeMB = 10;      ///< Rotation threshold
    size_t maxFiles = 3;            ///< Rotated files kept beside the active one
    bool sourceLocation = true;     ///< Prefix "(file:line)" when the caller supplies one
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 *        "error", "critical", "off"), case-insensitive
 * @return true and sets @p out when the name is known
 */
bool ParseLogLevel(std::string_view name, LogLevel& out);

/**
 * @brief Get string representation of a log level
 */
const char* LogLevelName(LogLevel level);

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Log message payload
 * @param timestamp Message timestamp
 *
 * The callback runs while the logger lock is held and must not log itself.
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Thread-safe logging system for Snare
 *
 * Features:
 * - Multiple severity levels with filtering
 * - Color-coded console output
 * - Rotating log file
 * - User callback integration
 * - Per-level statistics
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @return true on success, false if already initialized or a sink failed
     */
    bool Initialize(const LoggerOptions& options);

    /**
     * @brief Initialize the logger with the default rotation settings
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const;

    /**
     * @brief Options of the current (or last) initialization
     */
    [[nodiscard]] LoggerOptions GetOptions() const;

    void SetMinLevel(LogLevel level);

    [[nodiscard]] LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages
     *
     * Only consulted when the logger was initialized with LogOutput::Callback.
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    [[nodiscard]] bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a formatted message
     * @param level Severity level
     * @param format Printf-style format string
     * @param args Format arguments
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, args...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(result)));
        } else if (result > 0) {
            std::string largeBuffer(static_cast<size_t>(result) + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, args...);
            largeBuffer.resize(static_cast<size_t>(result));
            Log(level, largeBuffer);
        }
    }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    [[nodiscard]] Statistics GetStatistics() const;

    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerOptions options_;
    LogCallback callback_;

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Snare

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef SNARE_DISABLE_LOGGING

#define SNARE_LOG(level, msg) \
    ::Snare::Core::Logger::Instance().Log(::Snare::Core::LogLevel::level, msg, __FILE__, __LINE__)

#define SNARE_LOG_F(level, fmt, ...) \
    ::Snare::Core::Logger::Instance().LogFormat(::Snare::Core::LogLevel::level, fmt, __VA_ARGS__)

#else
#define SNARE_LOG(level, msg) ((void)0)
#define SNARE_LOG_F(level, fmt, ...) ((void)0)
#endif // SNARE_DISABLE_LOGGING

#define SNARE_LOG_TRACE(msg)    SNARE_LOG(Trace, msg)
#define SNARE_LOG_DEBUG(msg)    SNARE_LOG(Debug, msg)
#define SNARE_LOG_INFO(msg)     SNARE_LOG(Info, msg)
#define SNARE_LOG_WARNING(msg)  SNARE_LOG(Warning, msg)
#define SNARE_LOG_ERROR(msg)    SNARE_LOG(Error, msg)
#define SNARE_LOG_CRITICAL(msg) SNARE_LOG(Critical, msg)

#define SNARE_LOG_TRACE_F(fmt, ...)    SNARE_LOG_F(Trace, fmt, __VA_ARGS__)
#define SNARE_LOG_DEBUG_F(fmt, ...)    SNARE_LOG_F(Debug, fmt, __VA_ARGS__)
#define SNARE_LOG_INFO_F(fmt, ...)     SNARE_LOG_F(Info, fmt, __VA_ARGS__)
#define SNARE_LOG_WARNING_F(fmt, ...)  SNARE_LOG_F(Warning, fmt, __VA_ARGS__)
#define SNARE_LOG_ERROR_F(fmt, ...)    SNARE_LOG_F(Error, fmt, __VA_ARGS__)
#define SNARE_LOG_CRITICAL_F(fmt, ...) SNARE_LOG_F(Critical, fmt, __VA_ARGS__)

#endif // SNARE_CORE_LOGGER_HPP

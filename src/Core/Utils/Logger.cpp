/**
 * @file Logger.cpp
 * @brief Implementation of the logging infrastructure
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * This implementation uses spdlog for console output, rotating file output
 * and a callback sink for host integration.
 */

#include <Snare/Core/Logger.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace Snare {
namespace Core {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warning;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

/**
 * @brief Sink that hands the raw payload of each record to a function
 */
class CallbackSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Handler = std::function<void(const spdlog::details::log_msg&)>;

    explicit CallbackSink(Handler handler) : handler_(std::move(handler)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (handler_) {
            handler_(msg);
        }
    }

    void flush_() override {}

private:
    Handler handler_;
};

} // anonymous namespace

// ============================================================================
// Level helpers
// ============================================================================

bool ParseLogLevel(std::string_view name, LogLevel& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")                         { out = LogLevel::Trace; return true; }
    if (lower == "debug")                         { out = LogLevel::Debug; return true; }
    if (lower == "info")                          { out = LogLevel::Info; return true; }
    if (lower == "warning" || lower == "warn")    { out = LogLevel::Warning; return true; }
    if (lower == "error")                         { out = LogLevel::Error; return true; }
    if (lower == "critical")                      { out = LogLevel::Critical; return true; }
    if (lower == "off")                           { out = LogLevel::Off; return true; }
    return false;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRIT";
        case LogLevel::Off:      return "OFF";
        default:                 return "UNKN";
    }
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

bool Logger::Initialize(LogLevel minLevel, LogOutput outputs,
                        const std::string& logFilePath, size_t maxFileSizeMB) {
    LoggerOptions options;
    options.minLevel = minLevel;
    options.outputs = outputs;
    options.filePath = logFilePath;
    options.maxFileSizeMB = maxFileSizeMB;
    return Initialize(options);
}

bool Logger::Initialize(const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    options_ = options;
    const auto level = ToSpdlogLevel(options_.minLevel);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (hasFlag(options_.outputs, LogOutput::File) && !options_.filePath.empty()) {
            std::filesystem::path logPath(options_.filePath);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }

            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options_.filePath,
                options_.maxFileSizeMB * 1024 * 1024,
                options_.maxFiles));
        }

        // Runs under mutex_ (held by Log), which also guards callback_
        if (hasFlag(options_.outputs, LogOutput::Callback)) {
            sinks.push_back(std::make_shared<CallbackSink>(
                [this](const spdlog::details::log_msg& msg) {
                    if (callback_) {
                        std::string_view message(msg.payload.data(), msg.payload.size());
                        callback_(FromSpdlogLevel(msg.level), message, msg.time);
                    }
                }));
        }

        // Console is also the fallback when nothing else was usable
        if (hasFlag(options_.outputs, LogOutput::Console) || sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        for (auto& sink : sinks) {
            sink->set_level(level);
        }

        spdlogger_ = std::make_shared<spdlog::logger>("snare", sinks.begin(), sinks.end());

        // [timestamp] [level] [thread] message
        spdlogger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlogger_->set_level(level);
        spdlogger_->flush_on(spdlog::level::warn);

        initialized_ = true;
        return true;

    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Failed to create log directory: " << e.what() << std::endl;
    }

    spdlogger_.reset();
    return false;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    if (spdlogger_) {
        spdlogger_->flush();
        spdlogger_.reset();
    }

    initialized_ = false;
}

bool Logger::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

LoggerOptions Logger::GetOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.minLevel = level;
    if (spdlogger_) {
        spdlogger_->set_level(ToSpdlogLevel(level));
        for (auto& sink : spdlogger_->sinks()) {
            sink->set_level(ToSpdlogLevel(level));
        }
    }
}

LogLevel Logger::GetMinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.minLevel;
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool Logger::IsLevelEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ && level >= options_.minLevel && level != LogLevel::Off;
}

void Logger::Log(LogLevel level, std::string_view message,
                 const char* file, int line) {
    if (!IsLevelEnabled(level)) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.dropped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        switch (level) {
            case LogLevel::Trace:    stats_.trace++; break;
            case LogLevel::Debug:    stats_.debug++; break;
            case LogLevel::Info:     stats_.info++; break;
            case LogLevel::Warning:  stats_.warning++; break;
            case LogLevel::Error:    stats_.error++; break;
            case LogLevel::Critical: stats_.critical++; break;
            default: break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!spdlogger_) {
        return;
    }

    std::string formattedMsg;
    if (options_.sourceLocation && file && line > 0) {
        // Basename only
        const char* filename = file;
        for (const char* p = file; *p; ++p) {
            if (*p == '/' || *p == '\\') {
                filename = p + 1;
            }
        }
        formattedMsg = std::string("(") + filename + ":" + std::to_string(line) + ") " + std::string(message);
    } else {
        formattedMsg = std::string(message);
    }

    spdlogger_->log(ToSpdlogLevel(level), formattedMsg);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spdlogger_) {
        spdlogger_->flush();
    }
}

Logger::Statistics Logger::GetStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void Logger::ResetStatistics() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = Statistics{};
}

} // namespace Core
} // namespace Snare

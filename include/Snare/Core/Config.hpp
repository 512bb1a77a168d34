/**
 * @file Config.hpp
 * @brief Hook configuration loading
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Loads the JSON hook manifest:
 *
 * {
 *   "logging": { "level": "info", "file": "snare.log",
 *                "max_file_size_mb": 10, "max_files": 3 },
 *   "hooks": [
 *     { "id": "pak_check", "signature": "49 81 C3 9A 0B FB FF",
 *       "module": "Client-Win64-Shipping.exe", "timeout_ms": 5000,
 *       "on_failure": "abort", "target_offset": -69 }
 *   ]
 * }
 *
 * File reads are protected against:
 * - Path traversal (canonical path, optional allowed directory)
 * - Symlink swaps (O_NOFOLLOW on the canonical path)
 * - Oversized files
 */

#pragma once

#ifndef SNARE_CORE_CONFIG_HPP
#define SNARE_CORE_CONFIG_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>
#include <Snare/Core/Logger.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Snare::Config {

/**
 * @brief What the batch attach does when one hook fails
 */
enum class FailurePolicy : uint8_t {
    Abort,           ///< Stop and return the error
    LogAndContinue   ///< Log the error and attach the remaining hooks
};

[[nodiscard]] const char* toString(FailurePolicy policy) noexcept;

/**
 * @brief One configured hook
 */
struct HookDefinition {
    std::string id;
    std::string signature;             ///< Signature text, validated at load
    std::string moduleName;
    Milliseconds timeout{0};           ///< Readiness wait; 0 = check once
    FailurePolicy onFailure = FailurePolicy::Abort;
    int64_t targetDisplacement = 0;    ///< Signed offset from match to function entry
};

struct LoggingOptions {
    Core::LogLevel level = Core::LogLevel::Info;
    std::string file;                  ///< Empty = console only
    size_t maxFileSizeMB = 10;
    size_t maxFiles = 3;

    /**
     * @brief Logger setup for this section: console, plus the rotating file
     *        when one is named
     */
    [[nodiscard]] Core::LoggerOptions toLoggerOptions() const;
};

struct HookConfig {
    LoggingOptions logging;
    std::vector<HookDefinition> hooks;
};

/**
 * @brief Secure JSON hook configuration loader
 */
class HookConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
    };

    HookConfigLoader();
    explicit HookConfigLoader(const Options& options);
    ~HookConfigLoader();

    HookConfigLoader(const HookConfigLoader&) = delete;
    HookConfigLoader& operator=(const HookConfigLoader&) = delete;

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    [[nodiscard]] Result<HookConfig> load(const std::string& path);

    /**
     * @brief Load configuration from memory
     * @param document Configuration JSON text
     * @return Parsed configuration, or JsonParseFailed, MissingField,
     *         InvalidFieldType, PatternSyntaxError, ConfigInvalid
     */
    [[nodiscard]] Result<HookConfig> loadFromMemory(std::string_view document);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Snare::Config

#endif // SNARE_CORE_CONFIG_HPP

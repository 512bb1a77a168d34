/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Snare hooking library
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * This file defines all error codes used throughout Snare, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef SNARE_CORE_ERROR_CODES_HPP
#define SNARE_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <optional>
#include <type_traits>

namespace Snare {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Memory      = 0x02,  ///< Memory access and scan errors
    Attach      = 0x05,  ///< Module readiness and signature resolution errors
    Hook        = 0x06,  ///< Hook lifecycle errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Snare operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0200-0x02FF: Memory errors
 * - 0x0500-0x05FF: Attach errors
 * - 0x0600-0x06FF: Hook errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Feature not supported on this platform
    NotSupported = 0x0107,

    // ========================================================================
    // Memory Errors (0x0200-0x02FF)
    // ========================================================================

    /// Generic memory error
    MemoryError = 0x0200,

    /// Access range exceeds the module region
    OutOfBounds = 0x0201,

    /// Platform read reported a fault (uncommitted or unreadable page)
    UnreadableMemory = 0x0202,

    /// Page protection forbids writing
    WriteProtected = 0x0203,

    /// Invalid memory address
    InvalidAddress = 0x0204,

    /// Failed to change memory protection
    ProtectionChangeFailed = 0x0205,

    /// Memory access failed while scanning
    ScanMemoryError = 0x0206,

    /// Memory region not found
    RegionNotFound = 0x0207,

    // ========================================================================
    // Attach Errors (0x0500-0x05FF)
    // ========================================================================

    /// Scan completed without a match
    SignatureNotFound = 0x0501,

    /// Module readiness wait timed out
    ModuleNotLoaded = 0x0502,

    /// Module is not mapped in the process
    ModuleNotFound = 0x0503,

    // ========================================================================
    // Hook Errors (0x0600-0x06FF)
    // ========================================================================

    /// Generic hook error
    HookError = 0x0600,

    /// Id or target address already has a live hook
    AlreadyInstalled = 0x0601,

    /// Transition not allowed from the current hook state
    InvalidState = 0x0602,

    /// Hooking primitive failed to install the redirect
    HookInstallError = 0x0603,

    /// Hooking primitive failed to release the hook
    HookRemoveError = 0x0604,

    /// No hook registered under this id
    HookNotFound = 0x0605,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// JSON parse error
    JsonParseFailed = 0x0A01,

    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid field type
    InvalidFieldType = 0x0A04,

    /// Malformed byte signature text
    PatternSyntaxError = 0x0A05,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<size_t> locate(const Pattern& pattern) {
 *     if (pattern.size() == 0) return ErrorCode::InvalidArgument;
 *     return size_t{0};
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 *
 * Used for operations that can fail but don't return a value.
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    /// Explicit conversion to bool
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * SNARE_TRY(someOperation());
 * ```
 */
#define SNARE_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * SNARE_TRY_ASSIGN(value, someOperation());
 * ```
 */
#define SNARE_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Snare

#endif // SNARE_CORE_ERROR_CODES_HPP

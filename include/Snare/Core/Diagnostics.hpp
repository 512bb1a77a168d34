/**
 * @file Diagnostics.hpp
 * @brief Structured diagnostic events emitted by the hooking core
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#pragma once

#ifndef SNARE_CORE_DIAGNOSTICS_HPP
#define SNARE_CORE_DIAGNOSTICS_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/Logger.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Snare {

/**
 * @brief One diagnostic record
 *
 * Fields are ordered key/value pairs, e.g. hook, address, from, to, outcome.
 */
struct DiagnosticEvent {
    SystemTimePoint timestamp;
    std::string component;                                    ///< Emitting component
    std::string message;
    Core::LogLevel severity = Core::LogLevel::Info;
    std::vector<std::pair<std::string, std::string>> fields;

    /**
     * @brief Value of a field, or empty if absent
     */
    [[nodiscard]] std::string_view field(std::string_view key) const;

    /**
     * @brief "message key=value key=value" rendering
     */
    [[nodiscard]] std::string render() const;
};

/**
 * @brief "0x7ff6a1b2c3d4" rendering used in event fields
 */
[[nodiscard]] std::string formatAddress(Address address);

/**
 * @brief Receiver of diagnostic events
 *
 * Implementations must be callable from any thread.
 */
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    virtual void emit(const DiagnosticEvent& event) = 0;
};

/**
 * @brief Sink that writes events through Core::Logger at the event severity
 */
class LoggerDiagnosticsSink final : public DiagnosticsSink {
public:
    void emit(const DiagnosticEvent& event) override;
};

/**
 * @brief Sink that discards every event
 */
class NullDiagnosticsSink final : public DiagnosticsSink {
public:
    void emit(const DiagnosticEvent&) override {}
};

} // namespace Snare

#endif // SNARE_CORE_DIAGNOSTICS_HPP

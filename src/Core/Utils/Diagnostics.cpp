/**
 * @file Diagnostics.cpp
 * @brief Diagnostic event rendering and the logger-backed sink
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/Diagnostics.hpp>

#include <cstdio>

namespace Snare {

std::string formatAddress(Address address) {
    char buffer[2 + sizeof(Address) * 2 + 1];
    std::snprintf(buffer, sizeof(buffer), "0x%llx", static_cast<unsigned long long>(address));
    return buffer;
}

std::string_view DiagnosticEvent::field(std::string_view key) const {
    for (const auto& [name, value] : fields) {
        if (name == key) {
            return value;
        }
    }
    return {};
}

std::string DiagnosticEvent::render() const {
    std::string out = "[" + component + "] " + message;
    for (const auto& [name, value] : fields) {
        out += ' ';
        out += name;
        out += '=';
        out += value;
    }
    return out;
}

void LoggerDiagnosticsSink::emit(const DiagnosticEvent& event) {
    Core::Logger::Instance().Log(event.severity, event.render());
}

} // namespace Snare

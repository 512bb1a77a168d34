/**
 * @file AttachSequencer.cpp
 * @brief Module-load-time hook attachment implementation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/AttachSequencer.hpp>
#include <Snare/Core/Logger.hpp>

namespace Snare {
namespace Core {
namespace Hooks {

AttachSequencer::AttachSequencer(Memory::PatternScanner& scanner,
                                 Memory::SafeMemoryAccessor& accessor,
                                 HookRegistry& registry,
                                 std::shared_ptr<DiagnosticsSink> diagnostics)
    : m_scanner(scanner)
    , m_accessor(accessor)
    , m_registry(registry)
    , m_diagnostics(diagnostics ? std::move(diagnostics) : std::make_shared<NullDiagnosticsSink>()) {
}

Result<Address> AttachSequencer::resolve(const ModuleRegion& region,
                                         const Memory::Pattern& pattern,
                                         std::ptrdiff_t targetDisplacement) {
    auto found = m_scanner.find(region, pattern);
    if (found.isFailure()) {
        return found.error();
    }
    if (!found.value().has_value()) {
        return ErrorCode::SignatureNotFound;
    }

    // Unsigned wrap-around makes negative displacements land below base,
    // which validatePointer then rejects
    const Address target = region.base + *found.value() + static_cast<Address>(targetDisplacement);
    if (!m_accessor.validatePointer(region, target)) {
        return ErrorCode::InvalidAddress;
    }
    return target;
}

Result<HookHandle> AttachSequencer::attach(const std::string& id,
                                           const ModuleRegion& region,
                                           const Memory::Pattern& pattern,
                                           Address replacement,
                                           const AttachOptions& options) {
    if (options.readiness && !options.readiness->waitUntilLoaded(options.timeout)) {
        emit(id, "readiness", 0, ErrorCode::ModuleNotLoaded);
        return ErrorCode::ModuleNotLoaded;
    }

    auto resolved = resolve(region, pattern, options.targetDisplacement);
    if (resolved.isFailure()) {
        emit(id, "resolve", 0, resolved.error());
        return resolved.error();
    }
    const Address target = resolved.value();

    const size_t patchSize = m_registry.redirectSize();
    if (patchSize > 0 && !m_accessor.validatePointer(region, target + patchSize - 1)) {
        emit(id, "validate", target, ErrorCode::InvalidAddress);
        return ErrorCode::InvalidAddress;
    }

    auto installed = m_registry.install(id, HookTarget{region, target}, replacement);
    emit(id, "install", target, installed.isSuccess() ? ErrorCode::Success : installed.error());
    return installed;
}

Result<size_t> AttachSequencer::attachAll(const std::vector<Config::HookDefinition>& definitions,
                                          ModuleProvider& modules,
                                          const std::unordered_map<std::string, Address>& replacements,
                                          ModuleReadiness* readiness) {
    size_t attached = 0;

    for (const auto& definition : definitions) {
        ErrorCode error = ErrorCode::Success;

        auto pattern = Memory::Pattern::compile(definition.signature);
        auto replacement = replacements.find(definition.id);
        if (pattern.isFailure()) {
            error = pattern.error();
        } else if (replacement == replacements.end()) {
            error = ErrorCode::InvalidArgument;
        } else {
            auto region = modules.locate(definition.moduleName);
            if (region.isFailure()) {
                error = region.error();
            } else {
                AttachOptions options;
                options.timeout = definition.timeout;
                options.readiness = readiness;
                options.targetDisplacement = static_cast<std::ptrdiff_t>(definition.targetDisplacement);

                auto result = attach(definition.id, region.value(), pattern.value(),
                                     replacement->second, options);
                if (result.isFailure()) {
                    error = result.error();
                }
            }
        }

        if (error == ErrorCode::Success) {
            ++attached;
            SNARE_LOG_INFO_F("Hook '%s' attached in %s", definition.id.c_str(),
                             definition.moduleName.c_str());
            continue;
        }

        const std::string reason(getErrorMessage(error));
        if (definition.onFailure == Config::FailurePolicy::Abort) {
            SNARE_LOG_ERROR_F("Hook '%s' failed: %s (aborting)", definition.id.c_str(), reason.c_str());
            return error;
        }
        SNARE_LOG_WARNING_F("Hook '%s' failed: %s (continuing)", definition.id.c_str(), reason.c_str());
    }

    return attached;
}

void AttachSequencer::emit(const std::string& id, const char* step, Address address, ErrorCode outcome) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.component = "AttachSequencer";
    event.message = outcome == ErrorCode::Success ? "attached" : "attach failed";
    event.severity = outcome == ErrorCode::Success ? Core::LogLevel::Info : Core::LogLevel::Warning;
    event.fields = {
        {"hook", id},
        {"step", step},
        {"address", formatAddress(address)},
        {"outcome", outcome == ErrorCode::Success ? std::string("ok")
                                                  : std::string(getErrorMessage(outcome))},
    };
    m_diagnostics->emit(event);
}

} // namespace Hooks
} // namespace Core
} // namespace Snare

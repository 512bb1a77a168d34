/**
 * @file AttachSequencer.hpp
 * @brief Module-load-time hook attachment
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * The sequencer is the only component that composes the scanner and the
 * registry:
 *   readiness -> scan -> validate target -> registry install
 * Each step either succeeds or returns its error unchanged; a timed-out
 * or unresolved attach performs no mutation.
 */

#pragma once

#ifndef SNARE_CORE_ATTACH_SEQUENCER_HPP
#define SNARE_CORE_ATTACH_SEQUENCER_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>
#include <Snare/Core/Config.hpp>
#include <Snare/Core/Diagnostics.hpp>
#include <Snare/Core/HookRegistry.hpp>
#include <Snare/Core/ModuleLocator.hpp>
#include <Snare/Core/Pattern.hpp>
#include <Snare/Core/PatternScanner.hpp>
#include <Snare/Core/Readiness.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Snare {
namespace Core {
namespace Hooks {

/**
 * @brief Per-attach options
 */
struct AttachOptions {
    Milliseconds timeout{0};                 ///< Readiness wait budget
    ModuleReadiness* readiness = nullptr;    ///< Null = module already loaded
    std::ptrdiff_t targetDisplacement = 0;   ///< Added to the match address
};

class AttachSequencer {
public:
    AttachSequencer(Memory::PatternScanner& scanner,
                    Memory::SafeMemoryAccessor& accessor,
                    HookRegistry& registry,
                    std::shared_ptr<DiagnosticsSink> diagnostics = nullptr);

    /**
     * @brief Resolve pattern inside region and install a hook on it
     * @return Handle, or ModuleNotLoaded, SignatureNotFound, InvalidAddress,
     *         a scanner error or a registry error, unchanged
     */
    [[nodiscard]] Result<HookHandle> attach(const std::string& id,
                                            const ModuleRegion& region,
                                            const Memory::Pattern& pattern,
                                            Address replacement,
                                            const AttachOptions& options = {});

    /**
     * @brief Resolve the absolute target address without installing
     */
    [[nodiscard]] Result<Address> resolve(const ModuleRegion& region,
                                          const Memory::Pattern& pattern,
                                          std::ptrdiff_t targetDisplacement = 0);

    /**
     * @brief Attach every configured hook
     * @param definitions Hooks from the configuration
     * @param modules Resolves each definition's module name
     * @param replacements Replacement address per hook id
     * @param readiness Shared readiness for all modules (may be null)
     * @return Number of hooks attached, or the first error of a hook whose
     *         policy is Abort
     */
    [[nodiscard]] Result<size_t> attachAll(const std::vector<Config::HookDefinition>& definitions,
                                           ModuleProvider& modules,
                                           const std::unordered_map<std::string, Address>& replacements,
                                           ModuleReadiness* readiness = nullptr);

private:
    void emit(const std::string& id, const char* step, Address address, ErrorCode outcome);

    Memory::PatternScanner& m_scanner;
    Memory::SafeMemoryAccessor& m_accessor;
    HookRegistry& m_registry;
    std::shared_ptr<DiagnosticsSink> m_diagnostics;
};

} // namespace Hooks
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_ATTACH_SEQUENCER_HPP

/**
 * @file HookRegistry.hpp
 * @brief Thread-safe hook lifecycle management
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * The registry exclusively owns every hook it installs. Transitions of a
 * single hook are serialized by a per-hook lock; the registry-wide lock
 * only guards the id and address indexes.
 *
 * Lifecycle:
 *   Uninstalled -> Installed -> Enabled <-> Disabled -> Removed
 *   Failed is reachable from any transition attempt.
 *   Removed and Failed are terminal; the id may then be installed again.
 */

#pragma once

#ifndef SNARE_CORE_HOOK_REGISTRY_HPP
#define SNARE_CORE_HOOK_REGISTRY_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>
#include <Snare/Core/Diagnostics.hpp>
#include <Snare/Core/HookPrimitive.hpp>
#include <Snare/Core/MemoryAccessor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Snare {
namespace Core {
namespace Hooks {

/**
 * @brief Hook lifecycle state
 */
enum class HookState : uint8_t {
    Uninstalled,
    Installed,   ///< Redirect written, not yet enabled
    Enabled,     ///< Redirect active
    Disabled,    ///< Original bytes restored, handle kept
    Removed,     ///< Terminal: handle released
    Failed       ///< Terminal: a transition failed
};

[[nodiscard]] const char* toString(HookState state) noexcept;

/**
 * @brief Check whether a state is terminal (Removed or Failed)
 */
[[nodiscard]] constexpr bool isTerminal(HookState state) noexcept {
    return state == HookState::Removed || state == HookState::Failed;
}

/**
 * @brief Resolved hook target
 */
struct HookTarget {
    ModuleRegion region;  ///< Module the target lives in
    Address address = 0;  ///< Absolute address of the function entry
};

/**
 * @brief Snapshot of one hook
 */
struct HookInfo {
    std::string id;
    Address target = 0;
    Address replacement = 0;
    HookState state = HookState::Uninstalled;
    ByteBuffer originalBytes;   ///< Bytes at target before the redirect
    ByteBuffer redirectBytes;   ///< Bytes at target while enabled
    HookHandle handle;
};

/**
 * @brief Thread-safe map from hook id to lifecycle state
 */
class HookRegistry {
public:
    /**
     * @param accessor Used to snapshot and compare target bytes
     * @param primitive Performs the actual code patching
     * @param diagnostics Receives one event per transition attempt (may be null)
     */
    HookRegistry(Memory::SafeMemoryAccessor& accessor,
                 std::shared_ptr<HookPrimitive> primitive,
                 std::shared_ptr<DiagnosticsSink> diagnostics = nullptr);

    /**
     * @brief Removes every live hook
     */
    ~HookRegistry();

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    /**
     * @brief Install a redirect from target to replacement
     * @return Handle, AlreadyInstalled if the id is live or the patched range
     *         [address, address + redirectSize()) overlaps a live hook,
     *         HookInstallError if the primitive fails, or the accessor error
     *         if the original bytes cannot be read
     */
    [[nodiscard]] Result<HookHandle> install(const std::string& id,
                                             const HookTarget& target,
                                             Address replacement);

    /**
     * @brief Activate the redirect (Installed/Disabled -> Enabled)
     */
    [[nodiscard]] Result<void> enable(const std::string& id);

    /**
     * @brief Restore original bytes (Installed/Enabled -> Disabled)
     */
    [[nodiscard]] Result<void> disable(const std::string& id);

    /**
     * @brief Restore original bytes if active and release the handle
     *
     * Idempotent on Removed; InvalidState on Failed.
     */
    [[nodiscard]] Result<void> remove(const std::string& id);

    /**
     * @brief Current state, or HookNotFound
     */
    [[nodiscard]] Result<HookState> state(const std::string& id) const;

    [[nodiscard]] Result<HookInfo> info(const std::string& id) const;

    /**
     * @brief Number of hooks in a non-terminal state
     */
    [[nodiscard]] size_t liveCount() const;

    [[nodiscard]] std::vector<std::string> ids() const;

    /**
     * @brief Bytes the primitive overwrites per hook
     */
    [[nodiscard]] size_t redirectSize() const noexcept;

    /**
     * @brief Remove every live hook
     * @return Number of hooks that failed to remove
     */
    size_t removeAll();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Hooks
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_HOOK_REGISTRY_HPP

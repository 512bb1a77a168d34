/**
 * @file HookPrimitive.hpp
 * @brief Machine-code patching primitive used by the hook registry
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * The primitive owns the platform details of redirecting a function:
 * encoding the redirect, making code pages writable for the duration of a
 * patch, and flushing the instruction cache. No trampoline is generated;
 * the original bytes are saved and restored by the registry.
 */

#pragma once

#ifndef SNARE_CORE_HOOK_PRIMITIVE_HPP
#define SNARE_CORE_HOOK_PRIMITIVE_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>
#include <Snare/Core/MemoryAccessor.hpp>

#include <mutex>
#include <unordered_map>

namespace Snare {
namespace Core {
namespace Hooks {

/**
 * @brief Opaque record of one installed redirect
 */
struct HookHandle {
    uint64_t token = 0;       ///< Primitive-assigned identifier, never 0 when valid
    Address target = 0;       ///< Patched address
    Address replacement = 0;  ///< Redirect destination
    size_t patchSize = 0;     ///< Number of bytes overwritten at target

    [[nodiscard]] bool isValid() const noexcept { return token != 0; }
};

/**
 * @brief Abstract hooking primitive
 *
 * Implementations must be thread-safe for distinct targets.
 */
class HookPrimitive {
public:
    virtual ~HookPrimitive() = default;

    /**
     * @brief Number of bytes install() overwrites at the target
     */
    [[nodiscard]] virtual size_t redirectSize() const noexcept = 0;

    /**
     * @brief Write a redirect from target to replacement
     * @return Handle, or an error; on error the target may be partially
     *         written and the caller is responsible for restoring it
     */
    [[nodiscard]] virtual Result<HookHandle> install(const ModuleRegion& region,
                                                     Address target,
                                                     Address replacement) = 0;

    /**
     * @brief Write raw bytes into code memory at address
     *
     * Used to restore original bytes and to re-apply a saved redirect.
     */
    [[nodiscard]] virtual Result<void> patch(const ModuleRegion& region,
                                             Address address,
                                             ByteSpan bytes) = 0;

    /**
     * @brief Release a handle returned by install()
     *
     * Does not touch the target bytes.
     * @return HookRemoveError for an unknown handle
     */
    [[nodiscard]] virtual Result<void> uninstall(const HookHandle& handle) = 0;
};

/**
 * @brief x86-64 absolute indirect jump: FF 25 00 00 00 00 <imm64>
 *
 * Writes go through the SafeMemoryAccessor after the pages covering the
 * patch are made writable; the original protection is restored afterwards.
 * Protection changes are serialized process-wide, so concurrent patches that
 * share a page never observe each other's writable window.
 */
class InlineJumpPrimitive final : public HookPrimitive {
public:
    static constexpr size_t kRedirectSize = 14;

    explicit InlineJumpPrimitive(Memory::SafeMemoryAccessor& accessor);

    /**
     * @brief Encode the redirect bytes for replacement
     */
    [[nodiscard]] static ByteBuffer encodeJump(Address replacement);

    [[nodiscard]] size_t redirectSize() const noexcept override { return kRedirectSize; }

    [[nodiscard]] Result<HookHandle> install(const ModuleRegion& region,
                                             Address target,
                                             Address replacement) override;

    [[nodiscard]] Result<void> patch(const ModuleRegion& region,
                                     Address address,
                                     ByteSpan bytes) override;

    [[nodiscard]] Result<void> uninstall(const HookHandle& handle) override;

    [[nodiscard]] size_t activeCount() const;

private:
    Memory::SafeMemoryAccessor& m_accessor;

    mutable std::mutex m_mutex;
    uint64_t m_nextToken = 1;
    std::unordered_map<uint64_t, HookHandle> m_handles;
};

} // namespace Hooks
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_HOOK_PRIMITIVE_HPP

/**
 * @file Readiness.hpp
 * @brief Module readiness signals used before attaching hooks
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#pragma once

#ifndef SNARE_CORE_READINESS_HPP
#define SNARE_CORE_READINESS_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/MemoryAccessor.hpp>

#include <condition_variable>
#include <functional>
#include <mutex>

namespace Snare {
namespace Core {

/**
 * @brief Tells the attach sequencer whether a module is fully loaded
 */
class ModuleReadiness {
public:
    virtual ~ModuleReadiness() = default;

    /**
     * @brief Block until the module is loaded or timeout elapses
     * @param timeout Zero means check once without waiting
     * @return true if loaded
     */
    [[nodiscard]] virtual bool waitUntilLoaded(Milliseconds timeout) = 0;
};

/**
 * @brief Readiness driven by an explicit signal from the host
 */
class ReadinessSignal final : public ModuleReadiness {
public:
    ReadinessSignal() = default;

    explicit ReadinessSignal(bool loaded) : m_loaded(loaded) {}

    void markLoaded();

    void reset();

    [[nodiscard]] bool isLoaded() const;

    [[nodiscard]] bool waitUntilLoaded(Milliseconds timeout) override;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_loaded = false;
};

/**
 * @brief Readiness that polls a probe at a fixed interval
 */
class PollingReadiness final : public ModuleReadiness {
public:
    using Probe = std::function<bool()>;

    explicit PollingReadiness(Probe probe, Milliseconds interval = Milliseconds(1));

    [[nodiscard]] bool waitUntilLoaded(Milliseconds timeout) override;

    /**
     * @brief Probe that is true once the bytes at region.base + offset equal
     *        expected; unreadable memory counts as not ready
     */
    [[nodiscard]] static Probe bytesEqual(Memory::SafeMemoryAccessor& accessor,
                                          const ModuleRegion& region,
                                          size_t offset,
                                          ByteBuffer expected);

private:
    Probe m_probe;
    Milliseconds m_interval;
};

} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_READINESS_HPP

/**
 * @file Readiness.cpp
 * @brief Module readiness implementations
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/Readiness.hpp>

#include <algorithm>
#include <thread>

namespace Snare {
namespace Core {

namespace {

    /**
     * @brief now + timeout, saturating at TimePoint::max()
     *
     * Milliseconds::max() does not fit in Clock::duration, so large budgets
     * are compared in milliseconds before converting.
     */
    TimePoint deadlineAfter(TimePoint now, Milliseconds timeout) {
        const auto remaining = std::chrono::duration_cast<Milliseconds>(TimePoint::max() - now);
        if (timeout >= remaining) {
            return TimePoint::max();
        }
        return now + timeout;
    }

} // anonymous namespace

// ============================================================================
// ReadinessSignal
// ============================================================================

void ReadinessSignal::markLoaded() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_loaded = true;
    }
    m_cv.notify_all();
}

void ReadinessSignal::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded = false;
}

bool ReadinessSignal::isLoaded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded;
}

bool ReadinessSignal::waitUntilLoaded(Milliseconds timeout) {
    const TimePoint deadline = deadlineAfter(Clock::now(), timeout);
    std::unique_lock<std::mutex> lock(m_mutex);
    if (deadline == TimePoint::max()) {
        m_cv.wait(lock, [this] { return m_loaded; });
        return true;
    }
    return m_cv.wait_until(lock, deadline, [this] { return m_loaded; });
}

// ============================================================================
// PollingReadiness
// ============================================================================

PollingReadiness::PollingReadiness(Probe probe, Milliseconds interval)
    : m_probe(std::move(probe))
    , m_interval(std::max(interval, Milliseconds(1))) {
}

bool PollingReadiness::waitUntilLoaded(Milliseconds timeout) {
    if (!m_probe) {
        return false;
    }

    const TimePoint deadline = deadlineAfter(Clock::now(), timeout);
    for (;;) {
        if (m_probe()) {
            return true;
        }
        const TimePoint now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(m_interval, deadline - now));
    }
}

PollingReadiness::Probe PollingReadiness::bytesEqual(Memory::SafeMemoryAccessor& accessor,
                                                     const ModuleRegion& region,
                                                     size_t offset,
                                                     ByteBuffer expected) {
    return [&accessor, region, offset, expected = std::move(expected)]() {
        auto current = accessor.read(region, offset, expected.size());
        return current.isSuccess() && current.value() == expected;
    };
}

} // namespace Core
} // namespace Snare

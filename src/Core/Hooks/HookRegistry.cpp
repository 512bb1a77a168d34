/**
 * @file HookRegistry.cpp
 * @brief Thread-safe hook lifecycle implementation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Lock order is entry mutex before registry mutex. install() is the only
 * place that holds the registry mutex while taking an entry mutex, and it
 * does so for an entry no other thread can see yet.
 */

#include <Snare/Core/HookRegistry.hpp>
#include <Snare/Core/Logger.hpp>

#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace Snare {
namespace Core {
namespace Hooks {

const char* toString(HookState state) noexcept {
    switch (state) {
        case HookState::Uninstalled: return "Uninstalled";
        case HookState::Installed:   return "Installed";
        case HookState::Enabled:     return "Enabled";
        case HookState::Disabled:    return "Disabled";
        case HookState::Removed:     return "Removed";
        case HookState::Failed:      return "Failed";
    }
    return "Unknown";
}

namespace {

    /**
     * @brief Registry-owned hook record
     */
    struct HookEntry {
        std::mutex mutex;
        std::string id;
        HookTarget target;
        Address replacement = 0;
        HookState state = HookState::Uninstalled;
        ByteBuffer originalBytes;
        ByteBuffer redirectBytes;
        HookHandle handle;
    };

    /**
     * @brief Whether the redirect is currently written at the target
     */
    bool redirectActive(HookState state) noexcept {
        return state == HookState::Installed || state == HookState::Enabled;
    }

} // anonymous namespace

class HookRegistry::Impl {
public:
    Impl(Memory::SafeMemoryAccessor& accessor,
         std::shared_ptr<HookPrimitive> primitive,
         std::shared_ptr<DiagnosticsSink> diagnostics)
        : m_accessor(accessor)
        , m_primitive(std::move(primitive))
        , m_diagnostics(diagnostics ? std::move(diagnostics) : std::make_shared<NullDiagnosticsSink>()) {
    }

    Result<HookHandle> install(const std::string& id, const HookTarget& target, Address replacement) {
        if (id.empty() || replacement == 0 || !m_primitive) {
            emit(id, target.address, HookState::Uninstalled, HookState::Uninstalled,
                 ErrorCode::InvalidArgument);
            return ErrorCode::InvalidArgument;
        }
        if (!m_accessor.validatePointer(target.region, target.address)) {
            emit(id, target.address, HookState::Uninstalled, HookState::Uninstalled,
                 ErrorCode::InvalidAddress);
            return ErrorCode::InvalidAddress;
        }

        auto entry = std::make_shared<HookEntry>();
        entry->id = id;
        entry->target = target;
        entry->replacement = replacement;

        std::unique_lock<std::mutex> entryLock(entry->mutex);
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            if (m_live.count(id) != 0 || overlapsReservation(target.address, m_primitive->redirectSize())) {
                lock.unlock();
                emit(id, target.address, HookState::Uninstalled, HookState::Uninstalled,
                     ErrorCode::AlreadyInstalled);
                return ErrorCode::AlreadyInstalled;
            }
            m_entries[id] = entry;
            m_live.insert(id);
            m_addresses.emplace(target.address, Reservation{m_primitive->redirectSize(), id});
        }

        auto original = m_accessor.readAt(target.region, target.address, m_primitive->redirectSize());
        if (original.isFailure()) {
            markFailed(*entry);
            emit(id, target.address, HookState::Uninstalled, HookState::Failed, original.error());
            return original.error();
        }
        entry->originalBytes = std::move(original.value());

        auto installed = m_primitive->install(target.region, target.address, replacement);
        if (installed.isFailure()) {
            restoreIfChanged(*entry);
            markFailed(*entry);
            emit(id, target.address, HookState::Uninstalled, HookState::Failed, ErrorCode::HookInstallError);
            return ErrorCode::HookInstallError;
        }
        entry->handle = installed.value();

        auto redirect = m_accessor.readAt(target.region, target.address, entry->handle.patchSize);
        if (redirect.isFailure()) {
            entry->state = HookState::Installed;
            failEntry(*entry);
            emit(id, target.address, HookState::Uninstalled, HookState::Failed, redirect.error());
            return redirect.error();
        }
        entry->redirectBytes = std::move(redirect.value());

        entry->state = HookState::Installed;
        emit(id, target.address, HookState::Uninstalled, HookState::Installed, ErrorCode::Success);
        return entry->handle;
    }

    Result<void> enable(const std::string& id) {
        std::shared_ptr<HookEntry> entry;
        std::unique_lock<std::mutex> entryLock;
        if (!lockEntry(id, entry, entryLock)) {
            emit(id, 0, HookState::Uninstalled, HookState::Uninstalled, ErrorCode::HookNotFound);
            return ErrorCode::HookNotFound;
        }

        const HookState from = entry->state;
        switch (from) {
            case HookState::Enabled:
                emitNoop(*entry);
                return {};

            case HookState::Installed:
                entry->state = HookState::Enabled;
                break;

            case HookState::Disabled: {
                auto written = m_primitive->patch(entry->target.region, entry->target.address,
                                                  entry->redirectBytes);
                if (written.isFailure()) {
                    failEntry(*entry);
                    emit(id, entry->target.address, from, HookState::Failed, written.error());
                    return written.error();
                }
                entry->state = HookState::Enabled;
                break;
            }

            default:
                emit(id, entry->target.address, from, from, ErrorCode::InvalidState);
                return ErrorCode::InvalidState;
        }

        emit(id, entry->target.address, from, entry->state, ErrorCode::Success);
        return {};
    }

    Result<void> disable(const std::string& id) {
        std::shared_ptr<HookEntry> entry;
        std::unique_lock<std::mutex> entryLock;
        if (!lockEntry(id, entry, entryLock)) {
            emit(id, 0, HookState::Uninstalled, HookState::Uninstalled, ErrorCode::HookNotFound);
            return ErrorCode::HookNotFound;
        }

        const HookState from = entry->state;
        switch (from) {
            case HookState::Disabled:
                emitNoop(*entry);
                return {};

            case HookState::Installed:
            case HookState::Enabled: {
                auto written = m_primitive->patch(entry->target.region, entry->target.address,
                                                  entry->originalBytes);
                if (written.isFailure()) {
                    failEntry(*entry);
                    emit(id, entry->target.address, from, HookState::Failed, written.error());
                    return written.error();
                }
                entry->state = HookState::Disabled;
                break;
            }

            default:
                emit(id, entry->target.address, from, from, ErrorCode::InvalidState);
                return ErrorCode::InvalidState;
        }

        emit(id, entry->target.address, from, entry->state, ErrorCode::Success);
        return {};
    }

    Result<void> remove(const std::string& id) {
        std::shared_ptr<HookEntry> entry;
        std::unique_lock<std::mutex> entryLock;
        if (!lockEntry(id, entry, entryLock)) {
            emit(id, 0, HookState::Uninstalled, HookState::Uninstalled, ErrorCode::HookNotFound);
            return ErrorCode::HookNotFound;
        }

        const HookState from = entry->state;
        if (from == HookState::Removed) {
            emitNoop(*entry);
            return {};
        }
        if (from == HookState::Failed || from == HookState::Uninstalled) {
            emit(id, entry->target.address, from, from, ErrorCode::InvalidState);
            return ErrorCode::InvalidState;
        }

        if (redirectActive(from)) {
            auto written = m_primitive->patch(entry->target.region, entry->target.address,
                                              entry->originalBytes);
            if (written.isFailure()) {
                failEntry(*entry);
                emit(id, entry->target.address, from, HookState::Failed, written.error());
                return written.error();
            }
        }

        auto released = m_primitive->uninstall(entry->handle);
        if (released.isFailure()) {
            markFailed(*entry);
            emit(id, entry->target.address, from, HookState::Failed, ErrorCode::HookRemoveError);
            return ErrorCode::HookRemoveError;
        }

        entry->state = HookState::Removed;
        releaseReservation(*entry);
        emit(id, entry->target.address, from, HookState::Removed, ErrorCode::Success);
        return {};
    }

    Result<HookState> state(const std::string& id) const {
        auto entry = findEntry(id);
        if (!entry) {
            return ErrorCode::HookNotFound;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->state;
    }

    Result<HookInfo> info(const std::string& id) const {
        auto entry = findEntry(id);
        if (!entry) {
            return ErrorCode::HookNotFound;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        HookInfo result;
        result.id = entry->id;
        result.target = entry->target.address;
        result.replacement = entry->replacement;
        result.state = entry->state;
        result.originalBytes = entry->originalBytes;
        result.redirectBytes = entry->redirectBytes;
        result.handle = entry->handle;
        return result;
    }

    size_t liveCount() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_live.size();
    }

    std::vector<std::string> ids() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<std::string> result;
        result.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            result.push_back(id);
        }
        return result;
    }

    size_t redirectSize() const noexcept {
        return m_primitive ? m_primitive->redirectSize() : 0;
    }

    size_t removeAll() {
        std::vector<std::string> live;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            live.assign(m_live.begin(), m_live.end());
        }

        size_t failures = 0;
        for (const auto& id : live) {
            auto result = remove(id);
            if (result.isFailure()) {
                SNARE_LOG_ERROR_F("Failed to remove hook '%s': %s", id.c_str(),
                                  std::string(getErrorMessage(result.error())).c_str());
                ++failures;
            }
        }
        return failures;
    }

private:
    std::shared_ptr<HookEntry> findEntry(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        return it == m_entries.end() ? nullptr : it->second;
    }

    /**
     * @brief Lock the entry currently registered under id
     *
     * Retries when a fresh install replaced the entry between lookup and lock.
     */
    bool lockEntry(const std::string& id,
                   std::shared_ptr<HookEntry>& entry,
                   std::unique_lock<std::mutex>& entryLock) const {
        for (;;) {
            entry = findEntry(id);
            if (!entry) {
                return false;
            }
            entryLock = std::unique_lock<std::mutex>(entry->mutex);
            if (findEntry(id) == entry) {
                return true;
            }
            entryLock.unlock();
        }
    }

    /**
     * @brief Write the original bytes back when the target no longer matches them
     */
    void restoreIfChanged(HookEntry& entry) {
        auto current = m_accessor.readAt(entry.target.region, entry.target.address,
                                         entry.originalBytes.size());
        if (current.isSuccess() && current.value() == entry.originalBytes) {
            return;
        }
        auto restored = m_primitive->patch(entry.target.region, entry.target.address,
                                           entry.originalBytes);
        if (restored.isFailure()) {
            SNARE_LOG_CRITICAL_F("Hook '%s': could not restore original bytes at %s",
                                 entry.id.c_str(), formatAddress(entry.target.address).c_str());
        }
    }

    /**
     * @brief Best-effort rollback of a hook whose transition failed
     */
    void failEntry(HookEntry& entry) {
        restoreIfChanged(entry);
        if (entry.handle.isValid()) {
            auto released = m_primitive->uninstall(entry.handle);
            if (released.isFailure()) {
                SNARE_LOG_WARNING_F("Hook '%s': handle release failed during rollback", entry.id.c_str());
            }
        }
        markFailed(entry);
    }

    void markFailed(HookEntry& entry) {
        entry.state = HookState::Failed;
        releaseReservation(entry);
    }

    void releaseReservation(HookEntry& entry) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_live.erase(entry.id);
        auto it = m_addresses.find(entry.target.address);
        if (it != m_addresses.end() && it->second.id == entry.id) {
            m_addresses.erase(it);
        }
    }

    /**
     * @brief True when [address, address + length) intersects a live redirect
     *        (caller holds m_mutex)
     */
    bool overlapsReservation(Address address, size_t length) const {
        const size_t span = length == 0 ? 1 : length;
        auto next = m_addresses.lower_bound(address);
        if (next != m_addresses.end() && next->first - address < span) {
            return true;
        }
        if (next != m_addresses.begin()) {
            auto previous = std::prev(next);
            const size_t previousSpan = previous->second.length == 0 ? 1 : previous->second.length;
            if (address - previous->first < previousSpan) {
                return true;
            }
        }
        return false;
    }

    void emit(const std::string& id, Address address, HookState from, HookState to, ErrorCode outcome) {
        DiagnosticEvent event;
        event.timestamp = std::chrono::system_clock::now();
        event.component = "HookRegistry";
        event.message = outcome == ErrorCode::Success ? "transition" : "transition rejected";
        event.severity = outcome == ErrorCode::Success ? Core::LogLevel::Debug
                       : to == HookState::Failed       ? Core::LogLevel::Error
                                                       : Core::LogLevel::Warning;
        event.fields = {
            {"hook", id},
            {"address", formatAddress(address)},
            {"from", toString(from)},
            {"to", toString(to)},
            {"outcome", outcome == ErrorCode::Success ? std::string("ok")
                                                      : std::string(getErrorMessage(outcome))},
        };
        m_diagnostics->emit(event);
    }

    void emitNoop(const HookEntry& entry) {
        DiagnosticEvent event;
        event.timestamp = std::chrono::system_clock::now();
        event.component = "HookRegistry";
        event.message = "transition";
        event.severity = Core::LogLevel::Trace;
        event.fields = {
            {"hook", entry.id},
            {"address", formatAddress(entry.target.address)},
            {"from", toString(entry.state)},
            {"to", toString(entry.state)},
            {"outcome", "noop"},
        };
        m_diagnostics->emit(event);
    }

    Memory::SafeMemoryAccessor& m_accessor;
    std::shared_ptr<HookPrimitive> m_primitive;
    std::shared_ptr<DiagnosticsSink> m_diagnostics;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<HookEntry>> m_entries;
    std::unordered_set<std::string> m_live;            ///< Ids in a non-terminal state
    struct Reservation {
        size_t length;    ///< Bytes the redirect overwrites
        std::string id;
    };
    std::map<Address, Reservation> m_addresses;   ///< Live patched ranges, ordered by start
};

// ============================================================================
// HookRegistry Public Interface
// ============================================================================

HookRegistry::HookRegistry(Memory::SafeMemoryAccessor& accessor,
                           std::shared_ptr<HookPrimitive> primitive,
                           std::shared_ptr<DiagnosticsSink> diagnostics)
    : m_impl(std::make_unique<Impl>(accessor, std::move(primitive), std::move(diagnostics))) {
}

HookRegistry::~HookRegistry() {
    if (m_impl) {
        m_impl->removeAll();
    }
}

Result<HookHandle> HookRegistry::install(const std::string& id, const HookTarget& target, Address replacement) {
    return m_impl->install(id, target, replacement);
}

Result<void> HookRegistry::enable(const std::string& id) {
    return m_impl->enable(id);
}

Result<void> HookRegistry::disable(const std::string& id) {
    return m_impl->disable(id);
}

Result<void> HookRegistry::remove(const std::string& id) {
    return m_impl->remove(id);
}

Result<HookState> HookRegistry::state(const std::string& id) const {
    return m_impl->state(id);
}

Result<HookInfo> HookRegistry::info(const std::string& id) const {
    return m_impl->info(id);
}

size_t HookRegistry::liveCount() const {
    return m_impl->liveCount();
}

std::vector<std::string> HookRegistry::ids() const {
    return m_impl->ids();
}

size_t HookRegistry::redirectSize() const noexcept {
    return m_impl->redirectSize();
}

size_t HookRegistry::removeAll() {
    return m_impl->removeAll();
}

} // namespace Hooks
} // namespace Core
} // namespace Snare

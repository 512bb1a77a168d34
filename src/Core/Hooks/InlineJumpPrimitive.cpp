/**
 * @file InlineJumpPrimitive.cpp
 * @brief x86-64 absolute jump hooking primitive
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/HookPrimitive.hpp>
#include <Snare/Core/RegionEnumerator.hpp>
#include <Snare/Core/Logger.hpp>

#include <cstring>
#include <mutex>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace Snare {
namespace Core {
namespace Hooks {

namespace {

#ifndef _WIN32
    int toPosixProtection(MemoryProtection protection) noexcept {
        switch (protection) {
            case MemoryProtection::ReadOnly:         return PROT_READ;
            case MemoryProtection::ReadWrite:        return PROT_READ | PROT_WRITE;
            case MemoryProtection::Execute:          return PROT_EXEC;
            case MemoryProtection::ExecuteRead:      return PROT_READ | PROT_EXEC;
            case MemoryProtection::ExecuteReadWrite: return PROT_READ | PROT_WRITE | PROT_EXEC;
            default:                                 return PROT_NONE;
        }
    }
#endif

    /**
     * @brief Guards the save / change / restore of page protection
     *
     * Process-wide, shared by every primitive instance. A page's protection is
     * only saved while no other patch holds it writable.
     */
    std::mutex& protectionMutex() {
        static std::mutex mutex;
        return mutex;
    }

    /**
     * @brief Makes the pages covering [address, address + size) writable and
     *        restores their original protection on destruction
     */
    class WritableScope {
    public:
        WritableScope(Address address, size_t size)
            : m_address(address), m_size(size) {}

        ~WritableScope() { restore(); }

        WritableScope(const WritableScope&) = delete;
        WritableScope& operator=(const WritableScope&) = delete;

        Result<void> begin() {
#ifdef _WIN32
            if (!VirtualProtect(reinterpret_cast<LPVOID>(m_address), m_size,
                                PAGE_EXECUTE_READWRITE, &m_oldProtect)) {
                return ErrorCode::ProtectionChangeFailed;
            }
            m_active = true;
#else
            const long pageSize = sysconf(_SC_PAGESIZE);
            const Address page = static_cast<Address>(pageSize > 0 ? pageSize : 4096);
            const Address first = m_address & ~(page - 1);
            const Address last = (m_address + m_size - 1) & ~(page - 1);

            Memory::RegionEnumerator enumerator;
            for (Address cursor = first; cursor <= last; cursor += page) {
                auto region = enumerator.findRegionContaining(cursor);
                if (region.isFailure()) {
                    return ErrorCode::ProtectionChangeFailed;
                }
                m_pages.push_back({cursor, toPosixProtection(region.value().protection)});
            }

            for (auto& saved : m_pages) {
                if (mprotect(reinterpret_cast<void*>(saved.address), page,
                             PROT_READ | PROT_WRITE | PROT_EXEC) != 0) {
                    restore();
                    return ErrorCode::ProtectionChangeFailed;
                }
                saved.changed = true;
            }
            m_pageSize = page;
            m_active = true;
#endif
            return {};
        }

    private:
        void restore() noexcept {
#ifdef _WIN32
            if (m_active) {
                DWORD ignored;
                if (!VirtualProtect(reinterpret_cast<LPVOID>(m_address), m_size, m_oldProtect, &ignored)) {
                    SNARE_LOG_WARNING_F("Failed to restore protection at 0x%llx",
                                        static_cast<unsigned long long>(m_address));
                }
            }
#else
            for (auto& saved : m_pages) {
                if (saved.changed) {
                    if (mprotect(reinterpret_cast<void*>(saved.address), m_pageSize, saved.protection) != 0) {
                        SNARE_LOG_WARNING_F("Failed to restore protection at 0x%llx",
                                            static_cast<unsigned long long>(saved.address));
                    }
                    saved.changed = false;
                }
            }
#endif
            m_active = false;
        }

        Address m_address;
        size_t m_size;
        bool m_active = false;
#ifdef _WIN32
        DWORD m_oldProtect = 0;
#else
        struct SavedPage {
            Address address;
            int protection;
            bool changed = false;
        };
        std::vector<SavedPage> m_pages;
        Address m_pageSize = 4096;
#endif
    };

    void flushInstructionCache(Address address, size_t size) noexcept {
#ifdef _WIN32
        FlushInstructionCache(GetCurrentProcess(), reinterpret_cast<LPCVOID>(address), size);
#else
        char* begin = reinterpret_cast<char*>(address);
        __builtin___clear_cache(begin, begin + size);
#endif
    }

} // anonymous namespace

InlineJumpPrimitive::InlineJumpPrimitive(Memory::SafeMemoryAccessor& accessor)
    : m_accessor(accessor) {
}

ByteBuffer InlineJumpPrimitive::encodeJump(Address replacement) {
    // jmp qword ptr [rip+0]; dq replacement
    ByteBuffer bytes = {0xFF, 0x25, 0x00, 0x00, 0x00, 0x00};
    const uint64_t target = static_cast<uint64_t>(replacement);
    for (int i = 0; i < 8; ++i) {
        bytes.push_back(static_cast<Byte>((target >> (8 * i)) & 0xFF));
    }
    return bytes;
}

Result<HookHandle> InlineJumpPrimitive::install(const ModuleRegion& region,
                                                Address target,
                                                Address replacement) {
    if (replacement == 0) {
        return ErrorCode::InvalidArgument;
    }

    const ByteBuffer redirect = encodeJump(replacement);
    auto written = patch(region, target, redirect);
    if (written.isFailure()) {
        return written.error();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    HookHandle handle;
    handle.token = m_nextToken++;
    handle.target = target;
    handle.replacement = replacement;
    handle.patchSize = redirect.size();
    m_handles.emplace(handle.token, handle);
    return handle;
}

Result<void> InlineJumpPrimitive::patch(const ModuleRegion& region,
                                        Address address,
                                        ByteSpan bytes) {
    if (bytes.empty()) {
        return {};
    }
    if (!m_accessor.validatePointer(region, address)) {
        return ErrorCode::InvalidAddress;
    }
    if (bytes.size() > region.size - (address - region.base)) {
        return ErrorCode::OutOfBounds;
    }

    // Held until the scope has restored protection
    std::lock_guard<std::mutex> protectionLock(protectionMutex());
    WritableScope scope(address, bytes.size());
    SNARE_TRY(scope.begin());

    auto written = m_accessor.writeAt(region, address, bytes);
    if (written.isFailure()) {
        return written.error();
    }

    flushInstructionCache(address, bytes.size());
    return {};
}

Result<void> InlineJumpPrimitive::uninstall(const HookHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_handles.erase(handle.token) == 0) {
        return ErrorCode::HookRemoveError;
    }
    return {};
}

size_t InlineJumpPrimitive::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handles.size();
}

} // namespace Hooks
} // namespace Core
} // namespace Snare

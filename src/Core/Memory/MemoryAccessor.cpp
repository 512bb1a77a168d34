/**
 * @file MemoryAccessor.cpp
 * @brief Bounds-checked memory access implementation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/MemoryAccessor.hpp>
#include <Snare/Core/RegionEnumerator.hpp>

#include <cstring>

#ifdef _WIN32
#include <windows.h>
#endif

namespace Snare {
namespace Core {
namespace Memory {

namespace {

#ifdef _WIN32
    /**
     * @brief memcpy under SEH; no objects with destructors may live here
     */
    bool sehCopy(void* dst, const void* src, size_t size) noexcept {
        __try {
            std::memcpy(dst, src, size);
            return true;
        } __except(EXCEPTION_EXECUTE_HANDLER) {
            return false;
        }
    }

    bool isRangeAccessible(Address address, size_t size, bool needWrite) noexcept {
        Address cursor = address;
        const Address last = address + size;
        while (cursor < last) {
            MEMORY_BASIC_INFORMATION mbi;
            if (VirtualQuery(reinterpret_cast<LPCVOID>(cursor), &mbi, sizeof(mbi)) == 0) {
                return false;
            }
            if (mbi.State != MEM_COMMIT) return false;
            if (mbi.Protect & PAGE_GUARD) return false;
            if (mbi.Protect & PAGE_NOACCESS) return false;

            MemoryRegion region;
            region.protection = static_cast<MemoryProtection>(mbi.Protect & 0xFF);
            if (needWrite ? !region.isWritable() : !region.isReadable()) {
                return false;
            }
            cursor = reinterpret_cast<Address>(mbi.BaseAddress) + mbi.RegionSize;
        }
        return true;
    }
#endif

    /**
     * @brief Backend over the current process, gated on page protection
     */
    class ProcessMemoryBackend final : public MemoryBackend {
    public:
        Result<void> read(Address address, MutableByteSpan out) override {
            if (out.empty()) {
                return {};
            }
#ifdef _WIN32
            if (!isRangeAccessible(address, out.size(), false) ||
                !sehCopy(out.data(), reinterpret_cast<const void*>(address), out.size())) {
                return ErrorCode::UnreadableMemory;
            }
#else
            RegionEnumerator enumerator;
            auto check = enumerator.checkRange(address, out.size(),
                                               RegionEnumerator::filterReadable,
                                               ErrorCode::UnreadableMemory);
            if (check.isFailure()) {
                return ErrorCode::UnreadableMemory;
            }
            std::memcpy(out.data(), reinterpret_cast<const void*>(address), out.size());
#endif
            return {};
        }

        Result<void> write(Address address, ByteSpan data) override {
            if (data.empty()) {
                return {};
            }
#ifdef _WIN32
            if (!isRangeAccessible(address, data.size(), true) ||
                !sehCopy(reinterpret_cast<void*>(address), data.data(), data.size())) {
                return ErrorCode::WriteProtected;
            }
#else
            RegionEnumerator enumerator;
            auto check = enumerator.checkRange(address, data.size(),
                                               RegionEnumerator::filterWritable,
                                               ErrorCode::WriteProtected);
            if (check.isFailure()) {
                return ErrorCode::WriteProtected;
            }
            std::memcpy(reinterpret_cast<void*>(address), data.data(), data.size());
#endif
            return {};
        }
    };

} // anonymous namespace

std::shared_ptr<MemoryBackend> makeProcessMemoryBackend() {
    return std::make_shared<ProcessMemoryBackend>();
}

// ============================================================================
// SafeMemoryAccessor
// ============================================================================

SafeMemoryAccessor::SafeMemoryAccessor()
    : m_backend(makeProcessMemoryBackend()) {
}

SafeMemoryAccessor::SafeMemoryAccessor(std::shared_ptr<MemoryBackend> backend)
    : m_backend(backend ? std::move(backend) : makeProcessMemoryBackend()) {
}

bool SafeMemoryAccessor::inBounds(const ModuleRegion& region, size_t offset, size_t length) noexcept {
    // offset + length <= size, written to avoid overflow
    return offset <= region.size && length <= region.size - offset;
}

Result<ByteBuffer> SafeMemoryAccessor::read(const ModuleRegion& region, size_t offset, size_t length) {
    if (!inBounds(region, offset, length)) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::OutOfBounds;
    }

    ByteBuffer buffer(length);
    auto result = m_backend->read(region.base + offset, MutableByteSpan(buffer));
    if (result.isFailure()) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return result.error();
    }

    m_reads.fetch_add(1, std::memory_order_relaxed);
    return buffer;
}

Result<void> SafeMemoryAccessor::readInto(const ModuleRegion& region, size_t offset, MutableByteSpan out) {
    if (!inBounds(region, offset, out.size())) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::OutOfBounds;
    }

    auto result = m_backend->read(region.base + offset, out);
    if (result.isFailure()) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return result.error();
    }

    m_reads.fetch_add(1, std::memory_order_relaxed);
    return {};
}

Result<ByteBuffer> SafeMemoryAccessor::readAt(const ModuleRegion& region, Address address, size_t length) {
    if (!validatePointer(region, address)) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::InvalidAddress;
    }
    return read(region, address - region.base, length);
}

Result<void> SafeMemoryAccessor::write(const ModuleRegion& region, size_t offset, ByteSpan bytes) {
    if (!inBounds(region, offset, bytes.size())) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::OutOfBounds;
    }

    auto result = m_backend->write(region.base + offset, bytes);
    if (result.isFailure()) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return result.error();
    }

    m_writes.fetch_add(1, std::memory_order_relaxed);
    return {};
}

Result<void> SafeMemoryAccessor::writeAt(const ModuleRegion& region, Address address, ByteSpan bytes) {
    if (!validatePointer(region, address)) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::InvalidAddress;
    }
    return write(region, address - region.base, bytes);
}

bool SafeMemoryAccessor::validatePointer(const ModuleRegion& region, Address address) const noexcept {
    return address != 0 && region.contains(address);
}

SafeMemoryAccessor::Statistics SafeMemoryAccessor::getStatistics() const noexcept {
    Statistics stats;
    stats.reads = m_reads.load(std::memory_order_relaxed);
    stats.writes = m_writes.load(std::memory_order_relaxed);
    stats.failures = m_failures.load(std::memory_order_relaxed);
    return stats;
}

void SafeMemoryAccessor::resetStatistics() noexcept {
    m_reads.store(0, std::memory_order_relaxed);
    m_writes.store(0, std::memory_order_relaxed);
    m_failures.store(0, std::memory_order_relaxed);
}

} // namespace Memory
} // namespace Core
} // namespace Snare

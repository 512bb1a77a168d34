/**
 * @file MemoryAccessor.hpp
 * @brief Bounds-checked memory access over a module region
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * SafeMemoryAccessor is the only path through which the scanner and the
 * hook registry touch module memory. Every access is checked against the
 * ModuleRegion it targets and reported as a Result; nothing is cached.
 */

#pragma once

#ifndef SNARE_CORE_MEMORY_ACCESSOR_HPP
#define SNARE_CORE_MEMORY_ACCESSOR_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>

#include <atomic>
#include <memory>

namespace Snare {
namespace Core {
namespace Memory {

/**
 * @brief Raw memory backend
 *
 * Backends perform the platform access for an already bounds-checked
 * range. Implementations must be thread-safe and must not change page
 * protection.
 */
class MemoryBackend {
public:
    virtual ~MemoryBackend() = default;

    /**
     * @brief Copy out.size() bytes starting at address
     * @return Success, or UnreadableMemory when any page in the range faults
     */
    [[nodiscard]] virtual Result<void> read(Address address, MutableByteSpan out) = 0;

    /**
     * @brief Copy data to address
     * @return Success, or WriteProtected when any page forbids writing
     */
    [[nodiscard]] virtual Result<void> write(Address address, ByteSpan data) = 0;
};

/**
 * @brief Backend over the current process address space
 *
 * Checks the protection of every page in the range before copying, so an
 * unmapped or protected page is reported instead of faulting.
 */
[[nodiscard]] std::shared_ptr<MemoryBackend> makeProcessMemoryBackend();

/**
 * @brief Bounds-checked reader/writer over module regions
 */
class SafeMemoryAccessor {
public:
    /**
     * @brief Access counters for diagnostics
     */
    struct Statistics {
        uint64_t reads = 0;      ///< Successful reads
        uint64_t writes = 0;     ///< Successful writes
        uint64_t failures = 0;   ///< Rejected or faulted accesses
    };

    /**
     * @brief Construct over the process backend
     */
    SafeMemoryAccessor();

    explicit SafeMemoryAccessor(std::shared_ptr<MemoryBackend> backend);

    SafeMemoryAccessor(const SafeMemoryAccessor&) = delete;
    SafeMemoryAccessor& operator=(const SafeMemoryAccessor&) = delete;

    /**
     * @brief Read length bytes at region.base + offset
     * @return Exactly length bytes, OutOfBounds when offset + length exceeds
     *         region.size, or UnreadableMemory from the backend
     */
    [[nodiscard]] Result<ByteBuffer> read(const ModuleRegion& region, size_t offset, size_t length);

    /**
     * @brief Read into a caller buffer (all-or-nothing)
     */
    [[nodiscard]] Result<void> readInto(const ModuleRegion& region, size_t offset, MutableByteSpan out);

    /**
     * @brief Read length bytes at an absolute address inside region
     * @return InvalidAddress when address is null or outside region,
     *         otherwise as read()
     */
    [[nodiscard]] Result<ByteBuffer> readAt(const ModuleRegion& region, Address address, size_t length);

    /**
     * @brief Write bytes at region.base + offset
     * @return OutOfBounds as read(), or WriteProtected when the page forbids
     *         writing. Protection is never changed here.
     */
    [[nodiscard]] Result<void> write(const ModuleRegion& region, size_t offset, ByteSpan bytes);

    /**
     * @brief Write bytes at an absolute address inside region
     */
    [[nodiscard]] Result<void> writeAt(const ModuleRegion& region, Address address, ByteSpan bytes);

    /**
     * @brief Check that address is non-null and within [base, base + size)
     */
    [[nodiscard]] bool validatePointer(const ModuleRegion& region, Address address) const noexcept;

    [[nodiscard]] Statistics getStatistics() const noexcept;

    void resetStatistics() noexcept;

private:
    [[nodiscard]] static bool inBounds(const ModuleRegion& region, size_t offset, size_t length) noexcept;

    std::shared_ptr<MemoryBackend> m_backend;

    std::atomic<uint64_t> m_reads{0};
    std::atomic<uint64_t> m_writes{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace Memory
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_MEMORY_ACCESSOR_HPP

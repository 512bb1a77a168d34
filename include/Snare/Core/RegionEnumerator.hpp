/**
 * @file RegionEnumerator.hpp
 * @brief Memory region enumeration for the current process
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Enumerates the mappings of the running process (VirtualQuery on Windows,
 * /proc/self/maps on Linux) with filtering helpers used by the module
 * locator, the process memory backend and the inline jump primitive.
 */

#pragma once

#ifndef SNARE_CORE_REGION_ENUMERATOR_HPP
#define SNARE_CORE_REGION_ENUMERATOR_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Snare {
namespace Core {
namespace Memory {

/**
 * @brief Filter predicate for region enumeration
 */
using RegionFilter = std::function<bool(const MemoryRegion&)>;

/**
 * @brief Memory region enumerator for the current process
 *
 * Regions are returned in ascending address order. Each call takes a fresh
 * snapshot; nothing is cached.
 */
class RegionEnumerator {
public:
    RegionEnumerator();

    ~RegionEnumerator();

    RegionEnumerator(const RegionEnumerator&) = delete;
    RegionEnumerator& operator=(const RegionEnumerator&) = delete;

    RegionEnumerator(RegionEnumerator&&) noexcept;
    RegionEnumerator& operator=(RegionEnumerator&&) noexcept;

    /**
     * @brief Enumerate all committed memory regions
     * @return Vector of regions, or IOError if the map cannot be read
     */
    [[nodiscard]] Result<std::vector<MemoryRegion>> enumerateAll();

    /**
     * @brief Enumerate regions matching filter
     */
    [[nodiscard]] Result<std::vector<MemoryRegion>> enumerateFiltered(RegionFilter filter);

    /**
     * @brief Find region containing address
     * @return Region containing address or RegionNotFound
     */
    [[nodiscard]] Result<MemoryRegion> findRegionContaining(Address address);

    /**
     * @brief Get all executable regions
     */
    [[nodiscard]] Result<std::vector<MemoryRegion>> getExecutableRegions();

    /**
     * @brief Get all regions belonging to a module
     * @param moduleName File name of the module (e.g., "game.exe", "libc.so.6"),
     *        compared case-insensitively
     */
    [[nodiscard]] Result<std::vector<MemoryRegion>> getModuleRegions(const std::string& moduleName);

    /**
     * @brief Check that [address, address + length) is fully mapped by regions
     *        that all satisfy @p filter
     * @return Success, RegionNotFound for a gap, or the supplied failure code
     *         when a covering region is rejected by the filter
     */
    [[nodiscard]] Result<void> checkRange(Address address, size_t length,
                                          const RegionFilter& filter,
                                          ErrorCode rejected);

    // ========================================================================
    // Built-in Filter Functions
    // ========================================================================

    static bool filterExecutable(const MemoryRegion& region) noexcept;

    static bool filterWritable(const MemoryRegion& region) noexcept;

    static bool filterReadable(const MemoryRegion& region) noexcept;

    /**
     * @brief Create module name filter
     * @param moduleName Module name to match (case-insensitive)
     */
    static RegionFilter createModuleFilter(const std::string& moduleName);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Memory
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_REGION_ENUMERATOR_HPP

/**
 * @file ModuleLocator.hpp
 * @brief Resolves module names to scannable regions
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#pragma once

#ifndef SNARE_CORE_MODULE_LOCATOR_HPP
#define SNARE_CORE_MODULE_LOCATOR_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Snare {
namespace Core {

/**
 * @brief Supplies the region of a loaded module by name
 */
class ModuleProvider {
public:
    virtual ~ModuleProvider() = default;

    /**
     * @return Region of the module, or ModuleNotFound
     */
    [[nodiscard]] virtual Result<ModuleRegion> locate(const std::string& moduleName) = 0;
};

/**
 * @brief ModuleProvider over the current process
 *
 * Returns the largest gap-free run of executable mappings of the named
 * module, so every byte of the region is mapped and readable by a scan.
 * Names compare case-insensitively and results are cached until invalidated.
 */
class ProcessModuleLocator final : public ModuleProvider {
public:
    [[nodiscard]] Result<ModuleRegion> locate(const std::string& moduleName) override;

    /**
     * @brief Forget the cached region for one module (e.g. after unload)
     */
    void invalidate(const std::string& moduleName);

    void clear();

    /**
     * @brief Largest run of adjacent executable mappings
     *
     * Mappings need not be sorted. Runs of equal size resolve to the lowest
     * address. Non-executable mappings break a run.
     *
     * @return Region spanning the run, or ModuleNotFound if nothing is executable
     */
    [[nodiscard]] static Result<ModuleRegion> executableSpan(std::vector<MemoryRegion> mappings);

private:
    std::mutex m_mutex;
    std::unordered_map<std::string, ModuleRegion> m_cache;  ///< Keyed by lower-case name
};

} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_MODULE_LOCATOR_HPP

/**
 * @file ModuleLocator.cpp
 * @brief Process module lookup
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/ModuleLocator.hpp>
#include <Snare/Core/RegionEnumerator.hpp>
#include <Snare/Core/Logger.hpp>

#include <algorithm>
#include <cctype>

namespace Snare {
namespace Core {

namespace {

    std::string normalizeName(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

} // anonymous namespace

Result<ModuleRegion> ProcessModuleLocator::locate(const std::string& moduleName) {
    if (moduleName.empty()) {
        return ErrorCode::InvalidArgument;
    }

    const std::string key = normalizeName(moduleName);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    Memory::RegionEnumerator enumerator;
    auto regions = enumerator.getModuleRegions(moduleName);
    if (regions.isFailure()) {
        return regions.error();
    }

    auto span = executableSpan(regions.value());
    if (span.isFailure()) {
        SNARE_LOG_DEBUG_F("Module '%s' has no executable mapping", moduleName.c_str());
        return span.error();
    }

    const ModuleRegion module = span.value();

    SNARE_LOG_DEBUG_F("Module '%s' located at %p (%zu bytes)", moduleName.c_str(),
                      reinterpret_cast<const void*>(module.base), module.size);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache[key] = module;
    return module;
}

Result<ModuleRegion> ProcessModuleLocator::executableSpan(std::vector<MemoryRegion> mappings) {
    std::sort(mappings.begin(), mappings.end(),
              [](const MemoryRegion& a, const MemoryRegion& b) { return a.baseAddress < b.baseAddress; });

    ModuleRegion best;
    ModuleRegion current;
    for (const auto& region : mappings) {
        if (!region.isExecutable() || region.regionSize == 0) {
            current = ModuleRegion{};
            continue;
        }
        if (current.size != 0 && current.base + current.size == region.baseAddress) {
            current.size += region.regionSize;
        } else {
            current.base = region.baseAddress;
            current.size = region.regionSize;
        }
        if (current.size > best.size) {
            best = current;
        }
    }

    if (best.size == 0) {
        return ErrorCode::ModuleNotFound;
    }
    return best;
}

void ProcessModuleLocator::invalidate(const std::string& moduleName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.erase(normalizeName(moduleName));
}

void ProcessModuleLocator::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

} // namespace Core
} // namespace Snare

/**
 * @file RegionEnumerator.cpp
 * @brief Memory region enumeration implementation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/RegionEnumerator.hpp>

#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#else
#include <fstream>
#include <sstream>
#endif

namespace Snare {
namespace Core {
namespace Memory {

namespace {

    std::string baseName(const std::string& path) {
        size_t pos = path.find_last_of("\\/");
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

#ifndef _WIN32
    MemoryProtection protectionFromPerms(const std::string& perms) noexcept {
        const bool r = perms.size() > 0 && perms[0] == 'r';
        const bool w = perms.size() > 1 && perms[1] == 'w';
        const bool x = perms.size() > 2 && perms[2] == 'x';

        if (x) {
            if (w) return MemoryProtection::ExecuteReadWrite;
            if (r) return MemoryProtection::ExecuteRead;
            return MemoryProtection::Execute;
        }
        if (w) return MemoryProtection::ReadWrite;
        if (r) return MemoryProtection::ReadOnly;
        return MemoryProtection::NoAccess;
    }
#endif

} // anonymous namespace

#ifdef _WIN32

/**
 * @brief Implementation class for RegionEnumerator (VirtualQuery)
 */
class RegionEnumerator::Impl {
public:
    Result<std::vector<MemoryRegion>> enumerateAll() {
        std::vector<MemoryRegion> regions;
        MEMORY_BASIC_INFORMATION mbi;
        Address address = 0;

        while (VirtualQuery(reinterpret_cast<LPCVOID>(address), &mbi, sizeof(mbi)) != 0) {
            if (mbi.State == MEM_COMMIT) {
                regions.push_back(toRegion(mbi));
            }

            address = reinterpret_cast<Address>(mbi.BaseAddress) + mbi.RegionSize;
            if (address == 0) break; // Wrapped
        }

        return regions;
    }

    Result<MemoryRegion> findRegionContaining(Address address) {
        MEMORY_BASIC_INFORMATION mbi;
        if (VirtualQuery(reinterpret_cast<LPCVOID>(address), &mbi, sizeof(mbi)) == 0) {
            return ErrorCode::RegionNotFound;
        }

        if (mbi.State != MEM_COMMIT) {
            return ErrorCode::RegionNotFound;
        }

        return toRegion(mbi);
    }

private:
    static MemoryRegion toRegion(const MEMORY_BASIC_INFORMATION& mbi) {
        MemoryRegion region;
        region.baseAddress = reinterpret_cast<Address>(mbi.BaseAddress);
        region.regionSize = mbi.RegionSize;
        region.protection = static_cast<MemoryProtection>(mbi.Protect);

        if (mbi.Type == MEM_IMAGE) {
            char moduleName[MAX_PATH];
            if (GetModuleFileNameA(reinterpret_cast<HMODULE>(mbi.AllocationBase),
                                   moduleName, MAX_PATH)) {
                region.moduleName = baseName(moduleName);
            }
        }
        return region;
    }
};

#else // !_WIN32

/**
 * @brief Implementation class for RegionEnumerator (/proc/self/maps)
 */
class RegionEnumerator::Impl {
public:
    Result<std::vector<MemoryRegion>> enumerateAll() {
        std::ifstream maps("/proc/self/maps");
        if (!maps.is_open()) {
            return ErrorCode::IOError;
        }

        std::vector<MemoryRegion> regions;
        std::string line;
        while (std::getline(maps, line)) {
            // start-end perms offset dev inode [path]
            std::istringstream fields(line);
            std::string range, perms, offset, device, inode;
            if (!(fields >> range >> perms >> offset >> device >> inode)) {
                continue;
            }

            const size_t dash = range.find('-');
            if (dash == std::string::npos) {
                continue;
            }

            MemoryRegion region;
            try {
                const Address start = static_cast<Address>(std::stoull(range.substr(0, dash), nullptr, 16));
                const Address end = static_cast<Address>(std::stoull(range.substr(dash + 1), nullptr, 16));
                if (end <= start) {
                    continue;
                }
                region.baseAddress = start;
                region.regionSize = end - start;
            } catch (const std::exception&) {
                continue;
            }
            region.protection = protectionFromPerms(perms);

            std::string path;
            std::getline(fields >> std::ws, path);
            if (!path.empty() && path.front() == '/') {
                region.moduleName = baseName(path);
            }

            regions.push_back(std::move(region));
        }

        return regions;
    }

    Result<MemoryRegion> findRegionContaining(Address address) {
        auto regions = enumerateAll();
        if (regions.isFailure()) {
            return regions.error();
        }

        for (const auto& region : regions.value()) {
            if (address >= region.baseAddress && address < region.endAddress()) {
                return region;
            }
        }
        return ErrorCode::RegionNotFound;
    }
};

#endif // _WIN32

// ============================================================================
// RegionEnumerator Public Interface
// ============================================================================

RegionEnumerator::RegionEnumerator()
    : m_impl(std::make_unique<Impl>()) {
}

RegionEnumerator::~RegionEnumerator() = default;

RegionEnumerator::RegionEnumerator(RegionEnumerator&&) noexcept = default;
RegionEnumerator& RegionEnumerator::operator=(RegionEnumerator&&) noexcept = default;

Result<std::vector<MemoryRegion>> RegionEnumerator::enumerateAll() {
    return m_impl->enumerateAll();
}

Result<std::vector<MemoryRegion>> RegionEnumerator::enumerateFiltered(RegionFilter filter) {
    auto allRegions = enumerateAll();
    if (allRegions.isFailure()) {
        return allRegions.error();
    }

    std::vector<MemoryRegion> filtered;
    for (const auto& region : allRegions.value()) {
        if (filter(region)) {
            filtered.push_back(region);
        }
    }

    return filtered;
}

Result<MemoryRegion> RegionEnumerator::findRegionContaining(Address address) {
    return m_impl->findRegionContaining(address);
}

Result<std::vector<MemoryRegion>> RegionEnumerator::getExecutableRegions() {
    return enumerateFiltered(filterExecutable);
}

Result<std::vector<MemoryRegion>> RegionEnumerator::getModuleRegions(const std::string& moduleName) {
    return enumerateFiltered(createModuleFilter(moduleName));
}

Result<void> RegionEnumerator::checkRange(Address address, size_t length,
                                          const RegionFilter& filter,
                                          ErrorCode rejected) {
    if (length == 0) {
        return {};
    }
    if (address + length < address) {
        return ErrorCode::InvalidAddress;
    }

    Address cursor = address;
    const Address last = address + length;
    while (cursor < last) {
        auto region = findRegionContaining(cursor);
        if (region.isFailure()) {
            return region.error();
        }
        if (!filter(region.value())) {
            return rejected;
        }
        const Address regionEnd = region.value().endAddress();
        if (regionEnd <= cursor) {
            return ErrorCode::RegionNotFound;
        }
        cursor = regionEnd;
    }
    return {};
}

// ============================================================================
// Filter Functions
// ============================================================================

bool RegionEnumerator::filterExecutable(const MemoryRegion& region) noexcept {
    return region.isExecutable();
}

bool RegionEnumerator::filterWritable(const MemoryRegion& region) noexcept {
    return region.isWritable();
}

bool RegionEnumerator::filterReadable(const MemoryRegion& region) noexcept {
    return region.isReadable();
}

RegionFilter RegionEnumerator::createModuleFilter(const std::string& moduleName) {
    return [target = toLower(moduleName)](const MemoryRegion& region) -> bool {
        if (region.moduleName.empty()) {
            return false;
        }
        return toLower(region.moduleName) == target;
    };
}

} // namespace Memory
} // namespace Core
} // namespace Snare

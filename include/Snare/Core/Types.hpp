/**
 * @file Types.hpp
 * @brief Core type definitions for the Snare hooking library
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 * 
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Snare codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef SNARE_CORE_TYPES_HPP
#define SNARE_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <span>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>

namespace Snare {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw memory operations
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/// Memory address type (platform-specific)
using Address = uintptr_t;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock for waits and timeouts
using Clock = std::chrono::steady_clock;

/// Time point type
using TimePoint = Clock::time_point;

/// Wall-clock time point for diagnostics
using SystemTimePoint = std::chrono::system_clock::time_point;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Memory Region Types
// ============================================================================

/**
 * @brief Memory protection flags
 * 
 * Matches Windows PAGE_* constants for easy conversion. POSIX r/w/x
 * permissions are mapped onto the closest value.
 */
enum class MemoryProtection : uint32_t {
    NoAccess          = 0x01,
    ReadOnly          = 0x02,
    ReadWrite         = 0x04,
    WriteCopy         = 0x08,
    Execute           = 0x10,
    ExecuteRead       = 0x20,
    ExecuteReadWrite  = 0x40,
    ExecuteWriteCopy  = 0x80,
    Guard             = 0x100,
    NoCache           = 0x200,
    WriteCombine      = 0x400
};

/**
 * @brief Describes one mapping in the process address space
 */
struct MemoryRegion {
    Address baseAddress = 0;                               ///< Base address of the region
    size_t regionSize = 0;                                 ///< Size in bytes
    MemoryProtection protection = MemoryProtection::NoAccess; ///< Current protection
    std::string moduleName;                                ///< Backing module file name (if any)
    
    /// Check if region is executable
    [[nodiscard]] bool isExecutable() const noexcept {
        return static_cast<uint32_t>(protection) & 
               (static_cast<uint32_t>(MemoryProtection::Execute) |
                static_cast<uint32_t>(MemoryProtection::ExecuteRead) |
                static_cast<uint32_t>(MemoryProtection::ExecuteReadWrite) |
                static_cast<uint32_t>(MemoryProtection::ExecuteWriteCopy));
    }
    
    /// Check if region is writable
    [[nodiscard]] bool isWritable() const noexcept {
        return static_cast<uint32_t>(protection) &
               (static_cast<uint32_t>(MemoryProtection::ReadWrite) |
                static_cast<uint32_t>(MemoryProtection::WriteCopy) |
                static_cast<uint32_t>(MemoryProtection::ExecuteReadWrite) |
                static_cast<uint32_t>(MemoryProtection::ExecuteWriteCopy));
    }
    
    /// Check if region is readable
    [[nodiscard]] bool isReadable() const noexcept {
        const uint32_t value = static_cast<uint32_t>(protection);
        if (value & static_cast<uint32_t>(MemoryProtection::Guard)) {
            return false;
        }
        return value & 
               (static_cast<uint32_t>(MemoryProtection::ReadOnly) |
                static_cast<uint32_t>(MemoryProtection::ReadWrite) |
                static_cast<uint32_t>(MemoryProtection::WriteCopy) |
                static_cast<uint32_t>(MemoryProtection::ExecuteRead) |
                static_cast<uint32_t>(MemoryProtection::ExecuteReadWrite) |
                static_cast<uint32_t>(MemoryProtection::ExecuteWriteCopy));
    }
    
    /// End address (exclusive)
    [[nodiscard]] Address endAddress() const noexcept {
        return baseAddress + regionSize;
    }
};

// ============================================================================
// Module Region
// ============================================================================

/**
 * @brief Bounds of the scannable memory of one loaded module
 * 
 * Supplied by the module collaborator and treated as immutable for the
 * duration of a scan. (base, size) is the module identity used for caching.
 */
struct ModuleRegion {
    Address base = 0;   ///< First byte of the module image
    size_t size = 0;    ///< Image size in bytes
    
    /// End address (exclusive)
    [[nodiscard]] Address end() const noexcept {
        return base + size;
    }
    
    /// Check whether an address lies within [base, base + size)
    [[nodiscard]] bool contains(Address address) const noexcept {
        return address >= base && address - base < size;
    }
    
    [[nodiscard]] bool operator==(const ModuleRegion& other) const noexcept {
        return base == other.base && size == other.size;
    }
    
    [[nodiscard]] bool operator!=(const ModuleRegion& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace Snare

#endif // SNARE_CORE_TYPES_HPP

/**
 * @file PatternScanner.hpp
 * @brief Cached signature scanning over module regions
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Finds the lowest offset at which a Pattern matches inside a ModuleRegion.
 * Memory is read through SafeMemoryAccessor in overlapping chunks, and
 * every completed search (hit or miss) is cached by (region, pattern).
 */

#pragma once

#ifndef SNARE_CORE_PATTERN_SCANNER_HPP
#define SNARE_CORE_PATTERN_SCANNER_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>
#include <Snare/Core/Pattern.hpp>
#include <Snare/Core/MemoryAccessor.hpp>

#include <memory>
#include <optional>

namespace Snare {
namespace Core {
namespace Memory {

/**
 * @brief Matching algorithm selection
 */
enum class ScanAlgorithm : uint8_t {
    Auto,        ///< SkipSearch for sparse-wildcard patterns, Naive otherwise
    Naive,       ///< Masked compare at every offset
    SkipSearch   ///< Horspool skip table built from concrete bytes only
};

/**
 * @brief Signature scanner with a per-(region, pattern) result cache
 *
 * Thread-safe. Concurrent finds of the same key scan once; unrelated keys
 * do not serialize on each other.
 */
class PatternScanner {
public:
    /**
     * @brief Scanner tuning
     *
     * None of these change results, only how they are computed.
     */
    struct Options {
        size_t chunkSize = 1024 * 1024;           ///< Bytes per accessor read (plus overlap)
        double skipSearchMaxWildcardRatio = 0.25; ///< Auto: SkipSearch at or below this ratio
        ScanAlgorithm algorithm = ScanAlgorithm::Auto;
    };

    /**
     * @brief Cache counters
     */
    struct CacheStatistics {
        size_t entries = 0;          ///< Cached keys
        size_t positiveEntries = 0;  ///< Cached keys with a match
        uint64_t hits = 0;           ///< finds answered from the cache
        uint64_t misses = 0;         ///< finds that scanned memory
    };

    explicit PatternScanner(SafeMemoryAccessor& accessor);

    PatternScanner(SafeMemoryAccessor& accessor, Options options);

    ~PatternScanner();

    PatternScanner(const PatternScanner&) = delete;
    PatternScanner& operator=(const PatternScanner&) = delete;

    /**
     * @brief Find the first offset at which pattern matches in region
     * @return Offset relative to region.base, nullopt when the whole region
     *         was searched without a match, or ScanMemoryError when the
     *         accessor failed (not cached)
     */
    [[nodiscard]] Result<std::optional<size_t>> find(const ModuleRegion& region, const Pattern& pattern);

    /**
     * @brief Drop every cached result for region
     */
    void invalidate(const ModuleRegion& region);

    /**
     * @brief Drop every cached result
     */
    void clear();

    [[nodiscard]] CacheStatistics getCacheStatistics() const;

    [[nodiscard]] const Options& getOptions() const noexcept;

    /**
     * @brief Algorithm Auto resolves to for a pattern
     */
    [[nodiscard]] static ScanAlgorithm selectAlgorithm(const Pattern& pattern, const Options& options) noexcept;

    /**
     * @brief Find the first match of pattern within data
     * @param algorithm Naive or SkipSearch (Auto uses default Options)
     */
    [[nodiscard]] static std::optional<size_t> findInBuffer(ByteSpan data, const Pattern& pattern,
                                                            ScanAlgorithm algorithm = ScanAlgorithm::Auto);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Memory
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_PATTERN_SCANNER_HPP

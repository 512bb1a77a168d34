/**
 * @file PatternScanner.cpp
 * @brief Cached signature scanning implementation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/PatternScanner.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace Snare {
namespace Core {
namespace Memory {

namespace {

    /**
     * @brief Cache key: module identity plus pattern identity
     */
    struct CacheKey {
        Address base;
        size_t size;
        Pattern pattern;

        bool operator==(const CacheKey& other) const noexcept {
            return base == other.base && size == other.size && pattern == other.pattern;
        }
    };

    struct CacheKeyHash {
        size_t operator()(const CacheKey& key) const noexcept {
            size_t hash = std::hash<Address>{}(key.base);
            hash ^= std::hash<size_t>{}(key.size) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            hash ^= key.pattern.hash() + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            return hash;
        }
    };

    /**
     * @brief One cached search
     *
     * The mutex serializes the scan for this key; state mirrors result for
     * lock-free statistics.
     */
    struct CacheSlot {
        enum State : int { Empty = 0, Negative = 1, Positive = 2 };

        std::mutex mutex;
        std::optional<std::optional<size_t>> result;  ///< Outer empty = never searched
        std::atomic<int> state{Empty};
    };

    std::optional<size_t> naiveSearch(ByteSpan data, const Pattern& pattern) noexcept {
        const size_t m = pattern.size();
        if (m == 0 || data.size() < m) {
            return std::nullopt;
        }

        const size_t last = data.size() - m;
        for (size_t pos = 0; pos <= last; ++pos) {
            if (pattern.matchesAt(data.data() + pos)) {
                return pos;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Horspool search; wildcard tokens never contribute a skip
     *
     * A wildcard at index i matches any byte, so the default shift is
     * bounded by the last wildcard before the final token.
     */
    std::optional<size_t> skipSearch(ByteSpan data, const Pattern& pattern) noexcept {
        const size_t m = pattern.size();
        if (m == 0 || data.size() < m) {
            return std::nullopt;
        }

        size_t defaultShift = m;
        for (size_t i = 0; i + 1 < m; ++i) {
            if (pattern.isWildcard(i)) {
                defaultShift = m - 1 - i;
            }
        }

        std::array<size_t, 256> shift;
        shift.fill(defaultShift);
        const auto& bytes = pattern.bytes();
        for (size_t i = 0; i + 1 < m; ++i) {
            if (!pattern.isWildcard(i)) {
                size_t& entry = shift[bytes[i]];
                entry = std::min(entry, m - 1 - i);
            }
        }

        size_t pos = 0;
        while (pos + m <= data.size()) {
            if (pattern.matchesAt(data.data() + pos)) {
                return pos;
            }
            pos += shift[data[pos + m - 1]];
        }
        return std::nullopt;
    }

} // anonymous namespace

// ============================================================================
// Implementation
// ============================================================================

class PatternScanner::Impl {
public:
    Impl(SafeMemoryAccessor& accessor, Options options)
        : m_accessor(accessor)
        , m_options(options) {
        if (m_options.chunkSize == 0) {
            m_options.chunkSize = 1;
        }
    }

    Result<std::optional<size_t>> find(const ModuleRegion& region, const Pattern& pattern) {
        std::shared_ptr<CacheSlot> slot = acquireSlot(region, pattern);

        std::lock_guard<std::mutex> slotLock(slot->mutex);
        if (slot->result.has_value()) {
            m_hits.fetch_add(1, std::memory_order_relaxed);
            return *slot->result;
        }

        auto scanned = scanRegion(region, pattern);
        if (scanned.isFailure()) {
            return scanned.error();
        }

        m_misses.fetch_add(1, std::memory_order_relaxed);
        slot->result = scanned.value();
        slot->state.store(scanned.value().has_value() ? CacheSlot::Positive : CacheSlot::Negative,
                          std::memory_order_release);
        return scanned.value();
    }

    void invalidate(const ModuleRegion& region) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (auto it = m_cache.begin(); it != m_cache.end();) {
            if (it->first.base == region.base && it->first.size == region.size) {
                it = m_cache.erase(it);
            } else {
                ++it;
            }
        }
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_cache.clear();
    }

    CacheStatistics getCacheStatistics() const {
        CacheStatistics stats;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            for (const auto& [key, slot] : m_cache) {
                const int state = slot->state.load(std::memory_order_acquire);
                if (state != CacheSlot::Empty) {
                    ++stats.entries;
                }
                if (state == CacheSlot::Positive) {
                    ++stats.positiveEntries;
                }
            }
        }
        stats.hits = m_hits.load(std::memory_order_relaxed);
        stats.misses = m_misses.load(std::memory_order_relaxed);
        return stats;
    }

    const Options& getOptions() const noexcept {
        return m_options;
    }

private:
    std::shared_ptr<CacheSlot> acquireSlot(const ModuleRegion& region, const Pattern& pattern) {
        CacheKey key{region.base, region.size, pattern};

        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_cache.find(key);
            if (it != m_cache.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto [it, inserted] = m_cache.try_emplace(std::move(key), nullptr);
        if (inserted) {
            it->second = std::make_shared<CacheSlot>();
        }
        return it->second;
    }

    /**
     * @brief Chunked search; consecutive chunks overlap by pattern.size() - 1
     */
    Result<std::optional<size_t>> scanRegion(const ModuleRegion& region, const Pattern& pattern) {
        const size_t m = pattern.size();
        if (region.size < m) {
            return std::optional<size_t>{};
        }

        const ScanAlgorithm algorithm = selectAlgorithm(pattern, m_options);
        // A chunk never exceeds the region, so chunkSize + m - 1 cannot wrap
        const size_t chunkSize = std::min(m_options.chunkSize, region.size);
        ByteBuffer buffer(std::min(region.size, chunkSize + m - 1));

        for (size_t chunkStart = 0; chunkStart + m <= region.size; chunkStart += chunkSize) {
            const size_t readLength = std::min(chunkSize + m - 1, region.size - chunkStart);

            MutableByteSpan window(buffer.data(), readLength);
            auto readResult = m_accessor.readInto(region, chunkStart, window);
            if (readResult.isFailure()) {
                return ErrorCode::ScanMemoryError;
            }

            auto match = findInBuffer(ByteSpan(window.data(), window.size()), pattern, algorithm);
            if (match) {
                return std::optional<size_t>{chunkStart + *match};
            }
        }

        return std::optional<size_t>{};
    }

    SafeMemoryAccessor& m_accessor;
    Options m_options;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<CacheKey, std::shared_ptr<CacheSlot>, CacheKeyHash> m_cache;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
};

// ============================================================================
// PatternScanner Public Interface
// ============================================================================

PatternScanner::PatternScanner(SafeMemoryAccessor& accessor)
    : m_impl(std::make_unique<Impl>(accessor, Options{})) {
}

PatternScanner::PatternScanner(SafeMemoryAccessor& accessor, Options options)
    : m_impl(std::make_unique<Impl>(accessor, options)) {
}

PatternScanner::~PatternScanner() = default;

Result<std::optional<size_t>> PatternScanner::find(const ModuleRegion& region, const Pattern& pattern) {
    return m_impl->find(region, pattern);
}

void PatternScanner::invalidate(const ModuleRegion& region) {
    m_impl->invalidate(region);
}

void PatternScanner::clear() {
    m_impl->clear();
}

PatternScanner::CacheStatistics PatternScanner::getCacheStatistics() const {
    return m_impl->getCacheStatistics();
}

const PatternScanner::Options& PatternScanner::getOptions() const noexcept {
    return m_impl->getOptions();
}

ScanAlgorithm PatternScanner::selectAlgorithm(const Pattern& pattern, const Options& options) noexcept {
    if (options.algorithm != ScanAlgorithm::Auto) {
        return options.algorithm;
    }
    if (pattern.size() >= 3 && pattern.wildcardRatio() <= options.skipSearchMaxWildcardRatio) {
        return ScanAlgorithm::SkipSearch;
    }
    return ScanAlgorithm::Naive;
}

std::optional<size_t> PatternScanner::findInBuffer(ByteSpan data, const Pattern& pattern,
                                                   ScanAlgorithm algorithm) {
    if (algorithm == ScanAlgorithm::Auto) {
        algorithm = selectAlgorithm(pattern, Options{});
    }
    return algorithm == ScanAlgorithm::SkipSearch ? skipSearch(data, pattern)
                                                  : naiveSearch(data, pattern);
}

} // namespace Memory
} // namespace Core
} // namespace Snare

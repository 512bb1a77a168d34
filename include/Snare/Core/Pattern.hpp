/**
 * @file Pattern.hpp
 * @brief Compiled byte signatures with wildcards
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * A Pattern is an immutable sequence of tokens, each either an exact byte
 * or a wildcard. Compiled patterns are safe to share read-only across
 * threads and are used as cache keys by the PatternScanner.
 */

#pragma once

#ifndef SNARE_CORE_PATTERN_HPP
#define SNARE_CORE_PATTERN_HPP

#include <Snare/Core/Types.hpp>
#include <Snare/Core/ErrorCodes.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Snare {
namespace Core {
namespace Memory {

/**
 * @brief Byte signature with wildcard positions
 *
 * Accepted text forms:
 * - "48 8B ?? 00 FF" (?? = wildcard byte)
 * - "48 8B ? 00 FF"  (? = wildcard byte)
 * - "488B??00FF"     (tokens may be packed without separators)
 */
class Pattern {
public:
    /**
     * @brief Compile signature text
     * @param text Whitespace separated hex pairs and wildcards
     * @return Compiled pattern, or PatternSyntaxError for empty input,
     *         odd-length hex runs and characters outside [0-9A-Fa-f?]
     *
     * @example
     * auto pattern = Pattern::compile("49 81 C3 9A 0B FB FF");
     */
    [[nodiscard]] static Result<Pattern> compile(std::string_view text);

    /// Number of tokens
    [[nodiscard]] size_t size() const noexcept { return m_bytes.size(); }

    /// Token bytes (0x00 at wildcard positions)
    [[nodiscard]] const ByteBuffer& bytes() const noexcept { return m_bytes; }

    /// Mask (true = must match, false = wildcard)
    [[nodiscard]] const std::vector<bool>& mask() const noexcept { return m_mask; }

    [[nodiscard]] bool isWildcard(size_t index) const noexcept {
        return index < m_mask.size() && !m_mask[index];
    }

    [[nodiscard]] size_t wildcardCount() const noexcept { return m_wildcards; }

    /// Fraction of tokens that are wildcards, in [0, 1]
    [[nodiscard]] double wildcardRatio() const noexcept {
        return m_bytes.empty() ? 0.0
                               : static_cast<double>(m_wildcards) / static_cast<double>(m_bytes.size());
    }

    /// Check whether the pattern matches at the start of @p data
    [[nodiscard]] bool matchesAt(const Byte* data) const noexcept;

    /// Canonical "48 8B ?? 00 FF" form
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] size_t hash() const noexcept { return m_hash; }

    [[nodiscard]] bool operator==(const Pattern& other) const noexcept {
        return m_hash == other.m_hash && m_mask == other.m_mask && m_bytes == other.m_bytes;
    }

    [[nodiscard]] bool operator!=(const Pattern& other) const noexcept {
        return !(*this == other);
    }

private:
    Pattern() = default;

    ByteBuffer m_bytes;
    std::vector<bool> m_mask;
    size_t m_wildcards = 0;
    size_t m_hash = 0;
};

/**
 * @brief Hash functor for keyed containers
 */
struct PatternHash {
    size_t operator()(const Pattern& pattern) const noexcept {
        return pattern.hash();
    }
};

} // namespace Memory
} // namespace Core
} // namespace Snare

#endif // SNARE_CORE_PATTERN_HPP

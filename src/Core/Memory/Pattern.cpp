/**
 * @file Pattern.cpp
 * @brief Signature text compilation
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/Pattern.hpp>

#include <cctype>
#include <cstdio>

namespace Snare {
namespace Core {
namespace Memory {

namespace {

    int hexValue(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    /**
     * @brief FNV-1a over (byte, mask) pairs
     */
    size_t hashTokens(const ByteBuffer& bytes, const std::vector<bool>& mask) noexcept {
        uint64_t hash = 14695981039346656037ULL;
        for (size_t i = 0; i < bytes.size(); ++i) {
            hash ^= bytes[i];
            hash *= 1099511628211ULL;
            hash ^= mask[i] ? 0x01u : 0x00u;
            hash *= 1099511628211ULL;
        }
        return static_cast<size_t>(hash);
    }

} // anonymous namespace

Result<Pattern> Pattern::compile(std::string_view text) {
    Pattern pattern;

    size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        if (c == '?') {
            // "?" and "??" both denote one wildcard byte
            pos += (pos + 1 < text.size() && text[pos + 1] == '?') ? 2 : 1;
            pattern.m_bytes.push_back(0x00);
            pattern.m_mask.push_back(false);
            ++pattern.m_wildcards;
            continue;
        }

        if (hexValue(c) < 0) {
            return ErrorCode::PatternSyntaxError;
        }

        // Hex run ends at whitespace, a wildcard or end of input
        size_t runEnd = pos;
        while (runEnd < text.size() && hexValue(text[runEnd]) >= 0) {
            ++runEnd;
        }
        if ((runEnd - pos) % 2 != 0) {
            return ErrorCode::PatternSyntaxError;
        }
        for (size_t i = pos; i < runEnd; i += 2) {
            const int value = (hexValue(text[i]) << 4) | hexValue(text[i + 1]);
            pattern.m_bytes.push_back(static_cast<Byte>(value));
            pattern.m_mask.push_back(true);
        }
        pos = runEnd;
    }

    if (pattern.m_bytes.empty()) {
        return ErrorCode::PatternSyntaxError;
    }

    pattern.m_hash = hashTokens(pattern.m_bytes, pattern.m_mask);
    return pattern;
}

bool Pattern::matchesAt(const Byte* data) const noexcept {
    for (size_t i = 0; i < m_bytes.size(); ++i) {
        if (m_mask[i] && data[i] != m_bytes[i]) {
            return false;
        }
    }
    return true;
}

std::string Pattern::toString() const {
    std::string out;
    out.reserve(m_bytes.size() * 3);

    char hex[3];
    for (size_t i = 0; i < m_bytes.size(); ++i) {
        if (i != 0) {
            out += ' ';
        }
        if (!m_mask[i]) {
            out += "??";
        } else {
            std::snprintf(hex, sizeof(hex), "%02X", m_bytes[i]);
            out += hex;
        }
    }
    return out;
}

} // namespace Memory
} // namespace Core
} // namespace Snare

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"

namespace nbt {
namespace mutf8 {

// =============================================================================
// Modified UTF-8 (Java DataOutput.writeUTF encoding)
// =============================================================================
//
// Differences from standard UTF-8:
// - U+0000 is written as the two-byte sequence C0 80
// - Code points above U+FFFF are written as a UTF-16 surrogate pair, each
//   half as its own three-byte sequence (six bytes total)
//
// Host text is UTF-8. Lone surrogates, which Java strings may contain, are
// carried in host text as their three-byte generalized UTF-8 form so that a
// decode/encode pair reproduces the original bytes.
//
// =============================================================================

namespace detail {

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline void append_three(std::vector<uint8_t>& out, uint32_t unit) {
    out.push_back(static_cast<uint8_t>(0xE0 | (unit >> 12)));
    out.push_back(static_cast<uint8_t>(0x80 | ((unit >> 6) & 0x3F)));
    out.push_back(static_cast<uint8_t>(0x80 | (unit & 0x3F)));
}

inline auto is_continuation(uint8_t b) -> bool {
    return (b & 0xC0) == 0x80;
}

[[noreturn]] inline void invalid(const char* what, std::size_t offset) {
    throw nbt_error(error_kind::invalid_encoding, what, offset);
}

// Decode one standard UTF-8 (or generalized, surrogate-bearing) code point.
inline auto next_utf8(std::string_view s, std::size_t& i) -> uint32_t {
    auto at = [&](std::size_t k) { return static_cast<uint8_t>(s[k]); };
    auto start = i;
    uint8_t b0 = at(i);

    if (b0 < 0x80) {
        i += 1;
        return b0;
    }
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        if (i + 1 >= s.size() || !is_continuation(at(i + 1))) invalid("truncated two-byte sequence", start);
        i += 2;
        return (uint32_t(b0 & 0x1F) << 6) | (at(start + 1) & 0x3F);
    }
    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (i + 2 >= s.size() || !is_continuation(at(i + 1)) || !is_continuation(at(i + 2))) {
            invalid("truncated three-byte sequence", start);
        }
        uint32_t cp = (uint32_t(b0 & 0x0F) << 12) | (uint32_t(at(i + 1) & 0x3F) << 6) | (at(i + 2) & 0x3F);
        if (cp < 0x800) invalid("overlong three-byte sequence", start);
        i += 3;
        return cp;
    }
    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (i + 3 >= s.size() || !is_continuation(at(i + 1)) ||
            !is_continuation(at(i + 2)) || !is_continuation(at(i + 3))) {
            invalid("truncated four-byte sequence", start);
        }
        uint32_t cp = (uint32_t(b0 & 0x07) << 18) | (uint32_t(at(i + 1) & 0x3F) << 12) |
                      (uint32_t(at(i + 2) & 0x3F) << 6) | (at(i + 3) & 0x3F);
        if (cp < 0x10000 || cp > 0x10FFFF) invalid("four-byte sequence out of range", start);
        i += 4;
        return cp;
    }
    invalid("invalid UTF-8 lead byte", start);
}

} // namespace detail

// -----------------------------------------------------------------------------
// encode: host UTF-8 text -> modified UTF-8 bytes (no length prefix)
// -----------------------------------------------------------------------------

inline auto encode(std::string_view text) -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = detail::next_utf8(text, i);

        if (cp == 0) {
            out.push_back(0xC0);
            out.push_back(0x80);
        } else if (cp < 0x80) {
            out.push_back(static_cast<uint8_t>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<uint8_t>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            detail::append_three(out, cp);
        } else {
            cp -= 0x10000;
            detail::append_three(out, 0xD800 + (cp >> 10));
            detail::append_three(out, 0xDC00 + (cp & 0x3FF));
        }
    }
    return out;
}

// -----------------------------------------------------------------------------
// decode: modified UTF-8 bytes -> host UTF-8 text
// -----------------------------------------------------------------------------

inline auto decode(std::span<const uint8_t> bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size());

    auto read_three = [&](std::size_t k) -> uint32_t {
        return (uint32_t(bytes[k] & 0x0F) << 12) | (uint32_t(bytes[k + 1] & 0x3F) << 6) | (bytes[k + 2] & 0x3F);
    };
    auto is_three = [&](std::size_t k) -> bool {
        return k + 2 < bytes.size() && (bytes[k] & 0xF0) == 0xE0 &&
               detail::is_continuation(bytes[k + 1]) && detail::is_continuation(bytes[k + 2]);
    };

    std::size_t i = 0;
    while (i < bytes.size()) {
        uint8_t b0 = bytes[i];

        if (b0 < 0x80) {
            // Raw zero bytes are tolerated on input, as Java's readUTF does
            out += static_cast<char>(b0);
            i += 1;
        } else if ((b0 & 0xE0) == 0xC0) {
            if (i + 1 >= bytes.size() || !detail::is_continuation(bytes[i + 1])) {
                detail::invalid("truncated two-byte sequence", i);
            }
            uint32_t cp = (uint32_t(b0 & 0x1F) << 6) | (bytes[i + 1] & 0x3F);
            if (cp != 0 && cp < 0x80) {
                detail::invalid("overlong two-byte sequence", i);
            }
            detail::append_utf8(out, cp);
            i += 2;
        } else if ((b0 & 0xF0) == 0xE0) {
            if (!is_three(i)) {
                detail::invalid("truncated three-byte sequence", i);
            }
            uint32_t cp = read_three(i);
            if (cp < 0x800) {
                detail::invalid("overlong three-byte sequence", i);
            }
            i += 3;
            if (cp >= 0xD800 && cp <= 0xDBFF && is_three(i)) {
                uint32_t low = read_three(i);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 3;
                }
            }
            detail::append_utf8(out, cp);
        } else {
            detail::invalid("invalid modified UTF-8 lead byte", i);
        }
    }
    return out;
}

} // namespace mutf8
} // namespace nbt

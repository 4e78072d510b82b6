#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace JsonRead {

namespace utf8 {

constexpr bool is_high_surrogate(std::uint32_t u) { return u >= 0xD800u && u <= 0xDBFFu; }
constexpr bool is_low_surrogate(std::uint32_t u)  { return u >= 0xDC00u && u <= 0xDFFFu; }

/// A code point outside the surrogate range and not above U+10FFFF
constexpr bool is_scalar_value(std::uint32_t cp) {
    return cp <= 0x10FFFFu && !(cp >= 0xD800u && cp <= 0xDFFFu);
}

/// Appends the UTF-8 encoding of a scalar value.
constexpr void encode(std::uint32_t codepoint, std::string & out) {
    if (codepoint <= 0x7Fu) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FFu) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFFu) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else { // up to 0x10FFFF
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

/// Appends a lone surrogate as a 3-byte sequence (ED A0 80 .. ED BF BF).
/// The result is not valid UTF-8; raw-mode decoding uses it to keep the
/// unit recoverable instead of rejecting the input.
constexpr void encode_surrogate(std::uint16_t n, std::string & out) {
    out.push_back(static_cast<char>(((n >> 12) & 0x0F) | 0xE0));
    out.push_back(static_cast<char>(((n >> 6) & 0x3F) | 0x80));
    out.push_back(static_cast<char>((n & 0x3F) | 0x80));
}

/// Index of the first byte of the first ill-formed sequence in `s`, or
/// npos if `s` is valid. Strict: rejects overlong forms, surrogates and
/// code points above U+10FFFF.
constexpr std::size_t first_invalid(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    auto cont = [&](std::size_t k) { return k < n && (byte(k) & 0xC0) == 0x80; };

    while (i < n) {
        unsigned char c = byte(i);
        if (c < 0x80) {
            ++i;
            continue;
        }
        if (c >= 0xC2 && c <= 0xDF) {
            if (!cont(i + 1)) return i;
            i += 2;
            continue;
        }
        if (c >= 0xE0 && c <= 0xEF) {
            if (!cont(i + 1) || !cont(i + 2)) return i;
            unsigned char c1 = byte(i + 1);
            if (c == 0xE0 && c1 < 0xA0) return i; // overlong
            if (c == 0xED && c1 > 0x9F) return i; // surrogate
            i += 3;
            continue;
        }
        if (c >= 0xF0 && c <= 0xF4) {
            if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return i;
            unsigned char c1 = byte(i + 1);
            if (c == 0xF0 && c1 < 0x90) return i; // overlong
            if (c == 0xF4 && c1 > 0x8F) return i; // > U+10FFFF
            i += 4;
            continue;
        }
        return i;
    }
    return std::string_view::npos;
}

constexpr bool validate(std::string_view s) {
    return first_invalid(s) == std::string_view::npos;
}

} // namespace utf8

} // namespace JsonRead

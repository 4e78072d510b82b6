#pragma once

#include <array>
#include <cstdint>

namespace JsonRead {

namespace tables {

/// ESCAPE[b] is true for bytes that end a run of plain string content:
/// control characters (0x00-0x1F), '"' and '\\'.
inline constexpr std::array<bool, 256> ESCAPE = [] {
    std::array<bool, 256> t{};
    for (int i = 0; i < 0x20; ++i) {
        t[i] = true;
    }
    t['"']  = true;
    t['\\'] = true;
    return t;
}();

inline constexpr std::uint8_t HEX_INVALID = 0xFF;

/// HEX[b] is the value of hex digit b (either case), or HEX_INVALID.
inline constexpr std::array<std::uint8_t, 256> HEX = [] {
    std::array<std::uint8_t, 256> t{};
    for (auto & v : t) {
        v = HEX_INVALID;
    }
    for (int i = 0; i < 10; ++i) {
        t['0' + i] = static_cast<std::uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        t['a' + i] = static_cast<std::uint8_t>(10 + i);
        t['A' + i] = static_cast<std::uint8_t>(10 + i);
    }
    return t;
}();

constexpr bool is_escape(char c) {
    return ESCAPE[static_cast<unsigned char>(c)];
}

/// Returns false if `c` is not a hex digit
constexpr bool decode_hex_val(char c, std::uint16_t & out) {
    std::uint8_t v = HEX[static_cast<unsigned char>(c)];
    if (v == HEX_INVALID) {
        return false;
    }
    out = v;
    return true;
}

} // namespace tables

} // namespace JsonRead

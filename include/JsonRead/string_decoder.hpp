#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "read_result.hpp"
#include "utf8.hpp"

namespace JsonRead {

// Escape decoding shared by all sources. Every function takes the source
// as a template parameter and only uses its public byte primitives, so the
// same code runs over stream, slice and string input.
namespace string_decoder {

template<class T, class R>
constexpr ReadResult<T> make_error(const R & read, ReadError code) {
    return ReadResult<T>(code, read.position(), read.byte_offset());
}

template<class R>
constexpr ReadResult<char> next_or_eof(R & read) {
    auto r = read.next();
    if (!r) {
        return ReadResult<char>(r);
    }
    if (!r->has_value()) {
        return make_error<char>(read, ReadError::EOF_WHILE_PARSING_STRING);
    }
    return ReadResult<char>(static_cast<char>(**r));
}

template<class R>
constexpr ReadResult<char> peek_or_eof(R & read) {
    auto r = read.peek();
    if (!r) {
        return ReadResult<char>(r);
    }
    if (!r->has_value()) {
        return make_error<char>(read, ReadError::EOF_WHILE_PARSING_STRING);
    }
    return ReadResult<char>(static_cast<char>(**r));
}

/// Validates decoded bytes as UTF-8
template<class R>
constexpr ReadResult<void> check_utf8(const R & read, std::string_view bytes) {
    if (!utf8::validate(bytes)) {
        return make_error<void>(read, ReadError::INVALID_UNICODE_CODE_POINT);
    }
    return {};
}

template<class R>
constexpr ReadResult<void> parse_escape(R & read, bool validate, std::string & scratch);

// Called after the "u" of a unicode escape. Handles surrogate pairs; in
// non-validating mode an unpaired surrogate is kept as its 3-byte encoding.
template<class R>
constexpr ReadResult<void> parse_unicode_escape(R & read, bool validate, std::string & scratch) {
    auto first = read.decode_hex_escape();
    if (!first) {
        return first;
    }
    const std::uint16_t n1 = *first;

    if (utf8::is_low_surrogate(n1)) {
        if (validate) {
            return make_error<void>(read, ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE);
        }
        utf8::encode_surrogate(n1, scratch);
        return {};
    }

    if (!utf8::is_high_surrogate(n1)) {
        utf8::encode(n1, scratch);
        return {};
    }

    // High surrogate: an escaped low surrogate must follow immediately
    auto c = peek_or_eof(read);
    if (!c) {
        return c;
    }
    if (*c == '\\') {
        read.discard();
    } else {
        if (validate) {
            read.discard();
            return make_error<void>(read, ReadError::UNEXPECTED_END_OF_HEX_ESCAPE);
        }
        utf8::encode_surrogate(n1, scratch);
        return {};
    }

    c = peek_or_eof(read);
    if (!c) {
        return c;
    }
    if (*c == 'u') {
        read.discard();
    } else {
        if (validate) {
            read.discard();
            return make_error<void>(read, ReadError::UNEXPECTED_END_OF_HEX_ESCAPE);
        }
        // The backslash is consumed; decode whatever escape it introduces
        utf8::encode_surrogate(n1, scratch);
        return parse_escape(read, validate, scratch);
    }

    auto second = read.decode_hex_escape();
    if (!second) {
        return second;
    }
    const std::uint16_t n2 = *second;
    if (!utf8::is_low_surrogate(n2)) {
        return make_error<void>(read, ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE);
    }

    const std::uint32_t codepoint =
        ((static_cast<std::uint32_t>(n1 - 0xD800u) << 10)
         | static_cast<std::uint32_t>(n2 - 0xDC00u))
        + 0x10000u;
    if (!utf8::is_scalar_value(codepoint)) {
        return make_error<void>(read, ReadError::INVALID_UNICODE_CODE_POINT);
    }
    utf8::encode(codepoint, scratch);
    return {};
}

/// Parses one escape sequence and appends its bytes to `scratch`.
/// Assumes the backslash was already consumed.
template<class R>
__attribute__((noinline))
constexpr ReadResult<void> parse_escape(R & read, bool validate, std::string & scratch) {
    auto esc = next_or_eof(read);
    if (!esc) {
        return esc;
    }
    switch (*esc) {
    case '"':  scratch.push_back('"');  break;
    case '\\': scratch.push_back('\\'); break;
    case '/':  scratch.push_back('/');  break;
    case 'b':  scratch.push_back('\b'); break;
    case 'f':  scratch.push_back('\f'); break;
    case 'n':  scratch.push_back('\n'); break;
    case 'r':  scratch.push_back('\r'); break;
    case 't':  scratch.push_back('\t'); break;
    case 'u':
        return parse_unicode_escape(read, validate, scratch);
    default:
        return make_error<void>(read, ReadError::INVALID_ESCAPE);
    }
    return {};
}

/// Validates one escape sequence and discards it.
/// Assumes the backslash was already consumed.
template<class R>
constexpr ReadResult<void> ignore_escape(R & read) {
    auto esc = next_or_eof(read);
    if (!esc) {
        return esc;
    }
    switch (*esc) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
        return {};
    case 'u': {
        auto hex = read.decode_hex_escape();
        if (!hex) {
            return hex;
        }
        return {};
    }
    default:
        return make_error<void>(read, ReadError::INVALID_ESCAPE);
    }
}

} // namespace string_decoder

} // namespace JsonRead

#include "../test_helpers.hpp"
#include <JsonRead/escape_tables.hpp>
#include <JsonRead/utf8.hpp>

using namespace JsonRead;

// ============================================================================
// ESCAPE table
// ============================================================================

static_assert([] {
    for (int b = 0; b < 0x20; ++b) {
        if (!tables::ESCAPE[b]) return false;
    }
    return true;
}(), "ESCAPE: every control byte ends a plain run");

static_assert(tables::ESCAPE['"'] && tables::ESCAPE['\\'], "ESCAPE: quote and backslash");

static_assert([] {
    int count = 0;
    for (int b = 0; b < 256; ++b) {
        if (tables::ESCAPE[b]) ++count;
    }
    return count == 34;
}(), "ESCAPE: exactly 34 entries are set");

static_assert(!tables::ESCAPE[0x20] && !tables::ESCAPE['/'] && !tables::ESCAPE[0x7F]
              && !tables::ESCAPE[0x80] && !tables::ESCAPE[0xFF],
              "ESCAPE: space, slash, DEL and high bytes are plain");

static_assert(tables::is_escape('\n') && !tables::is_escape('a')
              && !tables::is_escape(static_cast<char>(0xC3)),
              "is_escape: signed char bytes are looked up as unsigned");

// ============================================================================
// HEX table
// ============================================================================

static_assert(tables::HEX['0'] == 0 && tables::HEX['9'] == 9, "HEX: digits");
static_assert(tables::HEX['a'] == 10 && tables::HEX['f'] == 15, "HEX: lower case");
static_assert(tables::HEX['A'] == 10 && tables::HEX['F'] == 15, "HEX: upper case");
static_assert(tables::HEX['g'] == tables::HEX_INVALID
              && tables::HEX['G'] == tables::HEX_INVALID
              && tables::HEX[' '] == tables::HEX_INVALID
              && tables::HEX[0] == tables::HEX_INVALID,
              "HEX: everything else is invalid");

static_assert([] {
    int valid = 0;
    for (int b = 0; b < 256; ++b) {
        if (tables::HEX[b] != tables::HEX_INVALID) ++valid;
    }
    return valid == 22;
}(), "HEX: 22 valid digits");

static_assert([] {
    std::uint16_t v = 0;
    return tables::decode_hex_val('c', v) && v == 12
        && !tables::decode_hex_val('x', v) && v == 12;
}(), "decode_hex_val: leaves output untouched on failure");

// ============================================================================
// UTF-8 helpers
// ============================================================================

static_assert([] {
    std::string out;
    utf8::encode(0x41, out);
    utf8::encode(0xE9, out);
    utf8::encode(0x20AC, out);
    utf8::encode(0x1F600, out);
    return out == "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
}(), "encode: one to four byte forms");

static_assert([] {
    std::string out;
    utf8::encode_surrogate(0xD800, out);
    utf8::encode_surrogate(0xDFFF, out);
    return TestHelpers::BytesEqual(out, {0xED, 0xA0, 0x80, 0xED, 0xBF, 0xBF});
}(), "encode_surrogate: 3-byte form of a lone surrogate");

static_assert(utf8::validate("") && utf8::validate("plain") && utf8::validate("\xC3\xA9\xF0\x9F\x98\x80"),
              "validate: accepts well-formed text");
static_assert(!utf8::validate("\xC0\x80"), "validate: rejects overlong NUL");
static_assert(!utf8::validate("\xE0\x80\x80"), "validate: rejects overlong 3-byte form");
static_assert(!utf8::validate("\xED\xA0\x80"), "validate: rejects encoded surrogates");
static_assert(!utf8::validate("\xF4\x90\x80\x80"), "validate: rejects code points above U+10FFFF");
static_assert(!utf8::validate("\xC3"), "validate: rejects truncated sequences");
static_assert(!utf8::validate("\x80"), "validate: rejects stray continuation bytes");
static_assert(!utf8::validate("\xFF"), "validate: rejects invalid lead bytes");

static_assert(utf8::is_high_surrogate(0xD800) && utf8::is_high_surrogate(0xDBFF)
              && !utf8::is_high_surrogate(0xDC00), "is_high_surrogate");
static_assert(utf8::is_low_surrogate(0xDC00) && utf8::is_low_surrogate(0xDFFF)
              && !utf8::is_low_surrogate(0xE000), "is_low_surrogate");
static_assert(utf8::is_scalar_value(0x10FFFF) && !utf8::is_scalar_value(0x110000)
              && !utf8::is_scalar_value(0xD800), "is_scalar_value");

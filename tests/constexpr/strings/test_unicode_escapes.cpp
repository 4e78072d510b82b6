#include "../test_helpers.hpp"

using namespace JsonRead;
using namespace TestHelpers;

// ============================================================================
// Unicode escapes outside the surrogate range
// ============================================================================

static_assert(DecodesEverywhere(R"(\u0041")", "A"), "ASCII");
static_assert(DecodesEverywhere(R"(\u00e9")", "\xC3\xA9"), "2-byte result");
static_assert(DecodesEverywhere(R"(\u20AC")", "\xE2\x82\xAC"), "3-byte result");
static_assert(DecodesEverywhere(R"(\uFFFF")", "\xEF\xBF\xBF"), "highest BMP unit");
static_assert(DecodesEverywhere(R"(\u0000")", std::string_view("\0", 1)), "NUL");
static_assert(DecodesEverywhere(R"(\u001f")", "\x1F"), "escaped control character is allowed");
static_assert(DecodesEverywhere(R"(\uabcd")", "\xEA\xAF\x8D") && DecodesEverywhere(R"(\uABCD")", "\xEA\xAF\x8D"),
              "hex digits in either case");
static_assert(DecodesEverywhere(R"(x\u0041y\u0042z")", "xAyBz"), "escapes between plain runs");

// ============================================================================
// Surrogate pairs
// ============================================================================

static_assert(DecodesEverywhere(R"(\uD83D\uDE00")", "\xF0\x9F\x98\x80"), "pair: U+1F600");
static_assert(DecodesEverywhere(R"(\ud834\udd1e")", "\xF0\x9D\x84\x9E"), "pair: U+1D11E, lower case");
static_assert(DecodesEverywhere(R"(\uD800\uDC00")", "\xF0\x90\x80\x80"), "pair: U+10000");
static_assert(DecodesEverywhere(R"(\uDBFF\uDFFF")", "\xF4\x8F\xBF\xBF"), "pair: U+10FFFF");

// ============================================================================
// Unpaired surrogates, validating mode
// ============================================================================

static_assert(FailsEverywhereWith(R"(\uDC00")", ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE),
              "lone low surrogate");
static_assert(FailsEverywhereWith(R"(\uD800")", ReadError::UNEXPECTED_END_OF_HEX_ESCAPE),
              "high surrogate followed by the closing quote");
static_assert(FailsEverywhereWith(R"(\uD800x")", ReadError::UNEXPECTED_END_OF_HEX_ESCAPE),
              "high surrogate followed by a plain byte");
static_assert(FailsEverywhereWith(R"(\uD800\n")", ReadError::UNEXPECTED_END_OF_HEX_ESCAPE),
              "high surrogate followed by another escape");
static_assert(FailsEverywhereWith(R"(\uD800\u0041")", ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE),
              "high surrogate followed by a non-surrogate unit");
static_assert(FailsEverywhereWith(R"(\uD800\uD800")", ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE),
              "two high surrogates");
static_assert(FailsEverywhereWith(R"(\uD800)", ReadError::EOF_WHILE_PARSING_STRING),
              "input ends after a high surrogate");
static_assert(FailsEverywhereWith(R"(\uD800\)", ReadError::EOF_WHILE_PARSING_STRING),
              "input ends inside the second escape");

template<Kind K>
constexpr bool SurrogateErrorPosition() {
    // The byte that breaks the pair is consumed before the error is reported
    return DecodeFailsAt<K>(R"(\uD800x")", ReadError::UNEXPECTED_END_OF_HEX_ESCAPE, 1, 7, 7);
}
static_assert(SurrogateErrorPosition<Kind::Stream>(), "stream: surrogate error position");
static_assert(SurrogateErrorPosition<Kind::Slice>(), "slice: surrogate error position");

// ============================================================================
// Unpaired surrogates, raw mode keeps the 3-byte encoding
// ============================================================================

template<Kind K>
constexpr bool RawBytes(std::string_view body, std::initializer_list<unsigned char> expected) {
    return WithSource<K>(body, [&](auto& src) {
        std::string scratch;
        auto r = src.parse_str_raw(scratch);
        return r && BytesEqual(r->get(), expected);
    });
}

template<Kind K>
constexpr bool LoneSurrogatesInRawMode() {
    return RawBytes<K>(R"(\uD800")", {0xED, 0xA0, 0x80})
        && RawBytes<K>(R"(\uDC00")", {0xED, 0xB0, 0x80})
        && RawBytes<K>(R"(\uD800x")", {0xED, 0xA0, 0x80, 'x'})
        && RawBytes<K>(R"(\uD800\n")", {0xED, 0xA0, 0x80, '\n'})
        && RawBytes<K>(R"(\uD800\"")", {0xED, 0xA0, 0x80, '"'})
        && RawBytes<K>(R"(a\uDFFFb")", {'a', 0xED, 0xBF, 0xBF, 'b'})
        && RawBytes<K>(R"(\uD83D\uDE00")", {0xF0, 0x9F, 0x98, 0x80});
}
static_assert(LoneSurrogatesInRawMode<Kind::Stream>(), "stream: lone surrogates in raw mode");
static_assert(LoneSurrogatesInRawMode<Kind::Slice>(), "slice: lone surrogates in raw mode");
static_assert(LoneSurrogatesInRawMode<Kind::String>(), "string: lone surrogates in raw mode");

static_assert(RawFailsEverywhereWith(R"(\uD800\u0041")", ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE),
              "raw mode: a started pair must still be completed");
static_assert(RawFailsEverywhereWith(R"(\uD800\q")", ReadError::INVALID_ESCAPE),
              "raw mode: the escape after a lone surrogate is still checked");

// ============================================================================
// decode_hex_escape
// ============================================================================

template<Kind K>
constexpr bool HexValue(std::string_view digits, std::uint16_t expected) {
    return WithSource<K>(digits, [&](auto& src) {
        auto r = src.decode_hex_escape();
        return r && *r == expected && src.byte_offset() == 4;
    });
}

template<Kind K>
constexpr bool HexDecoding() {
    return HexValue<K>("0000", 0x0000)
        && HexValue<K>("ffff", 0xFFFF)
        && HexValue<K>("FfFf", 0xFFFF)
        && HexValue<K>("1a2B", 0x1A2B)
        && HexValue<K>("0041rest", 0x0041);
}
static_assert(HexDecoding<Kind::Stream>(), "stream: decode_hex_escape");
static_assert(HexDecoding<Kind::Slice>(), "slice: decode_hex_escape");
static_assert(HexDecoding<Kind::String>(), "string: decode_hex_escape");

template<Kind K>
constexpr bool HexFails(std::string_view digits, ReadError expected, std::size_t offset) {
    return WithSource<K>(digits, [&](auto& src) {
        auto r = src.decode_hex_escape();
        return !r && r.error() == expected && src.byte_offset() == offset;
    });
}

static_assert(HexFails<Kind::Stream>("12G4", ReadError::INVALID_ESCAPE, 3), "stream: non-hex digit is consumed");
static_assert(HexFails<Kind::Slice>("12G4", ReadError::INVALID_ESCAPE, 3), "slice: non-hex digit is consumed");
static_assert(HexFails<Kind::Stream>("12", ReadError::EOF_WHILE_PARSING_STRING, 2), "stream: too few digits");
static_assert(HexFails<Kind::Slice>("12", ReadError::EOF_WHILE_PARSING_STRING, 2), "slice: too few digits");
static_assert(HexFails<Kind::Slice>("", ReadError::EOF_WHILE_PARSING_STRING, 0), "slice: no digits");

// With a closing quote inside the 4-byte window the two sources differ:
// the slice checks the remaining length first, the stream reads the quote.
static_assert(DecodeFailsWith<Kind::Slice>(R"(\u12")", ReadError::EOF_WHILE_PARSING_STRING),
              "slice: short \\u escape at end of input");
static_assert(DecodeFailsWith<Kind::Stream>(R"(\u12")", ReadError::INVALID_ESCAPE),
              "stream: short \\u escape reads the quote as a digit");
static_assert(FailsEverywhereWith(R"(\u12G4")", ReadError::INVALID_ESCAPE), "non-hex digit in \\u escape");
static_assert(DecodeFailsWith<Kind::Stream>(R"(\u")", ReadError::INVALID_ESCAPE)
              && DecodeFailsWith<Kind::Slice>(R"(\u")", ReadError::EOF_WHILE_PARSING_STRING),
              "\\u with no digits");

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "position.hpp"
#include "read_result.hpp"
#include "slice_source.hpp"
#include "utf8.hpp"

namespace JsonRead {

/// Tag for constructing a StringSource over text the caller vouches for.
struct trusted_utf8_t {
    explicit trusted_utf8_t() = default;
};
inline constexpr trusted_utf8_t trusted_utf8{};

/// Source over text that is known to be valid UTF-8.
/// Behaves like SliceSource but never re-validates decoded strings or
/// captured raw text. Build it with make_string_source, which checks the
/// text once, or with the trusted_utf8 constructor when the caller already
/// holds that guarantee.
template<bool RawCapture = RawCaptureByDefault>
class StringSource {
public:
    static constexpr bool should_early_return_if_failed = false;
    static constexpr bool is_fused = true;
    static constexpr bool raw_capture_enabled = RawCapture;

    // Empty input
    constexpr StringSource()
        : delegate_(std::string_view{}) {}

    constexpr StringSource(trusted_utf8_t, std::string_view text)
        : delegate_(text) {}

    constexpr ByteResult next() { return delegate_.next(); }
    constexpr ByteResult peek() { return delegate_.peek(); }
    constexpr void discard() { delegate_.discard(); }

    constexpr Position position() const { return delegate_.position(); }
    constexpr Position peek_position() const { return delegate_.peek_position(); }
    constexpr std::size_t byte_offset() const { return delegate_.byte_offset(); }

    // Borrowed runs come from valid text, and escapes only emit scalar
    // values in validating mode, so the result needs no further check.
    constexpr ReadResult<StrRef> parse_str(std::string & scratch) {
        return delegate_.template parse_str_bytes<true>(scratch);
    }

    constexpr ReadResult<BytesRef> parse_str_raw(std::string & scratch) {
        return delegate_.template parse_str_bytes<false>(scratch);
    }

    constexpr ReadResult<void> ignore_str() { return delegate_.ignore_str(); }
    constexpr ReadResult<std::uint16_t> decode_hex_escape() { return delegate_.decode_hex_escape(); }

    constexpr void begin_raw_buffering() requires RawCapture {
        delegate_.begin_raw_buffering();
    }

    template<raw_capture::RawConsumer Consumer>
    constexpr ReadResult<raw_capture::consumer_result_t<Consumer>>
    end_raw_buffering(Consumer && consumer) requires RawCapture {
        using R = raw_capture::consumer_result_t<Consumer>;
        std::string_view raw = delegate_.data_.substr(delegate_.raw_.start,
                                                      delegate_.index_ - delegate_.raw_.start);
        return ReadResult<R>(std::forward<Consumer>(consumer)(StrRef::borrowed(raw)));
    }

    constexpr void set_failed(bool & failed) { delegate_.set_failed(failed); }

    constexpr std::string_view text() const { return delegate_.data(); }

private:
    SliceSource<RawCapture> delegate_;
};

StringSource(trusted_utf8_t, std::string_view) -> StringSource<>;

/// Validates `text` as UTF-8 and wraps it in a StringSource. Invalid text
/// fails with INVALID_UNICODE_CODE_POINT, reported at the first byte of the
/// ill-formed sequence as if that byte had just been consumed.
template<bool RawCapture = RawCaptureByDefault>
constexpr ReadResult<StringSource<RawCapture>> make_string_source(std::string_view text) {
    const std::size_t bad = utf8::first_invalid(text);
    if (bad != std::string_view::npos) {
        return ReadResult<StringSource<RawCapture>>(ReadError::INVALID_UNICODE_CODE_POINT,
                                                    position_of_index(text, bad + 1), bad + 1);
    }
    return ReadResult<StringSource<RawCapture>>(StringSource<RawCapture>(trusted_utf8, text));
}

namespace source {
template<bool RawCapture>
struct source_traits<StringSource<RawCapture>> {
    static constexpr bool is_builtin = true;
};
}

static_assert(SourceLike<StringSource<true>>);
static_assert(SourceLike<StringSource<false>>);
static_assert(RawCapturingSource<StringSource<true>>);
static_assert(!RawCapturingSource<StringSource<false>>);

} // namespace JsonRead

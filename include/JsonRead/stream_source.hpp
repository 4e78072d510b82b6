#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "config.hpp"
#include "escape_tables.hpp"
#include "io.hpp"
#include "raw_capture.hpp"
#include "source_concept.hpp"
#include "string_decoder.hpp"

namespace JsonRead {

/// Source over a pull-based byte channel. Holds at most one byte of
/// look-ahead; decoded strings are always copied into the scratch buffer.
template<ByteChannelLike Channel, bool RawCapture = RawCaptureByDefault>
class StreamSource {
public:
    static constexpr bool should_early_return_if_failed = true;
    static constexpr bool is_fused = false;
    static constexpr bool raw_capture_enabled = RawCapture;

    constexpr explicit StreamSource(Channel channel)
        : m_iter(std::move(channel)) {}

    constexpr ByteResult next() {
        if (m_ch) {
            char c = *m_ch;
            m_ch.reset();
            mirror(c);
            return ByteResult{static_cast<std::uint8_t>(c)};
        }
        char c = 0;
        switch (m_iter.next(c)) {
        case ChannelStatus::ok:
            mirror(c);
            return ByteResult{static_cast<std::uint8_t>(c)};
        case ChannelStatus::eof:
            return ByteResult{std::nullopt};
        case ChannelStatus::error:
            break;
        }
        return string_decoder::make_error<std::optional<std::uint8_t>>(*this, ReadError::IO_ERROR);
    }

    constexpr ByteResult peek() {
        if (m_ch) {
            return ByteResult{static_cast<std::uint8_t>(*m_ch)};
        }
        char c = 0;
        switch (m_iter.next(c)) {
        case ChannelStatus::ok:
            m_ch = c;
            return ByteResult{static_cast<std::uint8_t>(c)};
        case ChannelStatus::eof:
            return ByteResult{std::nullopt};
        case ChannelStatus::error:
            break;
        }
        return string_decoder::make_error<std::optional<std::uint8_t>>(*this, ReadError::IO_ERROR);
    }

    constexpr void discard() {
        if (m_ch) {
            mirror(*m_ch);
            m_ch.reset();
        }
    }

    // The cursor already counts a peeked byte, so both positions coincide
    constexpr Position position() const {
        return Position{m_iter.line(), m_iter.col()};
    }

    constexpr Position peek_position() const {
        return position();
    }

    constexpr std::size_t byte_offset() const {
        if (m_ch) {
            return m_iter.byte_offset() - 1;
        }
        return m_iter.byte_offset();
    }

    constexpr ReadResult<StrRef> parse_str(std::string & scratch) {
        auto r = parse_str_bytes<true>(scratch);
        if (!r) {
            return ReadResult<StrRef>(r);
        }
        auto valid = string_decoder::check_utf8(*this, scratch);
        if (!valid) {
            return ReadResult<StrRef>(valid);
        }
        return ReadResult<StrRef>(StrRef::copied(std::string_view(scratch)));
    }

    constexpr ReadResult<BytesRef> parse_str_raw(std::string & scratch) {
        auto r = parse_str_bytes<false>(scratch);
        if (!r) {
            return ReadResult<BytesRef>(r);
        }
        return ReadResult<BytesRef>(BytesRef::copied(std::string_view(scratch)));
    }

    constexpr ReadResult<void> ignore_str() {
        while (true) {
            auto ch = string_decoder::next_or_eof(*this);
            if (!ch) {
                return ch;
            }
            if (!tables::is_escape(*ch)) {
                continue;
            }
            switch (*ch) {
            case '"':
                return {};
            case '\\': {
                auto r = string_decoder::ignore_escape(*this);
                if (!r) {
                    return r;
                }
                break;
            }
            default:
                return string_decoder::make_error<void>(*this, ReadError::CONTROL_CHARACTER_WHILE_PARSING_STRING);
            }
        }
    }

    constexpr ReadResult<std::uint16_t> decode_hex_escape() {
        std::uint16_t n = 0;
        for (int i = 0; i < 4; ++i) {
            auto c = string_decoder::next_or_eof(*this);
            if (!c) {
                return ReadResult<std::uint16_t>(c);
            }
            std::uint16_t v = 0;
            if (!tables::decode_hex_val(*c, v)) {
                return string_decoder::make_error<std::uint16_t>(*this, ReadError::INVALID_ESCAPE);
            }
            n = static_cast<std::uint16_t>((n << 4) + v);
        }
        return ReadResult<std::uint16_t>(n);
    }

    constexpr void begin_raw_buffering() requires RawCapture {
        m_raw.begin();
    }

    /// Hands every byte consumed since begin_raw_buffering to `consumer`.
    /// The view points into a temporary buffer and dies with the call.
    template<raw_capture::RawConsumer Consumer>
    constexpr ReadResult<raw_capture::consumer_result_t<Consumer>>
    end_raw_buffering(Consumer && consumer) requires RawCapture {
        using R = raw_capture::consumer_result_t<Consumer>;
        std::string raw = m_raw.take();
        if (!utf8::validate(raw)) {
            return string_decoder::make_error<R>(*this, ReadError::INVALID_UNICODE_CODE_POINT);
        }
        return ReadResult<R>(std::forward<Consumer>(consumer)(StrRef::copied(std::string_view(raw))));
    }

    constexpr void set_failed(bool & failed) {
        failed = true;
    }

    constexpr const Channel & channel() const {
        return m_iter.channel();
    }

private:
    constexpr void mirror(char c) {
        if constexpr (RawCapture) {
            m_raw.mirror(c);
        }
    }

    // Assumes the opening quote was consumed; appends the decoded contents
    // to scratch and stops after the closing quote.
    template<bool Validate>
    constexpr ReadResult<void> parse_str_bytes(std::string & scratch) {
        scratch.clear();
        while (true) {
            auto ch = string_decoder::next_or_eof(*this);
            if (!ch) {
                return ch;
            }
            if (!tables::is_escape(*ch)) {
                scratch.push_back(*ch);
                continue;
            }
            switch (*ch) {
            case '"':
                return {};
            case '\\': {
                auto r = string_decoder::parse_escape(*this, Validate, scratch);
                if (!r) {
                    return r;
                }
                break;
            }
            default:
                if constexpr (Validate) {
                    return string_decoder::make_error<void>(*this, ReadError::CONTROL_CHARACTER_WHILE_PARSING_STRING);
                }
                scratch.push_back(*ch);
                break;
            }
        }
    }

    LineColCursor<Channel> m_iter;
    std::optional<char> m_ch;
    [[no_unique_address]] raw_capture::storage_t<RawCapture, raw_capture::MirrorBuffer> m_raw{};
};

/// Stream source over an iterator range; runs in constant evaluation.
template<bool RawCapture = RawCaptureByDefault, CharInputIterator It, CharSentinelFor<It> Sent>
constexpr auto make_stream_source(It first, Sent last) {
    return StreamSource<IteratorChannel<It, Sent>, RawCapture>(
        IteratorChannel<It, Sent>(std::move(first), std::move(last)));
}

namespace source {
template<class Channel, bool RawCapture>
struct source_traits<StreamSource<Channel, RawCapture>> {
    static constexpr bool is_builtin = true;
};
}

static_assert(SourceLike<StreamSource<IteratorChannel<const char*, const char*>, true>>);
static_assert(SourceLike<StreamSource<IteratorChannel<const char*, const char*>, false>>);
static_assert(RawCapturingSource<StreamSource<IteratorChannel<const char*, const char*>, true>>);
static_assert(!RawCapturingSource<StreamSource<IteratorChannel<const char*, const char*>, false>>);

} // namespace JsonRead

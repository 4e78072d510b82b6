#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "config.hpp"
#include "escape_tables.hpp"
#include "raw_capture.hpp"
#include "source_concept.hpp"
#include "string_decoder.hpp"

namespace JsonRead {

template<bool RawCapture>
class StringSource;

/// Source over a borrowed, contiguous byte buffer. The buffer must outlive
/// the source and every Reference it returns.
///
/// Strings without escapes are returned as views into the buffer itself;
/// positions are recomputed on demand by rescanning from the start.
template<bool RawCapture = RawCaptureByDefault>
class SliceSource {
public:
    static constexpr bool should_early_return_if_failed = false;
    static constexpr bool is_fused = true;
    static constexpr bool raw_capture_enabled = RawCapture;

    constexpr explicit SliceSource(std::string_view data)
        : data_(data) {}

    constexpr SliceSource(const char * data, std::size_t size)
        : data_(data, size) {}

    explicit SliceSource(std::span<const std::uint8_t> bytes)
        : data_(reinterpret_cast<const char*>(bytes.data()), bytes.size()) {}

    constexpr ByteResult next() {
        if (index_ < data_.size()) {
            char c = data_[index_];
            ++index_;
            return ByteResult{static_cast<std::uint8_t>(c)};
        }
        return ByteResult{std::nullopt};
    }

    constexpr ByteResult peek() {
        if (index_ < data_.size()) {
            return ByteResult{static_cast<std::uint8_t>(data_[index_])};
        }
        return ByteResult{std::nullopt};
    }

    // Same as next(): at end of input there is nothing to consume
    constexpr void discard() {
        if (index_ < data_.size()) {
            ++index_;
        }
    }

    constexpr Position position() const {
        return position_of_index(data_, index_);
    }

    constexpr Position peek_position() const {
        // Clamp so that a peek at end of input does not point past the buffer
        return position_of_index(data_, std::min(data_.size(), index_ + 1));
    }

    constexpr std::size_t byte_offset() const {
        return index_;
    }

    constexpr ReadResult<StrRef> parse_str(std::string & scratch) {
        auto r = parse_str_bytes<true>(scratch);
        if (!r) {
            return r;
        }
        auto valid = string_decoder::check_utf8(*this, r->get());
        if (!valid) {
            return ReadResult<StrRef>(valid);
        }
        return r;
    }

    constexpr ReadResult<BytesRef> parse_str_raw(std::string & scratch) {
        return parse_str_bytes<false>(scratch);
    }

    __attribute__((noinline)) constexpr ReadResult<void> ignore_str() {
        while (true) {
            while (index_ < data_.size() && !tables::is_escape(data_[index_])) {
                ++index_;
            }
            if (index_ >= data_.size()) {
                return string_decoder::make_error<void>(*this, ReadError::EOF_WHILE_PARSING_STRING);
            }
            switch (data_[index_]) {
            case '"':
                ++index_;
                return {};
            case '\\': {
                ++index_;
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
        if (index_ + 4 > data_.size()) {
            index_ = data_.size();
            return string_decoder::make_error<std::uint16_t>(*this, ReadError::EOF_WHILE_PARSING_STRING);
        }
        std::uint16_t n = 0;
        for (int i = 0; i < 4; ++i) {
            std::uint16_t v = 0;
            bool ok = tables::decode_hex_val(data_[index_], v);
            ++index_;
            if (!ok) {
                return string_decoder::make_error<std::uint16_t>(*this, ReadError::INVALID_ESCAPE);
            }
            n = static_cast<std::uint16_t>((n << 4) + v);
        }
        return ReadResult<std::uint16_t>(n);
    }

    constexpr void begin_raw_buffering() requires RawCapture {
        raw_.start = index_;
    }

    /// Hands the bytes consumed since begin_raw_buffering to `consumer`,
    /// as a view borrowed from the input buffer.
    template<raw_capture::RawConsumer Consumer>
    constexpr ReadResult<raw_capture::consumer_result_t<Consumer>>
    end_raw_buffering(Consumer && consumer) requires RawCapture {
        using R = raw_capture::consumer_result_t<Consumer>;
        std::string_view raw = data_.substr(raw_.start, index_ - raw_.start);
        if (!utf8::validate(raw)) {
            return string_decoder::make_error<R>(*this, ReadError::INVALID_UNICODE_CODE_POINT);
        }
        return ReadResult<R>(std::forward<Consumer>(consumer)(StrRef::borrowed(raw)));
    }

    /// Makes the source look exhausted: the remaining input is dropped.
    constexpr void set_failed(bool &) {
        data_ = data_.substr(0, index_);
    }

    constexpr std::string_view data() const {
        return data_;
    }

private:
    template<bool> friend class StringSource;

    // Assumes the opening quote was consumed. Plain runs are scanned in place;
    // the scratch buffer is only touched once an escape forces a copy.
    template<bool Validate>
    constexpr ReadResult<BytesRef> parse_str_bytes(std::string & scratch) {
        scratch.clear();
        std::size_t start = index_;
        while (true) {
            while (index_ < data_.size() && !tables::is_escape(data_[index_])) {
                ++index_;
            }
            if (index_ >= data_.size()) {
                return string_decoder::make_error<BytesRef>(*this, ReadError::EOF_WHILE_PARSING_STRING);
            }
            switch (data_[index_]) {
            case '"': {
                if (scratch.empty()) {
                    std::string_view borrowed = data_.substr(start, index_ - start);
                    ++index_;
                    return ReadResult<BytesRef>(BytesRef::borrowed(borrowed));
                }
                scratch.append(data_.data() + start, index_ - start);
                ++index_;
                return ReadResult<BytesRef>(BytesRef::copied(std::string_view(scratch)));
            }
            case '\\': {
                scratch.append(data_.data() + start, index_ - start);
                ++index_;
                auto r = string_decoder::parse_escape(*this, Validate, scratch);
                if (!r) {
                    return ReadResult<BytesRef>(r);
                }
                start = index_;
                break;
            }
            default:
                // Control character: stays in the pending run unless rejected
                ++index_;
                if constexpr (Validate) {
                    return string_decoder::make_error<BytesRef>(*this, ReadError::CONTROL_CHARACTER_WHILE_PARSING_STRING);
                }
                break;
            }
        }
    }

    std::string_view data_;
    // Index of the next byte returned by next() or peek()
    std::size_t index_ = 0;
    [[no_unique_address]] raw_capture::storage_t<RawCapture, raw_capture::StartIndex> raw_{};
};

SliceSource(std::string_view) -> SliceSource<>;
SliceSource(const char *, std::size_t) -> SliceSource<>;
SliceSource(std::span<const std::uint8_t>) -> SliceSource<>;

namespace source {
template<bool RawCapture>
struct source_traits<SliceSource<RawCapture>> {
    static constexpr bool is_builtin = true;
};
}

static_assert(SourceLike<SliceSource<true>>);
static_assert(SourceLike<SliceSource<false>>);
static_assert(RawCapturingSource<SliceSource<true>>);
static_assert(!RawCapturingSource<SliceSource<false>>);

} // namespace JsonRead

#pragma once

#include <concepts>
#include <iterator>
#include <utility>

namespace JsonRead {

// 1) Iterator you can:
//    - read as *it   (convertible to char)
//    - advance as it++ / ++it
template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
// Written as `CharSentinelFor<It> Sent` in template heads.
template <class Sent, class It>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;


// ============================================================================
// Byte channels: pull one byte at a time, blocking however the channel does
// ============================================================================

enum class ChannelStatus {
    ok,     // byte written to `out`
    eof,    // no more input
    error   // the underlying device failed
};

template<class C>
concept ByteChannelLike = requires(C & channel, char & out) {
    { channel.read_byte(out) } -> std::same_as<ChannelStatus>;
};

/// Channel over any single-pass character iterator range.
/// Each byte is dereferenced exactly once and the iterator is advanced
/// right after, so istreambuf_iterator-like inputs are safe.
template<CharInputIterator It, CharSentinelFor<It> Sent>
class IteratorChannel {
public:
    constexpr IteratorChannel(It first, Sent last)
        : current_(std::move(first)), end_(std::move(last)) {}

    constexpr ChannelStatus read_byte(char & out) {
        if (current_ == end_) {
            return ChannelStatus::eof;
        }
        out = static_cast<char>(*current_);
        ++current_;
        return ChannelStatus::ok;
    }

    constexpr const It & current() const { return current_; }

private:
    It   current_;
    Sent end_;
};

static_assert(ByteChannelLike<IteratorChannel<const char*, const char*>>);

} // namespace JsonRead

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "source_concept.hpp"
#include "raw_capture.hpp"

namespace JsonRead {

/// Non-owning handle that forwards every operation to another source, so a
/// source can be lent to a callee and reused afterwards.
template<SourceLike S>
class SourceRef {
public:
    static constexpr bool should_early_return_if_failed = S::should_early_return_if_failed;
    static constexpr bool is_fused = S::is_fused;

    constexpr explicit SourceRef(S & source) : m_source(&source) {}

    constexpr ByteResult next() { return m_source->next(); }
    constexpr ByteResult peek() { return m_source->peek(); }
    constexpr void discard() { m_source->discard(); }

    constexpr Position position() const { return m_source->position(); }
    constexpr Position peek_position() const { return m_source->peek_position(); }
    constexpr std::size_t byte_offset() const { return m_source->byte_offset(); }

    constexpr ReadResult<StrRef> parse_str(std::string & scratch) { return m_source->parse_str(scratch); }
    constexpr ReadResult<BytesRef> parse_str_raw(std::string & scratch) { return m_source->parse_str_raw(scratch); }
    constexpr ReadResult<void> ignore_str() { return m_source->ignore_str(); }
    constexpr ReadResult<std::uint16_t> decode_hex_escape() { return m_source->decode_hex_escape(); }

    constexpr void begin_raw_buffering() requires RawCapturingSource<S> {
        m_source->begin_raw_buffering();
    }

    template<raw_capture::RawConsumer Consumer>
    constexpr ReadResult<raw_capture::consumer_result_t<Consumer>>
    end_raw_buffering(Consumer && consumer) requires RawCapturingSource<S> {
        return m_source->end_raw_buffering(std::forward<Consumer>(consumer));
    }

    constexpr void set_failed(bool & failed) { m_source->set_failed(failed); }

    constexpr S & get() const { return *m_source; }

private:
    S * m_source;
};

template<SourceLike S>
constexpr SourceRef<S> by_ref(S & source) {
    return SourceRef<S>(source);
}

namespace source {
template<class S>
struct source_traits<SourceRef<S>> {
    static constexpr bool is_builtin = true;
};
}

} // namespace JsonRead

#pragma once

#include <istream>
#include <string>

#include "io.hpp"
#include "log.hpp"
#include "stream_source.hpp"

namespace JsonRead {

/// Byte channel over a std::istream. The stream is read one character at a
/// time through its streambuf; a stream that goes bad reports an error
/// instead of a silent end of input.
class IStreamChannel {
public:
    explicit IStreamChannel(std::istream & in) : m_in(&in) {}

    ChannelStatus read_byte(char & out) {
        if (m_in->bad()) {
            return ChannelStatus::error;
        }
        std::istream::int_type c = m_in->get();
        if (c != std::istream::traits_type::eof()) {
            out = std::istream::traits_type::to_char_type(c);
            ++m_count;
            return ChannelStatus::ok;
        }
        if (m_in->bad()) {
            JSONREAD_LOG("input stream failed after %zu bytes", m_count);
            return ChannelStatus::error;
        }
        return ChannelStatus::eof;
    }

    std::size_t bytes_read() const { return m_count; }

private:
    std::istream * m_in;
    std::size_t m_count = 0;
};

static_assert(ByteChannelLike<IStreamChannel>);

template<bool RawCapture = RawCaptureByDefault>
inline StreamSource<IStreamChannel, RawCapture> make_stream_source(std::istream & in) {
    return StreamSource<IStreamChannel, RawCapture>(IStreamChannel(in));
}

} // namespace JsonRead

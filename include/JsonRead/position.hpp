#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "io.hpp"

namespace JsonRead {

/// Location of a byte in the input: 1-based line, 0-based column.
struct Position {
    std::size_t line   = 1;
    std::size_t column = 0;

    constexpr bool operator==(const Position&) const = default;
};

/// Position of the byte at index `i` of `data`, found by rescanning [0, i).
/// Only used on the error path, so the linear cost is acceptable.
constexpr Position position_of_index(std::string_view data, std::size_t i) {
    Position position{};
    for (std::size_t k = 0; k < i && k < data.size(); ++k) {
        if (data[k] == '\n') {
            position.line += 1;
            position.column = 0;
        } else {
            position.column += 1;
        }
    }
    return position;
}

/// Wraps a byte channel and keeps line/column bookkeeping incrementally.
template<ByteChannelLike Channel>
class LineColCursor {
public:
    constexpr explicit LineColCursor(Channel channel)
        : channel_(std::move(channel)) {}

    constexpr ChannelStatus next(char & out) {
        ChannelStatus st = channel_.read_byte(out);
        if (st != ChannelStatus::ok) {
            return st;
        }
        if (out == '\n') {
            start_of_line_ += col_ + 1;
            line_ += 1;
            col_ = 0;
        } else {
            col_ += 1;
        }
        return st;
    }

    constexpr std::size_t line() const { return line_; }
    constexpr std::size_t col() const { return col_; }

    // Number of bytes pulled from the channel so far
    constexpr std::size_t byte_offset() const { return start_of_line_ + col_; }

    constexpr Channel & channel() { return channel_; }
    constexpr const Channel & channel() const { return channel_; }

private:
    Channel     channel_;
    std::size_t line_          = 1;
    std::size_t col_           = 0;
    std::size_t start_of_line_ = 0;
};

} // namespace JsonRead

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "read_result.hpp"

namespace JsonRead {

namespace error_formatting_detail {

inline constexpr std::string_view ws = " \t\n\r\f\v";

inline std::string_view trim(std::string_view s) {
    std::size_t first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    std::size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}

template <class T>
std::string ReadResultToString(const ReadResult<T> & res) {
    if (res) {
        return "no error";
    }
    return std::string(error_message(res.error()))
        + " at line " + std::to_string(res.position().line)
        + " column " + std::to_string(res.position().column);
}

/// Same as above, followed by up to `window` bytes of input on each side of
/// the failing byte. `input` must be the buffer the result was produced from.
template <class T>
std::string ReadResultToString(const ReadResult<T> & res, std::string_view input, std::size_t window = 40) {
    std::string out = ReadResultToString(res);
    if (res) {
        return out;
    }
    std::size_t pos = res.offset() < input.size() ? res.offset() : input.size();
    std::size_t from = pos >= window ? pos - window : 0;
    std::string_view before = error_formatting_detail::trim(input.substr(from, pos - from));
    std::string_view after = error_formatting_detail::trim(input.substr(pos, window));

    out += ": '...";
    out += before;
    out += "\xF0\x9F\x98\x96"; // marker between consumed and pending input
    out += after;
    out += "...'";
    return out;
}

} // namespace JsonRead

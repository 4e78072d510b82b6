#pragma once

#include <string_view>

namespace JsonRead {


enum class ReadError {
    NO_ERROR,

    EOF_WHILE_PARSING_STRING,
    CONTROL_CHARACTER_WHILE_PARSING_STRING,
    INVALID_ESCAPE,
    INVALID_UNICODE_CODE_POINT,
    LONE_LEADING_SURROGATE_IN_HEX_ESCAPE,
    UNEXPECTED_END_OF_HEX_ESCAPE,

    IO_ERROR,

    // Reported by StringSequenceReader only
    EXPECTED_STRING
};

constexpr std::string_view error_to_string(ReadError e) {
    switch(e) {
    case ReadError::NO_ERROR: return "NO_ERROR"; break;
    case ReadError::EOF_WHILE_PARSING_STRING: return "EOF_WHILE_PARSING_STRING"; break;
    case ReadError::CONTROL_CHARACTER_WHILE_PARSING_STRING: return "CONTROL_CHARACTER_WHILE_PARSING_STRING"; break;
    case ReadError::INVALID_ESCAPE: return "INVALID_ESCAPE"; break;
    case ReadError::INVALID_UNICODE_CODE_POINT: return "INVALID_UNICODE_CODE_POINT"; break;
    case ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE: return "LONE_LEADING_SURROGATE_IN_HEX_ESCAPE"; break;
    case ReadError::UNEXPECTED_END_OF_HEX_ESCAPE: return "UNEXPECTED_END_OF_HEX_ESCAPE"; break;
    case ReadError::IO_ERROR: return "IO_ERROR"; break;
    case ReadError::EXPECTED_STRING: return "EXPECTED_STRING"; break;
    }
    return "N/A";
}

/// Human readable description, used by error_formatting.hpp
constexpr std::string_view error_message(ReadError e) {
    switch(e) {
    case ReadError::NO_ERROR                              : return "no error";
    case ReadError::EOF_WHILE_PARSING_STRING              : return "EOF while parsing a string";
    case ReadError::CONTROL_CHARACTER_WHILE_PARSING_STRING: return "control character (\\u0000-\\u001F) found while parsing a string";
    case ReadError::INVALID_ESCAPE                        : return "invalid escape";
    case ReadError::INVALID_UNICODE_CODE_POINT            : return "invalid unicode code point";
    case ReadError::LONE_LEADING_SURROGATE_IN_HEX_ESCAPE  : return "lone leading surrogate in hex escape";
    case ReadError::UNEXPECTED_END_OF_HEX_ESCAPE          : return "unexpected end of hex escape";
    case ReadError::IO_ERROR                              : return "I/O error while reading input";
    case ReadError::EXPECTED_STRING                       : return "expected a string";
    }
    return "N/A";
}

} // namespace JsonRead

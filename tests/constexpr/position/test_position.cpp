#include "../test_helpers.hpp"
#include <JsonRead/position.hpp>

using namespace JsonRead;
using namespace TestHelpers;

// ============================================================================
// position_of_index
// ============================================================================

static_assert(position_of_index("", 0) == Position{1, 0}, "empty input");
static_assert(position_of_index("abc", 0) == Position{1, 0}, "start of input");
static_assert(position_of_index("abc", 2) == Position{1, 2}, "within first line");
static_assert(position_of_index("ab\ncd", 3) == Position{2, 0}, "just after a newline");
static_assert(position_of_index("ab\ncd", 5) == Position{2, 2}, "end of second line");
static_assert(position_of_index("\n\n\n", 3) == Position{4, 0}, "only newlines");
static_assert(position_of_index("ab", 10) == Position{1, 2}, "index past the end is clamped");
static_assert(position_of_index("a\r\nb", 4) == Position{2, 1}, "CR counts as a column");

// ============================================================================
// LineColCursor
// ============================================================================

static_assert([] {
    std::string_view text = "ab\ncd\n\nx";
    LineColCursor cursor(IteratorChannel<const char*, const char*>(text.data(), text.data() + text.size()));
    char c = 0;
    if (cursor.line() != 1 || cursor.col() != 0 || cursor.byte_offset() != 0) return false;

    cursor.next(c); cursor.next(c);               // "ab"
    if (cursor.line() != 1 || cursor.col() != 2 || cursor.byte_offset() != 2) return false;

    cursor.next(c);                               // '\n'
    if (c != '\n' || cursor.line() != 2 || cursor.col() != 0 || cursor.byte_offset() != 3) return false;

    cursor.next(c); cursor.next(c); cursor.next(c); cursor.next(c); // "cd\n\n"
    if (cursor.line() != 4 || cursor.col() != 0 || cursor.byte_offset() != 7) return false;

    cursor.next(c);                               // 'x'
    if (cursor.line() != 4 || cursor.col() != 1 || cursor.byte_offset() != 8) return false;

    return cursor.next(c) == ChannelStatus::eof && cursor.byte_offset() == 8;
}(), "LineColCursor: line, column and byte offset bookkeeping");

// The cursor and the rescan agree on every prefix
static_assert([] {
    std::string_view text = "x\n yz\n\n\"q\"\n";
    LineColCursor cursor(IteratorChannel<const char*, const char*>(text.data(), text.data() + text.size()));
    char c = 0;
    for (std::size_t i = 1; i <= text.size(); ++i) {
        cursor.next(c);
        Position expected = position_of_index(text, i);
        if (cursor.line() != expected.line || cursor.col() != expected.column) return false;
        if (cursor.byte_offset() != i) return false;
    }
    return true;
}(), "LineColCursor matches position_of_index");

// ============================================================================
// Source positions
// ============================================================================

template<Kind K>
constexpr bool PositionsAfterReads() {
    return WithSource<K>("a\nbc", [](auto& src) {
        src.next();                                     // 'a'
        if (src.position() != Position{1, 1} || src.byte_offset() != 1) return false;
        src.next();                                     // '\n'
        if (src.position() != Position{2, 0} || src.byte_offset() != 2) return false;
        src.next();                                     // 'b'
        return src.position() == Position{2, 1} && src.byte_offset() == 3;
    });
}
static_assert(PositionsAfterReads<Kind::Stream>(), "stream: positions follow consumed bytes");
static_assert(PositionsAfterReads<Kind::Slice>(), "slice: positions follow consumed bytes");
static_assert(PositionsAfterReads<Kind::String>(), "string: positions follow consumed bytes");

static_assert(WithSource<Kind::Stream>("ab", [](auto& src) {
    src.next();
    src.peek();
    // The peeked byte is already counted by the cursor, but not by byte_offset
    return src.position() == Position{1, 2}
        && src.peek_position() == Position{1, 2}
        && src.byte_offset() == 1;
}), "stream: peek moves position but not byte_offset");

static_assert(WithSource<Kind::Slice>("ab", [](auto& src) {
    src.next();
    src.peek();
    return src.position() == Position{1, 1}
        && src.peek_position() == Position{1, 2}
        && src.byte_offset() == 1;
}), "slice: peek_position is one past the cursor");

static_assert(WithSource<Kind::Slice>("ab", [](auto& src) {
    src.next();
    src.next();
    src.peek();
    return src.peek_position() == Position{1, 2} && src.byte_offset() == 2;
}), "slice: peek_position is clamped at end of input");

static_assert(WithSource<Kind::Stream>("ab", [](auto& src) {
    src.peek();
    src.discard();
    src.peek();
    src.discard();
    return src.byte_offset() == 2 && src.position() == Position{1, 2};
}), "stream: discard brings byte_offset back in line");

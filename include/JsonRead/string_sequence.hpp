#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "read_result.hpp"
#include "source_concept.hpp"

namespace JsonRead {

/// Reads a whitespace separated sequence of top-level JSON strings, such as
/// `"a" "b"\n"c"`, one decoded string per next() call.
///
/// The first error ends the session: the source is told through set_failed,
/// and every later next() reports the end of the sequence.
template<SourceLike Source>
class StringSequenceReader {
public:
    using value_type = std::optional<std::string>;

    constexpr explicit StringSequenceReader(Source source)
        : m_source(std::move(source)) {}

    /// Next decoded string, std::nullopt once the input is exhausted or the
    /// session has failed, or the error that ended the session.
    constexpr ReadResult<value_type> next() {
        if constexpr (Source::should_early_return_if_failed) {
            if (m_failed) {
                return ReadResult<value_type>(value_type{});
            }
        }

        while (true) {
            auto b = m_source.peek();
            if (!b) {
                return fail(b);
            }
            if (!b->has_value()) {
                m_offset = m_source.byte_offset();
                return ReadResult<value_type>(value_type{});
            }
            const std::uint8_t c = **b;
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                m_source.discard();
                continue;
            }
            if (c != '"') {
                return fail(ReadResult<void>(ReadError::EXPECTED_STRING,
                                             m_source.peek_position(),
                                             m_source.byte_offset()));
            }
            m_source.discard();
            break;
        }

        auto s = m_source.parse_str(m_scratch);
        if (!s) {
            return fail(s);
        }
        m_offset = m_source.byte_offset();
        return ReadResult<value_type>(value_type{std::string(s->get())});
    }

    /// Offset just past the last string that was read completely. Once the
    /// end of the input is reached, the offset of that end, trailing
    /// whitespace included. A fused source that failed ends where it was
    /// truncated.
    constexpr std::size_t byte_offset() const {
        return m_offset;
    }

    constexpr bool failed() const {
        return m_failed;
    }

    constexpr Source & source() {
        return m_source;
    }

private:
    template<class T>
    constexpr ReadResult<value_type> fail(const ReadResult<T> & err) {
        m_source.set_failed(m_failed);
        if !consteval {
            JSONREAD_LOG("string sequence failed: %s at line %zu column %zu",
                         error_to_string(err.error()).data(),
                         err.position().line, err.position().column);
        }
        return ReadResult<value_type>(err);
    }

    Source m_source;
    std::string m_scratch;
    std::size_t m_offset = 0;
    bool m_failed = false;
};

} // namespace JsonRead

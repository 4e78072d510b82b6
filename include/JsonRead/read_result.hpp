#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "position.hpp"

namespace JsonRead {


/// Outcome of a source operation: either a value, or an error together with
/// the position and byte offset at which it was detected.
template <class T>
class ReadResult {
    ReadError m_error = ReadError::NO_ERROR;
    Position m_pos{};
    std::size_t m_offset = 0;
    T m_value{};

public:
    using value_type = T;

    constexpr ReadResult() = default;
    constexpr ReadResult(T value): m_value(std::move(value)) {}
    constexpr ReadResult(ReadError err, Position pos, std::size_t offset):
        m_error(err), m_pos(pos), m_offset(offset)
    {}

    /// Re-target an error result to another value type. Explicit: a
    /// successful `other` would come out as a default-constructed value.
    template<class U>
    constexpr explicit ReadResult(const ReadResult<U> & other)
        requires (!std::is_same_v<T, U>)
        : m_error(other.error()), m_pos(other.position()), m_offset(other.offset())
    {}

    constexpr explicit operator bool() const {
        return m_error == ReadError::NO_ERROR;
    }
    constexpr ReadError error() const {
        return m_error;
    }
    constexpr Position position() const {
        return m_pos;
    }
    constexpr std::size_t offset() const {
        return m_offset;
    }

    constexpr T & value() & { return m_value; }
    constexpr const T & value() const & { return m_value; }
    constexpr T && value() && { return std::move(m_value); }

    constexpr T & operator*() & { return m_value; }
    constexpr const T & operator*() const & { return m_value; }
    constexpr T * operator->() { return &m_value; }
    constexpr const T * operator->() const { return &m_value; }
};

template <>
class ReadResult<void> {
    ReadError m_error = ReadError::NO_ERROR;
    Position m_pos{};
    std::size_t m_offset = 0;

public:
    using value_type = void;

    constexpr ReadResult() = default;
    constexpr ReadResult(ReadError err, Position pos, std::size_t offset):
        m_error(err), m_pos(pos), m_offset(offset)
    {}
    template<class U>
    constexpr ReadResult(const ReadResult<U> & other)
        : m_error(other.error()), m_pos(other.position()), m_offset(other.offset())
    {}

    constexpr explicit operator bool() const {
        return m_error == ReadError::NO_ERROR;
    }
    constexpr ReadError error() const {
        return m_error;
    }
    constexpr Position position() const {
        return m_pos;
    }
    constexpr std::size_t offset() const {
        return m_offset;
    }
};

} // namespace JsonRead

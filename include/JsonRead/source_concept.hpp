#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "position.hpp"
#include "read_result.hpp"
#include "reference.hpp"

namespace JsonRead {

namespace source {

/// Sealing trait: only the built-in sources (and SourceRef over them)
/// specialise this with is_builtin = true. There is no user extension point.
template<class S>
struct source_traits {
    static constexpr bool is_builtin = false;
};

using ByteResult = ReadResult<std::optional<std::uint8_t>>;

/// SourceLike defines the byte-level interface the token parser drives.
/// Structural tokens go through next/peek/discard; after an opening quote
/// the caller hands over to parse_str / parse_str_raw / ignore_str.
template<typename S>
concept SourceLike = source_traits<S>::is_builtin && requires(S & src,
                                                              const S & csrc,
                                                              std::string & scratch,
                                                              bool & failed) {
    // ========== Byte primitives ==========
    { src.next() } -> std::same_as<ByteResult>;
    { src.peek() } -> std::same_as<ByteResult>;
    { src.discard() } -> std::same_as<void>;

    // ========== Diagnostics ==========
    { csrc.position() } -> std::same_as<Position>;
    { csrc.peek_position() } -> std::same_as<Position>;
    { csrc.byte_offset() } -> std::same_as<std::size_t>;

    // ========== Strings ==========
    { src.parse_str(scratch) } -> std::same_as<ReadResult<StrRef>>;
    { src.parse_str_raw(scratch) } -> std::same_as<ReadResult<BytesRef>>;
    { src.ignore_str() } -> std::same_as<ReadResult<void>>;
    { src.decode_hex_escape() } -> std::same_as<ReadResult<std::uint16_t>>;

    // ========== Streaming driver support ==========
    { src.set_failed(failed) } -> std::same_as<void>;
    { S::should_early_return_if_failed } -> std::convertible_to<bool>;
    { S::is_fused } -> std::convertible_to<bool>;
};

namespace detail {
struct CapturedSize {
    constexpr std::size_t operator()(StrRef raw) const { return raw.get().size(); }
};
} // namespace detail

/// Sources compiled with raw capture support.
template<typename S>
concept RawCapturingSource = SourceLike<S> && requires(S & src) {
    { src.begin_raw_buffering() } -> std::same_as<void>;
    { src.end_raw_buffering(detail::CapturedSize{}) }
        -> std::same_as<ReadResult<std::size_t>>;
};

/// Type trait to check if a type satisfies SourceLike at compile time
template<typename S>
constexpr bool is_source_like_v = SourceLike<S>;

} // namespace source

using source::SourceLike;
using source::RawCapturingSource;
using source::ByteResult;

} // namespace JsonRead

#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "reference.hpp"

namespace JsonRead {

// Storage for the begin_raw_buffering / end_raw_buffering pair.
// Sources keep one of these as a [[no_unique_address]] member; with raw
// capture compiled out the member is the empty Disabled type.
namespace raw_capture {

struct Disabled {};

/// Stream sources have no backing buffer, so consumed bytes are mirrored
/// into an append-only buffer while a capture is active.
struct MirrorBuffer {
    std::optional<std::string> buffer;

    constexpr void begin() {
        buffer.emplace();
    }
    constexpr bool active() const {
        return buffer.has_value();
    }
    constexpr void mirror(char c) {
        if (buffer) {
            buffer->push_back(c);
        }
    }
    constexpr std::string take() {
        std::string out;
        if (buffer) {
            out = std::move(*buffer);
            buffer.reset();
        }
        return out;
    }
};

/// Slice-backed sources only remember where the capture started.
struct StartIndex {
    std::size_t start = 0;
};

template<bool Enabled, class Storage>
using storage_t = std::conditional_t<Enabled, Storage, Disabled>;

/// A consumer receives the captured text once and returns a value.
/// The value travels in a ReadResult, so it must be default-initializable.
template<class Consumer>
concept RawConsumer = std::is_invocable_v<Consumer, StrRef>
    && !std::is_void_v<std::invoke_result_t<Consumer, StrRef>>
    && std::default_initializable<std::invoke_result_t<Consumer, StrRef>>;

template<class Consumer>
using consumer_result_t = std::invoke_result_t<Consumer, StrRef>;

} // namespace raw_capture

} // namespace JsonRead

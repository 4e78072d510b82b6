#pragma once

// Compile-time switches. Every macro may be predefined by the build.

// Default value of the RawCapture template parameter of every source.
// With RawCapture == false the begin/end raw buffering members do not exist.
#ifndef JSONREAD_ENABLE_RAW_CAPTURE
#define JSONREAD_ENABLE_RAW_CAPTURE 1
#endif

#ifndef JSONREAD_ENABLE_LOGGING
#ifdef NDEBUG
#define JSONREAD_ENABLE_LOGGING 0
#else
#define JSONREAD_ENABLE_LOGGING 1
#endif
#endif

namespace JsonRead {

inline constexpr bool RawCaptureByDefault = JSONREAD_ENABLE_RAW_CAPTURE != 0;

} // namespace JsonRead

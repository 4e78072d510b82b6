#pragma once

#include <cstdio>

#include "config.hpp"

// printf-style diagnostics for runtime-only paths (channels, drivers).
// Never call these from code that may run during constant evaluation
// unless guarded by `if !consteval`.

#if JSONREAD_ENABLE_LOGGING
#define JSONREAD_LOG(fmt, ...) std::fprintf(stderr, "[JsonRead] " fmt "\n", ##__VA_ARGS__)
#else
#define JSONREAD_LOG(fmt, ...) do {} while (0)
#endif

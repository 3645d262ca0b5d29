#ifndef BIGKEY_SETTINGS_HPP
#define BIGKEY_SETTINGS_HPP

#include <cstddef>
#include <cstdint>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define BIGKEY_DEBUG 1
#define BIGKEY_IF_DEBUG(...) __VA_ARGS__
#define BIGKEY_IF_NOT_DEBUG(...)
#else // release builds
#define BIGKEY_IF_DEBUG(...)
#define BIGKEY_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define BIGKEY_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define BIGKEY_GCC 1
#endif

// Defined by the build when the native backend is opted out of.
// The process-wide registry then starts out with the fallback backend.
#ifdef BIGKEY_NO_NATIVE_BIG_INT
#define BIGKEY_IF_NATIVE_BIG_INT(...)
#define BIGKEY_IF_NOT_NATIVE_BIG_INT(...) __VA_ARGS__
#else
#define BIGKEY_IF_NATIVE_BIG_INT(...) __VA_ARGS__
#define BIGKEY_IF_NOT_NATIVE_BIG_INT(...)
#endif

namespace bigkey {

#if !defined(BIGKEY_CLANG) && !defined(BIGKEY_GCC)
#error "bigkey currently only supports Clang or GCC."
#endif

using Int64 = std::int64_t;
using Uint8 = std::uint8_t;
using Uint32 = std::uint32_t;
using Uint64 = std::uint64_t;

/// @brief If `true`, the process-wide registry is initialized with the native backend.
/// Otherwise, it is initialized with the fallback backend.
inline constexpr bool has_native_big_int
    = BIGKEY_IF_NATIVE_BIG_INT(true) BIGKEY_IF_NOT_NATIVE_BIG_INT(false);

} // namespace bigkey

#endif

#pragma once

#include "../core/types.hpp"
#include <cstdio>

// Auto-detect platform if the build system did not provide one
#if !defined(MIXCORE_PLATFORM_POSIX) && \
    !defined(MIXCORE_PLATFORM_GENERIC)
  #if defined(__unix__) || defined(__APPLE__)
    #define MIXCORE_PLATFORM_POSIX
  #else
    #define MIXCORE_PLATFORM_GENERIC
  #endif
#endif

#if defined(MIXCORE_PLATFORM_POSIX)
#  include "impl_posix.hpp"
   namespace mixCore::platform { namespace impl = mixCore::platform::impl_posix; }
#else
#  include "impl_generic.hpp"
   namespace mixCore::platform { namespace impl = mixCore::platform::impl_generic; }
#endif

namespace mixCore::platform {

// Re-export primitives and functions from selected impl
using critical_section = impl::critical_section;

inline timestamp_t get_system_time_us() noexcept { return impl::get_system_time_us(); }

// Centralized logging
#ifndef MIXCORE_ENABLE_LOGGING
#define MIXCORE_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

namespace detail {
inline void log_sink(const char* msg) noexcept {
#if defined(MIXCORE_PLATFORM_POSIX)
    if (msg) { std::puts(msg); }
#else
    (void)msg;
#endif
}

template <typename... Args>
inline void format_and_log(const char* fmt, Args... args) noexcept {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer), fmt, args...); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */
    log_sink(buffer);
}
} // namespace detail

inline void log(const char* message) noexcept {
#if MIXCORE_ENABLE_LOGGING
    detail::log_sink(message);
#else
    (void)message;
#endif
}

#if MIXCORE_ENABLE_LOGGING
inline void logf(const char* fmt, u32 arg1) noexcept { detail::format_and_log(fmt, arg1); }
inline void logf(const char* fmt, u32 arg1, u32 arg2) noexcept { detail::format_and_log(fmt, arg1, arg2); }
inline void logf(const char* fmt, u32 arg1, u32 arg2, u32 arg3) noexcept { detail::format_and_log(fmt, arg1, arg2, arg3); }
inline void logf(const char* fmt, const char* arg1) noexcept { detail::format_and_log(fmt, arg1); }
inline void logf(const char* fmt, const char* arg1, const char* arg2) noexcept { detail::format_and_log(fmt, arg1, arg2); }
inline void logf(const char* fmt, const char* arg1, u32 arg2) noexcept { detail::format_and_log(fmt, arg1, arg2); }
inline void logf(const char* fmt, const char* arg1, const char* arg2, u32 arg3) noexcept { detail::format_and_log(fmt, arg1, arg2, arg3); }
#else
inline void logf(const char*, u32) noexcept {}
inline void logf(const char*, u32, u32) noexcept {}
inline void logf(const char*, u32, u32, u32) noexcept {}
inline void logf(const char*, const char*) noexcept {}
inline void logf(const char*, const char*, const char*) noexcept {}
inline void logf(const char*, const char*, u32) noexcept {}
inline void logf(const char*, const char*, const char*, u32) noexcept {}
#endif

} // namespace mixCore::platform

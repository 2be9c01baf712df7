#pragma once

// Auto-detect platform if the build system did not provide one
#if !defined(EMDELEGATE_PLATFORM_POSIX) && \
    !defined(EMDELEGATE_PLATFORM_GENERIC)
  #if defined(__unix__) || defined(__APPLE__)
    #define EMDELEGATE_PLATFORM_POSIX
  #else
    #define EMDELEGATE_PLATFORM_GENERIC
  #endif
#endif

#include "platform_base.hpp"
#include "../core/config.hpp"
#include <cstdio>

#include <etl/delegate.h>
#include <etl/type_traits.h>

#if defined(EMDELEGATE_PLATFORM_POSIX)
#  include "impl_posix.hpp"
   namespace emDelegate::platform { namespace impl = emDelegate::platform::impl_posix; }
#else
#  include "impl_generic.hpp"
   namespace emDelegate::platform { namespace impl = emDelegate::platform::impl_generic; }
#endif

namespace emDelegate::platform {

inline timestamp_t get_system_time_us() noexcept { return impl::get_system_time_us(); }
inline timestamp_t get_system_time() noexcept { return impl::get_system_time(); }

constexpr platform_info get_platform_info() noexcept { return impl::get_platform_info(); }

// Centralized logging
#ifndef EMDELEGATE_ENABLE_LOGGING
#define EMDELEGATE_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

// Receives one complete line (no trailing newline)
using log_sink_t = etl::delegate<void(const char*)>;

namespace detail {
inline log_sink_t& log_sink_slot() noexcept {
    static log_sink_t sink;
    return sink;
}

inline void log_sink(const char* msg) noexcept {
    const log_sink_t& sink = log_sink_slot();
    if (sink.is_valid()) {
        sink(msg);
    } else {
        impl::console_write(msg);
    }
}
} // namespace detail

/**
 * @brief Route log lines to a custom sink
 * @param sink Receiver for each line, an empty delegate restores the console
 * @return The previously installed sink
 */
inline log_sink_t set_log_sink(log_sink_t sink) noexcept {
    const log_sink_t previous = detail::log_sink_slot();
    detail::log_sink_slot() = sink;
    return previous;
}

inline void reset_log_sink() noexcept { detail::log_sink_slot() = log_sink_t(); }

inline void log(const char* message) noexcept {
#if EMDELEGATE_ENABLE_LOGGING
    detail::log_sink(message);
#else
    (void)message;
#endif
}

// Types that can safely pass through the snprintf varargs call
template <typename T>
struct is_loggable
    : etl::bool_constant<etl::is_arithmetic<T>::value || etl::is_pointer<T>::value> {};

template <typename... TArgs>
inline void logf(const char* fmt, TArgs... args) noexcept {
    static_assert(sizeof...(TArgs) > 0, "use log() for a message without arguments");
    static_assert((is_loggable<TArgs>::value && ...), "logf arguments must be arithmetic values or pointers");
#if EMDELEGATE_ENABLE_LOGGING
    char buffer[config::log_buffer_size];
    (void)std::snprintf(buffer, sizeof(buffer), fmt, args...); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */
    log(buffer);
#else
    (void)fmt;
    ((void)args, ...);
#endif
}

} // namespace emDelegate::platform

#pragma once

#include "platform_base.hpp"

#include <cstdio>

namespace emDelegate::platform::impl_generic {

inline timestamp_t get_system_time_us() noexcept {
    static timestamp_t counter = 0;
    return ++counter; // monotonic stub
}
inline timestamp_t get_system_time() noexcept { return get_system_time_us() / 1000; }

// Any hosted toolchain has stdio, Windows included
inline void console_write(const char* msg) noexcept {
    if (msg) { (void)std::puts(msg); }
}

inline constexpr platform_info get_platform_info() noexcept { return {"Generic", true}; }

} // namespace emDelegate::platform::impl_generic

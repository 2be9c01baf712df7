#pragma once

#include "platform_base.hpp"

#include <time.h>
#include <cstdio>

namespace emDelegate::platform::impl_posix {

inline timestamp_t get_system_time_us() noexcept {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_t>(ts.tv_sec) * 1000000ULL + static_cast<timestamp_t>(ts.tv_nsec / 1000);
}
inline timestamp_t get_system_time() noexcept { return get_system_time_us() / 1000ULL; }

inline void console_write(const char* msg) noexcept {
    if (msg) { (void)std::puts(msg); }
}

inline constexpr platform_info get_platform_info() noexcept { return {"POSIX", true}; }

} // namespace emDelegate::platform::impl_posix

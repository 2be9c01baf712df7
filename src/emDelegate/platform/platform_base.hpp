#pragma once

#include "../core/types.hpp"

namespace emDelegate::platform {

// Compile-time platform kind selection
enum class platform_kind : unsigned {
    posix,
    generic
};

#ifndef EMDELEGATE_PLATFORM_KIND
#  if defined(EMDELEGATE_PLATFORM_POSIX)
#    define EMDELEGATE_PLATFORM_KIND emDelegate::platform::platform_kind::posix
#  else
#    define EMDELEGATE_PLATFORM_KIND emDelegate::platform::platform_kind::generic
#  endif
#endif

struct platform_info {
    const char* name;
    bool has_console;
};

// Selected platform as a compile-time constant for constexpr dispatch
inline constexpr platform_kind selected_platform = EMDELEGATE_PLATFORM_KIND;

} // namespace emDelegate::platform

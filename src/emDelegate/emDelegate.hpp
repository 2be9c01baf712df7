#pragma once

/**
 * @file emDelegate.hpp
 * @brief Main header for emDelegate - delegates and events on fixed storage
 *
 * Callable references, multicast invocation lists and owner-guarded
 * notification slots with no dynamic allocation.
 * Depends only on ETL (Embedded Template Library).
 *
 * @version 1.0.0
 * @date 2025
 */

#include "emDelegate/core/types.hpp"
#include "emDelegate/core/config.hpp"
#include "emDelegate/error/result.hpp"
#include "emDelegate/error/error_handler.hpp"
#include "emDelegate/platform/platform.hpp"

#include "emDelegate/delegate/make_delegate.hpp"
#include "emDelegate/delegate/multicast_delegate.hpp"
#include "emDelegate/delegate/generic_delegates.hpp"
#include "emDelegate/event/event_args.hpp"
#include "emDelegate/event/event.hpp"

/**
 * @namespace emDelegate
 * @brief Main namespace for the delegate and event library
 */
namespace emDelegate {

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return "1.0.0";
    }

} // namespace emDelegate

#pragma once

#include <cstddef>

#include "types.hpp"

// Capacity of a multicast_delegate invocation list when none is given
#ifndef EMDELEGATE_MAX_INVOCATION_LIST
#define EMDELEGATE_MAX_INVOCATION_LIST 16
#endif

// Capacity of an event slot when none is given
#ifndef EMDELEGATE_MAX_EVENT_SUBSCRIBERS
#define EMDELEGATE_MAX_EVENT_SUBSCRIBERS 8
#endif

// Characters of an exception message kept in an error_context
#ifndef EMDELEGATE_FAULT_MESSAGE_LENGTH
#define EMDELEGATE_FAULT_MESSAGE_LENGTH 64
#endif

#ifndef EMDELEGATE_LOG_BUFFER_SIZE
#define EMDELEGATE_LOG_BUFFER_SIZE 256
#endif

namespace emDelegate::config {

        // Invocation lists
        constexpr size_t max_invocation_list = EMDELEGATE_MAX_INVOCATION_LIST;

        // Notification slots
        constexpr size_t max_event_subscribers = EMDELEGATE_MAX_EVENT_SUBSCRIBERS;

        // Error reporting
        constexpr size_t fault_message_length = EMDELEGATE_FAULT_MESSAGE_LENGTH;

        // Logging
        constexpr size_t log_buffer_size = EMDELEGATE_LOG_BUFFER_SIZE;

        // -------- Compile-time sanity checks for flags --------
        static_assert(max_invocation_list >= 1, "EMDELEGATE_MAX_INVOCATION_LIST must be >= 1");
        static_assert(max_invocation_list < invalid_member_index,
                      "EMDELEGATE_MAX_INVOCATION_LIST must fit member_index_t");
        static_assert(max_event_subscribers >= 1, "EMDELEGATE_MAX_EVENT_SUBSCRIBERS must be >= 1");
        static_assert(max_event_subscribers < invalid_member_index,
                      "EMDELEGATE_MAX_EVENT_SUBSCRIBERS must fit member_index_t");
        static_assert(fault_message_length >= 8, "EMDELEGATE_FAULT_MESSAGE_LENGTH must be >= 8");
        static_assert(log_buffer_size >= 32, "EMDELEGATE_LOG_BUFFER_SIZE must be >= 32");
}  // namespace emDelegate::config

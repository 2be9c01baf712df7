#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace emDelegate {
namespace error {

/**
 * @brief Error event types for callbacks
 */
enum class error_event : u8 {
    invocation_fault,   // a member threw during isolated invocation
    list_overflow,      // operator+= on a full invocation list
    remove_miss,        // operator-= with a member that is not registered
    invalid_target      // operator+= with an empty callable reference
};

/**
 * @brief Error severity levels
 */
enum class error_severity : u8 {
    info,       // Informational, no action needed
    warning,    // Warning, may need attention
    error,      // Error, requires handling
    critical    // Critical, caller state is suspect
};

constexpr const char* to_string(error_event event) noexcept {
    switch (event) {
        case error_event::invocation_fault: return "invocation_fault";
        case error_event::list_overflow:    return "list_overflow";
        case error_event::remove_miss:      return "remove_miss";
        case error_event::invalid_target:   return "invalid_target";
    }
    return "unknown";
}

using fault_message_t = string<config::fault_message_length>;

/**
 * @brief Error context information
 */
struct error_context {
    error_event event{error_event::invocation_fault};
    error_severity severity{error_severity::error};
    error_code code{error_code::success};
    member_index_t member{invalid_member_index};
    timestamp_t timestamp{0};
    fault_message_t message;

    error_context() = default;
};

/**
 * @brief Error handler callback type
 */
using error_handler_fn = void(*)(const error_context& ctx) noexcept;

/**
 * @brief Global error handler configuration
 */
class error_handler {
private:
    error_handler_fn callback_{nullptr};
    bool enabled_{false};
    u32 error_count_{0};
    error_context last_error_;

public:
    error_handler() = default;

    /**
     * @brief Set error handler callback
     */
    void set_callback(error_handler_fn callback) noexcept {
        callback_ = callback;
        enabled_ = (callback != nullptr);
    }

    /**
     * @brief Report an error
     */
    void report_error(const error_context& ctx) noexcept {
        error_count_++;
        last_error_ = ctx;

        if (enabled_ && callback_ != nullptr) {
            callback_(ctx);
        }

        if (ctx.severity >= error_severity::error) {
            platform::logf("ERROR: event=%s member=%u code=%s %s",
                           to_string(ctx.event),
                           static_cast<u32>(ctx.member),
                           to_string(ctx.code),
                           ctx.message.c_str());
        }
    }

    /**
     * @brief Create error context helper
     */
    static error_context make_context(
        error_event event,
        error_severity severity,
        error_code code = error_code::success,
        member_index_t member = invalid_member_index,
        const char* message = nullptr
    ) noexcept {
        error_context ctx;
        ctx.event = event;
        ctx.severity = severity;
        ctx.code = code;
        ctx.member = member;
        ctx.timestamp = platform::get_system_time_us();
        if (message != nullptr) {
            // Truncates to the fixed capacity
            ctx.message.assign(message);
        }
        return ctx;
    }

    u32 get_error_count() const noexcept {
        return error_count_;
    }

    const error_context& get_last_error() const noexcept {
        return last_error_;
    }

    /**
     * @brief Reset error statistics and drop the callback
     */
    void reset() noexcept {
        error_count_ = 0;
        last_error_ = error_context();
        callback_ = nullptr;
        enabled_ = false;
    }
};

/**
 * @brief Global error handler instance
 */
inline error_handler& get_global_error_handler() noexcept {
    static error_handler handler;
    return handler;
}

/**
 * @brief Convenience function to report errors
 */
inline void report_error(const error_context& ctx) noexcept {
    get_global_error_handler().report_error(ctx);
}

} // namespace error
} // namespace emDelegate

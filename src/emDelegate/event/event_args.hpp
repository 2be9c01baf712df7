#pragma once

namespace emDelegate::events {

/**
 * @brief Base for objects carried by standard-shaped events
 *
 * Derive to add payload fields. Events with nothing to say pass
 * event_args::empty().
 */
struct event_args {
    static const event_args& empty() noexcept {
        static const event_args instance{};
        return instance;
    }
};

// Standard handler shape: the raising object followed by its arguments
template <typename TSender, typename TArgs = event_args>
using event_handler_t = void(const TSender&, const TArgs&);

} // namespace emDelegate::events

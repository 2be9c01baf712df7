#pragma once

#include "../event/event.hpp"
#include "../event/event_args.hpp"

namespace emDelegate::demo {

/**
 * @brief Publisher exposing one custom-signature slot and one standard-shaped slot
 */
class notifier {
public:
    events::event<notifier, void(const char*)> notify;
    events::event<notifier, events::event_handler_t<notifier>> standard_notify;

    // Both return false when nobody was subscribed
    bool raise_notify(const char* message) const { return notify.raise(message); }

    bool raise_standard_notify() const {
        return standard_notify.raise(*this, events::event_args::empty());
    }

    // Keeps going past subscribers that throw
    invocation_report raise_notify_each(const char* message) const {
        return notify.raise_each(message);
    }
};

} // namespace emDelegate::demo

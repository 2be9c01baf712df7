#pragma once

#include <cstddef>

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../delegate/multicast_delegate.hpp"
#include "event_args.hpp"

namespace emDelegate::events {

template <typename TOwner, typename TSignature, size_t Capacity = config::max_event_subscribers>
class event;

/**
 * @brief Notification slot owned by TOwner
 *
 * Anyone holding the owner can subscribe and unsubscribe; only TOwner can
 * raise. Raising with no subscribers does nothing. Subscribers run in
 * registration order on the raising thread. Copy/move disabled: the slot
 * belongs to exactly one owner.
 */
template <typename TOwner, typename... TParams, size_t Capacity>
class event<TOwner, void(TParams...), Capacity> {
    friend TOwner;

public:
    using list_type       = multicast_delegate<void(TParams...), Capacity>;
    using handler_type    = typename list_type::delegate_type;
    using fault_handler_t = typename list_type::fault_handler_t;

private:
    list_type subscribers_;

public:
    event() = default;
    event(const event&) = delete;
    event& operator=(const event&) = delete;
    event(event&&) = delete;
    event& operator=(event&&) = delete;
    ~event() = default;

    /**
     * @brief Register a handler
     * @return invalid_parameter for an empty handler, capacity_exceeded when full
     */
    result<void, error_code> subscribe(handler_type handler) noexcept {
        return subscribers_.add(handler);
    }

    /**
     * @brief Drop the most recent registration of a handler
     * @return not_found if it was never registered
     */
    result<void, error_code> unsubscribe(handler_type handler) noexcept {
        return subscribers_.remove(handler);
    }

    event& operator+=(handler_type handler) noexcept {
        subscribers_ += handler;
        return *this;
    }

    event& operator-=(handler_type handler) noexcept {
        subscribers_ -= handler;
        return *this;
    }

    [[nodiscard]] size_t subscriber_count() const noexcept { return subscribers_.size(); }
    [[nodiscard]] bool has_subscribers() const noexcept { return !subscribers_.empty(); }

private:
    // Returns false when nobody is subscribed
    bool raise(TParams... args) const {
        return subscribers_.invoke_if(args...);
    }

    invocation_report raise_each(fault_handler_t on_fault, TParams... args) const {
        return subscribers_.invoke_each(on_fault, args...);
    }

    invocation_report raise_each(TParams... args) const {
        return subscribers_.invoke_each(args...);
    }
};

} // namespace emDelegate::events

#pragma once

#include <cstddef>
#include <exception>

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"

#include <etl/delegate.h>
#include <etl/type_traits.h>
#include <etl/vector.h>

namespace emDelegate {

template <typename TSignature, size_t Capacity = config::max_invocation_list>
class multicast_delegate;

/**
 * @brief Ordered list of callable references sharing one signature
 *
 * Members are etl::delegate values: they do not own the functions, objects
 * or lambdas they refer to. Invoking the list calls every member in
 * registration order and hands back the value of the last one; the values
 * of the earlier members are discarded. Storage is fixed capacity.
 *
 * Exceptions thrown by a member are not caught by invoke(): the remaining
 * members are skipped and the exception reaches the caller. invoke_each()
 * isolates members from each other instead.
 */
template <typename TReturn, typename... TParams, size_t Capacity>
class multicast_delegate<TReturn(TParams...), Capacity> {
public:
    using delegate_type   = etl::delegate<TReturn(TParams...)>;
    using invocation_list = etl::vector<delegate_type, Capacity>;
    using return_type     = TReturn;
    using result_type     = result<TReturn, error_code>;
    // Receives the position of the faulting member and a description of what it threw
    using fault_handler_t = etl::delegate<void(member_index_t, const char*)>;

    static constexpr size_t capacity = Capacity;
    static_assert(Capacity >= 1, "multicast_delegate capacity must be >= 1");
    static_assert(Capacity < invalid_member_index, "multicast_delegate capacity must fit member_index_t");

private:
    invocation_list members_;

public:
    multicast_delegate() = default;

    // Single-target list; an empty reference gives an empty list
    multicast_delegate(delegate_type target) noexcept {  // NOLINT(google-explicit-constructor)
        if (target.is_valid()) {
            members_.push_back(target);
        }
    }

    // -------- Factories --------

    template <TReturn(*Function)(TParams...)>
    static multicast_delegate create() noexcept {
        return multicast_delegate(delegate_type::template create<Function>());
    }

    template <typename T, TReturn(T::*Method)(TParams...)>
    static multicast_delegate create(T& instance) noexcept {
        return multicast_delegate(delegate_type::template create<T, Method>(instance));
    }

    template <typename T, TReturn(T::*Method)(TParams...) const>
    static multicast_delegate create(const T& instance) noexcept {
        return multicast_delegate(delegate_type::template create<T, Method>(instance));
    }

    // Functor or lambda; it must outlive every list it ends up in
    template <typename TFunctor,
              typename = etl::enable_if_t<etl::is_class<TFunctor>::value &&
                                          !etl::is_same<etl::remove_cv_t<TFunctor>, multicast_delegate>::value>>
    static multicast_delegate create(TFunctor& functor) noexcept {
        return multicast_delegate(delegate_type::create(functor));
    }

    // -------- Membership --------

    /**
     * @brief Append a callable reference
     * @return invalid_parameter for an empty reference, capacity_exceeded when full
     */
    result<void, error_code> add(delegate_type target) noexcept {
        if (!target.is_valid()) {
            return fail(error_code::invalid_parameter);
        }
        if (members_.full()) {
            return fail(error_code::capacity_exceeded);
        }
        members_.push_back(target);
        return ok();
    }

    /**
     * @brief Append every member of another list, keeping its order
     * @return capacity_exceeded (and nothing appended) if they do not all fit
     */
    result<void, error_code> add(const multicast_delegate& other) noexcept {
        const invocation_list appended = other.members_;
        if (members_.available() < appended.size()) {
            return fail(error_code::capacity_exceeded);
        }
        for (const auto& member : appended) {
            members_.push_back(member);
        }
        return ok();
    }

    /**
     * @brief Remove the last occurrence of a callable reference
     * @return not_found if it is not a member
     */
    result<void, error_code> remove(delegate_type target) noexcept {
        for (size_t pos = members_.size(); pos > 0; --pos) {
            if (members_[pos - 1] == target) {
                members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(pos - 1));
                return ok();
            }
        }
        return fail(error_code::not_found);
    }

    /**
     * @brief Remove the last contiguous run equal to another list
     * @return not_found if the run does not occur; removing an empty list is a no-op
     */
    result<void, error_code> remove(const multicast_delegate& other) noexcept {
        const invocation_list pattern = other.members_;
        const size_t run = pattern.size();
        if (run == 0) {
            return ok();
        }
        if (run > members_.size()) {
            return fail(error_code::not_found);
        }
        for (size_t start = members_.size() - run + 1; start > 0; --start) {
            const size_t first = start - 1;
            bool match = true;
            for (size_t k = 0; k < run && match; ++k) {
                match = (members_[first + k] == pattern[k]);
            }
            if (match) {
                const auto begin = members_.begin() + static_cast<std::ptrdiff_t>(first);
                members_.erase(begin, begin + static_cast<std::ptrdiff_t>(run));
                return ok();
            }
        }
        return fail(error_code::not_found);
    }

    void clear() noexcept { members_.clear(); }

    // Operator forms report failures to the global error handler
    multicast_delegate& operator+=(delegate_type target) noexcept {
        report(add(target));
        return *this;
    }

    multicast_delegate& operator+=(const multicast_delegate& other) noexcept {
        report(add(other));
        return *this;
    }

    multicast_delegate& operator-=(delegate_type target) noexcept {
        report(remove(target));
        return *this;
    }

    multicast_delegate& operator-=(const multicast_delegate& other) noexcept {
        report(remove(other));
        return *this;
    }

    friend multicast_delegate operator+(multicast_delegate lhs, const multicast_delegate& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend multicast_delegate operator-(multicast_delegate lhs, const multicast_delegate& rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    // -------- Queries --------

    [[nodiscard]] size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] bool empty() const noexcept { return members_.empty(); }
    [[nodiscard]] bool full() const noexcept { return members_.full(); }
    explicit operator bool() const noexcept { return !members_.empty(); }

    bool contains(delegate_type target) const noexcept {
        for (const auto& member : members_) {
            if (member == target) { return true; }
        }
        return false;
    }

    /**
     * @brief Snapshot of the members in registration order
     */
    invocation_list get_invocation_list() const noexcept { return members_; }

    friend bool operator==(const multicast_delegate& lhs, const multicast_delegate& rhs) noexcept {
        if (lhs.members_.size() != rhs.members_.size()) { return false; }
        for (size_t i = 0; i < lhs.members_.size(); ++i) {
            if (!(lhs.members_[i] == rhs.members_[i])) { return false; }
        }
        return true;
    }

    friend bool operator!=(const multicast_delegate& lhs, const multicast_delegate& rhs) noexcept {
        return !(lhs == rhs);
    }

    // -------- Invocation --------

    /**
     * @brief Invoke every member in registration order
     * @return Value of the last member, or empty_invocation_list
     */
    result_type invoke(TParams... args) const {
        if (members_.empty()) {
            return result_type(error_code::empty_invocation_list);
        }
        const invocation_list snapshot = members_;
        if constexpr (etl::is_same<TReturn, void>::value) {
            call_all(snapshot, args...);
            return result_type();
        } else {
            return result_type(call_all(snapshot, args...));
        }
    }

    result_type operator()(TParams... args) const {
        return invoke(args...);
    }

    /**
     * @brief Invoke only when there is at least one member
     * @return false if the list was empty
     */
    bool invoke_if(TParams... args) const {
        if (members_.empty()) {
            return false;
        }
        const invocation_list snapshot = members_;
        static_cast<void>(call_all(snapshot, args...));
        return true;
    }

    /**
     * @brief Invoke each member on its own, continuing past members that throw
     *
     * Works on a snapshot, so members may add or remove subscriptions while
     * running. Anything escaping a member goes to on_fault, or to the global
     * error handler when on_fault is empty. Exceptions not derived from
     * std::exception are described as "unknown exception".
     */
    invocation_report invoke_each(fault_handler_t on_fault, TParams... args) const {
        invocation_report report_out;
        const invocation_list snapshot = members_;
        for (size_t i = 0; i < snapshot.size(); ++i) {
            ++report_out.invoked;
            try {
                static_cast<void>(snapshot[i](args...));
            } catch (const std::exception& ex) {
                ++report_out.faulted;
                report_fault(on_fault, static_cast<member_index_t>(i), ex.what());
            } catch (...) {
                ++report_out.faulted;
                report_fault(on_fault, static_cast<member_index_t>(i), "unknown exception");
            }
        }
        return report_out;
    }

    invocation_report invoke_each(TParams... args) const {
        return invoke_each(fault_handler_t(), args...);
    }

private:
    // Requires a non-empty list
    static TReturn call_all(const invocation_list& members, TParams... args) {
        const size_t last = members.size() - 1;
        for (size_t i = 0; i < last; ++i) {
            static_cast<void>(members[i](args...));
        }
        return members[last](args...);
    }

    static void report_fault(const fault_handler_t& on_fault, member_index_t member, const char* what) {
        if (on_fault.is_valid()) {
            on_fault(member, what);
        } else {
            error::report_error(error::error_handler::make_context(
                error::error_event::invocation_fault, error::error_severity::error,
                error_code::member_fault, member, what));
        }
    }

    static void report(const result<void, error_code>& res) noexcept {
        if (res.is_ok()) { return; }
        switch (res.error()) {
            case error_code::capacity_exceeded:
                error::report_error(error::error_handler::make_context(
                    error::error_event::list_overflow, error::error_severity::error, res.error()));
                break;
            case error_code::not_found:
                error::report_error(error::error_handler::make_context(
                    error::error_event::remove_miss, error::error_severity::info, res.error()));
                break;
            default:
                error::report_error(error::error_handler::make_context(
                    error::error_event::invalid_target, error::error_severity::warning, res.error()));
                break;
        }
    }
};

} // namespace emDelegate

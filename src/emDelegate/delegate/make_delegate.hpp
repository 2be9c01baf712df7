#pragma once

// Signature deduction for building etl::delegate callable references
// without spelling out the signature at the call site.

#include <etl/delegate.h>
#include <etl/type_traits.h>

namespace emDelegate {

namespace detail {

template <typename T>
struct callable_traits;

template <typename TReturn, typename... TParams>
struct callable_traits<TReturn(*)(TParams...)> {
    using signature = TReturn(TParams...);
};

template <typename TReturn, typename TObject, typename... TParams>
struct callable_traits<TReturn(TObject::*)(TParams...)> {
    using signature = TReturn(TParams...);
    using object_type = TObject;
    static constexpr bool is_const = false;
};

template <typename TReturn, typename TObject, typename... TParams>
struct callable_traits<TReturn(TObject::*)(TParams...) const> {
    using signature = TReturn(TParams...);
    using object_type = TObject;
    static constexpr bool is_const = true;
};

// noexcept is part of the type since C++17; the delegate signature drops it
template <typename TReturn, typename... TParams>
struct callable_traits<TReturn(*)(TParams...) noexcept> : callable_traits<TReturn(*)(TParams...)> {};

template <typename TReturn, typename TObject, typename... TParams>
struct callable_traits<TReturn(TObject::*)(TParams...) noexcept>
    : callable_traits<TReturn(TObject::*)(TParams...)> {};

template <typename TReturn, typename TObject, typename... TParams>
struct callable_traits<TReturn(TObject::*)(TParams...) const noexcept>
    : callable_traits<TReturn(TObject::*)(TParams...) const> {};

// Functors and lambdas: read the signature off operator()
template <typename TFunctor>
struct functor_traits : callable_traits<decltype(&etl::remove_cv_t<TFunctor>::operator())> {};

} // namespace detail

template <typename TCallable>
using signature_of_t = typename detail::callable_traits<TCallable>::signature;

/**
 * @brief Reference to a free function bound at compile time
 */
template <auto Function>
constexpr auto make_delegate() noexcept {
    using delegate_type = etl::delegate<signature_of_t<decltype(Function)>>;
    return delegate_type::template create<Function>();
}

/**
 * @brief Reference to a member function bound to an instance
 * @note The instance must outlive the returned delegate
 */
template <auto Method, typename TObject>
constexpr auto make_delegate(TObject& instance) noexcept {
    using traits = detail::callable_traits<decltype(Method)>;
    using delegate_type = etl::delegate<typename traits::signature>;
    return delegate_type::template create<typename traits::object_type, Method>(instance);
}

/**
 * @brief Reference to a functor or lambda object
 * @note Non-owning: the functor must outlive the returned delegate
 */
template <typename TFunctor,
          typename = etl::enable_if_t<etl::is_class<TFunctor>::value>>
constexpr auto make_delegate(TFunctor& functor) noexcept {
    using delegate_type = etl::delegate<typename detail::functor_traits<TFunctor>::signature>;
    return delegate_type::create(functor);
}

// A temporary would dangle as soon as the full expression ends
template <typename TFunctor,
          typename = etl::enable_if_t<etl::is_class<etl::remove_reference_t<TFunctor>>::value &&
                                      !etl::is_lvalue_reference<TFunctor>::value>>
auto make_delegate(TFunctor&& functor) noexcept = delete;

} // namespace emDelegate

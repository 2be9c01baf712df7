#pragma once

// Ready-made delegate shapes, so most code never has to declare its own
// signature type:
//   action<A...>     void(A...)
//   func<A..., R>    R(A...)    (the last argument is the return type)
//   predicate<T>     bool(T)

#include "multicast_delegate.hpp"

namespace emDelegate {

namespace detail {

// Moves template arguments into the parameter list until one is left,
// which becomes the return type
template <typename TSignature, typename... TRest>
struct func_signature_builder;

template <typename... TParams, typename TReturn>
struct func_signature_builder<void(TParams...), TReturn> {
    using type = TReturn(TParams...);
};

template <typename... TParams, typename THead, typename TNext, typename... TTail>
struct func_signature_builder<void(TParams...), THead, TNext, TTail...>
    : func_signature_builder<void(TParams..., THead), TNext, TTail...> {};

} // namespace detail

template <typename... TArgsThenReturn>
struct func_signature {
    static_assert(sizeof...(TArgsThenReturn) >= 1, "func needs at least a return type");
    using type = typename detail::func_signature_builder<void(), TArgsThenReturn...>::type;
};

template <typename... TArgsThenReturn>
using func_signature_t = typename func_signature<TArgsThenReturn...>::type;

template <typename... TParams>
using action = multicast_delegate<void(TParams...)>;

template <typename... TArgsThenReturn>
using func = multicast_delegate<func_signature_t<TArgsThenReturn...>>;

template <typename T>
using predicate = multicast_delegate<bool(T)>;

} // namespace emDelegate

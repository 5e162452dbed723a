#pragma once

#include <fold-core/fwd.hh>
#include <fold-core/macros.hh>

#include <type_traits>
#include <utility>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Comparison:
//   max(a, b)                   - returns the larger of two values, b on ties (requires operator<)
//   min(a, b)                   - returns the smaller of two values, a on ties (requires operator<)
//
// Invocation:
//   invoke(f, args...)                          - call f, including member (function) pointers
//   is_invocable<F, Args...>                    - true iff invoke(f, args...) is well-formed
//   is_invocable_r<R, F, Args...>               - ... and the result converts to R (or R is void)
//   invoke_result_t<F, Args...>                 - result type of invoke(f, args...)
//   regular_invoke(f, args...)                  - like invoke, but void results become fc::unit
//   invoke_with_optional_idx(idx, f, args...)   - passes idx as first argument if f accepts it
//   regular_invoke_with_optional_idx(...)       - both of the above
//
// Callable utilities:
//   identify_function                - callable that returns its argument (identity function)
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//
// Ranges:
//   begin(c) / end(c)                - member begin/end or C array bounds
//


namespace fc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto s = fc::make_sequence(values);
///   auto n = fc::move(s).count(); // sequences are consumed by their reductions
template <class T>
[[nodiscard]] FC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] FC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] FC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
/// sequence::max / max_by_key follow the same rule: the last of several equal elements wins
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
/// sequence::min / min_by_key follow the same rule: the first of several equal elements wins
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
/// Usage:
///   static_assert(fc::always_false_t<T>, "T is not supported");
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   fc::function_ptr<int(float, double)>          -> int (*)(float, double)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Invocation
// =========================================================================================================

/// The "regular void": what a void-returning callable returns when invoked via regular_invoke
/// Also the payload of a control_flow that continues without carrying a value
struct unit
{
    [[nodiscard]] friend constexpr bool operator==(unit, unit) = default;
};

namespace impl
{
// member function pointer on an object (or derived object)
template <class M, class C, class Obj, class... Args>
    requires(std::is_function_v<M> && std::is_base_of_v<C, std::remove_cvref_t<Obj>>)
constexpr auto invoke_member(M C::* pm, Obj&& obj, Args&&... args)
    -> decltype((static_cast<Obj&&>(obj).*pm)(static_cast<Args&&>(args)...))
{
    return (static_cast<Obj&&>(obj).*pm)(static_cast<Args&&>(args)...);
}

// member function pointer on a pointer or pointer-like object
template <class M, class C, class Obj, class... Args>
    requires(std::is_function_v<M> && !std::is_base_of_v<C, std::remove_cvref_t<Obj>>)
constexpr auto invoke_member(M C::* pm, Obj&& obj, Args&&... args)
    -> decltype(((*static_cast<Obj&&>(obj)).*pm)(static_cast<Args&&>(args)...))
{
    return ((*static_cast<Obj&&>(obj)).*pm)(static_cast<Args&&>(args)...);
}

// member object pointer on an object, yields a reference with the object's value category
template <class M, class C, class Obj>
    requires(!std::is_function_v<M> && std::is_base_of_v<C, std::remove_cvref_t<Obj>>)
constexpr auto invoke_member(M C::* pm, Obj&& obj) -> decltype((static_cast<Obj&&>(obj).*pm))
{
    return static_cast<Obj&&>(obj).*pm;
}

// member object pointer on a pointer or pointer-like object
template <class M, class C, class Obj>
    requires(!std::is_function_v<M> && !std::is_base_of_v<C, std::remove_cvref_t<Obj>>)
constexpr auto invoke_member(M C::* pm, Obj&& obj) -> decltype(((*static_cast<Obj&&>(obj)).*pm))
{
    return (*static_cast<Obj&&>(obj)).*pm;
}

template <class F, class... Args>
concept invocable_with = (std::is_member_pointer_v<std::remove_cvref_t<F>>
                          && requires(F&& f, Args&&... args) {
                                 impl::invoke_member(static_cast<F&&>(f), static_cast<Args&&>(args)...);
                             })
                      || (!std::is_member_pointer_v<std::remove_cvref_t<F>>
                          && requires(F&& f, Args&&... args) { static_cast<F&&>(f)(static_cast<Args&&>(args)...); });
} // namespace impl

/// Calls f with args, uniformly for callables, member function pointers and member object pointers
/// Returns exactly what the call returns (decltype(auto)), including references
/// Usage:
///   fc::invoke(f, 1, 2);            // f(1, 2)
///   fc::invoke(&S::method, s, 1);   // s.method(1)
///   fc::invoke(&S::field, ptr);     // ptr->field
template <class F, class... Args>
    requires impl::invocable_with<F, Args...>
FC_FORCE_INLINE constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    if constexpr (std::is_member_pointer_v<std::remove_cvref_t<F>>)
        return impl::invoke_member(f, forward<Args>(args)...);
    else
        return forward<F>(f)(forward<Args>(args)...);
}

/// true iff fc::invoke(F, Args...) is well-formed
template <class F, class... Args>
constexpr bool is_invocable = impl::invocable_with<F, Args...>;

/// Result type of fc::invoke(F, Args...)
template <class F, class... Args>
using invoke_result_t = decltype(fc::invoke(std::declval<F>(), std::declval<Args>()...));

namespace impl
{
template <class R, class F, class... Args>
consteval bool check_invocable_r()
{
    if constexpr (!is_invocable<F, Args...>)
        return false;
    else if constexpr (std::is_void_v<R>)
        return true;
    else
        return std::is_convertible_v<invoke_result_t<F, Args...>, R>;
}
} // namespace impl

/// true iff fc::invoke(F, Args...) is well-formed and its result converts to R
/// every result is accepted for R = void
template <class R, class F, class... Args>
constexpr bool is_invocable_r = impl::check_invocable_r<R, F, Args...>();

/// Same as invoke, but a void result is returned as fc::unit
/// This allows generic code to store "whatever f returned"
template <class F, class... Args>
FC_FORCE_INLINE constexpr decltype(auto) regular_invoke(F&& f, Args&&... args)
{
    if constexpr (std::is_void_v<invoke_result_t<F, Args...>>)
    {
        fc::invoke(forward<F>(f), forward<Args>(args)...);
        return unit{};
    }
    else
        return fc::invoke(forward<F>(f), forward<Args>(args)...);
}

/// Calls f(idx, args...) if f accepts a leading index, otherwise f(args...)
/// This is how sequence callbacks can opt into receiving the running element index:
///   seq.for_each([](auto& v) { ... });
///   seq.for_each([](fc::isize idx, auto& v) { ... });
template <class F, class... Args>
FC_FORCE_INLINE constexpr decltype(auto) invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (is_invocable<F&&, isize, Args&&...>)
        return fc::invoke(forward<F>(f), idx, forward<Args>(args)...);
    else
        return fc::invoke(forward<F>(f), forward<Args>(args)...);
}

/// invoke_with_optional_idx with void results mapped to fc::unit
template <class F, class... Args>
FC_FORCE_INLINE constexpr decltype(auto) regular_invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (is_invocable<F&&, isize, Args&&...>)
        return fc::regular_invoke(forward<F>(f), idx, forward<Args>(args)...);
    else
        return fc::regular_invoke(forward<F>(f), forward<Args>(args)...);
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Preserves value category (lvalue/rvalue) of the input
/// sequence::flatten is flat_map(identify_function{})
struct identify_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return forward<T>(arg);
    }
};

// =========================================================================================================
// Ranges
// =========================================================================================================

/// Begin iterator of a container (member begin()) or a C array
template <class C>
[[nodiscard]] constexpr auto begin(C& c) -> decltype(c.begin())
{
    return c.begin();
}
template <class T, std::size_t N>
[[nodiscard]] constexpr T* begin(T (&arr)[N]) noexcept
{
    return arr;
}

/// End iterator (or sentinel) of a container (member end()) or a C array
template <class C>
[[nodiscard]] constexpr auto end(C& c) -> decltype(c.end())
{
    return c.end();
}
template <class T, std::size_t N>
[[nodiscard]] constexpr T* end(T (&arr)[N]) noexcept
{
    return arr + N;
}

} // namespace fc

#pragma once

#include <fold-core/fwd.hh>
#include <fold-core/utility.hh>

#include <compare>
#include <type_traits>
#include <utility>

/// Aggregate of two values, the item type of sequence::enumerate: fc::pair<isize, T>
///
/// Either member may be an lvalue reference (enumerate over a borrowed container yields fc::pair<isize, T&>).
/// Comparisons always look at the values, for reference members that is the referenced object.
/// Structured bindings work through get<I> and the std::tuple_size / std::tuple_element specializations.
///
///   for_each([](auto&& p) {
///       auto&& [idx, value] = p;
///       ...
///   });
template <class T, class U>
struct fc::pair
{
    using first_t = T;
    using second_t = U;

    T first;
    U second;

    [[nodiscard]] friend constexpr bool operator==(pair const& a, pair const& b)
        requires requires(std::remove_reference_t<T> const& t, std::remove_reference_t<U> const& u) {
            bool(t == t);
            bool(u == u);
        }
    {
        return a.first == b.first && a.second == b.second;
    }

    // lexicographic: first, then second
    [[nodiscard]] friend constexpr auto operator<=>(pair const& a, pair const& b)
        requires std::three_way_comparable<std::remove_cvref_t<T>> && std::three_way_comparable<std::remove_cvref_t<U>>
    {
        using result_t = std::common_comparison_category_t<std::compare_three_way_result_t<std::remove_cvref_t<T>>,
                                                           std::compare_three_way_result_t<std::remove_cvref_t<U>>>;
        if (auto const c = a.first <=> b.first; c != 0)
            return result_t(c);
        return result_t(a.second <=> b.second);
    }

    // (p.first) instead of p.first: rvalue pairs yield rvalue members, reference members stay references
    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return (fc::forward<P>(p).first);
        else
            return (fc::forward<P>(p).second);
    }
};

template <class T, class U>
struct std::tuple_size<fc::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, fc::pair<T, U>>
{
    static_assert(I < 2, "fc::pair has two elements");
    using type = std::conditional_t<I == 0, T, U>;
};

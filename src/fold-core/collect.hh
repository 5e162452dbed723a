#pragma once

#include <fold-core/fwd.hh>
#include <fold-core/utility.hh>

#include <cstddef>
#include <expected>
#include <type_traits>

// =========================================================================================================
// collector - the materialization protocol (sequence -> container)
// =========================================================================================================
//
// sequence::to_container<C>() (and to_vector, collect, push_to) drive this protocol:
//
//   auto c = fc::collector<C>::create();
//   fc::collector<C>::reserve(c, n);           // only if the sequence knows its size
//   fc::collector<C>::accept(c, elem);         // once per element, in traversal order
//   return fc::collector<C>::finalize(fc::move(c));
//
// The default implementation covers standard-library-shaped containers:
//   push_back (vector, list, deque, string), then insert (set, map, unordered_*),
//   then emplace(first, second) for pair-like elements into maps.
// Elements are forwarded with their value category: owning sequences move, borrowed ones copy.
//
// Custom containers specialize fc::collector:
//
// Fallible collection: a sequence of std::expected<R, E> collects into std::expected<C, E>,
// holding either C or the first error. See sequence::try_collect.
//
//   template <>
//   struct fc::collector<my_bag>
//   {
//       static my_bag create() { return {}; }
//       static void reserve(my_bag&, fc::isize) {}
//       static void accept(my_bag& b, int v) { b.add(v); }
//       static my_bag finalize(my_bag&& b) { return fc::move(b); }
//   };
//
template <class ContainerT>
struct fc::collector
{
    static_assert(sizeof(ContainerT) > 0, "ContainerT must be complete (did you forget to include its header?)");

    [[nodiscard]] static ContainerT create() { return ContainerT(); }

    static void reserve(ContainerT& container, isize size)
    {
        if constexpr (requires { container.reserve(std::size_t(size)); })
            container.reserve(std::size_t(size));
    }

    template <class T>
    static void accept(ContainerT& container, T&& elem)
    {
        if constexpr (requires { container.push_back(fc::forward<T>(elem)); })
            container.push_back(fc::forward<T>(elem));
        else if constexpr (requires { container.insert(fc::forward<T>(elem)); })
            container.insert(fc::forward<T>(elem));
        else if constexpr (requires { container.emplace(fc::forward<T>(elem).first, fc::forward<T>(elem).second); })
            container.emplace(fc::forward<T>(elem).first, fc::forward<T>(elem).second);
        else
            static_assert(fc::always_false_t<T>, "cannot add element to ContainerT, specialize fc::collector<ContainerT>");
    }

    [[nodiscard]] static ContainerT finalize(ContainerT&& container) { return fc::move(container); }
};

namespace fc::impl
{
template <class T>
constexpr bool is_expected = false;
template <class T, class E>
constexpr bool is_expected<std::expected<T, E>> = true;
} // namespace fc::impl

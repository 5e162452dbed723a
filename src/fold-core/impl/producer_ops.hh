#pragma once

#include <fold-core/control_flow.hh>
#include <fold-core/fwd.hh>
#include <fold-core/optional.hh>
#include <fold-core/producer.hh>
#include <fold-core/utility.hh>

#include <type_traits>
#include <utility>

// Generic algorithms on top of try_for_each, and the dispatch to producer overrides.
//
// Dispatch order for count: known_size() -> count() && -> full traversal
// Dispatch order for the rest: override -> generic traversal
//
// Overrides are only a shortcut. They must produce exactly what the generic path produces,
// including which user closures run (adapters with closures never offer overrides).
// Both sequence<P> and the adapters themselves (e.g. take::nth, chain::last) call these.

namespace fc::impl
{
template <class P>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] isize producer_count(P&& p)
{
    if constexpr (has_known_size<P>)
        return p.known_size();
    else if constexpr (has_count_override<P>)
        return fc::move(p).count();
    else
    {
        isize cnt = 0;
        fc::move(p).try_for_each(
            [&](auto&&) -> fc::control_flow<unit>
            {
                ++cnt;
                return fc::continue_with();
            });
        return cnt;
    }
}

/// Element at index k (0-based), or empty, by walking the elements. Precondition: k >= 0
/// The step stops on element k, so nothing past it is ever produced
template <class P>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] producer_result_t<P> producer_nth_by_traversal(P&& p, isize k)
{
    using result_t = producer_result_t<P>;

    auto flow = fc::move(p).try_for_each(
        [&](auto&& elem) -> fc::control_flow<result_t>
        {
            if (k == 0)
                return fc::stop_with(result_t(fc::forward<decltype(elem)>(elem)));
            --k;
            return fc::continue_with();
        });

    if (flow.is_stop())
        return fc::move(flow).stop_value();
    return {};
}

/// Element at index k (0-based), or empty. Precondition: k >= 0
template <class P>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] producer_result_t<P> producer_nth(P&& p, isize k)
{
    if constexpr (has_nth_override<P>)
        return fc::move(p).nth(k);
    else
        return impl::producer_nth_by_traversal(fc::move(p), k);
}

template <class P>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] producer_result_t<P> producer_last(P&& p)
{
    if constexpr (has_last_override<P>)
        return fc::move(p).last();
    else
    {
        producer_result_t<P> last;
        fc::move(p).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                last.emplace(fc::forward<decltype(elem)>(elem));
                return fc::continue_with();
            });
        return last;
    }
}

/// Ties: the first element with the smallest key wins
template <class P, class KeyF>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] producer_result_t<P> producer_min_by_key(P&& p, KeyF&& key)
{
    if constexpr (has_min_by_key_override<P, KeyF>)
        return fc::move(p).min_by_key(key);
    else
    {
        using key_t = std::remove_cvref_t<invoke_result_t<KeyF&, producer_element_t<P> const&>>;

        producer_result_t<P> best;
        fc::optional<key_t> best_key;
        fc::move(p).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                key_t k = fc::invoke(key, std::as_const(elem));
                if (!best_key.has_value() || k < best_key.value())
                {
                    best_key.emplace(fc::move(k));
                    best.emplace(fc::forward<decltype(elem)>(elem));
                }
                return fc::continue_with();
            });
        return best;
    }
}

/// Ties: the last element with the largest key wins
template <class P, class KeyF>
    requires(!std::is_lvalue_reference_v<P>)
[[nodiscard]] producer_result_t<P> producer_max_by_key(P&& p, KeyF&& key)
{
    if constexpr (has_max_by_key_override<P, KeyF>)
        return fc::move(p).max_by_key(key);
    else
    {
        using key_t = std::remove_cvref_t<invoke_result_t<KeyF&, producer_element_t<P> const&>>;

        producer_result_t<P> best;
        fc::optional<key_t> best_key;
        fc::move(p).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                key_t k = fc::invoke(key, std::as_const(elem));
                if (!best_key.has_value() || !(k < best_key.value()))
                {
                    best_key.emplace(fc::move(k));
                    best.emplace(fc::forward<decltype(elem)>(elem));
                }
                return fc::continue_with();
            });
        return best;
    }
}

/// Converts the result of a wrapped producer into the result type of an adapter,
/// passing the value through item_t so that references and conversions match the generic path
template <class ItemT, class ResultT>
[[nodiscard]] fc::optional<stored_item_t<ItemT>> convert_result(ResultT&& r)
{
    if (!r.has_value())
        return {};
    return fc::optional<stored_item_t<ItemT>>(static_cast<ItemT>(fc::forward<ResultT>(r).value()));
}
} // namespace fc::impl

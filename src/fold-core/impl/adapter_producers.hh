#pragma once

#include <fold-core/assert.hh>
#include <fold-core/control_flow.hh>
#include <fold-core/fwd.hh>
#include <fold-core/impl/producer_ops.hh>
#include <fold-core/impl/source_producers.hh>
#include <fold-core/optional.hh>
#include <fold-core/pair.hh>
#include <fold-core/producer.hh>
#include <fold-core/utility.hh>

#include <limits>
#include <type_traits>
#include <utility>

// Adapters wrap exactly one producer (two for chain) plus zero or more closures, all by value.
// Each adapter is a producer itself: its try_for_each runs the wrapped try_for_each with a
// step function that does the adapter's work and then calls the downstream step.
// A stop from downstream is returned unchanged, so the wrapped producer stops as well.
//
// Adapters that invoke user closures (map, filter, filter_map, flat_map, inspect) offer no overrides:
// the closures must observe exactly the elements the generic path would give them.

namespace fc::impl
{
// =========================================================================================================
// map
// =========================================================================================================

template <class P, class F>
struct map_producer
{
    using item_t = invoke_result_t<F&, typename P::item_t>;
    static_assert(!std::is_void_v<item_t>, "map function must return a value (use for_each or inspect for side effects)");

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each([&](auto&& elem) -> flow_t
                                            { return fc::invoke(step, fc::invoke(fn, fc::forward<decltype(elem)>(elem))); });
    }

    P inner;
    F fn;
};

// =========================================================================================================
// filter
// =========================================================================================================

/// The predicate sees each element exactly once, as a const reference
template <class P, class PredF>
struct filter_producer
{
    using item_t = typename P::item_t;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each(
            [&](auto&& elem) -> flow_t
            {
                if (!fc::invoke(predicate, std::as_const(elem)))
                    return fc::continue_with();
                return fc::invoke(step, fc::forward<decltype(elem)>(elem));
            });
    }

    P inner;
    PredF predicate;
};

// =========================================================================================================
// filter_map
// =========================================================================================================

/// fn returns an fc::optional, present values are passed on (moved out of the optional)
template <class P, class F>
struct filter_map_producer
{
    using option_t = std::remove_cvref_t<invoke_result_t<F&, typename P::item_t>>;
    static_assert(is_optional<option_t>, "filter_map function must return an fc::optional");

    using item_t = decltype(std::declval<option_t&&>().value());

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each(
            [&](auto&& elem) -> flow_t
            {
                option_t option = fc::invoke(fn, fc::forward<decltype(elem)>(elem));
                if (!option.has_value())
                    return fc::continue_with();
                return fc::invoke(step, fc::move(option).value());
            });
    }

    P inner;
    F fn;
};

// =========================================================================================================
// flat_map
// =========================================================================================================

/// fn maps each element to a source (anything fc::to_producer accepts),
/// which is then traversed with the same downstream step
/// A stop inside any inner traversal ends the outer traversal as well.
/// NOTE: if fn returns a reference into its argument, the argument must be a borrowed (lvalue) element
template <class P, class F>
struct flat_map_producer
{
    using inner_source_t = invoke_result_t<F&, typename P::item_t>;
    using inner_producer_t = producer_of_t<inner_source_t>;
    using item_t = typename inner_producer_t::item_t;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each(
            [&](auto&& elem) -> flow_t
            { return fc::to_producer(fc::invoke(fn, fc::forward<decltype(elem)>(elem))).try_for_each(step); });
    }

    P inner;
    F fn;
};

// =========================================================================================================
// take
// =========================================================================================================

/// Passes on the first n elements
/// The traversal stops right after the n-th element: element n is never produced by the wrapped producer.
template <class P>
struct take_producer
{
    using item_t = typename P::item_t;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;

        // take(0) must not even start the wrapped traversal
        if (count <= 0)
            return fc::continue_with();

        // the wrapped traversal is stopped with either the downstream result (stop or not)
        // once the downstream step stopped or the n-th element was passed on
        isize remaining = count;
        auto flow = fc::move(inner).try_for_each(
            [&](auto&& elem) -> fc::control_flow<flow_t>
            {
                --remaining;
                flow_t result = fc::invoke(step, fc::forward<decltype(elem)>(elem));
                if (result.is_stop() || remaining == 0)
                    return fc::stop_with(fc::move(result));
                return fc::continue_with();
            });

        if (flow.is_stop())
            return fc::move(flow).stop_value();
        return fc::continue_with();
    }

    [[nodiscard]] isize known_size() const
        requires has_known_size<P>
    {
        return fc::min(inner.known_size(), count);
    }

    [[nodiscard]] producer_result_t<P> nth(isize k) &&
    {
        if (k < count)
            return impl::producer_nth(fc::move(inner), k);

        // the generic path pulls all n elements before running dry
        if (count > 0)
            (void)impl::producer_nth(fc::move(inner), count - 1);
        return {};
    }

    [[nodiscard]] producer_result_t<P> last() &&
        requires has_known_size<P>
    {
        auto const size = known_size();
        if (size == 0)
            return {};
        return impl::producer_nth(fc::move(inner), size - 1);
    }

    P inner;
    isize count;
};

// =========================================================================================================
// skip
// =========================================================================================================

/// Discards the first n elements and passes on the rest
template <class P>
struct skip_producer
{
    using item_t = typename P::item_t;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;

        isize remaining = count;
        return fc::move(inner).try_for_each(
            [&](auto&& elem) -> flow_t
            {
                if (remaining > 0)
                {
                    --remaining;
                    return fc::continue_with();
                }
                return fc::invoke(step, fc::forward<decltype(elem)>(elem));
            });
    }

    [[nodiscard]] isize known_size() const
        requires has_known_size<P>
    {
        return fc::max(inner.known_size() - count, isize(0));
    }

    [[nodiscard]] producer_result_t<P> nth(isize k) &&
    {
        // count + k does not fit into isize: walk the elements like the generic path does
        if (k > std::numeric_limits<isize>::max() - count)
            return impl::producer_nth_by_traversal(fc::move(*this), k);
        return impl::producer_nth(fc::move(inner), count + k);
    }

    [[nodiscard]] producer_result_t<P> last() &&
        requires has_known_size<P>
    {
        if (known_size() == 0)
            return {};
        return impl::producer_last(fc::move(inner));
    }

    P inner;
    isize count;
};

// =========================================================================================================
// enumerate
// =========================================================================================================

/// Pairs each element with its running 0-based index: fc::pair<isize, stored_item_t<item>>
template <class P>
struct enumerate_producer
{
    using value_t = stored_item_t<typename P::item_t>;
    using item_t = fc::pair<isize, value_t>;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;

        isize idx = 0;
        return fc::move(inner).try_for_each([&](auto&& elem) -> flow_t
                                            { return fc::invoke(step, item_t{idx++, fc::forward<decltype(elem)>(elem)}); });
    }

    [[nodiscard]] isize known_size() const
        requires has_known_size<P>
    {
        return inner.known_size();
    }

    [[nodiscard]] isize count() && { return impl::producer_count(fc::move(inner)); }

    [[nodiscard]] fc::optional<item_t> nth(isize k) &&
    {
        auto value = impl::producer_nth(fc::move(inner), k);
        if (!value.has_value())
            return {};
        return fc::optional<item_t>(item_t{k, fc::move(value).value()});
    }

    P inner;
};

// =========================================================================================================
// inspect
// =========================================================================================================

/// Calls fn with a const reference to each element before passing it on unchanged
template <class P, class F>
struct inspect_producer
{
    using item_t = typename P::item_t;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each(
            [&](auto&& elem) -> flow_t
            {
                fc::invoke(fn, std::as_const(elem));
                return fc::invoke(step, fc::forward<decltype(elem)>(elem));
            });
    }

    P inner;
    F fn;
};

// =========================================================================================================
// chain
// =========================================================================================================

template <class ItemA, class ItemB>
using chain_item_t = std::conditional_t<std::is_lvalue_reference_v<ItemA> && std::is_lvalue_reference_v<ItemB>,
                                        std::common_reference_t<ItemA, ItemB>,
                                        std::common_type_t<std::remove_cvref_t<ItemA>, std::remove_cvref_t<ItemB>>>;

/// All elements of first, then all elements of second
/// Items are references only if both sides produce lvalue references, otherwise values of the common type.
/// second is not touched if the traversal stops inside first.
template <class P1, class P2>
struct chain_producer
{
    using item_t = chain_item_t<typename P1::item_t, typename P2::item_t>;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;

        auto chained_step = [&](auto&& elem) -> flow_t
        { return fc::invoke(step, static_cast<item_t>(fc::forward<decltype(elem)>(elem))); };

        flow_t flow = fc::move(first).try_for_each(chained_step);
        if (flow.is_stop())
            return flow;
        return fc::move(second).try_for_each(chained_step);
    }

    [[nodiscard]] isize known_size() const
        requires(has_known_size<P1> && has_known_size<P2>)
    {
        return first.known_size() + second.known_size();
    }

    [[nodiscard]] isize count() &&
    {
        auto const first_count = impl::producer_count(fc::move(first));
        return first_count + impl::producer_count(fc::move(second));
    }

    [[nodiscard]] fc::optional<stored_item_t<item_t>> nth(isize k) &&
        requires has_known_size<P1>
    {
        auto const first_size = first.known_size();
        if (k < first_size)
            return impl::convert_result<item_t>(impl::producer_nth(fc::move(first), k));
        return impl::convert_result<item_t>(impl::producer_nth(fc::move(second), k - first_size));
    }

    // both sides are traversed completely, exactly like the generic path
    [[nodiscard]] fc::optional<stored_item_t<item_t>> last() &&
    {
        auto first_last = impl::producer_last(fc::move(first));
        auto second_last = impl::producer_last(fc::move(second));
        if (second_last.has_value())
            return impl::convert_result<item_t>(fc::move(second_last));
        return impl::convert_result<item_t>(fc::move(first_last));
    }

    P1 first;
    P2 second;
};

// =========================================================================================================
// copied
// =========================================================================================================

/// Passes on owned copies of the elements (moves if the wrapped items are rvalues)
template <class P>
struct copied_producer
{
    using item_t = std::remove_cvref_t<typename P::item_t>;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;
        return fc::move(inner).try_for_each([&](auto&& elem) -> flow_t
                                            { return fc::invoke(step, item_t(fc::forward<decltype(elem)>(elem))); });
    }

    [[nodiscard]] isize known_size() const
        requires has_known_size<P>
    {
        return inner.known_size();
    }

    [[nodiscard]] isize count() && { return impl::producer_count(fc::move(inner)); }

    [[nodiscard]] fc::optional<item_t> nth(isize k) &&
    {
        return impl::convert_result<item_t>(impl::producer_nth(fc::move(inner), k));
    }

    [[nodiscard]] fc::optional<item_t> last() && { return impl::convert_result<item_t>(impl::producer_last(fc::move(inner))); }

    P inner;
};
} // namespace fc::impl

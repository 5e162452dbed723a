#pragma once

#include <fold-core/assert.hh>
#include <fold-core/assertf.hh>
#include <fold-core/collect.hh>
#include <fold-core/control_flow.hh>
#include <fold-core/fwd.hh>
#include <fold-core/impl/adapter_producers.hh>
#include <fold-core/impl/producer_ops.hh>
#include <fold-core/impl/source_producers.hh>
#include <fold-core/optional.hh>
#include <fold-core/producer.hh>
#include <fold-core/utility.hh>

#include <array>
#include <expected>
#include <type_traits>
#include <vector>

// -----------------------------------------------------------------------------
// fc::sequence reduction & lifetime model - condensed design summary
// -----------------------------------------------------------------------------

// 1) Internal iteration is the only iteration model.
//    A producer owns the loop and pushes elements into a step function.
//    There is no cursor, no begin/end on sequences, and therefore no zip.

// 2) The single primitive is try_for_each(step) -> control_flow<B>.
//    step returns stop(B) to end the traversal early, continue() otherwise.
//    See <fold-core/producer.hh> and <fold-core/control_flow.hh>.

// 3) All reductions (count/nth/find/min/max/fold/...) are implemented on that primitive.
//    Accumulators live in the step closure; only try_fold threads them through control_flow.

// 4) count/nth/last/min_by_key/max_by_key dispatch to producer overrides when available.
//    Overrides are observably identical: adapters with user closures never offer them.

// 5) Every transformation adds a single template layer (an adapter producer).
//    Closures are stored by value, nothing is type-erased or heap-allocated.

// 6) Sequences are consumed by every operation (all members are &&-qualified).
//    Use fc::move(seq) for named sequences. Re-traversal means creating a new sequence.

// 7) Callbacks may take the running index as optional first parameter:
//      seq.for_each([](auto& v) { ... });
//      seq.for_each([](fc::isize idx, auto& v) { ... });
//    (for_each, count_if, any, all, position, find, find_ptr, accumulate, to_container(map))

// 8) Single-element results are fc::optional<stored_item_t>:
//    - borrowed sequences (over lvalue containers) return optional<T&>
//    - everything else returns optional<T> (owning sequences move the element out)

// 9) Sharp edges are explicit and documented:
//    - borrowed sequences must not outlive their container (or its iterator validity)
//    - infinite sequences (unbounded iota, generators) hang in full traversals (count, last, min, ...)
//    - functions returning references into rvalue elements dangle (map, flat_map)

// a lazy, single-pass, push-based sequence
// with powerful functional compositions
// and predictable performance
// all ops are either
//   transformative / sub sequence (map, filter, take, flat_map, ...)
//   into-container-like (to_vector, to_container, push_to, try_collect, ...)
//   statistical (count, min, max, sum, find, ...)
// these sequences _can_ be infinite!
//
// important design decisions:
// - each transformation must only add a single template "layer"
// - sequence is the rich-api layer on top of a simple underlying producer
// - the compiler must easily be able to desugar everything and turn it into basically-optimal assembly
//
// for authors:
// - ProducerT must be a value type, borrowing happens inside the producer (e.g. range_producer<T&>)
template <class ProducerT>
struct fc::sequence
{
    static_assert(fc::producer<ProducerT>, "ProducerT must be a move-constructible type with an item_t");

private:
    // the underlying producer we consume
    ProducerT _producer;

    //
    // traits & typedefs
    //
public:
    using producer_t = ProducerT;

    // exact type handed to step functions
    // e.g. borrowed "vector<int>"  -> int&
    //      owned "vector<int>"     -> int&&
    //      iota                    -> isize
    using item_t = typename ProducerT::item_t;

    // value type for the elements
    using element_t = std::remove_cvref_t<item_t>;

    // fc::optional<int&> for borrowed elements, fc::optional<int> otherwise
    using result_t = fc::optional<fc::stored_item_t<item_t>>;

    // pointer to the element
    // NOTE: preserves constness
    using element_ptr_t = std::add_pointer_t<std::remove_reference_t<item_t>>;

    // true iff elements live in storage that outlives the traversal
    // (pointers and references to them may be kept)
    static constexpr bool has_stable_elements = std::is_lvalue_reference_v<item_t>;

    // true iff count() does not need to traverse
    static constexpr bool has_known_size = impl::has_known_size<ProducerT>;

    //
    // reductions
    // (structure-consuming, value-producing)
    //
public:
    [[nodiscard]] isize count() && { return impl::producer_count(fc::move(_producer)); }

    [[nodiscard]] isize count_if(auto&& predicate) &&
    {
        return fc::move(*this).accumulate( //
            isize(0),
            [&predicate](isize idx, isize& cnt, auto& elem)
            {
                if (fc::regular_invoke_with_optional_idx(idx, predicate, elem))
                    ++cnt;
            });
    }

    [[nodiscard]] bool any(auto&& predicate) &&
    {
        // stopped => we found one with "true", so any is true
        return fc::move(*this).visit_until([&](isize idx, auto&& elem)
                                           { return bool(fc::regular_invoke_with_optional_idx(idx, predicate, elem)); });
    }

    [[nodiscard]] bool all(auto&& predicate) &&
    {
        // stopped => we found one with "false", so all is false
        return !fc::move(*this).visit_until([&](isize idx, auto&& elem)
                                            { return !bool(fc::regular_invoke_with_optional_idx(idx, predicate, elem)); });
    }

    [[nodiscard]] bool none(auto&& predicate) && { return !fc::move(*this).any(predicate); }

    // index of the first element matching the predicate
    [[nodiscard]] fc::optional<isize> position(auto&& predicate) &&
    {
        fc::optional<isize> result;
        fc::move(*this).visit_until(
            [&](isize idx, auto&& elem)
            {
                if (!fc::regular_invoke_with_optional_idx(idx, predicate, elem))
                    return false;

                result = idx;
                return true; // stop
            });
        return result;
    }

    // first element matching the predicate
    [[nodiscard]] result_t find(auto&& predicate) &&
    {
        result_t result;
        fc::move(*this).visit_until(
            [&](isize idx, auto&& elem)
            {
                if (!fc::regular_invoke_with_optional_idx(idx, predicate, elem))
                    return false;

                result.emplace(fc::forward<decltype(elem)>(elem));
                return true; // stop
            });
        return result;
    }

    // pointer to the first element matching the predicate, nullptr if none
    [[nodiscard]] element_ptr_t find_ptr(auto&& predicate) &&
    {
        static_assert(sequence::has_stable_elements, ".find_ptr is only valid if we have stable elements");

        element_ptr_t result = nullptr;
        fc::move(*this).visit_until(
            [&](isize idx, auto&& elem)
            {
                if (!fc::regular_invoke_with_optional_idx(idx, predicate, elem))
                    return false;

                result = &elem;
                return true; // stop
            });
        return result;
    }

    // first present result of fn : elem -> fc::optional<U>
    template <class F>
    [[nodiscard]] auto find_map(F&& fn) &&
    {
        using option_t = std::remove_cvref_t<fc::invoke_result_t<F&, item_t>>;
        static_assert(impl::is_optional<option_t>, "find_map function must return an fc::optional");

        auto flow = fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<option_t>
            {
                option_t option = fc::invoke(fn, fc::forward<decltype(elem)>(elem));
                if (option.has_value())
                    return fc::stop_with(fc::move(option));
                return fc::continue_with();
            });

        if (flow.is_stop())
            return fc::move(flow).stop_value();
        return option_t();
    }

    [[nodiscard]] result_t first() && { return impl::producer_nth(fc::move(_producer), 0); }

    // k-th element (0-based)
    // never passes an element after the k-th to any function in the chain
    [[nodiscard]] result_t nth(isize k) &&
    {
        FC_ASSERTF(k >= 0, "nth index must be non-negative, got {}", k);
        return impl::producer_nth(fc::move(_producer), k);
    }

    [[nodiscard]] result_t last() && { return impl::producer_last(fc::move(_producer)); }

    // element with the smallest key(elem), the first one on ties
    template <class KeyF>
    [[nodiscard]] result_t min_by_key(KeyF&& key) &&
    {
        return impl::producer_min_by_key(fc::move(_producer), key);
    }

    // element with the largest key(elem), the last one on ties
    template <class KeyF>
    [[nodiscard]] result_t max_by_key(KeyF&& key) &&
    {
        return impl::producer_max_by_key(fc::move(_producer), key);
    }

    [[nodiscard]] result_t min() && { return fc::move(*this).min_by_key(fc::identify_function{}); }
    [[nodiscard]] result_t max() && { return fc::move(*this).max_by_key(fc::identify_function{}); }

    // smallest element according to less(a, b), the first one on ties
    [[nodiscard]] result_t min_by(auto&& less) &&
    {
        return fc::move(*this).extremum_by([&](auto const& elem, auto const& best) { return bool(less(elem, best)); });
    }

    // largest element according to less(a, b), the last one on ties
    [[nodiscard]] result_t max_by(auto&& less) &&
    {
        return fc::move(*this).extremum_by([&](auto const& elem, auto const& best) { return !bool(less(elem, best)); });
    }

    // element_t{} + e0 + e1 + ...
    [[nodiscard]] element_t sum() &&
    {
        return fc::move(*this).accumulate(element_t{}, [](element_t& acc, auto const& elem) { acc += elem; });
    }

    // f : (acc, elem) -> acc
    template <class AccT>
    [[nodiscard]] AccT fold(AccT init, auto&& f) &&
    {
        fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                init = fc::invoke(f, fc::move(init), fc::forward<decltype(elem)>(elem));
                return fc::continue_with();
            });
        return init;
    }

    // apply : (idx?, accum&, elem&)
    template <class AccT>
    [[nodiscard]] AccT accumulate(AccT init, auto&& apply) &&
    {
        fc::move(*this).for_each([&](isize idx, auto&& elem) { fc::invoke_with_optional_idx(idx, apply, init, elem); });
        return init;
    }

    // f : (acc, elem) -> control_flow<B, Acc>
    // returns stop(B) as soon as f does, otherwise continue(final acc)
    template <class AccT, class StepF>
    [[nodiscard]] auto try_fold(AccT init, StepF&& f) &&
    {
        using flow_t = std::remove_cvref_t<fc::invoke_result_t<StepF&, AccT&&, item_t>>;
        static_assert(impl::is_control_flow<flow_t>, "try_fold function must return fc::control_flow<B, Acc>");
        static_assert(std::is_constructible_v<AccT, typename flow_t::continue_t&&>,
                      "continue value of the try_fold function must be the accumulator");
        using stop_t = typename flow_t::stop_t;

        auto flow = fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<stop_t>
            {
                flow_t r = fc::invoke(f, fc::move(init), fc::forward<decltype(elem)>(elem));
                if (r.is_stop())
                    return fc::stop_with(fc::move(r).stop_value());

                init = fc::move(r).continue_value();
                return fc::continue_with();
            });

        if (flow.is_stop())
            return flow_t(fc::stop_with(fc::move(flow).stop_value()));
        return flow_t(fc::continue_with(fc::move(init)));
    }

    // calls fun on each element (optional with index first)
    void for_each(auto&& fun) &&
    {
        isize idx = 0;
        fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                fc::invoke_with_optional_idx(idx++, fun, fc::forward<decltype(elem)>(elem));
                return fc::continue_with();
            });
    }

    //
    // transformations
    // (structure-preserving, lazy)
    //
public:
    // fn : elem -> U
    template <class F>
    [[nodiscard]] auto map(F&& fn) &&
    {
        using adapter_t = impl::map_producer<ProducerT, std::decay_t<F>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::forward<F>(fn)});
    }

    // predicate : elem const& -> bool
    template <class PredF>
    [[nodiscard]] auto filter(PredF&& predicate) &&
    {
        using adapter_t = impl::filter_producer<ProducerT, std::decay_t<PredF>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::forward<PredF>(predicate)});
    }

    // fn : elem -> fc::optional<U>
    template <class F>
    [[nodiscard]] auto filter_map(F&& fn) &&
    {
        using adapter_t = impl::filter_map_producer<ProducerT, std::decay_t<F>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::forward<F>(fn)});
    }

    // fn : elem -> container, sequence or producer
    template <class F>
    [[nodiscard]] auto flat_map(F&& fn) &&
    {
        using adapter_t = impl::flat_map_producer<ProducerT, std::decay_t<F>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::forward<F>(fn)});
    }

    // sequence of containers (or sequences) -> sequence of their elements
    [[nodiscard]] auto flatten() && { return fc::move(*this).flat_map(fc::identify_function{}); }

    // the first n elements (fewer if the sequence is shorter)
    [[nodiscard]] auto take(isize n) &&
    {
        FC_ASSERTF(n >= 0, "take count must be non-negative, got {}", n);
        using adapter_t = impl::take_producer<ProducerT>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), n});
    }

    // all but the first n elements
    [[nodiscard]] auto skip(isize n) &&
    {
        FC_ASSERTF(n >= 0, "skip count must be non-negative, got {}", n);
        using adapter_t = impl::skip_producer<ProducerT>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), n});
    }

    // fc::pair<isize, elem> with the running index
    [[nodiscard]] auto enumerate() &&
    {
        using adapter_t = impl::enumerate_producer<ProducerT>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer)});
    }

    // fn : elem const& -> void, called for each element that passes through
    template <class F>
    [[nodiscard]] auto inspect(F&& fn) &&
    {
        using adapter_t = impl::inspect_producer<ProducerT, std::decay_t<F>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::forward<F>(fn)});
    }

    // all elements of this, then all elements of other (container, sequence or producer)
    template <class SourceT>
    [[nodiscard]] auto chain(SourceT&& other) &&
    {
        using adapter_t = impl::chain_producer<ProducerT, fc::producer_of_t<SourceT>>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer), fc::to_producer(fc::forward<SourceT>(other))});
    }

    // owned copies of the elements
    [[nodiscard]] auto copied() &&
    {
        using adapter_t = impl::copied_producer<ProducerT>;
        return sequence<adapter_t>(adapter_t{fc::move(_producer)});
    }

    //
    // materialization
    // (structure-destroying, terminal)
    // see <fold-core/collect.hh>
    //
public:
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container() &&
    {
        using collector_t = fc::collector<ContainerT>;

        auto container = collector_t::create();
        if constexpr (has_known_size)
            collector_t::reserve(container, _producer.known_size());
        fc::move(*this).for_each([&]<class T>(T&& elem) { collector_t::accept(container, fc::forward<T>(elem)); });
        return collector_t::finalize(fc::move(container));
    }

    // map : (idx?, elem) -> value to add
    template <class ContainerT>
    [[nodiscard]] ContainerT to_container(auto&& map) &&
    {
        using collector_t = fc::collector<ContainerT>;

        auto container = collector_t::create();
        if constexpr (has_known_size)
            collector_t::reserve(container, _producer.known_size());
        fc::move(*this).for_each([&]<class T>(isize idx, T&& elem)
                                 { collector_t::accept(container, fc::invoke_with_optional_idx(idx, map, fc::forward<T>(elem))); });
        return collector_t::finalize(fc::move(container));
    }

    // same as to_container<ContainerT>()
    // collect<std::expected<C, E>>() is try_collect<C>()
    template <class ContainerT>
    [[nodiscard]] ContainerT collect() &&
    {
        if constexpr (impl::is_expected<ContainerT> && impl::is_expected<element_t>)
            return fc::move(*this).template try_collect<typename ContainerT::value_type>();
        else
            return fc::move(*this).template to_container<ContainerT>();
    }

    // sequence of std::expected<R, E> -> std::expected<ContainerT, E>
    // the first error ends the traversal, nothing after it is produced or collected
    template <class ContainerT>
    [[nodiscard]] auto try_collect() &&
    {
        static_assert(impl::is_expected<element_t>, "try_collect requires elements of type std::expected<R, E>");
        static_assert(!std::is_void_v<typename element_t::value_type>, "std::expected<void, E> elements have nothing to collect");

        using error_t = typename element_t::error_type;
        using result_t = std::expected<ContainerT, error_t>;
        using collector_t = fc::collector<ContainerT>;

        auto container = collector_t::create();
        if constexpr (has_known_size)
            collector_t::reserve(container, _producer.known_size());

        auto flow = fc::move(_producer).try_for_each(
            [&]<class T>(T&& elem) -> fc::control_flow<error_t>
            {
                if (!elem.has_value())
                    return fc::stop_with(fc::forward<T>(elem).error());
                collector_t::accept(container, *fc::forward<T>(elem));
                return fc::continue_with();
            });

        if (flow.is_stop())
            return result_t(std::unexpect, fc::move(flow).stop_value());
        return result_t(collector_t::finalize(fc::move(container)));
    }

    [[nodiscard]] std::vector<element_t> to_vector() && { return fc::move(*this).template to_container<std::vector<element_t>>(); }

    // appends all elements to an existing container
    template <class ContainerT>
    void push_to(ContainerT& container) &&
    {
        fc::move(*this).for_each([&]<class T>(T&& elem) { fc::collector<ContainerT>::accept(container, fc::forward<T>(elem)); });
    }

    //
    // operational basis
    // i.e. all functions are implemented in terms of this
    //
public:
    // the primitive: calls step(item) -> control_flow<B> until it returns stop
    // returns that stop result, or continue if all elements were visited
    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        return fc::move(_producer).try_for_each(step);
    }

private:
    // calls step(idx, elem) -> bool until it returns true
    // returns true iff it stopped
    bool visit_until(auto&& step) &&
    {
        isize idx = 0;
        auto flow = fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                if (step(idx++, fc::forward<decltype(elem)>(elem)))
                    return fc::stop_with(unit{});
                return fc::continue_with();
            });
        return flow.is_stop();
    }

    // replaces the current best if should_replace(elem, best)
    result_t extremum_by(auto&& should_replace) &&
    {
        result_t best;
        fc::move(_producer).try_for_each(
            [&](auto&& elem) -> fc::control_flow<unit>
            {
                if (!best.has_value() || should_replace(std::as_const(elem), std::as_const(best.value())))
                    best.emplace(fc::forward<decltype(elem)>(elem));
                return fc::continue_with();
            });
        return best;
    }

    //
    // ctors, fringe api
    //
public:
    explicit sequence(ProducerT producer) : _producer(fc::move(producer)) {}

    // move-only: a sequence is consumed exactly once
    sequence(sequence&&) = default;
    sequence(sequence const&) = delete;
    sequence& operator=(sequence&&) = default;
    sequence& operator=(sequence const&) = delete;
    ~sequence() = default;

    // the underlying producer, consumes the sequence
    [[nodiscard]] ProducerT extract_producer() && { return fc::move(_producer); }
};

//
// factories
//

namespace fc
{
// sequence over a container (borrowed if lvalue, owned if rvalue), a producer or another sequence
// e.g. fc::make_sequence(vec)                  -> items are int&
//      fc::make_sequence(fc::move(vec))        -> items are int&&
//      fc::make_sequence(my_tree.producer())   -> custom internal iteration
template <class SourceT>
[[nodiscard]] auto make_sequence(SourceT&& source)
{
    return sequence<producer_of_t<SourceT>>(fc::to_producer(fc::forward<SourceT>(source)));
}

// owning sequence over the given values (stored in a fixed-size array)
template <class T, class... Ts>
[[nodiscard]] auto make_sequence_of(T value, Ts... values)
{
    static_assert((std::is_same_v<T, Ts> && ...), "all values must have the same type");
    return fc::make_sequence(std::array<T, 1 + sizeof...(Ts)>{fc::move(value), fc::move(values)...});
}

// sequence with exactly one (owned) element
template <class T>
[[nodiscard]] auto make_sequence_from_element(T&& value)
{
    using producer_t = impl::single_producer<std::decay_t<T>>;
    return sequence<producer_t>(producer_t{fc::forward<T>(value)});
}

// start, start + 1, ... without end
// NOTE: infinite, only use with short-circuiting operations
template <class T>
[[nodiscard]] auto make_sequence_iota(T start)
{
    using producer_t = impl::iota_producer<T, false>;
    return sequence<producer_t>(producer_t{start, start});
}

// start, start + 1, ..., end - 1
template <class T>
[[nodiscard]] auto make_sequence_iota(T start, T end)
{
    using producer_t = impl::iota_producer<T, true>;
    return sequence<producer_t>(producer_t{start, end});
}

// elements yielded by a generator function
// generator : fc::function_ref<bool(T)> yield -> void
// yield returns true if the generator must stop
template <class T, class GenF>
[[nodiscard]] auto make_sequence_from_fn(GenF&& generator)
{
    using producer_t = impl::generator_producer<T, std::decay_t<GenF>>;
    return sequence<producer_t>(producer_t{fc::forward<GenF>(generator)});
}
} // namespace fc

#pragma once

#include <fold-core/control_flow.hh>
#include <fold-core/function_ref.hh>
#include <fold-core/fwd.hh>
#include <fold-core/optional.hh>
#include <fold-core/producer.hh>
#include <fold-core/utility.hh>

#include <cstdint>
#include <iterator>
#include <limits>
#include <type_traits>
#include <utility>

// Producers that originate elements (as opposed to adapters that wrap another producer)

namespace fc::impl
{
template <class RangeT>
concept iterable = requires(RangeT& r) {
    fc::begin(r);
    fc::end(r);
    fc::begin(r) != fc::end(r);
};

// =========================================================================================================
// range_producer
// =========================================================================================================

/// Produces the elements of anything with begin/end, in iteration order
///
/// RangeT can be a reference (this is encouraged):
///   range_producer<std::vector<int>&>        borrows the vector, items are int&
///   range_producer<std::vector<int> const&>  borrows the vector, items are int const&
///   range_producer<std::vector<int>>         owns the (moved-in) vector, items are int&&
///
/// Borrowed items can be stored past the traversal (find, nth, ... return optional<T&>).
/// Owned items are moved out of the container when they are stored.
template <class RangeT>
struct range_producer
{
    static_assert(!std::is_array_v<RangeT>, "C arrays can only be borrowed (pass an lvalue)");

    static constexpr bool is_owning = !std::is_lvalue_reference_v<RangeT>;

    using range_t = std::remove_reference_t<RangeT>;
    using iterator_t = decltype(fc::begin(std::declval<range_t&>()));
    using sentinel_t = decltype(fc::end(std::declval<range_t&>()));
    using deref_t = decltype(*std::declval<iterator_t&>());
    using item_t = std::conditional_t<is_owning && std::is_lvalue_reference_v<deref_t>, //
                                      std::remove_reference_t<deref_t>&&,
                                      deref_t>;

    static constexpr bool is_sized = requires(range_t const& r) { r.size(); }
                                  || requires(iterator_t it, sentinel_t end) { end - it; };
    static constexpr bool is_random_access = requires(iterator_t it, sentinel_t end, isize k) {
        it + k;
        end - it;
    };
    static constexpr bool is_bidirectional = std::is_same_v<iterator_t, sentinel_t> && requires(iterator_t it) { --it; };

    explicit range_producer(RangeT&& range) : _range(fc::forward<RangeT>(range)) {}

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        auto const end = fc::end(_range);
        for (auto it = fc::begin(_range); it != end; ++it)
        {
            auto flow = fc::invoke(step, static_cast<item_t>(*it));
            if (flow.is_stop())
                return flow;
        }
        return fc::continue_with();
    }

    [[nodiscard]] isize known_size() const
        requires is_sized
    {
        if constexpr (requires(range_t const& r) { r.size(); })
            return isize(_range.size());
        else
            return isize(fc::end(_range) - fc::begin(_range));
    }

    [[nodiscard]] fc::optional<stored_item_t<item_t>> nth(isize k) &&
        requires is_random_access
    {
        if (k < 0 || k >= isize(fc::end(_range) - fc::begin(_range)))
            return {};
        return fc::optional<stored_item_t<item_t>>(static_cast<item_t>(*(fc::begin(_range) + k)));
    }

    [[nodiscard]] fc::optional<stored_item_t<item_t>> last() &&
        requires is_bidirectional
    {
        auto it = fc::end(_range);
        if (it == fc::begin(_range))
            return {};
        --it;
        return fc::optional<stored_item_t<item_t>>(static_cast<item_t>(*it));
    }

    // min/max only remember the best iterator, the element itself is read (or moved) once at the end

    template <class KeyF>
    [[nodiscard]] fc::optional<stored_item_t<item_t>> min_by_key(KeyF&& key) &&
    {
        return extremum_by_key(key, [](auto const& k, auto const& best) { return k < best; });
    }

    template <class KeyF>
    [[nodiscard]] fc::optional<stored_item_t<item_t>> max_by_key(KeyF&& key) &&
    {
        return extremum_by_key(key, [](auto const& k, auto const& best) { return !(k < best); });
    }

private:
    template <class KeyF, class ReplaceF>
    fc::optional<stored_item_t<item_t>> extremum_by_key(KeyF& key, ReplaceF&& should_replace)
    {
        using element_t = std::remove_cvref_t<item_t>;
        using key_t = std::remove_cvref_t<invoke_result_t<KeyF&, element_t const&>>;

        auto it = fc::begin(_range);
        auto const end = fc::end(_range);
        if (!(it != end))
            return {};

        auto best_it = it;
        key_t best_key = fc::invoke(key, std::as_const(*it));
        for (++it; it != end; ++it)
        {
            key_t k = fc::invoke(key, std::as_const(*it));
            if (should_replace(k, best_key))
            {
                best_key = fc::move(k);
                best_it = it;
            }
        }
        return fc::optional<stored_item_t<item_t>>(static_cast<item_t>(*best_it));
    }

    RangeT _range;
};

// =========================================================================================================
// single_producer
// =========================================================================================================

/// Produces exactly one (owned) element
template <class T>
struct single_producer
{
    using item_t = T&&;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        return fc::invoke(step, fc::move(value));
    }

    [[nodiscard]] isize known_size() const { return 1; }

    [[nodiscard]] fc::optional<T> nth(isize k) &&
    {
        if (k != 0)
            return {};
        return fc::optional<T>(fc::move(value));
    }

    [[nodiscard]] fc::optional<T> last() && { return fc::optional<T>(fc::move(value)); }

    T value;
};

// =========================================================================================================
// iota_producer
// =========================================================================================================

/// Produces start, start + 1, ... up to (excluding) end if IsBounded, otherwise up to the largest value of T
/// Unbounded iotas are practically infinite: only combine them with short-circuiting operations (take, find, nth, ...)
/// known_size saturates at the largest isize for 64 bit ranges with more elements than that
template <class T, bool IsBounded>
struct iota_producer
{
    static_assert(std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>, "iota only supports integral types");

    using item_t = T;
    using unsigned_t = std::make_unsigned_t<T>;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        if constexpr (IsBounded)
        {
            for (T v = start; v < end; ++v)
            {
                auto flow = fc::invoke(step, T(v));
                if (flow.is_stop())
                    return flow;
            }
        }
        else
        {
            for (T v = start;; ++v)
            {
                auto flow = fc::invoke(step, T(v));
                if (flow.is_stop())
                    return flow;
                if (v == std::numeric_limits<T>::max())
                    break;
            }
        }
        return fc::continue_with();
    }

    [[nodiscard]] isize known_size() const
        requires IsBounded
    {
        if (!(start < end))
            return 0;
        // the distance always fits into the unsigned type, but not always into isize (64 bit ranges)
        auto const distance = unsigned_t(unsigned_t(end) - unsigned_t(start));
        if constexpr (sizeof(unsigned_t) >= sizeof(isize))
            if (distance > unsigned_t(std::numeric_limits<isize>::max()))
                return std::numeric_limits<isize>::max();
        return isize(distance);
    }

    [[nodiscard]] fc::optional<T> nth(isize k) &&
    {
        if (k < 0)
            return {};
        if constexpr (IsBounded)
        {
            if (k >= known_size())
                return {};
        }
        else
        {
            // past the largest value of T
            if (std::uint64_t(k) > std::uint64_t(unsigned_t(unsigned_t(std::numeric_limits<T>::max()) - unsigned_t(start))))
                return {};
        }
        return fc::optional<T>(T(unsigned_t(unsigned_t(start) + unsigned_t(k))));
    }

    [[nodiscard]] fc::optional<T> last() &&
        requires IsBounded
    {
        if (known_size() == 0)
            return {};
        return fc::optional<T>(T(end - 1));
    }

    T start;
    T end;
};

// =========================================================================================================
// generator_producer
// =========================================================================================================

/// Produces whatever the generator function yields
///
/// The generator is called once with a yield callback: fc::function_ref<bool(T)>.
/// yield(v) passes v downstream and returns true if the traversal was stopped.
/// The generator should return once yield returned true; further yields are ignored
/// and never reach the step function.
template <class T, class GenF>
struct generator_producer
{
    using item_t = T;

    template <class StepF>
    auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
    {
        using flow_t = fc::step_flow_t<StepF, item_t>;

        fc::optional<flow_t> stopped;
        auto yield = [&](T value) -> bool
        {
            if (stopped.has_value())
                return true;

            flow_t flow = fc::invoke(step, fc::move(value));
            if (flow.is_stop())
            {
                stopped.emplace(fc::move(flow));
                return true;
            }
            return false;
        };

        fc::invoke(generator, fc::function_ref<bool(T)>(yield));

        if (stopped.has_value())
            return fc::move(stopped).value();
        return fc::continue_with();
    }

    GenF generator;
};
} // namespace fc::impl

// =========================================================================================================
// Bridging
// =========================================================================================================

namespace fc
{
/// Turns a "source" into a producer:
///   - a sequence rvalue yields its underlying producer
///   - a producer rvalue yields itself
///   - a range lvalue is borrowed (items are lvalue references into it)
///   - a range rvalue is moved into the producer (items are rvalue references, the container is consumed)
/// This is what fc::make_sequence and flat_map use for their arguments.
template <class SourceT>
[[nodiscard]] auto to_producer(SourceT&& source)
{
    using source_t = std::remove_cvref_t<SourceT>;

    if constexpr (impl::is_sequence<source_t>)
    {
        static_assert(!std::is_lvalue_reference_v<SourceT>, "sequences are consumed, use fc::move(seq)");
        return fc::move(source).extract_producer();
    }
    else if constexpr (impl::iterable<std::remove_reference_t<SourceT>>)
    {
        return impl::range_producer<SourceT>(fc::forward<SourceT>(source));
    }
    else if constexpr (fc::producer<source_t>)
    {
        static_assert(!std::is_lvalue_reference_v<SourceT>, "producers are consumed, use fc::move(producer)");
        return source_t(fc::move(source));
    }
    else
        static_assert(fc::always_false_t<SourceT>, "source must be a sequence, a producer or have begin()/end()");
}

/// Producer type created by fc::to_producer for the given source type
template <class SourceT>
using producer_of_t = decltype(fc::to_producer(std::declval<SourceT>()));
} // namespace fc

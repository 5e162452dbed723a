#pragma once

#include <fold-core/control_flow.hh>
#include <fold-core/fwd.hh>
#include <fold-core/optional.hh>
#include <fold-core/utility.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Producers - the primitive traversal contract
// =========================================================================================================
//
// A producer is any move-constructible type P with
//
//   using item_t = ...;  // exact type handed to the step function
//                        // (T& into storage that outlives the traversal, T&& or a prvalue)
//
//   template <class StepF>
//   auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>;
//
// try_for_each calls step(item) in order and returns the first stop result immediately,
// without producing (or pulling from a wrapped producer) any further element.
// If all elements were visited, it returns continue.
// The && qualifier makes traversal a consuming operation: a producer is traversed at most once.
//
// Everything else (count, nth, min_by_key, ...) is derived from this single primitive.
// Producers can additionally offer the following capabilities, detected via requires:
//
//   isize known_size() const   - exact element count without running any traversal
//                                (only offered by producers without user closures)
//   count() &&                 - }
//   nth(isize k) &&            - }  overrides that are observably identical to
//   last() &&                  - }  the generic algorithm (see <fold-core/impl/producer_ops.hh>)
//   min_by_key(key) &&         - }
//   max_by_key(key) &&         - }
//
// Producers are rarely used directly. fc::sequence<P> is the rich API on top of them.
//
// Example of a hand-written producer:
//
//   struct countdown
//   {
//       using item_t = int;
//       int from;
//
//       template <class StepF>
//       auto try_for_each(StepF&& step) && -> fc::step_flow_t<StepF, item_t>
//       {
//           for (auto i = from; i > 0; --i)
//               if (auto flow = fc::invoke(step, i); flow.is_stop())
//                   return flow;
//           return fc::continue_with();
//       }
//   };
//
//   auto n = fc::make_sequence(countdown{10}).filter(is_even).count();
//

namespace fc
{
/// Type used to store an item beyond its step call:
/// lvalue references stay references (the storage outlives the traversal), everything else decays to a value
template <class T>
using stored_item_t = std::conditional_t<std::is_lvalue_reference_v<T>, T, std::remove_cvref_t<T>>;

namespace impl
{
template <class T>
constexpr bool is_control_flow = false;
template <class B, class C>
constexpr bool is_control_flow<control_flow<B, C>> = true;

template <class T>
constexpr bool is_optional = false;
template <class T>
constexpr bool is_optional<optional<T>> = true;

template <class T>
constexpr bool is_sequence = false;
template <class P>
constexpr bool is_sequence<sequence<P>> = true;

template <class FlowT>
struct checked_step_flow
{
    static_assert(is_control_flow<FlowT>, "step functions must return fc::control_flow<B>");
    static_assert(std::is_same_v<typename FlowT::continue_t, unit>,
                  "the continue alternative of a step result carries no value, use fc::control_flow<B>");
    using type = FlowT;
};
} // namespace impl

/// The control_flow type returned by step function StepF when called with ItemT
/// This is also the return type of try_for_each for producers with item_t == ItemT
template <class StepF, class ItemT>
using step_flow_t = typename impl::checked_step_flow<std::remove_cvref_t<invoke_result_t<StepF&, ItemT>>>::type;

/// A type that satisfies the primitive traversal contract
/// (try_for_each itself cannot be checked without a concrete step function)
template <class P>
concept producer = std::is_object_v<P> && std::is_move_constructible_v<P> && requires { typename P::item_t; };

/// remove_cvref_t of the item type
template <class P>
using producer_element_t = std::remove_cvref_t<typename P::item_t>;

/// fc::optional<stored_item_t<item_t>>, the result of all single-element reductions
template <class P>
using producer_result_t = fc::optional<stored_item_t<typename P::item_t>>;

namespace impl
{
template <class P>
concept has_known_size = requires(P const& p) {
    { p.known_size() } -> std::convertible_to<isize>;
};
template <class P>
concept has_count_override = requires(P&& p) {
    { static_cast<P&&>(p).count() } -> std::convertible_to<isize>;
};
template <class P>
concept has_nth_override = requires(P&& p, isize k) { static_cast<P&&>(p).nth(k); };
template <class P>
concept has_last_override = requires(P&& p) { static_cast<P&&>(p).last(); };
template <class P, class KeyF>
concept has_min_by_key_override = requires(P&& p, KeyF& key) { static_cast<P&&>(p).min_by_key(key); };
template <class P, class KeyF>
concept has_max_by_key_override = requires(P&& p, KeyF& key) { static_cast<P&&>(p).max_by_key(key); };
} // namespace impl
} // namespace fc

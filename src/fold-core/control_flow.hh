#pragma once

#include <fold-core/assert.hh>
#include <fold-core/fwd.hh>
#include <fold-core/impl/object_lifetime_util.hh>
#include <fold-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// control_flow - the result of one step of an internal iteration
// =========================================================================================================
//
// A step function is called once per element and tells the producer whether to keep going:
//
//   continue(C)  - proceed with the next element (C is fc::unit for plain traversal)
//   stop(B)      - stop the traversal right now, carrying B out to the caller
//
// Producers never inspect B. Once a step returns stop, every enclosing adapter returns the
// very same result unchanged and no further element is produced anywhere in the chain.
//
// Construction is usually implicit via the tag helpers:
//
//   auto step = [&](int v) -> fc::control_flow<int> {
//       if (v > 10)
//           return fc::stop_with(v);
//       return fc::continue_with();
//   };
//
// try_fold threads its accumulator through the continue alternative:
//
//   fc::control_flow<error, int> r = fc::continue_with(acc + v);
//

namespace fc::impl
{
template <class B>
struct stop_tag
{
    B value;
};
template <class C>
struct continue_tag
{
    C value;
};
} // namespace fc::impl

namespace fc
{
/// Creates a stop result carrying value (converts to any compatible control_flow)
template <class B>
[[nodiscard]] constexpr impl::stop_tag<std::decay_t<B>> stop_with(B&& value)
{
    return {fc::forward<B>(value)};
}

/// Creates a continue result carrying no value (fc::unit)
[[nodiscard]] constexpr impl::continue_tag<unit> continue_with()
{
    return {};
}

/// Creates a continue result carrying value (e.g. the accumulator of try_fold)
template <class C>
[[nodiscard]] constexpr impl::continue_tag<std::decay_t<C>> continue_with(C&& value)
{
    return {fc::forward<C>(value)};
}
} // namespace fc

/// Two-alternative step result: stop(B) or continue(C)
/// Behaves like a small tagged union, with value semantics following B and C.
/// Reading the wrong alternative is a precondition violation (asserted).
template <class B, class C>
struct fc::control_flow
{
    static_assert(!std::is_reference_v<B> && !std::is_reference_v<C>,
                  "control_flow stores values, use fc::optional<T&> or a pointer to carry references");

    using stop_t = B;
    using continue_t = C;

    // construction
public:
    template <class U>
        requires std::is_constructible_v<B, U&&>
    control_flow(impl::stop_tag<U>&& tag) : _is_stop(true) // NOLINT
    {
        new (fc::placement_new, &_stop) B(fc::move(tag.value));
    }

    template <class U>
        requires std::is_constructible_v<C, U&&>
    control_flow(impl::continue_tag<U>&& tag) : _is_stop(false) // NOLINT
    {
        new (fc::placement_new, &_continue) C(fc::move(tag.value));
    }

    [[nodiscard]] static control_flow make_stop(B value) { return control_flow(fc::stop_with(fc::move(value))); }
    [[nodiscard]] static control_flow make_continue(C value)
    {
        return control_flow(fc::continue_with(fc::move(value)));
    }
    [[nodiscard]] static control_flow make_continue()
        requires std::is_default_constructible_v<C>
    {
        return control_flow(impl::continue_tag<C>{C()});
    }

    // copy / move / destroy
public:
    control_flow(control_flow&& rhs) noexcept(std::is_nothrow_move_constructible_v<B> && std::is_nothrow_move_constructible_v<C>)
      : _is_stop(rhs._is_stop)
    {
        if (_is_stop)
            new (fc::placement_new, &_stop) B(fc::move(rhs._stop));
        else
            new (fc::placement_new, &_continue) C(fc::move(rhs._continue));
    }

    control_flow(control_flow const& rhs)
        requires(std::is_copy_constructible_v<B> && std::is_copy_constructible_v<C>)
      : _is_stop(rhs._is_stop)
    {
        if (_is_stop)
            new (fc::placement_new, &_stop) B(rhs._stop);
        else
            new (fc::placement_new, &_continue) C(rhs._continue);
    }

    control_flow& operator=(control_flow&& rhs) noexcept(std::is_nothrow_move_constructible_v<B> && std::is_nothrow_move_constructible_v<C>)
    {
        if (this != &rhs)
        {
            destroy();
            _is_stop = rhs._is_stop;
            if (_is_stop)
                new (fc::placement_new, &_stop) B(fc::move(rhs._stop));
            else
                new (fc::placement_new, &_continue) C(fc::move(rhs._continue));
        }
        return *this;
    }

    control_flow& operator=(control_flow const& rhs)
        requires(std::is_copy_constructible_v<B> && std::is_copy_constructible_v<C>)
    {
        if (this != &rhs)
        {
            destroy();
            _is_stop = rhs._is_stop;
            if (_is_stop)
                new (fc::placement_new, &_stop) B(rhs._stop);
            else
                new (fc::placement_new, &_continue) C(rhs._continue);
        }
        return *this;
    }

    ~control_flow() { destroy(); }

    // queries
public:
    [[nodiscard]] bool is_stop() const { return _is_stop; }
    [[nodiscard]] bool is_continue() const { return !_is_stop; }

    // access
public:
    /// Precondition: is_stop()
    [[nodiscard]] B& stop_value() &
    {
        FC_ASSERT(_is_stop, "attempted to read the stop value of a continue result");
        return _stop;
    }
    [[nodiscard]] B const& stop_value() const&
    {
        FC_ASSERT(_is_stop, "attempted to read the stop value of a continue result");
        return _stop;
    }
    [[nodiscard]] B&& stop_value() &&
    {
        FC_ASSERT(_is_stop, "attempted to read the stop value of a continue result");
        return fc::move(_stop);
    }

    /// Precondition: is_continue()
    [[nodiscard]] C& continue_value() &
    {
        FC_ASSERT(!_is_stop, "attempted to read the continue value of a stop result");
        return _continue;
    }
    [[nodiscard]] C const& continue_value() const&
    {
        FC_ASSERT(!_is_stop, "attempted to read the continue value of a stop result");
        return _continue;
    }
    [[nodiscard]] C&& continue_value() &&
    {
        FC_ASSERT(!_is_stop, "attempted to read the continue value of a stop result");
        return fc::move(_continue);
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(control_flow const& lhs, control_flow const& rhs)
        requires requires(B const& b, C const& c) {
            bool(b == b);
            bool(c == c);
        }
    {
        if (lhs._is_stop != rhs._is_stop)
            return false;
        return lhs._is_stop ? bool(lhs._stop == rhs._stop) : bool(lhs._continue == rhs._continue);
    }

    // helper
private:
    void destroy()
    {
        if (_is_stop)
        {
            if constexpr (!std::is_trivially_destructible_v<B>)
                _stop.~B();
        }
        else
        {
            if constexpr (!std::is_trivially_destructible_v<C>)
                _continue.~C();
        }
    }

    // members
private:
    union
    {
        B _stop;
        C _continue;
    };
    bool _is_stop;
};

#pragma once

#include <fold-core/assert.hh>
#include <fold-core/fwd.hh>
#include <fold-core/utility.hh>

#include <type_traits>

/// Non-owning reference to a callable with signature R(Args...)
///
/// Two pointers wide and trivially copyable: a type-erased pointer to the callable and a thunk that
/// casts it back and invokes it. Nothing is allocated and nothing is copied.
///
/// fold-core hands one to generator functions as their yield callback (fc::make_sequence_from_fn):
///
///   auto seq = fc::make_sequence_from_fn<int>([](fc::function_ref<bool(int)> yield) {
///       for (auto i = 0; i < 10; ++i)
///           if (yield(i))
///               return; // the consumer does not want more
///   });
///
/// The referenced callable must outlive the function_ref.
/// Passing a temporary as a function argument is fine, storing a function_ref to one is not.
///
/// Accepts function pointers, lambdas, functors and pointers to members (through fc::invoke).
/// Signatures with noexcept or ref-qualifiers are not supported.
template <class R, class... Args>
struct fc::function_ref<R(Args...)>
{
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) // NOLINT(bugprone-forwarding-reference-overload)
      : _callable(const_cast<void*>(static_cast<void const*>(&f))), _thunk(&thunk<std::remove_reference_t<F>>)
    {
        static_assert(fc::is_invocable_r<R, F&, Args...>, "F must be callable with Args... and return something convertible to R");
    }

    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return _thunk != nullptr; }

    /// Precondition: is_valid()
    R operator()(Args... args) const
    {
        FC_ASSERT(_thunk != nullptr, "calling an empty function_ref");
        return _thunk(_callable, fc::forward<Args>(args)...);
    }

private:
    template <class Fn>
    static R thunk(void* callable, Args... args)
    {
        if constexpr (std::is_void_v<R>)
            fc::invoke(*static_cast<Fn*>(callable), fc::forward<Args>(args)...);
        else
            return fc::invoke(*static_cast<Fn*>(callable), fc::forward<Args>(args)...);
    }

    void* _callable = nullptr;
    fc::function_ptr<R(void*, Args...)> _thunk = nullptr;
};

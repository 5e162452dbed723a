#pragma once

#include <fold-core/assert.hh>
#include <fold-core/fwd.hh>
#include <fold-core/impl/object_lifetime_util.hh>
#include <fold-core/utility.hh>

#include <concepts>
#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as fc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct fc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace fc
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace fc

/// Sum type representing either a value of type T or no value (T | none).
/// This is the result type of every "single element" sequence reduction (nth, last, find, min, ...).
/// No operator* or operator->, access goes through value() which asserts engagement.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable.
///
/// optional<T&> is supported (see below) so that reductions over borrowed elements
/// can return the element itself instead of a copy.
template <class T>
struct fc::optional
{
    static_assert(!std::is_reference_v<T>, "handled by the optional<T&> specialization");

    using value_t = T;

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) : _has_value(true) // NOLINT
    {
        new (fc::placement_new, &_storage.value) T(fc::forward<U>(value));
    }

    /// Constructs an empty optional from fc::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (fc::placement_new, &_storage.value) T(fc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (fc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = fc::move(rhs._storage.value);
            else
                new (fc::placement_new, &_storage.value) T(fc::move(rhs._storage.value));

            _has_value = true;
        }
        else
            reset();

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (fc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else
                reset();
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modification
public:
    /// Destroys the current value (if any) and constructs a new one in place.
    /// Returns a reference to the new value.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        new (fc::placement_new, &_storage.value) T(fc::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    /// Destroys the held value, if any. has_value() == false afterwards.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns the held value with the value category of the optional itself.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        FC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        FC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        FC_ASSERT(_has_value, "attempted to access value of empty optional");
        return fc::move(_storage.value);
    }
    [[nodiscard]] T const&& value() const&&
    {
        FC_ASSERT(_has_value, "attempted to access value of empty optional");
        return fc::move(_storage.value);
    }

    /// Returns a copy of the held value, or fallback if empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(fc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? fc::move(_storage.value) : static_cast<T>(fc::forward<U>(fallback));
    }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted when T is not bool: optional<int> == true is almost certainly a bug.
    /// (only matches an actual bool, so optional<isize> == 3 still compares values)
    template <std::same_as<bool> B>
        requires(!std::is_same_v<T, bool>)
    bool operator==(B) const = delete;

    // members
private:
    fc::storage_for<T> _storage;
    bool _has_value = false;
};

/// Optional reference: either refers to an existing T or is empty.
/// Assignment and emplace rebind the reference, they never assign through it.
/// Constness is shallow: value() on a const optional<T&> still yields T&.
/// Cannot bind to temporaries.
template <class T>
struct fc::optional<T&>
{
    using value_t = T&;

    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    /// Binds to the given lvalue.
    optional(T& value) : _ptr(&value) {}
    optional(T&&) = delete;

    /// Converts from optional<U&> where U& binds to T& (e.g. int& to int const&).
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr)
    {
    }

    // modification
public:
    /// Rebinds to value.
    T& emplace(T& value)
    {
        _ptr = &value;
        return value;
    }

    void reset() { _ptr = nullptr; }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() const
    {
        FC_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    /// Returns a copy of the referenced value, or fallback if empty.
    template <class U>
    [[nodiscard]] std::remove_cv_t<T> value_or(U&& fallback) const
    {
        return _ptr != nullptr ? *_ptr : static_cast<std::remove_cv_t<T>>(fc::forward<U>(fallback));
    }

    // comparison
public:
    /// Compares the referenced values, not the addresses.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || *lhs._ptr == *rhs._ptr;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    template <std::same_as<bool> B>
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    bool operator==(B) const = delete;

    // members
private:
    T* _ptr = nullptr;
};

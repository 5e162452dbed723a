#pragma once

#include <cstddef>
#include <type_traits>

namespace fc
{
/// Tag for fc's own placement new, so we don't need to include <new>
/// Usage:
///   new (fc::placement_new, &storage.value) T(args...);
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new{};

/// Uninitialized storage with size and alignment of T
/// The value is neither constructed nor destroyed by storage_for itself.
/// Trivially destructible (and trivially copyable) if T is.
template <class T>
union storage_for
{
    constexpr storage_for() {}

    storage_for(storage_for const&) = default;
    storage_for(storage_for&&) = default;
    storage_for& operator=(storage_for const&) = default;
    storage_for& operator=(storage_for&&) = default;

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    T value;
};
} // namespace fc

inline void* operator new(std::size_t, fc::placement_new_tag, void* ptr) noexcept
{
    return ptr;
}

// only called if a constructor in placement new throws
inline void operator delete(void*, fc::placement_new_tag, void*) noexcept {}

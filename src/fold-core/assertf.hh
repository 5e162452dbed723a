#pragma once

#include <fold-core/assert.hh>

#include <format>
#include <string>

// FC_ASSERTF(cond, fmt, args...) - FC_ASSERT with a std::format message
// The arguments are only evaluated (and formatted) when cond is false.
//
//   FC_ASSERTF(k >= 0, "nth index must be non-negative, got {}", k);
//
#define FC_ASSERTF(cond, msg, ...) FC_IMPL_ASSERTF(cond, msg __VA_OPT__(, ) __VA_ARGS__)

// FC_ASSERTF_ALWAYS(cond, fmt, args...) - same, but active in every configuration
#define FC_ASSERTF_ALWAYS(cond, msg, ...) FC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)

#define FC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                          \
    do                                                                                  \
    {                                                                                   \
        if (!(cond)) [[unlikely]]                                                       \
            FC_IMPL_FAIL(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str());   \
    } while (false)

#if FC_ASSERT_ENABLED
#define FC_IMPL_ASSERTF(cond, msg, ...) FC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#else
// the format string is still checked at compile time
#define FC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        FC_UNUSED(cond);                                        \
        FC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif

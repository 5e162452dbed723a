#pragma once

// Lean assertion header, included by almost every fold-core header.
// Formatted messages live in <fold-core/assertf.hh> (pulls in <format>).
#include <fold-core/macros.hh>

#include <source_location>

// =========================================================================================================
// FC_ASSERT(cond, msg)
//
// Checks a precondition of the library: negative take/skip/nth counts, reading an empty optional,
// reading the wrong alternative of a control_flow, calling an empty function_ref.
// msg is a string literal.
//
// On failure the topmost handler of <fold-core/assert-handler.hh> runs (or the default handler, which
// prints to std::cerr), then we break into an attached debugger and abort.
// Handlers may throw instead, which is how tests observe failures.
//
// Active unless FC_RELEASE is defined. FC_ENABLE_ASSERT_IN_RELEASE keeps them in release builds.
//
// Not an assertion:
//   - running out of elements (empty fc::optional)
//   - stopping a traversal (stop control_flow)
//
#define FC_ASSERT(cond, msg) FC_IMPL_ASSERT(cond, msg)

// FC_ASSERT_ALWAYS(cond, msg) - same, but active in every configuration
#define FC_ASSERT_ALWAYS(cond, msg) FC_IMPL_ASSERT_ALWAYS(cond, msg)

// FC_DEBUG_BREAK() - stops in the debugger if one is attached, no-op otherwise
#define FC_DEBUG_BREAK() FC_IMPL_DEBUG_BREAK()

#ifndef FC_ASSERT_ENABLED
#if !defined(FC_RELEASE) || defined(FC_ENABLE_ASSERT_IN_RELEASE)
#define FC_ASSERT_ENABLED 1
#else
#define FC_ASSERT_ENABLED 0
#endif
#endif

namespace fc::impl
{
// reports the failure to the current handler, returns if the handler returns
FC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace fc::impl

// the break has to happen inside the macro so the debugger stops at the failing line

#if defined(FC_COMPILER_MSVC)
#define FC_IMPL_DEBUG_BREAK() (::fc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif defined(FC_COMPILER_POSIX)
// declared here to keep <csignal> out of every header, 5 is SIGTRAP
extern "C" int raise(int) noexcept;
#define FC_IMPL_DEBUG_BREAK() (::fc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define FC_IMPL_FAIL(expr_str, msg_cstr)                                                       \
    (::fc::impl::handle_assert_failure(expr_str, msg_cstr, ::std::source_location::current()), \
     FC_IMPL_DEBUG_BREAK(), ::fc::impl::perform_abort())

#define FC_IMPL_ASSERT_ALWAYS(cond, msg)   \
    do                                     \
    {                                      \
        if (!(cond)) [[unlikely]]          \
            FC_IMPL_FAIL(#cond, msg);      \
    } while (false)

#if FC_ASSERT_ENABLED
#define FC_IMPL_ASSERT(cond, msg) FC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define FC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        FC_UNUSED(cond);          \
        FC_UNUSED(msg);           \
    } while (false)
#endif

#pragma once

#include <fold-core/fwd.hh>
#include <fold-core/macros.hh>

#include <functional>
#include <source_location>
#include <string>
#include <utility>

// Assertion handler stack
//
// A failing FC_ASSERT / FC_ASSERTF calls the topmost handler. Without any handler, the default one
// prints the failure (and a stacktrace where std::stacktrace is available) to std::cerr.
// After the handler returns, the program aborts. Throwing from a handler unwinds instead:
//
//   auto handler = fc::impl::scoped_assertion_handler([](fc::impl::assertion_info const& info) {
//       throw precondition_error{info.message};
//   });
//   fc::make_sequence(values).take(n); // n < 0 now throws precondition_error
//
// The stack is global state and not synchronized.

namespace fc::impl
{
struct assertion_info
{
    std::string expression; // the failing condition as written
    std::string message;    // already formatted for FC_ASSERTF
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

// no-op if the stack is empty
void pop_assertion_handler();

// number of handlers currently pushed
[[nodiscard]] isize assertion_handler_count();

// pushes on construction, pops on destruction (also when a handler throws through it)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace fc::impl

#include <fold-core/assert-handler.hh>
#include <fold-core/assert.hh>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

#ifdef FC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<fc::impl::assertion_handler>& handler_stack()
{
    static std::vector<fc::impl::assertion_handler> handlers;
    return handlers;
}

void print_assertion_failure(fc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << std::format("fold-core assertion failed: {}\n"
                             "  message:  {}\n"
                             "  location: {}:{}:{}\n"
                             "  function: {}\n",
                             info.expression, info.message, loc.file_name(), loc.line(), loc.column(), loc.function_name());

#ifdef __cpp_lib_stacktrace
    std::cerr << "stacktrace:\n" << std::to_string(std::stacktrace::current(1)) << '\n';
#endif
    std::cerr.flush();
}
} // namespace

void fc::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void fc::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

fc::isize fc::impl::assertion_handler_count()
{
    return isize(handler_stack().size());
}

void fc::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    // the handler may throw, the caller aborts if it returns
    auto& handlers = handler_stack();
    if (handlers.empty())
        print_assertion_failure(info);
    else
        handlers.back()(info);
}

bool fc::impl::is_debugger_connected() noexcept
{
#if defined(FC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(FC_OS_LINUX)
    // a traced process has a non-zero "TracerPid:" entry
    std::ifstream status("/proc/self/status");
    std::string line;
    constexpr std::string_view key = "TracerPid:";
    while (std::getline(status, line))
    {
        if (!line.starts_with(key))
            continue;

        auto const value = line.find_first_not_of(" \t", key.size());
        return value != std::string::npos && line[value] != '0';
    }
    return false;
#else
    return false;
#endif
}

void fc::impl::perform_abort() noexcept
{
    std::abort();
}

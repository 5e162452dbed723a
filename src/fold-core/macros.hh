#pragma once

// Platform and attribute macros used across fold-core.
// Only what the library itself needs lives here.

// =========================================================================================================
// Compiler and OS detection
// =========================================================================================================
// Exactly one of FC_COMPILER_MSVC, FC_COMPILER_CLANG, FC_COMPILER_GCC is defined.
// FC_COMPILER_POSIX is defined for clang and gcc (incl. MinGW, which identifies as gcc).
// Exactly one of FC_OS_WINDOWS, FC_OS_LINUX, FC_OS_APPLE, FC_OS_BSD is defined.
// Build configuration (FC_DEBUG, FC_RELEASE, FC_RELWITHDEBINFO) comes from CMake.

#if defined(_MSC_VER)
#define FC_COMPILER_MSVC
#elif defined(__clang__)
#define FC_COMPILER_CLANG
#define FC_COMPILER_POSIX
#elif defined(__GNUC__)
#define FC_COMPILER_GCC
#define FC_COMPILER_POSIX
#else
#error "fold-core: unsupported compiler"
#endif

#if defined(_WIN32)
#define FC_OS_WINDOWS
#elif defined(__APPLE__)
#define FC_OS_APPLE
#elif defined(__linux__)
#define FC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define FC_OS_BSD
#else
#error "fold-core: unsupported platform"
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// FC_FORCE_INLINE - for the one-line invoke/forward helpers every adapter layer goes through
// FC_COLD_FUNC    - for failure paths (assertion handling)
#if defined(FC_COMPILER_MSVC)
#define FC_FORCE_INLINE __forceinline
#define FC_COLD_FUNC
#else
// gcc needs the additional 'inline'
#define FC_FORCE_INLINE __attribute__((always_inline)) inline
#define FC_COLD_FUNC __attribute__((cold))
#endif

// FC_UNUSED(expr) - type-checks expr without evaluating it
// Used by disabled assertions so that their arguments keep compiling.
#define FC_UNUSED(expr) (void)(sizeof((expr)))

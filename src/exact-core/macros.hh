#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: EC_COMPILER_MSVC, EC_COMPILER_CLANG, EC_COMPILER_GCC, EC_COMPILER_POSIX

#if defined(_MSC_VER)
#define EC_COMPILER_MSVC
#elif defined(__clang__)
#define EC_COMPILER_CLANG
#elif defined(__GNUC__)
#define EC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(EC_COMPILER_CLANG) || defined(EC_COMPILER_GCC)
#define EC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: EC_OS_WINDOWS, EC_OS_LINUX, EC_OS_APPLE, EC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define EC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define EC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define EC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define EC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Assertion configuration
// =========================================================================================================
// From CMake: EC_DEBUG, EC_RELEASE, EC_RELWITHDEBINFO
// Optional:   EC_ENABLE_ASSERT_IN_RELEASE
//
// EC_ASSERT_ENABLED is 1 when EC_ASSERT checks are compiled in.
// EC_ASSERT_ALWAYS (contract violations) is active regardless.

#if defined(EC_DEBUG) || defined(EC_RELWITHDEBINFO) || defined(EC_ENABLE_ASSERT_IN_RELEASE)
#define EC_ASSERT_ENABLED 1
#else
#define EC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// EC_FORCE_INLINE - Force function to be inlined
// Used on the word-level helpers that sit on every arithmetic path
#define EC_FORCE_INLINE EC_IMPL_FORCE_INLINE

// EC_COLD_FUNC - Mark function as rarely executed (assertion failure paths)
#define EC_COLD_FUNC EC_IMPL_COLD_FUNC

// EC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: expression is NOT evaluated, only its type is checked
#define EC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(EC_COMPILER_MSVC)

#define EC_IMPL_FORCE_INLINE __forceinline
#define EC_IMPL_COLD_FUNC

#elif defined(EC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define EC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define EC_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

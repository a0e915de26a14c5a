#pragma once

// Lean header with minimal dependencies, included by every arithmetic header.
#include <exact-core/fwd.hh>
#include <exact-core/macros.hh>

// =========================================================================================================
// EC_ASSERT - Runtime assertion with string literal message
//
// Validates an internal invariant at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Assertions are enabled in EC_DEBUG and EC_RELWITHDEBINFO builds.
//   In EC_RELEASE builds, assertions are disabled unless EC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Error handling strategy of exact-core:
//   - EC_ASSERT         -> violated internal invariants (bugs in this library)
//   - EC_ASSERT_ALWAYS  -> caller contract violations: division by zero, bit index outside [0, 128),
//                          bit value outside {0, 1}, byte buffers shorter than 16 bytes
//   - result<T, E>      -> malformed or out-of-range text input
//   - conversion<T>     -> inexact float / arbitrary precision / narrowing conversions
//
// Wrapping overflow in add/sub/mul/inc/dec/neg is defined behavior and never asserts.
//
// Usage:
//   EC_ASSERT(shift < 64, "normalization shift out of range");
//
#define EC_ASSERT(cond, msg) EC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// EC_ASSERT_ALWAYS - Always-active assertion
//
// Like EC_ASSERT but remains active in all build configurations, including release builds.
// Every contract violation of the public u128 / i128 API goes through this macro.
//
// Usage:
//   EC_ASSERT_ALWAYS(!divisor.is_zero(), "division by zero");
//   EC_ASSERT_ALWAYS(bytes.size() >= 16, "buffer must hold at least 16 bytes");
//
#define EC_ASSERT_ALWAYS(cond, msg) EC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// EC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define EC_DEBUG_BREAK() EC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// EC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by EC_ASSERT after the assertion handler returned.
//
#define EC_BREAK_AND_ABORT() (EC_DEBUG_BREAK(), ::ec::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ec::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or the default one that prints to stderr)
// Note: does not abort, caller must follow with EC_BREAK_AND_ABORT()
EC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ec::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ec::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef EC_COMPILER_MSVC

#define EC_IMPL_DEBUG_BREAK() (::ec::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(EC_COMPILER_POSIX)

// SIGTRAP is 5, declared here to avoid pulling in <csignal>
extern "C" int raise(int) noexcept;
#define EC_IMPL_DEBUG_BREAK() (::ec::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define EC_IMPL_DEBUG_BREAK() void(0)

#endif

#define EC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ec::impl::handle_assert_failure(#cond, msg, ::ec::source_location::current()); \
            EC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if EC_ASSERT_ENABLED

#define EC_IMPL_ASSERT(cond, msg) EC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but both arguments still have to compile
#define EC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        EC_UNUSED(cond);          \
        EC_UNUSED(msg);           \
    } while (false)

#endif

#pragma once

#include <exact-core/fwd.hh>

#include <functional>
#include <string>

namespace ec::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ec::impl::scoped_assertion_handler([](ec::impl::assertion_info const& info) {
//           throw contract_violation{info.message};
//       });
//
//       auto q = a / b; // a zero divisor now throws instead of aborting
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    ec::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// (prefer scoped_assertion_handler for automatic cleanup)
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ec::impl

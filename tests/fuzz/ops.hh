#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ec_fuzz
{
class scheme_source;

/// Draws one set of operands from the source, runs the operation and compares against the cpp_int reference
/// Returns a description of the mismatch, or nullopt if the result is exact
using check_fn = std::optional<std::string> (*)(scheme_source& source);

struct fuzz_op
{
    std::string_view name;

    // nullptr if the operation does not exist for that type
    check_fn u128_check;
    check_fn i128_check;
};

/// Every fuzzed operation, sorted by name
[[nodiscard]] std::span<fuzz_op const> all_ops();
} // namespace ec_fuzz

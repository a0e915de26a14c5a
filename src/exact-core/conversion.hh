#pragma once

#include <exact-core/fwd.hh>

#include <string_view>

/// Why decimal text could not be turned into a 128-bit integer
/// The two conditions are always distinguishable:
///   "12a", "", "0x10", "+" are malformed
///   "340282366920938463463374607431768211456" (2^128) is a well-formed u128 that is out of range
enum class ec::parse_error
{
    malformed,
    out_of_range,
};

/// Value produced by a conversion that may not be exact
/// value is always usable: out-of-range sources clamp to the nearest bound,
/// narrowing casts truncate. in_range reports whether value equals the source exactly
/// (up to truncation toward zero for float sources).
///
/// Usage:
///   auto [v, ok] = ec::u128::from_f64(x);
///   if (!ok)
///       report_clamped(x);
template <class T>
struct ec::conversion
{
    T value;
    bool in_range;

    constexpr bool operator==(conversion const&) const = default;
};

namespace ec
{
[[nodiscard]] constexpr std::string_view to_string_view(parse_error e)
{
    switch (e)
    {
    case parse_error::malformed:
        return "malformed";
    case parse_error::out_of_range:
        return "out of range";
    }
    return "unknown parse error";
}
} // namespace ec

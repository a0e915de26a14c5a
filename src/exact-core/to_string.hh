#pragma once

#include <exact-core/conversion.hh>
#include <exact-core/fwd.hh>
#include <exact-core/result.hh>

#include <iosfwd>
#include <string>
#include <string_view>

namespace ec
{
// decimal, "-" prefix for negative values, no "+" and no leading zeros
[[nodiscard]] std::string to_string(u128 v);
[[nodiscard]] std::string to_string(i128 v);

// "malformed" / "out of range"
[[nodiscard]] std::string to_string(parse_error e);

// streams the to_string text
std::ostream& operator<<(std::ostream& out, u128 v);
std::ostream& operator<<(std::ostream& out, i128 v);

/// Parses decimal text into T (u128 or i128)
///
/// Accepted syntax: an optional single '+' or '-' followed by one or more ASCII digits.
/// Leading zeros are fine. No whitespace, no digit separators, no base prefixes.
///
/// Errors:
///   parse_error::malformed     - anything that does not match the syntax ("", "-", "0x1F", " 1", "1_000")
///   parse_error::out_of_range  - well-formed but not representable in T
///                                (for u128 this includes every negative value except "-0")
///
/// Usage:
///   auto r = ec::parse_decimal<ec::u128>("340282366920938463463374607431768211455");
///   CHECK(r.value() == ec::u128::max());
template <class T>
[[nodiscard]] result<T, parse_error> parse_decimal(std::string_view text);

template <>
[[nodiscard]] result<u128, parse_error> parse_decimal<u128>(std::string_view text);

template <>
[[nodiscard]] result<i128, parse_error> parse_decimal<i128>(std::string_view text);
} // namespace ec

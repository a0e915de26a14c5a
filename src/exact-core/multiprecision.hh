#pragma once

#include <exact-core/conversion.hh>
#include <exact-core/fwd.hh>

#include <boost/multiprecision/cpp_int.hpp>

// Bridge between the fixed-width 128-bit types and Boost.Multiprecision's arbitrary-precision cpp_int.
// Consumers use it to hand exact intermediates to code that needs more than 128 bits,
// and the test suite uses cpp_int as the reference every operation is checked against.

namespace ec
{
using big_int = boost::multiprecision::cpp_int;

[[nodiscard]] big_int to_cpp_int(u128 v);
[[nodiscard]] big_int to_cpp_int(i128 v);

/// Negative values clamp to {0, false}, values >= 2^128 to {u128::max(), false}
[[nodiscard]] conversion<u128> u128_from_cpp_int(big_int const& v);

/// Values outside [-2^127, 2^127 - 1] clamp to the nearest bound with in_range == false
[[nodiscard]] conversion<i128> i128_from_cpp_int(big_int const& v);

/// Values that do not fit are a contract violation
[[nodiscard]] u128 must_u128_from_cpp_int(big_int const& v);
[[nodiscard]] i128 must_i128_from_cpp_int(big_int const& v);
} // namespace ec

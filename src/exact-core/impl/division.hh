#pragma once

#include <exact-core/fwd.hh>
#include <exact-core/u128.hh>

// =========================================================================================================
// Unsigned 128-bit division primitives
// =========================================================================================================
//
// Shared by u128 and i128 (which divides magnitudes and reapplies signs).
// All entry points compute truncating division with  dividend == divisor * quo + rem,  rem < divisor.
//
// Dispatch in divide():
//   1. divisor zero                          -> contract violation
//   2. both high words zero                  -> native 64-bit division
//   3. divisor == 1                          -> {dividend, 0}
//   4. divisor is a power of two             -> shift and mask
//   5. dividend < divisor / == divisor       -> {0, dividend} / {1, 0}
//   6. leading zero gap <= binary_division_spill -> divide_binary (few quotient bits)
//   7. otherwise                             -> divide_normalized (Knuth / reciprocal estimate)
//

namespace ec::impl
{
/// Leading zero gap between dividend and divisor up to which the bit-at-a-time loop is used.
/// Tuning constant only: every path computes identical results for every input.
inline constexpr int binary_division_spill = 16;

/// Divides the 128-bit value (u1:u0) by v using Knuth's normalize-and-correct method on 32-bit digits
/// (Hacker's Delight "divlu"). Precondition: u1 < v, so the quotient fits in 64 bits.
[[nodiscard]] u64 divide_128_by_64(u64 u1, u64 u0, u64 v, u64& remainder);

/// Shift-compare-subtract long division, one quotient bit per step
/// Precondition: v != 0 and u >= v
[[nodiscard]] quo_rem_result<u128> divide_binary(u128 u, u128 v);

/// Normalized division: 128-by-64 via divide_128_by_64 when v has no high word,
/// otherwise estimate the quotient from the top 64 bits of the normalized divisor and correct once
/// Precondition: v != 0
[[nodiscard]] quo_rem_result<u128> divide_normalized(u128 u, u128 v);

/// Full dispatcher, see above
[[nodiscard]] quo_rem_result<u128> divide(u128 u, u128 v);

/// 128-by-64 division
[[nodiscard]] quo_rem_result<u128, u64> divide64(u128 u, u64 v);
} // namespace ec::impl

#pragma once

#include <exact-core/fwd.hh>
#include <exact-core/macros.hh>

#include <bit>

// =========================================================================================================
// 64-bit word helpers
// =========================================================================================================
//
// Every 128-bit operation in exact-core is composed from these primitives on single u64 words.
//
// Multi-word arithmetic:
//   add_with_carry(a, b, carry_in)          - a + b + carry_in, returns sum and carry-out
//   sub_with_borrow(a, b, borrow_in)        - a - b - borrow_in, returns difference and borrow-out
//   mul_wide(a, b)                          - full 128-bit product of two words, split into hi / lo
//
// Bit counting:
//   count_leading_zeroes(value)             - consecutive 0 bits from the most significant bit
//   count_trailing_zeroes(value)            - consecutive 0 bits from the least significant bit
//   popcount(value)                         - number of 1 bits
//   bit_width(value)                        - smallest number of bits to represent value
//
// Permutations:
//   bit_reverse(value)                      - reverse the order of all 64 bits
//   byte_swap(value)                        - reverse the order of the 8 bytes
//   bit_rotate_left(value, shift)           - bitwise left-rotation
//   bit_rotate_right(value, shift)          - bitwise right-rotation
//

namespace ec
{
// =========================================================================================================
// Multi-word arithmetic
// =========================================================================================================

/// Result of a single-word add / subtract with carry or borrow
/// carry is always 0 or 1
struct word_with_carry
{
    u64 value;
    u64 carry;
};

/// Full product of two 64-bit words
struct wide_word
{
    u64 hi;
    u64 lo;
};

/// Adds two words and an incoming carry (0 or 1)
/// Usage:
///   auto [lo, c] = ec::add_with_carry(a.lo(), b.lo(), 0);
///   auto [hi, _] = ec::add_with_carry(a.hi(), b.hi(), c);
[[nodiscard]] EC_FORCE_INLINE constexpr word_with_carry add_with_carry(u64 a, u64 b, u64 carry_in) noexcept
{
    u64 const sum = a + b + carry_in;
    // carry out iff both inputs had the top bit set, or either did and the sum lost it
    u64 const carry_out = ((a & b) | ((a | b) & ~sum)) >> 63;
    return {sum, carry_out};
}

/// Subtracts b and an incoming borrow (0 or 1) from a
[[nodiscard]] EC_FORCE_INLINE constexpr word_with_carry sub_with_borrow(u64 a, u64 b, u64 borrow_in) noexcept
{
    u64 const diff = a - b - borrow_in;
    u64 const borrow_out = ((~a & b) | (~(a ^ b) & diff)) >> 63;
    return {diff, borrow_out};
}

/// Computes the full 128-bit product of two words
/// Uses 32-bit partial products so it does not depend on a compiler-provided 128-bit type
/// Usage:
///   auto [hi, lo] = ec::mul_wide(0xFFFF'FFFF'FFFF'FFFF, 2); // hi == 1, lo == 0xFFFF'FFFF'FFFF'FFFE
[[nodiscard]] EC_FORCE_INLINE constexpr wide_word mul_wide(u64 a, u64 b) noexcept
{
    constexpr u64 mask32 = 0xFFFF'FFFF;

    u64 const a0 = a & mask32;
    u64 const a1 = a >> 32;
    u64 const b0 = b & mask32;
    u64 const b1 = b >> 32;

    u64 const w0 = a0 * b0;
    u64 const t = a1 * b0 + (w0 >> 32);
    u64 const w1 = (t & mask32) + a0 * b1;
    u64 const w2 = t >> 32;

    return {a1 * b1 + w2 + (w1 >> 32), a * b};
}

// =========================================================================================================
// Bit counting
// =========================================================================================================

/// Counts the number of consecutive 0 bits, starting from the most significant bit
/// count_leading_zeroes(0) == 64
[[nodiscard]] EC_FORCE_INLINE constexpr int count_leading_zeroes(u64 value) noexcept
{
    return std::countl_zero(value);
}

/// Counts the number of consecutive 0 bits, starting from the least significant bit
/// count_trailing_zeroes(0) == 64
[[nodiscard]] EC_FORCE_INLINE constexpr int count_trailing_zeroes(u64 value) noexcept
{
    return std::countr_zero(value);
}

/// Counts the number of 1 bits
[[nodiscard]] EC_FORCE_INLINE constexpr int popcount(u64 value) noexcept
{
    return std::popcount(value);
}

/// Finds the smallest number of bits needed to represent the given value
/// bit_width(0) == 0, bit_width(1) == 1, bit_width(255) == 8
[[nodiscard]] EC_FORCE_INLINE constexpr int bit_width(u64 value) noexcept
{
    return int(std::bit_width(value));
}

// =========================================================================================================
// Permutations
// =========================================================================================================

/// Reverses the order of bytes
/// byte_swap(0x0102030405060708) == 0x0807060504030201
[[nodiscard]] constexpr u64 byte_swap(u64 value) noexcept
{
    return std::byteswap(value);
}

/// Reverses the order of all 64 bits (bit 0 becomes bit 63)
[[nodiscard]] constexpr u64 bit_reverse(u64 value) noexcept
{
    // swap adjacent bits, then pairs, then nibbles, then whole bytes
    value = ((value >> 1) & 0x5555'5555'5555'5555) | ((value & 0x5555'5555'5555'5555) << 1);
    value = ((value >> 2) & 0x3333'3333'3333'3333) | ((value & 0x3333'3333'3333'3333) << 2);
    value = ((value >> 4) & 0x0F0F'0F0F'0F0F'0F0F) | ((value & 0x0F0F'0F0F'0F0F'0F0F) << 4);
    return std::byteswap(value);
}

/// Rotates bits to the left by shift positions (with wrap-around)
/// Negative shift performs right rotation
[[nodiscard]] constexpr u64 bit_rotate_left(u64 value, int shift) noexcept
{
    return std::rotl(value, shift);
}

/// Rotates bits to the right by shift positions (with wrap-around)
/// Negative shift performs left rotation
[[nodiscard]] constexpr u64 bit_rotate_right(u64 value, int shift) noexcept
{
    return std::rotr(value, shift);
}
} // namespace ec

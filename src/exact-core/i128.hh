#pragma once

#include <exact-core/assert.hh>
#include <exact-core/bit.hh>
#include <exact-core/conversion.hh>
#include <exact-core/fwd.hh>
#include <exact-core/result.hh>
#include <exact-core/u128.hh>

#include <compare>
#include <string_view>

/// Signed 128-bit two's complement integer with the same word layout as u128
///
/// The value is negative iff the top bit of hi is set. Range [-2^127, 2^127 - 1].
///
/// add / sub / mul / inc / dec are bit-identical to the unsigned versions and wrap modulo 2^128.
/// Comparison, division, neg / abs and float conversion are sign aware.
/// Division strips the signs, divides the magnitudes with the u128 primitives and reapplies:
/// the quotient truncates toward zero and the remainder takes the sign of the dividend.
///
/// min() has no positive counterpart:
///   min().neg() == min(), min().abs() == min(), min().quo(minus_one()) == min() (remainder zero),
///   min().abs_u128() == 2^127 is the exact magnitude.
///
/// There are deliberately no bitwise or shift operations on i128.
struct ec::i128
{
    // construction
public:
    /// zero
    constexpr i128() = default;
    constexpr i128(u64 hi, u64 lo) : _hi(hi), _lo(lo) {}

    [[nodiscard]] static constexpr i128 from_raw(u64 hi, u64 lo) { return {hi, lo}; }

    /// Sign-extending
    [[nodiscard]] static constexpr i128 from_i64(i64 v) { return {v < 0 ? ~u64(0) : 0, u64(v)}; }
    [[nodiscard]] static constexpr i128 from_i32(i32 v) { return from_i64(v); }
    [[nodiscard]] static constexpr i128 from_i16(i16 v) { return from_i64(v); }
    [[nodiscard]] static constexpr i128 from_i8(i8 v) { return from_i64(v); }
    [[nodiscard]] static constexpr i128 from_u64(u64 v) { return {0, v}; }

    /// Truncates toward zero
    /// NaN -> {0, false}, values >= 2^127 and +Inf -> {max, false}, values < -2^127 and -Inf -> {min, false}
    [[nodiscard]] static conversion<i128> from_f64(f64 v);
    [[nodiscard]] static conversion<i128> from_f32(f32 v);

    [[nodiscard]] static i128 must_from_f64(f64 v);
    [[nodiscard]] static i128 must_from_f32(f32 v);

    /// Parses an optionally signed decimal number, see ec::parse_decimal
    [[nodiscard]] static result<i128, parse_error> from_string(std::string_view text);

    /// Malformed or out of range text is a contract violation
    [[nodiscard]] static i128 must_from_string(std::string_view text);

    [[nodiscard]] static constexpr i128 max() { return {0x7FFF'FFFF'FFFF'FFFF, ~u64(0)}; }
    [[nodiscard]] static constexpr i128 min() { return {0x8000'0000'0000'0000, 0}; }
    [[nodiscard]] static constexpr i128 zero() { return {}; }
    [[nodiscard]] static constexpr i128 minus_one() { return {~u64(0), ~u64(0)}; }

    // queries
public:
    [[nodiscard]] constexpr u64 hi() const { return _hi; }
    [[nodiscard]] constexpr u64 lo() const { return _lo; }
    [[nodiscard]] constexpr wide_word raw() const { return {_hi, _lo}; }

    [[nodiscard]] constexpr bool is_zero() const { return (_hi | _lo) == 0; }
    [[nodiscard]] constexpr bool is_negative() const { return (_hi >> 63) != 0; }

    /// -1, 0 or 1
    [[nodiscard]] constexpr int sign() const
    {
        if (is_negative())
            return -1;
        return is_zero() ? 0 : 1;
    }

    // comparison
public:
    /// -1, 0 or 1
    [[nodiscard]] constexpr int cmp(i128 n) const
    {
        // differing signs decide on their own, equal signs order like the unsigned bit patterns
        if (is_negative() != n.is_negative())
            return is_negative() ? -1 : 1;
        if (_hi != n._hi)
            return _hi > n._hi ? 1 : -1;
        if (_lo != n._lo)
            return _lo > n._lo ? 1 : -1;
        return 0;
    }

    [[nodiscard]] constexpr int cmp64(i64 n) const { return cmp(from_i64(n)); }

    [[nodiscard]] constexpr bool equal(i128 n) const { return _hi == n._hi && _lo == n._lo; }
    [[nodiscard]] constexpr bool equal64(i64 n) const { return equal(from_i64(n)); }

    [[nodiscard]] constexpr bool greater_than(i128 n) const { return cmp(n) > 0; }
    [[nodiscard]] constexpr bool greater_than64(i64 n) const { return cmp64(n) > 0; }
    [[nodiscard]] constexpr bool greater_or_equal(i128 n) const { return cmp(n) >= 0; }
    [[nodiscard]] constexpr bool greater_or_equal64(i64 n) const { return cmp64(n) >= 0; }
    [[nodiscard]] constexpr bool less_than(i128 n) const { return cmp(n) < 0; }
    [[nodiscard]] constexpr bool less_than64(i64 n) const { return cmp64(n) < 0; }
    [[nodiscard]] constexpr bool less_or_equal(i128 n) const { return cmp(n) <= 0; }
    [[nodiscard]] constexpr bool less_or_equal64(i64 n) const { return cmp64(n) <= 0; }

    friend constexpr bool operator==(i128, i128) = default;
    friend constexpr std::strong_ordering operator<=>(i128 a, i128 b) { return a.cmp(b) <=> 0; }

    // arithmetic (wrapping)
public:
    [[nodiscard]] constexpr i128 add(i128 n) const
    {
        auto const [lo, carry] = ec::add_with_carry(_lo, n._lo, 0);
        return {_hi + n._hi + carry, lo};
    }

    [[nodiscard]] constexpr i128 add64(i64 n) const { return add(from_i64(n)); }

    [[nodiscard]] constexpr i128 sub(i128 n) const
    {
        auto const [lo, borrow] = ec::sub_with_borrow(_lo, n._lo, 0);
        return {_hi - n._hi - borrow, lo};
    }

    [[nodiscard]] constexpr i128 sub64(i64 n) const { return sub(from_i64(n)); }

    [[nodiscard]] constexpr i128 inc() const { return add(from_i64(1)); }
    [[nodiscard]] constexpr i128 dec() const { return sub(from_i64(1)); }

    [[nodiscard]] constexpr i128 mul(i128 n) const
    {
        auto const [hi, lo] = ec::mul_wide(_lo, n._lo);
        return {hi + _hi * n._lo + _lo * n._hi, lo};
    }

    [[nodiscard]] constexpr i128 mul64(i64 n) const { return mul(from_i64(n)); }

    /// Two's complement negation, min() is its own negation
    [[nodiscard]] constexpr i128 neg() const
    {
        if (equal(min()))
            return *this;
        auto const [lo, carry] = ec::add_with_carry(~_lo, 1, 0);
        return {~_hi + carry, lo};
    }

    /// min().abs() == min()
    [[nodiscard]] constexpr i128 abs() const { return is_negative() ? neg() : *this; }

    /// Exact magnitude, 2^127 for min()
    [[nodiscard]] constexpr u128 abs_u128() const
    {
        if (!is_negative())
            return {_hi, _lo};
        return u128(~_hi, ~_lo).inc();
    }

    // division
    // a zero divisor is a contract violation
public:
    [[nodiscard]] i128 quo(i128 by) const;
    [[nodiscard]] i128 quo64(i64 by) const;
    [[nodiscard]] i128 rem(i128 by) const;
    [[nodiscard]] i64 rem64(i64 by) const;
    [[nodiscard]] quo_rem_result<i128> quo_rem(i128 by) const;
    [[nodiscard]] quo_rem_result<i128, i64> quo_rem64(i64 by) const;

    // conversions
public:
    /// Correctly rounded
    [[nodiscard]] f64 as_f64() const;

    /// Low 64 bits reinterpreted as two's complement
    [[nodiscard]] constexpr i64 as_i64() const { return i64(_lo); }
    [[nodiscard]] constexpr bool is_i64() const
    {
        // representable iff hi is the sign extension of lo
        return _hi == ((_lo >> 63) != 0 ? ~u64(0) : 0);
    }
    /// Contract violation if the value does not fit
    [[nodiscard]] i64 must_i64() const;

    /// Low 64 bits
    [[nodiscard]] constexpr u64 as_u64() const { return _lo; }
    [[nodiscard]] constexpr bool is_u64() const { return _hi == 0; }
    /// Contract violation if the value does not fit
    [[nodiscard]] u64 must_u64() const;

    /// Same bits reinterpreted as unsigned
    [[nodiscard]] constexpr u128 as_u128() const { return {_hi, _lo}; }
    [[nodiscard]] constexpr bool is_u128() const { return !is_negative(); }

    // operators
public:
    friend constexpr i128 operator+(i128 a, i128 b) { return a.add(b); }
    friend constexpr i128 operator-(i128 a, i128 b) { return a.sub(b); }
    friend constexpr i128 operator*(i128 a, i128 b) { return a.mul(b); }
    friend i128 operator/(i128 a, i128 b) { return a.quo(b); }
    friend i128 operator%(i128 a, i128 b) { return a.rem(b); }
    friend constexpr i128 operator-(i128 a) { return a.neg(); }

    constexpr i128& operator+=(i128 n) { return *this = add(n); }
    constexpr i128& operator-=(i128 n) { return *this = sub(n); }
    constexpr i128& operator*=(i128 n) { return *this = mul(n); }
    i128& operator/=(i128 n) { return *this = quo(n); }
    i128& operator%=(i128 n) { return *this = rem(n); }

    constexpr i128& operator++() { return *this = inc(); }
    constexpr i128& operator--() { return *this = dec(); }
    constexpr i128 operator++(int)
    {
        auto const r = *this;
        *this = inc();
        return r;
    }
    constexpr i128 operator--(int)
    {
        auto const r = *this;
        *this = dec();
        return r;
    }

private:
    u64 _hi = 0;
    u64 _lo = 0;
};

namespace ec
{
/// Subtracts the operand with the smaller bit pattern (compared as unsigned) from the other, wrapping
/// For operands of equal sign this is |a - b|
[[nodiscard]] constexpr i128 difference(i128 a, i128 b)
{
    return a.as_u128() < b.as_u128() ? b.sub(a) : a.sub(b);
}
} // namespace ec

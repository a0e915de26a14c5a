#pragma once

#include <exact-core/assert.hh>
#include <exact-core/bit.hh>
#include <exact-core/conversion.hh>
#include <exact-core/fwd.hh>
#include <exact-core/result.hh>

#include <array>
#include <compare>
#include <span>
#include <string_view>

/// Quotient and remainder of a truncating division
template <class Q, class R>
struct ec::quo_rem_result
{
    Q quo;
    R rem;

    constexpr bool operator==(quo_rem_result const&) const = default;
};

/// Unsigned 128-bit integer built from two 64-bit words
///
/// Represents hi * 2^64 + lo, range [0, 2^128 - 1].
/// Pure value type: every operation returns a new value, nothing is mutated except through
/// the compound assignment operators.
///
/// Semantics:
///   - add / sub / mul / inc / dec wrap modulo 2^128, silently
///   - quo / rem truncate, division by zero is a contract violation (EC_ASSERT_ALWAYS)
///   - shifts are logical, shift amounts >= 128 produce zero
///   - rotations take the amount modulo 128, negative amounts rotate right
///   - conversions that may lose information report it through conversion<T>::in_range
///
/// The named methods mirror the operators, the 64-bit variants avoid widening the operand:
///   auto a = ec::u128::from_u64(10);
///   auto b = a.mul64(3).add(ec::u128::max()); // wraps: 29
///   auto c = a * b + ec::u128::from_u64(1);
///
/// Layout is exactly two u64 words with hi first; the type is trivially copyable.
struct ec::u128
{
    // construction
public:
    /// zero
    constexpr u128() = default;
    constexpr u128(u64 hi, u64 lo) : _hi(hi), _lo(lo) {}

    [[nodiscard]] static constexpr u128 from_raw(u64 hi, u64 lo) { return {hi, lo}; }

    [[nodiscard]] static constexpr u128 from_u64(u64 v) { return {0, v}; }
    [[nodiscard]] static constexpr u128 from_u32(u32 v) { return {0, v}; }
    [[nodiscard]] static constexpr u128 from_u16(u16 v) { return {0, v}; }
    [[nodiscard]] static constexpr u128 from_u8(u8 v) { return {0, v}; }

    /// Negative inputs produce {0, false}
    [[nodiscard]] static constexpr conversion<u128> from_i64(i64 v)
    {
        if (v < 0)
            return {u128(), false};
        return {u128(0, u64(v)), true};
    }

    /// Like from_i64, but a negative input is a contract violation
    [[nodiscard]] static u128 must_from_i64(i64 v);

    /// Truncates toward zero
    /// NaN -> {0, false}, values >= 2^128 and +Inf -> {max, false}, values <= -1 and -Inf -> {0, false}
    [[nodiscard]] static conversion<u128> from_f64(f64 v);
    [[nodiscard]] static conversion<u128> from_f32(f32 v);

    /// Like from_f64 / from_f32, but a result that is not in range is a contract violation
    [[nodiscard]] static u128 must_from_f64(f64 v);
    [[nodiscard]] static u128 must_from_f32(f32 v);

    /// Reads the first 16 bytes, fewer bytes are a contract violation
    [[nodiscard]] static u128 from_big_endian(std::span<byte const> bytes);
    [[nodiscard]] static u128 from_little_endian(std::span<byte const> bytes);

    /// Parses an optionally signed decimal number, see ec::parse_decimal
    [[nodiscard]] static result<u128, parse_error> from_string(std::string_view text);
    [[nodiscard]] static u128 must_from_string(std::string_view text);

    [[nodiscard]] static constexpr u128 max() { return {~u64(0), ~u64(0)}; }
    [[nodiscard]] static constexpr u128 zero() { return {}; }

    // queries
public:
    [[nodiscard]] constexpr u64 hi() const { return _hi; }
    [[nodiscard]] constexpr u64 lo() const { return _lo; }
    [[nodiscard]] constexpr wide_word raw() const { return {_hi, _lo}; }

    [[nodiscard]] constexpr bool is_zero() const { return (_hi | _lo) == 0; }

    // comparison
public:
    /// -1, 0 or 1
    [[nodiscard]] constexpr int cmp(u128 n) const
    {
        if (_hi != n._hi)
            return _hi > n._hi ? 1 : -1;
        if (_lo != n._lo)
            return _lo > n._lo ? 1 : -1;
        return 0;
    }

    [[nodiscard]] constexpr int cmp64(u64 n) const
    {
        if (_hi != 0)
            return 1;
        if (_lo != n)
            return _lo > n ? 1 : -1;
        return 0;
    }

    [[nodiscard]] constexpr bool equal(u128 n) const { return _hi == n._hi && _lo == n._lo; }
    [[nodiscard]] constexpr bool equal64(u64 n) const { return _hi == 0 && _lo == n; }

    [[nodiscard]] constexpr bool greater_than(u128 n) const { return _hi > n._hi || (_hi == n._hi && _lo > n._lo); }
    [[nodiscard]] constexpr bool greater_than64(u64 n) const { return _hi != 0 || _lo > n; }
    [[nodiscard]] constexpr bool greater_or_equal(u128 n) const { return !less_than(n); }
    [[nodiscard]] constexpr bool greater_or_equal64(u64 n) const { return _hi != 0 || _lo >= n; }
    [[nodiscard]] constexpr bool less_than(u128 n) const { return _hi < n._hi || (_hi == n._hi && _lo < n._lo); }
    [[nodiscard]] constexpr bool less_than64(u64 n) const { return _hi == 0 && _lo < n; }
    [[nodiscard]] constexpr bool less_or_equal(u128 n) const { return !greater_than(n); }
    [[nodiscard]] constexpr bool less_or_equal64(u64 n) const { return _hi == 0 && _lo <= n; }

    friend constexpr bool operator==(u128, u128) = default;
    friend constexpr std::strong_ordering operator<=>(u128 a, u128 b)
    {
        return a._hi != b._hi ? a._hi <=> b._hi : a._lo <=> b._lo;
    }

    // arithmetic (wrapping)
public:
    [[nodiscard]] constexpr u128 add(u128 n) const
    {
        auto const [lo, carry] = ec::add_with_carry(_lo, n._lo, 0);
        return {_hi + n._hi + carry, lo};
    }

    [[nodiscard]] constexpr u128 add64(u64 n) const
    {
        auto const [lo, carry] = ec::add_with_carry(_lo, n, 0);
        return {_hi + carry, lo};
    }

    [[nodiscard]] constexpr u128 sub(u128 n) const
    {
        auto const [lo, borrow] = ec::sub_with_borrow(_lo, n._lo, 0);
        return {_hi - n._hi - borrow, lo};
    }

    [[nodiscard]] constexpr u128 sub64(u64 n) const
    {
        auto const [lo, borrow] = ec::sub_with_borrow(_lo, n, 0);
        return {_hi - borrow, lo};
    }

    [[nodiscard]] constexpr u128 inc() const { return add64(1); }
    [[nodiscard]] constexpr u128 dec() const { return sub64(1); }

    /// Low 128 bits of the product
    [[nodiscard]] constexpr u128 mul(u128 n) const
    {
        auto const [hi, lo] = ec::mul_wide(_lo, n._lo);
        return {hi + _hi * n._lo + _lo * n._hi, lo};
    }

    [[nodiscard]] constexpr u128 mul64(u64 n) const
    {
        auto const [hi, lo] = ec::mul_wide(_lo, n);
        return {hi + _hi * n, lo};
    }

    // division
    // a zero divisor is a contract violation
public:
    [[nodiscard]] u128 quo(u128 by) const;
    [[nodiscard]] u128 quo64(u64 by) const;
    [[nodiscard]] u128 rem(u128 by) const;
    [[nodiscard]] u64 rem64(u64 by) const;
    [[nodiscard]] quo_rem_result<u128> quo_rem(u128 by) const;
    [[nodiscard]] quo_rem_result<u128, u64> quo_rem64(u64 by) const;

    // bitwise
public:
    [[nodiscard]] constexpr u128 bit_and(u128 n) const { return {_hi & n._hi, _lo & n._lo}; }
    [[nodiscard]] constexpr u128 bit_and64(u64 n) const { return {0, _lo & n}; }
    [[nodiscard]] constexpr u128 bit_and_not(u128 n) const { return {_hi & ~n._hi, _lo & ~n._lo}; }
    [[nodiscard]] constexpr u128 bit_or(u128 n) const { return {_hi | n._hi, _lo | n._lo}; }
    [[nodiscard]] constexpr u128 bit_or64(u64 n) const { return {_hi, _lo | n}; }
    [[nodiscard]] constexpr u128 bit_xor(u128 n) const { return {_hi ^ n._hi, _lo ^ n._lo}; }
    [[nodiscard]] constexpr u128 bit_xor64(u64 n) const { return {_hi, _lo ^ n}; }
    [[nodiscard]] constexpr u128 bit_not() const { return {~_hi, ~_lo}; }

    /// Logical shift left, n >= 128 yields zero
    [[nodiscard]] constexpr u128 lsh(unsigned n) const
    {
        // a shift by the full word width is undefined on u64, so 0 and 64 are separate cases
        if (n == 0)
            return *this;
        if (n >= 128)
            return {};
        if (n >= 64)
            return {_lo << (n - 64), 0};
        return {(_hi << n) | (_lo >> (64 - n)), _lo << n};
    }

    /// Logical shift right, n >= 128 yields zero
    [[nodiscard]] constexpr u128 rsh(unsigned n) const
    {
        if (n == 0)
            return *this;
        if (n >= 128)
            return {};
        if (n >= 64)
            return {0, _hi >> (n - 64)};
        return {_hi >> n, (_lo >> n) | (_hi << (64 - n))};
    }

    /// Rotates left by k modulo 128, a negative k rotates right by -k
    /// rotate_left(k).rotate_left(-k) == *this for every k
    [[nodiscard]] constexpr u128 rotate_left(int k) const
    {
        // two's complement masking maps -k to 128 - (k mod 128)
        unsigned s = unsigned(k) & 127u;
        if (s == 0)
            return *this;
        if (s == 64)
            return {_lo, _hi};
        if (s < 64)
            return {(_hi << s) | (_lo >> (64 - s)), (_lo << s) | (_hi >> (64 - s))};

        // rotating by more than 64 is a word swap followed by a rotation by s - 64
        s -= 64;
        return {(_lo << s) | (_hi >> (64 - s)), (_hi << s) | (_lo >> (64 - s))};
    }

    /// Value of bit i (0 or 1), i outside [0, 128) is a contract violation
    [[nodiscard]] unsigned bit(int i) const;

    /// Copy with bit i set to b, i outside [0, 128) or b outside {0, 1} is a contract violation
    [[nodiscard]] u128 set_bit(int i, unsigned b) const;

    /// Minimum number of bits to represent the value, bit_len() == 0 for zero
    [[nodiscard]] constexpr int bit_len() const { return 128 - leading_zeros(); }

    [[nodiscard]] constexpr int leading_zeros() const
    {
        if (_hi != 0)
            return ec::count_leading_zeroes(_hi);
        return 64 + ec::count_leading_zeroes(_lo);
    }

    [[nodiscard]] constexpr int trailing_zeros() const
    {
        if (_lo != 0)
            return ec::count_trailing_zeroes(_lo);
        return 64 + ec::count_trailing_zeroes(_hi);
    }

    [[nodiscard]] constexpr int ones_count() const { return ec::popcount(_hi) + ec::popcount(_lo); }

    [[nodiscard]] constexpr u128 reverse() const { return {ec::bit_reverse(_lo), ec::bit_reverse(_hi)}; }
    [[nodiscard]] constexpr u128 reverse_bytes() const { return {ec::byte_swap(_lo), ec::byte_swap(_hi)}; }

    // conversions
public:
    /// Correctly rounded (round to nearest, ties to even)
    [[nodiscard]] f64 as_f64() const;

    /// Low 64 bits
    [[nodiscard]] constexpr u64 as_u64() const { return _lo; }
    [[nodiscard]] constexpr bool is_u64() const { return _hi == 0; }
    /// Contract violation if the value does not fit
    [[nodiscard]] u64 must_u64() const;

    /// Same bits reinterpreted as two's complement
    [[nodiscard]] i128 as_i128() const;
    [[nodiscard]] constexpr bool is_i128() const { return (_hi >> 63) == 0; }

    /// Writes 16 bytes, a smaller destination is a contract violation
    void put_big_endian(std::span<byte> bytes) const;
    void put_little_endian(std::span<byte> bytes) const;

    [[nodiscard]] std::array<byte, 16> to_big_endian() const;
    [[nodiscard]] std::array<byte, 16> to_little_endian() const;

    // operators
public:
    friend constexpr u128 operator+(u128 a, u128 b) { return a.add(b); }
    friend constexpr u128 operator-(u128 a, u128 b) { return a.sub(b); }
    friend constexpr u128 operator*(u128 a, u128 b) { return a.mul(b); }
    friend u128 operator/(u128 a, u128 b) { return a.quo(b); }
    friend u128 operator%(u128 a, u128 b) { return a.rem(b); }

    friend constexpr u128 operator&(u128 a, u128 b) { return a.bit_and(b); }
    friend constexpr u128 operator|(u128 a, u128 b) { return a.bit_or(b); }
    friend constexpr u128 operator^(u128 a, u128 b) { return a.bit_xor(b); }
    friend constexpr u128 operator~(u128 a) { return a.bit_not(); }
    friend constexpr u128 operator<<(u128 a, unsigned n) { return a.lsh(n); }
    friend constexpr u128 operator>>(u128 a, unsigned n) { return a.rsh(n); }

    constexpr u128& operator+=(u128 n) { return *this = add(n); }
    constexpr u128& operator-=(u128 n) { return *this = sub(n); }
    constexpr u128& operator*=(u128 n) { return *this = mul(n); }
    u128& operator/=(u128 n) { return *this = quo(n); }
    u128& operator%=(u128 n) { return *this = rem(n); }
    constexpr u128& operator&=(u128 n) { return *this = bit_and(n); }
    constexpr u128& operator|=(u128 n) { return *this = bit_or(n); }
    constexpr u128& operator^=(u128 n) { return *this = bit_xor(n); }
    constexpr u128& operator<<=(unsigned n) { return *this = lsh(n); }
    constexpr u128& operator>>=(unsigned n) { return *this = rsh(n); }

    constexpr u128& operator++() { return *this = inc(); }
    constexpr u128& operator--() { return *this = dec(); }
    constexpr u128 operator++(int)
    {
        auto const r = *this;
        *this = inc();
        return r;
    }
    constexpr u128 operator--(int)
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
/// |a - b|
[[nodiscard]] constexpr u128 difference(u128 a, u128 b)
{
    return a < b ? b.sub(a) : a.sub(b);
}

[[nodiscard]] constexpr u128 larger(u128 a, u128 b)
{
    return a < b ? b : a;
}

[[nodiscard]] constexpr u128 smaller(u128 a, u128 b)
{
    return a < b ? a : b;
}
} // namespace ec

#include "u128.hh"

#include <exact-core/i128.hh>
#include <exact-core/impl/division.hh>
#include <exact-core/to_string.hh>

#include <cmath>

namespace
{
constexpr ec::f64 two_pow_64 = 18446744073709551616.0;
constexpr ec::f64 two_pow_128 = two_pow_64 * two_pow_64;

ec::u64 load_big_endian(std::span<ec::byte const> bytes)
{
    ec::u64 v = 0;
    for (auto i = 0; i < 8; ++i)
        v = (v << 8) | ec::u64(bytes[i]);
    return v;
}

ec::u64 load_little_endian(std::span<ec::byte const> bytes)
{
    ec::u64 v = 0;
    for (auto i = 7; i >= 0; --i)
        v = (v << 8) | ec::u64(bytes[i]);
    return v;
}

void store_big_endian(std::span<ec::byte> bytes, ec::u64 v)
{
    for (auto i = 7; i >= 0; --i)
    {
        bytes[i] = ec::byte(v & 0xFF);
        v >>= 8;
    }
}

void store_little_endian(std::span<ec::byte> bytes, ec::u64 v)
{
    for (auto i = 0; i < 8; ++i)
    {
        bytes[i] = ec::byte(v & 0xFF);
        v >>= 8;
    }
}
} // namespace

ec::u128 ec::u128::must_from_i64(i64 v)
{
    EC_ASSERT_ALWAYS(v >= 0, "negative value does not fit in u128");
    return {0, u64(v)};
}

ec::conversion<ec::u128> ec::u128::from_f64(f64 v)
{
    if (std::isnan(v))
        return {u128(), false};

    // range checks apply to the truncated value, so (-1, 0] still converts to zero
    f64 const t = std::trunc(v);
    if (t < 0)
        return {u128(), false};
    if (t >= two_pow_128)
        return {max(), false};

    if (t < two_pow_64)
        return {u128(0, u64(t)), true};

    // t >= 2^64 is an integer with at most 53 significant bits, both parts are exact
    return {u128(u64(t / two_pow_64), u64(std::fmod(t, two_pow_64))), true};
}

ec::conversion<ec::u128> ec::u128::from_f32(f32 v)
{
    return from_f64(f64(v));
}

ec::u128 ec::u128::must_from_f64(f64 v)
{
    auto const c = from_f64(v);
    EC_ASSERT_ALWAYS(c.in_range, "float value does not fit in u128");
    return c.value;
}

ec::u128 ec::u128::must_from_f32(f32 v)
{
    return must_from_f64(f64(v));
}

ec::u128 ec::u128::from_big_endian(std::span<byte const> bytes)
{
    EC_ASSERT_ALWAYS(bytes.size() >= 16, "buffer must hold at least 16 bytes");
    return {load_big_endian(bytes.subspan(0, 8)), load_big_endian(bytes.subspan(8, 8))};
}

ec::u128 ec::u128::from_little_endian(std::span<byte const> bytes)
{
    EC_ASSERT_ALWAYS(bytes.size() >= 16, "buffer must hold at least 16 bytes");
    return {load_little_endian(bytes.subspan(8, 8)), load_little_endian(bytes.subspan(0, 8))};
}

ec::result<ec::u128, ec::parse_error> ec::u128::from_string(std::string_view text)
{
    return ec::parse_decimal<u128>(text);
}

ec::u128 ec::u128::must_from_string(std::string_view text)
{
    auto const r = from_string(text);
    EC_ASSERT_ALWAYS(r.has_value(), "text is not a decimal number in u128 range");
    return r.value();
}

ec::u128 ec::u128::quo(u128 by) const
{
    return impl::divide(*this, by).quo;
}

ec::u128 ec::u128::quo64(u64 by) const
{
    return impl::divide64(*this, by).quo;
}

ec::u128 ec::u128::rem(u128 by) const
{
    return impl::divide(*this, by).rem;
}

ec::u64 ec::u128::rem64(u64 by) const
{
    return impl::divide64(*this, by).rem;
}

ec::quo_rem_result<ec::u128> ec::u128::quo_rem(u128 by) const
{
    return impl::divide(*this, by);
}

ec::quo_rem_result<ec::u128, ec::u64> ec::u128::quo_rem64(u64 by) const
{
    return impl::divide64(*this, by);
}

unsigned ec::u128::bit(int i) const
{
    EC_ASSERT_ALWAYS(i >= 0 && i < 128, "bit index must be in [0, 128)");
    if (i < 64)
        return unsigned(_lo >> i) & 1u;
    return unsigned(_hi >> (i - 64)) & 1u;
}

ec::u128 ec::u128::set_bit(int i, unsigned b) const
{
    EC_ASSERT_ALWAYS(i >= 0 && i < 128, "bit index must be in [0, 128)");
    EC_ASSERT_ALWAYS(b <= 1, "bit value must be 0 or 1");

    auto r = *this;
    u64& word = i < 64 ? r._lo : r._hi;
    u64 const mask = u64(1) << (i & 63);
    if (b == 0)
        word &= ~mask;
    else
        word |= mask;
    return r;
}

ec::f64 ec::u128::as_f64() const
{
    if (_hi == 0)
        return f64(_lo);

    // keep the top 64 bits and fold every dropped bit into a sticky bit,
    // so the single rounding step in the u64 -> f64 conversion sees the exact tie information
    int const shift = bit_len() - 64; // in [1, 64]
    u64 top = rsh(unsigned(shift)).lo();
    u64 const dropped = shift == 64 ? _lo : _lo & ((u64(1) << shift) - 1);
    if (dropped != 0)
        top |= 1;

    return std::ldexp(f64(top), shift);
}

ec::u64 ec::u128::must_u64() const
{
    EC_ASSERT_ALWAYS(is_u64(), "value does not fit in u64");
    return _lo;
}

ec::i128 ec::u128::as_i128() const
{
    return i128::from_raw(_hi, _lo);
}

void ec::u128::put_big_endian(std::span<byte> bytes) const
{
    EC_ASSERT_ALWAYS(bytes.size() >= 16, "buffer must hold at least 16 bytes");
    store_big_endian(bytes.subspan(0, 8), _hi);
    store_big_endian(bytes.subspan(8, 8), _lo);
}

void ec::u128::put_little_endian(std::span<byte> bytes) const
{
    EC_ASSERT_ALWAYS(bytes.size() >= 16, "buffer must hold at least 16 bytes");
    store_little_endian(bytes.subspan(0, 8), _lo);
    store_little_endian(bytes.subspan(8, 8), _hi);
}

std::array<ec::byte, 16> ec::u128::to_big_endian() const
{
    std::array<byte, 16> bytes;
    put_big_endian(bytes);
    return bytes;
}

std::array<ec::byte, 16> ec::u128::to_little_endian() const
{
    std::array<byte, 16> bytes;
    put_little_endian(bytes);
    return bytes;
}

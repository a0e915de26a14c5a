#include "i128.hh"

#include <exact-core/impl/division.hh>
#include <exact-core/to_string.hh>

#include <cmath>

namespace
{
constexpr ec::f64 two_pow_127 = 170141183460469231731687303715884105728.0;
}

ec::conversion<ec::i128> ec::i128::from_f64(f64 v)
{
    if (std::isnan(v))
        return {i128(), false};

    f64 const t = std::trunc(v);
    if (t >= two_pow_127)
        return {max(), false};
    if (t < -two_pow_127)
        return {min(), false};

    // |t| <= 2^127 converts exactly, and -2^127 wraps onto min() through the negation
    auto const magnitude = u128::from_f64(std::fabs(t)).value.as_i128();
    return {t < 0 ? magnitude.neg() : magnitude, true};
}

ec::conversion<ec::i128> ec::i128::from_f32(f32 v)
{
    return from_f64(f64(v));
}

ec::i128 ec::i128::must_from_f64(f64 v)
{
    auto const c = from_f64(v);
    EC_ASSERT_ALWAYS(c.in_range, "float value does not fit in i128");
    return c.value;
}

ec::i128 ec::i128::must_from_f32(f32 v)
{
    return must_from_f64(f64(v));
}

ec::result<ec::i128, ec::parse_error> ec::i128::from_string(std::string_view text)
{
    return ec::parse_decimal<i128>(text);
}

ec::i128 ec::i128::must_from_string(std::string_view text)
{
    auto const r = from_string(text);
    EC_ASSERT_ALWAYS(r.has_value(), "text is not a decimal number in i128 range");
    return r.value();
}

ec::quo_rem_result<ec::i128> ec::i128::quo_rem(i128 by) const
{
    EC_ASSERT_ALWAYS(!by.is_zero(), "division by zero");

    auto const [q, r] = impl::divide(abs_u128(), by.abs_u128());

    // min() / -1 yields the magnitude 2^127, whose bit pattern is min() again
    auto quo = q.as_i128();
    if (is_negative() != by.is_negative())
        quo = quo.neg();

    auto rem = r.as_i128();
    if (is_negative())
        rem = rem.neg();

    return {quo, rem};
}

ec::quo_rem_result<ec::i128, ec::i64> ec::i128::quo_rem64(i64 by) const
{
    EC_ASSERT_ALWAYS(by != 0, "division by zero");

    // 0 - u64(by) is the magnitude even for the most negative i64
    u64 const magnitude = by < 0 ? 0 - u64(by) : u64(by);
    auto const [q, r] = impl::divide64(abs_u128(), magnitude);

    auto quo = q.as_i128();
    if (is_negative() != (by < 0))
        quo = quo.neg();

    // r < |by| <= 2^63 always fits in i64
    auto rem = i64(r);
    if (is_negative())
        rem = -rem;

    return {quo, rem};
}

ec::i128 ec::i128::quo(i128 by) const
{
    return quo_rem(by).quo;
}

ec::i128 ec::i128::quo64(i64 by) const
{
    return quo_rem64(by).quo;
}

ec::i128 ec::i128::rem(i128 by) const
{
    return quo_rem(by).rem;
}

ec::i64 ec::i128::rem64(i64 by) const
{
    return quo_rem64(by).rem;
}

ec::f64 ec::i128::as_f64() const
{
    if (is_negative())
        return -abs_u128().as_f64();
    return as_u128().as_f64();
}

ec::i64 ec::i128::must_i64() const
{
    EC_ASSERT_ALWAYS(is_i64(), "value does not fit in i64");
    return i64(_lo);
}

ec::u64 ec::i128::must_u64() const
{
    EC_ASSERT_ALWAYS(is_u64(), "value does not fit in u64");
    return _lo;
}

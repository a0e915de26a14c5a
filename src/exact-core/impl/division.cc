#include "division.hh"

#include <exact-core/assert.hh>
#include <exact-core/bit.hh>

ec::u64 ec::impl::divide_128_by_64(u64 u1, u64 u0, u64 v, u64& remainder)
{
    EC_ASSERT(u1 < v, "quotient of 128-by-64 division must fit in 64 bits");

    constexpr u64 b = u64(1) << 32; // number base, one digit is 32 bits
    constexpr u64 mask32 = b - 1;

    // normalize so the divisor's top bit is set
    int const s = ec::count_leading_zeroes(v);
    v <<= s;
    u64 const vn1 = v >> 32;
    u64 const vn0 = v & mask32;

    u64 const un32 = s == 0 ? u1 : (u1 << s) | (u0 >> (64 - s));
    u64 const un10 = u0 << s;
    u64 const un1 = un10 >> 32;
    u64 const un0 = un10 & mask32;

    // first quotient digit, estimate then correct at most twice
    u64 q1 = un32 / vn1;
    u64 rhat = un32 - q1 * vn1;
    while (q1 >= b || q1 * vn0 > b * rhat + un1)
    {
        --q1;
        rhat += vn1;
        if (rhat >= b)
            break;
    }

    u64 const un21 = un32 * b + un1 - q1 * v;

    // second quotient digit
    u64 q0 = un21 / vn1;
    rhat = un21 - q0 * vn1;
    while (q0 >= b || q0 * vn0 > b * rhat + un0)
    {
        --q0;
        rhat += vn1;
        if (rhat >= b)
            break;
    }

    remainder = (un21 * b + un0 - q0 * v) >> s;
    return q1 * b + q0;
}

ec::quo_rem_result<ec::u128> ec::impl::divide_binary(u128 u, u128 v)
{
    EC_ASSERT(!v.is_zero() && u >= v, "binary division needs a nonzero divisor not above the dividend");

    // align the divisor's top bit with the dividend's, then produce one quotient bit per position
    int const shift = v.leading_zeros() - u.leading_zeros();
    v = v.lsh(unsigned(shift));

    u128 q;
    for (auto i = 0; i <= shift; ++i)
    {
        q = q.lsh(1);
        if (u >= v)
        {
            u = u.sub(v);
            q = q.bit_or64(1);
        }
        v = v.rsh(1);
    }

    return {q, u};
}

ec::quo_rem_result<ec::u128> ec::impl::divide_normalized(u128 u, u128 v)
{
    EC_ASSERT(!v.is_zero(), "divisor must be nonzero");

    if (v.hi() == 0)
    {
        auto const [q, r] = divide64(u, v.lo());
        return {q, u128::from_u64(r)};
    }

    // v >= 2^64, so the quotient fits in 64 bits.
    // Dividing u/2 by the top word of the normalized divisor underestimates the true quotient
    // by at most one after the decrement below, a single correction step fixes it.
    int const n = ec::count_leading_zeroes(v.hi());
    u128 const v1 = v.lsh(unsigned(n));
    u128 const u1 = u.rsh(1);

    u64 ignored = 0;
    u64 tq = divide_128_by_64(u1.hi(), u1.lo(), v1.hi(), ignored);
    tq >>= 63 - n;
    if (tq != 0)
        --tq;

    auto q = u128::from_u64(tq);
    auto r = u.sub(v.mul64(tq));
    if (r >= v)
    {
        q = q.inc();
        r = r.sub(v);
    }

    return {q, r};
}

ec::quo_rem_result<ec::u128> ec::impl::divide(u128 u, u128 v)
{
    EC_ASSERT_ALWAYS(!v.is_zero(), "division by zero");

    if ((u.hi() | v.hi()) == 0)
        return {u128::from_u64(u.lo() / v.lo()), u128::from_u64(u.lo() % v.lo())};

    int const v_lz = v.leading_zeros();
    int const v_tz = v.trailing_zeros();

    if (v_lz == 127) // v == 1
        return {u, u128()};

    if (v_lz + v_tz == 127) // single set bit
        return {u.rsh(unsigned(v_tz)), u.bit_and(v.dec())};

    int const c = u.cmp(v);
    if (c < 0)
        return {u128(), u};
    if (c == 0)
        return {u128::from_u64(1), u128()};

    int const u_lz = u.leading_zeros();
    if (v_lz - u_lz > binary_division_spill)
        return divide_normalized(u, v);

    return divide_binary(u, v);
}

ec::quo_rem_result<ec::u128, ec::u64> ec::impl::divide64(u128 u, u64 v)
{
    EC_ASSERT_ALWAYS(v != 0, "division by zero");

    if (u.hi() == 0)
        return {u128::from_u64(u.lo() / v), u.lo() % v};

    u64 r = 0;
    if (u.hi() < v)
    {
        u64 const lo = divide_128_by_64(u.hi(), u.lo(), v, r);
        return {u128::from_u64(lo), r};
    }

    // quotient needs both words: divide the high word natively, carry its remainder into the low step
    u64 const hi = u.hi() / v;
    u64 const k = u.hi() % v;
    u64 const lo = divide_128_by_64(k, u.lo(), v, r);
    return {u128(hi, lo), r};
}

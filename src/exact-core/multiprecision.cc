#include "multiprecision.hh"

#include <exact-core/assert.hh>
#include <exact-core/i128.hh>
#include <exact-core/u128.hh>

namespace
{
ec::big_int const& word_mask()
{
    static ec::big_int const mask = (ec::big_int(1) << 64) - 1;
    return mask;
}

// precondition: 0 <= v < 2^128
ec::u128 split_words(ec::big_int const& v)
{
    auto const hi = static_cast<ec::u64>(ec::big_int(v >> 64));
    auto const lo = static_cast<ec::u64>(ec::big_int(v & word_mask()));
    return {hi, lo};
}
} // namespace

ec::big_int ec::to_cpp_int(u128 v)
{
    return (big_int(v.hi()) << 64) | big_int(v.lo());
}

ec::big_int ec::to_cpp_int(i128 v)
{
    if (v.is_negative())
        return -ec::to_cpp_int(v.abs_u128());
    return ec::to_cpp_int(v.as_u128());
}

ec::conversion<ec::u128> ec::u128_from_cpp_int(big_int const& v)
{
    if (v.sign() < 0)
        return {u128(), false};
    if (v > ec::to_cpp_int(u128::max()))
        return {u128::max(), false};
    return {split_words(v), true};
}

ec::conversion<ec::i128> ec::i128_from_cpp_int(big_int const& v)
{
    if (v < ec::to_cpp_int(i128::min()))
        return {i128::min(), false};
    if (v > ec::to_cpp_int(i128::max()))
        return {i128::max(), false};

    // the magnitude is at most 2^127, whose bit pattern negates onto min()
    auto const magnitude = split_words(boost::multiprecision::abs(v)).as_i128();
    return {v.sign() < 0 ? magnitude.neg() : magnitude, true};
}

ec::u128 ec::must_u128_from_cpp_int(big_int const& v)
{
    auto const c = ec::u128_from_cpp_int(v);
    EC_ASSERT_ALWAYS(c.in_range, "cpp_int value does not fit in u128");
    return c.value;
}

ec::i128 ec::must_i128_from_cpp_int(big_int const& v)
{
    auto const c = ec::i128_from_cpp_int(v);
    EC_ASSERT_ALWAYS(c.in_range, "cpp_int value does not fit in i128");
    return c.value;
}

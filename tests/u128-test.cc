#include <exact-core/i128.hh>
#include <exact-core/u128.hh>

#include <nexus/test.hh>

#include "contract.hh"

#include <cmath>
#include <limits>
#include <random>
#include <type_traits>

using namespace ec::primitive_defines;

using ec::u128;

static_assert(sizeof(u128) == 16);
static_assert(std::is_trivially_copyable_v<u128>);
static_assert(u128::max().inc() == u128());
static_assert(u128().dec() == u128::max());
static_assert(u128(0, 1).lsh(64) == u128(1, 0));

namespace
{
constexpr u64 all_ones = ~u64(0);

// rotation reference built from single-bit moves
u128 rotate_bitwise(u128 v, int k)
{
    auto const s = ((k % 128) + 128) % 128;
    u128 r;
    for (auto i = 0; i < 128; ++i)
        r = r.set_bit((i + s) % 128, v.bit(i));
    return r;
}
} // namespace

// =========================================================================================================
// Arithmetic
// =========================================================================================================

TEST("u128 - add and sub propagate carries and wrap")
{
    CHECK(u128(0, all_ones).add64(1) == u128(1, 0));
    CHECK(u128(0, all_ones).add(u128(0, 1)) == u128(1, 0));
    CHECK(u128(1, 0).sub64(1) == u128(0, all_ones));
    CHECK(u128(1, 0).sub(u128(0, 1)) == u128(0, all_ones));

    SECTION("max wraps to zero")
    {
        CHECK(u128(all_ones, all_ones).inc() == u128(0, 0));
        CHECK(u128::max().add64(1) == u128::zero());
        CHECK(u128::zero().dec() == u128::max());
        CHECK(u128::zero().sub(u128(0, 1)) == u128::max());
    }

    SECTION("adding max then one is the identity")
    {
        std::mt19937_64 rng(7);
        for (auto i = 0; i < 100; ++i)
        {
            auto const a = u128(rng(), rng());
            CHECK(a.add(u128::max()).add64(1) == a);
            CHECK(a.sub(a) == u128::zero());
        }
    }
}

TEST("u128 - mul keeps the low 128 bits")
{
    CHECK(u128(0, all_ones).mul(u128(0, all_ones)) == u128(all_ones - 1, 1));
    CHECK(u128::max().mul(u128::max()) == u128(0, 1));
    CHECK(u128(1, 0).mul(u128(1, 0)) == u128::zero());
    CHECK(u128(1, 1).mul64(2) == u128(2, 2));
    CHECK(u128(0, 3).mul64(0) == u128::zero());
    CHECK(u128(0x1234, 0x5678).mul(u128(0, 1)) == u128(0x1234, 0x5678));
}

TEST("u128 - division")
{
    CHECK((u128::from_u64(1).quo_rem(u128::from_u64(2)) == ec::quo_rem_result<u128>{u128(), u128(0, 1)}));
    CHECK(u128::max().quo(u128::max()) == u128(0, 1));
    CHECK(u128::max().quo64(all_ones) == u128(1, 1));
    CHECK(u128::max().rem64(all_ones) == 0);

    // 2^64 = 3 * 6148914691236517205 + 1
    auto const [q, r] = u128(1, 0).quo_rem64(3);
    CHECK(q == u128(0, 6148914691236517205ull));
    CHECK(r == 1);

    CHECK(u128(1, 0).rem(u128(0, 3)) == u128(0, 1));
    CHECK(u128(5, 7).quo(u128(5, 7)) == u128(0, 1));
    CHECK(u128(5, 7).quo(u128(5, 8)) == u128::zero());
    CHECK(u128(5, 7).rem(u128(5, 8)) == u128(5, 7));

    SECTION("division by zero is a contract violation")
    {
        auto const a = u128(1, 2);
        CHECK(ec_test::violates_contract([&] { (void)a.quo(u128()); }));
        CHECK(ec_test::violates_contract([&] { (void)a.rem(u128()); }));
        CHECK(ec_test::violates_contract([&] { (void)a.quo_rem(u128()); }));
        CHECK(ec_test::violates_contract([&] { (void)a.quo64(0); }));
        CHECK(ec_test::violates_contract([&] { (void)a.rem64(0); }));
        CHECK(ec_test::violates_contract([&] { (void)a.quo_rem64(0); }));
        CHECK(ec_test::violates_contract([&] { (void)(a / u128()); }));
    }
}

// =========================================================================================================
// Comparison
// =========================================================================================================

TEST("u128 - ordering compares hi before lo")
{
    CHECK(u128(1, 0) > u128(0, all_ones));
    CHECK(u128(1, 0).greater_than(u128(0, all_ones)));
    CHECK(u128(0, all_ones).less_than(u128(1, 0)));
    CHECK(u128(1, 5).cmp(u128(1, 6)) == -1);
    CHECK(u128(1, 6).cmp(u128(1, 5)) == 1);
    CHECK(u128(1, 6).cmp(u128(1, 6)) == 0);
    CHECK(u128(2, 2).greater_or_equal(u128(2, 2)));
    CHECK(u128(2, 2).less_or_equal(u128(2, 2)));
    CHECK(!u128(2, 2).less_than(u128(2, 2)));

    SECTION("64-bit operands")
    {
        CHECK(u128(1, 0).cmp64(all_ones) == 1);
        CHECK(u128(0, 5).cmp64(5) == 0);
        CHECK(u128(0, 4).cmp64(5) == -1);
        CHECK(u128(0, 5).equal64(5));
        CHECK(!u128(1, 5).equal64(5));
        CHECK(u128(1, 0).greater_than64(all_ones));
        CHECK(u128(0, 5).greater_or_equal64(5));
        CHECK(u128(0, 4).less_than64(5));
        CHECK(!u128(1, 4).less_than64(5));
        CHECK(u128(0, 5).less_or_equal64(5));
    }
}

// =========================================================================================================
// Bitwise
// =========================================================================================================

TEST("u128 - boolean ops are word-wise")
{
    auto const a = u128(0xF0F0, 0xFF00);
    auto const b = u128(0xFF00, 0x0FF0);

    CHECK(a.bit_and(b) == u128(0xF000, 0x0F00));
    CHECK(a.bit_or(b) == u128(0xFFF0, 0xFFF0));
    CHECK(a.bit_xor(b) == u128(0x0FF0, 0xF0F0));
    CHECK(a.bit_and_not(b) == u128(0x00F0, 0xF000));
    CHECK(a.bit_not() == u128(~u64(0xF0F0), ~u64(0xFF00)));

    CHECK(a.bit_and64(0x0F00) == u128(0, 0x0F00));
    CHECK(a.bit_or64(0x00FF) == u128(0xF0F0, 0xFFFF));
    CHECK(a.bit_xor64(0xFFFF) == u128(0xF0F0, 0x00FF));

    CHECK((a & b) == a.bit_and(b));
    CHECK((a | b) == a.bit_or(b));
    CHECK((a ^ b) == a.bit_xor(b));
    CHECK(~a == a.bit_not());
}

TEST("u128 - shifts handle the word boundary")
{
    auto const one = u128(0, 1);

    CHECK(one.lsh(0) == one);
    CHECK(one.lsh(1) == u128(0, 2));
    CHECK(one.lsh(63) == u128(0, u64(1) << 63));
    CHECK(one.lsh(64) == u128(1, 0));
    CHECK(one.lsh(65) == u128(2, 0));
    CHECK(one.lsh(127) == u128(u64(1) << 63, 0));
    CHECK(one.lsh(128) == u128());
    CHECK(one.lsh(500) == u128());
    CHECK(u128(1, u64(1) << 63).lsh(1) == u128(3, 0));

    auto const top = u128(u64(1) << 63, 0);
    CHECK(top.rsh(0) == top);
    CHECK(top.rsh(63) == u128(1, 0));
    CHECK(top.rsh(64) == u128(0, u64(1) << 63));
    CHECK(top.rsh(127) == one);
    CHECK(top.rsh(128) == u128());
    CHECK(u128(3, 0).rsh(1) == u128(1, u64(1) << 63));

    CHECK((one << 64) == u128(1, 0));
    CHECK((top >> 127) == one);
}

TEST("u128 - rotate_left")
{
    auto const v = u128::from_u64(0x1234'5678'9ABC'DEF0);

    CHECK(v.rotate_left(4) == u128(1, 0x2345'6789'ABCD'EF00));
    CHECK(v.rotate_left(4) == rotate_bitwise(v, 4));

    CHECK(v.rotate_left(0) == v);
    CHECK(v.rotate_left(128) == v);
    CHECK(v.rotate_left(64) == u128(v.lo(), v.hi()));
    CHECK(u128(0, 1).rotate_left(65) == u128(2, 0));

    SECTION("negative amounts rotate right")
    {
        CHECK(u128(0, 1).rotate_left(-1) == u128(u64(1) << 63, 0));
        CHECK(v.rotate_left(-4) == rotate_bitwise(v, -4));
        CHECK(v.rotate_left(-128) == v);
    }

    SECTION("matches the bitwise reference and inverts")
    {
        std::mt19937_64 rng(1234);
        for (auto k : {1, 3, 63, 64, 65, 100, 127, 129, 255, 1000, -1, -63, -64, -65, -127, -129, -1000})
        {
            auto const x = u128(rng(), rng());
            CHECK(x.rotate_left(k) == rotate_bitwise(x, k));
            CHECK(x.rotate_left(k).rotate_left(-k) == x);
            CHECK(x.rotate_left(k).ones_count() == x.ones_count());
        }
    }
}

TEST("u128 - bit and set_bit")
{
    auto const v = u128().set_bit(100, 1).set_bit(3, 1);

    CHECK(v == u128(u64(1) << 36, 8));
    CHECK(v.bit(100) == 1);
    CHECK(v.bit(3) == 1);
    CHECK(v.bit(0) == 0);
    CHECK(v.bit(127) == 0);
    CHECK(v.set_bit(100, 0) == u128(0, 8));
    CHECK(v.set_bit(3, 1) == v);

    SECTION("invalid index or value is a contract violation")
    {
        CHECK(ec_test::violates_contract([&] { (void)v.bit(128); }));
        CHECK(ec_test::violates_contract([&] { (void)v.bit(-1); }));
        CHECK(ec_test::violates_contract([&] { (void)v.set_bit(128, 1); }));
        CHECK(ec_test::violates_contract([&] { (void)v.set_bit(-1, 0); }));
        CHECK(ec_test::violates_contract([&] { (void)v.set_bit(0, 2); }));
        CHECK(!ec_test::violates_contract([&] { (void)v.set_bit(127, 1); }));
    }
}

TEST("u128 - bit counting")
{
    CHECK(u128().bit_len() == 0);
    CHECK(u128().leading_zeros() == 128);
    CHECK(u128().trailing_zeros() == 128);
    CHECK(u128().ones_count() == 0);

    CHECK(u128::max().bit_len() == 128);
    CHECK(u128::max().leading_zeros() == 0);
    CHECK(u128::max().trailing_zeros() == 0);
    CHECK(u128::max().ones_count() == 128);

    CHECK(u128(1, 0).bit_len() == 65);
    CHECK(u128(1, 0).leading_zeros() == 63);
    CHECK(u128(1, 0).trailing_zeros() == 64);
    CHECK(u128(0, 1).bit_len() == 1);

    // both words contribute
    CHECK(u128(0xFF, 0xFF).ones_count() == 16);
    CHECK(u128(0xFF, 0).ones_count() == 8);
}

TEST("u128 - reverse and reverse_bytes")
{
    CHECK(u128(0, 1).reverse() == u128(u64(1) << 63, 0));
    CHECK(u128(1, 0).reverse() == u128(0, u64(1) << 63));

    auto const v = u128(0x0102'0304'0506'0708, 0x090A'0B0C'0D0E'0F10);
    CHECK(v.reverse_bytes() == u128(0x100F'0E0D'0C0B'0A09, 0x0807'0605'0403'0201));
    CHECK(v.reverse_bytes().reverse_bytes() == v);
    CHECK(v.reverse().reverse() == v);
}

// =========================================================================================================
// Conversions
// =========================================================================================================

TEST("u128 - byte encodings")
{
    auto const v = u128(0x0102'0304'0506'0708, 0x090A'0B0C'0D0E'0F10);

    SECTION("big endian puts hi first")
    {
        auto const bytes = v.to_big_endian();
        for (auto i = 0; i < 16; ++i)
            CHECK(bytes[i] == ec::byte(i + 1));
        CHECK(u128::from_big_endian(bytes) == v);
    }

    SECTION("little endian puts lo first")
    {
        auto const bytes = v.to_little_endian();
        for (auto i = 0; i < 16; ++i)
            CHECK(bytes[i] == ec::byte(16 - i));
        CHECK(u128::from_little_endian(bytes) == v);
    }

    SECTION("larger buffers use the first 16 bytes")
    {
        std::array<ec::byte, 20> buffer{};
        buffer[16] = ec::byte(0xAA);
        v.put_big_endian(buffer);
        CHECK(buffer[16] == ec::byte(0xAA));
        CHECK(u128::from_big_endian(buffer) == v);

        v.put_little_endian(buffer);
        CHECK(u128::from_little_endian(buffer) == v);
    }

    SECTION("round trip")
    {
        std::mt19937_64 rng(99);
        for (auto i = 0; i < 100; ++i)
        {
            auto const x = u128(rng(), rng());
            CHECK(u128::from_big_endian(x.to_big_endian()) == x);
            CHECK(u128::from_little_endian(x.to_little_endian()) == x);
        }
    }

    SECTION("short buffers are a contract violation")
    {
        std::array<ec::byte, 15> small{};
        CHECK(ec_test::violates_contract([&] { v.put_big_endian(small); }));
        CHECK(ec_test::violates_contract([&] { v.put_little_endian(small); }));
        CHECK(ec_test::violates_contract([&] { (void)u128::from_big_endian(small); }));
        CHECK(ec_test::violates_contract([&] { (void)u128::from_little_endian(small); }));
    }
}

TEST("u128 - as_f64 is correctly rounded")
{
    CHECK(u128().as_f64() == 0.0);
    CHECK(u128(0, 12345).as_f64() == 12345.0);
    CHECK(u128(1, 0).as_f64() == 18446744073709551616.0);
    CHECK(u128::max().as_f64() == std::ldexp(1.0, 128));

    // 2^117 + 1 is below half an ulp above 2^117
    CHECK(u128(u64(1) << 53, 1).as_f64() == std::ldexp(1.0, 117));
    // 2^117 + 2^64 is an exact tie, rounds to the even mantissa
    CHECK(u128((u64(1) << 53) | 1, 0).as_f64() == std::ldexp(1.0, 117));
    // one more than the tie must round up even though the extra bit is in the low word
    CHECK(u128((u64(1) << 53) | 1, 1).as_f64() == std::ldexp(1.0, 117) + std::ldexp(1.0, 65));
}

TEST("u128 - from_f64 truncates and clamps")
{
    auto const nan = std::numeric_limits<f64>::quiet_NaN();
    auto const inf = std::numeric_limits<f64>::infinity();

    CHECK((u128::from_f64(nan) == ec::conversion<u128>{u128(), false}));
    CHECK((u128::from_f64(inf) == ec::conversion<u128>{u128::max(), false}));
    CHECK((u128::from_f64(-inf) == ec::conversion<u128>{u128(), false}));
    CHECK((u128::from_f64(-1.0) == ec::conversion<u128>{u128(), false}));
    CHECK((u128::from_f64(-0.5) == ec::conversion<u128>{u128(), true}));
    CHECK((u128::from_f64(0.0) == ec::conversion<u128>{u128(), true}));
    CHECK((u128::from_f64(1.5) == ec::conversion<u128>{u128(0, 1), true}));
    CHECK((u128::from_f64(18446744073709551616.0) == ec::conversion<u128>{u128(1, 0), true}));
    CHECK((u128::from_f64(std::ldexp(1.0, 127)) == ec::conversion<u128>{u128(u64(1) << 63, 0), true}));
    CHECK((u128::from_f64(std::ldexp(1.0, 128)) == ec::conversion<u128>{u128::max(), false}));
    CHECK((u128::from_f64(1e300) == ec::conversion<u128>{u128::max(), false}));

    // largest double below 2^128 is 2^128 - 2^75
    auto const below = std::nextafter(std::ldexp(1.0, 128), 0.0);
    auto const c = u128::from_f64(below);
    CHECK(c.in_range);
    CHECK(c.value == u128(~u64(0) << 11, 0));

    CHECK((u128::from_f32(3.75f) == ec::conversion<u128>{u128(0, 3), true}));
}

TEST("u128 - must conversions")
{
    auto const nan = std::numeric_limits<f64>::quiet_NaN();

    CHECK(u128::must_from_string("340282366920938463463374607431768211455") == u128::max());
    CHECK(u128::must_from_string("-0") == u128());
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_string("-1"); }));
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_string("0x10"); }));
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_string("340282366920938463463374607431768211456"); }));

    CHECK(u128::must_from_f64(1.5) == u128(0, 1));
    CHECK(u128::must_from_f64(-0.5) == u128());
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_f64(-1.0); }));
    CHECK(ec_test::violates_contract([&] { (void)u128::must_from_f64(nan); }));
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_f64(std::ldexp(1.0, 128)); }));

    CHECK(u128::must_from_f32(3.75f) == u128(0, 3));
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_f32(-1.0f); }));
}

TEST("u128 - integer conversions")
{
    CHECK(u128::from_u64(7) == u128(0, 7));
    CHECK(u128::from_u32(7) == u128(0, 7));
    CHECK(u128::from_u16(7) == u128(0, 7));
    CHECK(u128::from_u8(255) == u128(0, 255));

    CHECK((u128::from_i64(5) == ec::conversion<u128>{u128(0, 5), true}));
    CHECK((u128::from_i64(-1) == ec::conversion<u128>{u128(), false}));
    CHECK(u128::must_from_i64(5) == u128(0, 5));
    CHECK(ec_test::violates_contract([] { (void)u128::must_from_i64(-1); }));

    CHECK(u128(1, 2).as_u64() == 2);
    CHECK(!u128(1, 2).is_u64());
    CHECK(u128(0, 2).is_u64());
    CHECK(u128(0, 2).must_u64() == 2);
    CHECK(ec_test::violates_contract([] { (void)u128(1, 2).must_u64(); }));

    CHECK(u128::max().as_i128() == ec::i128::minus_one());
    CHECK(!u128::max().is_i128());
    CHECK(u128(0x7FFF'FFFF'FFFF'FFFF, all_ones).is_i128());
    CHECK(u128(0x7FFF'FFFF'FFFF'FFFF, all_ones).as_i128() == ec::i128::max());
}

TEST("u128 - helpers and operators")
{
    auto const a = u128(0, 10);
    auto const b = u128(1, 3);

    CHECK(ec::difference(a, b) == u128(0, all_ones - 6));
    CHECK(ec::difference(b, a) == ec::difference(a, b));
    CHECK(ec::larger(a, b) == b);
    CHECK(ec::smaller(a, b) == a);

    CHECK(a + b == u128(1, 13));
    CHECK(b - a == u128(0, all_ones - 6));
    CHECK(a * a == u128(0, 100));
    CHECK(b / a == b.quo(a));
    CHECK(b % a == b.rem(a));

    auto c = a;
    c += b;
    CHECK(c == u128(1, 13));
    c -= b;
    CHECK(c == a);
    c *= u128(0, 3);
    CHECK(c == u128(0, 30));
    c /= u128(0, 4);
    CHECK(c == u128(0, 7));
    c %= u128(0, 4);
    CHECK(c == u128(0, 3));
    c <<= 64;
    CHECK(c == u128(3, 0));
    c >>= 63;
    CHECK(c == u128(0, 6));

    auto d = u128::max();
    CHECK(d++ == u128::max());
    CHECK(d == u128());
    CHECK(--d == u128::max());
}

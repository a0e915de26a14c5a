#include "to_string.hh"

#include <exact-core/i128.hh>
#include <exact-core/u128.hh>

#include <charconv>
#include <ostream>

namespace
{
// largest power of ten in a u64, a u128 has at most three chunks of this size
constexpr ec::u64 chunk_divisor = 10'000'000'000'000'000'000ull;
constexpr int chunk_digits = 19;

struct decimal_text
{
    bool negative = false;
    std::string_view digits;
};

bool split_sign(std::string_view text, decimal_text& out)
{
    if (!text.empty() && (text.front() == '+' || text.front() == '-'))
    {
        out.negative = text.front() == '-';
        text.remove_prefix(1);
    }

    if (text.empty())
        return false;

    for (auto c : text)
        if (c < '0' || c > '9')
            return false;

    out.digits = text;
    return true;
}

// false if the value would exceed limit
bool accumulate_digits(std::string_view digits, ec::u128 limit, ec::u128& out)
{
    auto const [limit_quo, limit_rem] = limit.quo_rem64(10);

    ec::u128 v;
    for (auto c : digits)
    {
        auto const d = ec::u64(c - '0');
        if (v > limit_quo || (v == limit_quo && d > limit_rem))
            return false;
        v = v.mul64(10).add64(d);
    }

    out = v;
    return true;
}

void append_u64(std::string& s, ec::u64 v, int min_digits)
{
    char buffer[24];
    auto const [end, err] = std::to_chars(buffer, buffer + sizeof(buffer), v);
    EC_ASSERT(err == std::errc(), "24 chars always hold a u64");

    auto const n = int(end - buffer);
    if (n < min_digits)
        s.append(size_t(min_digits - n), '0');
    s.append(buffer, end);
}
} // namespace

std::string ec::to_string(u128 v)
{
    if (v.is_u64())
    {
        std::string s;
        append_u64(s, v.lo(), 1);
        return s;
    }

    // least significant chunk first
    u64 chunks[3] = {};
    auto count = 0;
    while (!v.is_zero())
    {
        auto const [q, r] = v.quo_rem64(chunk_divisor);
        chunks[count++] = r;
        v = q;
    }

    std::string s;
    s.reserve(40);
    append_u64(s, chunks[count - 1], 1);
    for (auto i = count - 2; i >= 0; --i)
        append_u64(s, chunks[i], chunk_digits);
    return s;
}

std::string ec::to_string(i128 v)
{
    if (!v.is_negative())
        return ec::to_string(v.as_u128());
    return "-" + ec::to_string(v.abs_u128());
}

std::string ec::to_string(parse_error e)
{
    return std::string(ec::to_string_view(e));
}

template <>
ec::result<ec::u128, ec::parse_error> ec::parse_decimal<ec::u128>(std::string_view text)
{
    decimal_text parsed;
    if (!split_sign(text, parsed))
        return ec::error(parse_error::malformed);

    u128 magnitude;
    if (!accumulate_digits(parsed.digits, u128::max(), magnitude))
        return ec::error(parse_error::out_of_range);

    // "-0" is zero, every other negative value is out of range
    if (parsed.negative && !magnitude.is_zero())
        return ec::error(parse_error::out_of_range);

    return magnitude;
}

template <>
ec::result<ec::i128, ec::parse_error> ec::parse_decimal<ec::i128>(std::string_view text)
{
    decimal_text parsed;
    if (!split_sign(text, parsed))
        return ec::error(parse_error::malformed);

    // the negative range reaches one further than the positive one
    auto const limit = parsed.negative ? i128::min().abs_u128() : i128::max().as_u128();

    u128 magnitude;
    if (!accumulate_digits(parsed.digits, limit, magnitude))
        return ec::error(parse_error::out_of_range);

    auto const v = magnitude.as_i128();
    return parsed.negative ? v.neg() : v;
}

std::ostream& ec::operator<<(std::ostream& out, u128 v)
{
    return out << ec::to_string(v);
}

std::ostream& ec::operator<<(std::ostream& out, i128 v)
{
    return out << ec::to_string(v);
}

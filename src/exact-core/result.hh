#pragma once

#include <exact-core/assert.hh>
#include <exact-core/fwd.hh>

#include <type_traits>
#include <utility>

/// Tag wrapper marking a value as the error alternative of a result
/// Created via ec::error(e) so that result<T, E> can be constructed unambiguously even when T == E.
template <class E>
struct ec::as_error_t
{
    E value;
};

namespace ec
{
/// Wraps e as an error for result construction
/// Usage:
///   ec::result<u128, parse_error> r = ec::error(parse_error::malformed);
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return {std::forward<E>(e)};
}
} // namespace ec

/// Sum type representing either a success value T or an error value E
/// Used for operations that can fail with detailed error information, e.g. parsing decimal text.
///
/// exact-core only ever stores scalar values here, so result is restricted to trivially copyable
/// alternatives and is itself trivially copyable.
/// A default-constructed result holds the error E{}.
///
/// Usage:
///   auto r = ec::u128::from_string("12345");
///   if (r.has_error())
///       return r.error();
///   auto v = r.value();
template <class T, class E>
struct ec::result
{
    static_assert(std::is_trivially_copyable_v<T>, "result<T, E> requires a trivially copyable value type");
    static_assert(std::is_trivially_copyable_v<E>, "result<T, E> requires a trivially copyable error type");

public:
    constexpr result() : _error(), _has_value(false) {}

    constexpr result(T const& value) : _value(value), _has_value(true) {}

    template <class U>
        requires std::is_convertible_v<U const&, E>
    constexpr result(as_error_t<U> const& e) : _error(e.value), _has_value(false)
    {
    }

public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Precondition: has_value()
    [[nodiscard]] constexpr T const& value() const
    {
        EC_ASSERT_ALWAYS(_has_value, "accessed value of a result holding an error");
        return _value;
    }

    /// Precondition: has_error()
    [[nodiscard]] constexpr E const& error() const
    {
        EC_ASSERT_ALWAYS(!_has_value, "accessed error of a result holding a value");
        return _error;
    }

    [[nodiscard]] constexpr T value_or(T const& fallback) const { return _has_value ? _value : fallback; }

    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value ? lhs._value == rhs._value : lhs._error == rhs._error;
    }

private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

#pragma once

#include <exact-core/fwd.hh>
#include <exact-core/to_string.hh>

#include <string>
#include <string_view>

// =========================================================================================================
// Structured text encodings
// =========================================================================================================
//
// JSON:  a 128-bit value is a quoted decimal string, "340282366920938463463374607431768211455",
//        because JSON numbers lose precision beyond 2^53 in most consumers.
//        Decoding also accepts an unquoted decimal.
// Text:  the plain decimal, used as XML element / attribute text and anywhere a bare token is needed.
//
// Decoding is strict: a payload decodes only if its decimal body is exactly what parse_decimal accepts.

namespace ec
{
[[nodiscard]] std::string to_json(u128 v);
[[nodiscard]] std::string to_json(i128 v);

[[nodiscard]] std::string to_text(u128 v);
[[nodiscard]] std::string to_text(i128 v);

/// Decodes a JSON value produced by to_json (or an unquoted decimal)
/// A payload that opens a quote without closing it is malformed.
template <class T>
[[nodiscard]] result<T, parse_error> from_json(std::string_view json)
{
    if (!json.empty() && json.front() == '"')
    {
        if (json.size() < 2 || json.back() != '"')
            return ec::error(parse_error::malformed);
        json = json.substr(1, json.size() - 2);
    }

    return ec::parse_decimal<T>(json);
}

template <class T>
[[nodiscard]] result<T, parse_error> from_text(std::string_view text)
{
    return ec::parse_decimal<T>(text);
}
} // namespace ec

#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>

namespace ec
{
//
// Primitives
//

// Explicitly-sized primitive types
// The 128-bit types are built from two u64 words, so u64 is the workhorse here.
// Bit indices, shift amounts and bit counts use plain "int".

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes (binary encoding)
using byte = std::byte;

// file, line, column, function of a call site
using source_location = std::source_location;

// "using namespace ec::primitive_defines;" pulls only the primitive aliases into scope
namespace primitive_defines
{
using ec::byte;
using ec::f32;
using ec::f64;
using ec::i16;
using ec::i32;
using ec::i64;
using ec::i8;
using ec::u16;
using ec::u32;
using ec::u64;
using ec::u8;
} // namespace primitive_defines

//
// 128-bit integers
//

struct u128;
struct i128;

// quotient and remainder of one division, the remainder type differs for 64-bit divisors
template <class Q, class R = Q>
struct quo_rem_result;

//
// Recoverable errors
//

enum class parse_error;

template <class T>
struct conversion;

template <class E>
struct as_error_t;

template <class T, class E>
struct result;

} // namespace ec

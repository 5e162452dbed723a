#pragma once

#include <cstddef>
#include <cstdint>


namespace fc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We encourage using these types wherever the range is important for correctness or memory layout.
// However, we happily use "int" as a default integer if the range doesn't matter much
// (e.g. well below a few millions, such as loop counters or small counts).

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

// signed size type (controversial but intentional)
// Element counts, take/skip bounds and nth indices are all isize.
// * "count - 1" on an empty sequence must not wrap around to a huge positive number
// * a negative bound is a detectable precondition violation instead of a silently huge one
// * mixed signed/unsigned arithmetic is a major source of bugs and confusing implicit conversions
// * we only target 64-bit platforms, so i64 provides plenty of range
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Support types
//

struct unit;

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct pair;

template <class T>
struct function_ref;

//
// Internal iteration
//

template <class B, class C = unit>
struct control_flow;

template <class ContainerT>
struct collector;

template <class ProducerT>
struct sequence;

} // namespace fc

#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include <cstddef>
#include <cstdint>
#include <type_traits>

using i8 = std::int8_t;
using u8 = std::uint8_t;
using i16 = std::int16_t;
using u16 = std::uint16_t;
using i32 = std::int32_t;
using u32 = std::uint32_t;
using i64 = std::int64_t;
using u64 = std::uint64_t;
using f32 = float;
using f64 = double;
using uSz = std::size_t;

namespace Env {
template <typename>
inline constexpr bool always_false_v = false;
}

// bitwise operators for scoped flag enums, opt-in per enum with MAKE_FLAG_ENUM(EnumName)
template <typename E>
struct is_flag_enum : std::false_type {};

#define MAKE_FLAG_ENUM(E__) \
    template <>             \
    struct is_flag_enum<E__> : std::true_type {};

namespace flags {
template <typename E>
concept FlagEnum = std::is_enum_v<E> && is_flag_enum<E>::value;

namespace operators {
template <FlagEnum E>
constexpr E operator|(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));
}
template <FlagEnum E>
constexpr E operator&(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));
}
template <FlagEnum E>
constexpr E operator^(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) ^ static_cast<U>(b));
}
template <FlagEnum E>
constexpr E operator~(E a) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(~static_cast<U>(a));
}
template <FlagEnum E>
constexpr E &operator|=(E &a, E b) {
    return a = a | b;
}
template <FlagEnum E>
constexpr E &operator&=(E &a, E b) {
    return a = a & b;
}
template <FlagEnum E>
constexpr E &operator^=(E &a, E b) {
    return a = a ^ b;
}
}  // namespace operators

// all bits of F set in v
template <auto F, FlagEnum E = decltype(F)>
constexpr bool has(E v) {
    using U = std::underlying_type_t<E>;
    return (static_cast<U>(v) & static_cast<U>(F)) == static_cast<U>(F);
}

// any bit of F set in v
template <auto F, FlagEnum E = decltype(F)>
constexpr bool any(E v) {
    using U = std::underlying_type_t<E>;
    return (static_cast<U>(v) & static_cast<U>(F)) != 0;
}

template <FlagEnum E>
constexpr auto to_underlying(E v) {
    return static_cast<std::underlying_type_t<E>>(v);
}
}  // namespace flags

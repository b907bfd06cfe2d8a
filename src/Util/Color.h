#pragma once
// Copyright (c) 2025, WH & 2026, hitcore contributors, All rights reserved.

#include "types.h"

#include <algorithm>
#include <concepts>

using Channel = u8;
namespace Colors {
template <typename T>
concept Numeric = std::is_arithmetic_v<T>;

constexpr Channel to_byte(Numeric auto value) {
    if constexpr(std::is_floating_point_v<decltype(value)>)
        return static_cast<Channel>(std::clamp<decltype(value)>(value, 0, 1) * 255);
    else
        return static_cast<Channel>(std::clamp<i64>(static_cast<i64>(value), 0, 255));
}
}  // namespace Colors

// argb colors
struct Color {
    u32 v;

    constexpr Color() : v{0} {}
    constexpr Color(u32 val) : v{val} {}

    template <Colors::Numeric A, Colors::Numeric R, Colors::Numeric G, Colors::Numeric B>
    constexpr Color(A a, R r, G g, B b)
        : v{(static_cast<u32>(Colors::to_byte(a)) << 24) | (static_cast<u32>(Colors::to_byte(r)) << 16) |
            (static_cast<u32>(Colors::to_byte(g)) << 8) | static_cast<u32>(Colors::to_byte(b))} {}

    friend constexpr bool operator==(Color a, Color b) { return a.v == b.v; }

    // clang-format off
	[[nodiscard]] constexpr Channel A() const { return static_cast<Channel>((v >> 24) & 0xFF); }
	[[nodiscard]] constexpr Channel R() const { return static_cast<Channel>((v >> 16) & 0xFF); }
	[[nodiscard]] constexpr Channel G() const { return static_cast<Channel>((v >> 8) & 0xFF); }
	[[nodiscard]] constexpr Channel B() const { return static_cast<Channel>(v & 0xFF); }

	template <typename T = float>
	[[nodiscard]] constexpr T Af() const { return static_cast<T>(static_cast<float>(A()) / 255.0f); }
    // clang-format on
};

template <Colors::Numeric R, Colors::Numeric G, Colors::Numeric B>
constexpr Color rgb(R r, G g, B b) {
    return {255, Colors::to_byte(r), Colors::to_byte(g), Colors::to_byte(b)};
}

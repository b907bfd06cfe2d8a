#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include "types.h"

#include <type_traits>

namespace Timing {

// monotonic, from SDL's high resolution counter
[[nodiscard]] u64 getTicksNS();

[[nodiscard]] inline u64 getTicksMS() { return getTicksNS() / 1000000ULL; }

// seconds
template <typename T = f64>
    requires(std::is_floating_point_v<T>)
[[nodiscard]] inline T getTimeReal() {
    return static_cast<T>(static_cast<f64>(getTicksNS()) / 1000000000.0);
}

void sleepMS(u32 ms);

}  // namespace Timing

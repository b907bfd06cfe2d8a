#pragma once

#include "noinclude.h"
#include "types.h"

enum class ModFlags : u64 {
    None = 0,  // NOTE: not "nomod" (unless ModFlags == None, but not ModFlags & None)

    // Green mods
    NoFail = 1ULL << 0,
    Easy = 1ULL << 1,
    Autopilot = 1ULL << 2,
    Relax = 1ULL << 3,

    // Red mods
    Hidden = 1ULL << 4,
    HardRock = 1ULL << 5,
    Flashlight = 1ULL << 6,

    // Speed mods
    DoubleTime = 1ULL << 7,
    HalfTime = 1ULL << 8,

    // Non-submittable
    Autoplay = 1ULL << 63
};
MAKE_FLAG_ENUM(ModFlags);

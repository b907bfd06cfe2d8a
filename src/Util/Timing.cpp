// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "Timing.h"

#include <SDL3/SDL_timer.h>

namespace Timing {

u64 getTicksNS() { return SDL_GetTicksNS(); }

void sleepMS(u32 ms) { SDL_DelayNS(static_cast<u64>(ms) * 1000000ULL); }

}  // namespace Timing

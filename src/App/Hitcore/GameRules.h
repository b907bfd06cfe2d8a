#pragma once
// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.

#include "noinclude.h"
#include "types.h"
#include "Vectors.h"

#include <algorithm>
#include <type_traits>

class GameRules {
   public:
    //************************//
    //	Hitobject Animations  //
    //************************//

    // how long a hitobject stays visible after its end time
    static float getFadeOutTime();

    //********************//
    //	Hitobject Timing  //
    //********************//

    static constexpr forceinline float getMinHitWindow300() { return 80.f; }
    static constexpr forceinline float getMidHitWindow300() { return 50.f; }
    static constexpr forceinline float getMaxHitWindow300() { return 20.f; }

    static constexpr forceinline float getMinHitWindow100() { return 140.f; }
    static constexpr forceinline float getMidHitWindow100() { return 100.f; }
    static constexpr forceinline float getMaxHitWindow100() { return 60.f; }

    static constexpr forceinline float getMinHitWindow50() { return 200.f; }
    static constexpr forceinline float getMidHitWindow50() { return 150.f; }
    static constexpr forceinline float getMaxHitWindow50() { return 100.f; }

    // respect overrides
    static float getMinApproachTime();
    static float getMidApproachTime();
    static float getMaxApproachTime();

    // AR 5 -> 1200 ms
    template <typename T>
    static forceinline T mapDifficultyRange(T scaledDiff, T min, T mid, T max)
        requires(std::is_same_v<T, float> || std::is_same_v<T, double>)
    {
        if(scaledDiff == (T)5.)
            return mid;
        else if(scaledDiff > (T)5.)
            return mid + (max - mid) * (scaledDiff - (T)5.) / (T)5.;
        else
            return mid - (mid - min) * ((T)5. - scaledDiff) / (T)5.;
    }

    // AR < 5: 1200 + 120 * (5 - AR), AR >= 5: 1200 - 150 * (AR - 5)
    static float arToMilliseconds(float AR);

    // OD 5 -> 150 ms
    static forceinline float odTo50HitWindowMS(float OD) {
        return mapDifficultyRange(OD, getMinHitWindow50(), getMidHitWindow50(), getMaxHitWindow50());
    }
    // OD 5 -> 100 ms
    static forceinline float odTo100HitWindowMS(float OD) {
        return mapDifficultyRange(OD, getMinHitWindow100(), getMidHitWindow100(), getMaxHitWindow100());
    }
    // OD 5 -> 50 ms
    static forceinline float odTo300HitWindowMS(float OD) {
        return mapDifficultyRange(OD, getMinHitWindow300(), getMidHitWindow300(), getMaxHitWindow300());
    }

    //*********************//
    //	Hitobject Scaling  //
    //*********************//

    // in osu!pixels, CS 4 -> 36.48
    static constexpr forceinline f32 getHitCircleRadius(f32 CS) { return std::max(0.0f, 54.4f - 4.48f * CS); }

    //*************//
    //	Playfield  //
    //*************//

    static constexpr const int OSU_COORD_WIDTH = 512;
    static constexpr const int OSU_COORD_HEIGHT = 384;

    static forceinline vec2 getPlayfieldCenter() {
        return {OSU_COORD_WIDTH / 2.f, OSU_COORD_HEIGHT / 2.f};
    }

    //**********//
    //	Scoring  //
    //**********//

    // coarse integer difficulty bonus, floor 1
    static int getDifficultyMultiplier(float HP, float CS, float OD);
};

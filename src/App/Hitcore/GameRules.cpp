// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.
#include "GameRules.h"

#include "GameConVars.h"

#include <cmath>

float GameRules::getFadeOutTime() { return std::max(0.f, cv::fadeout_time.getFloat()); }

float GameRules::getMinApproachTime() { return cv::approachtime_min.getFloat(); }
float GameRules::getMidApproachTime() { return cv::approachtime_mid.getFloat(); }
float GameRules::getMaxApproachTime() { return cv::approachtime_max.getFloat(); }

float GameRules::arToMilliseconds(float AR) {
    return mapDifficultyRange(AR, getMinApproachTime(), getMidApproachTime(), getMaxApproachTime());
}

int GameRules::getDifficultyMultiplier(float HP, float CS, float OD) {
    const float raw = (HP + CS + OD + std::max(0.0f, CS - 5.0f) * 2.0f) / 6.0f;
    return std::max(1, static_cast<int>(std::lround(raw)));
}

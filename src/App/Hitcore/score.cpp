// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.
#include "score.h"

#include "GameConVars.h"
#include "GameRules.h"
#include "Logging.h"

#include "fmt/format.h"

#include <algorithm>
#include <cmath>

std::string_view scoreGradeToString(ScoreGrade grade) {
    switch(grade) {
        case ScoreGrade::X:
            return "SS";
        case ScoreGrade::S:
            return "S";
        case ScoreGrade::A:
            return "A";
        case ScoreGrade::B:
            return "B";
        case ScoreGrade::C:
            return "C";
        case ScoreGrade::D:
            return "D";
        case ScoreGrade::F:
            return "F";
        case ScoreGrade::N:
            break;
    }
    return "N";
}

LiveScore::LiveScore() { this->reset(ModState{}, DifficultyAttributes{}); }

void LiveScore::reset(const ModState &mods, const DifficultyAttributes &diff) {
    this->mods = mods;

    this->iScore = 0;
    this->iCombo = 0;
    this->iComboMax = 0;
    this->fHealth = HEALTH_MAX;

    this->iNumMisses = 0;
    this->iNum50s = 0;
    this->iNum100s = 0;
    this->iNum300s = 0;

    this->iDifficultyMultiplier = GameRules::getDifficultyMultiplier(diff.HP, diff.CS, diff.OD);
    this->fModMultiplier = mods.getScoreMultiplier();
    this->fDrainMultiplier = mods.getDrainMultiplier();
    this->fHP = diff.HP;

    this->bDead = false;

    this->onScoreChange();
}

int LiveScore::getBaseValue(LiveScore::HIT hit) {
    switch(hit) {
        case HIT::HIT_300:
            return 300;
        case HIT::HIT_100:
            return 100;
        case HIT::HIT_50:
            return 50;
        case HIT::HIT_MISS:
        case HIT::HIT_NULL:
            break;
    }
    return 0;
}

f64 LiveScore::getHealthIncrease(LiveScore::HIT hit, f64 HP) {
    const f64 base = (10.0 - HP) * cv::hit_health_base.getDouble();

    switch(hit) {
        case HIT::HIT_300:
            return base;
        case HIT::HIT_100:
            return base * 0.5;
        case HIT::HIT_50:
            return base * 0.25;
        case HIT::HIT_MISS:
            return -cv::miss_health_penalty.getDouble();
        case HIT::HIT_NULL:
            break;
    }
    return 0.0;
}

void LiveScore::addHitResult(LiveScore::HIT hit) {
    if(hit == HIT::HIT_NULL) return;

    if(hit == HIT::HIT_MISS) {
        this->iCombo = 0;
        this->iNumMisses++;
    } else {
        // combo before this hit counts
        const f64 comboFactor =
            1.0 + ((f64)this->iCombo * this->iDifficultyMultiplier * this->fModMultiplier) / 25.0;
        this->iScore += (u64)std::floor((f64)getBaseValue(hit) * comboFactor * this->fModMultiplier);

        this->iCombo++;
        this->iComboMax = std::max(this->iComboMax, this->iCombo);

        switch(hit) {
            case HIT::HIT_300:
                this->iNum300s++;
                break;
            case HIT::HIT_100:
                this->iNum100s++;
                break;
            case HIT::HIT_50:
                this->iNum50s++;
                break;
            default:
                break;
        }
    }

    this->addHealth(getHealthIncrease(hit, this->fHP));
    this->onScoreChange();
}

void LiveScore::drainHealth(f64 clockDeltaMS) {
    if(clockDeltaMS <= 0.0 || cv::drain_disabled.getBool()) return;

    const f64 drain = this->fHP * cv::drain_rate_scale.getDouble() * this->fDrainMultiplier * (clockDeltaMS / 1000.0);
    this->addHealth(-drain);
}

void LiveScore::addHealth(f64 percent) { this->fHealth = std::clamp(this->fHealth + percent, 0.0, HEALTH_MAX); }

void LiveScore::onScoreChange() {
    this->fAccuracy = calculateAccuracy(this->iNum300s, this->iNum100s, this->iNum50s, this->iNumMisses);
    this->grade = this->bDead ? ScoreGrade::F
                              : calculateGrade(this->iNum300s, this->iNum100s, this->iNum50s, this->iNumMisses);
}

float LiveScore::calculateAccuracy(int num300s, int num100s, int num50s, int numMisses) {
    const int totalNumHits = num300s + num100s + num50s + numMisses;
    if(totalNumHits <= 0) return 100.0f;

    const f64 totalHitPoints = num300s * 300.0 + num100s * 100.0 + num50s * 50.0;
    return (float)(totalHitPoints / (totalNumHits * 300.0) * 100.0);
}

ScoreGrade LiveScore::calculateGrade(int num300s, int num100s, int num50s, int numMisses) {
    const float totalNumHits = (float)(numMisses + num50s + num100s + num300s);
    if(totalNumHits <= 0.0f) return ScoreGrade::N;

    const float percent300s = (float)num300s / totalNumHits;
    const float percent50s = (float)num50s / totalNumHits;

    // first match wins
    if(num300s > 0 && numMisses == 0 && num50s == 0 && num100s == 0) return ScoreGrade::X;
    if(percent300s > 0.9f && percent50s < 0.01f && numMisses == 0) return ScoreGrade::S;
    if((percent300s > 0.8f && numMisses == 0) || (percent300s > 0.9f)) return ScoreGrade::A;
    if((percent300s > 0.7f && numMisses == 0) || (percent300s > 0.8f)) return ScoreGrade::B;
    if(percent300s > 0.6f) return ScoreGrade::C;
    return ScoreGrade::D;
}

FinishedScore LiveScore::buildFinishedScore(std::string beatmapIdentity, u64 unixTimestamp) const {
    FinishedScore score;
    score.beatmapIdentity = std::move(beatmapIdentity);
    score.mods = this->mods;
    score.score = this->iScore;
    score.unixTimestamp = unixTimestamp;
    score.num300s = this->iNum300s;
    score.num100s = this->iNum100s;
    score.num50s = this->iNum50s;
    score.numMisses = this->iNumMisses;
    score.comboMax = this->iComboMax;
    score.accuracy = this->fAccuracy;
    score.passed = !this->bDead;
    score.grade = score.calculate_grade();
    return score;
}

ScoreGrade FinishedScore::calculate_grade() const {
    if(!this->passed) return ScoreGrade::F;
    return LiveScore::calculateGrade(this->num300s, this->num100s, this->num50s, this->numMisses);
}

std::string FinishedScore::dbgstr() const {
    return fmt::format(
        R"(std::string beatmapIdentity: {}
    ModState mods: {}
    u64 score: {}
    u64 unixTimestamp: {}
    int num300s: {}
    int num100s: {}
    int num50s: {}
    int numMisses: {}
    int comboMax: {}
    float accuracy: {:.2f}
    ScoreGrade grade: {}
    bool passed: {})",
        this->beatmapIdentity, this->mods.toString(), this->score, this->unixTimestamp, this->num300s, this->num100s,
        this->num50s, this->numMisses, this->comboMax, this->accuracy, scoreGradeToString(this->grade), this->passed);
}

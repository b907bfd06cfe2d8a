#pragma once
// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.

#include "ModState.h"
#include "types.h"

#include <string>
#include <string_view>

enum class ScoreGrade : uint8_t {
    X,  // SS
    S,
    A,
    B,
    C,
    D,
    F,  // failed, regardless of accuracy
    N   // means "no grade"
};

[[nodiscard]] std::string_view scoreGradeToString(ScoreGrade grade);

struct FinishedScore {
    [[nodiscard]] inline bool operator==(const FinishedScore &c) const {
        return unixTimestamp == c.unixTimestamp &&          //
               score == c.score &&                          //
               mods == c.mods &&                            //
               beatmapIdentity == c.beatmapIdentity &&      //
               num300s == c.num300s &&                      //
               num100s == c.num100s &&                      //
               num50s == c.num50s &&                        //
               numMisses == c.numMisses &&                  //
               comboMax == c.comboMax &&                    //
               grade == c.grade;                            //
    }

    std::string beatmapIdentity;
    ModState mods;

    u64 score = 0;
    u64 unixTimestamp = 0;

    int num300s = 0;
    int num100s = 0;
    int num50s = 0;
    int numMisses = 0;

    int comboMax = 0;
    float accuracy = 0.f;  // percent

    ScoreGrade grade = ScoreGrade::N;
    bool passed = false;

    [[nodiscard]] std::string dbgstr() const;

    // F for failed runs
    [[nodiscard]] ScoreGrade calculate_grade() const;
};

class LiveScore {
   public:
    enum class HIT : uint8_t {
        HIT_NULL,
        HIT_MISS,
        HIT_50,
        HIT_100,
        HIT_300,
    };

    // weighted hit value over the maximum, in percent. 100 before anything was judged
    static float calculateAccuracy(int num300s, int num100s, int num50s, int numMisses);
    static ScoreGrade calculateGrade(int num300s, int num100s, int num50s, int numMisses);

    static int getBaseValue(LiveScore::HIT hit);

    // signed, misses return the penalty as a negative value
    static f64 getHealthIncrease(LiveScore::HIT hit, f64 HP);

    static constexpr f64 HEALTH_MAX = 100.0;

   public:
    LiveScore();

    // difficultyMultiplier and the mod multiplier are fixed for the whole attempt
    void reset(const ModState &mods, const DifficultyAttributes &diff);

    // score, combo, counters, accuracy and health in one step; HIT_NULL is ignored
    void addHitResult(LiveScore::HIT hit);

    // passive drain over a clock delta, no-op if disabled or the delta is not positive
    void drainHealth(f64 clockDeltaMS);

    void setDead(bool dead) {
        this->bDead = dead;
        this->onScoreChange();
    }

    [[nodiscard]] FinishedScore buildFinishedScore(std::string beatmapIdentity, u64 unixTimestamp) const;

    [[nodiscard]] inline u64 getScore() const { return this->iScore; }
    [[nodiscard]] inline ScoreGrade getGrade() const { return this->grade; }
    [[nodiscard]] inline int getCombo() const { return this->iCombo; }
    [[nodiscard]] inline int getComboMax() const { return this->iComboMax; }
    [[nodiscard]] inline float getAccuracy() const { return this->fAccuracy; }
    [[nodiscard]] inline f64 getHealth() const { return this->fHealth; }
    [[nodiscard]] inline int getNumMisses() const { return this->iNumMisses; }
    [[nodiscard]] inline int getNum50s() const { return this->iNum50s; }
    [[nodiscard]] inline int getNum100s() const { return this->iNum100s; }
    [[nodiscard]] inline int getNum300s() const { return this->iNum300s; }
    [[nodiscard]] inline int getNumJudged() const {
        return this->iNum300s + this->iNum100s + this->iNum50s + this->iNumMisses;
    }

    [[nodiscard]] inline int getDifficultyMultiplier() const { return this->iDifficultyMultiplier; }
    [[nodiscard]] inline f64 getScoreMultiplier() const { return this->fModMultiplier; }
    [[nodiscard]] inline const ModState &getMods() const { return this->mods; }

    [[nodiscard]] inline bool isDead() const { return this->bDead; }

   private:
    void onScoreChange();
    void addHealth(f64 percent);

    ModState mods;

    ScoreGrade grade{ScoreGrade::N};

    u64 iScore{0};
    int iCombo{0};
    int iComboMax{0};
    float fAccuracy{100.f};
    f64 fHealth{HEALTH_MAX};

    int iNumMisses{0};
    int iNum50s{0};
    int iNum100s{0};
    int iNum300s{0};

    int iDifficultyMultiplier{1};
    f64 fModMultiplier{1.0};
    f64 fDrainMultiplier{1.0};
    f64 fHP{5.0};

    bool bDead{false};
};

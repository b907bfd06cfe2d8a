#pragma once
// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.

#include "score.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// local best scores, one per (chart identity, mod combination)
class ScoreDatabase {
   public:
    static constexpr u32 SCORE_DB_VERSION = 1;

    ScoreDatabase() = default;

    // returns true if the score was recorded, i.e. there was none yet for its key or it beats the old one
    bool addScore(const FinishedScore &score);

    [[nodiscard]] std::optional<FinishedScore> getBest(std::string_view beatmapIdentity, const ModState &mods) const;

    // all mod combinations for the chart, highest score first
    [[nodiscard]] std::vector<FinishedScore> getAll(std::string_view beatmapIdentity) const;

    void clear();

    // both return false (and log) on I/O failure, a failed load leaves the current contents untouched
    bool save(std::string_view path) const;
    bool load(std::string_view path);

    // with cv::score_db_path
    bool save() const;
    bool load();

    [[nodiscard]] inline uSz getNumScores() const { return this->scores.size(); }
    [[nodiscard]] inline bool isChanged() const { return this->bScoresChanged; }

    static bool sortScoreByScore(const FinishedScore &a, const FinishedScore &b);

   private:
    using Key = std::pair<std::string, u64>;

    std::map<Key, FinishedScore> scores;
    mutable bool bScoresChanged{false};
};

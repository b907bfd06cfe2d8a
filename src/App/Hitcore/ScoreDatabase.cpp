// Copyright (c) 2016, PG & 2026, hitcore contributors, All rights reserved.
#include "ScoreDatabase.h"

#include "ByteBufferedFile.h"
#include "GameConVars.h"
#include "Logging.h"

#include <algorithm>

bool ScoreDatabase::sortScoreByScore(const FinishedScore &a, const FinishedScore &b) {
    if(a.score != b.score) return a.score > b.score;
    // older first on ties
    return a.unixTimestamp < b.unixTimestamp;
}

bool ScoreDatabase::addScore(const FinishedScore &score) {
    Key key{score.beatmapIdentity, score.mods.serialize()};

    const auto it = this->scores.find(key);
    if(it != this->scores.end() && score.score <= it->second.score) {
        logIfCV(debug_judgement, "not replacing {} with {} for {} [{}]", it->second.score, score.score,
                score.beatmapIdentity, score.mods.toString());
        return false;
    }

    this->scores.insert_or_assign(std::move(key), score);
    this->bScoresChanged = true;
    return true;
}

std::optional<FinishedScore> ScoreDatabase::getBest(std::string_view beatmapIdentity, const ModState &mods) const {
    const auto it = this->scores.find(Key{std::string{beatmapIdentity}, mods.serialize()});
    if(it == this->scores.end()) return std::nullopt;
    return it->second;
}

std::vector<FinishedScore> ScoreDatabase::getAll(std::string_view beatmapIdentity) const {
    std::vector<FinishedScore> ret;

    // keys are ordered by identity first
    for(auto it = this->scores.lower_bound(Key{std::string{beatmapIdentity}, 0});
        it != this->scores.end() && it->first.first == beatmapIdentity; ++it) {
        ret.push_back(it->second);
    }

    std::ranges::stable_sort(ret, sortScoreByScore);
    return ret;
}

void ScoreDatabase::clear() {
    if(!this->scores.empty()) this->bScoresChanged = true;
    this->scores.clear();
}

bool ScoreDatabase::save() const { return this->save(cv::score_db_path.getString()); }
bool ScoreDatabase::load() { return this->load(cv::score_db_path.getString()); }

bool ScoreDatabase::save(std::string_view path) const {
    debugLog("Saving {} scores to {} ...", this->scores.size(), path);

    ByteBufferedFile::Writer dbr(path);
    if(!dbr.good()) {
        debugLog("Cannot save scores to {}: {}", path, dbr.error());
        return false;
    }

    dbr.write<u32>(SCORE_DB_VERSION);
    dbr.write<u32>((u32)this->scores.size());

    for(const auto &[key, score] : this->scores) {
        if(!dbr.good()) break;

        dbr.write_string(key.first);
        dbr.write<u64>(key.second);

        dbr.write<u64>(score.score);
        dbr.write<u64>(score.unixTimestamp);
        dbr.write<i32>(score.num300s);
        dbr.write<i32>(score.num100s);
        dbr.write<i32>(score.num50s);
        dbr.write<i32>(score.numMisses);
        dbr.write<i32>(score.comboMax);
        dbr.write<f32>(score.accuracy);
        dbr.write<u8>((u8)score.grade);
        dbr.write<u8>(score.passed ? 1 : 0);
    }

    if(!dbr.finish()) {
        debugLog("Failed to save scores to {}: {}", path, dbr.error());
        return false;
    }

    this->bScoresChanged = false;
    return true;
}

bool ScoreDatabase::load(std::string_view path) {
    ByteBufferedFile::Reader dbr(path);
    if(!dbr.good() || dbr.total_size == 0) {
        debugLog("No scores loaded from {}: {}", path, dbr.good() ? "empty file" : dbr.error());
        return false;
    }

    const u32 db_version = dbr.read<u32>();
    if(db_version != SCORE_DB_VERSION) {
        debugLog("{} has unsupported version {} (expected {})", path, db_version, SCORE_DB_VERSION);
        return false;
    }

    const u32 nb_scores = dbr.read<u32>();

    std::map<Key, FinishedScore> loaded;
    for(u32 i = 0; i < nb_scores && dbr.good(); i++) {
        FinishedScore sc;

        if(!dbr.read_string(sc.beatmapIdentity)) break;
        const u64 modBits = dbr.read<u64>();
        sc.mods = ModState::deserialize(modBits);

        sc.score = dbr.read<u64>();
        sc.unixTimestamp = dbr.read<u64>();
        sc.num300s = dbr.read<i32>();
        sc.num100s = dbr.read<i32>();
        sc.num50s = dbr.read<i32>();
        sc.numMisses = dbr.read<i32>();
        sc.comboMax = dbr.read<i32>();
        sc.accuracy = dbr.read<f32>();

        const u8 grade = dbr.read<u8>();
        sc.passed = dbr.read<u8>() != 0;
        sc.grade = grade <= (u8)ScoreGrade::N ? (ScoreGrade)grade : sc.calculate_grade();

        loaded.insert_or_assign(Key{sc.beatmapIdentity, sc.mods.serialize()}, std::move(sc));
    }

    if(!dbr.good()) {
        debugLog("Failed to load scores from {}: {}", path, dbr.error());
        return false;
    }

    this->scores = std::move(loaded);
    this->bScoresChanged = false;

    debugLog("Loaded {} scores from {}", this->scores.size(), path);
    return true;
}

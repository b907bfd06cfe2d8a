#pragma once
// Copyright (c) 2020, PG & 2026, hitcore contributors, All rights reserved.

#include "Color.h"
#include "HitObjects.h"
#include "ModState.h"
#include "noinclude.h"
#include "types.h"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// a parsed chart, immutable once parse() returns it
class Beatmap final {
   public:
    struct LoadError {
       public:
        enum code : u8 {
            NONE = 0,
            FILE_LOAD = 1,
            NO_OBJECTS = 2,
            NO_TIMINGPOINTS = 3,
            MISSING_SECTION = 4,
            TOOMANY_HITOBJECTS = 5,
            ERRC_COUNT = 6
        };
        code errc{0};

        [[nodiscard]] forceinline std::string_view error_string() const { return reasons[errc]; }

        explicit operator bool() const { return errc != NONE; }

       private:
        static constexpr const std::array<std::string_view, ERRC_COUNT> reasons{
            "no error",                     //
            "failed to load file",          //
            "no objects in file",           //
            "no timingpoints in file",      //
            "no [HitObjects] section",      //
            "too many objects in file"};
    };

    enum class BlockId : i8 {
        Sentinel = -2,  // for skipping the first string scan, header must come first
        Header = -1,
        General = 0,
        Metadata = 1,
        Difficulty = 2,
        Events = 3,
        TimingPoints = 4,
        Colours = 5,
        HitObjects = 6,
        Unknown = 7,  // any other [Section], its lines are ignored
    };

    struct MetadataBlock {
        std::string_view str;
        BlockId id;
    };

    static constexpr const std::array<MetadataBlock, 7> metadataBlocks{
        MetadataBlock{.str = "[General]", .id = BlockId::General},
        MetadataBlock{.str = "[Metadata]", .id = BlockId::Metadata},
        MetadataBlock{.str = "[Difficulty]", .id = BlockId::Difficulty},
        MetadataBlock{.str = "[Events]", .id = BlockId::Events},
        MetadataBlock{.str = "[TimingPoints]", .id = BlockId::TimingPoints},
        MetadataBlock{.str = "[Colours]", .id = BlockId::Colours},
        MetadataBlock{.str = "[HitObjects]", .id = BlockId::HitObjects}};

    struct TIMINGPOINT final {
        f64 offset;
        f64 msPerBeat;  // negative on inherited points: -100 / slider velocity

        i32 meter;

        bool uninherited;  // <=> timingChange
        bool kiai;

        bool operator==(const TIMINGPOINT &) const = default;
    };

    struct BREAK final {
        i64 startTime;
        i64 endTime;
    };

    struct TIMING_INFO {
        f64 offset{0.0};

        f64 beatLength{1.0};      // of the governing uninherited point
        f64 sliderVelocity{1.0};  // of the governing inherited point, clamped to [0.1, 10]

        i32 meter{4};
        bool kiai{false};
        bool isNaN{false};

        bool operator==(const TIMING_INFO &) const = default;
    };

    struct LOAD_RESULT {
        std::shared_ptr<const Beatmap> beatmap{nullptr};
        LoadError error{LoadError::NONE};
    };

    static constexpr std::array<Color, 4> DEFAULT_COMBO_COLORS{
        rgb(255, 192, 0), rgb(0, 202, 0), rgb(18, 124, 255), rgb(242, 24, 57)};

    // never throws, a rejected chart comes back with error set and no beatmap
    static LOAD_RESULT parse(std::string_view rawText);
    static LOAD_RESULT loadFromFile(std::string_view osuFilePath);

    // timingpoints must be sorted, falls back to the first point (or defaults) before any point applies
    static TIMING_INFO getTimingInfoForTimeAndTimingPoints(i32 positionMS,
                                                           const std::vector<TIMINGPOINT> &timingpoints);

    [[nodiscard]] inline TIMING_INFO getTimingInfoForTime(i32 positionMS) const {
        return getTimingInfoForTimeAndTimingPoints(positionMS, this->timingpoints);
    }

    Beatmap(const Beatmap &) = delete;
    Beatmap &operator=(const Beatmap &) = delete;
    Beatmap(Beatmap &&) noexcept = default;
    Beatmap &operator=(Beatmap &&) noexcept = default;
    ~Beatmap() = default;

    // raw metadata

    [[nodiscard]] inline int getFormatVersion() const { return this->iVersion; }
    [[nodiscard]] inline int getID() const { return this->iID; }
    [[nodiscard]] inline const std::string &getTitle() const { return this->sTitle; }
    [[nodiscard]] inline const std::string &getArtist() const { return this->sArtist; }
    [[nodiscard]] inline const std::string &getCreator() const { return this->sCreator; }
    [[nodiscard]] inline const std::string &getDifficultyName() const { return this->sDifficultyName; }
    [[nodiscard]] inline const std::string &getAudioFileName() const { return this->sAudioFileName; }
    [[nodiscard]] inline const std::string &getBackgroundImageFileName() const {
        return this->sBackgroundImageFileName;
    }
    [[nodiscard]] inline i32 getAudioLeadIn() const { return this->iAudioLeadIn; }

    // BeatmapID if the chart has one, otherwise a content hash
    [[nodiscard]] inline const std::string &getIdentity() const { return this->sIdentity; }

    [[nodiscard]] inline f32 getAR() const { return this->difficulty.AR; }
    [[nodiscard]] inline f32 getCS() const { return this->difficulty.CS; }
    [[nodiscard]] inline f32 getOD() const { return this->difficulty.OD; }
    [[nodiscard]] inline f32 getHP() const { return this->difficulty.HP; }
    [[nodiscard]] inline const DifficultyAttributes &getDifficulty() const { return this->difficulty; }

    [[nodiscard]] inline f32 getSliderMultiplier() const { return this->fSliderMultiplier; }
    [[nodiscard]] inline f32 getSliderTickRate() const { return this->fSliderTickRate; }

    // gameplay data

    [[nodiscard]] inline const std::vector<TIMINGPOINT> &getTimingPoints() const { return this->timingpoints; }
    [[nodiscard]] inline const std::vector<std::unique_ptr<HitObject>> &getHitObjects() const {
        return this->hitobjects;
    }
    [[nodiscard]] inline const std::vector<BREAK> &getBreaks() const { return this->breaks; }
    [[nodiscard]] inline const std::vector<Color> &getComboColors() const { return this->combocolors; }

    [[nodiscard]] inline uSz getNumObjects() const { return this->hitobjects.size(); }
    [[nodiscard]] inline uSz getNumCircles() const { return this->iNumCircles; }
    [[nodiscard]] inline uSz getNumSliders() const { return this->iNumSliders; }
    [[nodiscard]] inline uSz getNumSpinners() const { return this->iNumSpinners; }

    [[nodiscard]] i32 getFirstObjectTime() const;
    // latest end time of any object, computed once while parsing
    [[nodiscard]] inline f64 getLastObjectEndTime() const { return this->fLastObjectEndTime; }

    [[nodiscard]] bool isInBreak(f64 positionMS) const;

   private:
    Beatmap() = default;

    // raw metadata
    std::string sTitle;
    std::string sArtist;
    std::string sCreator;
    std::string sDifficultyName;
    std::string sAudioFileName;
    std::string sBackgroundImageFileName;
    std::string sIdentity;
    int iVersion{14};
    int iID{0};
    i32 iAudioLeadIn{0};

    DifficultyAttributes difficulty;
    f32 fSliderMultiplier{1.4f};
    f32 fSliderTickRate{1.f};

    // gameplay data
    std::vector<TIMINGPOINT> timingpoints;
    std::vector<std::unique_ptr<HitObject>> hitobjects;
    std::vector<BREAK> breaks;
    std::vector<Color> combocolors;

    uSz iNumCircles{0};
    uSz iNumSliders{0};
    uSz iNumSpinners{0};
    f64 fLastObjectEndTime{0.0};
};

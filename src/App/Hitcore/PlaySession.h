#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include "Automation.h"
#include "Beatmap.h"
#include "ModState.h"
#include "Vectors.h"
#include "score.h"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class AbstractAudioSource;

// one attempt at one chart: clock, judgement, health and the per-frame snapshot
// exclusively driven by a single tick loop, see update()
class PlaySession final {
   public:
    enum class State : u8 {
        IDLE,
        LOADING,
        PLAYING,
        PAUSED,
        COMPLETED,
        FAILED,
    };

    struct LoadError {
       public:
        enum code : u8 { NONE = 0, AUDIO_LOAD = 1, NO_BEATMAP = 2, NO_AUDIO_SOURCE = 3, ERRC_COUNT = 4 };
        code errc{0};

        [[nodiscard]] forceinline std::string_view error_string() const { return reasons[errc]; }

        explicit operator bool() const { return errc != NONE; }

       private:
        static constexpr const std::array<std::string_view, ERRC_COUNT> reasons{
            "no error",                   //
            "failed to load audio",       //
            "no beatmap to play",         //
            "no audio source to play on"  //
        };
    };

    // the two gameplay keys, judged the same way
    enum class HitKey : u8 { K1, K2 };

    // per-attempt judgement state, indexed like Beatmap::getHitObjects()
    struct ObjectState {
        LiveScore::HIT result{LiveScore::HIT::HIT_NULL};
        LiveScore::HIT headResult{LiveScore::HIT::HIT_NULL};  // sliders only, judged at the end
        f64 resolveTime{0.0};
        bool bHeadHit{false};
        bool bResolved{false};
    };

    struct VisibleObject {
        const HitObject *object;
        uSz index;

        f32 approachProgress;  // 1 when appearing, 0 at the hit time
        f32 opacity;
        vec2 ballPos;  // slider ball, or the object position

        i32 comboNumber;
        Color comboColor;

        bool bHeadHit;
        bool bResolved;
    };

    struct HitMarker {
        vec2 pos;
        LiveScore::HIT result;
        f64 spawnTime;  // session clock
        u32 epoch;
        std::optional<HitKey> key;  // nullopt if no click caused it (timeouts, spinners, slider ends)
    };

    // read-only view for the renderer, rebuilt once per update()
    struct FrameState {
        State state{State::IDLE};
        f64 time{0.0};

        std::vector<VisibleObject> visibleObjects;
        std::vector<HitMarker> hitMarkers;

        vec2 cursor{0.f, 0.f};
        std::vector<vec2> cursorTrail;  // oldest first

        std::array<u32, 2> keyPresses{};  // per HitKey, this attempt

        u64 score{0};
        int combo{0};
        float accuracy{100.f};
        f64 health{LiveScore::HEALTH_MAX};
        ScoreGrade grade{ScoreGrade::N};

        bool bCanSkip{false};
        bool bInBreak{false};
    };

    PlaySession();
    ~PlaySession();

    PlaySession(const PlaySession &) = delete;
    PlaySession &operator=(const PlaySession &) = delete;
    PlaySession(PlaySession &&) = delete;
    PlaySession &operator=(PlaySession &&) = delete;

    // supersedes whatever the session was doing, the previous load callback (if any) is ignored from now on
    // audioPath defaults to the chart's AudioFilename
    // the audio source is not owned and has to outlive the session (or the next start()/quit())
    bool start(std::shared_ptr<const Beatmap> beatmap, AbstractAudioSource *audio, const ModState &mods,
               std::string_view audioPath = {});
    bool retry();

    bool pause();
    bool resume();

    // jumps to skip_lead_time before the first object, only allowed while the clock is further away than that
    bool skip();

    // back to idle from anywhere
    void quit();

    // acknowledges COMPLETED or FAILED, nullopt in any other state
    std::optional<FinishedScore> finish();

    // one tick, realTimeMS is a monotonic wall clock
    void update(f64 realTimeMS);

    // discrete click on one of the two keys, judged against the current clock and cursor
    // ignored under mods that script the clicks
    void onHitInput(HitKey key);
    void setCursorPos(vec2 pos);

    [[nodiscard]] inline State getState() const { return this->state; }
    [[nodiscard]] inline LoadError getLastLoadError() const { return this->lastLoadError; }
    [[nodiscard]] inline u32 getEpoch() const { return this->iEpoch; }
    // false if PROTECTED convars were modified when the attempt started
    [[nodiscard]] inline bool isSubmittable() const { return this->bSubmittable; }

    [[nodiscard]] inline f64 getTime() const { return this->fTime; }
    [[nodiscard]] inline bool isAudioStarted() const { return this->bAudioStarted; }
    [[nodiscard]] inline bool isWaiting() const { return this->bIsWaiting; }
    [[nodiscard]] inline vec2 getCursorPos() const { return this->vCursorPos; }

    [[nodiscard]] inline const LiveScore &getScore() const { return this->score; }
    [[nodiscard]] inline const ModState &getMods() const { return this->mods; }
    [[nodiscard]] inline const DifficultyAttributes &getDifficulty() const { return this->difficulty; }
    [[nodiscard]] inline const std::shared_ptr<const Beatmap> &getBeatmap() const { return this->beatmap; }
    [[nodiscard]] inline const std::vector<ObjectState> &getObjectStates() const { return this->objectStates; }

    [[nodiscard]] inline f32 getApproachTime() const { return this->fApproachTime; }
    [[nodiscard]] inline f32 getHitWindow300() const { return this->fHitWindow300; }
    [[nodiscard]] inline f32 getHitWindow100() const { return this->fHitWindow100; }
    [[nodiscard]] inline f32 getHitWindow50() const { return this->fHitWindow50; }
    [[nodiscard]] inline f32 getHitCircleRadius() const { return this->fHitCircleRadius; }

    [[nodiscard]] bool canSkip() const;

    [[nodiscard]] inline const FrameState &getFrameState() const { return this->frameState; }

    static std::string_view stateToString(State state);

   private:
    friend class Automation;

    void onAudioLoaded(u32 epoch, bool success);
    void setState(State newState);

    void updateClock(f64 realTimeMS);
    void updateVisibility();
    void updateTimeouts();
    void updateDrain(f64 clockDelta);
    void updateCursorTrail();
    void pruneHitMarkers();
    void checkEndConditions();
    void buildFrameState();

    // false if nothing was in range
    bool judgeHitInput(HitKey key);
    void addJudgement(uSz index, LiveScore::HIT hit, vec2 markerPos, std::optional<HitKey> key = std::nullopt);

    void startAudio(f64 positionMS);

    [[nodiscard]] LiveScore::HIT getTierForDelta(f64 delta) const;

    // clock time after which the object is gone from the playfield
    [[nodiscard]] f64 getVisibleUntil(uSz index) const;

    std::shared_ptr<const Beatmap> beatmap{nullptr};
    AbstractAudioSource *audio{nullptr};
    std::string sAudioPath;

    ModState mods;
    DifficultyAttributes difficulty;
    f32 fSpeedMultiplier{1.f};

    State state{State::IDLE};
    LoadError lastLoadError{LoadError::NONE};
    u32 iEpoch{0};
    bool bSubmittable{true};

    // clock
    f64 fTime{0.0};
    f64 fLastRealTime{0.0};
    f64 fWaitStartRealTime{0.0};
    f64 fWaitStartTime{0.0};
    bool bIsWaiting{false};    // lead-in, clock runs on the wall clock
    bool bNeedsPin{false};     // next update re-anchors the wall clock
    bool bHasRealTime{false};  // fLastRealTime is valid
    bool bAudioStarted{false};
    f64 fLastAudioPos{0.0};    // last position that moved the clock
    bool bHasAudioPos{false};  // fLastAudioPos is valid for the current play()

    // difficulty-derived, fixed per attempt
    f32 fApproachTime{1200.f};
    f32 fHitWindow300{50.f};
    f32 fHitWindow100{100.f};
    f32 fHitWindow50{150.f};
    f32 fHitCircleRadius{32.f};

    LiveScore score;
    std::vector<ObjectState> objectStates;
    uSz iFirstActiveIndex{0};
    std::vector<uSz> visibleIndices;

    vec2 vCursorPos{0.f, 0.f};
    std::vector<vec2> cursorTrail;
    std::vector<HitMarker> hitMarkers;
    std::array<u32, 2> keyPresses{};

    Automation automation;

    FrameState frameState;
};

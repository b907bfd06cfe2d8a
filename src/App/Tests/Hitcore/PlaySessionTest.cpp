// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "TestMacros.h"

#include "AudioSource.h"
#include "Beatmap.h"
#include "ConVar.h"
#include "ConVarHandler.h"
#include "GameConVars.h"
#include "GameRules.h"
#include "PlaySession.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Hc::Tests {

namespace {

// OD5: 50/100/150 ms windows, CS4, no drain
constexpr std::string_view SINGLE_CIRCLE = R"(osu file format v14

[General]
AudioFilename: audio.mp3

[Metadata]
Title:Single
BeatmapID:42

[Difficulty]
HPDrainRate:0
CircleSize:4
OverallDifficulty:5
ApproachRate:5

[TimingPoints]
0,500,4,2,0,100,1,0

[HitObjects]
256,192,1000,1,0,0:0:0:0:
)";

constexpr std::string_view LATE_START = R"(osu file format v14

[Difficulty]
HPDrainRate:0
OverallDifficulty:5

[HitObjects]
256,192,10000,1,0,0:0:0:0:
)";

constexpr std::string_view SLIDER_AND_SPINNER = R"(osu file format v14

[Difficulty]
HPDrainRate:0
CircleSize:4
OverallDifficulty:5
ApproachRate:5
SliderMultiplier:1.4

[TimingPoints]
0,500,4,2,0,100,1,0

[HitObjects]
100,100,1000,2,0,L|200:100,1,140
256,192,3000,12,0,4000,0:0:0:0:
)";

constexpr std::string_view SEVEN_CIRCLES = R"(osu file format v14

[Difficulty]
HPDrainRate:0
OverallDifficulty:5

[HitObjects]
64,64,1000,1,0
128,64,1100,1,0
192,64,1200,1,0
256,64,1300,1,0
320,64,1400,1,0
384,64,1500,1,0
448,64,1600,1,0
)";

// the position only changes when the test says so, loads complete on request
class ScriptedAudioSource final : public AbstractAudioSource {
   public:
    void load(std::string_view path, LoadCallback onLoaded) override {
        this->sLastPath = path;
        this->pendingLoads.push_back(std::move(onLoaded));
    }

    // completes the most recent request unless told otherwise
    void completeLoad(bool success) { this->completeLoad(this->pendingLoads.size() - 1, success); }
    void completeLoad(uSz request, bool success) {
        if(request >= this->pendingLoads.size() || !this->pendingLoads[request]) return;
        auto callback = std::move(this->pendingLoads[request]);
        this->pendingLoads[request] = nullptr;
        callback(success);
    }

    void play(f64 positionMS) override {
        this->fPosition = positionMS;
        this->fLastPlayPosition = positionMS;
        this->bPlaying = true;
        this->iNumPlays++;
    }

    void stop() override {
        this->bPlaying = false;
        this->iNumStops++;
    }

    void setRate(f32 rate) override { this->fRate = rate; }

    [[nodiscard]] f64 getPositionMS() const override { return this->fPosition; }
    [[nodiscard]] f64 getDurationMS() const override { return this->fDuration; }

    std::vector<LoadCallback> pendingLoads;
    std::string sLastPath;

    f64 fPosition{0.0};
    f64 fDuration{0.0};
    f64 fLastPlayPosition{-1.0};
    f32 fRate{1.f};
    int iNumPlays{0};
    int iNumStops{0};
    bool bPlaying{false};
};

std::shared_ptr<const Beatmap> load(std::string_view text) { return Beatmap::parse(text).beatmap; }

using HitKey = PlaySession::HitKey;

}  // namespace

class PlaySessionTest {
   public:
    int run() {
        cvars().resetAll();

        testPlaythrough();
        testNoInput();
        testHitWindows();
        testRadiusAndLockout();
        testLoadFailures();
        testStaleLoadCallback();
        testStaleAudioPosition();
        testVirtualTimeAfterSong();
        testSkip();
        testPauseResume();
        testSpeedMods();
        testSliderAndSpinner();
        testFailure();
        testAutomation();
        testFrameState();
        testHitKeys();
        testRetryAndQuit();

        cvars().resetAll();
        TEST_PRINT_RESULTS("PlaySessionTest");
        return m_failures > 0 ? 1 : 0;
    }

   private:
    // start, finish the load and run the lead-in until the song starts at 0 (normal speed only)
    bool startPlaying(PlaySession &session, ScriptedAudioSource &audio, std::string_view chart,
                      const ModState &mods = {}) {
        if(!session.start(load(chart), &audio, mods)) return false;
        audio.completeLoad(true);
        this->tickAt(session, 0.0);
        this->tickAt(session, 2000.0);
        return session.getState() == PlaySession::State::PLAYING && session.isAudioStarted();
    }

    // audio at positionMS, one tick later on the wall clock
    void advanceTo(PlaySession &session, ScriptedAudioSource &audio, f64 positionMS, f64 realDelta = 16.0) {
        audio.fPosition = positionMS;
        this->tickAt(session, this->fRealTime + realDelta);
    }

    void tickAt(PlaySession &session, f64 realMS) {
        this->fRealTime = realMS;
        session.update(realMS);
    }

    void testPlaythrough() {
        TEST_SECTION("playthrough");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "idle before start");

        TEST_ASSERT(session.start(load(SINGLE_CIRCLE), &audio, ModState{}), "start accepted");
        TEST_ASSERT(session.getState() == PlaySession::State::LOADING, "loading");
        TEST_ASSERT_EQ(audio.sLastPath, std::string{"audio.mp3"}, "chart audio file requested");

        audio.completeLoad(true);
        TEST_ASSERT(session.getState() == PlaySession::State::PLAYING, "playing after load");

        this->tickAt(session, 0.0);
        TEST_ASSERT_NEAR(session.getTime(), -2000.0, 0.001, "lead-in starts at -2000");
        TEST_ASSERT(session.isWaiting() && !session.isAudioStarted(), "audio waits for the lead-in");
        TEST_ASSERT_EQ(audio.iNumPlays, 0, "no playback during the lead-in");

        this->tickAt(session, 1000.0);
        TEST_ASSERT_NEAR(session.getTime(), -1000.0, 0.001, "lead-in follows the wall clock");

        this->tickAt(session, 2000.0);
        TEST_ASSERT_NEAR(session.getTime(), 0.0, 0.001, "song starts at 0");
        TEST_ASSERT(session.isAudioStarted(), "audio started");
        TEST_ASSERT_EQ(audio.iNumPlays, 1, "play called once");
        TEST_ASSERT_NEAR(audio.fLastPlayPosition, 0.0, 0.001, "played from the start");

        this->advanceTo(session, audio, 1000.0);
        TEST_ASSERT_NEAR(session.getTime(), 1000.0, 0.001, "clock follows the audio");
        TEST_ASSERT(session.getCursorPos() == GameRules::getPlayfieldCenter(), "cursor starts centered");

        session.onHitInput(HitKey::K1);
        const auto &st = session.getObjectStates()[0];
        TEST_ASSERT(st.bResolved && st.result == LiveScore::HIT::HIT_300, "perfect hit is a 300");
        TEST_ASSERT_EQ(session.getScore().getNum300s(), 1, "one 300");
        TEST_ASSERT_EQ(session.getScore().getCombo(), 1, "combo 1");

        this->advanceTo(session, audio, 2100.0);
        TEST_ASSERT(session.getState() == PlaySession::State::COMPLETED, "completed after the grace period");
        TEST_ASSERT(!audio.bPlaying, "audio stopped");

        auto result = session.finish();
        TEST_ASSERT(result.has_value(), "finish yields a score");
        if(result) {
            TEST_ASSERT(result->grade == ScoreGrade::X, "SS");
            TEST_ASSERT(result->passed, "passed");
            TEST_ASSERT_EQ(result->beatmapIdentity, std::string{"42"}, "identity");
            TEST_ASSERT_NEAR(result->accuracy, 100.f, 0.001f, "accuracy");
            TEST_ASSERT(result->unixTimestamp > 0, "timestamp");
        }
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "idle after finish");
        TEST_ASSERT(!session.finish().has_value(), "finish only once");
    }

    void testNoInput() {
        TEST_SECTION("no input");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");

        this->advanceTo(session, audio, 1150.0);
        TEST_ASSERT(!session.getObjectStates()[0].bResolved, "still hittable at the edge of the 50 window");

        this->advanceTo(session, audio, 1151.0);
        TEST_ASSERT(session.getObjectStates()[0].result == LiveScore::HIT::HIT_MISS, "missed after the window");
        TEST_ASSERT_NEAR(session.getScore().getHealth(), 85.0, 0.0001, "miss costs 15 health without drain");
        TEST_ASSERT_NEAR(session.getScore().getAccuracy(), 0.f, 0.0001f, "accuracy 0");

        this->advanceTo(session, audio, 2100.0);
        TEST_ASSERT(session.getState() == PlaySession::State::COMPLETED, "completed despite the miss");
        auto result = session.finish();
        if(result) TEST_ASSERT(result->grade == ScoreGrade::D, "D");
    }

    LiveScore::HIT hitAt(f64 positionMS) {
        ScriptedAudioSource audio;
        PlaySession session;
        if(!this->startPlaying(session, audio, SINGLE_CIRCLE)) return LiveScore::HIT::HIT_NULL;
        this->advanceTo(session, audio, positionMS);
        session.onHitInput(HitKey::K1);
        return session.getObjectStates()[0].result;
    }

    void testHitWindows() {
        TEST_SECTION("hit windows");

        TEST_ASSERT(this->hitAt(1049.0) == LiveScore::HIT::HIT_300, "+49 is a 300");
        TEST_ASSERT(this->hitAt(951.0) == LiveScore::HIT::HIT_300, "-49 is a 300");
        TEST_ASSERT(this->hitAt(1051.0) == LiveScore::HIT::HIT_100, "+51 is a 100");
        TEST_ASSERT(this->hitAt(1100.0) == LiveScore::HIT::HIT_100, "+100 is a 100");
        TEST_ASSERT(this->hitAt(1149.0) == LiveScore::HIT::HIT_50, "+149 is a 50");
        TEST_ASSERT(this->hitAt(851.0) == LiveScore::HIT::HIT_50, "-149 is a 50");
        TEST_ASSERT(this->hitAt(1151.0) == LiveScore::HIT::HIT_MISS, "+151 is a miss");

        // too early: the click does nothing, the object stays hittable
        TEST_ASSERT(this->hitAt(800.0) == LiveScore::HIT::HIT_NULL, "-200 is ignored");
    }

    void testRadiusAndLockout() {
        TEST_SECTION("radius");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");
        this->advanceTo(session, audio, 1000.0);

        session.setCursorPos({256.f + 40.f, 192.f});
        session.onHitInput(HitKey::K1);
        TEST_ASSERT(!session.getObjectStates()[0].bResolved, "click outside the circle is absorbed");

        session.setCursorPos({256.f + 30.f, 192.f});
        session.onHitInput(HitKey::K2);
        TEST_ASSERT(session.getObjectStates()[0].result == LiveScore::HIT::HIT_300, "click inside the radius");

        session.onHitInput(HitKey::K1);
        TEST_ASSERT_EQ(session.getScore().getNumJudged(), 1, "an object is judged once");
    }

    void testLoadFailures() {
        TEST_SECTION("load failures");

        ScriptedAudioSource audio;
        PlaySession session;

        TEST_ASSERT(!session.start(nullptr, &audio, ModState{}), "no beatmap");
        TEST_ASSERT_EQ((int)session.getLastLoadError().errc, (int)PlaySession::LoadError::NO_BEATMAP, "NO_BEATMAP");
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "idle");

        TEST_ASSERT(!session.start(load(SINGLE_CIRCLE), nullptr, ModState{}), "no audio source");
        TEST_ASSERT_EQ((int)session.getLastLoadError().errc, (int)PlaySession::LoadError::NO_AUDIO_SOURCE,
                       "NO_AUDIO_SOURCE");

        TEST_ASSERT(session.start(load(SINGLE_CIRCLE), &audio, ModState{}), "start");
        audio.completeLoad(false);
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "idle after a failed load");
        TEST_ASSERT_EQ((int)session.getLastLoadError().errc, (int)PlaySession::LoadError::AUDIO_LOAD, "AUDIO_LOAD");
        TEST_ASSERT(!session.getLastLoadError().error_string().empty(), "error message");
    }

    void testStaleLoadCallback() {
        TEST_SECTION("stale load callback");

        ScriptedAudioSource audio;
        PlaySession session;

        TEST_ASSERT(session.start(load(SINGLE_CIRCLE), &audio, ModState{}), "first start");
        const u32 firstEpoch = session.getEpoch();
        TEST_ASSERT(session.start(load(SINGLE_CIRCLE), &audio, ModState{}), "second start");
        TEST_ASSERT(session.getEpoch() != firstEpoch, "new epoch");

        audio.completeLoad(0, true);
        TEST_ASSERT(session.getState() == PlaySession::State::LOADING, "superseded load is ignored");

        audio.completeLoad(1, true);
        TEST_ASSERT(session.getState() == PlaySession::State::PLAYING, "current load completes");

        // a load that finishes after quitting does nothing
        TEST_ASSERT(session.start(load(SINGLE_CIRCLE), &audio, ModState{}), "third start");
        session.quit();
        audio.completeLoad(true);
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "stays idle after quit");
    }

    void testStaleAudioPosition() {
        TEST_SECTION("stale audio position");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");

        this->advanceTo(session, audio, 500.0);
        TEST_ASSERT_NEAR(session.getTime(), 500.0, 0.001, "clock at 500");

        this->advanceTo(session, audio, 0.0);
        TEST_ASSERT_NEAR(session.getTime(), 516.67, 0.01, "stale position advances one frame");
        this->advanceTo(session, audio, 0.0);
        TEST_ASSERT_NEAR(session.getTime(), 533.34, 0.01, "and another");

        this->advanceTo(session, audio, 600.0);
        TEST_ASSERT_NEAR(session.getTime(), 600.0, 0.001, "audio position takes over again");

        // a backend stuck on a non-zero position
        ScriptedAudioSource stuckAudio;
        PlaySession stuck;
        TEST_ASSERT(this->startPlaying(stuck, stuckAudio, SINGLE_CIRCLE), "playing");
        this->advanceTo(stuck, stuckAudio, 500.0);
        for(int i = 0; i < 60; i++) this->advanceTo(stuck, stuckAudio, 500.0);
        const f64 afterStuck = stuck.getTime();
        TEST_ASSERT_NEAR(afterStuck, 500.0 + 60 * 16.67, 0.01, "repeated position keeps the clock moving");

        this->advanceTo(stuck, stuckAudio, 480.0);
        TEST_ASSERT(stuck.getTime() > afterStuck, "position going back never rewinds the clock");

        // the backend catches up but is still behind the clock, hold until it passes
        this->advanceTo(stuck, stuckAudio, 1000.0);
        TEST_ASSERT(stuck.getTime() > afterStuck, "no rewind when the backend recovers behind the clock");
        this->advanceTo(stuck, stuckAudio, 2000.0);
        TEST_ASSERT_NEAR(stuck.getTime(), 2000.0, 0.001, "audio takes over once ahead");
    }

    void testVirtualTimeAfterSong() {
        TEST_SECTION("clock after the song ends");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");
        audio.fDuration = 1200.0;

        this->advanceTo(session, audio, 1000.0);
        session.onHitInput(HitKey::K1);

        this->advanceTo(session, audio, 1200.0, 100.0);
        TEST_ASSERT_NEAR(session.getTime(), 1200.0, 0.001, "clamped to the song end");

        this->advanceTo(session, audio, 1200.0, 500.0);
        TEST_ASSERT_NEAR(session.getTime(), 1700.0, 0.001, "continues on the wall clock");
        TEST_ASSERT(session.getState() == PlaySession::State::PLAYING, "grace period still running");

        this->advanceTo(session, audio, 1200.0, 500.0);
        TEST_ASSERT(session.getState() == PlaySession::State::COMPLETED, "completes without audio");
    }

    void testSkip() {
        TEST_SECTION("skip");

        ScriptedAudioSource audio;
        PlaySession session;

        // first object at 1000, skipping would land at -1000
        session.start(load(SINGLE_CIRCLE), &audio, ModState{});
        audio.completeLoad(true);
        this->tickAt(session, 0.0);
        TEST_ASSERT(session.canSkip(), "skippable at -2000");
        TEST_ASSERT(session.skip(), "skip");
        TEST_ASSERT_NEAR(session.getTime(), -1000.0, 0.001, "skipped into the lead-in");
        TEST_ASSERT(!session.isAudioStarted(), "still waiting");
        TEST_ASSERT(!session.skip(), "no second skip within 2000 ms of the first object");

        this->tickAt(session, 100.0);
        TEST_ASSERT_NEAR(session.getTime(), -1000.0, 0.001, "wall clock re-anchored");
        this->tickAt(session, 600.0);
        TEST_ASSERT_NEAR(session.getTime(), -500.0, 0.001, "lead-in continues");

        // first object at 10000, the skip seeks the song
        ScriptedAudioSource lateAudio;
        PlaySession late;
        TEST_ASSERT(this->startPlaying(late, lateAudio, LATE_START), "playing");
        TEST_ASSERT(late.skip(), "skip into the song");
        TEST_ASSERT_NEAR(lateAudio.fLastPlayPosition, 8000.0, 0.001, "audio seeked");
        TEST_ASSERT_NEAR(late.getTime(), 8000.0, 0.001, "clock at the seek target");
        TEST_ASSERT(!late.canSkip(), "nothing left to skip");

        late.pause();
        TEST_ASSERT(!late.skip(), "no skip while paused");
    }

    void testPauseResume() {
        TEST_SECTION("pause and resume");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");
        this->advanceTo(session, audio, 500.0);

        TEST_ASSERT(!session.resume(), "resume needs a pause");
        TEST_ASSERT(session.pause(), "pause");
        TEST_ASSERT(session.getState() == PlaySession::State::PAUSED, "paused");
        TEST_ASSERT(!audio.bPlaying, "audio stopped");
        TEST_ASSERT(!session.pause(), "no double pause");

        this->advanceTo(session, audio, 900.0);
        TEST_ASSERT_NEAR(session.getTime(), 500.0, 0.001, "clock frozen while paused");
        session.onHitInput(HitKey::K1);
        TEST_ASSERT_EQ(session.getScore().getNumJudged(), 0, "input ignored while paused");

        TEST_ASSERT(session.resume(), "resume");
        TEST_ASSERT(audio.bPlaying, "audio playing");
        TEST_ASSERT_NEAR(audio.fLastPlayPosition, 500.0, 0.001, "resumed where it stopped");

        // pause during the lead-in
        PlaySession waiting;
        ScriptedAudioSource waitingAudio;
        waiting.start(load(SINGLE_CIRCLE), &waitingAudio, ModState{});
        waitingAudio.completeLoad(true);
        this->tickAt(waiting, 0.0);
        this->tickAt(waiting, 500.0);
        TEST_ASSERT_NEAR(waiting.getTime(), -1500.0, 0.001, "in the lead-in");
        waiting.pause();
        this->tickAt(waiting, 5000.0);
        waiting.resume();
        this->tickAt(waiting, 6000.0);
        TEST_ASSERT_NEAR(waiting.getTime(), -1500.0, 0.001, "lead-in resumes where it stopped");
        this->tickAt(waiting, 6500.0);
        TEST_ASSERT_NEAR(waiting.getTime(), -1000.0, 0.001, "and keeps counting");
    }

    void testSpeedMods() {
        TEST_SECTION("speed and difficulty mods");

        ScriptedAudioSource audio;
        PlaySession session;
        auto dt = ModState::fromString("DT").value();
        session.start(load(SINGLE_CIRCLE), &audio, dt);
        audio.completeLoad(true);
        this->tickAt(session, 0.0);
        this->tickAt(session, 1000.0);
        TEST_ASSERT_NEAR(session.getTime(), -500.0, 0.001, "lead-in runs 1.5x");
        this->tickAt(session, 1400.0);
        TEST_ASSERT(session.isAudioStarted(), "audio started");
        TEST_ASSERT_NEAR(audio.fRate, 1.5f, 0.0001f, "playback rate");

        // stale frames scale too
        this->advanceTo(session, audio, 500.0);
        this->advanceTo(session, audio, 0.0);
        TEST_ASSERT_NEAR(session.getTime(), 525.005, 0.01, "stale frame at 1.5x");

        ScriptedAudioSource ezAudio;
        PlaySession ez;
        auto hrez = ModState::fromString("HREZ").value();
        TEST_ASSERT(this->startPlaying(ez, ezAudio, SINGLE_CIRCLE, hrez), "playing");
        TEST_ASSERT(ez.getMods().has(ModFlags::Easy) && !ez.getMods().has(ModFlags::HardRock), "EZ only");
        TEST_ASSERT_NEAR(ez.getDifficulty().OD, 2.5f, 0.001f, "EZ halves OD");
        TEST_ASSERT_NEAR(ez.getHitWindow50(), GameRules::odTo50HitWindowMS(2.5f), 0.001f, "wider 50 window");
        TEST_ASSERT_NEAR(ez.getHitCircleRadius(), GameRules::getHitCircleRadius(2.f), 0.001f, "bigger circles");
        TEST_ASSERT_NEAR(ez.getScore().getScoreMultiplier(), 0.5, 0.0001, "EZ score multiplier");
    }

    void testSliderAndSpinner() {
        TEST_SECTION("slider and spinner");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SLIDER_AND_SPINNER), "playing");

        this->advanceTo(session, audio, 1040.0);
        session.setCursorPos({100.f, 100.f});
        session.onHitInput(HitKey::K1);
        const auto &slider = session.getObjectStates()[0];
        TEST_ASSERT(slider.bHeadHit && !slider.bResolved, "head hit, slider still running");
        TEST_ASSERT_EQ(session.getScore().getNumJudged(), 0, "not judged before the end");

        this->advanceTo(session, audio, 1250.0);
        TEST_ASSERT(!slider.bResolved, "mid slider");

        this->advanceTo(session, audio, 1500.0);
        TEST_ASSERT(slider.bResolved && slider.result == LiveScore::HIT::HIT_300, "resolved with the head tier");

        this->advanceTo(session, audio, 3500.0);
        TEST_ASSERT(!session.getObjectStates()[1].bResolved, "spinner runs");
        this->advanceTo(session, audio, 4000.0);
        TEST_ASSERT(session.getObjectStates()[1].result == LiveScore::HIT::HIT_300, "spinner completes itself");

        // unhit slider: missed after its end plus the 50 window
        ScriptedAudioSource missAudio;
        PlaySession missed;
        TEST_ASSERT(this->startPlaying(missed, missAudio, SLIDER_AND_SPINNER), "playing");
        this->advanceTo(missed, missAudio, 1600.0);
        TEST_ASSERT(!missed.getObjectStates()[0].bResolved, "slider still pending");
        this->advanceTo(missed, missAudio, 1651.0);
        TEST_ASSERT(missed.getObjectStates()[0].result == LiveScore::HIT::HIT_MISS, "slider missed");
    }

    void testFailure() {
        TEST_SECTION("failure");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SEVEN_CIRCLES), "playing");
        this->advanceTo(session, audio, 1800.0);
        TEST_ASSERT_EQ(session.getScore().getNumMisses(), 7, "all missed");
        TEST_ASSERT(session.getState() == PlaySession::State::FAILED, "failed at 0 health");
        TEST_ASSERT(!audio.bPlaying, "audio stopped");

        auto result = session.finish();
        TEST_ASSERT(result.has_value(), "failed runs can be finished");
        if(result) {
            TEST_ASSERT(!result->passed, "not passed");
            TEST_ASSERT(result->grade == ScoreGrade::F, "F");
        }

        ScriptedAudioSource nfAudio;
        PlaySession noFail;
        TEST_ASSERT(this->startPlaying(noFail, nfAudio, SEVEN_CIRCLES, ModState::fromString("NF").value()), "NF");
        this->advanceTo(noFail, nfAudio, 1800.0);
        TEST_ASSERT_NEAR(noFail.getScore().getHealth(), 0.0, 0.0001, "health empty");
        TEST_ASSERT(noFail.getState() == PlaySession::State::PLAYING, "NF keeps playing");
    }

    void testAutomation() {
        TEST_SECTION("automation");

        ScriptedAudioSource audio;
        PlaySession autoplay;
        TEST_ASSERT(this->startPlaying(autoplay, audio, SEVEN_CIRCLES, ModState::fromString("AT").value()), "AT");

        autoplay.setCursorPos({0.f, 0.f});
        TEST_ASSERT(autoplay.getCursorPos() != vec2(0.f, 0.f), "cursor is scripted");

        for(f64 pos = 900.0; pos <= 1700.0; pos += 10.0) this->advanceTo(autoplay, audio, pos);
        TEST_ASSERT_EQ(autoplay.getScore().getNum300s(), 7, "every circle is a 300");
        TEST_ASSERT_EQ(autoplay.getScore().getComboMax(), 7, "full combo");

        ScriptedAudioSource rxAudio;
        PlaySession relax;
        TEST_ASSERT(this->startPlaying(relax, rxAudio, SINGLE_CIRCLE, ModState::fromString("RX").value()), "RX");
        this->advanceTo(relax, rxAudio, 950.0);
        relax.onHitInput(HitKey::K1);
        TEST_ASSERT_EQ(relax.getScore().getNumJudged(), 0, "manual clicks ignored under RX");
        this->advanceTo(relax, rxAudio, 995.0);
        TEST_ASSERT(relax.getObjectStates()[0].result == LiveScore::HIT::HIT_300, "RX clicks near the object");

        ScriptedAudioSource apAudio;
        PlaySession autopilot;
        TEST_ASSERT(this->startPlaying(autopilot, apAudio, SEVEN_CIRCLES, ModState::fromString("AP").value()), "AP");
        this->advanceTo(autopilot, apAudio, 990.0);
        TEST_ASSERT(autopilot.getCursorPos() == vec2(64.f, 64.f), "AP snaps onto the next object");
        TEST_ASSERT_EQ(autopilot.getScore().getNumJudged(), 0, "AP does not click");
        autopilot.onHitInput(HitKey::K2);
        TEST_ASSERT(autopilot.getObjectStates()[0].result == LiveScore::HIT::HIT_300, "manual click under AP");

        const auto autoPresses = autoplay.getFrameState().keyPresses;
        TEST_ASSERT_EQ(autoPresses[0], (u32)4, "scripted clicks start on K1");
        TEST_ASSERT_EQ(autoPresses[1], (u32)3, "and alternate with K2");
    }

    void testFrameState() {
        TEST_SECTION("frame state");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing");

        this->advanceTo(session, audio, 500.0);
        const auto &fs = session.getFrameState();
        TEST_ASSERT(fs.state == PlaySession::State::PLAYING, "state");
        TEST_ASSERT_EQ(fs.visibleObjects.size(), (uSz)1, "circle visible");
        if(!fs.visibleObjects.empty()) {
            TEST_ASSERT_NEAR(fs.visibleObjects[0].approachProgress, 500.f / 1200.f, 0.001f, "approach progress");
            TEST_ASSERT_EQ(fs.visibleObjects[0].comboNumber, 1, "combo number");
            TEST_ASSERT_NEAR(fs.visibleObjects[0].opacity, 1.f, 0.001f, "fully faded in");
        }
        TEST_ASSERT(!fs.cursorTrail.empty(), "cursor trail");
        TEST_ASSERT(fs.cursorTrail.size() <= 16, "trail capped");

        this->advanceTo(session, audio, 1000.0);
        session.onHitInput(HitKey::K1);
        this->advanceTo(session, audio, 1016.0);
        TEST_ASSERT_EQ(session.getFrameState().hitMarkers.size(), (uSz)1, "hit marker");
        TEST_ASSERT(session.getFrameState().visibleObjects.size() == 1, "fading out after the hit");

        this->advanceTo(session, audio, 1400.0);
        TEST_ASSERT(session.getFrameState().hitMarkers.empty(), "hit marker expired");
        this->advanceTo(session, audio, 1600.0);
        TEST_ASSERT(session.getFrameState().visibleObjects.empty(), "faded out");

        for(int i = 0; i < 40; i++) this->advanceTo(session, audio, 1600.0 + i);
        TEST_ASSERT_EQ(session.getFrameState().cursorTrail.size(), (uSz)16, "trail length");
    }

    void testHitKeys() {
        TEST_SECTION("hit keys");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SEVEN_CIRCLES), "playing");

        this->advanceTo(session, audio, 1000.0);
        session.setCursorPos({64.f, 64.f});
        session.onHitInput(HitKey::K1);

        this->advanceTo(session, audio, 1100.0);
        session.setCursorPos({128.f, 64.f});
        session.onHitInput(HitKey::K2);
        // nothing under the cursor, still a key press
        session.onHitInput(HitKey::K2);

        TEST_ASSERT_EQ(session.getScore().getNum300s(), 2, "both keys judge");

        this->advanceTo(session, audio, 1110.0);
        const auto &fs = session.getFrameState();
        TEST_ASSERT_EQ(fs.keyPresses[0], (u32)1, "one K1 press");
        TEST_ASSERT_EQ(fs.keyPresses[1], (u32)2, "two K2 presses");
        TEST_ASSERT_EQ(fs.hitMarkers.size(), (uSz)2, "a marker per hit");
        if(fs.hitMarkers.size() == 2) {
            TEST_ASSERT(fs.hitMarkers[0].key == HitKey::K1, "first hit on K1");
            TEST_ASSERT(fs.hitMarkers[1].key == HitKey::K2, "second hit on K2");
        }

        // a timeout was not caused by any key
        this->advanceTo(session, audio, 1400.0);
        const auto &markers = session.getFrameState().hitMarkers;
        TEST_ASSERT(!markers.empty(), "miss marker");
        if(!markers.empty()) TEST_ASSERT(!markers.back().key.has_value(), "miss marker has no key");

        TEST_ASSERT(session.retry(), "retry");
        audio.completeLoad(true);
        TEST_ASSERT_EQ(session.getFrameState().keyPresses[1], (u32)0, "presses reset with the attempt");
    }

    void testRetryAndQuit() {
        TEST_SECTION("retry and quit");

        ScriptedAudioSource audio;
        PlaySession session;
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE, ModState::fromString("HD").value()), "playing");
        this->advanceTo(session, audio, 1000.0);
        session.onHitInput(HitKey::K1);
        const u32 epoch = session.getEpoch();

        TEST_ASSERT(session.retry(), "retry");
        TEST_ASSERT(session.getEpoch() != epoch, "new attempt");
        TEST_ASSERT(session.getState() == PlaySession::State::LOADING, "loading again");
        TEST_ASSERT_EQ(session.getScore().getNumJudged(), 0, "score reset");
        TEST_ASSERT(session.getMods().has(ModFlags::Hidden), "mods kept");
        TEST_ASSERT(!session.getObjectStates()[0].bResolved, "objects reset");
        TEST_ASSERT(session.getFrameState().hitMarkers.empty(), "markers of the old attempt are gone");

        audio.completeLoad(true);
        TEST_ASSERT(session.getState() == PlaySession::State::PLAYING, "playing again");
        TEST_ASSERT(cvars().isGameplayLocked(), "gameplay settings locked while playing");

        session.quit();
        TEST_ASSERT(session.getState() == PlaySession::State::IDLE, "quit");
        TEST_ASSERT(!cvars().isGameplayLocked(), "unlocked after quitting");
        TEST_ASSERT(!session.finish().has_value(), "nothing to finish after quitting");

        // protected settings are checked when an attempt starts
        cvars().resetAll();
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing with defaults");
        TEST_ASSERT(session.isSubmittable(), "defaults are submittable");
        session.quit();

        cv::miss_health_penalty.setValue(5.0f);
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing with a modified penalty");
        TEST_ASSERT(!session.isSubmittable(), "modified protected convar");
        session.quit();

        cvars().resetAll();
        cv::cursor_trail_length.setValue(4);
        TEST_ASSERT(this->startPlaying(session, audio, SINGLE_CIRCLE), "playing with a shorter trail");
        TEST_ASSERT(session.isSubmittable(), "unprotected convars don't matter");
        session.quit();
        cvars().resetAll();
    }

    f64 fRealTime{0.0};

    int m_passes = 0;
    int m_failures = 0;
};

}  // namespace Hc::Tests

TEST_MAIN(Hc::Tests::PlaySessionTest)

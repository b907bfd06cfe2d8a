// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "PlaySession.h"

#include "AudioSource.h"
#include "ConVarHandler.h"
#include "GameConVars.h"
#include "GameRules.h"
#include "Logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace {
std::string_view hitToString(LiveScore::HIT hit) {
    switch(hit) {
        case LiveScore::HIT::HIT_300:
            return "300";
        case LiveScore::HIT::HIT_100:
            return "100";
        case LiveScore::HIT::HIT_50:
            return "50";
        case LiveScore::HIT::HIT_MISS:
            return "miss";
        case LiveScore::HIT::HIT_NULL:
            break;
    }
    return "null";
}
}  // namespace

std::string_view PlaySession::stateToString(State state) {
    switch(state) {
        case State::IDLE:
            return "Idle";
        case State::LOADING:
            return "Loading";
        case State::PLAYING:
            return "Playing";
        case State::PAUSED:
            return "Paused";
        case State::COMPLETED:
            return "Completed";
        case State::FAILED:
            return "Failed";
    }
    return "?";
}

PlaySession::PlaySession() { this->buildFrameState(); }

PlaySession::~PlaySession() {
    if(this->state == State::PLAYING || this->state == State::PAUSED) cvars().setGameplayLock(false);
}

void PlaySession::setState(State newState) {
    if(this->state == newState) return;
    debugLog("{} -> {} (epoch {}, time {:.0f})", stateToString(this->state), stateToString(newState), this->iEpoch,
             this->fTime);
    this->state = newState;

    // gameplay convars are frozen for the duration of an attempt
    cvars().setGameplayLock(newState == State::PLAYING || newState == State::PAUSED);
}

//*********************//
//	State transitions  //
//*********************//

bool PlaySession::start(std::shared_ptr<const Beatmap> beatmap, AbstractAudioSource *audio, const ModState &mods,
                        std::string_view audioPath) {
    // invalidate the previous attempt first, even if this one gets rejected
    this->iEpoch++;
    if(this->audio != nullptr && this->state != State::IDLE) this->audio->stop();
    this->bAudioStarted = false;
    this->bIsWaiting = false;
    this->visibleIndices.clear();
    this->hitMarkers.clear();

    if(!beatmap) {
        this->lastLoadError = {LoadError::NO_BEATMAP};
        debugLog("Cannot start: {}", this->lastLoadError.error_string());
        this->setState(State::IDLE);
        this->buildFrameState();
        return false;
    }
    if(audio == nullptr) {
        this->lastLoadError = {LoadError::NO_AUDIO_SOURCE};
        debugLog("Cannot start: {}", this->lastLoadError.error_string());
        this->setState(State::IDLE);
        this->buildFrameState();
        return false;
    }

    this->beatmap = std::move(beatmap);
    this->audio = audio;
    this->sAudioPath = audioPath.empty() ? this->beatmap->getAudioFileName() : std::string{audioPath};
    this->mods = mods;
    this->lastLoadError = {LoadError::NONE};

    this->difficulty = mods.applyToDifficulty(this->beatmap->getDifficulty());
    this->fSpeedMultiplier = mods.getSpeedMultiplier();

    this->fApproachTime = GameRules::arToMilliseconds(this->difficulty.AR);
    this->fHitWindow300 = GameRules::odTo300HitWindowMS(this->difficulty.OD);
    this->fHitWindow100 = GameRules::odTo100HitWindowMS(this->difficulty.OD);
    this->fHitWindow50 = GameRules::odTo50HitWindowMS(this->difficulty.OD);
    this->fHitCircleRadius = GameRules::getHitCircleRadius(this->difficulty.CS);

    this->score.reset(mods, this->difficulty);
    // GAMEPLAY convars (all PROTECTED ones included) are locked from here on, so checking once is enough
    this->bSubmittable = cvars().areAllCvarsSubmittable();
    logIf(!this->bSubmittable, "Modified protected convars, this attempt won't be recorded");
    this->objectStates.assign(this->beatmap->getNumObjects(), ObjectState{});
    this->iFirstActiveIndex = 0;

    this->vCursorPos = GameRules::getPlayfieldCenter();
    this->cursorTrail.clear();
    this->keyPresses = {};
    this->automation.reset();

    // lead-in, the clock counts up to 0 on the wall clock before the song starts
    const f64 leadIn = std::max<f64>(cv::lead_in_time.getDouble(), (f64)this->beatmap->getAudioLeadIn());
    this->fTime = -leadIn;
    this->bIsWaiting = true;
    this->bNeedsPin = true;
    this->bHasRealTime = false;

    debugLog("Starting \"{} - {} [{}]\" +{}: AR {:.2f} CS {:.2f} OD {:.2f} HP {:.2f}, speed {:.2f}, lead-in {:.0f}",
             this->beatmap->getArtist(), this->beatmap->getTitle(), this->beatmap->getDifficultyName(),
             mods.toString(), this->difficulty.AR, this->difficulty.CS, this->difficulty.OD, this->difficulty.HP,
             this->fSpeedMultiplier, leadIn);

    this->setState(State::LOADING);
    this->buildFrameState();

    // may call back immediately
    const u32 epoch = this->iEpoch;
    this->audio->load(this->sAudioPath, [this, epoch](bool success) { this->onAudioLoaded(epoch, success); });
    return true;
}

void PlaySession::onAudioLoaded(u32 epoch, bool success) {
    if(epoch != this->iEpoch || this->state != State::LOADING) {
        debugLog("Ignoring audio load result from epoch {} (current {}, {})", epoch, this->iEpoch,
                 stateToString(this->state));
        return;
    }

    if(!success) {
        this->lastLoadError = {LoadError::AUDIO_LOAD};
        debugLog("{}: {}", this->sAudioPath, this->lastLoadError.error_string());
        this->setState(State::IDLE);
        this->buildFrameState();
        return;
    }

    this->setState(State::PLAYING);
    this->buildFrameState();
}

bool PlaySession::retry() {
    if(!this->beatmap || this->audio == nullptr) return false;

    // start() overwrites these
    std::shared_ptr<const Beatmap> map = this->beatmap;
    const std::string audioPath = this->sAudioPath;
    const ModState retryMods = this->mods;

    return this->start(std::move(map), this->audio, retryMods, audioPath);
}

bool PlaySession::pause() {
    if(this->state != State::PLAYING) return false;

    if(this->bAudioStarted) this->audio->stop();
    this->bHasRealTime = false;

    this->setState(State::PAUSED);
    this->buildFrameState();
    return true;
}

bool PlaySession::resume() {
    if(this->state != State::PAUSED) return false;

    if(this->bAudioStarted) {
        this->audio->setRate(this->fSpeedMultiplier);
        this->audio->play(this->fTime);
        this->bHasAudioPos = false;
    } else {
        // still in the lead-in, continue from where the clock stopped
        this->bNeedsPin = true;
    }
    this->bHasRealTime = false;

    this->setState(State::PLAYING);
    this->buildFrameState();
    return true;
}

bool PlaySession::canSkip() const {
    if(this->state != State::PLAYING || !this->beatmap || this->beatmap->getNumObjects() == 0) return false;
    return this->fTime < (f64)this->beatmap->getFirstObjectTime() - cv::skip_lead_time.getDouble();
}

bool PlaySession::skip() {
    if(!this->canSkip()) {
        logIfCV(debug_judgement, "skip refused at {:.0f}", this->fTime);
        return false;
    }

    const f64 target = (f64)this->beatmap->getFirstObjectTime() - cv::skip_lead_time.getDouble();
    if(target < 0.0) {
        this->fTime = target;
        this->bNeedsPin = true;
    } else {
        this->startAudio(target);
        this->fTime = target;
    }

    debugLog("Skipped to {:.0f}", target);
    this->buildFrameState();
    return true;
}

void PlaySession::quit() {
    this->iEpoch++;

    if(this->audio != nullptr && this->state != State::IDLE) this->audio->stop();
    this->bAudioStarted = false;
    this->bIsWaiting = false;

    this->visibleIndices.clear();
    this->hitMarkers.clear();

    this->setState(State::IDLE);
    this->buildFrameState();
}

std::optional<FinishedScore> PlaySession::finish() {
    if(this->state != State::COMPLETED && this->state != State::FAILED) return std::nullopt;

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const u64 unixTimestamp = (u64)std::chrono::duration_cast<std::chrono::seconds>(now).count();

    FinishedScore result = this->score.buildFinishedScore(this->beatmap->getIdentity(), unixTimestamp);

    this->iEpoch++;
    this->visibleIndices.clear();
    this->hitMarkers.clear();

    this->setState(State::IDLE);
    this->buildFrameState();
    return result;
}

void PlaySession::startAudio(f64 positionMS) {
    this->bIsWaiting = false;
    this->bNeedsPin = false;
    this->bAudioStarted = true;
    this->bHasAudioPos = false;
    this->audio->setRate(this->fSpeedMultiplier);
    this->audio->play(positionMS);
}

//**********//
//	 Tick	//
//**********//

void PlaySession::update(f64 realTimeMS) {
    if(this->state != State::PLAYING) {
        this->buildFrameState();
        return;
    }

    const f64 prevTime = this->fTime;

    this->updateClock(realTimeMS);
    this->updateVisibility();
    this->updateTimeouts();
    this->automation.update(*this);
    this->updateDrain(this->fTime - prevTime);
    this->updateCursorTrail();
    this->pruneHitMarkers();
    this->checkEndConditions();

    this->buildFrameState();
}

void PlaySession::updateClock(f64 realTimeMS) {
    const f64 realDelta = this->bHasRealTime ? std::max(realTimeMS - this->fLastRealTime, 0.0) : 0.0;
    this->fLastRealTime = realTimeMS;
    this->bHasRealTime = true;

    if(this->bIsWaiting) {
        if(this->bNeedsPin) {
            this->bNeedsPin = false;
            this->fWaitStartRealTime = realTimeMS;
            this->fWaitStartTime = this->fTime;
        }

        this->fTime = this->fWaitStartTime + (realTimeMS - this->fWaitStartRealTime) * this->fSpeedMultiplier;
        if(this->fTime < 0.0) return;

        // from here on the song position is the clock
        this->startAudio(0.0);
    }

    const f64 pos = this->audio->getPositionMS();
    const f64 duration = this->audio->getDurationMS();

    if(duration > 0.0 && pos >= duration) {
        // song is over but objects (or the grace period) aren't, continue on virtual time
        this->fTime = std::max(this->fTime + realDelta * this->fSpeedMultiplier, duration);
    } else if(pos >= 0.0 && (!this->bHasAudioPos || pos > this->fLastAudioPos)) {
        this->fLastAudioPos = pos;
        this->bHasAudioPos = true;
        // never backwards, the fallback below may have run ahead of the backend
        this->fTime = std::max(this->fTime, pos);
    } else {
        // position didn't move (or went back), keep going on a nominal frame
        this->fTime += cv::stale_audio_frame_delta.getDouble() * this->fSpeedMultiplier;
        logIfCV(debug_judgement, "stale audio position {:.0f}, clock advanced to {:.2f}", pos, this->fTime);
    }
}

f64 PlaySession::getVisibleUntil(uSz index) const {
    const auto &obj = this->beatmap->getHitObjects()[index];
    const auto &st = this->objectStates[index];

    const f64 fadeStart = st.bResolved ? std::min(obj->getEndTime(), st.resolveTime) : obj->getEndTime();
    return fadeStart + GameRules::getFadeOutTime();
}

void PlaySession::updateVisibility() {
    const auto &hitobjects = this->beatmap->getHitObjects();

    // skip everything that is resolved and already faded out
    while(this->iFirstActiveIndex < hitobjects.size() && this->objectStates[this->iFirstActiveIndex].bResolved &&
          this->fTime > this->getVisibleUntil(this->iFirstActiveIndex)) {
        this->iFirstActiveIndex++;
    }

    this->visibleIndices.clear();
    for(uSz i = this->iFirstActiveIndex; i < hitobjects.size(); i++) {
        const f64 objTime = (f64)hitobjects[i]->getTime();

        // sorted by time, nothing after this has appeared yet
        if(objTime > this->fTime + this->fApproachTime) break;

        if(this->fTime >= objTime - this->fApproachTime && this->fTime <= this->getVisibleUntil(i)) {
            this->visibleIndices.push_back(i);
        }
    }
}

void PlaySession::updateTimeouts() {
    const auto &hitobjects = this->beatmap->getHitObjects();

    for(uSz i = this->iFirstActiveIndex; i < hitobjects.size() && this->state == State::PLAYING; i++) {
        const auto &obj = hitobjects[i];
        if((f64)obj->getTime() > this->fTime) break;

        const auto &st = this->objectStates[i];
        if(st.bResolved) continue;

        switch(obj->getType()) {
            case HitObjectType::CIRCLE:
                if(this->fTime > (f64)obj->getTime() + this->fHitWindow50) {
                    this->addJudgement(i, LiveScore::HIT::HIT_MISS, obj->getPos());
                }
                break;
            case HitObjectType::SLIDER:
                if(st.bHeadHit) {
                    // no tracking breaks, a hit head carries the slider
                    if(this->fTime >= obj->getEndTime()) {
                        this->addJudgement(i, st.headResult, obj->getPosAt(obj->getEndTime()));
                    }
                } else if(this->fTime > obj->getEndTime() + this->fHitWindow50) {
                    this->addJudgement(i, LiveScore::HIT::HIT_MISS, obj->getPos());
                }
                break;
            case HitObjectType::SPINNER:
                if(this->fTime >= obj->getEndTime()) {
                    this->addJudgement(i, LiveScore::HIT::HIT_300, obj->getPos());
                }
                break;
        }
    }
}

void PlaySession::updateDrain(f64 clockDelta) {
    if(clockDelta <= 0.0) return;
    if(this->fTime <= (f64)this->beatmap->getFirstObjectTime()) return;
    if(this->beatmap->isInBreak(this->fTime)) return;

    this->score.drainHealth(clockDelta);
}

void PlaySession::updateCursorTrail() {
    const uSz maxLength = (uSz)std::max(cv::cursor_trail_length.getInt(), 0);

    this->cursorTrail.push_back(this->vCursorPos);
    if(this->cursorTrail.size() > maxLength) {
        this->cursorTrail.erase(this->cursorTrail.begin(),
                                this->cursorTrail.begin() + (i64)(this->cursorTrail.size() - maxLength));
    }
}

void PlaySession::pruneHitMarkers() {
    const f64 duration = cv::hitmarker_duration.getDouble();
    std::erase_if(this->hitMarkers, [this, duration](const HitMarker &marker) {
        return marker.epoch != this->iEpoch || this->fTime - marker.spawnTime > duration;
    });
}

void PlaySession::checkEndConditions() {
    if(this->state != State::PLAYING) return;

    if(this->fTime > this->beatmap->getLastObjectEndTime() + cv::end_grace_time.getDouble()) {
        this->audio->stop();
        this->bAudioStarted = false;
        this->setState(State::COMPLETED);
        return;
    }

    if(this->score.getHealth() <= 0.0 && !this->mods.has(ModFlags::NoFail)) {
        this->score.setDead(true);
        this->audio->stop();
        this->bAudioStarted = false;
        this->setState(State::FAILED);
    }
}

//***************//
//	 Judgement	 //
//***************//

LiveScore::HIT PlaySession::getTierForDelta(f64 delta) const {
    delta = std::abs(delta);
    if(delta <= this->fHitWindow300) return LiveScore::HIT::HIT_300;
    if(delta <= this->fHitWindow100) return LiveScore::HIT::HIT_100;
    if(delta <= this->fHitWindow50) return LiveScore::HIT::HIT_50;
    return LiveScore::HIT::HIT_MISS;
}

void PlaySession::onHitInput(HitKey key) {
    if(this->state != State::PLAYING || !this->beatmap) return;

    const AutoplayMode mode = this->mods.getAutoplayMode();
    if(mode == AutoplayMode::Auto || mode == AutoplayMode::Relax) return;

    this->keyPresses[(uSz)key]++;
    this->judgeHitInput(key);
}

void PlaySession::setCursorPos(vec2 pos) {
    const AutoplayMode mode = this->mods.getAutoplayMode();
    if(this->state != State::IDLE && (mode == AutoplayMode::Auto || mode == AutoplayMode::Autopilot)) return;

    this->vCursorPos = pos;
}

bool PlaySession::judgeHitInput(HitKey key) {
    const auto &hitobjects = this->beatmap->getHitObjects();

    for(const uSz i : this->visibleIndices) {
        auto &st = this->objectStates[i];
        const auto &obj = hitobjects[i];
        if(st.bResolved || st.bHeadHit || obj->getType() == HitObjectType::SPINNER) continue;

        const f64 delta = this->fTime - (f64)obj->getTime();
        if(std::abs(delta) > this->fHitWindow50) continue;

        // only the earliest candidate is considered, a click never falls through to a later object
        if(vec::distance(this->vCursorPos, obj->getPos()) > this->fHitCircleRadius) {
            logIfCV(debug_judgement, "#{}: click at {:.0f} outside of radius", i, this->fTime);
            return false;
        }

        const LiveScore::HIT tier = this->getTierForDelta(delta);
        if(obj->getType() == HitObjectType::SLIDER) {
            st.bHeadHit = true;
            st.headResult = tier;
            logIfCV(debug_judgement, "#{}: slider head {} ({:+.1f} ms)", i, hitToString(tier), delta);
        } else {
            this->addJudgement(i, tier, obj->getPos(), key);
        }
        return true;
    }

    logIfCV(debug_judgement, "click at {:.0f} with nothing in range", this->fTime);
    return false;
}

void PlaySession::addJudgement(uSz index, LiveScore::HIT hit, vec2 markerPos, std::optional<HitKey> key) {
    auto &st = this->objectStates[index];
    st.bResolved = true;
    st.result = hit;
    st.resolveTime = this->fTime;

    this->score.addHitResult(hit);
    this->hitMarkers.push_back(
        HitMarker{.pos = markerPos, .result = hit, .spawnTime = this->fTime, .epoch = this->iEpoch, .key = key});

    logIfCV(debug_judgement, "#{} at {:.0f}: {} (combo {}, score {}, health {:.2f})", index, this->fTime,
            hitToString(hit), this->score.getCombo(), this->score.getScore(), this->score.getHealth());
}

//******************//
//	 Frame state	//
//******************//

void PlaySession::buildFrameState() {
    FrameState &fs = this->frameState;

    fs.state = this->state;
    fs.time = this->fTime;

    fs.visibleObjects.clear();
    if(this->beatmap) {
        const auto &hitobjects = this->beatmap->getHitObjects();
        const f64 fadeOut = GameRules::getFadeOutTime();
        const f64 fadeIn = std::max(this->fApproachTime / 3.0, 1.0);

        for(const uSz i : this->visibleIndices) {
            const auto &obj = hitobjects[i];
            const auto &st = this->objectStates[i];
            const f64 objTime = (f64)obj->getTime();

            const f64 appearTime = objTime - this->fApproachTime;
            f64 opacity = std::clamp((this->fTime - appearTime) / fadeIn, 0.0, 1.0);

            const f64 fadeStart = st.bResolved ? std::min(obj->getEndTime(), st.resolveTime) : obj->getEndTime();
            if(this->fTime > fadeStart) {
                opacity *= fadeOut > 0.0 ? std::clamp(1.0 - (this->fTime - fadeStart) / fadeOut, 0.0, 1.0) : 0.0;
            }

            fs.visibleObjects.push_back(VisibleObject{
                .object = obj.get(),
                .index = i,
                .approachProgress = (f32)std::clamp((objTime - this->fTime) / this->fApproachTime, 0.0, 1.0),
                .opacity = (f32)opacity,
                .ballPos = obj->getPosAt(this->fTime),
                .comboNumber = obj->getComboNumber(),
                .comboColor = obj->getComboColor(),
                .bHeadHit = st.bHeadHit,
                .bResolved = st.bResolved,
            });
        }
    }

    fs.hitMarkers = this->hitMarkers;
    fs.cursor = this->vCursorPos;
    fs.cursorTrail = this->cursorTrail;
    fs.keyPresses = this->keyPresses;

    fs.score = this->score.getScore();
    fs.combo = this->score.getCombo();
    fs.accuracy = this->score.getAccuracy();
    fs.health = this->score.getHealth();
    fs.grade = this->score.getGrade();

    fs.bCanSkip = this->canSkip();
    fs.bInBreak = this->beatmap && this->state == State::PLAYING && this->beatmap->isInBreak(this->fTime);
}

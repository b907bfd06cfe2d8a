// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "Automation.h"

#include "GameConVars.h"
#include "Logging.h"
#include "PlaySession.h"

void Automation::reset() {
    this->iLastClickedIndex = -1;
    this->bNextKeyIsK2 = false;
}

void Automation::update(PlaySession &session) {
    const AutoplayMode mode = session.mods.getAutoplayMode();
    if(mode == AutoplayMode::None || session.state != PlaySession::State::PLAYING) return;

    // aim first, so a click in the same tick already sees the snapped cursor
    if(mode == AutoplayMode::Auto || mode == AutoplayMode::Autopilot) this->updateCursor(session);
    if(mode == AutoplayMode::Auto || mode == AutoplayMode::Relax) this->updateClicks(session);
}

void Automation::updateCursor(PlaySession &session) {
    const auto &hitobjects = session.beatmap->getHitObjects();
    const f64 time = session.fTime;

    // a held slider is followed exactly
    for(const uSz i : session.visibleIndices) {
        const auto &st = session.objectStates[i];
        if(st.bHeadHit && !st.bResolved && time < hitobjects[i]->getEndTime()) {
            session.vCursorPos = hitobjects[i]->getPosAt(time);
            return;
        }
    }

    for(const uSz i : session.visibleIndices) {
        const auto &st = session.objectStates[i];
        if(st.bResolved || st.bHeadHit) continue;

        const auto &obj = hitobjects[i];
        const vec2 target = obj->getPos();

        if((f64)obj->getTime() - time < cv::autoplay_snap_time.getDouble()) {
            session.vCursorPos = target;
        } else {
            session.vCursorPos += (target - session.vCursorPos) * cv::autoplay_ease_factor.getFloat();
        }
        return;
    }
}

void Automation::updateClicks(PlaySession &session) {
    const auto &hitobjects = session.beatmap->getHitObjects();
    const f64 lenience = cv::relax_hit_lenience.getDouble();

    for(const uSz i : session.visibleIndices) {
        const auto &st = session.objectStates[i];
        const auto &obj = hitobjects[i];
        if(st.bResolved || st.bHeadHit || obj->getType() == HitObjectType::SPINNER) continue;
        if((i64)i <= this->iLastClickedIndex) continue;

        const f64 delta = (f64)obj->getTime() - session.fTime;
        if(delta > lenience) break;

        // too late, left to the timeout
        if(-delta > session.fHitWindow50) continue;

        this->iLastClickedIndex = (i64)i;
        const auto key = this->bNextKeyIsK2 ? PlaySession::HitKey::K2 : PlaySession::HitKey::K1;
        this->bNextKeyIsK2 = !this->bNextKeyIsK2;
        session.keyPresses[(uSz)key]++;
        if(!session.judgeHitInput(key)) {
            logIfCV(debug_judgement, "scripted click for #{} at {:.0f} hit nothing", i, session.fTime);
        }
    }
}

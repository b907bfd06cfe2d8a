// Copyright (c) 2015, PG & 2026, hitcore contributors, All rights reserved.
#include "HitObjects.h"

#include "GameRules.h"

#include <algorithm>
#include <cmath>

HitObject::HitObject(HitObjectType type, vec2 pos, i32 time, bool newCombo)
    : type(type), pos(pos), time(time), bNewCombo(newCombo) {}

//**************//
//	 Slider	    //
//**************//

Slider::Slider(vec2 pos, i32 time, bool newCombo, SLIDERCURVETYPE curveType, std::vector<vec2> controlPoints,
               i32 repeats, f32 pixelLength)
    : HitObject(HitObjectType::SLIDER, pos, time, newCombo),
      curveType(curveType),
      iRepeats(std::max(repeats, 1)),
      fPixelLength(pixelLength) {
    this->curve = SliderCurve::createCurve(curveType, std::move(controlPoints), pixelLength);
}

vec2 Slider::positionAtProgress(f64 progress) const {
    const auto &points = this->curve->getPoints();
    if(points.empty()) return this->pos;

    progress = std::clamp(progress, 0.0, 1.0);

    const f64 scaled = progress * this->iRepeats;
    const auto slide = (i32)std::floor(scaled);

    // exactly at the end: odd slide counts finish at the tail, even ones back at the head
    if(slide >= this->iRepeats) {
        return (this->iRepeats % 2 != 0) ? points.back().pos : points.front().pos;
    }

    f64 slideProgress = scaled - slide;
    if(slide % 2 != 0) slideProgress = 1.0 - slideProgress;

    return this->curve->pointAtDistance((f32)(slideProgress * this->curve->getLength()));
}

vec2 Slider::getPosAt(f64 time) const {
    if(this->duration <= 0.0) return this->positionAtProgress(0.0);
    return this->positionAtProgress((time - (f64)this->time) / this->duration);
}

vec2 Slider::getEndPos() const { return this->positionAtProgress(1.0); }

//***************//
//	 Spinner	 //
//***************//

Spinner::Spinner(i32 time, i32 endTime, bool newCombo)
    : HitObject(HitObjectType::SPINNER, GameRules::getPlayfieldCenter(), time, newCombo) {
    // zero-length spinners still resolve after their start
    this->duration = std::max<f64>((f64)endTime - (f64)time, 1.0);
}

#pragma once
// Copyright (c) 2015, PG & 2026, hitcore contributors, All rights reserved.

#include "Color.h"
#include "SliderCurves.h"
#include "Vectors.h"
#include "noinclude.h"
#include "types.h"

#include <memory>
#include <vector>

enum class HitObjectType : uint8_t {
    CIRCLE,
    SLIDER,
    SPINNER,
};

namespace PpyHitObjectType {
enum {
    CIRCLE = (1 << 0),
    SLIDER = (1 << 1),
    NEW_COMBO = (1 << 2),
    SPINNER = (1 << 3),
};
}

// immutable chart data, per-attempt judgement state lives in the PlaySession
class HitObject {
   protected:  // only constructable through subclasses
    HitObject(HitObjectType type, vec2 pos, i32 time, bool newCombo);

   public:
    HitObject() = delete;
    virtual ~HitObject() = default;

    HitObject(const HitObject &) = delete;
    HitObject &operator=(const HitObject &) = delete;
    HitObject(HitObject &&) noexcept = default;
    HitObject &operator=(HitObject &&) noexcept = default;

    // where the cursor has to be at the given clock time
    [[nodiscard]] virtual vec2 getPosAt(f64 time) const = 0;

    [[nodiscard]] inline HitObjectType getType() const { return this->type; }
    [[nodiscard]] inline vec2 getPos() const { return this->pos; }
    [[nodiscard]] inline i32 getTime() const { return this->time; }
    [[nodiscard]] inline f64 getDuration() const { return this->duration; }
    [[nodiscard]] inline f64 getEndTime() const { return (f64)this->time + this->duration; }

    [[nodiscard]] inline bool isNewCombo() const { return this->bNewCombo; }
    [[nodiscard]] inline i32 getComboNumber() const { return this->iComboNumber; }
    [[nodiscard]] inline i32 getColorIndex() const { return this->iColorIndex; }
    [[nodiscard]] inline Color getComboColor() const { return this->comboColor; }

   protected:
    friend class Beatmap;

    HitObjectType type;
    vec2 pos;
    i32 time;
    f64 duration{0.0};

    bool bNewCombo;
    i32 iComboNumber{1};
    i32 iColorIndex{0};
    Color comboColor{0xffffffff};
};

class Circle final : public HitObject {
   public:
    Circle(vec2 pos, i32 time, bool newCombo) : HitObject(HitObjectType::CIRCLE, pos, time, newCombo) {}

    [[nodiscard]] vec2 getPosAt(f64 /*time*/) const override { return this->pos; }
};

class Slider final : public HitObject {
   public:
    Slider(vec2 pos, i32 time, bool newCombo, SLIDERCURVETYPE curveType, std::vector<vec2> controlPoints,
           i32 repeats, f32 pixelLength);

    // progress over the whole slider including repeats, in [0, 1]
    // even traversals run head to tail, odd ones tail to head
    [[nodiscard]] vec2 positionAtProgress(f64 progress) const;

    // clamped to the slider's time span
    [[nodiscard]] vec2 getPosAt(f64 time) const override;

    [[nodiscard]] inline SLIDERCURVETYPE getCurveType() const { return this->curveType; }
    [[nodiscard]] inline i32 getRepeats() const { return this->iRepeats; }
    [[nodiscard]] inline f32 getPixelLength() const { return this->fPixelLength; }
    [[nodiscard]] inline f64 getSlideDuration() const { return this->duration / this->iRepeats; }
    [[nodiscard]] inline const SliderCurve &getCurve() const { return *this->curve; }

    [[nodiscard]] vec2 getEndPos() const;

   private:
    friend class Beatmap;

    SLIDERCURVETYPE curveType;
    i32 iRepeats;
    f32 fPixelLength;
    std::unique_ptr<SliderCurve> curve;
};

class Spinner final : public HitObject {
   public:
    // always centered on the playfield
    Spinner(i32 time, i32 endTime, bool newCombo);

    [[nodiscard]] vec2 getPosAt(f64 /*time*/) const override { return this->pos; }
};

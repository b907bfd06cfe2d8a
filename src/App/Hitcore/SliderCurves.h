#pragma once
// Copyright (c) 2015, PG & Jeffrey Han (opsu!) & 2026, hitcore contributors, All rights reserved.

#include "Vectors.h"
#include "types.h"

#include <memory>
#include <vector>

using SLIDERCURVETYPE = char;

namespace SliderCurveType {
inline constexpr SLIDERCURVETYPE BEZIER = 'B';
inline constexpr SLIDERCURVETYPE CATMULL = 'C';
inline constexpr SLIDERCURVETYPE LINEAR = 'L';
inline constexpr SLIDERCURVETYPE PASSTHROUGH = 'P';
}  // namespace SliderCurveType

// one sample of the arc-length table
struct CurvePoint {
    vec2 pos{0.f};
    f32 distance{0.f};  // from the slider head, along the path
};

class SliderCurveBuilder;

//**********************//
//	 Curve Base Class	//
//**********************//

// constant-velocity path: samples are equidistant along the curve, and the last sample sits
// exactly at the declared pixel length (geometry that ends early is extended along its last segment)
class SliderCurve {
   public:
    static std::unique_ptr<SliderCurve> createCurve(SLIDERCURVETYPE type, std::vector<vec2> controlPoints,
                                                    f32 pixelLength);
    static std::unique_ptr<SliderCurve> createCurve(SLIDERCURVETYPE type, std::vector<vec2> controlPoints,
                                                    f32 pixelLength, f32 curvePointsSeparation);

   public:
    SliderCurve() = delete;

    SliderCurve(const SliderCurve &) = default;
    SliderCurve &operator=(const SliderCurve &) = default;
    SliderCurve(SliderCurve &&) = default;
    SliderCurve &operator=(SliderCurve &&) = default;
    virtual ~SliderCurve() = default;

    // t is normalized distance, clamped to [0, 1]
    [[nodiscard]] virtual vec2 pointAt(f32 t) const;
    [[nodiscard]] vec2 pointAtDistance(f32 distance) const;

    [[nodiscard]] inline f32 getStartAngle() const { return this->fStartAngle; }
    [[nodiscard]] inline f32 getEndAngle() const { return this->fEndAngle; }

    [[nodiscard]] inline const std::vector<CurvePoint> &getPoints() const { return this->curvePoints; }
    [[nodiscard]] inline const std::vector<vec2> &getControlPoints() const { return this->controlPoints; }

    [[nodiscard]] inline f32 getPixelLength() const { return this->fPixelLength; }
    [[nodiscard]] inline f32 getLength() const {
        return this->curvePoints.empty() ? 0.f : this->curvePoints.back().distance;
    }

    // true if the geometry could not form a path and collapsed onto the head position
    [[nodiscard]] inline bool isDegenerate() const { return this->bDegenerate; }

   protected:
    friend class SliderCurveBuilder;

    SliderCurve(std::vector<vec2> controlPoints, f32 pixelLength);

    // collapse onto the first control point
    void makeDegenerate();

    // original input values
    std::vector<vec2> controlPoints;

    std::vector<CurvePoint> curvePoints;
    f32 fStartAngle{0.f};
    f32 fEndAngle{0.f};
    f32 fPixelLength{0.f};
    bool bDegenerate{false};
};

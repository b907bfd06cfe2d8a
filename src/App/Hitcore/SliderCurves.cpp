// Copyright (c) 2015, PG & Jeffrey Han (opsu!) & 2026, hitcore contributors, All rights reserved.
#include "SliderCurves.h"

#include "GameConVars.h"
#include "Logging.h"
#include "noinclude.h"

#include <algorithm>
#include <array>
#include <cmath>

//*******************//
//	 Curve Builder	 //
//*******************//

// flattens curve segments into one polyline, then resamples it by arc length
// placed up here for friend access to SliderCurve
class SliderCurveBuilder {
   private:
    // bezier sampling step in osu!pixels of control polygon length
    static constexpr f32 BEZIER_STEP_LENGTH = 2.0f;
    static constexpr u32 BEZIER_MAX_STEPS = 1000;

    std::vector<vec2> casteljau;  // de casteljau working buffer
    std::vector<vec2> allPoints;
    std::vector<f32> distances;
    u32 numSegments{0};

    vec2 bezierAt(const vec2 *controlPoints, u64 count, f32 t) {
        this->casteljau.assign(controlPoints, controlPoints + count);
        for(u64 k = count - 1; k > 0; k--) {
            for(u64 i = 0; i < k; i++) {
                this->casteljau[i] = vec::mix(this->casteljau[i], this->casteljau[i + 1], t);
            }
        }
        return this->casteljau[0];
    }

   public:
    void reset() {
        this->allPoints.clear();
        this->numSegments = 0;
    }

    void addBezierSegment(const vec2 *controlPoints, u64 count) {
        if(count == 0) return;
        this->numSegments++;

        if(count <= 2) {
            this->allPoints.insert(this->allPoints.end(), controlPoints, controlPoints + count);
            return;
        }

        f32 polygonLength = 0.f;
        for(u64 i = 1; i < count; i++) {
            polygonLength += vec::length(controlPoints[i] - controlPoints[i - 1]);
        }

        const u32 steps = std::clamp<u32>((u32)(polygonLength / BEZIER_STEP_LENGTH), 2, BEZIER_MAX_STEPS);
        for(u32 i = 0; i <= steps; i++) {
            this->allPoints.push_back(this->bezierAt(controlPoints, count, (f32)i / (f32)steps));
        }
    }

    void addCatmullSegment(const std::array<vec2, 4> &initPoints) {
        this->numSegments++;

        f32 approxLength = 0;
        for(i32 i = 1; i < 4; i++) {
            approxLength += std::max(0.0001f, vec::length(initPoints[i] - initPoints[i - 1]));
        }

        const i32 numPoints = (i32)(approxLength / 8.0f) + 2;

        for(i32 i = 0; i < numPoints; i++) {
            // evaluate the middle span [1, 2] of the 4-point window
            const f32 t = 1.f + (f32)i / (f32)(numPoints - 1);

            const vec2 A1 = initPoints[0] * (1 - t) + initPoints[1] * t;
            const vec2 A2 = initPoints[1] * (2 - t) + initPoints[2] * (t - 1);
            const vec2 A3 = initPoints[2] * (3 - t) + initPoints[3] * (t - 2);

            const vec2 B1 = A1 * ((2 - t) * 0.5f) + A2 * (t * 0.5f);
            const vec2 B2 = A2 * ((3 - t) * 0.5f) + A3 * ((t - 1) * 0.5f);

            this->allPoints.push_back(B1 * (2 - t) + B2 * (t - 1));
        }
    }

    // arc samples are generated by the caller
    void addRawSegment(const std::vector<vec2> &points) {
        this->numSegments++;
        this->allPoints.insert(this->allPoints.end(), points.begin(), points.end());
    }

    [[nodiscard]] bool hasSegments() const { return this->numSegments > 0 && !this->allPoints.empty(); }

    void build(SliderCurve &curve, f32 curvePointsSeparation);
};

void SliderCurveBuilder::build(SliderCurve &curve, f32 curvePointsSeparation) {
    const f32 length = curve.fPixelLength;
    if(this->allPoints.empty() || !(length > 0.f)) {
        debugLog("degenerate slider curve (points: {} pixelLength: {}), using the head position",
                 this->allPoints.size(), length);
        curve.makeDegenerate();
        return;
    }

    // cumulative arc length along the raw polyline
    this->distances.clear();
    this->distances.reserve(this->allPoints.size() + 1);
    this->distances.push_back(0.f);
    for(uSz i = 1; i < this->allPoints.size(); i++) {
        this->distances.push_back(this->distances.back() + vec::length(this->allPoints[i] - this->allPoints[i - 1]));
    }

    // geometry shorter than declared: extend along the last segment that has a direction
    if(this->distances.back() < length) {
        uSz last = this->allPoints.size() - 1;
        while(last > 0 && this->distances[last] - this->distances[last - 1] <= 0.f) last--;

        if(last == 0) {
            debugLog("degenerate slider curve (all {} points coincide), using the head position",
                     this->allPoints.size());
            curve.makeDegenerate();
            return;
        }

        const vec2 dir = vec::normalize(this->allPoints[last] - this->allPoints[last - 1]);
        this->allPoints.push_back(this->allPoints.back() + dir * (length - this->distances.back()));
        this->distances.push_back(length);
    }

    // equidistant resampling, the last sample lands exactly on the pixel length
    const u32 maxPoints = std::max(cv::slider_curve_max_points.getVal<u32>(), 1U);
    const u32 nCurve =
        std::clamp<u32>((u32)(length / std::clamp<f32>(curvePointsSeparation, 1.0f, 100.0f)), 1, maxPoints);

    curve.curvePoints.clear();
    curve.curvePoints.reserve(nCurve + 1);

    uSz seg = 0;
    for(u32 i = 0; i <= nCurve; i++) {
        const f32 dist = (i == nCurve) ? length : ((f32)i * length) / (f32)nCurve;
        while(seg + 2 < this->distances.size() && this->distances[seg + 1] < dist) seg++;

        const f32 span = this->distances[seg + 1] - this->distances[seg];
        const f32 t = span > 0.f ? std::clamp<f32>((dist - this->distances[seg]) / span, 0.f, 1.f) : 0.f;
        curve.curvePoints.push_back({.pos = vec::mix(this->allPoints[seg], this->allPoints[seg + 1], t),
                                     .distance = dist});
    }

    // start and end angles for reverse arrows, skipping samples closer than a pixel
    const auto &pts = curve.curvePoints;
    if(pts.size() > 1) {
        const vec2 start = pts.front().pos;
        uSz cnt = 1;
        while(cnt + 1 < pts.size() && vec::length(pts[cnt].pos - start) < 1) cnt++;
        curve.fStartAngle = (f32)(std::atan2(pts[cnt].pos.y - start.y, pts[cnt].pos.x - start.x) * 180 / PI);

        const vec2 end = pts.back().pos;
        i64 rcnt = (i64)pts.size() - 2;
        while(rcnt > 0 && vec::length(pts[rcnt].pos - end) < 1) rcnt--;
        curve.fEndAngle = (f32)(std::atan2(pts[rcnt].pos.y - end.y, pts[rcnt].pos.x - end.x) * 180 / PI);
    }
}

namespace {  // static

// used as a calculation buffer to avoid reallocations on each curve creation
thread_local SliderCurveBuilder g_curveBuilder;

// arcs that bulge less than this from their longest chord are drawn as lines
constexpr f64 MAX_STRAIGHT_DEVIATION = 0.05;

forceinline f64 circumcircleDeterminant(vec2d a, vec2d b, vec2d c) {
    return 2.0 * (a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y));
}

// |det| / (|ab|*|bc|*|ca|) is 1/radius, the bulge of an arc over a chord L is about L^2 / (8 * radius)
bool isNearlyStraight(vec2d a, vec2d b, vec2d c) {
    const f64 ab = vec::length(b - a);
    const f64 bc = vec::length(c - b);
    const f64 ca = vec::length(a - c);
    const f64 sides = ab * bc * ca;
    if(!(sides > 0.0)) return true;  // coincident points (or NaN)

    const f64 curvature = std::abs(circumcircleDeterminant(a, b, c)) / sides;
    const f64 longest = std::max({ab, bc, ca});
    return longest * longest * curvature / 8.0 < MAX_STRAIGHT_DEVIATION;
}

//***********************//
//	 Curve Subclasses	 //
//***********************//

class SliderCurveEqualDistanceMulti final : public SliderCurve {
   public:
    SliderCurveEqualDistanceMulti(std::vector<vec2> controlPoints, f32 pixelLength, f32 curvePointsSeparation,
                                  bool line);  // beziers
    SliderCurveEqualDistanceMulti(std::vector<vec2> controlPoints, f32 pixelLength,
                                  f32 curvePointsSeparation);  // catmulls
};

// the only difference is that bezier's constructor takes a "line" parameter as an argument, catmull's doesn't
using SliderCurveBezier = SliderCurveEqualDistanceMulti;
using SliderCurveCatmull = SliderCurveEqualDistanceMulti;

//*******************//
//	 Bezier Curves	 //
//*******************//

SliderCurveEqualDistanceMulti::SliderCurveEqualDistanceMulti(std::vector<vec2> controlPoints_, f32 pixelLength,
                                                             f32 curvePointsSeparation, bool line)
    : SliderCurve(std::move(controlPoints_), pixelLength) {
    const uSz numControlPoints = this->controlPoints.size();

    g_curveBuilder.reset();

    // Beziers: splits points into different Beziers if has the same points (red anchor points)
    // a b c - c d - d e f g
    // Lines: generate a new curve for each sequential pair
    // ab  bc  cd  de  ef  fg
    uSz segmentStart = 0;
    for(uSz i = 1; i < numControlPoints; i++) {
        if(line) {
            g_curveBuilder.addBezierSegment(&this->controlPoints[i - 1], 2);
        } else if(this->controlPoints[i] == this->controlPoints[i - 1]) {
            if(i - segmentStart >= 2) {
                g_curveBuilder.addBezierSegment(&this->controlPoints[segmentStart], i - segmentStart);
            }
            segmentStart = i;
        }
    }

    if(!line && numControlPoints - segmentStart >= 2) {
        g_curveBuilder.addBezierSegment(&this->controlPoints[segmentStart], numControlPoints - segmentStart);
    }

    if(g_curveBuilder.hasSegments()) {
        g_curveBuilder.build(*this, curvePointsSeparation);
    } else {
        debugLog("no segments (line: {} numControlPoints: {} pixelLength: {})", line, numControlPoints, pixelLength);
        this->makeDegenerate();
    }
}

//********************//
//   Catmull Curves   //
//********************//

SliderCurveEqualDistanceMulti::SliderCurveEqualDistanceMulti(std::vector<vec2> controlPoints_, f32 pixelLength,
                                                             f32 curvePointsSeparation)
    : SliderCurve(std::move(controlPoints_), pixelLength) {
    const uSz numControlPoints = this->controlPoints.size();

    g_curveBuilder.reset();

    // pad both ends so the first and last spans are drawn too
    std::vector<vec2> padded;
    padded.reserve(numControlPoints + 2);
    padded.push_back(this->controlPoints.front());
    padded.insert(padded.end(), this->controlPoints.begin(), this->controlPoints.end());
    padded.push_back(this->controlPoints.back());

    for(uSz i = 0; i + 3 < padded.size(); i++) {
        g_curveBuilder.addCatmullSegment({padded[i], padded[i + 1], padded[i + 2], padded[i + 3]});
    }

    if(g_curveBuilder.hasSegments()) {
        g_curveBuilder.build(*this, curvePointsSeparation);
    } else {
        debugLog("no catmull segments (numControlPoints: {} pixelLength: {})", numControlPoints, pixelLength);
        this->makeDegenerate();
    }
}

//**********************//
//	 Circular Curves	//
//**********************//

class SliderCurveCircumscribedCircle final : public SliderCurve {
   public:
    SliderCurveCircumscribedCircle(std::vector<vec2> controlPoints, f32 pixelLength, f32 curvePointsSeparation);
};

SliderCurveCircumscribedCircle::SliderCurveCircumscribedCircle(std::vector<vec2> controlPoints_, f32 pixelLength,
                                                               f32 curvePointsSeparation)
    : SliderCurve(std::move(controlPoints_), pixelLength) {
    const vec2d a{this->controlPoints[0]};
    const vec2d b{this->controlPoints[1]};
    const vec2d c{this->controlPoints[2]};

    const f64 det = circumcircleDeterminant(a, b, c);
    const f64 aSq = vec::dot(a, a);
    const f64 bSq = vec::dot(b, b);
    const f64 cSq = vec::dot(c, c);

    const vec2d center{(aSq * (b.y - c.y) + bSq * (c.y - a.y) + cSq * (a.y - b.y)) / det,
                       (aSq * (c.x - b.x) + bSq * (a.x - c.x) + cSq * (b.x - a.x)) / det};
    const f64 radius = vec::length(a - center);

    // the arc must pass through the middle point
    const f64 startAng = std::atan2(a.y - center.y, a.x - center.x);
    f64 midAng = std::atan2(b.y - center.y, b.x - center.x);
    f64 endAng = std::atan2(c.y - center.y, c.x - center.x);
    while(midAng < startAng) midAng += 2.0 * PI;
    while(endAng < startAng) endAng += 2.0 * PI;
    if(midAng > endAng) endAng -= 2.0 * PI;

    // walk pixelLength along the circle (len = theta * r)
    const f64 arcAng = (f64)this->fPixelLength / radius;
    const f64 sweep = endAng > startAng ? arcAng : -arcAng;

    const f32 steps = std::min(this->fPixelLength / std::clamp<f32>(curvePointsSeparation, 1.0f, 100.0f),
                               cv::slider_curve_max_points.getFloat());
    const i32 intSteps = std::max((i32)std::ceil(steps), 1);

    std::vector<vec2> arc;
    arc.reserve(intSteps + 1);
    for(i32 i = 0; i <= intSteps; i++) {
        const f64 ang = startAng + sweep * ((f64)i / (f64)intSteps);
        arc.emplace_back((f32)(center.x + std::cos(ang) * radius), (f32)(center.y + std::sin(ang) * radius));
    }

    g_curveBuilder.reset();
    g_curveBuilder.addRawSegment(arc);
    g_curveBuilder.build(*this, curvePointsSeparation);
}

}  // namespace

//******************************//
//	 Curve Base Class Factory	//
//******************************//

std::unique_ptr<SliderCurve> SliderCurve::createCurve(SLIDERCURVETYPE type, std::vector<vec2> controlPoints,
                                                      f32 pixelLength) {
    const f32 points_separation = cv::slider_curve_points_separation.getFloat();
    return createCurve(type, std::move(controlPoints), pixelLength, points_separation);
}

std::unique_ptr<SliderCurve> SliderCurve::createCurve(SLIDERCURVETYPE type, std::vector<vec2> controlPoints,
                                                      f32 pixelLength, f32 curvePointsSeparation) {
    using namespace SliderCurveType;

    if(controlPoints.empty()) {
        debugLog("slider without control points (pixelLength: {})", pixelLength);
        return std::make_unique<SliderCurveBezier>(std::move(controlPoints), pixelLength, curvePointsSeparation,
                                                   false);
    }

    if(type == PASSTHROUGH && controlPoints.size() == 3) {
        if(isNearlyStraight(vec2d{controlPoints[0]}, vec2d{controlPoints[1]}, vec2d{controlPoints[2]})) {
            // (nearly) collinear, a straight line through the points instead
            logIfCV(debug_judgement, "collinear passthrough slider, using a line");
            return std::make_unique<SliderCurveBezier>(std::move(controlPoints), pixelLength, curvePointsSeparation,
                                                       true);
        }
        return std::make_unique<SliderCurveCircumscribedCircle>(std::move(controlPoints), pixelLength,
                                                                curvePointsSeparation);
    } else if(type == CATMULL && controlPoints.size() >= 2) {
        return std::make_unique<SliderCurveCatmull>(std::move(controlPoints), pixelLength, curvePointsSeparation);
    }

    return std::make_unique<SliderCurveBezier>(std::move(controlPoints), pixelLength, curvePointsSeparation,
                                               (type == LINEAR));
}

SliderCurve::SliderCurve(std::vector<vec2> controlPoints, f32 pixelLength)
    : controlPoints(std::move(controlPoints)), fPixelLength(std::abs(pixelLength)) {
    if(!std::isfinite(this->fPixelLength)) this->fPixelLength = 0.f;
}

void SliderCurve::makeDegenerate() {
    this->bDegenerate = true;
    this->curvePoints.clear();
    this->curvePoints.push_back(
        {.pos = this->controlPoints.empty() ? vec2{0.f, 0.f} : this->controlPoints.front(), .distance = 0.f});
    this->fStartAngle = 0.f;
    this->fEndAngle = 0.f;
}

vec2 SliderCurve::pointAt(f32 t) const { return this->pointAtDistance(std::clamp<f32>(t, 0.f, 1.f) * this->getLength()); }

vec2 SliderCurve::pointAtDistance(f32 distance) const {
    if(this->curvePoints.empty()) return {0.f, 0.f};
    if(this->curvePoints.size() == 1 || distance <= 0.f) return this->curvePoints.front().pos;
    if(distance >= this->curvePoints.back().distance) return this->curvePoints.back().pos;

    // samples are equidistant, so the index is direct
    const f32 step = this->curvePoints.back().distance / (f32)(this->curvePoints.size() - 1);
    const uSz index = std::min<uSz>((uSz)(distance / step), this->curvePoints.size() - 2);

    const CurvePoint &p1 = this->curvePoints[index];
    const CurvePoint &p2 = this->curvePoints[index + 1];
    const f32 span = p2.distance - p1.distance;
    const f32 t = span > 0.f ? std::clamp<f32>((distance - p1.distance) / span, 0.f, 1.f) : 0.f;

    return vec::mix(p1.pos, p2.pos, t);
}

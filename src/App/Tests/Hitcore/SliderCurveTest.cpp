// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "TestMacros.h"

#include "ConVarHandler.h"
#include "HitObjects.h"
#include "SliderCurves.h"

#include <cmath>
#include <memory>
#include <vector>

namespace Hc::Tests {

namespace {

constexpr f32 PX_EPS = 0.75f;

f32 dist(vec2 a, vec2 b) { return vec::length(a - b); }

}  // namespace

class SliderCurveTest {
   public:
    int run() {
        cvars().resetAll();

        testLinear();
        testLengthCorrection();
        testPassthrough();
        testBezier();
        testCatmull();
        testDegenerate();
        testSliderTraversal();

        TEST_PRINT_RESULTS("SliderCurveTest");
        return m_failures > 0 ? 1 : 0;
    }

   private:
    void testLinear() {
        TEST_SECTION("linear");

        auto curve = SliderCurve::createCurve(SliderCurveType::LINEAR, {{0.f, 0.f}, {100.f, 0.f}}, 100.f);
        TEST_ASSERT(!curve->isDegenerate(), "straight line is not degenerate");
        TEST_ASSERT_NEAR(curve->getLength(), 100.f, 0.01f, "length");
        TEST_ASSERT(dist(curve->pointAt(0.f), {0.f, 0.f}) < PX_EPS, "starts at the head");
        TEST_ASSERT(dist(curve->pointAt(0.5f), {50.f, 0.f}) < PX_EPS, "halfway");
        TEST_ASSERT(dist(curve->pointAt(1.f), {100.f, 0.f}) < PX_EPS, "ends at the tail");
        TEST_ASSERT(dist(curve->pointAt(2.f), {100.f, 0.f}) < PX_EPS, "t is clamped");

        // two segments, the corner sits at half the length
        auto corner =
            SliderCurve::createCurve(SliderCurveType::LINEAR, {{0.f, 0.f}, {100.f, 0.f}, {100.f, 100.f}}, 200.f);
        TEST_ASSERT(dist(corner->pointAt(0.5f), {100.f, 0.f}) < PX_EPS, "corner at half length");
        TEST_ASSERT(dist(corner->pointAt(0.75f), {100.f, 50.f}) < PX_EPS, "second segment");
        TEST_ASSERT(dist(corner->pointAt(1.f), {100.f, 100.f}) < PX_EPS, "last point");
    }

    void testLengthCorrection() {
        TEST_SECTION("declared length wins");

        auto shorter = SliderCurve::createCurve(SliderCurveType::LINEAR, {{0.f, 0.f}, {200.f, 0.f}}, 100.f);
        TEST_ASSERT_NEAR(shorter->getLength(), 100.f, 0.01f, "truncated to the pixel length");
        TEST_ASSERT(dist(shorter->pointAt(1.f), {100.f, 0.f}) < PX_EPS, "truncated end");

        auto longer = SliderCurve::createCurve(SliderCurveType::LINEAR, {{0.f, 0.f}, {50.f, 0.f}}, 100.f);
        TEST_ASSERT_NEAR(longer->getLength(), 100.f, 0.01f, "extended to the pixel length");
        TEST_ASSERT(dist(longer->pointAt(1.f), {100.f, 0.f}) < PX_EPS, "extended along the last segment");

        // samples are equidistant
        const auto &pts = longer->getPoints();
        bool equidistant = pts.size() > 2;
        for(uSz i = 2; i < pts.size(); i++) {
            const f32 a = pts[i].distance - pts[i - 1].distance;
            const f32 b = pts[1].distance - pts[0].distance;
            if(std::abs(a - b) > 0.01f) equidistant = false;
        }
        TEST_ASSERT(equidistant, "arc-length samples are evenly spaced");
        TEST_ASSERT_NEAR(pts.back().distance, 100.f, 0.001f, "last sample at the pixel length");
    }

    void testPassthrough() {
        TEST_SECTION("passthrough");

        // half circle around (100, 0) with radius 100
        const f32 halfCircle = (f32)PI * 100.f;
        auto arc = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH, {{0.f, 0.f}, {100.f, 100.f}, {200.f, 0.f}},
                                            halfCircle);
        TEST_ASSERT(!arc->isDegenerate(), "arc is not degenerate");
        TEST_ASSERT(dist(arc->pointAt(0.f), {0.f, 0.f}) < PX_EPS, "arc head");
        TEST_ASSERT(dist(arc->pointAt(0.5f), {100.f, 100.f}) < PX_EPS, "arc passes through the middle point");
        TEST_ASSERT(dist(arc->pointAt(1.f), {200.f, 0.f}) < PX_EPS, "arc tail");

        // a quarter circle only
        auto quarter = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH,
                                                {{0.f, 0.f}, {100.f, 100.f}, {200.f, 0.f}}, halfCircle / 2.f);
        TEST_ASSERT(dist(quarter->pointAt(1.f), {100.f, 100.f}) < PX_EPS, "arc cut at the pixel length");

        auto collinear = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH,
                                                  {{0.f, 0.f}, {50.f, 0.f}, {100.f, 0.f}}, 100.f);
        TEST_ASSERT(!collinear->isDegenerate(), "collinear points fall back to a line");
        TEST_ASSERT(dist(collinear->pointAt(1.f), {100.f, 0.f}) < PX_EPS, "collinear end");

        // a tiny bend would need a huge circle, it has to start at the head like a line does
        auto nearlyStraight = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH,
                                                       {{0.f, 0.f}, {100.f, 0.0001f}, {200.f, 0.f}}, 200.f);
        TEST_ASSERT(dist(nearlyStraight->pointAt(0.f), {0.f, 0.f}) < 0.01f, "nearly straight head");
        TEST_ASSERT(dist(nearlyStraight->pointAt(1.f), {200.f, 0.f}) < PX_EPS, "nearly straight end");

        // a shallow but visible bend is still an arc
        auto shallow = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH,
                                                {{0.f, 0.f}, {100.f, 5.f}, {200.f, 0.f}}, 150.f);
        TEST_ASSERT(dist(shallow->pointAt(0.f), {0.f, 0.f}) < PX_EPS, "shallow arc head");
        TEST_ASSERT(shallow->pointAt(0.5f).y > 1.f, "shallow arc bulges");

        // anything other than three points is a bezier
        auto four = SliderCurve::createCurve(SliderCurveType::PASSTHROUGH,
                                             {{0.f, 0.f}, {50.f, 0.f}, {50.f, 0.f}, {50.f, 50.f}}, 100.f);
        TEST_ASSERT(dist(four->pointAt(1.f), {50.f, 50.f}) < PX_EPS, "four point passthrough");
    }

    void testBezier() {
        TEST_SECTION("bezier");

        // symmetric control polygon, the curve peaks at (50, 50)
        auto curve = SliderCurve::createCurve(SliderCurveType::BEZIER, {{0.f, 0.f}, {50.f, 100.f}, {100.f, 0.f}}, 50.f);
        TEST_ASSERT_NEAR(curve->getLength(), 50.f, 0.01f, "bezier length");
        TEST_ASSERT(dist(curve->pointAt(0.f), {0.f, 0.f}) < PX_EPS, "bezier head");
        TEST_ASSERT(curve->pointAt(1.f).y > 0.f, "bezier bends toward the control point");

        // a repeated point splits the path into independent segments
        auto split = SliderCurve::createCurve(SliderCurveType::BEZIER,
                                              {{0.f, 0.f}, {100.f, 0.f}, {100.f, 0.f}, {100.f, 100.f}}, 200.f);
        TEST_ASSERT(dist(split->pointAt(0.5f), {100.f, 0.f}) < PX_EPS, "red anchor is a hard corner");
        TEST_ASSERT(dist(split->pointAt(1.f), {100.f, 100.f}) < PX_EPS, "split tail");
    }

    void testCatmull() {
        TEST_SECTION("catmull");

        auto curve = SliderCurve::createCurve(SliderCurveType::CATMULL, {{0.f, 0.f}, {100.f, 0.f}}, 100.f);
        TEST_ASSERT(!curve->isDegenerate(), "two point catmull");
        TEST_ASSERT(dist(curve->pointAt(0.f), {0.f, 0.f}) < PX_EPS, "catmull head");
        TEST_ASSERT(dist(curve->pointAt(1.f), {100.f, 0.f}) < PX_EPS, "catmull tail");
    }

    void testDegenerate() {
        TEST_SECTION("degenerate");

        auto same = SliderCurve::createCurve(SliderCurveType::LINEAR, {{50.f, 50.f}, {50.f, 50.f}}, 100.f);
        TEST_ASSERT(same->isDegenerate(), "coincident points");
        TEST_ASSERT(dist(same->pointAt(0.7f), {50.f, 50.f}) < PX_EPS, "collapses onto the head");

        auto zero = SliderCurve::createCurve(SliderCurveType::LINEAR, {{10.f, 20.f}, {100.f, 20.f}}, 0.f);
        TEST_ASSERT(zero->isDegenerate(), "zero pixel length");
        TEST_ASSERT(dist(zero->pointAt(1.f), {10.f, 20.f}) < PX_EPS, "zero length stays at the head");

        auto nan = SliderCurve::createCurve(SliderCurveType::LINEAR, {{10.f, 20.f}, {100.f, 20.f}}, std::nanf(""));
        TEST_ASSERT(nan->isDegenerate(), "NaN pixel length");

        auto none = SliderCurve::createCurve(SliderCurveType::BEZIER, {}, 100.f);
        TEST_ASSERT(none->isDegenerate(), "no control points");
        TEST_ASSERT(dist(none->pointAt(0.5f), {0.f, 0.f}) < PX_EPS, "origin without control points");
    }

    void testSliderTraversal() {
        TEST_SECTION("slider traversal");

        const Slider slider({0.f, 0.f}, 1000, false, SliderCurveType::LINEAR, {{0.f, 0.f}, {100.f, 0.f}}, 2, 100.f);

        TEST_ASSERT(dist(slider.positionAtProgress(0.0), {0.f, 0.f}) < PX_EPS, "progress 0");
        TEST_ASSERT(dist(slider.positionAtProgress(0.25), {50.f, 0.f}) < PX_EPS, "first slide forward");
        TEST_ASSERT(dist(slider.positionAtProgress(0.5), {100.f, 0.f}) < PX_EPS, "turns at the tail");
        TEST_ASSERT(dist(slider.positionAtProgress(0.75), {50.f, 0.f}) < PX_EPS, "second slide backward");
        TEST_ASSERT(dist(slider.getEndPos(), {0.f, 0.f}) < PX_EPS, "even slide count ends at the head");

        const Slider single({0.f, 0.f}, 1000, false, SliderCurveType::LINEAR, {{0.f, 0.f}, {100.f, 0.f}}, 1, 100.f);
        TEST_ASSERT(dist(single.getEndPos(), {100.f, 0.f}) < PX_EPS, "odd slide count ends at the tail");

        const Slider clamped({0.f, 0.f}, 1000, false, SliderCurveType::LINEAR, {{0.f, 0.f}, {100.f, 0.f}}, 0, 100.f);
        TEST_ASSERT_EQ(clamped.getRepeats(), 1, "at least one slide");
    }

    int m_passes = 0;
    int m_failures = 0;
};

}  // namespace Hc::Tests

TEST_MAIN(Hc::Tests::SliderCurveTest)

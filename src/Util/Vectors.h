// Copyright (c) 2025, WH & 2026, hitcore contributors, All rights reserved.
#pragma once

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

#include <type_traits>

using glm::vec2;
using vec2d = glm::dvec2;

namespace vec {

static constexpr auto FLOAT_NORMALIZE_EPSILON = 0.000001f;

using glm::distance;
using glm::dot;
using glm::length;
using glm::max;
using glm::min;
using glm::mix;
using glm::normalize;

template <typename V>
    requires(std::is_floating_point_v<V>)
void setLength(vec2 &v, const V &len) {
    if(length(v) > FLOAT_NORMALIZE_EPSILON) {
        v = normalize(v) * static_cast<float>(len);
    }
}

}  // namespace vec

#pragma once

/// @file utils.hpp
/// @brief Scalar and 2D vector helpers shared by the image passes

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace streak_math {

// =============================================================================
// Scalar
// =============================================================================

[[nodiscard]] constexpr float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

/// Clamp value to range [min_val, max_val]
[[nodiscard]] constexpr float clamp(float value, float min_val, float max_val) noexcept {
    return value < min_val ? min_val : (value > max_val ? max_val : value);
}

/// Clamp value to range [0, 1]
[[nodiscard]] constexpr float saturate(float value) noexcept {
    return clamp(value, 0.0f, 1.0f);
}

/// Hermite interpolation between edge0 and edge1
[[nodiscard]] inline float smoothstep(float edge0, float edge1, float x) noexcept {
    float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

/// Fractional part, always in [0, 1)
[[nodiscard]] inline float fract(float x) noexcept {
    return x - std::floor(x);
}

// =============================================================================
// Vec2
// =============================================================================

/// Counter-clockwise perpendicular
[[nodiscard]] inline Vec2 perpendicular(const Vec2& v) noexcept {
    return Vec2(-v.y, v.x);
}

/// Normalize, returning zero for vectors shorter than min_length
[[nodiscard]] inline Vec2 normalize_or_zero(const Vec2& v, float min_length = consts::EPSILON) noexcept {
    float len = glm::length(v);
    return len < min_length ? vec2::ZERO : v / len;
}

/// Scale v down so its length does not exceed max_length
[[nodiscard]] inline Vec2 clamp_length(const Vec2& v, float max_length) noexcept {
    float len = glm::length(v);
    if (len <= max_length || len <= 0.0f) {
        return v;
    }
    return v * (max_length / len);
}

} // namespace streak_math

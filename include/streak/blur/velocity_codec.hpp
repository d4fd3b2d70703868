#pragma once

/// @file velocity_codec.hpp
/// @brief Packing of pixel velocity and depth into one unorm texel

#include <streak/math/types.hpp>
#include <streak/math/utils.hpp>
#include <cmath>

namespace streak_blur {

using streak_math::Vec2;
using streak_math::Vec4;

/// Levels per velocity channel of the packed field (Rgb10A2Unorm)
inline constexpr float VELOCITY_LEVELS = 1023.0f;

/// Map a pixel velocity to [0, 1]^2. Vectors longer than radius are shortened to it.
[[nodiscard]] inline Vec2 encode_velocity(const Vec2& velocity, float radius) noexcept {
    Vec2 clamped = streak_math::clamp_length(velocity, radius);
    return clamped / radius * 0.5f + 0.5f;
}

/// Inverse of encode_velocity
[[nodiscard]] inline Vec2 decode_velocity(const Vec2& encoded, float radius) noexcept {
    return (encoded * 2.0f - 1.0f) * radius;
}

/// Velocity field texel: rg = encoded velocity, b = linear depth
[[nodiscard]] inline Vec4 pack_velocity_depth(const Vec2& velocity, float linear_depth, float radius) noexcept {
    Vec2 encoded = encode_velocity(velocity, radius);
    return Vec4(encoded.x, encoded.y, linear_depth, 0.0f);
}

/// Decode a stored texel. 0.5 has no exact 10-bit level, so zero motion is
/// stored as the level next to it and reads back as `±radius / 1023`.
/// Components inside one storage step of zero are snapped to zero.
[[nodiscard]] inline Vec2 unpack_velocity(const Vec4& texel, float radius) noexcept {
    Vec2 velocity = decode_velocity(Vec2(texel.r, texel.g), radius);
    const float step = 2.0f * radius / VELOCITY_LEVELS;
    if (std::abs(velocity.x) < step) {
        velocity.x = 0.0f;
    }
    if (std::abs(velocity.y) < step) {
        velocity.y = 0.0f;
    }
    return velocity;
}

[[nodiscard]] inline float unpack_depth(const Vec4& texel) noexcept {
    return texel.b;
}

} // namespace streak_blur

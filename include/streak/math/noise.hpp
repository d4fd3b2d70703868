#pragma once

/// @file noise.hpp
/// @brief Deterministic screen-space noise for sample jitter

#include "types.hpp"
#include "utils.hpp"
#include <cstdint>

namespace streak_math {

/// Period of the per-frame noise offset, in frames
inline constexpr std::uint64_t NOISE_FRAME_PERIOD = 64;

/// Per-frame offset applied to noise coordinates so the pattern moves
/// between frames and repeats every NOISE_FRAME_PERIOD frames
[[nodiscard]] inline float noise_time_offset(std::uint64_t frame_id) noexcept {
    return 5.588238f * static_cast<float>(frame_id % NOISE_FRAME_PERIOD);
}

/// Interleaved gradient noise (Jimenez 2014), in [0, 1).
/// @param p Integer pixel coordinate
[[nodiscard]] inline float interleaved_gradient_noise(const Vec2& p) noexcept {
    return fract(52.9829189f * fract(glm::dot(p, Vec2(0.06711056f, 0.00583715f))));
}

/// Interleaved gradient noise animated by frame id
[[nodiscard]] inline float interleaved_gradient_noise(const Vec2& p, std::uint64_t frame_id) noexcept {
    return interleaved_gradient_noise(p + Vec2(noise_time_offset(frame_id)));
}

} // namespace streak_math

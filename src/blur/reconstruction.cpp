/// @file reconstruction.cpp
/// @brief Dual-direction reconstruction filter
///
/// Every pixel walks 2 * loop_count samples along its own velocity and along
/// the dominant velocity of its tile neighborhood. Each sample is weighted
/// by depth order, direction agreement and distance falloff.

#include <streak/blur/reconstruction.hpp>
#include <streak/blur/velocity_codec.hpp>
#include <streak/math/noise.hpp>
#include <streak/math/utils.hpp>
#include <algorithm>
#include <cmath>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::Ok;
using streak_core::Result;
using streak_math::interleaved_gradient_noise;
using streak_math::saturate;
using streak_math::Vec3;

ReconstructionParams ReconstructionParams::from(const ResolvedParams& params, std::uint64_t frame_id) noexcept {
    ReconstructionParams out;
    out.loop_count = std::max(params.loop_count, 1u);
    out.codec_radius = params.codec_radius();
    out.frame_id = frame_id;
    out.debug_mode = params.debug_mode;
    out.write_blend_weight = params.accumulation_enabled() &&
                             params.accumulation_weight == AccumulationWeight::ReconstructionAlpha;
    return out;
}

// =============================================================================
// Sample Weights
// =============================================================================

namespace weights {

float soft_depth_compare(float za, float zb) noexcept {
    float nearest = std::max(std::min(za, zb), 1e-6f);
    return saturate(1.0f - DEPTH_FILTER_STRENGTH * (zb - za) / nearest);
}

float cone(float distance, float velocity_length) noexcept {
    return saturate(1.0f - distance / velocity_length);
}

float cylinder(float distance, float velocity_length) noexcept {
    return 1.0f - streak_math::smoothstep(0.95f * velocity_length, 1.05f * velocity_length, distance);
}

} // namespace weights

// =============================================================================
// Lookups
// =============================================================================

namespace {

Vec2 noise_coord(std::uint32_t x, std::uint32_t y) noexcept {
    return Vec2(static_cast<float>(x), static_cast<float>(y));
}

/// Debug color for a velocity: same mapping as the velocity encoding
Vec4 velocity_debug_color(const Vec2& velocity, float radius) noexcept {
    Vec2 encoded = encode_velocity(velocity, radius);
    return Vec4(encoded.x, encoded.y, 0.5f, 1.0f);
}

/// Neighbor max cell covering a pixel, without jitter
Vec2 neighbor_max_at(const Image& neighbor_max, std::uint32_t x, std::uint32_t y,
                     std::uint32_t frame_width, std::uint32_t frame_height) noexcept {
    Vec2 uv((static_cast<float>(x) + 0.5f) / static_cast<float>(frame_width),
            (static_cast<float>(y) + 0.5f) / static_cast<float>(frame_height));
    const Vec4& texel = neighbor_max.sample_point_uv(uv);
    return Vec2(texel.r, texel.g);
}

} // anonymous namespace

Vec2 jittered_neighbor_max(const Image& neighbor_max, std::uint32_t x, std::uint32_t y,
                           std::uint32_t frame_width, std::uint32_t frame_height, std::uint64_t frame_id) {
    // Rotate a quarter-tile offset by a per-pixel angle to hide the tile grid
    float angle = interleaved_gradient_noise(noise_coord(x, y) + Vec2(2.0f * static_cast<float>(frame_width), 0.0f),
                                             frame_id) * streak_math::consts::TAU;
    Vec2 offset = Vec2(std::cos(angle), std::sin(angle)) * 0.25f /
                  Vec2(static_cast<float>(neighbor_max.width()), static_cast<float>(neighbor_max.height()));

    Vec2 uv((static_cast<float>(x) + 0.5f) / static_cast<float>(frame_width),
            (static_cast<float>(y) + 0.5f) / static_cast<float>(frame_height));
    const Vec4& texel = neighbor_max.sample_point_uv(uv + offset);
    return Vec2(texel.r, texel.g);
}

// =============================================================================
// Reconstruction
// =============================================================================

Vec4 reconstruct_pixel(const Image& color, const Image& velocity_field, const Image& neighbor_max,
                       std::uint32_t x, std::uint32_t y, const ReconstructionParams& params) {
    const std::uint32_t width = color.width();
    const std::uint32_t height = color.height();
    const float radius = params.codec_radius;

    const Vec4& center_texel = velocity_field.load(x, y);
    const Vec2 v_c = unpack_velocity(center_texel, radius);
    const float z_p = unpack_depth(center_texel);

    switch (params.debug_mode) {
        case DebugMode::Velocity:
            return velocity_debug_color(v_c, radius);
        case DebugMode::NeighborMax:
            return velocity_debug_color(neighbor_max_at(neighbor_max, x, y, width, height), radius);
        case DebugMode::Depth:
            return Vec4(z_p, z_p, z_p, 1.0f);
        default:
            break;
    }

    const Vec4& c_p = color.load(x, y);

    const Vec2 v_max = jittered_neighbor_max(neighbor_max, x, y, width, height, params.frame_id);
    const float l_v_max = glm::length(v_max);
    if (l_v_max < MIN_VELOCITY) {
        return c_p;
    }

    const Vec2 p(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);

    const float l_v_c_raw = glm::length(v_c);
    const Vec2 v_c_n = l_v_c_raw < MIN_VELOCITY ? Vec2(0.0f) : v_c / l_v_c_raw;
    const float l_v_c = std::max(l_v_c_raw, MIN_VELOCITY);
    const Vec2 v_max_n = v_max / l_v_max;

    // Secondary direction: perpendicular to v_max, turning towards v_c as v_c grows
    Vec2 w_p = streak_math::perpendicular(v_max_n);
    if (glm::dot(w_p, v_c) < 0.0f) {
        w_p = -w_p;
    }
    const Vec2 w_c = streak_math::normalize_or_zero(
        glm::mix(w_p, v_c_n, saturate((l_v_c - MIN_VELOCITY) / 1.5f)));

    const float w_a_c = std::abs(glm::dot(w_c, v_c_n));
    const float w_a_max = std::abs(glm::dot(w_c, v_max_n));

    const auto sample_count = static_cast<float>(params.loop_count * 2);
    const float center_weight = sample_count / (l_v_c * 40.0f);

    float total_weight = center_weight;
    Vec3 result = Vec3(c_p) * center_weight;

    // Start from -1 plus a jitter four sample steps wide
    const float jitter = 8.0f / (sample_count + 4.0f);
    const float dt = (2.0f - jitter) / sample_count;
    float t = -1.0f + interleaved_gradient_noise(noise_coord(x, y), params.frame_id) * jitter;

    for (std::uint32_t i = 0; i < params.loop_count * 2; ++i) {
        const bool along_center = (i & 1u) == 0;
        const Vec2 sweep = along_center ? v_c : v_max;
        const Vec2 sweep_n = along_center ? v_c_n : v_max_n;
        const float w_a = along_center ? w_a_c : w_a_max;

        const Vec2 position = p + t * sweep;
        const Vec4& s_texel = velocity_field.sample_point(position);
        const Vec2 v_s = unpack_velocity(s_texel, radius);
        const float z_s = unpack_depth(s_texel);

        const float distance = std::abs(t) * glm::length(sweep);
        const float l_v_s = std::max(glm::length(v_s), MIN_VELOCITY);

        const float f = weights::soft_depth_compare(z_p, z_s);
        const float b = weights::soft_depth_compare(z_s, z_p);
        const float w_b = std::abs(glm::dot(v_s / l_v_s, sweep_n));

        const float weight = f * weights::cone(distance, l_v_s) * w_b
                           + b * weights::cone(distance, l_v_c) * w_a
                           + weights::cylinder(distance, std::min(l_v_s, l_v_c)) * std::max(w_a, w_b) * 2.0f;

        result += Vec3(color.sample_bilinear(position)) * weight;
        total_weight += weight;
        t += dt;
    }

    const float alpha = params.write_blend_weight ? center_weight / total_weight : c_p.a;
    return Vec4(result / total_weight, alpha);
}

Result<void> reconstruct(const Image& color, const Image& velocity_field, const Image& neighbor_max,
                         const ReconstructionParams& params, Image& destination,
                         const streak_core::ParallelConfig& parallel) {
    if (color.empty() || neighbor_max.empty()) {
        return Err(ImageError::empty("reconstruction input"));
    }
    if (!velocity_field.same_size(color)) {
        return Err(ImageError::size_mismatch(color.width(), color.height(),
                                             velocity_field.width(), velocity_field.height()));
    }
    if (!destination.same_size(color)) {
        return Err(ImageError::size_mismatch(color.width(), color.height(),
                                             destination.width(), destination.height()));
    }

    streak_core::parallel_for_rows(parallel, 0, color.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
        for (std::uint32_t y = y_begin; y < y_end; ++y) {
            for (std::uint32_t x = 0; x < color.width(); ++x) {
                destination.store(x, y, reconstruct_pixel(color, velocity_field, neighbor_max, x, y, params));
            }
        }
    });

    return Ok();
}

} // namespace streak_blur

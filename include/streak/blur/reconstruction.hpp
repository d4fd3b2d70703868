#pragma once

/// @file reconstruction.hpp
/// @brief Gather pass that synthesizes the blurred color

#include "config.hpp"
#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/image.hpp>
#include <streak/math/types.hpp>
#include <cstdint>

namespace streak_blur {

using streak_image::Image;
using streak_math::Vec2;
using streak_math::Vec4;

/// Velocities shorter than this (in pixels) count as no motion
inline constexpr float MIN_VELOCITY = 0.5f;

/// Steepness of the soft depth comparison
inline constexpr float DEPTH_FILTER_STRENGTH = 20.0f;

/// Scalars the reconstruction needs from the resolved settings
struct ReconstructionParams {
    std::uint32_t loop_count = 1;
    float codec_radius = 1.0f;
    std::uint64_t frame_id = 0;
    DebugMode debug_mode = DebugMode::Off;
    bool write_blend_weight = false;  ///< Store the center weight share in alpha

    [[nodiscard]] static ReconstructionParams from(const ResolvedParams& params, std::uint64_t frame_id) noexcept;
};

// =============================================================================
// Sample Weights
// =============================================================================

namespace weights {

/// 1 when `zb` is in front of or level with `za`, falling to 0 as `zb` moves behind it
[[nodiscard]] float soft_depth_compare(float za, float zb) noexcept;

/// Linear falloff over the length of a velocity
[[nodiscard]] float cone(float distance, float velocity_length) noexcept;

/// Flat top with smooth edges around the length of a velocity
[[nodiscard]] float cylinder(float distance, float velocity_length) noexcept;

} // namespace weights

/// NeighborMax velocity looked up at a pixel with the per-pixel tile jitter applied
[[nodiscard]] Vec2 jittered_neighbor_max(const Image& neighbor_max, std::uint32_t x, std::uint32_t y,
                                         std::uint32_t frame_width, std::uint32_t frame_height,
                                         std::uint64_t frame_id);

/// Reconstruct a single pixel
[[nodiscard]] Vec4 reconstruct_pixel(const Image& color, const Image& velocity_field, const Image& neighbor_max,
                                     std::uint32_t x, std::uint32_t y, const ReconstructionParams& params);

/// Run the reconstruction (or the selected debug view) for every pixel.
/// `destination` must match the size of `color`.
streak_core::Result<void> reconstruct(const Image& color, const Image& velocity_field, const Image& neighbor_max,
                                      const ReconstructionParams& params, Image& destination,
                                      const streak_core::ParallelConfig& parallel = {});

} // namespace streak_blur

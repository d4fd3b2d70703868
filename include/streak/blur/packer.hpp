#pragma once

/// @file packer.hpp
/// @brief First pass: per-pixel velocity and linear depth

#include "config.hpp"
#include "frame_source.hpp"
#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/image.hpp>

namespace streak_blur {

/// Velocity in pixels over one exposure for a UV-space motion vector
[[nodiscard]] Vec2 exposure_velocity(const Vec2& motion_uv, const ResolvedParams& params) noexcept;

/// Fill `velocity_field` (Rgb10A2Unorm, frame sized) from the host depth and
/// motion. Motion comes from the host motion vectors, else from camera
/// reprojection, else is zero.
streak_core::Result<void> pack_velocity(const IFrameSource& host, const ResolvedParams& params,
                                        Image& velocity_field,
                                        const streak_core::ParallelConfig& parallel = {});

} // namespace streak_blur

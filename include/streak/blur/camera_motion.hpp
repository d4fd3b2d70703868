#pragma once

/// @file camera_motion.hpp
/// @brief Screen motion of static geometry from camera reprojection

#include "depth.hpp"
#include "frame_source.hpp"
#include <streak/math/types.hpp>

namespace streak_blur {

using streak_math::Vec2;

/// UV-space motion (current - previous) of the surface seen at `uv` with
/// device depth `raw_depth`, assuming the surface did not move.
///
/// UV (0, 0) is the top-left corner; NDC y points up.
[[nodiscard]] Vec2 camera_motion(const Vec2& uv, float raw_depth, const DepthParams& depth_params,
                                 const CameraTransforms& cameras);

/// Same as camera_motion with inverse(view_projection) precomputed
[[nodiscard]] Vec2 camera_motion(const Vec2& uv, float raw_depth, const DepthParams& depth_params,
                                 const Mat4& inverse_view_projection, const Mat4& previous_view_projection);

} // namespace streak_blur

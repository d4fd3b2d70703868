/// @file camera_motion.cpp
/// @brief Reprojection of static geometry into the previous frame

#include <streak/blur/camera_motion.hpp>
#include <cmath>

namespace streak_blur {

using streak_math::Vec4;

Vec2 camera_motion(const Vec2& uv, float raw_depth, const DepthParams& depth_params,
                   const Mat4& inverse_view_projection, const Mat4& previous_view_projection) {
    // Reversed-Z matrices already expect reversed depth; only linear depth needs converting back
    float device_depth = depth_params.convention == DepthConvention::Linear01
        ? standard_device_depth(raw_depth, depth_params)
        : raw_depth;

    Vec4 ndc(uv.x * 2.0f - 1.0f, 1.0f - uv.y * 2.0f, device_depth, 1.0f);
    Vec4 world = inverse_view_projection * ndc;
    if (std::abs(world.w) < 1e-12f) {
        return Vec2(0.0f);
    }
    world /= world.w;

    Vec4 previous_clip = previous_view_projection * world;
    if (previous_clip.w <= 1e-6f) {
        // Surface was behind the previous camera; no usable history
        return Vec2(0.0f);
    }
    Vec2 previous_ndc = Vec2(previous_clip.x, previous_clip.y) / previous_clip.w;
    Vec2 previous_uv(previous_ndc.x * 0.5f + 0.5f, 0.5f - previous_ndc.y * 0.5f);

    return uv - previous_uv;
}

Vec2 camera_motion(const Vec2& uv, float raw_depth, const DepthParams& depth_params,
                   const CameraTransforms& cameras) {
    return camera_motion(uv, raw_depth, depth_params, glm::inverse(cameras.view_projection),
                         cameras.previous_view_projection);
}

} // namespace streak_blur

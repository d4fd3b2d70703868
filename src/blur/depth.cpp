/// @file depth.cpp
/// @brief Depth linearization

#include <streak/blur/depth.hpp>
#include <algorithm>

namespace streak_blur {

namespace {

/// x = 1 - far/near, y = far/near; linear01 = 1 / (x * z + y)
struct ZBufferParams {
    float x;
    float y;
};

ZBufferParams zbuffer_params(const DepthParams& params) noexcept {
    float near_plane = std::max(params.near_plane, 1e-6f);
    float far_plane = std::max(params.far_plane, near_plane * 1.0001f);
    float ratio = far_plane / near_plane;
    return ZBufferParams{1.0f - ratio, ratio};
}

} // anonymous namespace

float linearize_depth(float raw, const DepthParams& params) noexcept {
    float z = std::clamp(raw, 0.0f, 1.0f);
    switch (params.convention) {
        case DepthConvention::Linear01:
            return z;
        case DepthConvention::ReversedZ:
            z = 1.0f - z;
            break;
        default:
            break;
    }
    ZBufferParams zb = zbuffer_params(params);
    return 1.0f / (zb.x * z + zb.y);
}

float standard_device_depth(float raw, const DepthParams& params) noexcept {
    float z = std::clamp(raw, 0.0f, 1.0f);
    switch (params.convention) {
        case DepthConvention::ReversedZ:
            return 1.0f - z;
        case DepthConvention::Linear01: {
            ZBufferParams zb = zbuffer_params(params);
            float linear = std::max(z, 1.0f / zb.y);
            return std::clamp((1.0f / linear - zb.y) / zb.x, 0.0f, 1.0f);
        }
        default:
            return z;
    }
}

} // namespace streak_blur

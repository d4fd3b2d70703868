#pragma once

/// @file depth.hpp
/// @brief Device depth conventions and linearization

#include <cstdint>

namespace streak_blur {

/// How the host stores depth
enum class DepthConvention : std::uint8_t {
    Standard,   ///< Zero-to-one device depth, 0 at the near plane
    ReversedZ,  ///< Zero-to-one device depth, 1 at the near plane
    Linear01,   ///< Already view depth divided by the far plane
};

/// Camera clip planes and depth storage convention
struct DepthParams {
    float near_plane = 0.1f;
    float far_plane = 1000.0f;
    DepthConvention convention = DepthConvention::Standard;
};

/// Device depth to view depth / far, in [near/far, 1]
[[nodiscard]] float linearize_depth(float raw, const DepthParams& params) noexcept;

/// Device depth in the standard (non-reversed) zero-to-one convention
[[nodiscard]] float standard_device_depth(float raw, const DepthParams& params) noexcept;

} // namespace streak_blur

#pragma once

/// @file config.hpp
/// @brief Motion blur settings and the per-frame parameters derived from them

#include <cstdint>
#include <string>
#include <vector>

namespace streak_blur {

// =============================================================================
// Enumerations
// =============================================================================

/// How the exposure time is determined
enum class ExposureMode : std::uint8_t {
    Constant,      ///< Fixed shutter speed (1 / shutter_speed seconds)
    DeltaTime,     ///< Exposure follows the frame time, scaled by exposure_time_scale
    ShutterAngle,  ///< Exposure is shutter_angle / 360 of the frame time
};

/// Reconstruction quality tier
enum class SampleCountTier : std::uint8_t {
    Low,
    Medium,
    High,
    Custom,  ///< Use MotionBlurSettings::custom_sample_count
};

/// Debug visualization selector
enum class DebugMode : std::uint8_t {
    Off,
    Velocity,
    NeighborMax,
    Depth,
};

/// Weight given to the current frame by the accumulator
enum class AccumulationWeight : std::uint8_t {
    FixedRatio,           ///< 1 - accumulation_ratio
    ReconstructionAlpha,  ///< max(1 - accumulation_ratio, reconstruction alpha)
};

[[nodiscard]] const char* exposure_mode_name(ExposureMode mode) noexcept;
[[nodiscard]] const char* sample_count_tier_name(SampleCountTier tier) noexcept;
[[nodiscard]] const char* debug_mode_name(DebugMode mode) noexcept;
[[nodiscard]] const char* accumulation_weight_name(AccumulationWeight weight) noexcept;

// =============================================================================
// Limits
// =============================================================================

namespace limits {
    inline constexpr float MIN_BLUR_RADIUS = 0.5f;   ///< Percent of frame height
    inline constexpr float MAX_BLUR_RADIUS = 10.0f;
    inline constexpr float MAX_ACCUMULATION_RATIO = 0.99f;
    inline constexpr int MIN_SAMPLE_COUNT = 2;
    inline constexpr int MAX_SAMPLE_COUNT = 128;
    inline constexpr std::uint32_t TILE_GRANULARITY = 8;
}

// =============================================================================
// MotionBlurSettings
// =============================================================================

/// Designer-facing settings. Any value is accepted; out-of-range values are
/// clamped when the settings are resolved for a frame.
struct MotionBlurSettings {
    ExposureMode exposure_mode = ExposureMode::DeltaTime;
    float shutter_speed = 30.0f;        ///< Denominator of the shutter speed (Constant mode)
    float exposure_time_scale = 1.0f;   ///< DeltaTime mode
    float shutter_angle = 180.0f;       ///< Degrees (ShutterAngle mode)
    SampleCountTier sample_count = SampleCountTier::Medium;
    int custom_sample_count = 12;
    float max_blur_radius = 3.5f;       ///< Percent of the frame height
    float accumulation_ratio = 0.0f;
    AccumulationWeight accumulation_weight = AccumulationWeight::FixedRatio;
    DebugMode debug_mode = DebugMode::Off;
};

// =============================================================================
// ResolvedParams
// =============================================================================

/// Settings resolved against a frame size and delta time
struct ResolvedParams {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    float velocity_scale = 0.0f;
    std::uint32_t sample_count = 2;     ///< Samples walked per pixel, 2 * loop_count
    std::uint32_t loop_count = 1;
    float max_blur_radius = limits::MIN_BLUR_RADIUS;  ///< Clamped percent
    std::uint32_t max_blur_pixels = 0;
    std::uint32_t tile_size = limits::TILE_GRANULARITY;
    float accumulation_ratio = 0.0f;
    AccumulationWeight accumulation_weight = AccumulationWeight::FixedRatio;
    DebugMode debug_mode = DebugMode::Off;

    /// Radius used to encode velocities; at least one pixel
    [[nodiscard]] float codec_radius() const noexcept {
        return max_blur_pixels > 0 ? static_cast<float>(max_blur_pixels) : 1.0f;
    }

    /// Texels per axis read by the last tile reduction
    [[nodiscard]] std::uint32_t tile_loop() const noexcept { return tile_size / limits::TILE_GRANULARITY; }

    /// Width or height of the tile and neighbor-max fields
    [[nodiscard]] std::uint32_t tile_columns() const noexcept { return divided(width, tile_size); }
    [[nodiscard]] std::uint32_t tile_rows() const noexcept { return divided(height, tile_size); }

    [[nodiscard]] bool accumulation_enabled() const noexcept {
        return accumulation_ratio > 0.0f && debug_mode == DebugMode::Off;
    }

    /// max_blur_pixels resolved to zero; nothing can blur
    [[nodiscard]] bool degenerate() const noexcept { return max_blur_pixels == 0; }

    /// Size of an image downsampled by divider, never below one texel
    [[nodiscard]] static std::uint32_t divided(std::uint32_t extent, std::uint32_t divider) noexcept {
        std::uint32_t value = divider == 0 ? extent : extent / divider;
        return value == 0 ? 1 : value;
    }
};

/// Names of the settings fields that were clamped while resolving
struct ClampReport {
    std::vector<std::string> fields;

    [[nodiscard]] bool any() const noexcept { return !fields.empty(); }
};

// =============================================================================
// Derivations
// =============================================================================

/// Scale from per-frame motion to per-exposure motion
[[nodiscard]] float velocity_scale(const MotionBlurSettings& settings, float delta_time) noexcept;

/// Samples taken per pixel: 4, 10 and 20 for the tiers, clamped custom value otherwise
[[nodiscard]] int sample_count_value(const MotionBlurSettings& settings) noexcept;

/// Reconstruction loop iterations: Low 2, Medium 5, High 10, Custom clamp(n / 2, 1, 64)
[[nodiscard]] std::uint32_t loop_count(const MotionBlurSettings& settings) noexcept;

/// Longest blur in pixels for a radius given in percent of the frame height
[[nodiscard]] std::uint32_t max_blur_pixels(float radius_percent, std::uint32_t frame_height) noexcept;

/// Smallest multiple of 8 covering max_blur_pixels, never below 8
[[nodiscard]] std::uint32_t tile_size_for(std::uint32_t max_blur_pixels) noexcept;

/// Clamp settings and compute every derived value for one frame
[[nodiscard]] ResolvedParams resolve_settings(const MotionBlurSettings& settings,
                                              std::uint32_t width, std::uint32_t height,
                                              float delta_time, ClampReport* report = nullptr);

} // namespace streak_blur

/// @file config.cpp
/// @brief Settings clamping and derived per-frame parameters

#include <streak/blur/config.hpp>
#include <algorithm>
#include <cmath>

namespace streak_blur {

// =============================================================================
// Names
// =============================================================================

const char* exposure_mode_name(ExposureMode mode) noexcept {
    switch (mode) {
        case ExposureMode::Constant: return "constant";
        case ExposureMode::DeltaTime: return "delta_time";
        case ExposureMode::ShutterAngle: return "shutter_angle";
        default: return "unknown";
    }
}

const char* sample_count_tier_name(SampleCountTier tier) noexcept {
    switch (tier) {
        case SampleCountTier::Low: return "low";
        case SampleCountTier::Medium: return "medium";
        case SampleCountTier::High: return "high";
        case SampleCountTier::Custom: return "custom";
        default: return "unknown";
    }
}

const char* debug_mode_name(DebugMode mode) noexcept {
    switch (mode) {
        case DebugMode::Off: return "off";
        case DebugMode::Velocity: return "velocity";
        case DebugMode::NeighborMax: return "neighbor_max";
        case DebugMode::Depth: return "depth";
        default: return "unknown";
    }
}

const char* accumulation_weight_name(AccumulationWeight weight) noexcept {
    switch (weight) {
        case AccumulationWeight::FixedRatio: return "fixed_ratio";
        case AccumulationWeight::ReconstructionAlpha: return "reconstruction_alpha";
        default: return "unknown";
    }
}

// =============================================================================
// Clamping
// =============================================================================

namespace {

/// Clamp a float, mapping NaN to the lower bound, and record the field if it moved
float clamp_field(float value, float lo, float hi, const char* field, ClampReport* report) {
    float clamped = std::isnan(value) ? lo : std::clamp(value, lo, hi);
    if (report && clamped != value) {
        report->fields.emplace_back(field);
    }
    return clamped;
}

} // anonymous namespace

float velocity_scale(const MotionBlurSettings& settings, float delta_time) noexcept {
    switch (settings.exposure_mode) {
        case ExposureMode::Constant: {
            if (!(delta_time > 0.0f)) {
                return 0.0f;
            }
            float shutter = std::isnan(settings.shutter_speed) ? 1.0f : std::max(settings.shutter_speed, 1.0f);
            return 1.0f / (shutter * delta_time);
        }
        case ExposureMode::DeltaTime:
            return std::isnan(settings.exposure_time_scale) ? 0.0f : std::max(settings.exposure_time_scale, 0.0f);
        case ExposureMode::ShutterAngle:
            return std::isnan(settings.shutter_angle) ? 0.0f : std::clamp(settings.shutter_angle / 360.0f, 0.0f, 1.0f);
        default:
            return 0.0f;
    }
}

int sample_count_value(const MotionBlurSettings& settings) noexcept {
    switch (settings.sample_count) {
        case SampleCountTier::Low: return 4;
        case SampleCountTier::Medium: return 10;
        case SampleCountTier::High: return 20;
        default:
            return std::clamp(settings.custom_sample_count, limits::MIN_SAMPLE_COUNT, limits::MAX_SAMPLE_COUNT);
    }
}

std::uint32_t loop_count(const MotionBlurSettings& settings) noexcept {
    return static_cast<std::uint32_t>(std::max(sample_count_value(settings) / 2, 1));
}

std::uint32_t max_blur_pixels(float radius_percent, std::uint32_t frame_height) noexcept {
    float pixels = radius_percent * static_cast<float>(frame_height) / 100.0f;
    return pixels > 0.0f ? static_cast<std::uint32_t>(pixels) : 0u;
}

std::uint32_t tile_size_for(std::uint32_t max_blur_pixels) noexcept {
    constexpr std::uint32_t g = limits::TILE_GRANULARITY;
    if (max_blur_pixels <= g) {
        return g;
    }
    return ((max_blur_pixels - 1) / g + 1) * g;
}

ResolvedParams resolve_settings(const MotionBlurSettings& settings,
                                std::uint32_t width, std::uint32_t height,
                                float delta_time, ClampReport* report) {
    ResolvedParams params;
    params.width = width;
    params.height = height;

    // Recorded only; the derivations below apply the same bounds themselves
    if (report) {
        if (settings.exposure_mode == ExposureMode::Constant && !(settings.shutter_speed >= 1.0f)) {
            report->fields.emplace_back("shutter_speed");
        }
        if (settings.exposure_mode == ExposureMode::DeltaTime && !(settings.exposure_time_scale >= 0.0f)) {
            report->fields.emplace_back("exposure_time_scale");
        }
        if (settings.exposure_mode == ExposureMode::ShutterAngle &&
            !(settings.shutter_angle >= 0.0f && settings.shutter_angle <= 360.0f)) {
            report->fields.emplace_back("shutter_angle");
        }
        if (settings.sample_count == SampleCountTier::Custom &&
            (settings.custom_sample_count < limits::MIN_SAMPLE_COUNT ||
             settings.custom_sample_count > limits::MAX_SAMPLE_COUNT)) {
            report->fields.emplace_back("custom_sample_count");
        }
    }

    params.velocity_scale = velocity_scale(settings, delta_time);
    params.loop_count = loop_count(settings);
    params.sample_count = params.loop_count * 2;

    params.max_blur_radius = clamp_field(settings.max_blur_radius, limits::MIN_BLUR_RADIUS,
                                         limits::MAX_BLUR_RADIUS, "max_blur_radius", report);
    params.max_blur_pixels = max_blur_pixels(params.max_blur_radius, height);
    params.tile_size = tile_size_for(params.max_blur_pixels);

    params.accumulation_ratio = clamp_field(settings.accumulation_ratio, 0.0f,
                                            limits::MAX_ACCUMULATION_RATIO, "accumulation_ratio", report);
    params.accumulation_weight = settings.accumulation_weight;
    params.debug_mode = settings.debug_mode;

    return params;
}

} // namespace streak_blur

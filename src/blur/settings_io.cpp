/// @file settings_io.cpp
/// @brief JSON load/save for motion blur settings

#include <streak/blur/settings_io.hpp>
#include <streak/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <limits>
#include <fstream>
#include <optional>
#include <utility>

namespace streak_blur {

using streak_core::ConfigError;
using streak_core::Err;
using streak_core::Ok;
using streak_core::Result;

namespace {

template<typename Enum, std::size_t N>
using NameTable = std::array<std::pair<const char*, Enum>, N>;

constexpr NameTable<ExposureMode, 3> EXPOSURE_MODES{{
    {"constant", ExposureMode::Constant},
    {"delta_time", ExposureMode::DeltaTime},
    {"shutter_angle", ExposureMode::ShutterAngle},
}};

constexpr NameTable<SampleCountTier, 4> SAMPLE_COUNTS{{
    {"low", SampleCountTier::Low},
    {"medium", SampleCountTier::Medium},
    {"high", SampleCountTier::High},
    {"custom", SampleCountTier::Custom},
}};

constexpr NameTable<DebugMode, 4> DEBUG_MODES{{
    {"off", DebugMode::Off},
    {"velocity", DebugMode::Velocity},
    {"neighbor_max", DebugMode::NeighborMax},
    {"depth", DebugMode::Depth},
}};

constexpr NameTable<AccumulationWeight, 2> ACCUMULATION_WEIGHTS{{
    {"fixed_ratio", AccumulationWeight::FixedRatio},
    {"reconstruction_alpha", AccumulationWeight::ReconstructionAlpha},
}};

/// Read an enumerated field into `out`; absent keys leave it untouched
template<typename Enum, std::size_t N>
std::optional<ConfigError> read_enum(const nlohmann::json& doc, const char* key,
                                     const NameTable<Enum, N>& table, Enum& out) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    const auto& field = doc.at(key);
    if (!field.is_string()) {
        return ConfigError::type_mismatch(key, "a string");
    }
    const auto& text = field.get_ref<const std::string&>();
    for (const auto& [name, value] : table) {
        if (text == name) {
            out = value;
            return std::nullopt;
        }
    }
    return ConfigError::unknown_value(key, text);
}

template<typename Number>
std::optional<ConfigError> read_number(const nlohmann::json& doc, const char* key, Number& out) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    const auto& field = doc.at(key);
    if (!field.is_number()) {
        return ConfigError::type_mismatch(key, "a number");
    }
    // Out-of-range values are clamped later; narrowing an unrepresentable value is not defined
    const double value = field.get<double>();
    const auto lowest = static_cast<double>(std::numeric_limits<Number>::lowest());
    const auto highest = static_cast<double>(std::numeric_limits<Number>::max());
    out = static_cast<Number>(std::clamp(value, lowest, highest));
    return std::nullopt;
}

} // anonymous namespace

Result<MotionBlurSettings> settings_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<MotionBlurSettings>(ConfigError::type_mismatch("<root>", "an object"));
    }

    MotionBlurSettings settings;
    const std::optional<ConfigError> problems[] = {
        read_enum(document, "exposure_mode", EXPOSURE_MODES, settings.exposure_mode),
        read_number(document, "shutter_speed", settings.shutter_speed),
        read_number(document, "exposure_time_scale", settings.exposure_time_scale),
        read_number(document, "shutter_angle", settings.shutter_angle),
        read_enum(document, "sample_count", SAMPLE_COUNTS, settings.sample_count),
        read_number(document, "custom_sample_count", settings.custom_sample_count),
        read_number(document, "max_blur_radius", settings.max_blur_radius),
        read_number(document, "accumulation_ratio", settings.accumulation_ratio),
        read_enum(document, "accumulation_weight", ACCUMULATION_WEIGHTS, settings.accumulation_weight),
        read_enum(document, "debug_mode", DEBUG_MODES, settings.debug_mode),
    };

    for (const auto& problem : problems) {
        if (problem) {
            return Err<MotionBlurSettings>(*problem);
        }
    }
    return settings;
}

nlohmann::json settings_to_json(const MotionBlurSettings& settings) {
    nlohmann::json j;
    j["exposure_mode"] = exposure_mode_name(settings.exposure_mode);
    j["shutter_speed"] = settings.shutter_speed;
    j["exposure_time_scale"] = settings.exposure_time_scale;
    j["shutter_angle"] = settings.shutter_angle;
    j["sample_count"] = sample_count_tier_name(settings.sample_count);
    j["custom_sample_count"] = settings.custom_sample_count;
    j["max_blur_radius"] = settings.max_blur_radius;
    j["accumulation_ratio"] = settings.accumulation_ratio;
    j["accumulation_weight"] = accumulation_weight_name(settings.accumulation_weight);
    j["debug_mode"] = debug_mode_name(settings.debug_mode);
    return j;
}

Result<MotionBlurSettings> load_settings(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<MotionBlurSettings>(ConfigError::unreadable(path, "cannot open file"));
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        return Err<MotionBlurSettings>(ConfigError::unreadable(path, e.what()));
    }

    auto settings = settings_from_json(document);
    if (!settings) {
        settings.error().with_context("path", path);
        return settings;
    }

    streak_core::blur_logger()->debug("Loaded motion blur settings from {}", path);
    return settings;
}

Result<void> save_settings(const std::string& path, const MotionBlurSettings& settings) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Err(streak_core::Error(streak_core::ErrorCode::IOError, "Cannot write '" + path + "'"));
    }
    file << settings_to_json(settings).dump(2);
    if (!file) {
        return Err(streak_core::Error(streak_core::ErrorCode::IOError, "Write failed for '" + path + "'"));
    }
    return Ok();
}

} // namespace streak_blur

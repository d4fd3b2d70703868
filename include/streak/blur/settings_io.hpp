#pragma once

/// @file settings_io.hpp
/// @brief JSON documents for MotionBlurSettings

#include "config.hpp"
#include <streak/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace streak_blur {

/// Read settings from a JSON object.
///
/// Missing keys keep their defaults. Enumerations are lower-case strings
/// ("constant", "delta_time", "shutter_angle"; "low", "medium", "high",
/// "custom"; "off", "velocity", "neighbor_max", "depth"; "fixed_ratio",
/// "reconstruction_alpha"). Numbers are taken as given and clamped later.
[[nodiscard]] streak_core::Result<MotionBlurSettings> settings_from_json(const nlohmann::json& document);

/// Write every settings field
[[nodiscard]] nlohmann::json settings_to_json(const MotionBlurSettings& settings);

/// Load a settings file
[[nodiscard]] streak_core::Result<MotionBlurSettings> load_settings(const std::string& path);

/// Save a settings file (pretty-printed, 2-space indent)
streak_core::Result<void> save_settings(const std::string& path, const MotionBlurSettings& settings);

} // namespace streak_blur

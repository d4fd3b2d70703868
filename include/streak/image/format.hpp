#pragma once

/// @file format.hpp
/// @brief Pixel storage formats for CPU images

#include <streak/math/types.hpp>
#include <cstddef>
#include <cstdint>

namespace streak_image {

using streak_math::Vec4;

// =============================================================================
// PixelFormat
// =============================================================================

/// Storage format of an image. Texels are always handled as four floats;
/// the format decides which channels exist and at what precision they are kept.
enum class PixelFormat : std::uint8_t {
    Rgba32Float = 0,
    Rgba16Float,
    Rgb10A2Unorm,  // 10-bit unorm rgb, 2-bit unorm alpha
    Rg16Float,
    R32Float,
};

/// Bytes one texel occupies in the equivalent GPU format
[[nodiscard]] constexpr std::size_t bytes_per_pixel(PixelFormat format) noexcept {
    switch (format) {
        case PixelFormat::Rgba32Float: return 16;
        case PixelFormat::Rgba16Float: return 8;
        case PixelFormat::Rgb10A2Unorm: return 4;
        case PixelFormat::Rg16Float: return 4;
        case PixelFormat::R32Float: return 4;
        default: return 0;
    }
}

[[nodiscard]] constexpr std::uint32_t channel_count(PixelFormat format) noexcept {
    switch (format) {
        case PixelFormat::Rgba32Float:
        case PixelFormat::Rgba16Float:
        case PixelFormat::Rgb10A2Unorm:
            return 4;
        case PixelFormat::Rg16Float: return 2;
        case PixelFormat::R32Float: return 1;
        default: return 0;
    }
}

/// Check if format clamps its channels to [0, 1]
[[nodiscard]] constexpr bool is_normalized_format(PixelFormat format) noexcept {
    return format == PixelFormat::Rgb10A2Unorm;
}

[[nodiscard]] inline const char* pixel_format_name(PixelFormat format) noexcept {
    switch (format) {
        case PixelFormat::Rgba32Float: return "Rgba32Float";
        case PixelFormat::Rgba16Float: return "Rgba16Float";
        case PixelFormat::Rgb10A2Unorm: return "Rgb10A2Unorm";
        case PixelFormat::Rg16Float: return "Rg16Float";
        case PixelFormat::R32Float: return "R32Float";
        default: return "Unknown";
    }
}

/// Reduce a texel to what the format can hold. Missing channels read back
/// as 0 for g/b and 1 for alpha, like a GPU sampler would return them.
[[nodiscard]] Vec4 quantize(PixelFormat format, const Vec4& texel) noexcept;

/// Smallest step the format can represent in its rgb channels near 1.0
[[nodiscard]] float format_precision(PixelFormat format) noexcept;

} // namespace streak_image

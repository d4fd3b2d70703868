/// @file format.cpp
/// @brief Storage quantization for pixel formats

#include <streak/image/format.hpp>
#include <algorithm>
#include <cmath>

namespace streak_image {

namespace {

float to_half(float value) noexcept {
    return glm::unpackHalf1x16(glm::packHalf1x16(value));
}

float to_unorm(float value, float steps) noexcept {
    float clamped = std::clamp(value, 0.0f, 1.0f);
    return std::round(clamped * steps) / steps;
}

} // anonymous namespace

Vec4 quantize(PixelFormat format, const Vec4& texel) noexcept {
    switch (format) {
        case PixelFormat::Rgba32Float:
            return texel;
        case PixelFormat::Rgba16Float:
            return Vec4(to_half(texel.r), to_half(texel.g), to_half(texel.b), to_half(texel.a));
        case PixelFormat::Rgb10A2Unorm:
            return Vec4(to_unorm(texel.r, 1023.0f), to_unorm(texel.g, 1023.0f),
                        to_unorm(texel.b, 1023.0f), to_unorm(texel.a, 3.0f));
        case PixelFormat::Rg16Float:
            return Vec4(to_half(texel.r), to_half(texel.g), 0.0f, 1.0f);
        case PixelFormat::R32Float:
            return Vec4(texel.r, 0.0f, 0.0f, 1.0f);
        default:
            return texel;
    }
}

float format_precision(PixelFormat format) noexcept {
    switch (format) {
        case PixelFormat::Rgb10A2Unorm: return 1.0f / 1023.0f;
        case PixelFormat::Rgba16Float:
        case PixelFormat::Rg16Float: return 1.0f / 1024.0f;
        default: return 0.0f;
    }
}

} // namespace streak_image

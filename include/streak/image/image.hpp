#pragma once

/// @file image.hpp
/// @brief CPU image with format-accurate storage and clamped sampling

#include "format.hpp"
#include <streak/core/error.hpp>
#include <streak/math/types.hpp>
#include <cstdint>
#include <vector>

namespace streak_image {

using streak_math::Vec2;
using streak_math::UVec2;

// =============================================================================
// Image
// =============================================================================

/// Row-major image, origin at the top-left texel.
///
/// Pixel-space coordinates put texel (x, y) at [x, x+1) x [y, y+1), so its
/// centre is (x + 0.5, y + 0.5). All reads clamp to the border.
class Image {
public:
    Image() = default;
    Image(std::uint32_t width, std::uint32_t height,
          PixelFormat format = PixelFormat::Rgba32Float,
          const Vec4& fill_value = Vec4(0.0f));

    // =========================================================================
    // Shape
    // =========================================================================

    [[nodiscard]] std::uint32_t width() const noexcept { return m_width; }
    [[nodiscard]] std::uint32_t height() const noexcept { return m_height; }
    [[nodiscard]] UVec2 size() const noexcept { return UVec2(m_width, m_height); }
    [[nodiscard]] PixelFormat format() const noexcept { return m_format; }
    [[nodiscard]] bool empty() const noexcept { return m_width == 0 || m_height == 0; }
    [[nodiscard]] std::size_t texel_count() const noexcept { return m_texels.size(); }

    /// Bytes the image would occupy in its GPU format
    [[nodiscard]] std::size_t byte_size() const noexcept {
        return texel_count() * bytes_per_pixel(m_format);
    }

    [[nodiscard]] bool same_size(const Image& other) const noexcept {
        return m_width == other.m_width && m_height == other.m_height;
    }

    /// Reallocate storage; contents are reset to fill_value
    void reset(std::uint32_t width, std::uint32_t height, PixelFormat format,
               const Vec4& fill_value = Vec4(0.0f));

    // =========================================================================
    // Texel Access
    // =========================================================================

    [[nodiscard]] const Vec4& load(std::uint32_t x, std::uint32_t y) const noexcept {
        return m_texels[static_cast<std::size_t>(y) * m_width + x];
    }

    /// Load with coordinates clamped to the image
    [[nodiscard]] const Vec4& load_clamped(std::int32_t x, std::int32_t y) const noexcept;

    /// Store a texel, quantized to the image format
    void store(std::uint32_t x, std::uint32_t y, const Vec4& texel) noexcept {
        m_texels[static_cast<std::size_t>(y) * m_width + x] = quantize(m_format, texel);
    }

    /// Fill every texel
    void fill(const Vec4& value);

    [[nodiscard]] const std::vector<Vec4>& texels() const noexcept { return m_texels; }

    // =========================================================================
    // Sampling
    // =========================================================================

    /// Nearest texel to a pixel-space position
    [[nodiscard]] const Vec4& sample_point(const Vec2& position) const noexcept;

    /// Bilinear filter at a pixel-space position
    [[nodiscard]] Vec4 sample_bilinear(const Vec2& position) const noexcept;

    /// Nearest texel to a normalized [0, 1] coordinate
    [[nodiscard]] const Vec4& sample_point_uv(const Vec2& uv) const noexcept {
        return sample_point(uv * Vec2(static_cast<float>(m_width), static_cast<float>(m_height)));
    }

    // =========================================================================
    // Copy
    // =========================================================================

    /// Copy texels from an image of the same size, re-quantizing to this format
    streak_core::Result<void> copy_from(const Image& source);

private:
    std::uint32_t m_width = 0;
    std::uint32_t m_height = 0;
    PixelFormat m_format = PixelFormat::Rgba32Float;
    std::vector<Vec4> m_texels;
};

} // namespace streak_image

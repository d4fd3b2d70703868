/// @file image.cpp
/// @brief CPU image storage and sampling

#include <streak/image/image.hpp>
#include <algorithm>
#include <cmath>

namespace streak_image {

Image::Image(std::uint32_t width, std::uint32_t height, PixelFormat format, const Vec4& fill_value) {
    reset(width, height, format, fill_value);
}

void Image::reset(std::uint32_t width, std::uint32_t height, PixelFormat format, const Vec4& fill_value) {
    m_width = width;
    m_height = height;
    m_format = format;
    m_texels.assign(static_cast<std::size_t>(width) * height, quantize(format, fill_value));
}

const Vec4& Image::load_clamped(std::int32_t x, std::int32_t y) const noexcept {
    auto cx = static_cast<std::uint32_t>(std::clamp<std::int32_t>(x, 0, static_cast<std::int32_t>(m_width) - 1));
    auto cy = static_cast<std::uint32_t>(std::clamp<std::int32_t>(y, 0, static_cast<std::int32_t>(m_height) - 1));
    return load(cx, cy);
}

void Image::fill(const Vec4& value) {
    std::fill(m_texels.begin(), m_texels.end(), quantize(m_format, value));
}

const Vec4& Image::sample_point(const Vec2& position) const noexcept {
    return load_clamped(static_cast<std::int32_t>(std::floor(position.x)),
                        static_cast<std::int32_t>(std::floor(position.y)));
}

Vec4 Image::sample_bilinear(const Vec2& position) const noexcept {
    // Shift so integer coordinates land on texel centres
    float fx = position.x - 0.5f;
    float fy = position.y - 0.5f;
    float x0f = std::floor(fx);
    float y0f = std::floor(fy);
    float tx = fx - x0f;
    float ty = fy - y0f;

    auto x0 = static_cast<std::int32_t>(x0f);
    auto y0 = static_cast<std::int32_t>(y0f);

    const Vec4& c00 = load_clamped(x0, y0);
    const Vec4& c10 = load_clamped(x0 + 1, y0);
    const Vec4& c01 = load_clamped(x0, y0 + 1);
    const Vec4& c11 = load_clamped(x0 + 1, y0 + 1);

    Vec4 top = glm::mix(c00, c10, tx);
    Vec4 bottom = glm::mix(c01, c11, tx);
    return glm::mix(top, bottom, ty);
}

streak_core::Result<void> Image::copy_from(const Image& source) {
    if (!same_size(source)) {
        return streak_core::Err(streak_core::ImageError::size_mismatch(
            m_width, m_height, source.width(), source.height()));
    }

    if (source.format() == m_format) {
        m_texels = source.m_texels;
    } else {
        std::transform(source.m_texels.begin(), source.m_texels.end(), m_texels.begin(),
                       [this](const Vec4& texel) { return quantize(m_format, texel); });
    }
    return streak_core::Ok();
}

} // namespace streak_image

/// @file neighbor_max.cpp
/// @brief 3x3 neighbor max expansion

#include <streak/blur/neighbor_max.hpp>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::Ok;
using streak_core::Result;
using streak_image::PixelFormat;
using streak_math::Vec2;
using streak_math::Vec4;

Result<void> expand_neighbor_max(const Image& tiles, Image& destination,
                                 const streak_core::ParallelConfig& parallel) {
    if (tiles.empty()) {
        return Err(ImageError::empty("neighbor max source"));
    }
    if (!destination.same_size(tiles)) {
        return Err(ImageError::size_mismatch(tiles.width(), tiles.height(),
                                             destination.width(), destination.height()));
    }
    if (destination.format() != PixelFormat::Rg16Float) {
        return Err(ImageError::format_mismatch(pixel_format_name(PixelFormat::Rg16Float),
                                               pixel_format_name(destination.format())));
    }

    streak_core::parallel_for_rows(parallel, 0, tiles.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
        for (std::uint32_t y = y_begin; y < y_end; ++y) {
            for (std::uint32_t x = 0; x < tiles.width(); ++x) {
                Vec2 longest(0.0f);
                float longest_sq = -1.0f;
                for (std::int32_t dy = -1; dy <= 1; ++dy) {
                    for (std::int32_t dx = -1; dx <= 1; ++dx) {
                        const Vec4& texel = tiles.load_clamped(static_cast<std::int32_t>(x) + dx,
                                                               static_cast<std::int32_t>(y) + dy);
                        Vec2 v(texel.r, texel.g);
                        float len_sq = glm::dot(v, v);
                        if (len_sq > longest_sq) {
                            longest = v;
                            longest_sq = len_sq;
                        }
                    }
                }
                destination.store(x, y, Vec4(longest.x, longest.y, 0.0f, 1.0f));
            }
        }
    });

    return Ok();
}

} // namespace streak_blur

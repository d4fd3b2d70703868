/// @file tile_reducer.cpp
/// @brief Tile max reduction

#include <streak/blur/tile_reducer.hpp>
#include <streak/blur/velocity_codec.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::Ok;
using streak_core::Result;
using streak_image::PixelFormat;

namespace {

/// Half-open source index range read by one destination cell
struct Footprint {
    std::int32_t begin = 0;
    std::int32_t end = 0;
};

/// The centred loop-wide window, widened to the cell's proportional share of
/// the source so that every source texel belongs to at least one cell when
/// the source is not an exact multiple of the destination.
std::vector<Footprint> footprints(std::uint32_t source_extent, std::uint32_t destination_extent,
                                  std::uint32_t loop, float offset) {
    const float ratio = static_cast<float>(source_extent) / static_cast<float>(destination_extent);
    std::vector<Footprint> result(destination_extent);
    for (std::uint32_t cell = 0; cell < destination_extent; ++cell) {
        const auto window = static_cast<std::int32_t>(std::floor((static_cast<float>(cell) + 0.5f) * ratio + offset));
        const auto share_begin = static_cast<std::int32_t>(
            static_cast<std::uint64_t>(cell) * source_extent / destination_extent);
        const auto share_end = static_cast<std::int32_t>(
            static_cast<std::uint64_t>(cell + 1) * source_extent / destination_extent);
        result[cell].begin = std::min(window, share_begin);
        result[cell].end = std::max(window + static_cast<std::int32_t>(loop), share_end);
    }
    return result;
}

} // anonymous namespace

Result<void> reduce_tiles(const Image& source, Image& destination, const ReduceParams& params,
                          const streak_core::ParallelConfig& parallel) {
    if (source.empty()) {
        return Err(ImageError::empty("tile reduction source"));
    }
    if (destination.empty()) {
        return Err(ImageError::empty("tile reduction destination"));
    }
    if (destination.format() != PixelFormat::Rg16Float) {
        return Err(ImageError::format_mismatch(pixel_format_name(PixelFormat::Rg16Float),
                                               pixel_format_name(destination.format())));
    }

    const std::uint32_t loop = params.loop == 0 ? 1 : params.loop;
    const auto columns = footprints(source.width(), destination.width(), loop, params.offset);
    const auto rows = footprints(source.height(), destination.height(), loop, params.offset);

    auto read = [&](std::int32_t sx, std::int32_t sy) -> Vec2 {
        const Vec4& texel = source.load_clamped(sx, sy);
        return params.decode_packed ? unpack_velocity(texel, params.codec_radius) : Vec2(texel.r, texel.g);
    };

    streak_core::parallel_for_rows(parallel, 0, destination.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
        for (std::uint32_t y = y_begin; y < y_end; ++y) {
            const Footprint& row = rows[y];
            for (std::uint32_t x = 0; x < destination.width(); ++x) {
                const Footprint& column = columns[x];

                Vec2 longest(0.0f);
                float longest_sq = -1.0f;
                for (std::int32_t sy = row.begin; sy < row.end; ++sy) {
                    for (std::int32_t sx = column.begin; sx < column.end; ++sx) {
                        Vec2 v = read(sx, sy);
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

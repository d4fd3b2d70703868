#pragma once

/// @file tile_reducer.hpp
/// @brief Max-magnitude velocity reduction used to build the tile pyramid

#include "config.hpp"
#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/image.hpp>
#include <cstdint>

namespace streak_blur {

using streak_image::Image;

/// Footprint of one reduction.
///
/// Each destination cell reads `loop` x `loop` source texels starting at
/// `offset` texels from the cell centre projected onto the source, and keeps
/// the longest velocity. When the source is not an exact multiple of the
/// destination the window also spans the cell's proportional share
/// `[k*src/dst, (k+1)*src/dst)`, so no source texel falls between cells.
struct ReduceParams {
    std::uint32_t loop = 2;
    float offset = -0.5f;
    bool decode_packed = false;  ///< Source is a packed velocity field
    float codec_radius = 1.0f;   ///< Only used with decode_packed

    /// Velocity field -> 1/4 resolution
    [[nodiscard]] static ReduceParams first_stage(float codec_radius) noexcept {
        return ReduceParams{4, -1.5f, true, codec_radius};
    }

    /// 1/4 -> 1/8 resolution
    [[nodiscard]] static ReduceParams second_stage() noexcept {
        return ReduceParams{2, -0.5f, false, 1.0f};
    }

    /// 1/8 -> 1/tile_size resolution
    [[nodiscard]] static ReduceParams final_stage(std::uint32_t tile_size) noexcept {
        std::uint32_t loop = tile_size / limits::TILE_GRANULARITY;
        if (loop == 0) {
            loop = 1;
        }
        return ReduceParams{loop, -0.5f * static_cast<float>(loop - 1), false, 1.0f};
    }
};

/// Write the max-magnitude velocity of each footprint into `destination`
/// (Rg16Float). Destination size decides the reduction ratio.
streak_core::Result<void> reduce_tiles(const Image& source, Image& destination, const ReduceParams& params,
                                       const streak_core::ParallelConfig& parallel = {});

} // namespace streak_blur

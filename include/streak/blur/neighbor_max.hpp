#pragma once

/// @file neighbor_max.hpp
/// @brief Dominant velocity of each tile's 3x3 neighborhood

#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/image.hpp>

namespace streak_blur {

using streak_image::Image;

/// For every tile write the longest velocity among the tile and its eight
/// neighbors, clamping at the field border. `destination` must match the
/// size of `tiles` and be Rg16Float.
streak_core::Result<void> expand_neighbor_max(const Image& tiles, Image& destination,
                                              const streak_core::ParallelConfig& parallel = {});

} // namespace streak_blur

#pragma once

/// @file streak.hpp
/// @brief Umbrella header for the streak motion blur library

#include "core/error.hpp"
#include "core/handle.hpp"
#include "core/log.hpp"
#include "core/parallel.hpp"

#include "math/noise.hpp"
#include "math/types.hpp"
#include "math/utils.hpp"

#include "image/format.hpp"
#include "image/image.hpp"
#include "image/scratch_pool.hpp"

#include "blur/accumulator.hpp"
#include "blur/camera_motion.hpp"
#include "blur/config.hpp"
#include "blur/depth.hpp"
#include "blur/frame_clock.hpp"
#include "blur/frame_source.hpp"
#include "blur/motion_blur.hpp"
#include "blur/neighbor_max.hpp"
#include "blur/packer.hpp"
#include "blur/reconstruction.hpp"
#include "blur/settings_io.hpp"
#include "blur/tile_reducer.hpp"
#include "blur/velocity_codec.hpp"

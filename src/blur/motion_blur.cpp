/// @file motion_blur.cpp
/// @brief Pipeline sequencing and scratch image lifetimes

#include <streak/blur/motion_blur.hpp>
#include <streak/blur/neighbor_max.hpp>
#include <streak/blur/packer.hpp>
#include <streak/blur/reconstruction.hpp>
#include <streak/blur/tile_reducer.hpp>
#include <streak/core/log.hpp>
#include <spdlog/fmt/ranges.h>
#include <utility>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::InputError;
using streak_core::Ok;
using streak_core::Result;
using streak_image::PixelFormat;
using streak_image::ScratchImage;

namespace {

/// Log and pass through a failed stage
Result<void> stage_failed(const char* stage, streak_core::Error error) {
    error.with_context("stage", stage);
    streak_core::blur_logger()->warn("Motion blur aborted: {}", streak_core::build_error_chain(error));
    return Err(std::move(error));
}

} // anonymous namespace

MotionBlur::MotionBlur(IScratchAllocator& allocator, MotionBlurSettings settings,
                       streak_core::ParallelConfig parallel)
    : m_allocator(&allocator)
    , m_settings(settings)
    , m_parallel(parallel) {}

Result<void> MotionBlur::validate(const Image& source, const Image& destination, const IFrameSource& host) const {
    if (source.empty()) {
        return Err(ImageError::empty("source frame"));
    }
    if (!destination.same_size(source)) {
        return Err(ImageError::size_mismatch(source.width(), source.height(),
                                             destination.width(), destination.height()));
    }
    const Image* depth = host.depth();
    if (!depth) {
        return Err(InputError::missing_depth());
    }
    if (!depth->same_size(source)) {
        return Err(InputError::size_mismatch("Depth image"));
    }
    const Image* motion = host.motion_vectors();
    if (motion && !motion->same_size(source)) {
        return Err(InputError::size_mismatch("Motion vector image"));
    }
    return Ok();
}

Result<void> MotionBlur::render(const Image& source, Image& destination, const IFrameSource& host) {
    streak_core::LogScope scope("MotionBlur::render", streak_core::blur_logger());

    if (auto valid = validate(source, destination, host); !valid) {
        return stage_failed("validate", std::move(valid.error()));
    }

    const std::uint32_t width = source.width();
    const std::uint32_t height = source.height();
    const std::uint64_t frame_id = host.current_frame_id();

    ClampReport clamps;
    const ResolvedParams params = resolve_settings(m_settings, width, height, host.delta_time(), &clamps);
    if (clamps.any()) {
        streak_core::blur_logger()->debug("Clamped settings: {}", fmt::join(clamps.fields, ", "));
    }
    if (params.degenerate()) {
        streak_core::blur_logger()->debug("Max blur radius is below one pixel at {}px height; output is unblurred",
                                          height);
    }

    RenderStats stats;
    stats.tile_columns = params.tile_columns();
    stats.tile_rows = params.tile_rows();

    auto acquire = [&](std::uint32_t w, std::uint32_t h, PixelFormat format) {
        auto image = ScratchImage::acquire(*m_allocator, w, h, format);
        if (image) {
            ++stats.scratch_images;
        }
        return image;
    };

    // Velocity/depth
    auto velocity = acquire(width, height, PixelFormat::Rgb10A2Unorm);
    if (!velocity) {
        return stage_failed("velocity", std::move(velocity.error()));
    }
    if (auto packed = pack_velocity(host, params, velocity->image(), m_parallel); !packed) {
        return stage_failed("velocity", std::move(packed.error()));
    }

    // Tile max pyramid: 1/4, 1/8, then 1/tile_size
    auto tile4 = acquire(ResolvedParams::divided(width, 4), ResolvedParams::divided(height, 4), PixelFormat::Rg16Float);
    if (!tile4) {
        return stage_failed("tile_max_4", std::move(tile4.error()));
    }
    if (auto reduced = reduce_tiles(velocity->image(), tile4->image(),
                                    ReduceParams::first_stage(params.codec_radius()), m_parallel); !reduced) {
        return stage_failed("tile_max_4", std::move(reduced.error()));
    }

    auto tile8 = acquire(ResolvedParams::divided(width, 8), ResolvedParams::divided(height, 8), PixelFormat::Rg16Float);
    if (!tile8) {
        return stage_failed("tile_max_8", std::move(tile8.error()));
    }
    if (auto reduced = reduce_tiles(tile4->image(), tile8->image(), ReduceParams::second_stage(), m_parallel);
        !reduced) {
        return stage_failed("tile_max_8", std::move(reduced.error()));
    }
    if (auto released = tile4->release(); !released) {
        return stage_failed("tile_max_8", std::move(released.error()));
    }

    auto tile = acquire(stats.tile_columns, stats.tile_rows, PixelFormat::Rg16Float);
    if (!tile) {
        return stage_failed("tile_max", std::move(tile.error()));
    }
    if (auto reduced = reduce_tiles(tile8->image(), tile->image(),
                                    ReduceParams::final_stage(params.tile_size), m_parallel); !reduced) {
        return stage_failed("tile_max", std::move(reduced.error()));
    }
    if (auto released = tile8->release(); !released) {
        return stage_failed("tile_max", std::move(released.error()));
    }

    // Neighbor max
    auto neighbor = acquire(stats.tile_columns, stats.tile_rows, PixelFormat::Rg16Float);
    if (!neighbor) {
        return stage_failed("neighbor_max", std::move(neighbor.error()));
    }
    if (auto expanded = expand_neighbor_max(tile->image(), neighbor->image(), m_parallel); !expanded) {
        return stage_failed("neighbor_max", std::move(expanded.error()));
    }
    if (auto released = tile->release(); !released) {
        return stage_failed("neighbor_max", std::move(released.error()));
    }

    // Reconstruction into a staging image
    auto staged = acquire(width, height, PixelFormat::Rgba32Float);
    if (!staged) {
        return stage_failed("reconstruction", std::move(staged.error()));
    }
    if (auto rebuilt = reconstruct(source, velocity->image(), neighbor->image(),
                                   ReconstructionParams::from(params, frame_id), staged->image(), m_parallel);
        !rebuilt) {
        return stage_failed("reconstruction", std::move(rebuilt.error()));
    }
    if (auto released = velocity->release(); !released) {
        return stage_failed("reconstruction", std::move(released.error()));
    }
    if (auto released = neighbor->release(); !released) {
        return stage_failed("reconstruction", std::move(released.error()));
    }

    // Accumulation, computed before anything visible changes
    auto step = m_accumulator.prepare(source, staged->image(), params, frame_id, m_parallel);
    if (!step) {
        return stage_failed("accumulation", std::move(step.error()));
    }
    stats.accumulation = step->kind;

    const Image& result = step->kind == AccumulationStep::Kind::Disabled ? staged->image() : step->output;
    if (auto copied = destination.copy_from(result); !copied) {
        return stage_failed("commit", std::move(copied.error()));
    }

    m_accumulator.commit(std::move(*step));
    m_last_params = params;
    stats.elapsed_us = scope.elapsed_us();
    m_last_stats = stats;

    streak_core::blur_logger()->trace("Frame {} blurred: {}x{} tiles of {}px, {} loops, accumulation {}",
                                      frame_id, stats.tile_columns, stats.tile_rows, params.tile_size,
                                      params.loop_count, accumulation_step_name(stats.accumulation));
    return Ok();
}

} // namespace streak_blur

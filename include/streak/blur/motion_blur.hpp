#pragma once

/// @file motion_blur.hpp
/// @brief Per-frame motion blur pipeline

#include "accumulator.hpp"
#include "config.hpp"
#include "frame_source.hpp"
#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/scratch_pool.hpp>
#include <cstdint>
#include <optional>

namespace streak_blur {

using streak_image::IScratchAllocator;

/// Counters for the last render
struct RenderStats {
    std::uint32_t tile_columns = 0;
    std::uint32_t tile_rows = 0;
    std::uint32_t scratch_images = 0;
    AccumulationStep::Kind accumulation = AccumulationStep::Kind::Disabled;
    std::int64_t elapsed_us = 0;
};

// =============================================================================
// MotionBlur
// =============================================================================

/// Tile-based motion blur.
///
/// Each render runs packing, three tile reductions, the neighbor max
/// expansion, reconstruction and optional accumulation. Intermediate images
/// come from the scratch allocator and are returned before render() does.
///
/// Not thread-safe: one render at a time per instance.
class MotionBlur {
public:
    explicit MotionBlur(IScratchAllocator& allocator, MotionBlurSettings settings = {},
                        streak_core::ParallelConfig parallel = {});

    MotionBlur(const MotionBlur&) = delete;
    MotionBlur& operator=(const MotionBlur&) = delete;

    /// Blur `source` into `destination`.
    ///
    /// On error neither `destination` nor the accumulation history changes.
    streak_core::Result<void> render(const Image& source, Image& destination, const IFrameSource& host);

    // =========================================================================
    // Settings
    // =========================================================================

    [[nodiscard]] const MotionBlurSettings& settings() const noexcept { return m_settings; }
    void set_settings(const MotionBlurSettings& settings) { m_settings = settings; }

    [[nodiscard]] const streak_core::ParallelConfig& parallel_config() const noexcept { return m_parallel; }
    void set_parallel_config(const streak_core::ParallelConfig& parallel) { m_parallel = parallel; }

    // =========================================================================
    // State
    // =========================================================================

    /// Drop the accumulation history
    void reset() { m_accumulator.reset(); }

    /// Notify a change of output size; drops a history of another size
    void resize(std::uint32_t width, std::uint32_t height) { m_accumulator.resize(width, height); }

    [[nodiscard]] const Accumulator& accumulator() const noexcept { return m_accumulator; }

    /// Parameters resolved by the last successful render
    [[nodiscard]] const std::optional<ResolvedParams>& last_params() const noexcept { return m_last_params; }

    [[nodiscard]] const RenderStats& last_stats() const noexcept { return m_last_stats; }

private:
    streak_core::Result<void> validate(const Image& source, const Image& destination,
                                       const IFrameSource& host) const;

    IScratchAllocator* m_allocator;
    MotionBlurSettings m_settings;
    streak_core::ParallelConfig m_parallel;
    Accumulator m_accumulator;
    std::optional<ResolvedParams> m_last_params;
    RenderStats m_last_stats;
};

} // namespace streak_blur

#pragma once

/// @file accumulator.hpp
/// @brief Temporal accumulation of reconstructed frames

#include "config.hpp"
#include <streak/core/error.hpp>
#include <streak/core/parallel.hpp>
#include <streak/image/image.hpp>
#include <cstdint>
#include <optional>

namespace streak_blur {

using streak_image::Image;

/// Result of one accumulation step, computed without touching the
/// accumulator so that a failed render leaves its history intact.
struct AccumulationStep {
    enum class Kind : std::uint8_t {
        Disabled,     ///< Accumulation off; history is dropped on commit
        Repeat,       ///< Same frame id as the last advance; history reused as is
        Initialized,  ///< History (re)created from the reconstruction
        Blended,      ///< History blended with the reconstruction
    };

    Kind kind = Kind::Disabled;
    std::uint64_t frame_id = 0;
    Image output;   ///< Color to present (empty when Disabled)
    Image history;  ///< New history (empty when Disabled or Repeat)

    [[nodiscard]] bool advances() const noexcept { return kind == Kind::Initialized || kind == Kind::Blended; }
};

[[nodiscard]] const char* accumulation_step_name(AccumulationStep::Kind kind) noexcept;

// =============================================================================
// Accumulator
// =============================================================================

/// Owns the full-resolution history buffer.
///
/// The history advances at most once per frame id: repeated renders of the
/// same frame present the stored history again instead of blending twice.
class Accumulator {
public:
    Accumulator() = default;

    /// Compute this frame's output.
    /// @param source Unblurred frame; its alpha is carried to the output
    /// @param reconstruction Reconstructed frame, same size as source
    [[nodiscard]] streak_core::Result<AccumulationStep> prepare(
        const Image& source, const Image& reconstruction, const ResolvedParams& params,
        std::uint64_t frame_id, const streak_core::ParallelConfig& parallel = {}) const;

    /// Adopt a prepared step
    void commit(AccumulationStep&& step);

    /// Drop the history; the next enabled frame starts over
    void reset();

    /// Drop the history unless it already has the given size
    void resize(std::uint32_t width, std::uint32_t height);

    [[nodiscard]] bool has_history() const noexcept { return !m_history.empty(); }
    [[nodiscard]] const Image& history() const noexcept { return m_history; }
    [[nodiscard]] std::optional<std::uint64_t> last_frame_id() const noexcept { return m_last_frame_id; }

private:
    Image m_history;
    std::optional<std::uint64_t> m_last_frame_id;
};

} // namespace streak_blur

/// @file accumulator.cpp
/// @brief History blending with single advance per frame

#include <streak/blur/accumulator.hpp>
#include <streak/math/types.hpp>
#include <algorithm>
#include <utility>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::Result;
using streak_image::PixelFormat;
using streak_math::Vec3;
using streak_math::Vec4;

namespace {

constexpr PixelFormat HISTORY_FORMAT = PixelFormat::Rgba16Float;

/// History color with the source alpha
void present(const Image& history, const Image& source, Image& output,
             const streak_core::ParallelConfig& parallel) {
    output.reset(source.width(), source.height(), PixelFormat::Rgba32Float);
    streak_core::parallel_for_rows(parallel, 0, source.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
        for (std::uint32_t y = y_begin; y < y_end; ++y) {
            for (std::uint32_t x = 0; x < source.width(); ++x) {
                output.store(x, y, Vec4(Vec3(history.load(x, y)), source.load(x, y).a));
            }
        }
    });
}

} // anonymous namespace

const char* accumulation_step_name(AccumulationStep::Kind kind) noexcept {
    switch (kind) {
        case AccumulationStep::Kind::Disabled: return "disabled";
        case AccumulationStep::Kind::Repeat: return "repeat";
        case AccumulationStep::Kind::Initialized: return "initialized";
        case AccumulationStep::Kind::Blended: return "blended";
        default: return "unknown";
    }
}

Result<AccumulationStep> Accumulator::prepare(const Image& source, const Image& reconstruction,
                                              const ResolvedParams& params, std::uint64_t frame_id,
                                              const streak_core::ParallelConfig& parallel) const {
    if (!reconstruction.same_size(source)) {
        return Err<AccumulationStep>(ImageError::size_mismatch(source.width(), source.height(),
                                                               reconstruction.width(), reconstruction.height()));
    }

    AccumulationStep step;
    step.frame_id = frame_id;

    if (!params.accumulation_enabled()) {
        step.kind = AccumulationStep::Kind::Disabled;
        return step;
    }

    const bool history_fits = has_history() && m_history.same_size(source);

    if (history_fits && m_last_frame_id == frame_id) {
        step.kind = AccumulationStep::Kind::Repeat;
        present(m_history, source, step.output, parallel);
        return step;
    }

    step.history.reset(source.width(), source.height(), HISTORY_FORMAT);

    if (!history_fits) {
        step.kind = AccumulationStep::Kind::Initialized;
        streak_core::parallel_for_rows(parallel, 0, source.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
            for (std::uint32_t y = y_begin; y < y_end; ++y) {
                for (std::uint32_t x = 0; x < source.width(); ++x) {
                    step.history.store(x, y, Vec4(Vec3(reconstruction.load(x, y)), 1.0f));
                }
            }
        });
    } else {
        step.kind = AccumulationStep::Kind::Blended;
        const float ratio = params.accumulation_ratio;
        const bool alpha_weight = params.accumulation_weight == AccumulationWeight::ReconstructionAlpha;

        streak_core::parallel_for_rows(parallel, 0, source.height(), [&](std::uint32_t y_begin, std::uint32_t y_end) {
            for (std::uint32_t y = y_begin; y < y_end; ++y) {
                for (std::uint32_t x = 0; x < source.width(); ++x) {
                    const Vec4& current = reconstruction.load(x, y);
                    float current_weight = 1.0f - ratio;
                    if (alpha_weight) {
                        current_weight = std::max(current_weight, std::clamp(current.a, 0.0f, 1.0f));
                    }
                    Vec3 blended = Vec3(m_history.load(x, y)) * (1.0f - current_weight) + Vec3(current) * current_weight;
                    step.history.store(x, y, Vec4(blended, 1.0f));
                }
            }
        });
    }

    present(step.history, source, step.output, parallel);
    return step;
}

void Accumulator::commit(AccumulationStep&& step) {
    switch (step.kind) {
        case AccumulationStep::Kind::Disabled:
            reset();
            break;
        case AccumulationStep::Kind::Repeat:
            break;
        case AccumulationStep::Kind::Initialized:
        case AccumulationStep::Kind::Blended:
            m_history = std::move(step.history);
            m_last_frame_id = step.frame_id;
            break;
    }
}

void Accumulator::reset() {
    m_history = Image();
    m_last_frame_id.reset();
}

void Accumulator::resize(std::uint32_t width, std::uint32_t height) {
    if (has_history() && (m_history.width() != width || m_history.height() != height)) {
        reset();
    }
}

} // namespace streak_blur

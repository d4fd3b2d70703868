#pragma once

/// @file frame_clock.hpp
/// @brief Frame counter with smoothed delta time

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>

namespace streak_blur {

// =============================================================================
// FrameClock
// =============================================================================

/// Counts displayed frames and keeps an exponentially smoothed frame time.
class FrameClock {
public:
    using Clock = std::chrono::steady_clock;

    /// @param smoothing Weight of the newest sample, in (0, 1]
    /// @param initial_delta Smoothed value before the first sample
    explicit FrameClock(float smoothing = 0.2f, float initial_delta = 1.0f / 60.0f)
        : m_smoothing(smoothing > 0.0f && smoothing <= 1.0f ? smoothing : 0.2f)
        , m_initial_delta(initial_delta)
        , m_smoothed_delta(initial_delta) {}

    /// Advance one frame with an explicit delta time.
    /// Non-finite or non-positive deltas advance the id but leave the smoothing untouched.
    /// @return The new frame id
    std::uint64_t advance(float delta_seconds) {
        ++m_frame_id;
        if (std::isfinite(delta_seconds) && delta_seconds > 0.0f) {
            m_last_delta = delta_seconds;
            m_elapsed += delta_seconds;
            if (m_samples == 0) {
                m_smoothed_delta = delta_seconds;
            } else {
                m_smoothed_delta += (delta_seconds - m_smoothed_delta) * m_smoothing;
            }
            ++m_samples;
        }
        return m_frame_id;
    }

    /// Advance one frame using wall-clock time since the previous tick
    std::uint64_t tick() {
        auto now = Clock::now();
        float delta = 0.0f;
        if (m_last_tick) {
            delta = std::chrono::duration<float>(now - *m_last_tick).count();
        }
        m_last_tick = now;
        return advance(delta);
    }

    [[nodiscard]] std::uint64_t frame_id() const noexcept { return m_frame_id; }
    [[nodiscard]] float delta_time() const noexcept { return m_last_delta; }
    [[nodiscard]] float smoothed_delta_time() const noexcept { return m_smoothed_delta; }
    [[nodiscard]] double elapsed() const noexcept { return m_elapsed; }

    void reset() {
        m_frame_id = 0;
        m_samples = 0;
        m_last_delta = 0.0f;
        m_smoothed_delta = m_initial_delta;
        m_elapsed = 0.0;
        m_last_tick.reset();
    }

private:
    float m_smoothing;
    float m_initial_delta;
    float m_smoothed_delta;
    float m_last_delta = 0.0f;
    double m_elapsed = 0.0;
    std::uint64_t m_frame_id = 0;
    std::uint64_t m_samples = 0;
    std::optional<Clock::time_point> m_last_tick;
};

} // namespace streak_blur

/// @file frame_source.cpp
/// @brief HostFrame clock synchronization

#include <streak/blur/frame_source.hpp>
#include <streak/blur/frame_clock.hpp>

namespace streak_blur {

void HostFrame::sync(const FrameClock& clock) {
    m_frame_id = clock.frame_id();
    m_delta_time = clock.smoothed_delta_time();
}

} // namespace streak_blur

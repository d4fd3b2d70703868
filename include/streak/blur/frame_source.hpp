#pragma once

/// @file frame_source.hpp
/// @brief What the host provides for each rendered frame

#include "depth.hpp"
#include <streak/image/image.hpp>
#include <streak/math/types.hpp>
#include <cstdint>
#include <optional>
#include <utility>

namespace streak_blur {

using streak_image::Image;
using streak_math::Mat4;

/// Current and previous view-projection of the camera
struct CameraTransforms {
    Mat4 view_projection{1.0f};
    Mat4 previous_view_projection{1.0f};
};

// =============================================================================
// IFrameSource
// =============================================================================

/// Host hook queried once per render.
///
/// Images use the top-left texel as origin. Motion vectors hold the UV-space
/// displacement of each pixel since the previous frame (current - previous)
/// in their red and green channels.
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /// Device depth in the red channel; required
    [[nodiscard]] virtual const Image* depth() const = 0;

    /// Per-pixel motion vectors, nullptr when the host has none
    [[nodiscard]] virtual const Image* motion_vectors() const = 0;

    /// Camera matrices used to derive motion when no motion vectors exist
    [[nodiscard]] virtual std::optional<CameraTransforms> camera_transforms() const = 0;

    [[nodiscard]] virtual DepthParams depth_params() const = 0;

    /// Monotonically increasing id of the displayed frame
    [[nodiscard]] virtual std::uint64_t current_frame_id() const = 0;

    /// Smoothed frame time in seconds
    [[nodiscard]] virtual float delta_time() const = 0;
};

class FrameClock;

// =============================================================================
// HostFrame
// =============================================================================

/// IFrameSource backed by images the caller hands over
class HostFrame : public IFrameSource {
public:
    HostFrame() = default;
    explicit HostFrame(Image depth) : m_depth(std::move(depth)) {}

    void set_depth(Image depth) { m_depth = std::move(depth); }
    void set_motion_vectors(Image motion) { m_motion = std::move(motion); }
    void clear_motion_vectors() { m_motion.reset(); }
    void set_camera_transforms(const CameraTransforms& transforms) { m_cameras = transforms; }
    void clear_camera_transforms() { m_cameras.reset(); }
    void set_depth_params(const DepthParams& params) { m_depth_params = params; }

    /// Set frame id and delta time directly
    void set_frame(std::uint64_t frame_id, float delta_time) {
        m_frame_id = frame_id;
        m_delta_time = delta_time;
    }

    /// Take frame id and smoothed delta time from a clock
    void sync(const FrameClock& clock);

    [[nodiscard]] Image& depth_image() noexcept { return m_depth; }
    [[nodiscard]] Image* motion_image() noexcept { return m_motion ? &*m_motion : nullptr; }

    // IFrameSource
    [[nodiscard]] const Image* depth() const override { return m_depth.empty() ? nullptr : &m_depth; }
    [[nodiscard]] const Image* motion_vectors() const override { return m_motion ? &*m_motion : nullptr; }
    [[nodiscard]] std::optional<CameraTransforms> camera_transforms() const override { return m_cameras; }
    [[nodiscard]] DepthParams depth_params() const override { return m_depth_params; }
    [[nodiscard]] std::uint64_t current_frame_id() const override { return m_frame_id; }
    [[nodiscard]] float delta_time() const override { return m_delta_time; }

private:
    Image m_depth;
    std::optional<Image> m_motion;
    std::optional<CameraTransforms> m_cameras;
    DepthParams m_depth_params;
    std::uint64_t m_frame_id = 0;
    float m_delta_time = 1.0f / 60.0f;
};

} // namespace streak_blur

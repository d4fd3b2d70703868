/// @file packer.cpp
/// @brief Velocity/depth packing pass

#include <streak/blur/packer.hpp>
#include <streak/blur/camera_motion.hpp>
#include <streak/blur/velocity_codec.hpp>
#include <streak/math/utils.hpp>

namespace streak_blur {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::InputError;
using streak_core::Ok;
using streak_core::Result;
using streak_image::PixelFormat;

Vec2 exposure_velocity(const Vec2& motion_uv, const ResolvedParams& params) noexcept {
    // Half the exposure lies on each side of the pixel
    Vec2 frame_size(static_cast<float>(params.width), static_cast<float>(params.height));
    Vec2 velocity = motion_uv * (params.velocity_scale * 0.5f) * frame_size;
    return streak_math::clamp_length(velocity, static_cast<float>(params.max_blur_pixels));
}

Result<void> pack_velocity(const IFrameSource& host, const ResolvedParams& params,
                           Image& velocity_field, const streak_core::ParallelConfig& parallel) {
    const Image* depth = host.depth();
    if (!depth) {
        return Err(InputError::missing_depth());
    }
    if (depth->width() != params.width || depth->height() != params.height) {
        return Err(InputError::size_mismatch("Depth image"));
    }
    if (velocity_field.width() != params.width || velocity_field.height() != params.height) {
        return Err(ImageError::size_mismatch(params.width, params.height,
                                             velocity_field.width(), velocity_field.height()));
    }
    if (velocity_field.format() != PixelFormat::Rgb10A2Unorm) {
        return Err(ImageError::format_mismatch(pixel_format_name(PixelFormat::Rgb10A2Unorm),
                                               pixel_format_name(velocity_field.format())));
    }

    const Image* motion = host.motion_vectors();
    if (motion && !motion->same_size(*depth)) {
        return Err(InputError::size_mismatch("Motion vector image"));
    }

    const DepthParams depth_params = host.depth_params();
    const auto cameras = host.camera_transforms();
    const bool reproject = !motion && cameras.has_value();

    Mat4 inverse_view_projection(1.0f);
    Mat4 previous_view_projection(1.0f);
    if (reproject) {
        inverse_view_projection = glm::inverse(cameras->view_projection);
        previous_view_projection = cameras->previous_view_projection;
    }

    const float radius = params.codec_radius();
    const float inv_width = 1.0f / static_cast<float>(params.width);
    const float inv_height = 1.0f / static_cast<float>(params.height);

    streak_core::parallel_for_rows(parallel, 0, params.height, [&](std::uint32_t y_begin, std::uint32_t y_end) {
        for (std::uint32_t y = y_begin; y < y_end; ++y) {
            for (std::uint32_t x = 0; x < params.width; ++x) {
                float raw_depth = depth->load(x, y).r;

                Vec2 motion_uv(0.0f);
                if (motion) {
                    const Vec4& texel = motion->load(x, y);
                    motion_uv = Vec2(texel.r, texel.g);
                } else if (reproject) {
                    Vec2 uv((static_cast<float>(x) + 0.5f) * inv_width, (static_cast<float>(y) + 0.5f) * inv_height);
                    motion_uv = camera_motion(uv, raw_depth, depth_params,
                                              inverse_view_projection, previous_view_projection);
                }

                Vec2 velocity = exposure_velocity(motion_uv, params);
                float linear_depth = linearize_depth(raw_depth, depth_params);
                velocity_field.store(x, y, pack_velocity_depth(velocity, linear_depth, radius));
            }
        }
    });

    return Ok();
}

} // namespace streak_blur

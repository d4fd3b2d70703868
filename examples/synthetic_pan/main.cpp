/// @file main.cpp
/// @brief Synthetic panning demo
///
/// Renders a striped frame sliding to the right, runs a few frames through
/// MotionBlur with accumulation and logs what each frame did.
///
/// Usage: synthetic_pan [settings.json] [log-level]

#include <streak/streak.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <string>

namespace {

constexpr std::uint32_t FRAME_WIDTH = 320;
constexpr std::uint32_t FRAME_HEIGHT = 180;
constexpr std::uint32_t STRIPE_WIDTH = 16;
constexpr float PAN_PIXELS_PER_FRAME = 12.0f;
constexpr int FRAME_COUNT = 6;

using streak_image::Image;
using streak_image::PixelFormat;
using streak_math::Vec4;

/// Vertical stripes shifted by `offset` pixels
Image make_stripes(float offset) {
    Image image(FRAME_WIDTH, FRAME_HEIGHT, PixelFormat::Rgba32Float);
    for (std::uint32_t y = 0; y < FRAME_HEIGHT; ++y) {
        for (std::uint32_t x = 0; x < FRAME_WIDTH; ++x) {
            float u = std::fmod(static_cast<float>(x) - offset + 1000.0f * STRIPE_WIDTH, 2.0f * STRIPE_WIDTH);
            float value = u < static_cast<float>(STRIPE_WIDTH) ? 0.9f : 0.1f;
            image.store(x, y, Vec4(value, value * 0.8f, value * 0.6f, 1.0f));
        }
    }
    return image;
}

/// Mean absolute difference between horizontally adjacent pixels
float edge_energy(const Image& image) {
    double sum = 0.0;
    for (std::uint32_t y = 0; y < image.height(); ++y) {
        for (std::uint32_t x = 1; x < image.width(); ++x) {
            sum += std::abs(image.load(x, y).r - image.load(x - 1, y).r);
        }
    }
    return static_cast<float>(sum / (static_cast<double>(image.width() - 1) * image.height()));
}

} // namespace

int main(int argc, char* argv[]) {
    streak_core::LogConfig log_config;
    if (argc > 2) {
        if (auto level = streak_core::parse_log_level(argv[2])) {
            log_config.level = *level;
        } else {
            STREAK_LOG_WARN("Unknown log level '{}', using info", argv[2]);
        }
    }
    streak_core::configure_logging(log_config);

    STREAK_LOG_INFO("=== Synthetic Pan Demo ===");

    streak_blur::MotionBlurSettings settings;
    settings.max_blur_radius = 8.0f;
    settings.accumulation_ratio = 0.4f;

    if (argc > 1) {
        auto loaded = streak_blur::load_settings(argv[1]);
        if (!loaded) {
            STREAK_LOG_ERROR("Failed to load settings: {}", streak_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        settings = *loaded;
        STREAK_LOG_INFO("Settings loaded from {}", argv[1]);
    }
    STREAK_LOG_INFO("Settings: {}", streak_blur::settings_to_json(settings).dump());

    streak_image::ScratchImagePool pool;
    streak_blur::MotionBlur blur(pool, settings);
    streak_blur::FrameClock clock;

    // Uniform motion: the whole frame pans right
    const float motion_uv = PAN_PIXELS_PER_FRAME / static_cast<float>(FRAME_WIDTH);

    streak_blur::HostFrame host(Image(FRAME_WIDTH, FRAME_HEIGHT, PixelFormat::R32Float, Vec4(0.5f)));
    host.set_motion_vectors(Image(FRAME_WIDTH, FRAME_HEIGHT, PixelFormat::Rg16Float, Vec4(motion_uv, 0.0f, 0.0f, 1.0f)));

    Image output(FRAME_WIDTH, FRAME_HEIGHT);

    for (int frame = 0; frame < FRAME_COUNT; ++frame) {
        clock.advance(1.0f / 60.0f);
        host.sync(clock);

        Image source = make_stripes(PAN_PIXELS_PER_FRAME * static_cast<float>(frame));

        auto rendered = blur.render(source, output, host);
        if (!rendered) {
            STREAK_LOG_ERROR("Frame {} failed: {}", clock.frame_id(), streak_core::build_error_chain(rendered.error()));
            return EXIT_FAILURE;
        }

        const auto& stats = blur.last_stats();
        STREAK_LOG_INFO("Frame {}: {}x{} tiles, {} scratch images, accumulation {}, {} us, edge energy {:.4f} -> {:.4f}",
                     clock.frame_id(), stats.tile_columns, stats.tile_rows, stats.scratch_images,
                     streak_blur::accumulation_step_name(stats.accumulation), stats.elapsed_us,
                     edge_energy(source), edge_energy(output));
    }

    // Presenting the same frame again reuses the history
    auto repeated = blur.render(make_stripes(PAN_PIXELS_PER_FRAME * (FRAME_COUNT - 1)), output, host);
    if (!repeated) {
        STREAK_LOG_ERROR("Repeat failed: {}", streak_core::build_error_chain(repeated.error()));
        return EXIT_FAILURE;
    }
    STREAK_LOG_INFO("Repeat of frame {}: accumulation {}", clock.frame_id(),
                 streak_blur::accumulation_step_name(blur.last_stats().accumulation));

    const auto& pool_stats = pool.stats();
    STREAK_LOG_INFO("Scratch pool: {} acquires, {} reused, peak {} KiB",
                 pool_stats.acquire_count, pool_stats.reuse_count, pool_stats.peak_live_bytes / 1024);

    streak_core::shutdown_logging();
    return EXIT_SUCCESS;
}

// streak_blur MotionBlur pipeline tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <streak/blur/motion_blur.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace streak_blur;
using Catch::Approx;
using streak_image::PixelFormat;
using streak_image::ScratchImagePool;
using streak_image::ScratchPoolConfig;
using streak_math::Vec2;
using streak_math::Vec3;
using streak_math::Vec4;

namespace {

constexpr std::uint32_t WIDTH = 96;
constexpr std::uint32_t HEIGHT = 100;

/// Black frame with a white vertical bar over columns [40, 56)
Image bar_frame() {
    Image image(WIDTH, HEIGHT, PixelFormat::Rgba32Float, Vec4(0.0f, 0.0f, 0.0f, 1.0f));
    for (std::uint32_t y = 0; y < HEIGHT; ++y) {
        for (std::uint32_t x = 40; x < 56; ++x) {
            image.store(x, y, Vec4(1.0f));
        }
    }
    return image;
}

/// Horizontal gradient, distinct per pixel
Image gradient_frame() {
    Image image(WIDTH, HEIGHT, PixelFormat::Rgba32Float);
    for (std::uint32_t y = 0; y < HEIGHT; ++y) {
        for (std::uint32_t x = 0; x < WIDTH; ++x) {
            image.store(x, y, Vec4(static_cast<float>(x) / WIDTH, static_cast<float>(y) / HEIGHT, 0.5f, 0.75f));
        }
    }
    return image;
}

HostFrame still_host(std::uint64_t frame_id = 1) {
    HostFrame host(Image(WIDTH, HEIGHT, PixelFormat::R32Float, Vec4(0.5f)));
    host.set_frame(frame_id, 1.0f / 60.0f);
    return host;
}

/// Host whose motion vectors move every pixel `pixels` to the right over one exposure
HostFrame panning_host(float pixels, std::uint64_t frame_id = 1) {
    HostFrame host = still_host(frame_id);
    // Exposure velocity is uv * 0.5 * width at a velocity scale of 1
    float motion_uv = pixels * 2.0f / static_cast<float>(WIDTH);
    host.set_motion_vectors(Image(WIDTH, HEIGHT, PixelFormat::Rg16Float, Vec4(motion_uv, 0.0f, 0.0f, 1.0f)));
    return host;
}

MotionBlurSettings wide_settings() {
    MotionBlurSettings settings;
    settings.max_blur_radius = 10.0f;  // 10 px at 100 px height
    return settings;
}

} // anonymous namespace

TEST_CASE("MotionBlur leaves a still frame untouched", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlur blur(pool, wide_settings());

    Image source = gradient_frame();
    Image destination(WIDTH, HEIGHT);
    auto host = still_host();

    REQUIRE(blur.render(source, destination, host).is_ok());
    REQUIRE(destination.texels() == source.texels());

    SECTION("every scratch image is returned") {
        REQUIRE(pool.live_count() == 0);
        REQUIRE(pool.stats().acquire_count == 6);
        REQUIRE(pool.stats().release_count == 6);
        REQUIRE(blur.last_stats().scratch_images == 6);
    }

    SECTION("frame layout") {
        REQUIRE(blur.last_params().has_value());
        REQUIRE(blur.last_params()->tile_size == 16);
        REQUIRE(blur.last_stats().tile_columns == WIDTH / 16);
        REQUIRE(blur.last_stats().tile_rows == HEIGHT / 16);
    }

    SECTION("a second frame reuses scratch storage") {
        auto next = still_host(2);
        REQUIRE(blur.render(source, destination, next).is_ok());
        REQUIRE(pool.stats().reuse_count > 0);
    }
}

TEST_CASE("MotionBlur leaves a tall still frame untouched", "[blur][pipeline]") {
    // 10% of 4320 px gives a 432 px radius, where the stored zero level is
    // well above half a pixel before it is snapped
    constexpr std::uint32_t tall_width = 8;
    constexpr std::uint32_t tall_height = 4320;

    Image source(tall_width, tall_height, PixelFormat::Rgba32Float);
    for (std::uint32_t y = 0; y < tall_height; ++y) {
        for (std::uint32_t x = 0; x < tall_width; ++x) {
            source.store(x, y, Vec4(static_cast<float>(x) / tall_width,
                                    static_cast<float>(y % 97) / 97.0f, 0.25f, 1.0f));
        }
    }

    HostFrame host(Image(tall_width, tall_height, PixelFormat::R32Float, Vec4(0.5f)));
    host.set_frame(1, 1.0f / 60.0f);

    ScratchImagePool pool;
    MotionBlur blur(pool, wide_settings());
    Image destination(tall_width, tall_height);

    REQUIRE(blur.render(source, destination, host).is_ok());
    REQUIRE(blur.last_params()->max_blur_pixels == 432);
    REQUIRE(destination.texels() == source.texels());
}

TEST_CASE("MotionBlur smears along horizontal motion", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlur blur(pool, wide_settings());

    Image source = bar_frame();
    Image destination(WIDTH, HEIGHT);
    auto host = panning_host(8.0f);

    REQUIRE(blur.render(source, destination, host).is_ok());

    const std::uint32_t row = HEIGHT / 2;

    SECTION("light spreads past both bar edges") {
        REQUIRE(destination.load(38, row).r > 0.01f);
        REQUIRE(destination.load(57, row).r > 0.01f);
    }

    SECTION("far pixels and the bar centre keep their color") {
        REQUIRE(destination.load(10, row).r == Approx(0.0f).margin(1e-6));
        REQUIRE(destination.load(85, row).r == Approx(0.0f).margin(1e-6));
        REQUIRE(destination.load(47, row).r > 0.9f);
    }

    SECTION("rows are blurred alike") {
        for (std::uint32_t y : {20u, 40u, 70u}) {
            REQUIRE(destination.load(38, y).r > 0.01f);
            REQUIRE(destination.load(10, y).r == Approx(0.0f).margin(1e-6));
        }
    }

    SECTION("alpha comes from the source") {
        REQUIRE(destination.load(40, row).a == 1.0f);
    }
}

TEST_CASE("MotionBlur derives motion from camera transforms", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlur blur(pool, wide_settings());

    Image source = bar_frame();
    Image destination(WIDTH, HEIGHT);

    DepthParams depth_params;
    depth_params.near_plane = 0.1f;
    depth_params.far_plane = 100.0f;

    Mat4 projection = glm::perspective(glm::radians(60.0f), static_cast<float>(WIDTH) / HEIGHT,
                                       depth_params.near_plane, depth_params.far_plane);
    auto view_from = [&](float x) {
        return glm::lookAt(Vec3(x, 0.0f, 0.0f), Vec3(x, 0.0f, -1.0f), Vec3(0.0f, 1.0f, 0.0f));
    };

    // Everything sits on a plane 5 units ahead
    Vec4 clip = projection * Vec4(0.0f, 0.0f, -5.0f, 1.0f);

    HostFrame host(Image(WIDTH, HEIGHT, PixelFormat::R32Float, Vec4(clip.z / clip.w)));
    host.set_depth_params(depth_params);
    host.set_frame(1, 1.0f / 60.0f);

    SECTION("moving camera blurs") {
        host.set_camera_transforms(CameraTransforms{projection * view_from(0.5f), projection * view_from(0.0f)});
        REQUIRE(blur.render(source, destination, host).is_ok());
        REQUIRE(destination.texels() != source.texels());
    }

    SECTION("still camera does not") {
        host.set_camera_transforms(CameraTransforms{projection * view_from(0.5f), projection * view_from(0.5f)});
        REQUIRE(blur.render(source, destination, host).is_ok());
        REQUIRE(destination.texels() == source.texels());
    }
}

TEST_CASE("MotionBlur output does not depend on worker count", "[blur][pipeline]") {
    ScratchImagePool pool;
    Image source = bar_frame();
    auto host = panning_host(6.0f);

    streak_core::ParallelConfig workers;
    workers.worker_count = 4;
    workers.min_rows_per_band = 1;

    MotionBlur serial(pool, wide_settings(), streak_core::ParallelConfig::inline_only());
    MotionBlur threaded(pool, wide_settings(), workers);

    Image a(WIDTH, HEIGHT);
    Image b(WIDTH, HEIGHT);
    REQUIRE(serial.render(source, a, host).is_ok());
    REQUIRE(threaded.render(source, b, host).is_ok());
    REQUIRE(a.texels() == b.texels());
}

TEST_CASE("MotionBlur failures leave the destination untouched", "[blur][pipeline]") {
    Image source = bar_frame();
    const Vec4 sentinel(0.25f, 0.5f, 0.75f, 1.0f);
    Image destination(WIDTH, HEIGHT, PixelFormat::Rgba32Float, sentinel);

    SECTION("missing depth") {
        ScratchImagePool pool;
        MotionBlur blur(pool, wide_settings());
        HostFrame host;

        auto result = blur.render(source, destination, host);
        REQUIRE(result.is_err());
        const auto* input = result.error().as<streak_core::InputError>();
        REQUIRE(input != nullptr);
        REQUIRE(input->kind == streak_core::InputError::Kind::MissingDepth);
        REQUIRE(destination.load(10, 10) == sentinel);
    }

    SECTION("mismatched motion vectors") {
        ScratchImagePool pool;
        MotionBlur blur(pool, wide_settings());
        auto host = still_host();
        host.set_motion_vectors(Image(WIDTH / 2, HEIGHT, PixelFormat::Rg16Float));

        auto result = blur.render(source, destination, host);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<streak_core::InputError>());
    }

    SECTION("mismatched destination") {
        ScratchImagePool pool;
        MotionBlur blur(pool, wide_settings());
        Image small(WIDTH / 2, HEIGHT / 2);
        auto host = still_host();

        auto result = blur.render(source, small, host);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<streak_core::ImageError>());
    }

    SECTION("scratch exhaustion") {
        ScratchPoolConfig config;
        config.max_live_images = 2;
        ScratchImagePool pool(config);
        MotionBlur blur(pool, wide_settings());
        auto host = panning_host(8.0f);

        auto result = blur.render(source, destination, host);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == streak_core::ErrorCode::OutOfMemory);
        const std::string* stage = result.error().get_context("stage");
        REQUIRE(stage != nullptr);
        REQUIRE(*stage == "tile_max_8");

        REQUIRE(destination.load(47, 50) == sentinel);
        REQUIRE(pool.live_count() == 0);
        REQUIRE_FALSE(blur.last_params().has_value());
    }
}

TEST_CASE("MotionBlur accumulation", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlurSettings settings = wide_settings();
    settings.accumulation_ratio = 0.5f;
    MotionBlur blur(pool, settings);

    Image source = bar_frame();
    Image first(WIDTH, HEIGHT);
    Image repeat(WIDTH, HEIGHT);

    auto host = panning_host(8.0f, 10);
    REQUIRE(blur.render(source, first, host).is_ok());
    REQUIRE(blur.last_stats().accumulation == AccumulationStep::Kind::Initialized);

    SECTION("same frame id presents the same image") {
        REQUIRE(blur.render(source, repeat, host).is_ok());
        REQUIRE(blur.last_stats().accumulation == AccumulationStep::Kind::Repeat);
        REQUIRE(repeat.texels() == first.texels());
    }

    SECTION("next frame blends") {
        host.set_frame(11, 1.0f / 60.0f);
        REQUIRE(blur.render(source, repeat, host).is_ok());
        REQUIRE(blur.last_stats().accumulation == AccumulationStep::Kind::Blended);
        REQUIRE(blur.accumulator().last_frame_id() == std::optional<std::uint64_t>(11));
    }

    SECTION("failed render keeps the history") {
        HostFrame broken;
        broken.set_frame(11, 1.0f / 60.0f);
        REQUIRE(blur.render(source, repeat, broken).is_err());
        REQUIRE(blur.accumulator().last_frame_id() == std::optional<std::uint64_t>(10));
    }

    SECTION("turning accumulation off drops the history") {
        settings.accumulation_ratio = 0.0f;
        blur.set_settings(settings);
        host.set_frame(11, 1.0f / 60.0f);
        REQUIRE(blur.render(source, repeat, host).is_ok());
        REQUIRE(blur.last_stats().accumulation == AccumulationStep::Kind::Disabled);
        REQUIRE_FALSE(blur.accumulator().has_history());
    }

    SECTION("reset and resize") {
        blur.resize(WIDTH, HEIGHT);
        REQUIRE(blur.accumulator().has_history());
        blur.reset();
        REQUIRE_FALSE(blur.accumulator().has_history());
    }
}

TEST_CASE("MotionBlur debug views", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlurSettings settings = wide_settings();
    settings.debug_mode = DebugMode::Depth;
    settings.accumulation_ratio = 0.5f;
    MotionBlur blur(pool, settings);

    Image source = bar_frame();
    Image destination(WIDTH, HEIGHT);

    HostFrame host(Image(WIDTH, HEIGHT, PixelFormat::R32Float, Vec4(0.3f)));
    DepthParams linear;
    linear.convention = DepthConvention::Linear01;
    host.set_depth_params(linear);

    REQUIRE(blur.render(source, destination, host).is_ok());
    REQUIRE(destination.load(5, 5).r == Approx(0.3f).margin(1.0f / 1023.0f));
    REQUIRE(destination.load(5, 5).a == 1.0f);
    REQUIRE(blur.last_stats().accumulation == AccumulationStep::Kind::Disabled);
}

TEST_CASE("MotionBlur clamps settings", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlurSettings settings;
    settings.max_blur_radius = 40.0f;
    settings.accumulation_ratio = 2.0f;
    settings.sample_count = SampleCountTier::Custom;
    settings.custom_sample_count = 1000;
    MotionBlur blur(pool, settings);

    Image source = gradient_frame();
    Image destination(WIDTH, HEIGHT);
    auto host = still_host();

    REQUIRE(blur.render(source, destination, host).is_ok());
    REQUIRE(blur.last_params()->max_blur_radius == 10.0f);
    REQUIRE(blur.last_params()->accumulation_ratio == Approx(0.99f));
    REQUIRE(blur.last_params()->sample_count == 128);
    REQUIRE(blur.settings().accumulation_ratio == 2.0f);
}

TEST_CASE("MotionBlur on a frame too small to blur", "[blur][pipeline]") {
    ScratchImagePool pool;
    MotionBlur blur(pool);

    Image source(6, 5, PixelFormat::Rgba32Float, Vec4(0.2f, 0.4f, 0.6f, 1.0f));
    Image destination(6, 5);
    HostFrame host(Image(6, 5, PixelFormat::R32Float, Vec4(0.5f)));
    host.set_motion_vectors(Image(6, 5, PixelFormat::Rg16Float, Vec4(0.5f, 0.5f, 0.0f, 1.0f)));

    REQUIRE(blur.render(source, destination, host).is_ok());
    REQUIRE(blur.last_params()->degenerate());
    REQUIRE(destination.texels() == source.texels());
    REQUIRE(blur.last_stats().tile_columns == 1);
    REQUIRE(blur.last_stats().tile_rows == 1);
}

// streak_blur depth linearization and camera motion tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <streak/blur/camera_motion.hpp>
#include <streak/blur/depth.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace streak_blur;
using Catch::Approx;
using streak_math::Vec3;
using streak_math::Vec4;

namespace {

Mat4 make_view_projection(const Vec3& eye) {
    Mat4 projection = glm::perspective(glm::radians(60.0f), 16.0f / 9.0f, 0.1f, 100.0f);
    Mat4 view = glm::lookAt(eye, eye + Vec3(0.0f, 0.0f, -1.0f), Vec3(0.0f, 1.0f, 0.0f));
    return projection * view;
}

/// Device depth of a world point seen through view_projection
float device_depth_of(const Mat4& view_projection, const Vec3& point) {
    Vec4 clip = view_projection * Vec4(point, 1.0f);
    return clip.z / clip.w;
}

} // anonymous namespace

// =============================================================================
// Depth
// =============================================================================

TEST_CASE("linearize_depth endpoints", "[blur][depth]") {
    DepthParams params;
    params.near_plane = 0.5f;
    params.far_plane = 100.0f;

    SECTION("standard") {
        REQUIRE(linearize_depth(0.0f, params) == Approx(0.5f / 100.0f));
        REQUIRE(linearize_depth(1.0f, params) == Approx(1.0f));
    }

    SECTION("reversed") {
        params.convention = DepthConvention::ReversedZ;
        REQUIRE(linearize_depth(1.0f, params) == Approx(0.5f / 100.0f));
        REQUIRE(linearize_depth(0.0f, params) == Approx(1.0f));
    }

    SECTION("linear passes through") {
        params.convention = DepthConvention::Linear01;
        REQUIRE(linearize_depth(0.3f, params) == 0.3f);
    }

    SECTION("monotonic in view depth") {
        float previous = 0.0f;
        for (int i = 0; i <= 20; ++i) {
            float linear = linearize_depth(static_cast<float>(i) / 20.0f, params);
            REQUIRE(linear >= previous);
            previous = linear;
        }
    }
}

TEST_CASE("standard_device_depth inverts the conventions", "[blur][depth]") {
    DepthParams params;
    params.near_plane = 0.1f;
    params.far_plane = 50.0f;

    params.convention = DepthConvention::ReversedZ;
    REQUIRE(standard_device_depth(0.25f, params) == Approx(0.75f));

    DepthParams standard = params;
    standard.convention = DepthConvention::Standard;
    float linear = linearize_depth(0.9f, standard);

    params.convention = DepthConvention::Linear01;
    REQUIRE(standard_device_depth(linear, params) == Approx(0.9f).margin(1e-3));
}

// =============================================================================
// Camera Motion
// =============================================================================

TEST_CASE("camera_motion of a still camera is zero", "[blur][camera]") {
    CameraTransforms cameras;
    cameras.view_projection = make_view_projection(Vec3(0.0f));
    cameras.previous_view_projection = cameras.view_projection;

    Vec2 motion = camera_motion(Vec2(0.3f, 0.7f), 0.95f, DepthParams{}, cameras);
    REQUIRE(motion.x == Approx(0.0f).margin(1e-5));
    REQUIRE(motion.y == Approx(0.0f).margin(1e-5));
}

TEST_CASE("camera_motion of a panning camera", "[blur][camera]") {
    DepthParams params;
    params.near_plane = 0.1f;
    params.far_plane = 100.0f;

    const Vec3 point(0.0f, 0.0f, -10.0f);

    SECTION("moving right makes the world slide left") {
        CameraTransforms cameras;
        cameras.previous_view_projection = make_view_projection(Vec3(0.0f));
        cameras.view_projection = make_view_projection(Vec3(1.0f, 0.0f, 0.0f));

        // Point straight ahead of the old camera now sits left of centre
        Vec4 clip = cameras.view_projection * Vec4(point, 1.0f);
        Vec2 uv(clip.x / clip.w * 0.5f + 0.5f, 0.5f - clip.y / clip.w * 0.5f);
        float depth = device_depth_of(cameras.view_projection, point);

        Vec2 motion = camera_motion(uv, depth, params, cameras);
        REQUIRE(motion.x < 0.0f);
        REQUIRE(motion.x == Approx(uv.x - 0.5f).margin(1e-3));
        REQUIRE(motion.y == Approx(0.0f).margin(1e-4));
    }

    SECTION("moving up makes the world slide down the image") {
        CameraTransforms cameras;
        cameras.previous_view_projection = make_view_projection(Vec3(0.0f));
        cameras.view_projection = make_view_projection(Vec3(0.0f, 1.0f, 0.0f));

        Vec4 clip = cameras.view_projection * Vec4(point, 1.0f);
        Vec2 uv(clip.x / clip.w * 0.5f + 0.5f, 0.5f - clip.y / clip.w * 0.5f);
        float depth = device_depth_of(cameras.view_projection, point);

        Vec2 motion = camera_motion(uv, depth, params, cameras);
        REQUIRE(uv.y > 0.5f);
        REQUIRE(motion.y > 0.0f);
        REQUIRE(motion.x == Approx(0.0f).margin(1e-4));
    }
}

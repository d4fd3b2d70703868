// streak_math noise and helper tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <streak/math/noise.hpp>
#include <streak/math/utils.hpp>

using namespace streak_math;
using Catch::Approx;

TEST_CASE("interleaved_gradient_noise range and determinism", "[math][noise]") {
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            Vec2 p(static_cast<float>(x), static_cast<float>(y));
            float n = interleaved_gradient_noise(p);
            REQUIRE(n >= 0.0f);
            REQUIRE(n < 1.0f);
            REQUIRE(n == interleaved_gradient_noise(p));
        }
    }
}

TEST_CASE("interleaved_gradient_noise known values", "[math][noise]") {
    REQUIRE(interleaved_gradient_noise(Vec2(0.0f)) == 0.0f);
    // fract(52.9829189 * 0.06711056)
    REQUIRE(interleaved_gradient_noise(Vec2(1.0f, 0.0f)) == Approx(0.5557).margin(1e-3));
}

TEST_CASE("noise time offset repeats every 64 frames", "[math][noise]") {
    Vec2 p(13.0f, 7.0f);
    REQUIRE(noise_time_offset(0) == 0.0f);
    REQUIRE(noise_time_offset(64) == 0.0f);
    REQUIRE(interleaved_gradient_noise(p, 3) == interleaved_gradient_noise(p, 67));
    REQUIRE(interleaved_gradient_noise(p, 0) == interleaved_gradient_noise(p));
}

TEST_CASE("scalar helpers", "[math][utils]") {
    REQUIRE(saturate(-1.0f) == 0.0f);
    REQUIRE(saturate(2.0f) == 1.0f);
    REQUIRE(lerp(2.0f, 4.0f, 0.5f) == 3.0f);
    REQUIRE(smoothstep(0.0f, 1.0f, 0.5f) == Approx(0.5f));
    REQUIRE(smoothstep(0.0f, 1.0f, -3.0f) == 0.0f);
    REQUIRE(fract(-0.25f) == Approx(0.75f));
}

TEST_CASE("vector helpers", "[math][utils]") {
    SECTION("perpendicular is counter-clockwise") {
        Vec2 p = perpendicular(Vec2(1.0f, 0.0f));
        REQUIRE(p.x == 0.0f);
        REQUIRE(p.y == 1.0f);
    }

    SECTION("normalize_or_zero") {
        REQUIRE(glm::length(normalize_or_zero(Vec2(3.0f, 4.0f))) == Approx(1.0f));
        REQUIRE(normalize_or_zero(Vec2(0.1f, 0.0f), 0.5f) == vec2::ZERO);
    }

    SECTION("clamp_length") {
        Vec2 clamped = clamp_length(Vec2(30.0f, 40.0f), 10.0f);
        REQUIRE(glm::length(clamped) == Approx(10.0f));
        REQUIRE(clamped.x == Approx(6.0f));
        REQUIRE(clamp_length(Vec2(1.0f, 1.0f), 10.0f) == Vec2(1.0f, 1.0f));
        REQUIRE(clamp_length(Vec2(1.0f, 0.0f), 0.0f) == vec2::ZERO);
    }
}

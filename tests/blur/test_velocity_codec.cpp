// streak_blur velocity codec tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <streak/blur/velocity_codec.hpp>
#include <streak/image/format.hpp>

using namespace streak_blur;
using Catch::Approx;
using streak_image::PixelFormat;

TEST_CASE("encode_velocity maps into the unit square", "[blur][codec]") {
    const float radius = 20.0f;

    REQUIRE(encode_velocity(Vec2(0.0f), radius) == Vec2(0.5f));
    REQUIRE(encode_velocity(Vec2(20.0f, 0.0f), radius).x == Approx(1.0f));
    REQUIRE(encode_velocity(Vec2(0.0f, -20.0f), radius).y == Approx(0.0f));
    REQUIRE(encode_velocity(Vec2(10.0f, -5.0f), radius).x == Approx(0.75f));
}

TEST_CASE("encode_velocity shortens long vectors", "[blur][codec]") {
    const float radius = 10.0f;
    Vec2 decoded = decode_velocity(encode_velocity(Vec2(30.0f, 40.0f), radius), radius);

    REQUIRE(glm::length(decoded) == Approx(10.0f));
    REQUIRE(decoded.x == Approx(6.0f));
    REQUIRE(decoded.y == Approx(8.0f));
}

TEST_CASE("velocity survives 10-bit storage within one step", "[blur][codec]") {
    const float radius = 37.0f;
    const float tolerance = 2.0f * radius / 1023.0f;

    const Vec2 velocities[] = {
        Vec2(0.0f), Vec2(12.3f, -4.5f), Vec2(-36.9f, 0.2f), Vec2(1.0f, 1.0f),
    };

    for (const Vec2& velocity : velocities) {
        Vec4 texel = streak_image::quantize(PixelFormat::Rgb10A2Unorm,
                                            pack_velocity_depth(velocity, 0.4f, radius));
        Vec2 decoded = unpack_velocity(texel, radius);
        REQUIRE(decoded.x == Approx(velocity.x).margin(tolerance));
        REQUIRE(decoded.y == Approx(velocity.y).margin(tolerance));
        REQUIRE(unpack_depth(texel) == Approx(0.4f).margin(1.0f / 1023.0f));
    }
}

TEST_CASE("stored zero velocity reads back as exactly zero", "[blur][codec]") {
    // 432 px is a 10% radius on a 4320 px tall frame
    const float radius = GENERATE(1.0f, 10.0f, 200.0f, 432.0f, 1000.0f);
    Vec4 texel = streak_image::quantize(PixelFormat::Rgb10A2Unorm, pack_velocity_depth(Vec2(0.0f), 1.0f, radius));

    REQUIRE(unpack_velocity(texel, radius) == Vec2(0.0f));
}

TEST_CASE("motion of one storage step survives the zero snap", "[blur][codec]") {
    const float radius = 432.0f;
    const float step = 2.0f * radius / VELOCITY_LEVELS;
    Vec4 texel = streak_image::quantize(PixelFormat::Rgb10A2Unorm,
                                        pack_velocity_depth(Vec2(2.0f * step, -3.0f), 1.0f, radius));
    Vec2 decoded = unpack_velocity(texel, radius);

    REQUIRE(decoded.x == Approx(2.0f * step).margin(step));
    REQUIRE(decoded.x > 0.0f);
    REQUIRE(decoded.y == Approx(-3.0f).margin(step));
}

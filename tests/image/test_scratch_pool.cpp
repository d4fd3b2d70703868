// streak_image ScratchImagePool and ScratchImage tests

#include <catch2/catch_test_macros.hpp>
#include <streak/image/scratch_pool.hpp>

using namespace streak_image;

// =============================================================================
// ScratchImagePool Tests
// =============================================================================

TEST_CASE("ScratchImagePool acquire and release", "[image][scratch]") {
    ScratchImagePool pool;

    auto handle = pool.acquire(16, 8, PixelFormat::Rgba16Float);
    REQUIRE(handle.is_ok());
    REQUIRE(pool.live_count() == 1);

    Image* image = pool.get(*handle);
    REQUIRE(image != nullptr);
    REQUIRE(image->width() == 16);
    REQUIRE(image->height() == 8);
    REQUIRE(image->format() == PixelFormat::Rgba16Float);
    REQUIRE(pool.stats().live_bytes == 16 * 8 * 8);

    REQUIRE(pool.release(*handle).is_ok());
    REQUIRE(pool.live_count() == 0);
    REQUIRE(pool.cached_count() == 1);
    REQUIRE(pool.stats().live_bytes == 0);
    REQUIRE(pool.stats().peak_live_bytes == 16 * 8 * 8);
}

TEST_CASE("ScratchImagePool reuses matching images", "[image][scratch]") {
    ScratchImagePool pool;

    auto first = pool.acquire(32, 32, PixelFormat::Rg16Float);
    REQUIRE(first.is_ok());
    Image* storage = pool.get(*first);
    REQUIRE(pool.release(*first).is_ok());

    SECTION("same shape comes back from the cache") {
        auto second = pool.acquire(32, 32, PixelFormat::Rg16Float);
        REQUIRE(second.is_ok());
        REQUIRE(pool.get(*second) == storage);
        REQUIRE(pool.stats().reuse_count == 1);
        REQUIRE(pool.cached_count() == 0);
    }

    SECTION("different format allocates fresh storage") {
        auto second = pool.acquire(32, 32, PixelFormat::Rgba16Float);
        REQUIRE(second.is_ok());
        REQUIRE(pool.stats().reuse_count == 0);
        REQUIRE(pool.cached_count() == 1);
    }

    SECTION("trim drops the cache") {
        pool.trim();
        REQUIRE(pool.cached_count() == 0);
    }
}

TEST_CASE("ScratchImagePool rejects bad handles", "[image][scratch]") {
    ScratchImagePool pool;

    SECTION("double release") {
        auto handle = pool.acquire(4, 4, PixelFormat::Rgba32Float);
        REQUIRE(handle.is_ok());
        REQUIRE(pool.release(*handle).is_ok());

        auto again = pool.release(*handle);
        REQUIRE(again.is_err());
        REQUIRE(again.error().is<streak_core::HandleError>());
        REQUIRE(pool.stats().release_count == 1);
    }

    SECTION("stale handle does not resolve") {
        auto handle = pool.acquire(4, 4, PixelFormat::Rgba32Float);
        REQUIRE(handle.is_ok());
        REQUIRE(pool.release(*handle).is_ok());
        REQUIRE(pool.get(*handle) == nullptr);

        auto reused = pool.acquire(4, 4, PixelFormat::Rgba32Float);
        REQUIRE(reused.is_ok());
        REQUIRE(reused->index() == handle->index());
        REQUIRE(pool.get(*handle) == nullptr);
        REQUIRE(pool.get(*reused) != nullptr);
    }

    SECTION("null handle") {
        REQUIRE(pool.get(ScratchHandle::null()) == nullptr);
        REQUIRE(pool.release(ScratchHandle::null()).is_err());
    }
}

TEST_CASE("ScratchImagePool limits", "[image][scratch]") {
    SECTION("empty request") {
        ScratchImagePool pool;
        auto handle = pool.acquire(0, 16, PixelFormat::Rgba32Float);
        REQUIRE(handle.is_err());
        REQUIRE(handle.error().is<streak_core::ImageError>());
        REQUIRE(pool.stats().failure_count == 1);
    }

    SECTION("byte budget") {
        ScratchPoolConfig config;
        config.byte_budget = 1024;
        ScratchImagePool pool(config);

        auto a = pool.acquire(8, 8, PixelFormat::Rgba32Float);  // 1024 bytes
        REQUIRE(a.is_ok());

        auto b = pool.acquire(1, 1, PixelFormat::R32Float);
        REQUIRE(b.is_err());
        REQUIRE(b.error().code() == streak_core::ErrorCode::OutOfMemory);
        REQUIRE(pool.stats().failure_count == 1);

        REQUIRE(pool.release(*a).is_ok());
        REQUIRE(pool.acquire(1, 1, PixelFormat::R32Float).is_ok());
    }

    SECTION("live image count") {
        ScratchPoolConfig config;
        config.max_live_images = 2;
        ScratchImagePool pool(config);

        REQUIRE(pool.acquire(2, 2, PixelFormat::Rgba32Float).is_ok());
        REQUIRE(pool.acquire(2, 2, PixelFormat::Rgba32Float).is_ok());
        REQUIRE(pool.acquire(2, 2, PixelFormat::Rgba32Float).is_err());
        REQUIRE(pool.live_count() == 2);
    }

    SECTION("cache size") {
        ScratchPoolConfig config;
        config.max_cached_images = 1;
        ScratchImagePool pool(config);

        auto a = pool.acquire(2, 2, PixelFormat::Rgba32Float);
        auto b = pool.acquire(2, 2, PixelFormat::Rgba32Float);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(pool.release(*a).is_ok());
        REQUIRE(pool.release(*b).is_ok());
        REQUIRE(pool.cached_count() == 1);
    }
}

// =============================================================================
// ScratchImage Tests
// =============================================================================

TEST_CASE("ScratchImage returns its image on scope exit", "[image][scratch]") {
    ScratchImagePool pool;

    {
        auto guard = ScratchImage::acquire(pool, 8, 8, PixelFormat::Rgb10A2Unorm);
        REQUIRE(guard.is_ok());
        REQUIRE(guard->is_active());
        REQUIRE(guard->image().width() == 8);
        REQUIRE(pool.live_count() == 1);
    }

    REQUIRE(pool.live_count() == 0);
    REQUIRE(pool.stats().release_count == 1);
}

TEST_CASE("ScratchImage explicit release", "[image][scratch]") {
    ScratchImagePool pool;

    auto guard = ScratchImage::acquire(pool, 8, 8, PixelFormat::Rgba32Float);
    REQUIRE(guard.is_ok());

    REQUIRE(guard->release().is_ok());
    REQUIRE_FALSE(guard->is_active());
    REQUIRE(pool.live_count() == 0);

    // Second release is a no-op on the guard
    REQUIRE(guard->release().is_ok());
    REQUIRE(pool.stats().release_count == 1);
}

TEST_CASE("ScratchImage move transfers ownership", "[image][scratch]") {
    ScratchImagePool pool;

    auto acquired = ScratchImage::acquire(pool, 4, 4, PixelFormat::Rgba32Float);
    REQUIRE(acquired.is_ok());

    ScratchImage first = std::move(*acquired);
    REQUIRE(first.is_active());

    ScratchImage second;
    REQUIRE_FALSE(second.is_active());
    second = std::move(first);
    REQUIRE_FALSE(first.is_active());
    REQUIRE(second.is_active());
    REQUIRE(pool.live_count() == 1);

    auto other = ScratchImage::acquire(pool, 4, 4, PixelFormat::Rgba32Float);
    REQUIRE(other.is_ok());
    REQUIRE(pool.live_count() == 2);

    // Assigning over an active guard releases what it held
    second = std::move(*other);
    REQUIRE(pool.live_count() == 1);
    REQUIRE(pool.stats().release_count == 1);
}

TEST_CASE("ScratchImage acquire propagates pool failure", "[image][scratch]") {
    ScratchPoolConfig config;
    config.max_live_images = 1;
    ScratchImagePool pool(config);

    auto first = ScratchImage::acquire(pool, 4, 4, PixelFormat::Rgba32Float);
    REQUIRE(first.is_ok());

    auto second = ScratchImage::acquire(pool, 4, 4, PixelFormat::Rgba32Float);
    REQUIRE(second.is_err());
    REQUIRE(second.error().is<streak_core::ImageError>());
}

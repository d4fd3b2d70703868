#pragma once

/// @file scratch_pool.hpp
/// @brief Pooled temporary images with generational handles

#include "image.hpp"
#include <streak/core/error.hpp>
#include <streak/core/handle.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace streak_image {

using streak_core::Result;

/// Tag type for scratch image handles
struct ScratchTag {};

using ScratchHandle = streak_core::Handle<ScratchTag>;

// =============================================================================
// IScratchAllocator
// =============================================================================

/// Provider of temporary images for a single pipeline invocation.
///
/// Implementations may recycle storage. A handle stops resolving as soon as
/// it is released, and releasing it a second time is an error.
class IScratchAllocator {
public:
    virtual ~IScratchAllocator() = default;

    /// Acquire an image of the given shape. Contents are unspecified.
    [[nodiscard]] virtual Result<ScratchHandle> acquire(std::uint32_t width, std::uint32_t height,
                                                        PixelFormat format) = 0;

    /// Return an image to the allocator
    virtual Result<void> release(ScratchHandle handle) = 0;

    /// Resolve a live handle, nullptr if null, stale or foreign
    [[nodiscard]] virtual Image* get(ScratchHandle handle) = 0;
};

// =============================================================================
// ScratchImagePool
// =============================================================================

/// Limits for a ScratchImagePool. Zero means unlimited.
struct ScratchPoolConfig {
    std::size_t byte_budget = 0;        ///< Cap on bytes held by live images
    std::size_t max_live_images = 0;    ///< Cap on simultaneously live images
    std::size_t max_cached_images = 16; ///< Released images kept for reuse
};

/// Pool statistics
struct ScratchPoolStats {
    std::size_t acquire_count = 0;
    std::size_t reuse_count = 0;
    std::size_t release_count = 0;
    std::size_t failure_count = 0;
    std::size_t live_bytes = 0;
    std::size_t peak_live_bytes = 0;
};

/// Default scratch allocator: keeps released images and hands them back to
/// requests with the same width, height and format.
class ScratchImagePool : public IScratchAllocator {
public:
    ScratchImagePool() = default;
    explicit ScratchImagePool(ScratchPoolConfig config);

    ScratchImagePool(const ScratchImagePool&) = delete;
    ScratchImagePool& operator=(const ScratchImagePool&) = delete;

    [[nodiscard]] Result<ScratchHandle> acquire(std::uint32_t width, std::uint32_t height,
                                                PixelFormat format) override;
    Result<void> release(ScratchHandle handle) override;
    [[nodiscard]] Image* get(ScratchHandle handle) override;

    [[nodiscard]] std::size_t live_count() const noexcept { return m_handles.len(); }
    [[nodiscard]] std::size_t cached_count() const noexcept { return m_cache.size(); }
    [[nodiscard]] const ScratchPoolStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const ScratchPoolConfig& config() const noexcept { return m_config; }

    /// Drop every cached (released) image
    void trim();

private:
    std::unique_ptr<Image> take_cached(std::uint32_t width, std::uint32_t height, PixelFormat format);

    ScratchPoolConfig m_config;
    ScratchPoolStats m_stats;
    streak_core::HandleAllocator<ScratchTag> m_handles;
    std::vector<std::unique_ptr<Image>> m_slots;
    std::vector<std::unique_ptr<Image>> m_cache;
};

// =============================================================================
// ScratchImage (RAII)
// =============================================================================

/// Owns one scratch image for the duration of a scope and returns it to
/// its allocator exactly once, either via release() or on destruction.
class ScratchImage {
public:
    ScratchImage() = default;
    ScratchImage(IScratchAllocator& allocator, ScratchHandle handle);
    ~ScratchImage();

    ScratchImage(const ScratchImage&) = delete;
    ScratchImage& operator=(const ScratchImage&) = delete;
    ScratchImage(ScratchImage&& other) noexcept;
    ScratchImage& operator=(ScratchImage&& other) noexcept;

    /// Acquire from an allocator and wrap the handle
    [[nodiscard]] static Result<ScratchImage> acquire(IScratchAllocator& allocator, std::uint32_t width,
                                                      std::uint32_t height, PixelFormat format);

    [[nodiscard]] bool is_active() const noexcept { return m_allocator != nullptr; }
    [[nodiscard]] ScratchHandle handle() const noexcept { return m_handle; }

    /// The held image; only valid while active
    [[nodiscard]] Image& image() noexcept { return *m_image; }
    [[nodiscard]] const Image& image() const noexcept { return *m_image; }

    /// Return the image now. Calling it on an inactive guard is a no-op.
    Result<void> release();

private:
    IScratchAllocator* m_allocator = nullptr;
    ScratchHandle m_handle;
    Image* m_image = nullptr;
};

} // namespace streak_image

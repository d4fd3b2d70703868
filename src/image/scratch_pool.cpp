/// @file scratch_pool.cpp
/// @brief Scratch image pool and RAII guard

#include <streak/image/scratch_pool.hpp>
#include <streak/core/log.hpp>
#include <algorithm>
#include <utility>

namespace streak_image {

using streak_core::Err;
using streak_core::ImageError;
using streak_core::Ok;

// =============================================================================
// ScratchImagePool
// =============================================================================

ScratchImagePool::ScratchImagePool(ScratchPoolConfig config)
    : m_config(config) {}

Result<ScratchHandle> ScratchImagePool::acquire(std::uint32_t width, std::uint32_t height, PixelFormat format) {
    if (width == 0 || height == 0) {
        ++m_stats.failure_count;
        return Err<ScratchHandle>(ImageError::empty("scratch request"));
    }

    const std::size_t bytes = static_cast<std::size_t>(width) * height * bytes_per_pixel(format);

    if (m_config.max_live_images != 0 && live_count() >= m_config.max_live_images) {
        ++m_stats.failure_count;
        streak_core::image_logger()->warn("Scratch pool out of images ({} live)", live_count());
        return Err<ScratchHandle>(ImageError::resource_exhausted(width, height, "live image limit reached"));
    }

    if (m_config.byte_budget != 0 && m_stats.live_bytes + bytes > m_config.byte_budget) {
        ++m_stats.failure_count;
        streak_core::image_logger()->warn("Scratch pool budget exceeded: {} + {} > {} bytes",
                                          m_stats.live_bytes, bytes, m_config.byte_budget);
        return Err<ScratchHandle>(ImageError::resource_exhausted(width, height, "byte budget exceeded"));
    }

    ScratchHandle handle = m_handles.allocate();
    if (handle.is_null()) {
        ++m_stats.failure_count;
        return Err<ScratchHandle>(ImageError::resource_exhausted(width, height, "handle space exhausted"));
    }

    auto image = take_cached(width, height, format);
    if (image) {
        ++m_stats.reuse_count;
    } else {
        image = std::make_unique<Image>(width, height, format);
    }

    if (handle.index() >= m_slots.size()) {
        m_slots.resize(handle.index() + 1);
    }
    m_slots[handle.index()] = std::move(image);

    ++m_stats.acquire_count;
    m_stats.live_bytes += bytes;
    m_stats.peak_live_bytes = std::max(m_stats.peak_live_bytes, m_stats.live_bytes);

    streak_core::image_logger()->trace("Scratch acquire {}x{} {} -> slot {}",
                                       width, height, pixel_format_name(format), handle.index());
    return handle;
}

Result<void> ScratchImagePool::release(ScratchHandle handle) {
    if (auto freed = m_handles.free(handle); !freed) {
        streak_core::image_logger()->warn("Rejected scratch release: {}", freed.error().message());
        return freed;
    }

    auto image = std::move(m_slots[handle.index()]);
    m_stats.live_bytes -= image->byte_size();
    ++m_stats.release_count;

    if (m_cache.size() < m_config.max_cached_images) {
        m_cache.push_back(std::move(image));
    }
    return Ok();
}

Image* ScratchImagePool::get(ScratchHandle handle) {
    if (!m_handles.is_valid(handle)) {
        return nullptr;
    }
    return m_slots[handle.index()].get();
}

void ScratchImagePool::trim() {
    m_cache.clear();
}

std::unique_ptr<Image> ScratchImagePool::take_cached(std::uint32_t width, std::uint32_t height, PixelFormat format) {
    auto it = std::find_if(m_cache.begin(), m_cache.end(), [&](const std::unique_ptr<Image>& image) {
        return image->width() == width && image->height() == height && image->format() == format;
    });
    if (it == m_cache.end()) {
        return nullptr;
    }
    auto image = std::move(*it);
    m_cache.erase(it);
    return image;
}

// =============================================================================
// ScratchImage
// =============================================================================

ScratchImage::ScratchImage(IScratchAllocator& allocator, ScratchHandle handle)
    : m_allocator(&allocator)
    , m_handle(handle)
    , m_image(allocator.get(handle))
{
    if (!m_image) {
        m_allocator = nullptr;
        m_handle = ScratchHandle::null();
    }
}

ScratchImage::~ScratchImage() {
    if (auto released = release(); !released) {
        streak_core::image_logger()->error("Scratch guard release failed: {}", released.error().message());
    }
}

ScratchImage::ScratchImage(ScratchImage&& other) noexcept
    : m_allocator(std::exchange(other.m_allocator, nullptr))
    , m_handle(std::exchange(other.m_handle, ScratchHandle::null()))
    , m_image(std::exchange(other.m_image, nullptr)) {}

ScratchImage& ScratchImage::operator=(ScratchImage&& other) noexcept {
    if (this != &other) {
        if (auto released = release(); !released) {
            streak_core::image_logger()->error("Scratch guard release failed: {}", released.error().message());
        }
        m_allocator = std::exchange(other.m_allocator, nullptr);
        m_handle = std::exchange(other.m_handle, ScratchHandle::null());
        m_image = std::exchange(other.m_image, nullptr);
    }
    return *this;
}

Result<ScratchImage> ScratchImage::acquire(IScratchAllocator& allocator, std::uint32_t width,
                                           std::uint32_t height, PixelFormat format) {
    auto handle = allocator.acquire(width, height, format);
    if (!handle) {
        return Err<ScratchImage>(std::move(handle.error()));
    }

    ScratchImage guard(allocator, *handle);
    if (!guard.is_active()) {
        return Err<ScratchImage>(streak_core::HandleError::stale());
    }
    return Result<ScratchImage>(std::move(guard));
}

Result<void> ScratchImage::release() {
    if (!m_allocator) {
        return Ok();
    }
    IScratchAllocator* allocator = std::exchange(m_allocator, nullptr);
    ScratchHandle handle = std::exchange(m_handle, ScratchHandle::null());
    m_image = nullptr;
    return allocator->release(handle);
}

} // namespace streak_image

#pragma once

/// @file handle.hpp
/// @brief Type-safe generational handles for streak_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <vector>

namespace streak_core {

// =============================================================================
// Handle Constants
// =============================================================================

namespace handle_constants {
    /// Maximum index value (24 bits)
    constexpr std::uint32_t MAX_INDEX = (1u << 24) - 1;

    /// Null handle bits
    constexpr std::uint32_t NULL_BITS = UINT32_MAX;
}

// =============================================================================
// Handle<T>
// =============================================================================

/// Generational index handle.
/// Layout: [Generation(8 bits) | Index(24 bits)]
template<typename T>
struct Handle {
    std::uint32_t bits = handle_constants::NULL_BITS;

    constexpr Handle() noexcept = default;

    [[nodiscard]] static constexpr Handle create(std::uint32_t index, std::uint8_t generation) noexcept {
        Handle h;
        h.bits = (static_cast<std::uint32_t>(generation) << 24) | (index & handle_constants::MAX_INDEX);
        return h;
    }

    [[nodiscard]] static constexpr Handle null() noexcept { return Handle{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept { return bits == handle_constants::NULL_BITS; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return bits != handle_constants::NULL_BITS; }

    [[nodiscard]] constexpr std::uint32_t index() const noexcept {
        return bits & handle_constants::MAX_INDEX;
    }

    [[nodiscard]] constexpr std::uint8_t generation() const noexcept {
        return static_cast<std::uint8_t>(bits >> 24);
    }

    constexpr bool operator==(const Handle&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

// =============================================================================
// HandleAllocator<T>
// =============================================================================

/// Hands out slot indices and tracks a generation per slot so that a
/// released handle can never be mistaken for the slot's next occupant.
template<typename T>
class HandleAllocator {
public:
    HandleAllocator() = default;

    /// Allocate a handle, reusing the most recently freed slot first.
    /// Returns a null handle once the 24-bit index space is exhausted.
    [[nodiscard]] Handle<T> allocate() {
        if (!m_free_list.empty()) {
            std::uint32_t index = m_free_list.back();
            m_free_list.pop_back();
            return Handle<T>::create(index, m_generations[index]);
        }

        auto index = static_cast<std::uint32_t>(m_generations.size());
        if (index > handle_constants::MAX_INDEX) {
            return Handle<T>::null();
        }
        m_generations.push_back(0);
        return Handle<T>::create(index, 0);
    }

    /// Free a handle. Null, foreign and already-freed handles are rejected.
    Result<void> free(Handle<T> handle) {
        if (auto check = validate(handle); !check) {
            return check;
        }
        std::uint32_t index = handle.index();
        m_generations[index] = static_cast<std::uint8_t>(m_generations[index] + 1);
        m_free_list.push_back(index);
        return Ok();
    }

    /// Check a handle against the live generation of its slot
    [[nodiscard]] Result<void> validate(Handle<T> handle) const {
        if (handle.is_null()) {
            return Err(HandleError::null());
        }
        if (handle.index() >= m_generations.size()) {
            return Err(HandleError::out_of_bounds());
        }
        if (m_generations[handle.index()] != handle.generation()) {
            return Err(HandleError::stale());
        }
        return Ok();
    }

    [[nodiscard]] bool is_valid(Handle<T> handle) const { return validate(handle).is_ok(); }

    /// Live handle count
    [[nodiscard]] std::size_t len() const noexcept { return m_generations.size() - m_free_list.size(); }

    /// Total slot count (live plus free)
    [[nodiscard]] std::size_t capacity() const noexcept { return m_generations.size(); }

    [[nodiscard]] std::size_t free_count() const noexcept { return m_free_list.size(); }

    void clear() {
        m_generations.clear();
        m_free_list.clear();
    }

private:
    std::vector<std::uint8_t> m_generations;
    std::vector<std::uint32_t> m_free_list;
};

} // namespace streak_core

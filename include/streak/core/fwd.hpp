#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for streak_core

#include <cstdint>

namespace streak_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
struct Handle;

template<typename T>
class HandleAllocator;

// =============================================================================
// Parallel Execution
// =============================================================================

struct ParallelConfig;

} // namespace streak_core

#pragma once

/// @file log.hpp
/// @brief Logging utilities for streak

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define STREAK_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define STREAK_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define STREAK_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define STREAK_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define STREAK_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define STREAK_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace streak_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system. Affects loggers created before and after the call.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger used by the image module ("streak.image")
std::shared_ptr<spdlog::logger> image_logger();

/// Logger used by the blur pipeline ("streak.blur")
std::shared_ptr<spdlog::logger> blur_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII scope that traces entry and exit with elapsed time
class LogScope {
public:
    LogScope(const std::string& name, std::shared_ptr<spdlog::logger> logger);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

    /// Microseconds since construction
    [[nodiscard]] std::int64_t elapsed_us() const;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop all named loggers created through get_logger
void shutdown_logging();

} // namespace streak_core

#pragma once

/// @file parallel.hpp
/// @brief Row-band parallel loops for per-pixel passes

#include "fwd.hpp"
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace streak_core {

/// Worker configuration for parallel passes
struct ParallelConfig {
    /// Number of worker threads; 0 uses hardware concurrency, 1 runs inline
    std::uint32_t worker_count = 0;

    /// Smallest band of rows handed to one worker
    std::uint32_t min_rows_per_band = 4;

    [[nodiscard]] static ParallelConfig inline_only() { return ParallelConfig{1, 1}; }
};

/// Joins every joinable thread it holds when it goes out of scope, so a throw
/// between starting two workers never destroys a joinable std::thread.
class ThreadJoiner {
public:
    ThreadJoiner() = default;
    ~ThreadJoiner() { join(); }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;
    ThreadJoiner(ThreadJoiner&&) = delete;
    ThreadJoiner& operator=(ThreadJoiner&&) = delete;

    std::vector<std::thread>& threads() noexcept { return m_threads; }

    void join() {
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread> m_threads;
};

/// Effective worker count after resolving 0 to the hardware concurrency
[[nodiscard]] std::uint32_t resolve_worker_count(const ParallelConfig& config);

/// Split rows [begin, end) into contiguous bands and call `body(band_begin, band_end)`
/// for each, on up to `worker_count` threads. Returns once every band has finished.
/// Bands never overlap, so a body that writes only rows inside its band is race-free.
void parallel_for_rows(const ParallelConfig& config, std::uint32_t begin, std::uint32_t end,
                       const std::function<void(std::uint32_t, std::uint32_t)>& body);

} // namespace streak_core

/// @file parallel.cpp
/// @brief Row-band parallel loop on std::thread workers

#include <streak/core/parallel.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace streak_core {

std::uint32_t resolve_worker_count(const ParallelConfig& config) {
    if (config.worker_count != 0) {
        return config.worker_count;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

void parallel_for_rows(const ParallelConfig& config, std::uint32_t begin, std::uint32_t end,
                       const std::function<void(std::uint32_t, std::uint32_t)>& body) {
    if (end <= begin) {
        return;
    }

    const std::uint32_t rows = end - begin;
    const std::uint32_t min_band = std::max(1u, config.min_rows_per_band);
    const std::uint32_t max_bands = (rows + min_band - 1) / min_band;
    const std::uint32_t workers = std::min(resolve_worker_count(config), max_bands);

    if (workers <= 1) {
        body(begin, end);
        return;
    }

    const std::uint32_t band = (rows + workers - 1) / workers;

    std::exception_ptr failure;
    std::mutex failure_mutex;
    ThreadJoiner joiner;
    auto& threads = joiner.threads();
    threads.reserve(workers);

    for (std::uint32_t w = 0; w < workers; ++w) {
        const std::uint32_t band_begin = begin + w * band;
        if (band_begin >= end) {
            break;
        }
        const std::uint32_t band_end = std::min(end, band_begin + band);
        threads.emplace_back([&, band_begin, band_end]() {
            try {
                body(band_begin, band_end);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        });
    }

    joiner.join();

    // Surface the first worker failure on the calling thread
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace streak_core

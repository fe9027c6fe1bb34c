#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tradebook {

// Runs task(i) for every i in [0, count) on at most `workers` threads.
// Each index is handed to exactly one worker. The first exception thrown by a
// task is rethrown on the calling thread after all workers have joined.
inline void run_parallel(std::size_t count, std::size_t workers,
                         const std::function<void(std::size_t)>& task) {
    if (workers <= 1 || count <= 1) {
        for (std::size_t i = 0; i < count; i++) task(i);
        return;
    }

    std::atomic<std::size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    std::vector<std::thread> threads;
    std::size_t n = workers < count ? workers : count;
    threads.reserve(n);
    for (std::size_t w = 0; w < n; w++) {
        threads.emplace_back([&] {
            while (true) {
                std::size_t i = next.fetch_add(1);
                if (i >= count) break;
                try {
                    task(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure) failure = std::current_exception();
                }
            }
        });
    }
    for (auto& t : threads) if (t.joinable()) t.join();

    if (failure) std::rethrow_exception(failure);
}

} // namespace tradebook

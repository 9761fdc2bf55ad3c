// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace codegraph {

// Fixed-size pool. Each run() spawns the workers, hands out task indices and
// joins them, so a returning run() is a barrier for everything it scheduled.
class WorkerPool {
public:
    explicit WorkerPool(unsigned int num_threads = 0) : num_threads_(num_threads) {
        // Auto-detect thread count if not specified
        if (num_threads_ == 0) {
            num_threads_ = std::thread::hardware_concurrency();
            if (num_threads_ == 0)
                num_threads_ = 4; // Fallback
        }
    }

    unsigned int size() const { return num_threads_; }

    // Call task(i) for every i in [0, count). The first exception thrown by a
    // task is rethrown here after all workers have stopped.
    void run(size_t count, const std::function<void(size_t)> &task) {
        if (count == 0)
            return;

        std::atomic<size_t> next{0};
        std::exception_ptr failure;
        std::mutex failure_mutex;

        auto worker = [&]() {
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= count)
                    return;
                try {
                    task(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure)
                        failure = std::current_exception();
                    next.store(count);
                    return;
                }
            }
        };

        size_t thread_count = std::min<size_t>(num_threads_, count);
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }

        // Wait for all threads
        for (auto &t : threads) {
            t.join();
        }

        if (failure)
            std::rethrow_exception(failure);
    }

private:
    unsigned int num_threads_;
};

} // namespace codegraph

#pragma once
/**
 * @file ParallelFor.h
 * @brief Chunked work distribution over a fixed set of worker threads.
 */
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace ringpower {
    namespace detail {
        /**
         * @brief Start nWorkers threads with spawn(body) and join them all.
         *
         * If a start fails, stop is raised, the threads already running are joined and the start-up error is
         * rethrown. No joinable thread is ever destroyed.
         */
        template <typename Body, typename Spawn>
        void runWorkers(const int nWorkers, Body& body, std::atomic<bool>& stop, Spawn& spawn) {
            std::vector<std::thread> workers;
            workers.reserve(nWorkers);
            try {
                for (int w = 0; w < nWorkers; ++w) workers.push_back(spawn(body));
            }
            catch (...) {
                stop.store(true, std::memory_order_relaxed);
                for (auto& worker : workers) worker.join();
                throw;
            }
            for (auto& worker : workers) worker.join();
        }
    }

    /**
     * @brief Run task(i) for every i in [0, numTasks).
     *
     * Workers pull chunk indices from a shared atomic counter. Tasks must only write to state owned by their
     * own index; results are then independent of the worker count. The first exception thrown by any task
     * stops the remaining chunks and is rethrown on the calling thread after all workers joined.
     *
     * @param numTasks    number of tasks
     * @param chunkSize   tasks per chunk, > 0
     * @param maxWorkers  threads to use; 1 runs inline
     * @param task        callable taking int64_t
     * @param spawn       callable taking the worker body by reference and returning a started std::thread
     */
    template <typename Task, typename Spawn>
    void parallelFor(const int64_t numTasks, const int chunkSize, const int maxWorkers, Task&& task, Spawn&& spawn) {
        if (chunkSize <= 0) throw std::invalid_argument("parallelFor: chunkSize must be positive");
        if (maxWorkers <= 0) throw std::invalid_argument("parallelFor: maxWorkers must be positive");
        if (numTasks <= 0) return;

        if (maxWorkers == 1) {
            for (int64_t i = 0; i < numTasks; ++i) task(i);
            return;
        }

        const int64_t nChunks = (numTasks + chunkSize - 1) / chunkSize;
        std::atomic<int64_t> nextChunk{0};
        std::atomic<bool> failed{false};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        auto body = [&] {
            while (!failed.load(std::memory_order_relaxed)) {
                const int64_t chunkIdx = nextChunk.fetch_add(1, std::memory_order_relaxed);
                if (chunkIdx >= nChunks) break;
                const int64_t begin = chunkIdx * chunkSize;
                const int64_t end = std::min(numTasks, begin + chunkSize);
                try {
                    for (int64_t i = begin; i < end; ++i) task(i);
                }
                catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) firstError = std::current_exception();
                    failed.store(true, std::memory_order_relaxed);
                }
            }
        };

        const auto nWorkers = static_cast<int>(std::min<int64_t>(maxWorkers, nChunks));
        detail::runWorkers(nWorkers, body, failed, spawn);
        if (firstError) std::rethrow_exception(firstError);
    }

    template <typename Task>
    void parallelFor(const int64_t numTasks, const int chunkSize, const int maxWorkers, Task&& task) {
        parallelFor(numTasks, chunkSize, maxWorkers, std::forward<Task>(task),
                    [](auto& body) { return std::thread(std::ref(body)); });
    }
}

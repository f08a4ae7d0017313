#pragma once
// Chunked parallel loops for independent work items (one wall per item)
// Uses std::thread and std::atomic for portable multithreading

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace wallslicer {

// Progress callback: (completed, total, task name)
using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

// Thread-safe completion counter that reports roughly every 5%
class ProgressTracker {
public:
    ProgressTracker(size_t totalItems, ProgressCallback callback, std::string taskName)
        : total(totalItems)
        , completed(0)
        , callback(std::move(callback))
        , taskName(std::move(taskName))
        , interval(std::max(size_t(1), totalItems / 20)) {}

    void itemCompleted() {
        size_t current = ++completed;
        if (callback && (current == total || current % interval == 0)) {
            callback(current, total, taskName);
        }
    }

    size_t getCompleted() const { return completed.load(); }
    size_t getTotal() const { return total; }

private:
    size_t total;
    std::atomic<size_t> completed;
    ProgressCallback callback;
    std::string taskName;
    size_t interval;
};

// Get the number of threads to use (respects hardware concurrency)
inline unsigned int getThreadCount() {
    unsigned int n = std::thread::hardware_concurrency();
    return std::max(1u, n);
}

// Parallel for loop over [0, count); each thread processes a contiguous chunk.
// maxThreads == 0 uses every hardware thread.
template<typename Func>
void parallel_for(size_t count, Func&& func, unsigned int maxThreads = 0,
                  ProgressTracker* tracker = nullptr) {
    if (count == 0) return;

    unsigned int numThreads = getThreadCount();
    if (maxThreads > 0) numThreads = std::min(numThreads, maxThreads);
    numThreads = static_cast<unsigned int>(std::min<size_t>(numThreads, count));

    if (numThreads <= 1) {
        for (size_t i = 0; i < count; ++i) {
            func(i);
            if (tracker) tracker->itemCompleted();
        }
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(numThreads);

    size_t chunkSize = (count + numThreads - 1) / numThreads;

    for (unsigned int t = 0; t < numThreads; ++t) {
        size_t chunkStart = t * chunkSize;
        size_t chunkEnd = std::min(chunkStart + chunkSize, count);

        if (chunkStart < count) {
            threads.emplace_back([=, &func] {
                for (size_t i = chunkStart; i < chunkEnd; ++i) {
                    func(i);
                    if (tracker) tracker->itemCompleted();
                }
            });
        }
    }

    for (auto& t : threads) {
        t.join();
    }
}

} // namespace wallslicer

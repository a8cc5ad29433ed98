#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <future>
#include <thread>
#include <vector>

namespace nodeweave {

/// Split [0, count) into contiguous chunks and run fn(begin, end) on each
/// chunk with std::async. Small ranges run inline on the calling thread.
/// Exceptions thrown by a chunk are rethrown from future::get().
template <typename Fn>
void parallelForChunks(size_t count, Fn&& fn, size_t minChunk = 64) {
    if (count == 0) {
        return;
    }
    const size_t hw = std::max<size_t>(1, std::thread::hardware_concurrency());
    const size_t chunks = std::min(hw, (count + minChunk - 1) / minChunk);
    if (chunks <= 1) {
        fn(size_t{0}, count);
        return;
    }

    const size_t chunkSize = (count + chunks - 1) / chunks;
    std::vector<std::future<void>> futures;
    futures.reserve(chunks);
    for (size_t begin = 0; begin < count; begin += chunkSize) {
        const size_t end = std::min(count, begin + chunkSize);
        futures.push_back(std::async(std::launch::async, [&fn, begin, end]() {
            fn(begin, end);
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
}

/// Per-index variant of parallelForChunks.
template <typename Fn>
void parallelFor(size_t count, Fn&& fn, size_t minChunk = 64) {
    parallelForChunks(count, [&fn](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            fn(i);
        }
    }, minChunk);
}

/// Lock-free running maximum. Commutative, so chunk order is irrelevant.
inline void atomicFetchMax(std::atomic<float>& target, float value) {
    float current = target.load(std::memory_order_relaxed);
    while (value > current &&
           !target.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
    }
}

}  // namespace nodeweave

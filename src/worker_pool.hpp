#pragma once

#include "chunk.hpp"
#include "chunk_result.hpp"
#include "translator.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pseudo_mt {

// Fixed set of threads, each owning one translator clone, that run chunk
// computations and hand finished results to a callback.
class ChunkWorkerPool {
public:
    using Processor = std::function<ChunkResult(const Chunk&, Translator&)>;
    using StartHandler = std::function<void(std::size_t)>;
    using ResultHandler = std::function<void(ChunkResult)>;

    ChunkWorkerPool(
        std::vector<std::unique_ptr<Translator>> translators,
        Processor processor,
        StartHandler on_start,
        ResultHandler on_result
    );
    ~ChunkWorkerPool();

    ChunkWorkerPool(const ChunkWorkerPool&) = delete;
    ChunkWorkerPool& operator=(const ChunkWorkerPool&) = delete;

    void submit(Chunk chunk);

    // Drops queued chunks and tells workers to exit after their current one.
    // Does not wait for them.
    void shutdown();

    std::size_t queued() const;
    std::size_t size() const { return threads_.size(); }

private:
    void worker_loop(std::stop_token stop_token, Translator& translator);

    std::vector<std::unique_ptr<Translator>> translators_;
    Processor processor_;
    StartHandler on_start_;
    ResultHandler on_result_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Chunk> queue_;
    std::stop_source stop_source_;
    std::vector<std::jthread> threads_;
};

}  // namespace pseudo_mt

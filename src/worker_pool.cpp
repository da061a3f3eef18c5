#include "worker_pool.hpp"

#include "log.hpp"

#include <exception>
#include <utility>

namespace pseudo_mt {

ChunkWorkerPool::ChunkWorkerPool(
    std::vector<std::unique_ptr<Translator>> translators,
    Processor processor,
    StartHandler on_start,
    ResultHandler on_result
)
    : translators_(std::move(translators)),
      processor_(std::move(processor)),
      on_start_(std::move(on_start)),
      on_result_(std::move(on_result)) {
    threads_.reserve(translators_.size());
    for (auto& translator : translators_) {
        Translator& local_translator = *translator;
        threads_.emplace_back([this, &local_translator](std::stop_token) {
            worker_loop(stop_source_.get_token(), local_translator);
        });
    }
}

ChunkWorkerPool::~ChunkWorkerPool() {
    shutdown();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ChunkWorkerPool::submit(Chunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_source_.stop_requested()) {
            return;
        }
        queue_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

void ChunkWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }
    stop_source_.request_stop();
    cv_.notify_all();
}

std::size_t ChunkWorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ChunkWorkerPool::worker_loop(std::stop_token stop_token, Translator& translator) {
    while (true) {
        Chunk chunk;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait(lock, stop_token, [this]() { return !queue_.empty(); })) {
                return;
            }
            chunk = std::move(queue_.front());
            queue_.pop_front();
        }

        if (on_start_) {
            on_start_(chunk.index);
        }

        ChunkResult result;
        try {
            result = processor_(chunk, translator);
        } catch (const std::exception& ex) {
            log_error("worker failed on chunk " + std::to_string(chunk.index) + ": " + ex.what());
            result = ChunkResult{};
            result.index = chunk.index;
            result.success = false;
            result.error = ex.what();
        }

        on_result_(std::move(result));
    }
}

}  // namespace pseudo_mt

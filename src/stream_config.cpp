#include "stream_config.hpp"

#include <algorithm>
#include <cctype>

namespace pseudo_mt {
namespace {

constexpr std::size_t kMinChunkBytes = 64;
constexpr std::size_t kMaxChunkBytes = 1024 * 1024;

}  // namespace

bool validate_chunk_config(const ChunkConfig& config, std::string& error) {
    if (config.max_chunk_size < kMinChunkBytes || config.max_chunk_size > kMaxChunkBytes) {
        error = "max_chunk_size must be between " + std::to_string(kMinChunkBytes) + " and " +
            std::to_string(kMaxChunkBytes) + ", got " + std::to_string(config.max_chunk_size);
        return false;
    }
    if (config.min_chunk_size > config.max_chunk_size) {
        error = "min_chunk_size (" + std::to_string(config.min_chunk_size) +
            ") must not exceed max_chunk_size (" + std::to_string(config.max_chunk_size) + ")";
        return false;
    }
    if (config.overlap_size >= config.max_chunk_size) {
        error = "overlap_size must be smaller than max_chunk_size";
        return false;
    }
    if (config.max_lines_per_chunk == 0) {
        error = "max_lines_per_chunk must be at least 1";
        return false;
    }
    return true;
}

bool validate_stream_config(const StreamConfig& config, std::string& error) {
    if (config.max_concurrent_chunks == 0) {
        error = "max_concurrent_chunks must be at least 1";
        return false;
    }
    if (config.thread_pool_size == 0) {
        error = "thread_pool_size must be at least 1";
        return false;
    }
    if (config.chunk_timeout.count() <= 0) {
        error = "chunk_timeout must be positive";
        return false;
    }
    if (config.progress_interval.count() <= 0) {
        error = "progress_interval must be positive";
        return false;
    }
    if (config.max_queue_size == 0) {
        error = "max_queue_size must be at least 1";
        return false;
    }
    return true;
}

bool validate_buffer_config(const BufferConfig& config, std::string& error) {
    if (config.max_size_bytes != 0) {
        return true;
    }
    if (config.max_size_mb < 1 || config.max_size_mb > 4096) {
        error = "max_size_mb must be between 1 and 4096, got " + std::to_string(config.max_size_mb);
        return false;
    }
    return true;
}

bool parse_eviction_policy(const std::string& text, EvictionPolicy& out) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "lru") {
        out = EvictionPolicy::LRU;
        return true;
    }
    if (lowered == "fifo") {
        out = EvictionPolicy::FIFO;
        return true;
    }
    return false;
}

const char* eviction_policy_name(EvictionPolicy policy) {
    return policy == EvictionPolicy::FIFO ? "fifo" : "lru";
}

}  // namespace pseudo_mt

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace pseudo_mt {

struct ChunkConfig {
    std::size_t max_chunk_size = 4096;
    std::size_t min_chunk_size = 512;
    std::size_t overlap_size = 256;
    bool respect_boundaries = true;
    std::size_t max_lines_per_chunk = 100;
    bool chunk_by_blocks = true;
};

struct StreamConfig {
    bool enable_streaming = true;
    std::size_t min_size_for_streaming = 100 * 1024;
    std::size_t max_concurrent_chunks = 3;
    std::chrono::milliseconds chunk_timeout{30000};
    std::chrono::milliseconds progress_interval{500};
    bool maintain_context_window = true;
    std::size_t context_window_size = 1024;
    bool enable_backpressure = true;
    std::size_t max_queue_size = 10;
    std::size_t thread_pool_size = 4;
};

enum class EvictionPolicy {
    LRU,
    FIFO
};

struct BufferConfig {
    std::size_t max_size_mb = 50;
    // Exact capacity; overrides max_size_mb when non-zero.
    std::size_t max_size_bytes = 0;
    bool enable_compression = true;
    EvictionPolicy eviction_policy = EvictionPolicy::LRU;

    std::size_t capacity_bytes() const {
        return max_size_bytes != 0 ? max_size_bytes : max_size_mb * 1024 * 1024;
    }
};

bool validate_chunk_config(const ChunkConfig& config, std::string& error);
bool validate_stream_config(const StreamConfig& config, std::string& error);
bool validate_buffer_config(const BufferConfig& config, std::string& error);

bool parse_eviction_policy(const std::string& text, EvictionPolicy& out);
const char* eviction_policy_name(EvictionPolicy policy);

}  // namespace pseudo_mt

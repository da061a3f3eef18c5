#pragma once

#include "chunk_result.hpp"
#include "codec.hpp"
#include "stream_config.hpp"

#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pseudo_mt {

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t chunks = 0;
    std::size_t evictions = 0;
    std::size_t compressions = 0;
    double hit_rate = 0.0;
};

// Size-bounded store of chunk results keyed by chunk index. Results are kept
// serialized (and compressed when enabled), so resident_bytes() is what the
// cache actually holds. Safe for concurrent use.
class ResultCache {
public:
    explicit ResultCache(BufferConfig config, std::shared_ptr<const Codec> codec = nullptr);

    // Returns false, leaving the cache untouched, if the entry alone exceeds
    // the capacity. Otherwise evicts by policy until it fits.
    bool add(std::size_t index, const ChunkResult& result);
    std::optional<ChunkResult> get(std::size_t index);

    CacheStats stats() const;
    std::size_t resident_bytes() const;
    std::size_t capacity_bytes() const { return capacity_; }
    std::vector<std::size_t> indices() const;
    // Drops every entry and resets the statistics.
    void clear();

private:
    struct Entry {
        std::string bytes;
        std::list<std::size_t>::iterator position;
    };

    void erase_locked(std::map<std::size_t, Entry>::iterator it);

    BufferConfig config_;
    std::shared_ptr<const Codec> codec_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::map<std::size_t, Entry> entries_;
    // Front is the next eviction victim: least recently used for LRU, oldest
    // insertion for FIFO.
    std::list<std::size_t> order_;
    std::size_t resident_ = 0;
    CacheStats stats_;
};

std::string encode_chunk_result(const ChunkResult& result);
ChunkResult decode_chunk_result(const std::string& bytes);

}  // namespace pseudo_mt

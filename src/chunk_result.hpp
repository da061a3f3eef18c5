#pragma once

#include "block.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pseudo_mt {

struct ChunkResult {
    std::size_t index = 0;
    bool success = false;
    std::optional<std::vector<Block>> parsed_blocks;
    // Set only on success.
    std::optional<std::vector<Block>> translated_blocks;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    double processing_time_ms = 0.0;
};

struct StreamingProgress {
    std::size_t total_chunks = 0;
    std::size_t processed_chunks = 0;
    std::size_t bytes_processed = 0;
    std::size_t total_bytes = 0;
    std::optional<std::size_t> current_chunk;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    double percentage() const {
        if (total_chunks == 0) {
            return 0.0;
        }
        return static_cast<double>(processed_chunks) / static_cast<double>(total_chunks) * 100.0;
    }

    bool is_complete() const { return processed_chunks >= total_chunks; }
};

}  // namespace pseudo_mt

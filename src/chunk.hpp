#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pseudo_mt {

struct ChunkMetadata {
    bool single_chunk = false;
    bool ast_based = false;
    bool line_based = false;
    bool has_overlap = false;
    // Leading bytes of content repeated from the previous chunk.
    std::size_t overlap_bytes = 0;
    std::vector<std::string> boundary_types;
};

struct Chunk {
    std::string content;
    std::size_t start_line = 0;  // 1-based, inclusive
    std::size_t end_line = 0;
    std::size_t start_byte = 0;  // [start_byte, end_byte) into the source
    std::size_t end_byte = 0;
    std::size_t index = 0;
    std::size_t total_chunks = 0;
    ChunkMetadata metadata;

    std::size_t size() const { return content.size(); }
    std::size_t line_count() const { return end_line >= start_line ? end_line - start_line + 1 : 0; }
};

}  // namespace pseudo_mt

#pragma once

#include "chunk.hpp"
#include "stream_config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pseudo_mt {

// Position of one chunk in the source, before its content is copied out.
struct ChunkSpan {
    std::size_t start_line = 0;
    std::size_t end_line = 0;
    std::size_t start_byte = 0;
    std::size_t end_byte = 0;
    ChunkMetadata metadata;
};

std::vector<ChunkSpan> plan_chunks(const std::string& text, const ChunkConfig& config);

std::vector<Chunk> chunk_text(const std::string& text, const ChunkConfig& config);

// Lazy form of chunk_text: yields the same chunks one at a time. Only the
// split plan is computed up front; chunk contents are copied on demand.
class ChunkStream {
public:
    ChunkStream(std::string text, const ChunkConfig& config);

    std::optional<Chunk> next();
    std::size_t total_chunks() const { return plan_.size(); }

private:
    std::string text_;
    std::vector<ChunkSpan> plan_;
    std::size_t cursor_ = 0;
};

bool validate_chunks(const std::vector<Chunk>& chunks, const std::string& original, std::string& error);
bool validate_chunks(const std::vector<Chunk>& chunks, const std::string& original);

}  // namespace pseudo_mt

#pragma once

#include "chunk_result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pseudo_mt {

struct ReportEntry {
    std::size_t start_line = 0;
    std::size_t end_line = 0;
    std::string original;
    ChunkResult result;
};

struct TranslationReport {
    std::string source_name;
    std::string mode;
    // Sorted by result.index.
    std::vector<ReportEntry> chunks;
    std::vector<std::string> errors;
};

// Code emitted for one chunk: translated blocks joined by blank lines.
std::string chunk_translation_text(const ChunkResult& result);

}  // namespace pseudo_mt

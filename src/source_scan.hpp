#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pseudo_mt {

// Lexical state of one physical line, as seen by a Python-like scanner that
// understands brackets, comments, string literals and backslash continuation.
struct SourceLine {
    std::size_t start_byte = 0;
    std::size_t end_byte = 0;  // past the terminating '\n', or end of text
    std::size_t indent = 0;
    bool blank = false;
    bool comment_only = false;
    int depth_at_start = 0;
    bool in_string_at_start = false;
    bool continues = false;
};

struct SourceScan {
    std::vector<SourceLine> lines;
    bool balanced = true;
    std::string error;
};

SourceScan scan_source(const std::string& text);

// First word of a line after indentation, e.g. "def", "class", "@".
std::string leading_keyword(const std::string& text, const SourceLine& line);

}  // namespace pseudo_mt

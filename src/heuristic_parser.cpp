#include "heuristic_parser.hpp"

#include "source_scan.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace pseudo_mt {
namespace {

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool starts_with_word(const std::string& line, const std::string& word) {
    if (!line.starts_with(word)) {
        return false;
    }
    return line.size() == word.size() || line[word.size()] == ' ' || line[word.size()] == ':' ||
        line[word.size()] == '(';
}

std::size_t count_words(const std::string& line) {
    std::istringstream in(line);
    std::size_t words = 0;
    std::string word;
    while (in >> word) {
        ++words;
    }
    return words;
}

bool has_code_punctuation(const std::string& line) {
    static const char* markers[] = {"=", "(", "[", "{", "->", "+=", "-=", ";", "::", "!="};
    for (const char* marker : markers) {
        if (line.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string strip_trailing_blank_lines(const std::string& text) {
    const std::size_t last_visible = text.find_last_not_of(" \t\r\n");
    if (last_visible == std::string::npos) {
        return {};
    }
    std::size_t line_end = text.find('\n', last_visible);
    if (line_end == std::string::npos) {
        line_end = text.size();
    }
    if (line_end > 0 && text[line_end - 1] == '\r') {
        --line_end;
    }
    return text.substr(0, line_end);
}

}  // namespace

bool looks_like_code_line(const std::string& raw_line) {
    const std::string line = trim(raw_line);
    if (line.empty()) {
        return false;
    }

    static const std::unordered_set<std::string> bare_statements = {
        "pass", "break", "continue", "return", "else:", "try:", "finally:"
    };
    if (bare_statements.contains(line)) {
        return true;
    }

    if (starts_with_word(line, "def") || starts_with_word(line, "class") || starts_with_word(line, "import") ||
        starts_with_word(line, "async") || line.front() == '@') {
        return true;
    }
    if (starts_with_word(line, "from") && line.find(" import ") != std::string::npos) {
        return true;
    }
    if (has_code_punctuation(line)) {
        return true;
    }
    if (line.back() == ':' && count_words(line) <= 4) {
        return true;
    }
    if (line.back() == '.' || line.back() == '?') {
        return false;
    }

    return count_words(line) <= 2;
}

std::vector<std::string> HeuristicParser::identify_blocks(const std::string& text) const {
    std::vector<std::string> blocks;
    if (text.empty()) {
        return blocks;
    }

    const SourceScan scan = scan_source(text);
    std::size_t block_start = 0;
    bool previous_blank = false;
    bool previous_continues = false;

    for (const auto& line : scan.lines) {
        const bool opens_block = !line.blank && line.indent == 0 && line.depth_at_start == 0 &&
            !line.in_string_at_start && !previous_continues;

        if (opens_block && previous_blank && line.start_byte > block_start) {
            blocks.push_back(text.substr(block_start, line.start_byte - block_start));
            block_start = line.start_byte;
        }

        previous_blank = line.blank;
        if (!line.blank) {
            previous_continues = line.continues;
        }
    }

    blocks.push_back(text.substr(block_start));
    return blocks;
}

ParseResult HeuristicParser::parse(const std::string& text) const {
    ParseResult result;

    const SourceScan scan = scan_source(text);
    if (!scan.balanced) {
        result.errors.push_back(scan.error);
        return result;
    }

    std::size_t line_number = 1;
    for (const std::string& raw_block : identify_blocks(text)) {
        const std::size_t block_lines = static_cast<std::size_t>(
            std::count(raw_block.begin(), raw_block.end(), '\n')
        ) + (raw_block.empty() || raw_block.back() == '\n' ? 0 : 1);
        const std::size_t first_line = line_number;
        line_number += block_lines;

        const std::string content = strip_trailing_blank_lines(raw_block);
        if (trim(content).empty()) {
            continue;
        }

        bool has_code = false;
        bool has_english = false;
        bool has_comment = false;
        std::size_t content_lines = 0;

        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) {
            ++content_lines;
            const std::string trimmed = trim(line);
            if (trimmed.empty()) {
                continue;
            }
            if (trimmed.front() == '#') {
                has_comment = true;
            } else if (looks_like_code_line(trimmed)) {
                has_code = true;
            } else {
                has_english = true;
            }
        }

        Block block;
        block.content = content;
        block.start_line = first_line;
        block.end_line = first_line + (content_lines == 0 ? 0 : content_lines - 1);
        if (has_code && has_english) {
            block.type = BlockType::Mixed;
        } else if (has_english) {
            block.type = BlockType::English;
        } else if (has_code) {
            block.type = BlockType::Code;
        } else if (has_comment) {
            block.type = BlockType::Comment;
        }
        result.blocks.push_back(std::move(block));
    }

    result.success = true;
    return result;
}

}  // namespace pseudo_mt

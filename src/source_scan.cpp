#include "source_scan.hpp"

#include <cctype>

namespace pseudo_mt {
namespace {

bool is_open_bracket(char c) {
    return c == '(' || c == '[' || c == '{';
}

bool is_close_bracket(char c) {
    return c == ')' || c == ']' || c == '}';
}

bool is_triple_quote(const std::string& text, std::size_t pos, char quote) {
    return pos + 2 < text.size() && text[pos] == quote && text[pos + 1] == quote && text[pos + 2] == quote;
}

}  // namespace

SourceScan scan_source(const std::string& text) {
    SourceScan scan;

    int depth = 0;
    char triple_quote = 0;
    char single_quote = 0;
    std::size_t line_number = 1;
    std::size_t pos = 0;

    while (pos < text.size()) {
        SourceLine line;
        line.start_byte = pos;
        line.depth_at_start = depth;
        line.in_string_at_start = triple_quote != 0;

        std::size_t eol = text.find('\n', pos);
        const std::size_t content_end = eol == std::string::npos ? text.size() : eol;
        line.end_byte = eol == std::string::npos ? text.size() : eol + 1;

        std::size_t first = pos;
        while (first < content_end && (text[first] == ' ' || text[first] == '\t' || text[first] == '\r')) {
            ++first;
        }
        line.indent = first - pos;
        line.blank = first == content_end;
        line.comment_only = !line.blank && triple_quote == 0 && text[first] == '#';

        bool last_was_backslash = false;
        for (std::size_t i = pos; i < content_end; ++i) {
            const char c = text[i];
            if (c != '\r') {
                last_was_backslash = false;
            }

            if (triple_quote != 0) {
                if (c == '\\') {
                    ++i;
                    continue;
                }
                if (is_triple_quote(text, i, triple_quote)) {
                    triple_quote = 0;
                    i += 2;
                }
                continue;
            }

            if (single_quote != 0) {
                if (c == '\\') {
                    ++i;
                    continue;
                }
                if (c == single_quote) {
                    single_quote = 0;
                }
                continue;
            }

            if (c == '#') {
                break;
            }
            if (c == '"' || c == '\'') {
                if (is_triple_quote(text, i, c)) {
                    triple_quote = c;
                    i += 2;
                } else {
                    single_quote = c;
                }
                continue;
            }
            if (is_open_bracket(c)) {
                ++depth;
            } else if (is_close_bracket(c)) {
                if (depth == 0) {
                    if (scan.balanced) {
                        scan.balanced = false;
                        scan.error = std::string("unexpected '") + c + "' at line " + std::to_string(line_number);
                    }
                } else {
                    --depth;
                }
            } else if (c == '\\') {
                last_was_backslash = true;
            }
        }

        // Single-quoted strings never span lines.
        single_quote = 0;
        line.continues = last_was_backslash && triple_quote == 0;

        scan.lines.push_back(line);
        pos = line.end_byte;
        ++line_number;
    }

    if (scan.balanced && triple_quote != 0) {
        scan.balanced = false;
        scan.error = "unterminated triple-quoted string";
    }
    if (scan.balanced && depth > 0) {
        scan.balanced = false;
        scan.error = std::to_string(depth) + " unclosed bracket(s) at end of input";
    }

    return scan;
}

std::string leading_keyword(const std::string& text, const SourceLine& line) {
    std::size_t i = line.start_byte + line.indent;
    if (i >= line.end_byte) {
        return {};
    }
    if (text[i] == '@') {
        return "@";
    }

    std::string word;
    while (i < line.end_byte) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isalnum(c) == 0 && c != '_') {
            break;
        }
        word.push_back(static_cast<char>(c));
        ++i;
    }
    return word;
}

}  // namespace pseudo_mt

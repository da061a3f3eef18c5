#include "chunker.hpp"

#include "log.hpp"
#include "source_scan.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace pseudo_mt {
namespace {

struct StatementUnit {
    std::size_t first_line = 0;  // indices into SourceScan::lines, inclusive
    std::size_t last_line = 0;
    std::string kind;
};

bool is_whitespace_only(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::size_t line_bytes(const SourceLine& line) {
    return line.end_byte - line.start_byte;
}

bool is_clause_keyword(const std::string& keyword) {
    static const std::unordered_set<std::string> clauses = {"else", "elif", "except", "finally"};
    return clauses.contains(keyword);
}

std::string unit_kind(const std::string& keyword) {
    if (keyword == "def" || keyword == "async") {
        return "function";
    }
    if (keyword == "class") {
        return "class";
    }
    return "statement";
}

bool is_top_level_filler(const SourceLine& line) {
    return line.depth_at_start == 0 && !line.in_string_at_start && (line.blank || (line.comment_only && line.indent == 0));
}

std::vector<StatementUnit> top_level_units(const std::string& text, const SourceScan& scan, bool chunk_by_blocks) {
    std::vector<std::size_t> starts;
    std::vector<std::string> kinds;
    bool after_decorator = false;
    bool previous_continues = false;

    for (std::size_t i = 0; i < scan.lines.size(); ++i) {
        const SourceLine& line = scan.lines[i];
        const bool top_level = !line.blank && !line.comment_only && line.indent == 0 &&
            line.depth_at_start == 0 && !line.in_string_at_start && !previous_continues;

        if (!line.blank && !line.comment_only) {
            previous_continues = line.continues;
        }
        if (!top_level) {
            continue;
        }

        const std::string keyword = leading_keyword(text, line);
        if (is_clause_keyword(keyword)) {
            continue;
        }
        if (after_decorator) {
            // The decorated definition belongs to the unit its decorator opened.
            if (keyword != "@") {
                kinds.back() = unit_kind(keyword);
                after_decorator = false;
            }
            continue;
        }

        starts.push_back(i);
        kinds.push_back(keyword == "@" ? "function" : unit_kind(keyword));
        after_decorator = keyword == "@";
    }

    std::vector<StatementUnit> units;
    if (starts.empty()) {
        if (!scan.lines.empty()) {
            units.push_back({0, scan.lines.size() - 1, "statement"});
        }
        return units;
    }

    std::vector<std::size_t> boundaries = starts;
    if (chunk_by_blocks) {
        // Comments and blank lines directly above a statement travel with it.
        for (std::size_t k = 1; k < boundaries.size(); ++k) {
            std::size_t b = boundaries[k];
            while (b > boundaries[k - 1] + 1 && is_top_level_filler(scan.lines[b - 1])) {
                --b;
            }
            boundaries[k] = b;
        }
    }
    boundaries.front() = 0;

    for (std::size_t k = 0; k < boundaries.size(); ++k) {
        const std::size_t last = k + 1 < boundaries.size() ? boundaries[k + 1] - 1 : scan.lines.size() - 1;
        units.push_back({boundaries[k], last, kinds[k]});
    }
    return units;
}

ChunkSpan make_span(const SourceScan& scan, std::size_t first, std::size_t last) {
    ChunkSpan span;
    span.start_line = first + 1;
    span.end_line = last + 1;
    span.start_byte = scan.lines[first].start_byte;
    span.end_byte = scan.lines[last].end_byte;
    return span;
}

bool plan_boundary_aware(
    const std::string& text,
    const SourceScan& scan,
    const ChunkConfig& config,
    std::vector<ChunkSpan>& out
) {
    if (!scan.balanced) {
        log_debug("boundary scan failed (" + scan.error + "), using line-based chunking");
        return false;
    }

    const auto units = top_level_units(text, scan, config.chunk_by_blocks);
    std::vector<ChunkSpan> spans;

    std::size_t group_first = 0;
    std::size_t group_bytes = 0;
    std::size_t group_lines = 0;
    std::vector<std::string> group_kinds;
    bool group_open = false;

    auto close_group = [&](std::size_t last_line) {
        ChunkSpan span = make_span(scan, group_first, last_line);
        span.metadata.ast_based = true;
        span.metadata.boundary_types = group_kinds;
        spans.push_back(std::move(span));
        group_open = false;
        group_bytes = 0;
        group_lines = 0;
        group_kinds.clear();
    };

    for (std::size_t u = 0; u < units.size(); ++u) {
        const auto& unit = units[u];
        const std::size_t unit_bytes =
            scan.lines[unit.last_line].end_byte - scan.lines[unit.first_line].start_byte;
        const std::size_t unit_lines = unit.last_line - unit.first_line + 1;

        if (unit_bytes > config.max_chunk_size || unit_lines > config.max_lines_per_chunk) {
            log_debug(
                "statement at line " + std::to_string(unit.first_line + 1) +
                " exceeds chunk limits, using line-based chunking"
            );
            return false;
        }

        if (group_open && (group_bytes + unit_bytes > config.max_chunk_size ||
                           group_lines + unit_lines > config.max_lines_per_chunk)) {
            close_group(units[u - 1].last_line);
        }

        if (!group_open) {
            group_open = true;
            group_first = unit.first_line;
        }
        group_bytes += unit_bytes;
        group_lines += unit_lines;
        if (std::find(group_kinds.begin(), group_kinds.end(), unit.kind) == group_kinds.end()) {
            group_kinds.push_back(unit.kind);
        }
    }

    if (group_open) {
        close_group(units.back().last_line);
    }

    out = std::move(spans);
    return true;
}

std::vector<ChunkSpan> plan_line_based(const SourceScan& scan, const ChunkConfig& config) {
    std::vector<ChunkSpan> spans;
    const auto& lines = scan.lines;
    const std::size_t n = lines.size();

    std::size_t previous_body_first = 0;
    std::size_t i = 0;
    while (i < n) {
        std::size_t overlap_first = i;
        std::size_t overlap_bytes = 0;

        if (!spans.empty() && config.overlap_size > 0) {
            const std::size_t byte_budget = std::min(config.overlap_size, config.max_chunk_size / 2);
            const std::size_t line_budget = config.max_lines_per_chunk / 2;
            std::size_t j = i;
            while (j > previous_body_first) {
                const std::size_t len = line_bytes(lines[j - 1]);
                if (overlap_bytes + len > byte_budget || i - (j - 1) > line_budget) {
                    break;
                }
                overlap_bytes += len;
                --j;
            }
            overlap_first = j;

            if (overlap_bytes + line_bytes(lines[i]) > config.max_chunk_size) {
                overlap_first = i;
                overlap_bytes = 0;
            }
        }

        const std::size_t overlap_lines = i - overlap_first;
        const std::size_t byte_limit = config.max_chunk_size - overlap_bytes;
        const std::size_t line_limit = config.max_lines_per_chunk - overlap_lines;

        std::size_t size = 0;
        std::size_t k = i;
        while (k < n) {
            const std::size_t len = line_bytes(lines[k]);
            if (k > i && (size + len > byte_limit || k - i + 1 > line_limit)) {
                break;
            }
            size += len;
            ++k;
            if (size >= config.min_chunk_size && lines[k - 1].blank && k < n) {
                break;
            }
        }

        ChunkSpan span = make_span(scan, overlap_first, k - 1);
        span.metadata.line_based = true;
        span.metadata.has_overlap = overlap_bytes > 0;
        span.metadata.overlap_bytes = overlap_bytes;
        spans.push_back(std::move(span));

        previous_body_first = i;
        i = k;
    }

    return spans;
}

Chunk materialize(const std::string& text, const ChunkSpan& span, std::size_t index, std::size_t total) {
    Chunk chunk;
    chunk.content = text.substr(span.start_byte, span.end_byte - span.start_byte);
    chunk.start_line = span.start_line;
    chunk.end_line = span.end_line;
    chunk.start_byte = span.start_byte;
    chunk.end_byte = span.end_byte;
    chunk.index = index;
    chunk.total_chunks = total;
    chunk.metadata = span.metadata;
    return chunk;
}

std::size_t spanned_lines(const std::string& content) {
    if (content.empty()) {
        return 0;
    }
    const auto newlines = static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n'));
    return content.back() == '\n' ? newlines : newlines + 1;
}

}  // namespace

std::vector<ChunkSpan> plan_chunks(const std::string& text, const ChunkConfig& config) {
    if (is_whitespace_only(text)) {
        return {};
    }

    const SourceScan scan = scan_source(text);

    if (text.size() <= config.max_chunk_size) {
        ChunkSpan span = make_span(scan, 0, scan.lines.size() - 1);
        span.metadata.single_chunk = true;
        return {span};
    }

    if (config.respect_boundaries) {
        std::vector<ChunkSpan> spans;
        if (plan_boundary_aware(text, scan, config, spans)) {
            return spans;
        }
    }

    return plan_line_based(scan, config);
}

std::vector<Chunk> chunk_text(const std::string& text, const ChunkConfig& config) {
    const auto plan = plan_chunks(text, config);

    std::vector<Chunk> chunks;
    chunks.reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        chunks.push_back(materialize(text, plan[i], i, plan.size()));
    }
    return chunks;
}

ChunkStream::ChunkStream(std::string text, const ChunkConfig& config)
    : text_(std::move(text)), plan_(plan_chunks(text_, config)) {}

std::optional<Chunk> ChunkStream::next() {
    if (cursor_ >= plan_.size()) {
        return std::nullopt;
    }
    const std::size_t index = cursor_++;
    return materialize(text_, plan_[index], index, plan_.size());
}

bool validate_chunks(const std::vector<Chunk>& chunks, const std::string& original, std::string& error) {
    if (chunks.empty()) {
        if (!is_whitespace_only(original)) {
            error = "no chunks for non-empty input";
            return false;
        }
        return true;
    }

    std::string rebuilt;
    rebuilt.reserve(original.size());
    std::size_t expected_start = 0;

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        const std::string where = "chunk " + std::to_string(i) + ": ";

        if (chunk.index != i || chunk.total_chunks != chunks.size()) {
            error = where + "index/total mismatch";
            return false;
        }
        if (chunk.end_byte < chunk.start_byte || chunk.end_byte > original.size() ||
            chunk.end_byte - chunk.start_byte != chunk.size()) {
            error = where + "byte range inconsistent with content";
            return false;
        }
        if (original.compare(chunk.start_byte, chunk.size(), chunk.content) != 0) {
            error = where + "content differs from source range";
            return false;
        }
        if (chunk.metadata.overlap_bytes > chunk.size() ||
            chunk.start_byte + chunk.metadata.overlap_bytes != expected_start) {
            error = where + "does not continue where the previous chunk ended";
            return false;
        }

        const auto line_before = static_cast<std::size_t>(
            std::count(original.begin(), original.begin() + static_cast<std::ptrdiff_t>(chunk.start_byte), '\n')
        );
        if (chunk.start_line != line_before + 1 ||
            chunk.end_line + 1 != chunk.start_line + spanned_lines(chunk.content)) {
            error = where + "line numbers inconsistent with position";
            return false;
        }

        rebuilt.append(chunk.content, chunk.metadata.overlap_bytes, std::string::npos);
        expected_start = chunk.end_byte;
    }

    if (rebuilt != original) {
        error = "reassembled chunks differ from original input";
        return false;
    }
    return true;
}

bool validate_chunks(const std::vector<Chunk>& chunks, const std::string& original) {
    std::string ignored;
    return validate_chunks(chunks, original, ignored);
}

}  // namespace pseudo_mt

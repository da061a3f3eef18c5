#include "writer_md.hpp"

#include <fstream>

namespace pseudo_mt {

std::string chunk_translation_text(const ChunkResult& result) {
    std::string text;
    if (!result.translated_blocks) {
        return text;
    }
    for (const auto& block : *result.translated_blocks) {
        if (!text.empty()) {
            text += "\n\n";
        }
        text += block.content;
    }
    return text;
}

bool write_markdown_report(const std::filesystem::path& out_path, const TranslationReport& report, std::string& error) {
    std::ofstream out(out_path);
    if (!out) {
        error = "Failed to open markdown output: " + out_path.string();
        return false;
    }

    out << "# " << report.source_name << "\n\n";
    out << "Mode: " << report.mode << ", chunks: " << report.chunks.size() << "\n\n";

    for (const auto& entry : report.chunks) {
        const ChunkResult& result = entry.result;

        out << "## Chunk " << (result.index + 1);
        if (entry.end_line >= entry.start_line && entry.start_line > 0) {
            out << " (lines " << entry.start_line << "-" << entry.end_line << ")";
        }
        out << "\n";
        out << "**Status:** " << (result.success ? "ok" : "failed") << ", " << result.processing_time_ms
            << " ms\n\n";
        out << "**Original:**\n\n```text\n" << entry.original;
        if (!entry.original.empty() && entry.original.back() != '\n') {
            out << "\n";
        }
        out << "```\n\n";

        if (result.success) {
            out << "**Translated:**\n\n```python\n" << chunk_translation_text(result) << "\n```\n\n";
        }
        if (result.error) {
            out << "**Error:** " << *result.error << "\n\n";
        }
        if (!result.warnings.empty()) {
            out << "**Warnings:**\n";
            for (const auto& warning : result.warnings) {
                out << "- " << warning << "\n";
            }
            out << "\n";
        }
        out << "---\n\n";
    }

    if (!out) {
        error = "Failed to write markdown output: " + out_path.string();
        return false;
    }
    return true;
}

}  // namespace pseudo_mt

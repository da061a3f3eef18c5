#include "writer_xml.hpp"

#include <pugixml.hpp>

namespace pseudo_mt {
namespace {

void append_block(pugi::xml_node parent, const Block& block) {
    auto node = parent.append_child("block");
    node.append_attribute("type") = block_type_name(block.type);
    node.append_attribute("start_line") = static_cast<unsigned long long>(block.start_line);
    node.append_attribute("end_line") = static_cast<unsigned long long>(block.end_line);
    auto translated = block.metadata.find("translated");
    if (translated != block.metadata.end()) {
        node.append_attribute("translated") = translated->second.c_str();
    }
    node.text().set(block.content.c_str());
}

}  // namespace

bool write_xml_report(const std::filesystem::path& out_path, const TranslationReport& report, std::string& error) {
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("translation");
    root.append_attribute("source") = report.source_name.c_str();
    root.append_attribute("mode") = report.mode.c_str();
    root.append_attribute("chunks") = static_cast<unsigned long long>(report.chunks.size());

    for (const auto& entry : report.chunks) {
        const ChunkResult& result = entry.result;

        auto chunk = root.append_child("chunk");
        chunk.append_attribute("index") = static_cast<unsigned long long>(result.index);
        chunk.append_attribute("success") = result.success;
        chunk.append_attribute("time_ms") = result.processing_time_ms;
        chunk.append_attribute("start_line") = static_cast<unsigned long long>(entry.start_line);
        chunk.append_attribute("end_line") = static_cast<unsigned long long>(entry.end_line);

        const auto& blocks = result.translated_blocks ? result.translated_blocks : result.parsed_blocks;
        if (blocks) {
            for (const auto& block : *blocks) {
                append_block(chunk, block);
            }
        }
        for (const auto& warning : result.warnings) {
            chunk.append_child("warning").text().set(warning.c_str());
        }
        if (result.error) {
            chunk.append_child("error").text().set(result.error->c_str());
        }
    }

    for (const auto& message : report.errors) {
        root.append_child("error").text().set(message.c_str());
    }

    if (!doc.save_file(out_path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        error = "Failed to write XML report: " + out_path.string();
        return false;
    }
    return true;
}

}  // namespace pseudo_mt

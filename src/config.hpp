#pragma once

#include "ingest_modes.hpp"
#include "log.hpp"
#include "stream_config.hpp"

#include <cstddef>
#include <string>

namespace pseudo_mt {

struct AppConfig {
    // "-" means stdin / stdout.
    std::string input_path;
    std::string output_path;
    std::string model_path;
    StreamMode mode = StreamMode::FullDocument;

    ChunkConfig chunk;
    StreamConfig stream;
    BufferConfig buffer;

    int max_tokens = 384;
    int n_ctx = 4096;
    int n_gpu_layers = -1;
    int n_threads = 8;

    std::string report_xml_path;
    std::string markdown_path;
    bool show_progress = true;
    LogLevel log_level = LogLevel::Info;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace pseudo_mt

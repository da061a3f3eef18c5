#include "config.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace pseudo_mt {
namespace {

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    if (!value.empty() && value.front() == '-') {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(value));
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <file|-> --output <file|-> --model <gguf-path> [options]\n\n"
        << "Options:\n"
        << "  --mode <m>              document | line | block | interactive (default: document)\n"
        << "  --workers <n>           Worker threads (default: hardware concurrency)\n"
        << "  --concurrency <n>       Max chunks in flight; 1 is sequential (default: 3)\n"
        << "  --max-chunk-size <n>    Max chunk size in bytes (default: 4096)\n"
        << "  --min-chunk-size <n>    Preferred min chunk size in bytes (default: 512)\n"
        << "  --max-lines <n>         Max lines per chunk (default: 100)\n"
        << "  --overlap <n>           Overlap between line-based chunks in bytes (default: 256)\n"
        << "  --no-boundaries         Split by lines only, ignoring statement boundaries\n"
        << "  --context-window <n>    Context window in bytes (default: 1024)\n"
        << "  --chunk-timeout-ms <n>  Per-chunk timeout in parallel mode (default: 30000)\n"
        << "  --cache-mb <n>          Result cache capacity in MiB (default: 50)\n"
        << "  --eviction <p>          lru | fifo (default: lru)\n"
        << "  --no-compression        Keep cached results uncompressed\n"
        << "  --max-tokens <n>        Max generated tokens per block (default: 384)\n"
        << "  --ctx <n>               Context size (default: 4096)\n"
        << "  --n-gpu-layers <n>      llama.cpp GPU layers (default: -1)\n"
        << "  --threads <n>           llama.cpp CPU threads per context (default: 8)\n"
        << "  --report-xml <path>     Also write a per-chunk XML report\n"
        << "  --emit-markdown <path>  Also write a per-chunk Markdown report\n"
        << "  --no-progress           Disable progress bar output\n"
        << "  --quiet                 Only log errors\n"
        << "  --verbose               Log debug output\n"
        << "  -h, --help              Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    std::size_t workers = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_path = require_value(arg);
        } else if (arg == "--model") {
            config.model_path = require_value(arg);
        } else if (arg == "--mode") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_stream_mode(value, config.mode)) {
                error = "Unsupported --mode: " + value + " (supported: document, line, block, interactive)";
            }
        } else if (arg == "--workers") {
            if (!parse_size_arg(arg, require_value(arg), workers, error)) {
                return false;
            }
        } else if (arg == "--concurrency") {
            if (!parse_size_arg(arg, require_value(arg), config.stream.max_concurrent_chunks, error)) {
                return false;
            }
        } else if (arg == "--max-chunk-size") {
            if (!parse_size_arg(arg, require_value(arg), config.chunk.max_chunk_size, error)) {
                return false;
            }
        } else if (arg == "--min-chunk-size") {
            if (!parse_size_arg(arg, require_value(arg), config.chunk.min_chunk_size, error)) {
                return false;
            }
        } else if (arg == "--max-lines") {
            if (!parse_size_arg(arg, require_value(arg), config.chunk.max_lines_per_chunk, error)) {
                return false;
            }
        } else if (arg == "--overlap") {
            if (!parse_size_arg(arg, require_value(arg), config.chunk.overlap_size, error)) {
                return false;
            }
        } else if (arg == "--no-boundaries") {
            config.chunk.respect_boundaries = false;
        } else if (arg == "--context-window") {
            if (!parse_size_arg(arg, require_value(arg), config.stream.context_window_size, error)) {
                return false;
            }
        } else if (arg == "--chunk-timeout-ms") {
            std::size_t timeout_ms = 0;
            if (!parse_size_arg(arg, require_value(arg), timeout_ms, error)) {
                return false;
            }
            config.stream.chunk_timeout = std::chrono::milliseconds(timeout_ms);
        } else if (arg == "--cache-mb") {
            if (!parse_size_arg(arg, require_value(arg), config.buffer.max_size_mb, error)) {
                return false;
            }
        } else if (arg == "--eviction") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_eviction_policy(value, config.buffer.eviction_policy)) {
                error = "Unsupported --eviction: " + value + " (supported: lru, fifo)";
            }
        } else if (arg == "--no-compression") {
            config.buffer.enable_compression = false;
        } else if (arg == "--max-tokens") {
            if (!parse_int_arg(arg, require_value(arg), config.max_tokens, error)) {
                return false;
            }
        } else if (arg == "--ctx") {
            if (!parse_int_arg(arg, require_value(arg), config.n_ctx, error)) {
                return false;
            }
        } else if (arg == "--n-gpu-layers") {
            if (!parse_int_arg(arg, require_value(arg), config.n_gpu_layers, error)) {
                return false;
            }
        } else if (arg == "--threads") {
            if (!parse_int_arg(arg, require_value(arg), config.n_threads, error)) {
                return false;
            }
        } else if (arg == "--report-xml") {
            config.report_xml_path = require_value(arg);
        } else if (arg == "--emit-markdown") {
            config.markdown_path = require_value(arg);
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "--quiet") {
            config.log_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            config.log_level = LogLevel::Debug;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }
    config.stream.thread_pool_size = workers;

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.output_path.empty()) {
        error = "--output is required";
        return false;
    }
    if (config.model_path.empty()) {
        error = "--model is required";
        return false;
    }
    if (!validate_chunk_config(config.chunk, error) || !validate_stream_config(config.stream, error) ||
        !validate_buffer_config(config.buffer, error)) {
        return false;
    }

    return true;
}

}  // namespace pseudo_mt

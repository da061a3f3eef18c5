#include "assembler.hpp"
#include "codec_zstd.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "heuristic_parser.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "session.hpp"
#include "translator_llama.hpp"
#include "writer_md.hpp"
#include "writer_xml.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace pseudo_mt;

namespace {

struct RunSummary {
    std::size_t chunks = 0;
    std::size_t failed = 0;
    std::size_t warnings = 0;
    std::chrono::milliseconds wall_time{0};
};

bool read_input(const std::string& path, std::string& out, std::string& error) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open input: " + path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

bool check_model_file(const std::string& model_path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(model_path, ec)) {
        error = "Model file not found: " + model_path;
        return false;
    }
    return true;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(const StreamingProgress& progress, bool done) {
    const double ratio = progress.percentage() / 100.0;

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(ratio, 30)
        << "] "
        << std::setw(3) << static_cast<int>(progress.percentage()) << "% "
        << "chunks " << progress.processed_chunks << "/" << progress.total_chunks
        << " bytes " << progress.bytes_processed << "/" << progress.total_bytes;
    if (!progress.errors.empty()) {
        line << " errors " << progress.errors.size();
    }

    std::cerr << line.str();
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

class OutputSink {
public:
    bool open(const std::string& path, std::string& error) {
        if (path == "-") {
            out_ = &std::cout;
            return true;
        }
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        file_.open(path, std::ios::binary);
        if (!file_) {
            error = "Failed to open output: " + path;
            return false;
        }
        out_ = &file_;
        return true;
    }

    void write(const std::string& text) {
        *out_ << text;
        out_->flush();
    }

    bool good() const { return out_ != nullptr && out_->good(); }

private:
    std::ofstream file_;
    std::ostream* out_ = nullptr;
};

bool write_reports(const AppConfig& config, const TranslationReport& report) {
    bool ok = true;
    std::string error;
    if (!config.markdown_path.empty()) {
        if (!write_markdown_report(config.markdown_path, report, error)) {
            std::cerr << "[error] markdown report failed: " << error << "\n";
            ok = false;
        }
    }
    if (!config.report_xml_path.empty()) {
        if (!write_xml_report(config.report_xml_path, report, error)) {
            std::cerr << "[error] XML report failed: " << error << "\n";
            ok = false;
        }
    }
    return ok;
}

// Keeps status lines out of translated output written to stdout.
std::ostream& status_stream(const AppConfig& config) {
    return config.output_path == "-" ? std::cerr : std::cout;
}

std::string source_name(const std::string& input_path) {
    return input_path == "-" ? std::string("stdin") : std::filesystem::path(input_path).filename().string();
}

bool run_document(
    const AppConfig& config,
    const Translator& translator,
    const Parser& parser,
    const Assembler& assembler,
    std::shared_ptr<const Codec> codec,
    OutputSink& sink,
    RunSummary& summary
) {
    std::string text;
    std::string error;
    if (!read_input(config.input_path, text, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return false;
    }

    StreamingPipeline pipeline(
        translator,
        parser,
        assembler,
        config.chunk,
        config.stream,
        config.buffer,
        std::move(codec)
    );

    TranslationReport report;
    report.source_name = source_name(config.input_path);
    report.mode = stream_mode_name(config.mode);

    const auto started = std::chrono::steady_clock::now();

    if (!pipeline.should_use_streaming(text)) {
        log_debug("input below streaming threshold, translating in one piece");
        ChunkResult result;
        const std::string code = pipeline.translate_unchunked(text, result);
        sink.write(code);

        ReportEntry entry;
        entry.start_line = 1;
        entry.end_line = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
        entry.original = text;
        entry.result = std::move(result);
        report.chunks.push_back(std::move(entry));
    } else {
        ProgressCallback progress_callback;
        if (config.show_progress) {
            progress_callback = [](const StreamingProgress& progress) { print_progress(progress, false); };
        }

        std::vector<ChunkResult> results;
        {
            ResultStream stream = pipeline.stream_translate(text, progress_callback);
            while (auto result = stream.next()) {
                if (!result->success) {
                    log_warning(
                        "chunk " + std::to_string(result->index) + " failed: " + result->error.value_or("unknown error")
                    );
                }
                results.push_back(std::move(*result));
            }
        }
        if (config.show_progress) {
            print_progress(pipeline.progress(), true);
        }

        sink.write(pipeline.assemble_streamed());

        std::sort(results.begin(), results.end(), [](const ChunkResult& a, const ChunkResult& b) {
            return a.index < b.index;
        });
        const auto& chunks = pipeline.chunks();
        for (auto& result : results) {
            ReportEntry entry;
            if (result.index < chunks.size()) {
                entry.start_line = chunks[result.index].start_line;
                entry.end_line = chunks[result.index].end_line;
                entry.original = chunks[result.index].content;
            }
            entry.result = std::move(result);
            report.chunks.push_back(std::move(entry));
        }

        const MemoryUsage memory = pipeline.memory_usage();
        const CacheStats cache = pipeline.cache().stats();
        log_debug(
            "cache: resident=" + std::to_string(memory.buffer_size_bytes) + " hits=" + std::to_string(cache.hits) +
            " misses=" + std::to_string(cache.misses) + " evictions=" + std::to_string(cache.evictions)
        );
    }

    const StreamingProgress progress = pipeline.progress();
    report.errors = progress.errors;

    summary.chunks = progress.processed_chunks;
    summary.failed = progress.errors.size();
    summary.warnings = progress.warnings.size();
    summary.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    const PipelineStats stats = pipeline.stats();
    status_stream(config)
        << "[ok] " << report.source_name
        << " chunks=" << stats.chunks_total
        << " workers=" << stats.workers_used
        << " time_ms=" << stats.wall_time.count()
        << " ms_per_chunk=" << stats.ms_per_chunk
        << "\n";

    return write_reports(config, report);
}

bool run_session(
    const AppConfig& config,
    const Translator& translator,
    const Parser& parser,
    const Assembler& assembler,
    std::shared_ptr<const Codec> codec,
    OutputSink& sink,
    RunSummary& summary
) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (config.input_path != "-") {
        file.open(config.input_path, std::ios::binary);
        if (!file) {
            std::cerr << "[fatal] Failed to open input: " << config.input_path << "\n";
            return false;
        }
        in = &file;
    }

    if (!config.markdown_path.empty() || !config.report_xml_path.empty()) {
        log_warning("reports are only written in document mode");
    }

    SessionConfig session_config;
    session_config.chunk = config.chunk;
    session_config.stream = config.stream;
    session_config.buffer = config.buffer;
    session_config.codec = std::move(codec);

    StreamSession session(translator, parser, assembler, std::move(session_config));
    session.add_event_listener([](const StreamingEvent& event) {
        if (event.type == EventType::Warning) {
            log_debug("event warning: " + event.message);
        }
    });

    const auto started = std::chrono::steady_clock::now();
    {
        TranslationStream stream = session.translate_stream(input_from_lines(*in), config.mode);
        while (auto fragment = stream.next()) {
            sink.write(*fragment);
        }
    }

    const StreamingProgress progress = session.progress();
    summary.chunks = progress.processed_chunks;
    summary.failed = progress.errors.size();
    summary.warnings = progress.warnings.size();
    summary.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    status_stream(config)
        << "[ok] " << source_name(config.input_path)
        << " mode=" << stream_mode_name(config.mode)
        << " units=" << progress.processed_chunks
        << " state=" << session_state_name(session.state())
        << "\n";
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    set_log_level(config.log_level);

    if (!check_model_file(config.model_path, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    LlamaTranslatorConfig translator_cfg;
    translator_cfg.model_path = config.model_path;
    translator_cfg.n_ctx = config.n_ctx;
    translator_cfg.n_gpu_layers = config.n_gpu_layers;
    translator_cfg.n_threads = config.n_threads;
    translator_cfg.max_tokens = config.max_tokens;
    translator_cfg.max_context_chars = config.stream.context_window_size * 2;

    std::unique_ptr<LlamaTranslator> translator;
    try {
        translator = std::make_unique<LlamaTranslator>(translator_cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] failed to initialize translator: " << ex.what() << "\n";
        return 1;
    }

    HeuristicParser parser;
    BasicAssembler assembler;
    std::shared_ptr<const Codec> codec;
    if (config.buffer.enable_compression) {
        codec = std::make_shared<ZstdCodec>();
    }

    OutputSink sink;
    if (!sink.open(config.output_path, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    RunSummary summary;
    bool ok = false;
    try {
        if (config.mode == StreamMode::FullDocument) {
            ok = run_document(config, *translator, parser, assembler, codec, sink, summary);
        } else {
            ok = run_session(config, *translator, parser, assembler, codec, sink, summary);
        }
    } catch (const StreamingError& ex) {
        std::cerr << "[fatal] streaming failed: " << ex.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[fatal] invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    if (!sink.good()) {
        std::cerr << "[error] failed writing output: " << config.output_path << "\n";
        ok = false;
    }

    status_stream(config)
        << "[summary] mode=" << stream_mode_name(config.mode)
        << " chunks=" << summary.chunks
        << " failed=" << summary.failed
        << " warnings=" << summary.warnings
        << " time_ms=" << summary.wall_time.count()
        << "\n";

    return ok ? 0 : 1;
}

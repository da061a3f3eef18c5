#include "pipeline.hpp"

#include "chunker.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "source_scan.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace pseudo_mt {
namespace {

constexpr std::size_t kContextTailLines = 10;
constexpr std::size_t kQueuedChunkEstimateBytes = 4096;

std::size_t count_newlines(const std::string& text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

std::string last_lines(std::string text, std::size_t count) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    std::size_t pos = text.size();
    for (std::size_t seen = 0; seen < count; ++seen) {
        const std::size_t newline = pos == 0 ? std::string::npos : text.rfind('\n', pos - 1);
        if (newline == std::string::npos) {
            return text;
        }
        pos = newline;
    }
    return text.substr(pos + 1);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Removes the first `count` lines of a block plus any blank lines after them.
// Returns the number of lines removed.
std::size_t drop_leading_lines(std::string& content, std::size_t count) {
    std::size_t removed = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        const std::size_t newline = content.find('\n', pos);
        const std::string line =
            content.substr(pos, newline == std::string::npos ? std::string::npos : newline - pos);
        if (removed >= count && !is_blank(line)) {
            break;
        }
        ++removed;
        pos = newline == std::string::npos ? content.size() : newline + 1;
    }
    content.erase(0, pos);
    return removed;
}

// Keeps the blocks that belong to this chunk, dropping whatever was parsed
// from the context prefix or the overlap with the previous chunk, and maps
// line numbers back to the source.
std::vector<Block> own_blocks(
    std::vector<Block> blocks,
    std::size_t prefix_lines,
    std::size_t skip_lines,
    std::size_t chunk_start_line
) {
    std::vector<Block> out;
    for (Block& block : blocks) {
        if (block.end_line <= skip_lines) {
            continue;
        }
        if (block.start_line <= skip_lines) {
            block.start_line += drop_leading_lines(block.content, skip_lines - block.start_line + 1);
            if (block.content.empty()) {
                continue;
            }
        }
        block.start_line = block.start_line - prefix_lines + chunk_start_line - 1;
        block.end_line = block.end_line - prefix_lines + chunk_start_line - 1;
        out.push_back(std::move(block));
    }
    return out;
}

std::string code_of(const std::vector<Block>& blocks) {
    std::string code;
    for (const auto& block : blocks) {
        if (block.type != BlockType::Code) {
            continue;
        }
        if (!code.empty()) {
            code += '\n';
        }
        code += block.content;
    }
    return code;
}

const BufferConfig& checked(const BufferConfig& config) {
    std::string error;
    if (!validate_buffer_config(config, error)) {
        throw std::invalid_argument("invalid buffer config: " + error);
    }
    return config;
}

}  // namespace

ResultStream::ResultStream(ResultStream&& other) noexcept
    : pipeline_(std::exchange(other.pipeline_, nullptr)), run_id_(other.run_id_) {}

ResultStream& ResultStream::operator=(ResultStream&& other) noexcept {
    if (this != &other) {
        if (pipeline_ != nullptr) {
            pipeline_->finish_run(run_id_);
        }
        pipeline_ = std::exchange(other.pipeline_, nullptr);
        run_id_ = other.run_id_;
    }
    return *this;
}

ResultStream::~ResultStream() {
    if (pipeline_ != nullptr) {
        pipeline_->finish_run(run_id_);
    }
}

std::optional<ChunkResult> ResultStream::next() {
    if (pipeline_ == nullptr) {
        return std::nullopt;
    }
    return pipeline_->next_result(run_id_);
}

StreamingPipeline::StreamingPipeline(
    const Translator& prototype,
    const Parser& parser,
    const Assembler& assembler,
    ChunkConfig chunk_config,
    StreamConfig stream_config,
    BufferConfig buffer_config,
    std::shared_ptr<const Codec> codec
)
    : prototype_(prototype),
      parser_(parser),
      assembler_(assembler),
      chunk_config_(chunk_config),
      stream_config_(stream_config),
      cache_(checked(buffer_config), std::move(codec)),
      context_window_(stream_config.context_window_size) {
    std::string error;
    if (!validate_chunk_config(chunk_config_, error)) {
        throw std::invalid_argument("invalid chunk config: " + error);
    }
    if (!validate_stream_config(stream_config_, error)) {
        throw std::invalid_argument("invalid stream config: " + error);
    }
}

StreamingPipeline::~StreamingPipeline() {
    finish_run(run_id_);

    std::unique_ptr<ChunkWorkerPool> pool;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        pool = std::move(pool_);
    }
    // Joins workers; a translation still running is waited for here.
    pool.reset();
}

bool StreamingPipeline::should_use_streaming(const std::string& text) const {
    return stream_config_.enable_streaming && text.size() >= stream_config_.min_size_for_streaming;
}

ResultStream StreamingPipeline::stream_translate(const std::string& text, ProgressCallback progress_callback) {
    finish_run(run_id_);

    std::unique_ptr<ChunkWorkerPool> previous_pool;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        previous_pool = std::move(pool_);
        completed_.clear();
        in_flight_.clear();
        abandoned_.clear();
    }
    previous_pool.reset();

    cancelled_ = false;
    cache_.clear();
    context_window_.clear();

    chunks_ = chunk_text(text, chunk_config_);
    next_dispatch_ = 0;
    parallel_ = stream_config_.max_concurrent_chunks > 1;

    std::size_t workers_used = 1;
    try {
        if (parallel_) {
            workers_used = std::min(stream_config_.thread_pool_size, std::max<std::size_t>(chunks_.size(), 1));
            std::vector<std::unique_ptr<Translator>> translators;
            translators.reserve(workers_used);
            for (std::size_t i = 0; i < workers_used; ++i) {
                translators.push_back(prototype_.clone());
            }
            auto pool = std::make_unique<ChunkWorkerPool>(
                std::move(translators),
                [this](const Chunk& chunk, Translator& translator) { return process_chunk(chunk, translator); },
                [this](std::size_t index) { on_chunk_started(index); },
                [this](ChunkResult result) { on_chunk_finished(std::move(result)); }
            );
            std::lock_guard<std::mutex> lock(channel_mutex_);
            pool_ = std::move(pool);
        } else {
            sequential_translator_ = prototype_.clone();
        }
    } catch (const std::exception& ex) {
        throw StreamingError(std::string("failed to initialize translator: ") + ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_ = StreamingProgress{};
        progress_.total_chunks = chunks_.size();
        progress_.total_bytes = text.size();
        stats_ = PipelineStats{};
        stats_.chunks_total = chunks_.size();
        stats_.workers_used = workers_used;
    }
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        run_callback_ = std::move(progress_callback);
    }

    log_info(
        "streaming " + std::to_string(text.size()) + " bytes as " + std::to_string(chunks_.size()) +
        " chunk(s), " + (parallel_ ? std::to_string(workers_used) + " worker(s)" : std::string("sequential"))
    );

    run_started_ = Clock::now();
    run_active_ = true;
    ++run_id_;
    start_reporter();
    return ResultStream(this, run_id_);
}

std::optional<ChunkResult> StreamingPipeline::next_result(std::size_t run_id) {
    if (!run_active_ || run_id != run_id_) {
        return std::nullopt;
    }

    auto result = parallel_ ? next_parallel() : next_sequential();
    if (!result) {
        finish_run(run_id);
    }
    return result;
}

std::optional<ChunkResult> StreamingPipeline::next_sequential() {
    if (cancelled_.load() || next_dispatch_ >= chunks_.size()) {
        return std::nullopt;
    }

    const Chunk& chunk = chunks_[next_dispatch_++];
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_.current_chunk = chunk.index;
    }
    notify_chunk_started(chunk.index);

    ChunkResult result = process_chunk(chunk, *sequential_translator_);
    record(result, chunk.size());
    return result;
}

std::optional<ChunkResult> StreamingPipeline::next_parallel() {
    if (!cancelled_.load()) {
        dispatch_ready_chunks();
    }

    std::unique_lock<std::mutex> lock(channel_mutex_);
    while (true) {
        if (!completed_.empty()) {
            ChunkResult result = std::move(completed_.front());
            completed_.pop_front();
            lock.unlock();
            record(result, chunks_[result.index].size());
            return result;
        }
        if (cancelled_.load() || in_flight_.empty()) {
            return std::nullopt;
        }

        const auto earliest = std::min_element(
            in_flight_.begin(),
            in_flight_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; }
        );
        const std::size_t index = earliest->first;
        const Clock::time_point deadline = earliest->second;

        if (Clock::now() >= deadline) {
            in_flight_.erase(earliest);
            abandoned_.insert(index);
            lock.unlock();

            ChunkResult result;
            result.index = index;
            result.error = "Chunk " + std::to_string(index) + " timed out after " +
                std::to_string(stream_config_.chunk_timeout.count()) + " ms";
            result.processing_time_ms = static_cast<double>(stream_config_.chunk_timeout.count());
            log_warning(*result.error);
            record(result, chunks_[index].size());
            return result;
        }

        channel_cv_.wait_until(lock, deadline);
    }
}

void StreamingPipeline::dispatch_ready_chunks() {
    const std::size_t limit = stream_config_.enable_backpressure
        ? stream_config_.max_concurrent_chunks
        : std::max(stream_config_.max_concurrent_chunks, stream_config_.max_queue_size);

    std::optional<std::size_t> last_dispatched;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (!pool_) {
            return;
        }
        // Results not yet consumed still count against the window.
        while (in_flight_.size() + completed_.size() < limit && next_dispatch_ < chunks_.size()) {
            const Chunk& chunk = chunks_[next_dispatch_++];
            in_flight_[chunk.index] = Clock::now() + stream_config_.chunk_timeout;
            pool_->submit(chunk);
            last_dispatched = chunk.index;
        }
    }

    if (last_dispatched) {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_.current_chunk = last_dispatched;
    }
}

void StreamingPipeline::on_chunk_started(std::size_t index) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        auto it = in_flight_.find(index);
        if (it == in_flight_.end()) {
            return;
        }
        it->second = Clock::now() + stream_config_.chunk_timeout;
    }
    notify_chunk_started(index);
}

void StreamingPipeline::notify_chunk_started(std::size_t index) {
    std::function<void(std::size_t)> callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = chunk_started_callback_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(index);
    } catch (const std::exception& ex) {
        log_warning(std::string("chunk start callback failed: ") + ex.what());
    }
}

void StreamingPipeline::on_chunk_finished(ChunkResult result) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (abandoned_.contains(result.index)) {
            log_debug("dropping late result for chunk " + std::to_string(result.index));
            return;
        }
        if (in_flight_.erase(result.index) == 0) {
            return;
        }
        completed_.push_back(std::move(result));
    }
    channel_cv_.notify_all();
}

void StreamingPipeline::record(const ChunkResult& result, std::size_t chunk_bytes) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_.processed_chunks += 1;
    progress_.bytes_processed += chunk_bytes;
    if (result.error) {
        progress_.errors.push_back("chunk " + std::to_string(result.index) + ": " + *result.error);
    }
    progress_.warnings.insert(progress_.warnings.end(), result.warnings.begin(), result.warnings.end());
}

ChunkResult StreamingPipeline::process_chunk(const Chunk& chunk, Translator& translator) {
    const auto started = Clock::now();
    auto elapsed_ms = [&started]() {
        return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
    };

    ChunkResult result;
    result.index = chunk.index;

    try {
        std::optional<ChunkResult> previous;
        if (chunk.index > 0 && stream_config_.maintain_context_window) {
            // May be absent in parallel runs; the chunk then goes without it.
            previous = cache_.get(chunk.index - 1);
        }

        const std::string prefix = context_prefix(previous, chunk.index);
        const std::size_t prefix_lines = count_newlines(prefix);
        const std::size_t overlap_lines = count_newlines(chunk.content.substr(0, chunk.metadata.overlap_bytes));

        ParseResult parsed = parser_.parse(prefix + chunk.content);
        result.warnings = parsed.warnings;
        if (!parsed.success) {
            result.error = "Parse error: " + join(parsed.errors, "; ");
            log_warning("chunk " + std::to_string(chunk.index) + ": " + *result.error);
        } else {
            translate_blocks(chunk, previous, prefix_lines, overlap_lines, std::move(parsed.blocks), translator, result);
        }
    } catch (const std::exception& ex) {
        log_error("chunk " + std::to_string(chunk.index) + " failed: " + ex.what());
        result.success = false;
        result.error = ex.what();
        result.translated_blocks.reset();
    }

    result.processing_time_ms = elapsed_ms();
    store_result(result);
    return result;
}

void StreamingPipeline::store_result(ChunkResult& result) {
    // Held throughout so a chunk cannot time out between the check and the store.
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (abandoned_.contains(result.index)) {
        return;
    }

    if (result.translated_blocks) {
        update_context_window(*result.translated_blocks);
    }
    try {
        if (!cache_.add(result.index, result)) {
            result.warnings.push_back(
                "result for chunk " + std::to_string(result.index) + " exceeds the cache capacity and was not kept"
            );
        }
    } catch (const std::exception& ex) {
        log_error("caching chunk " + std::to_string(result.index) + " failed: " + ex.what());
        result.warnings.push_back(std::string("result not cached: ") + ex.what());
    }
}

void StreamingPipeline::translate_blocks(
    const Chunk& chunk,
    const std::optional<ChunkResult>& previous,
    std::size_t prefix_lines,
    std::size_t overlap_lines,
    std::vector<Block> parsed_blocks,
    Translator& translator,
    ChunkResult& result
) {
    std::vector<Block> blocks =
        own_blocks(std::move(parsed_blocks), prefix_lines, prefix_lines + overlap_lines, chunk.start_line);
    result.parsed_blocks = blocks;

    const TranslationContext context = build_translation_context(previous, chunk.index);
    std::vector<Block> translated;
    translated.reserve(blocks.size());
    for (const Block& block : blocks) {
        if (block.type != BlockType::English) {
            translated.push_back(block);
            continue;
        }
        try {
            Block code_block = block;
            code_block.type = BlockType::Code;
            code_block.content = translator.translate(block.content, context);
            code_block.metadata["translated"] = "true";
            translated.push_back(std::move(code_block));
        } catch (const std::exception& ex) {
            const std::string warning =
                "Translation failed at line " + std::to_string(block.start_line) + ": " + ex.what();
            log_warning("chunk " + std::to_string(chunk.index) + ": " + warning);
            result.warnings.push_back(warning);
            translated.push_back(block);
        }
    }

    result.translated_blocks = std::move(translated);
    result.success = true;
}

std::string StreamingPipeline::context_prefix(
    const std::optional<ChunkResult>& previous,
    std::size_t chunk_index
) const {
    if (!previous || !previous->translated_blocks || previous->translated_blocks->empty()) {
        return {};
    }
    const std::string tail = last_lines(previous->translated_blocks->back().content, kContextTailLines);
    // A tail cut inside a bracket or string would make the chunk unparseable.
    if (tail.empty() || !scan_source(tail).balanced) {
        return {};
    }
    return tail + "\n\n# --- Chunk " + std::to_string(chunk_index) + " ---\n\n";
}

TranslationContext StreamingPipeline::build_translation_context(
    const std::optional<ChunkResult>& previous,
    std::size_t chunk_index
) const {
    TranslationContext context;
    context["chunk_index"] = std::to_string(chunk_index);
    context["after"] = "";

    std::string before;
    if (previous && previous->translated_blocks) {
        before = code_of(*previous->translated_blocks);
        if (before.size() > stream_config_.context_window_size) {
            before.erase(0, before.size() - stream_config_.context_window_size);
        }
    }
    context["before"] = before;
    context["code"] = before;

    if (stream_config_.maintain_context_window) {
        const std::string recent = context_window_.context();
        if (!recent.empty()) {
            context["window"] = recent;
        }
    }
    return context;
}

void StreamingPipeline::update_context_window(const std::vector<Block>& blocks) {
    if (!stream_config_.maintain_context_window) {
        return;
    }
    for (const auto& block : blocks) {
        if (block.type == BlockType::Code) {
            context_window_.add_context(block.content + "\n");
        }
    }
}

std::string StreamingPipeline::assemble_streamed() {
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        total = progress_.total_chunks;
    }

    std::vector<Block> blocks;
    for (std::size_t index = 0; index < total; ++index) {
        auto result = cache_.get(index);
        if (!result || !result->translated_blocks) {
            continue;
        }
        blocks.insert(blocks.end(), result->translated_blocks->begin(), result->translated_blocks->end());
    }
    return assembler_.assemble(blocks);
}

std::string StreamingPipeline::translate_unchunked(const std::string& text, ChunkResult& out_result) {
    std::unique_ptr<Translator> translator;
    try {
        translator = prototype_.clone();
    } catch (const std::exception& ex) {
        throw StreamingError(std::string("failed to initialize translator: ") + ex.what());
    }

    cache_.clear();
    context_window_.clear();

    Chunk chunk;
    chunk.content = text;
    chunk.start_line = 1;
    chunk.end_line = std::max<std::size_t>(
        1,
        count_newlines(text) + (text.empty() || text.back() == '\n' ? 0 : 1)
    );
    chunk.end_byte = text.size();
    chunk.total_chunks = 1;
    chunk.metadata.single_chunk = true;

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_ = StreamingProgress{};
        progress_.total_chunks = 1;
        progress_.total_bytes = text.size();
        progress_.current_chunk = 0;
        stats_ = PipelineStats{};
        stats_.chunks_total = 1;
        stats_.workers_used = 1;
    }

    const auto started = Clock::now();
    out_result = process_chunk(chunk, *translator);
    record(out_result, text.size());
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        stats_.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        stats_.ms_per_chunk = static_cast<double>(stats_.wall_time.count());
    }

    if (!out_result.success || !out_result.translated_blocks) {
        return text;
    }
    return assembler_.assemble(*out_result.translated_blocks);
}

void StreamingPipeline::add_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void StreamingPipeline::set_chunk_started_callback(std::function<void(std::size_t)> callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    chunk_started_callback_ = std::move(callback);
}

void StreamingPipeline::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    log_info("cancellation requested");
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (pool_) {
            pool_->shutdown();
        }
    }
    channel_cv_.notify_all();
}

StreamingProgress StreamingPipeline::progress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_;
}

PipelineStats StreamingPipeline::stats() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return stats_;
}

MemoryUsage StreamingPipeline::memory_usage() const {
    MemoryUsage usage;
    usage.buffer_size_bytes = cache_.resident_bytes();
    usage.context_window_size_bytes = context_window_.size_bytes();

    std::size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        queued = completed_.size() + (pool_ ? pool_->queued() : 0);
    }
    usage.queue_size_estimate_bytes = queued * kQueuedChunkEstimateBytes;
    return usage;
}

void StreamingPipeline::finish_run(std::size_t run_id) {
    if (!run_active_ || run_id != run_id_) {
        return;
    }
    run_active_ = false;

    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (pool_) {
            // Does not wait: a chunk still running finishes in the background.
            pool_->shutdown();
        }
    }
    sequential_translator_.reset();

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        stats_.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - run_started_);
        const double wall_seconds = static_cast<double>(stats_.wall_time.count()) / 1000.0;
        if (wall_seconds > 0.0) {
            stats_.chunks_per_second = static_cast<double>(progress_.processed_chunks) / wall_seconds;
        }
        if (progress_.processed_chunks > 0) {
            stats_.ms_per_chunk = static_cast<double>(stats_.wall_time.count()) /
                static_cast<double>(progress_.processed_chunks);
        }
    }

    stop_reporter();
    log_debug("run finished" + std::string(cancelled_.load() ? " (cancelled)" : ""));
}

void StreamingPipeline::start_reporter() {
    stop_reporter();
    reporter_ = std::jthread([this](std::stop_token stop_token) {
        std::mutex wait_mutex;
        std::condition_variable_any wait_cv;
        while (!stop_token.stop_requested()) {
            report_progress();
            std::unique_lock<std::mutex> lock(wait_mutex);
            wait_cv.wait_for(lock, stop_token, stream_config_.progress_interval, []() { return false; });
        }
        report_progress();
    });
}

void StreamingPipeline::stop_reporter() {
    if (reporter_.joinable()) {
        reporter_.request_stop();
        reporter_.join();
    }
}

void StreamingPipeline::report_progress() {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
        if (run_callback_) {
            callbacks.push_back(run_callback_);
        }
    }
    if (callbacks.empty()) {
        return;
    }

    const StreamingProgress snapshot = progress();
    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& ex) {
            log_warning(std::string("progress callback failed: ") + ex.what());
        }
    }
}

}  // namespace pseudo_mt

#pragma once

#include "assembler.hpp"
#include "chunk.hpp"
#include "chunk_result.hpp"
#include "codec.hpp"
#include "context_window.hpp"
#include "parser.hpp"
#include "result_cache.hpp"
#include "stream_config.hpp"
#include "translator.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace pseudo_mt {

using ProgressCallback = std::function<void(const StreamingProgress&)>;

struct MemoryUsage {
    std::size_t buffer_size_bytes = 0;
    std::size_t context_window_size_bytes = 0;
    std::size_t queue_size_estimate_bytes = 0;
};

struct PipelineStats {
    std::size_t chunks_total = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
    double chunks_per_second = 0.0;
    double ms_per_chunk = 0.0;
};

class StreamingPipeline;

// Pull handle over one streaming run. Each next() advances processing and
// returns the next finished chunk result, or nullopt once the input is
// exhausted or the run was cancelled. Sequential runs yield in chunk order;
// parallel runs yield in completion order.
class ResultStream {
public:
    ResultStream() = default;
    ResultStream(ResultStream&& other) noexcept;
    ResultStream& operator=(ResultStream&& other) noexcept;
    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;
    ~ResultStream();

    std::optional<ChunkResult> next();

private:
    friend class StreamingPipeline;
    ResultStream(StreamingPipeline* pipeline, std::size_t run_id) : pipeline_(pipeline), run_id_(run_id) {}

    StreamingPipeline* pipeline_ = nullptr;
    std::size_t run_id_ = 0;
};

// Chunk-level orchestrator: splits input, translates chunks sequentially or
// on a worker pool, caches results and reassembles them in order.
// The translator, parser and assembler must outlive the pipeline. A codec is
// required when buffer_config enables compression.
class StreamingPipeline {
public:
    StreamingPipeline(
        const Translator& prototype,
        const Parser& parser,
        const Assembler& assembler,
        ChunkConfig chunk_config,
        StreamConfig stream_config,
        BufferConfig buffer_config,
        std::shared_ptr<const Codec> codec = nullptr
    );
    ~StreamingPipeline();

    StreamingPipeline(const StreamingPipeline&) = delete;
    StreamingPipeline& operator=(const StreamingPipeline&) = delete;

    bool should_use_streaming(const std::string& text) const;

    // Starts a run over text; any previous run is finished first. Throws
    // StreamingError if the translators for the run cannot be created.
    ResultStream stream_translate(const std::string& text, ProgressCallback progress_callback = {});

    // Translates one chunk with the given translator. Never throws; failures
    // come back as a result with success = false.
    ChunkResult process_chunk(const Chunk& chunk, Translator& translator);

    // Concatenates cached translated blocks for chunks 0..total-1 in index
    // order, skipping chunks that failed or are no longer cached.
    std::string assemble_streamed();

    // Whole-input path for small documents. Returns the assembled code, or
    // the input unchanged if the translation failed.
    std::string translate_unchunked(const std::string& text, ChunkResult& out_result);

    void add_progress_callback(ProgressCallback callback);

    // Called with a chunk index when its processing begins; from worker
    // threads in parallel runs.
    void set_chunk_started_callback(std::function<void(std::size_t)> callback);

    // Stops a run in progress: no new chunks are dispatched, and the next
    // call to next() yields only results already finished.
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    StreamingProgress progress() const;
    PipelineStats stats() const;
    MemoryUsage memory_usage() const;

    ResultCache& cache() { return cache_; }
    const ResultCache& cache() const { return cache_; }
    const ContextWindow& context_window() const { return context_window_; }
    // Chunks of the current or last run, in index order.
    const std::vector<Chunk>& chunks() const { return chunks_; }
    const ChunkConfig& chunk_config() const { return chunk_config_; }
    const StreamConfig& stream_config() const { return stream_config_; }

private:
    friend class ResultStream;

    using Clock = std::chrono::steady_clock;

    std::optional<ChunkResult> next_result(std::size_t run_id);
    std::optional<ChunkResult> next_sequential();
    std::optional<ChunkResult> next_parallel();
    void dispatch_ready_chunks();
    void on_chunk_started(std::size_t index);
    void notify_chunk_started(std::size_t index);
    void on_chunk_finished(ChunkResult result);
    void record(const ChunkResult& result, std::size_t chunk_bytes);
    void store_result(ChunkResult& result);
    void finish_run(std::size_t run_id);
    void start_reporter();
    void stop_reporter();
    void report_progress();

    std::string context_prefix(const std::optional<ChunkResult>& previous, std::size_t chunk_index) const;
    TranslationContext build_translation_context(
        const std::optional<ChunkResult>& previous,
        std::size_t chunk_index
    ) const;
    void translate_blocks(
        const Chunk& chunk,
        const std::optional<ChunkResult>& previous,
        std::size_t prefix_lines,
        std::size_t overlap_lines,
        std::vector<Block> parsed_blocks,
        Translator& translator,
        ChunkResult& result
    );
    void update_context_window(const std::vector<Block>& blocks);

    const Translator& prototype_;
    const Parser& parser_;
    const Assembler& assembler_;
    ChunkConfig chunk_config_;
    StreamConfig stream_config_;

    ResultCache cache_;
    ContextWindow context_window_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex progress_mutex_;
    StreamingProgress progress_;
    PipelineStats stats_;
    std::chrono::steady_clock::time_point run_started_;
    bool parallel_ = false;

    std::mutex callbacks_mutex_;
    std::vector<ProgressCallback> callbacks_;
    ProgressCallback run_callback_;
    std::function<void(std::size_t)> chunk_started_callback_;
    std::jthread reporter_;

    // Per-run state, touched only by the thread pulling results.
    std::vector<Chunk> chunks_;
    std::size_t next_dispatch_ = 0;
    std::size_t run_id_ = 0;
    bool run_active_ = false;
    std::unique_ptr<Translator> sequential_translator_;

    // Results handed over by workers.
    mutable std::mutex channel_mutex_;
    std::condition_variable channel_cv_;
    std::deque<ChunkResult> completed_;
    // Chunk index -> deadline. The clock restarts when a worker picks it up.
    std::map<std::size_t, Clock::time_point> in_flight_;
    std::set<std::size_t> abandoned_;

    // Declared last so workers stop before the state they report into.
    std::unique_ptr<ChunkWorkerPool> pool_;
};

}  // namespace pseudo_mt

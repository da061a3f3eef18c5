#pragma once

#include "assembler.hpp"
#include "codec.hpp"
#include "context_window.hpp"
#include "event_queue.hpp"
#include "ingest_modes.hpp"
#include "parser.hpp"
#include "pipeline.hpp"
#include "stream_config.hpp"
#include "streaming_event.hpp"
#include "translator.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pseudo_mt {

enum class SessionState {
    Idle,
    Started,
    Processing,
    Paused,
    Cancelled,
    Error,
    Completed
};

const char* session_state_name(SessionState state);

// Returns the next input unit, or nullopt at end of input.
using InputSource = std::function<std::optional<std::string>()>;
using UpdateCallback = std::function<void(const TranslationUpdate&)>;
using StatementPredicate = std::function<bool(const std::string&)>;

InputSource input_from_units(std::vector<std::string> units);
// One unit per line, newline included. The stream must outlive the source.
InputSource input_from_lines(std::istream& in);

struct SessionConfig {
    ChunkConfig chunk;
    StreamConfig stream;
    BufferConfig buffer;
    std::shared_ptr<const Codec> codec;
    std::size_t event_queue_size = 1000;
    std::size_t interactive_history = 5;
    // Empty means is_complete_statement().
    StatementPredicate complete_statement;
};

class StreamSession;

// Pull handle over one session run: next() consumes input as needed and
// returns the next piece of translated text, or nullopt when done.
class TranslationStream {
public:
    TranslationStream(TranslationStream&& other) noexcept;
    TranslationStream& operator=(TranslationStream&&) = delete;
    TranslationStream(const TranslationStream&) = delete;
    TranslationStream& operator=(const TranslationStream&) = delete;
    ~TranslationStream();

    // Throws StreamingError on a session-level failure.
    std::optional<std::string> next();

private:
    friend class StreamSession;
    TranslationStream(
        StreamSession* session,
        std::size_t stream_id,
        std::unique_ptr<IngestProcessor> processor,
        InputSource input
    );

    void finish(bool exhausted);

    StreamSession* session_ = nullptr;
    std::size_t stream_id_ = 0;
    std::unique_ptr<IngestProcessor> processor_;
    InputSource input_;
    std::deque<std::string> pending_;
    bool input_done_ = false;
    bool finished_ = false;
};

// Runs TranslationStream::next() on a background thread per call. Calls are
// chained, so results arrive in the same order as from the synchronous form.
class AsyncTranslationStream {
public:
    explicit AsyncTranslationStream(TranslationStream stream);

    std::future<std::optional<std::string>> next();

private:
    std::shared_ptr<TranslationStream> stream_;
    std::shared_future<void> last_;
};

// Real-time translation session. One stream runs at a time; pause(),
// resume() and cancel() may be called from any thread.
class StreamSession final : private IngestHost {
public:
    StreamSession(
        const Translator& prototype,
        const Parser& parser,
        const Assembler& assembler,
        SessionConfig config
    );
    ~StreamSession() override;

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Throws StreamingError (state Error) if the session cannot be set up,
    // or if a stream is already running.
    TranslationStream translate_stream(InputSource input, StreamMode mode, UpdateCallback on_update = {});
    AsyncTranslationStream translate_stream_async(InputSource input, StreamMode mode, UpdateCallback on_update = {});

    std::size_t add_event_listener(EventListener listener);
    bool remove_event_listener(std::size_t id);

    void pause();
    void resume();
    void cancel();

    SessionState state() const;
    bool is_cancelled() const override;
    StreamingProgress progress() const;
    StreamingPipeline& pipeline() override { return pipeline_; }

private:
    friend class TranslationStream;

    const Parser& parser() const override { return parser_; }
    Translator& translator() override { return *translator_; }
    std::string translate_block(const Block& block, std::size_t chunk_index, std::size_t block_index) override;
    void emit(StreamingEvent event) override;
    void notify_update(const TranslationUpdate& update) override;
    bool is_complete_statement(const std::string& text) const override;
    std::size_t interactive_history() const override { return config_.interactive_history; }
    void record_unit(std::size_t bytes, const std::string& error) override;
    void mirror_progress(const StreamingProgress& progress) override;

    void wait_if_paused();
    void begin_processing();
    void end_stream(std::size_t stream_id, bool exhausted);
    [[noreturn]] void fail(const std::string& message);

    const Translator& prototype_;
    const Parser& parser_;
    SessionConfig config_;

    // Declared before the pipeline: its workers report into it.
    EventDispatcher events_;
    StreamingPipeline pipeline_;
    ContextWindow context_window_;
    std::unique_ptr<Translator> translator_;
    UpdateCallback on_update_;

    mutable std::mutex mutex_;
    std::condition_variable pause_cv_;
    SessionState state_ = SessionState::Idle;
    bool paused_ = false;
    std::atomic<bool> cancelled_{false};
    std::size_t stream_id_ = 0;
    bool stream_active_ = false;

    mutable std::mutex progress_mutex_;
    StreamingProgress progress_;
};

}  // namespace pseudo_mt

#include "session.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <exception>
#include <istream>
#include <utility>

namespace pseudo_mt {
namespace {

// Marks the end of one async step, also when it throws.
class StepDone {
public:
    explicit StepDone(std::shared_ptr<std::promise<void>> done) : done_(std::move(done)) {}
    ~StepDone() { done_->set_value(); }

    StepDone(const StepDone&) = delete;
    StepDone& operator=(const StepDone&) = delete;

private:
    std::shared_ptr<std::promise<void>> done_;
};

}  // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Started: return "started";
        case SessionState::Processing: return "processing";
        case SessionState::Paused: return "paused";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Error: return "error";
        case SessionState::Completed: return "completed";
    }
    return "unknown";
}

InputSource input_from_units(std::vector<std::string> units) {
    auto state = std::make_shared<std::pair<std::vector<std::string>, std::size_t>>(std::move(units), 0);
    return [state]() -> std::optional<std::string> {
        if (state->second >= state->first.size()) {
            return std::nullopt;
        }
        return state->first[state->second++];
    };
}

InputSource input_from_lines(std::istream& in) {
    return [&in]() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(in, line)) {
            return std::nullopt;
        }
        if (!in.eof()) {
            line += '\n';
        }
        return line;
    };
}

TranslationStream::TranslationStream(
    StreamSession* session,
    std::size_t stream_id,
    std::unique_ptr<IngestProcessor> processor,
    InputSource input
)
    : session_(session), stream_id_(stream_id), processor_(std::move(processor)), input_(std::move(input)) {}

TranslationStream::TranslationStream(TranslationStream&& other) noexcept
    : session_(std::exchange(other.session_, nullptr)),
      stream_id_(other.stream_id_),
      processor_(std::move(other.processor_)),
      input_(std::move(other.input_)),
      pending_(std::move(other.pending_)),
      input_done_(other.input_done_),
      finished_(other.finished_) {}

TranslationStream::~TranslationStream() {
    if (session_ != nullptr && !finished_) {
        finish(false);
    }
}

std::optional<std::string> TranslationStream::next() {
    if (session_ == nullptr) {
        return std::nullopt;
    }

    try {
        while (true) {
            if (!pending_.empty()) {
                std::string text = std::move(pending_.front());
                pending_.pop_front();
                return text;
            }
            if (finished_) {
                return std::nullopt;
            }
            if (session_->is_cancelled()) {
                finish(false);
                continue;
            }

            session_->wait_if_paused();
            if (session_->is_cancelled()) {
                continue;
            }

            if (!input_done_) {
                std::optional<std::string> unit = input_();
                if (!unit) {
                    input_done_ = true;
                    processor_->finish(pending_);
                    continue;
                }
                session_->begin_processing();
                processor_->consume(*unit, pending_);
                continue;
            }

            if (!processor_->pump(pending_)) {
                finish(true);
            }
        }
    } catch (const std::exception& ex) {
        finished_ = true;
        pending_.clear();
        session_->fail(ex.what());
    }
}

void TranslationStream::finish(bool exhausted) {
    finished_ = true;
    session_->end_stream(stream_id_, exhausted);
}

AsyncTranslationStream::AsyncTranslationStream(TranslationStream stream)
    : stream_(std::make_shared<TranslationStream>(std::move(stream))) {}

std::future<std::optional<std::string>> AsyncTranslationStream::next() {
    auto done = std::make_shared<std::promise<void>>();
    std::shared_future<void> previous = std::exchange(last_, done->get_future().share());

    return std::async(std::launch::async, [stream = stream_, previous, done]() {
        StepDone step_done(done);
        if (previous.valid()) {
            previous.wait();
        }
        return stream->next();
    });
}

StreamSession::StreamSession(
    const Translator& prototype,
    const Parser& parser,
    const Assembler& assembler,
    SessionConfig config
)
    : prototype_(prototype),
      parser_(parser),
      config_(std::move(config)),
      events_(config_.event_queue_size),
      pipeline_(prototype, parser, assembler, config_.chunk, config_.stream, config_.buffer, config_.codec),
      context_window_(config_.stream.context_window_size) {}

StreamSession::~StreamSession() {
    pipeline_.set_chunk_started_callback({});
    pipeline_.cancel();
    events_.stop();
}

TranslationStream StreamSession::translate_stream(InputSource input, StreamMode mode, UpdateCallback on_update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_active_) {
            throw StreamingError("a translation stream is already running");
        }
        cancelled_ = false;
        paused_ = false;
        state_ = SessionState::Started;
        stream_active_ = true;
        ++stream_id_;
    }
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_ = StreamingProgress{};
    }
    context_window_.clear();
    on_update_ = std::move(on_update);

    events_.start();
    StreamingEvent started;
    started.type = EventType::Started;
    started.data["mode"] = stream_mode_name(mode);
    emit(std::move(started));

    try {
        translator_ = prototype_.clone();
    } catch (const std::exception& ex) {
        fail(std::string("failed to initialize translator: ") + ex.what());
    }

    log_info(std::string("translation stream started (") + stream_mode_name(mode) + " mode)");
    return TranslationStream(this, stream_id_, make_ingest_processor(mode, *this), std::move(input));
}

AsyncTranslationStream StreamSession::translate_stream_async(
    InputSource input,
    StreamMode mode,
    UpdateCallback on_update
) {
    return AsyncTranslationStream(translate_stream(std::move(input), mode, std::move(on_update)));
}

std::size_t StreamSession::add_event_listener(EventListener listener) {
    return events_.add_listener(std::move(listener));
}

bool StreamSession::remove_event_listener(std::size_t id) {
    return events_.remove_listener(id);
}

void StreamSession::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Started && state_ != SessionState::Processing) {
        return;
    }
    state_ = SessionState::Paused;
    paused_ = true;
}

void StreamSession::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Paused) {
            return;
        }
        state_ = SessionState::Processing;
        paused_ = false;
    }
    pause_cv_.notify_all();
}

void StreamSession::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        paused_ = false;
        if (state_ != SessionState::Completed && state_ != SessionState::Error) {
            state_ = SessionState::Cancelled;
        }
    }
    pause_cv_.notify_all();
    pipeline_.cancel();

    log_info("translation stream cancelled");
    StreamingEvent event;
    event.type = EventType::Cancelled;
    event.progress = progress();
    emit(std::move(event));
}

SessionState StreamSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StreamSession::is_cancelled() const {
    return cancelled_.load();
}

StreamingProgress StreamSession::progress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_;
}

std::string StreamSession::translate_block(const Block& block, std::size_t chunk_index, std::size_t block_index) {
    switch (block.type) {
        case BlockType::English:
            break;
        case BlockType::Code:
            context_window_.add_context(block.content + "\n");
            return block.content;
        case BlockType::Comment:
        case BlockType::Mixed:
            return block.content;
    }

    StreamingEvent started;
    started.type = EventType::TranslationStarted;
    started.chunk_index = chunk_index;
    started.data["block_type"] = block_type_name(block.type);
    started.data["block_index"] = std::to_string(block_index);
    emit(std::move(started));

    TranslationContext context;
    context["code"] = context_window_.context();
    context["streaming"] = "true";
    context["mode"] = "real-time";

    std::string translated;
    try {
        translated = translator_->translate(block.content, context);
    } catch (const std::exception& ex) {
        const std::string warning = std::string("Failed to translate block: ") + ex.what();
        log_warning(warning);
        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            progress_.warnings.push_back(warning);
        }
        StreamingEvent event;
        event.type = EventType::Warning;
        event.message = warning;
        event.chunk_index = chunk_index;
        emit(std::move(event));
        return block.content;
    }

    context_window_.add_context(translated + "\n");

    StreamingEvent completed;
    completed.type = EventType::TranslationCompleted;
    completed.chunk_index = chunk_index;
    completed.data["block_index"] = std::to_string(block_index);
    emit(std::move(completed));
    return translated;
}

void StreamSession::emit(StreamingEvent event) {
    events_.push(std::move(event));
}

void StreamSession::notify_update(const TranslationUpdate& update) {
    if (!on_update_) {
        return;
    }
    try {
        on_update_(update);
    } catch (const std::exception& ex) {
        log_warning(std::string("update callback failed: ") + ex.what());
    }
}

bool StreamSession::is_complete_statement(const std::string& text) const {
    if (config_.complete_statement) {
        return config_.complete_statement(text);
    }
    return pseudo_mt::is_complete_statement(text);
}

void StreamSession::record_unit(std::size_t bytes, const std::string& error) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_.total_chunks += 1;
    progress_.processed_chunks += 1;
    progress_.total_bytes += bytes;
    progress_.bytes_processed += bytes;
    progress_.current_chunk = progress_.processed_chunks - 1;
    if (!error.empty()) {
        progress_.errors.push_back(error);
    }
}

void StreamSession::mirror_progress(const StreamingProgress& progress) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    // Keep translation warnings raised by this session.
    std::vector<std::string> own_warnings = std::move(progress_.warnings);
    progress_ = progress;
    progress_.warnings.insert(progress_.warnings.begin(), own_warnings.begin(), own_warnings.end());
}

void StreamSession::wait_if_paused() {
    std::unique_lock<std::mutex> lock(mutex_);
    pause_cv_.wait(lock, [this]() { return !paused_ || cancelled_.load(); });
}

void StreamSession::begin_processing() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Started) {
        state_ = SessionState::Processing;
    }
}

void StreamSession::end_stream(std::size_t stream_id, bool exhausted) {
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_active_ || stream_id != stream_id_) {
            return;
        }
        if (exhausted && !cancelled_.load() && state_ != SessionState::Error) {
            state_ = SessionState::Completed;
            completed = true;
        }
    }

    if (completed) {
        const StreamingProgress snapshot = progress();
        log_info(
            "translation stream completed: " + std::to_string(snapshot.processed_chunks) + " unit(s), " +
            std::to_string(snapshot.warnings.size()) + " warning(s)"
        );
        StreamingEvent event;
        event.type = EventType::Completed;
        event.progress = snapshot;
        emit(std::move(event));
    } else if (!cancelled_.load()) {
        // Dropped before reaching the end of input.
        cancel();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_active_ = false;
    }
    events_.stop();
}

void StreamSession::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Error;
        stream_active_ = false;
    }
    log_error("translation stream failed: " + message);

    StreamingEvent event;
    event.type = EventType::Error;
    event.message = message;
    event.progress = progress();
    emit(std::move(event));
    events_.stop();

    throw StreamingError(message);
}

}  // namespace pseudo_mt

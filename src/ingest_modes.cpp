#include "ingest_modes.hpp"

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace pseudo_mt {
namespace {

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string with_newline(const std::string& unit) {
    if (!unit.empty() && unit.back() == '\n') {
        return unit;
    }
    return unit + "\n";
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

StreamingEvent warning_event(const std::string& message, std::optional<std::size_t> chunk_index = std::nullopt) {
    StreamingEvent event;
    event.type = EventType::Warning;
    event.message = message;
    event.chunk_index = chunk_index;
    return event;
}

// Parses one accumulated unit and appends each block's translation, with
// `suffix`, to out. Returns false if the unit did not parse.
bool translate_unit(
    IngestHost& host,
    const std::string& text,
    std::size_t chunk_index,
    bool partial,
    const std::string& suffix,
    std::deque<std::string>& out
) {
    const ParseResult parsed = host.parser().parse(text);
    if (!parsed.success) {
        const std::string message = "Parse error: " + join(parsed.errors, "; ");
        log_warning("unit " + std::to_string(chunk_index) + ": " + message);
        host.emit(warning_event(message, chunk_index));
        host.record_unit(text.size(), message);
        return false;
    }

    for (std::size_t block_index = 0; block_index < parsed.blocks.size(); ++block_index) {
        if (host.is_cancelled()) {
            break;
        }
        const Block& block = parsed.blocks[block_index];
        std::string translated = host.translate_block(block, chunk_index, block_index);
        if (translated.empty()) {
            continue;
        }

        TranslationUpdate update;
        update.chunk_index = chunk_index;
        update.block_index = block_index;
        update.original_content = block.content;
        update.translated_content = translated;
        update.is_partial = partial;
        update.metadata["block_type"] = block_type_name(block.type);
        host.notify_update(update);

        out.push_back(std::move(translated) + suffix);
    }
    host.record_unit(text.size(), {});
    return true;
}

class LineByLineProcessor final : public IngestProcessor {
public:
    explicit LineByLineProcessor(IngestHost& host) : host_(host) {}

    void consume(const std::string& unit, std::deque<std::string>& out) override {
        buffer_ += with_newline(unit);
        if (!host_.is_complete_statement(buffer_)) {
            return;
        }
        const std::string statement = std::move(buffer_);
        buffer_.clear();
        translate_unit(host_, statement, statement_index_++, false, "\n", out);
    }

    void finish(std::deque<std::string>& out) override {
        if (trim(buffer_).empty()) {
            return;
        }
        const std::string remaining = std::move(buffer_);
        buffer_.clear();
        translate_unit(host_, remaining, statement_index_++, true, "\n", out);
    }

private:
    IngestHost& host_;
    std::string buffer_;
    std::size_t statement_index_ = 0;
};

class BlockByBlockProcessor final : public IngestProcessor {
public:
    explicit BlockByBlockProcessor(IngestHost& host) : host_(host) {}

    void consume(const std::string& unit, std::deque<std::string>& out) override {
        accumulated_ += unit;

        std::vector<std::string> blocks = host_.parser().identify_blocks(accumulated_);
        if (blocks.size() <= 1) {
            return;
        }

        // The last block may still be growing.
        for (std::size_t i = 0; i + 1 < blocks.size(); ++i) {
            if (host_.is_cancelled()) {
                break;
            }
            if (trim(blocks[i]).empty()) {
                continue;
            }
            translate_unit(host_, blocks[i], block_counter_++, false, "\n\n", out);
        }
        accumulated_ = std::move(blocks.back());
    }

    void finish(std::deque<std::string>& out) override {
        if (trim(accumulated_).empty()) {
            return;
        }
        const std::string remaining = std::move(accumulated_);
        accumulated_.clear();
        translate_unit(host_, remaining, block_counter_++, true, "\n", out);
    }

private:
    IngestHost& host_;
    std::string accumulated_;
    std::size_t block_counter_ = 0;
};

// Collects the whole input, then runs it through the pipeline and releases
// chunk translations in chunk order.
class FullDocumentProcessor final : public IngestProcessor {
public:
    explicit FullDocumentProcessor(IngestHost& host) : host_(host) {}

    void consume(const std::string& unit, std::deque<std::string>& out) override {
        (void)out;
        document_ += unit;
    }

    void finish(std::deque<std::string>& out) override {
        (void)out;
        StreamingPipeline& pipeline = host_.pipeline();
        // Workers may still call back after this processor is gone, so the
        // callbacks hold the host only.
        IngestHost& host = host_;
        pipeline.set_chunk_started_callback([&host](std::size_t index) {
            StreamingEvent event;
            event.type = EventType::ChunkStarted;
            event.chunk_index = index;
            host.emit(std::move(event));
        });
        stream_ = pipeline.stream_translate(document_, [&host](const StreamingProgress& progress) {
            StreamingEvent event;
            event.type = EventType::ProgressUpdate;
            event.progress = progress;
            host.emit(std::move(event));
        });
        document_.clear();
        running_ = true;
    }

    bool pump(std::deque<std::string>& out) override {
        if (!running_) {
            return false;
        }

        std::optional<ChunkResult> result = stream_.next();
        if (!result) {
            for (auto& [index, fragment] : reorder_) {
                if (!fragment.empty()) {
                    out.push_back(std::move(fragment));
                }
            }
            reorder_.clear();
            host_.mirror_progress(host_.pipeline().progress());
            host_.pipeline().set_chunk_started_callback({});
            running_ = false;
            return false;
        }

        const StreamingProgress progress = host_.pipeline().progress();
        host_.mirror_progress(progress);

        StreamingEvent completed;
        completed.type = EventType::ChunkCompleted;
        completed.chunk_index = result->index;
        completed.progress = progress;
        completed.data["success"] = result->success ? "true" : "false";
        host_.emit(std::move(completed));

        for (const auto& warning : result->warnings) {
            host_.emit(warning_event(warning, result->index));
        }
        if (result->error) {
            host_.emit(warning_event(*result->error, result->index));
        }

        reorder_[result->index] = fragment_for(*result);
        while (!reorder_.empty() && reorder_.begin()->first == next_index_) {
            if (!reorder_.begin()->second.empty()) {
                out.push_back(std::move(reorder_.begin()->second));
            }
            reorder_.erase(reorder_.begin());
            ++next_index_;
        }
        return true;
    }

private:
    std::string fragment_for(const ChunkResult& result) {
        if (!result.translated_blocks || result.translated_blocks->empty()) {
            return {};
        }
        const auto& translated = *result.translated_blocks;
        std::vector<std::string> parts;
        parts.reserve(translated.size());
        for (std::size_t i = 0; i < translated.size(); ++i) {
            TranslationUpdate update;
            update.chunk_index = result.index;
            update.block_index = i;
            if (result.parsed_blocks && i < result.parsed_blocks->size()) {
                update.original_content = (*result.parsed_blocks)[i].content;
            }
            update.translated_content = translated[i].content;
            update.metadata = translated[i].metadata;
            host_.notify_update(update);
            parts.push_back(translated[i].content);
        }
        return join(parts, "\n\n") + "\n\n";
    }

    IngestHost& host_;
    std::string document_;
    ResultStream stream_;
    bool running_ = false;
    std::map<std::size_t, std::string> reorder_;
    std::size_t next_index_ = 0;
};

class InteractiveProcessor final : public IngestProcessor {
public:
    explicit InteractiveProcessor(IngestHost& host) : host_(host) {}

    void consume(const std::string& unit, std::deque<std::string>& out) override {
        const std::size_t turn = turn_++;
        remember("# User input " + std::to_string(turn) + ":\n" + unit);

        TranslationContext context;
        context["mode"] = "interactive";
        context["session_history"] = history();
        context["interaction_count"] = std::to_string(turn);

        const ParseResult parsed = host_.parser().parse(unit);
        if (!parsed.success) {
            const std::string message = "Parse error: " + join(parsed.errors, "; ");
            host_.emit(warning_event(message, turn));
            host_.record_unit(unit.size(), message);
            respond("# Error: Failed to translate - " + message + "\n\n", out);
            return;
        }

        std::vector<std::string> translations;
        for (const Block& block : parsed.blocks) {
            std::string translated = block.content;
            if (block.type == BlockType::English) {
                StreamingEvent started;
                started.type = EventType::TranslationStarted;
                started.chunk_index = turn;
                started.data["block_type"] = block_type_name(block.type);
                host_.emit(std::move(started));
                try {
                    translated = host_.translator().translate(block.content, context);
                } catch (const std::exception& ex) {
                    const std::string message = std::string("Failed to translate - ") + ex.what();
                    log_warning("turn " + std::to_string(turn) + ": " + message);
                    host_.emit(warning_event(message, turn));
                    host_.record_unit(unit.size(), message);
                    respond("# Error: " + message + "\n\n", out);
                    return;
                }
                StreamingEvent finished;
                finished.type = EventType::TranslationCompleted;
                finished.chunk_index = turn;
                host_.emit(std::move(finished));
            }

            TranslationUpdate update;
            update.chunk_index = turn;
            update.original_content = unit;
            update.translated_content = translated;
            update.metadata["interactive"] = "true";
            host_.notify_update(update);

            translations.push_back(std::move(translated));
        }

        host_.record_unit(unit.size(), {});
        const std::string response = join(translations, "\n");
        remember("# Translation " + std::to_string(turn) + ":\n" + response);
        out.push_back("# Translation " + std::to_string(turn) + ":\n" + response + "\n\n");
    }

    void finish(std::deque<std::string>& out) override {
        (void)out;
    }

private:
    void respond(const std::string& text, std::deque<std::string>& out) {
        remember(text);
        out.push_back(text);
    }

    void remember(std::string entry) {
        transcript_.push_back(std::move(entry));
        while (transcript_.size() > host_.interactive_history()) {
            transcript_.pop_front();
        }
    }

    std::string history() const {
        return join(std::vector<std::string>(transcript_.begin(), transcript_.end()), "\n");
    }

    IngestHost& host_;
    std::deque<std::string> transcript_;
    std::size_t turn_ = 0;
};

}  // namespace

bool parse_stream_mode(const std::string& text, StreamMode& out) {
    if (text == "line" || text == "line-by-line") {
        out = StreamMode::LineByLine;
    } else if (text == "block" || text == "block-by-block") {
        out = StreamMode::BlockByBlock;
    } else if (text == "document" || text == "full-document") {
        out = StreamMode::FullDocument;
    } else if (text == "interactive") {
        out = StreamMode::Interactive;
    } else {
        return false;
    }
    return true;
}

const char* stream_mode_name(StreamMode mode) {
    switch (mode) {
        case StreamMode::LineByLine: return "line";
        case StreamMode::BlockByBlock: return "block";
        case StreamMode::FullDocument: return "document";
        case StreamMode::Interactive: return "interactive";
    }
    return "unknown";
}

bool is_complete_statement(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty() || text.back() == ':' || text.back() == '\\') {
        return false;
    }

    auto open = [&text](char opening, char closing) {
        return std::count(text.begin(), text.end(), opening) - std::count(text.begin(), text.end(), closing);
    };
    return open('(', ')') <= 0 && open('[', ']') <= 0 && open('{', '}') <= 0;
}

std::unique_ptr<IngestProcessor> make_ingest_processor(StreamMode mode, IngestHost& host) {
    switch (mode) {
        case StreamMode::LineByLine: return std::make_unique<LineByLineProcessor>(host);
        case StreamMode::BlockByBlock: return std::make_unique<BlockByBlockProcessor>(host);
        case StreamMode::FullDocument: return std::make_unique<FullDocumentProcessor>(host);
        case StreamMode::Interactive: return std::make_unique<InteractiveProcessor>(host);
    }
    return nullptr;
}

}  // namespace pseudo_mt

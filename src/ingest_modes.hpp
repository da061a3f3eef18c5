#pragma once

#include "block.hpp"
#include "parser.hpp"
#include "pipeline.hpp"
#include "streaming_event.hpp"
#include "translator.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

namespace pseudo_mt {

enum class StreamMode {
    LineByLine,
    BlockByBlock,
    FullDocument,
    Interactive
};

bool parse_stream_mode(const std::string& text, StreamMode& out);
const char* stream_mode_name(StreamMode mode);

// Default complete-statement test for line-by-line ingestion: non-empty,
// not opening a block (trailing ':'), no trailing '\' and no unclosed
// (), [] or {} by plain counting. Brackets inside strings are counted too.
bool is_complete_statement(const std::string& text);

// What an ingestion mode needs from the session driving it.
class IngestHost {
public:
    virtual ~IngestHost() = default;

    virtual const Parser& parser() const = 0;
    virtual Translator& translator() = 0;
    virtual StreamingPipeline& pipeline() = 0;

    // Translates English blocks and passes the rest through. A failed
    // translation raises a Warning event and keeps the original text.
    virtual std::string translate_block(const Block& block, std::size_t chunk_index, std::size_t block_index) = 0;

    virtual void emit(StreamingEvent event) = 0;
    virtual void notify_update(const TranslationUpdate& update) = 0;
    virtual bool is_cancelled() const = 0;
    virtual bool is_complete_statement(const std::string& text) const = 0;
    virtual std::size_t interactive_history() const = 0;

    // Progress bookkeeping for modes that do not go through the pipeline.
    virtual void record_unit(std::size_t bytes, const std::string& error) = 0;
    virtual void mirror_progress(const StreamingProgress& progress) = 0;
};

// One ingestion mode. consume() is fed each input unit, finish() once at end
// of input (not after cancellation). Modes that keep producing after the
// input ends do so from pump(), which returns false once exhausted.
class IngestProcessor {
public:
    virtual ~IngestProcessor() = default;

    virtual void consume(const std::string& unit, std::deque<std::string>& out) = 0;
    virtual void finish(std::deque<std::string>& out) = 0;
    virtual bool pump(std::deque<std::string>& out) { return false; }
};

std::unique_ptr<IngestProcessor> make_ingest_processor(StreamMode mode, IngestHost& host);

}  // namespace pseudo_mt

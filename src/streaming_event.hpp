#pragma once

#include "chunk_result.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace pseudo_mt {

enum class EventType {
    Started,
    ChunkStarted,
    ChunkCompleted,
    TranslationStarted,
    TranslationCompleted,
    ProgressUpdate,
    Warning,
    Error,
    Cancelled,
    Completed
};

const char* event_type_name(EventType type);

struct StreamingEvent {
    EventType type = EventType::ProgressUpdate;
    std::string message;
    std::optional<std::size_t> chunk_index;
    std::optional<StreamingProgress> progress;
    std::map<std::string, std::string> data;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// One translated unit as seen by an update callback.
struct TranslationUpdate {
    std::size_t chunk_index = 0;
    std::size_t block_index = 0;
    std::string original_content;
    std::string translated_content;
    // Unit flushed at end of input from an incomplete accumulation.
    bool is_partial = false;
    std::map<std::string, std::string> metadata;
};

}  // namespace pseudo_mt

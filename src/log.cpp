#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace pseudo_mt {
namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "[debug] ";
        case LogLevel::Info:
            return "[info] ";
        case LogLevel::Warning:
            return "[warn] ";
        case LogLevel::Error:
            return "[error] ";
    }
    return "[info] ";
}

}  // namespace

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

void log_line(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_level.load(std::memory_order_relaxed))) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << level_tag(level) << message << "\n";
}

}  // namespace pseudo_mt

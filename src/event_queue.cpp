#include "event_queue.hpp"

#include "log.hpp"

#include <algorithm>
#include <exception>

namespace pseudo_mt {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::Started: return "started";
        case EventType::ChunkStarted: return "chunk_started";
        case EventType::ChunkCompleted: return "chunk_completed";
        case EventType::TranslationStarted: return "translation_started";
        case EventType::TranslationCompleted: return "translation_completed";
        case EventType::ProgressUpdate: return "progress_update";
        case EventType::Warning: return "warning";
        case EventType::Error: return "error";
        case EventType::Cancelled: return "cancelled";
        case EventType::Completed: return "completed";
    }
    return "unknown";
}

EventDispatcher::EventDispatcher(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

std::size_t EventDispatcher::add_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const std::size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool EventDispatcher::remove_listener(std::size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void EventDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::jthread([this](std::stop_token stop_token) { dispatch_loop(stop_token); });
    dispatch_thread_ = worker_.get_id();
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    not_full_.notify_all();
    worker_.request_stop();
    worker_.join();
    std::lock_guard<std::mutex> lock(mutex_);
    dispatch_thread_ = std::thread::id{};
}

bool EventDispatcher::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void EventDispatcher::push(StreamingEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
        lock.unlock();
        deliver(event);
        return;
    }
    // A listener pushing from the dispatch thread must not wait on itself.
    if (std::this_thread::get_id() != dispatch_thread_) {
        not_full_.wait(lock, [this]() { return events_.size() < capacity_ || !running_; });
    }
    events_.push_back(std::move(event));
    lock.unlock();
    not_empty_.notify_one();
}

void EventDispatcher::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_ || std::this_thread::get_id() == dispatch_thread_) {
        return;
    }
    idle_.wait(lock, [this]() { return (events_.empty() && !dispatching_) || !running_; });
}

void EventDispatcher::deliver(const StreamingEvent& event) {
    std::vector<std::pair<std::size_t, EventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& [id, listener] : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            log_warning(
                "event listener " + std::to_string(id) + " failed on " + event_type_name(event.type) + ": " + ex.what()
            );
        }
    }
}

void EventDispatcher::dispatch_loop(std::stop_token stop_token) {
    while (true) {
        StreamingEvent event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, stop_token, [this]() { return !events_.empty(); });
            if (events_.empty()) {
                // Stop requested and nothing left to deliver.
                break;
            }
            event = std::move(events_.front());
            events_.pop_front();
            dispatching_ = true;
        }
        not_full_.notify_all();

        deliver(event);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            dispatching_ = false;
        }
        idle_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatching_ = false;
    }
    idle_.notify_all();
    not_full_.notify_all();
}

}  // namespace pseudo_mt

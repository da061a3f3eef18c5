#pragma once

#include "streaming_event.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace pseudo_mt {

using EventListener = std::function<void(const StreamingEvent&)>;

// Bounded event queue drained by a single dispatch thread. Listeners run on
// that thread, one event at a time, in registration order.
class EventDispatcher {
public:
    explicit EventDispatcher(std::size_t capacity = 1000);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    std::size_t add_listener(EventListener listener);
    bool remove_listener(std::size_t id);

    void start();
    // Delivers everything already queued, then joins the dispatch thread.
    void stop();
    bool is_running() const;

    // Blocks while the queue is full. While the dispatcher is stopped the
    // event is delivered on the calling thread instead.
    void push(StreamingEvent event);

    // Waits until every queued event has been handed to the listeners.
    void flush();

private:
    void dispatch_loop(std::stop_token stop_token);
    void deliver(const StreamingEvent& event);

    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::condition_variable_any idle_;
    std::deque<StreamingEvent> events_;
    bool dispatching_ = false;
    bool running_ = false;
    std::thread::id dispatch_thread_;

    std::mutex listeners_mutex_;
    std::vector<std::pair<std::size_t, EventListener>> listeners_;
    std::size_t next_listener_id_ = 1;

    std::jthread worker_;
};

}  // namespace pseudo_mt

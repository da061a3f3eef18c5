#include "context_window.hpp"

namespace pseudo_mt {

ContextWindow::ContextWindow(std::size_t window_size) : window_size_(window_size) {}

void ContextWindow::add_context(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (text.size() >= window_size_) {
        buffer_.assign(text, text.size() - window_size_, window_size_);
        return;
    }

    buffer_ += text;
    if (buffer_.size() > window_size_) {
        buffer_.erase(0, buffer_.size() - window_size_);
    }
}

std::string ContextWindow::context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

std::size_t ContextWindow::size_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void ContextWindow::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

}  // namespace pseudo_mt

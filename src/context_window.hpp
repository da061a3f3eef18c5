#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace pseudo_mt {

// Rolling buffer holding the most recent window_size bytes of added text.
class ContextWindow {
public:
    explicit ContextWindow(std::size_t window_size);

    void add_context(const std::string& text);
    std::string context() const;

    std::size_t size_bytes() const;
    std::size_t window_size() const { return window_size_; }
    void clear();

private:
    std::size_t window_size_;
    mutable std::mutex mutex_;
    std::string buffer_;
};

}  // namespace pseudo_mt

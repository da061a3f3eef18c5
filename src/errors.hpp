#pragma once

#include <stdexcept>
#include <string>

namespace pseudo_mt {

// Session-level failure (setup or teardown). Per-chunk and per-block problems
// are reported through results and warnings instead.
class StreamingError : public std::runtime_error {
public:
    explicit StreamingError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace pseudo_mt

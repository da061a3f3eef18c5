#pragma once

#include "block.hpp"

#include <string>
#include <vector>

namespace pseudo_mt {

class Parser {
public:
    virtual ~Parser() = default;

    // Must not throw on malformed text: report success = false with errors.
    virtual ParseResult parse(const std::string& text) const = 0;

    // Raw top-level block split; concatenating the pieces yields the input.
    virtual std::vector<std::string> identify_blocks(const std::string& text) const = 0;
};

}  // namespace pseudo_mt

#pragma once

#include "parser.hpp"

namespace pseudo_mt {

// Classifies blank-line separated top-level groups as code, English prose,
// comments or a mix of those, using per-line lexical heuristics.
class HeuristicParser final : public Parser {
public:
    ParseResult parse(const std::string& text) const override;
    std::vector<std::string> identify_blocks(const std::string& text) const override;
};

bool looks_like_code_line(const std::string& line);

}  // namespace pseudo_mt

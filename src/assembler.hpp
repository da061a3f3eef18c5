#pragma once

#include "block.hpp"

#include <string>
#include <vector>

namespace pseudo_mt {

class Assembler {
public:
    virtual ~Assembler() = default;

    // Deterministic and free of side effects.
    virtual std::string assemble(const std::vector<Block>& blocks) const = 0;
};

// Hoists import statements to the top (deduplicated, first-seen order) and
// joins the remaining block bodies with one blank line between them.
class BasicAssembler final : public Assembler {
public:
    std::string assemble(const std::vector<Block>& blocks) const override;
};

}  // namespace pseudo_mt

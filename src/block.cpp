#include "block.hpp"

namespace pseudo_mt {

const char* block_type_name(BlockType type) {
    switch (type) {
        case BlockType::Code:
            return "code";
        case BlockType::English:
            return "english";
        case BlockType::Comment:
            return "comment";
        case BlockType::Mixed:
            return "mixed";
    }
    return "code";
}

}  // namespace pseudo_mt

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pseudo_mt {

enum class BlockType {
    Code,
    English,
    Comment,
    Mixed
};

const char* block_type_name(BlockType type);

struct Block {
    BlockType type = BlockType::Code;
    std::string content;
    std::size_t start_line = 0;
    std::size_t end_line = 0;
    std::map<std::string, std::string> metadata;
};

struct ParseResult {
    bool success = false;
    std::vector<Block> blocks;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

}  // namespace pseudo_mt

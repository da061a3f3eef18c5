#pragma once

#include "codec.hpp"

namespace pseudo_mt {

class ZstdCodec final : public Codec {
public:
    explicit ZstdCodec(int level = 3);

    const char* name() const override { return "zstd"; }
    std::string compress(const std::string& bytes) const override;
    std::string decompress(const std::string& bytes) const override;

private:
    int level_;
};

}  // namespace pseudo_mt

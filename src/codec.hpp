#pragma once

#include <string>

namespace pseudo_mt {

// Byte-level compressor used by ResultCache when compression is enabled.
class Codec {
public:
    virtual ~Codec() = default;

    virtual const char* name() const = 0;
    virtual std::string compress(const std::string& bytes) const = 0;
    virtual std::string decompress(const std::string& bytes) const = 0;
};

}  // namespace pseudo_mt

#include "codec_zstd.hpp"

#include <zstd.h>

#include <stdexcept>

namespace pseudo_mt {

ZstdCodec::ZstdCodec(int level) : level_(level) {}

std::string ZstdCodec::compress(const std::string& bytes) const {
    const std::size_t bound = ZSTD_compressBound(bytes.size());
    std::string out(bound, '\0');

    const std::size_t written = ZSTD_compress(out.data(), out.size(), bytes.data(), bytes.size(), level_);
    if (ZSTD_isError(written)) {
        throw std::runtime_error(std::string("ZSTD compression failed: ") + ZSTD_getErrorName(written));
    }

    out.resize(written);
    return out;
}

std::string ZstdCodec::decompress(const std::string& bytes) const {
    const unsigned long long original = ZSTD_getFrameContentSize(bytes.data(), bytes.size());
    if (original == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error("ZSTD decompression failed: not a zstd frame");
    }
    if (original == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw std::runtime_error("ZSTD decompression failed: frame does not record its content size");
    }

    std::string out(static_cast<std::size_t>(original), '\0');
    const std::size_t written = ZSTD_decompress(out.data(), out.size(), bytes.data(), bytes.size());
    if (ZSTD_isError(written)) {
        throw std::runtime_error(std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(written));
    }

    out.resize(written);
    return out;
}

}  // namespace pseudo_mt

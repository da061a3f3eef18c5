#include "result_cache.hpp"

#include "log.hpp"

#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace pseudo_mt {
namespace {

class ByteWriter {
public:
    void put_u64(std::uint64_t value) {
        char raw[sizeof(value)];
        std::memcpy(raw, &value, sizeof(value));
        out_.append(raw, sizeof(raw));
    }

    void put_bool(bool value) { out_.push_back(value ? 1 : 0); }

    void put_double(double value) {
        char raw[sizeof(value)];
        std::memcpy(raw, &value, sizeof(value));
        out_.append(raw, sizeof(raw));
    }

    void put_string(const std::string& value) {
        put_u64(value.size());
        out_ += value;
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

class ByteReader {
public:
    explicit ByteReader(const std::string& in) : in_(in) {}

    std::uint64_t get_u64() {
        std::uint64_t value = 0;
        std::memcpy(&value, take(sizeof(value)), sizeof(value));
        return value;
    }

    bool get_bool() { return *take(1) != 0; }

    double get_double() {
        double value = 0.0;
        std::memcpy(&value, take(sizeof(value)), sizeof(value));
        return value;
    }

    std::string get_string() {
        const auto size = static_cast<std::size_t>(get_u64());
        const char* data = take(size);
        return std::string(data, size);
    }

    bool done() const { return pos_ == in_.size(); }

private:
    const char* take(std::size_t n) {
        if (n > in_.size() - pos_) {
            throw std::runtime_error("truncated cache entry");
        }
        const char* p = in_.data() + pos_;
        pos_ += n;
        return p;
    }

    const std::string& in_;
    std::size_t pos_ = 0;
};

void put_blocks(ByteWriter& w, const std::optional<std::vector<Block>>& blocks) {
    w.put_bool(blocks.has_value());
    if (!blocks) {
        return;
    }
    w.put_u64(blocks->size());
    for (const auto& block : *blocks) {
        w.put_u64(static_cast<std::uint64_t>(block.type));
        w.put_string(block.content);
        w.put_u64(block.start_line);
        w.put_u64(block.end_line);
        w.put_u64(block.metadata.size());
        for (const auto& [key, value] : block.metadata) {
            w.put_string(key);
            w.put_string(value);
        }
    }
}

std::optional<std::vector<Block>> get_blocks(ByteReader& r) {
    if (!r.get_bool()) {
        return std::nullopt;
    }
    std::vector<Block> blocks(static_cast<std::size_t>(r.get_u64()));
    for (auto& block : blocks) {
        const auto type = r.get_u64();
        if (type > static_cast<std::uint64_t>(BlockType::Mixed)) {
            throw std::runtime_error("bad block type in cache entry");
        }
        block.type = static_cast<BlockType>(type);
        block.content = r.get_string();
        block.start_line = static_cast<std::size_t>(r.get_u64());
        block.end_line = static_cast<std::size_t>(r.get_u64());
        const auto metadata_count = r.get_u64();
        for (std::uint64_t i = 0; i < metadata_count; ++i) {
            std::string key = r.get_string();
            block.metadata[std::move(key)] = r.get_string();
        }
    }
    return blocks;
}

}  // namespace

std::string encode_chunk_result(const ChunkResult& result) {
    ByteWriter w;
    w.put_u64(result.index);
    w.put_bool(result.success);
    put_blocks(w, result.parsed_blocks);
    put_blocks(w, result.translated_blocks);
    w.put_bool(result.error.has_value());
    if (result.error) {
        w.put_string(*result.error);
    }
    w.put_u64(result.warnings.size());
    for (const auto& warning : result.warnings) {
        w.put_string(warning);
    }
    w.put_double(result.processing_time_ms);
    return w.take();
}

ChunkResult decode_chunk_result(const std::string& bytes) {
    ByteReader r(bytes);
    ChunkResult result;
    result.index = static_cast<std::size_t>(r.get_u64());
    result.success = r.get_bool();
    result.parsed_blocks = get_blocks(r);
    result.translated_blocks = get_blocks(r);
    if (r.get_bool()) {
        result.error = r.get_string();
    }
    const auto warning_count = r.get_u64();
    for (std::uint64_t i = 0; i < warning_count; ++i) {
        result.warnings.push_back(r.get_string());
    }
    result.processing_time_ms = r.get_double();

    if (!r.done()) {
        throw std::runtime_error("trailing bytes in cache entry");
    }
    return result;
}

ResultCache::ResultCache(BufferConfig config, std::shared_ptr<const Codec> codec)
    : config_(config), codec_(std::move(codec)), capacity_(config.capacity_bytes()) {
    if (config_.enable_compression && !codec_) {
        throw std::invalid_argument("ResultCache: compression enabled but no codec given");
    }
}

bool ResultCache::add(std::size_t index, const ChunkResult& result) {
    std::string bytes = encode_chunk_result(result);
    const bool compress = config_.enable_compression;
    if (compress) {
        bytes = codec_->compress(bytes);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (compress) {
        ++stats_.compressions;
    }

    if (bytes.size() > capacity_) {
        log_warning(
            "cache entry for chunk " + std::to_string(index) + " (" + std::to_string(bytes.size()) +
            " bytes) exceeds cache capacity " + std::to_string(capacity_)
        );
        return false;
    }

    if (auto existing = entries_.find(index); existing != entries_.end()) {
        erase_locked(existing);
    }

    while (resident_ + bytes.size() > capacity_ && !order_.empty()) {
        erase_locked(entries_.find(order_.front()));
        ++stats_.evictions;
    }

    const std::size_t size = bytes.size();
    order_.push_back(index);
    entries_.emplace(index, Entry{std::move(bytes), std::prev(order_.end())});
    resident_ += size;
    return true;
}

std::optional<ChunkResult> ResultCache::get(std::size_t index) {
    std::string bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(index);
        if (it == entries_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }

        ++stats_.hits;
        if (config_.eviction_policy == EvictionPolicy::LRU) {
            order_.splice(order_.end(), order_, it->second.position);
        }
        bytes = it->second.bytes;
    }

    try {
        if (config_.enable_compression) {
            bytes = codec_->decompress(bytes);
        }
        return decode_chunk_result(bytes);
    } catch (const std::exception& ex) {
        log_error("cache entry for chunk " + std::to_string(index) + " is unreadable: " + ex.what());
        return std::nullopt;
    }
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats out = stats_;
    out.chunks = entries_.size();
    const std::size_t accesses = out.hits + out.misses;
    out.hit_rate = accesses == 0 ? 0.0 : static_cast<double>(out.hits) / static_cast<double>(accesses);
    return out;
}

std::size_t ResultCache::resident_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_;
}

std::vector<std::size_t> ResultCache::indices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::size_t> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
    resident_ = 0;
    stats_ = CacheStats{};
}

void ResultCache::erase_locked(std::map<std::size_t, Entry>::iterator it) {
    resident_ -= it->second.bytes.size();
    order_.erase(it->second.position);
    entries_.erase(it);
}

}  // namespace pseudo_mt

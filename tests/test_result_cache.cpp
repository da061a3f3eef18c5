#include "result_cache.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pseudo_mt;

namespace {

ChunkResult sample_result(std::size_t index) {
    ChunkResult result;
    result.index = index;
    result.success = true;

    Block english;
    english.type = BlockType::English;
    english.content = "compute the total.";
    english.start_line = 3;
    english.end_line = 3;
    result.parsed_blocks = std::vector<Block>{english};

    Block code = english;
    code.type = BlockType::Code;
    code.content = "total = sum(values)";
    code.metadata["translated"] = "true";
    result.translated_blocks = std::vector<Block>{code};

    result.warnings.push_back("slow chunk");
    result.processing_time_ms = 12.5;
    return result;
}

// sample_result(index) grown by `extra` bytes of warning text.
ChunkResult padded_result(std::size_t index, std::size_t extra) {
    ChunkResult result = sample_result(index);
    result.warnings.push_back(std::string(extra, 'w'));
    return result;
}

std::size_t entry_size() {
    return encode_chunk_result(sample_result(0)).size();
}

BufferConfig sized_for(std::size_t entries, EvictionPolicy policy) {
    BufferConfig config = test::uncompressed_buffer();
    const std::size_t entry_size = encode_chunk_result(sample_result(0)).size();
    config.max_size_bytes = entries * entry_size + entry_size / 2;
    config.eviction_policy = policy;
    return config;
}

}  // namespace

TEST(ResultCache, StoresAndReturnsResults) {
    ResultCache cache(test::uncompressed_buffer());
    ASSERT_TRUE(cache.add(4, sample_result(4)));

    const auto loaded = cache.get(4);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->index, 4u);
    EXPECT_TRUE(loaded->success);
    ASSERT_TRUE(loaded->translated_blocks.has_value());
    ASSERT_EQ(loaded->translated_blocks->size(), 1u);
    EXPECT_EQ(loaded->translated_blocks->front().content, "total = sum(values)");
    EXPECT_EQ(loaded->translated_blocks->front().type, BlockType::Code);
    EXPECT_EQ(loaded->translated_blocks->front().metadata.at("translated"), "true");
    EXPECT_EQ(loaded->parsed_blocks->front().type, BlockType::English);
    EXPECT_EQ(loaded->warnings, std::vector<std::string>{"slow chunk"});
    EXPECT_DOUBLE_EQ(loaded->processing_time_ms, 12.5);

    EXPECT_FALSE(cache.get(5).has_value());
}

TEST(ResultCache, FailedResultKeepsErrorAndNoTranslation) {
    ResultCache cache(test::uncompressed_buffer());
    ChunkResult failed;
    failed.index = 2;
    failed.error = "Parse error: 1 unclosed bracket(s) at end of input";
    ASSERT_TRUE(cache.add(2, failed));

    const auto loaded = cache.get(2);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->success);
    EXPECT_FALSE(loaded->translated_blocks.has_value());
    EXPECT_FALSE(loaded->parsed_blocks.has_value());
    EXPECT_EQ(loaded->error, failed.error);
}

TEST(ResultCache, HitRateCountsHitsAndMisses) {
    ResultCache cache(test::uncompressed_buffer());
    cache.add(0, sample_result(0));

    cache.get(0);
    cache.get(0);
    cache.get(0);
    cache.get(9);

    const CacheStats stats = cache.stats();
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.chunks, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.75);
}

TEST(ResultCache, LruEvictsLeastRecentlyUsed) {
    ResultCache cache(sized_for(2, EvictionPolicy::LRU));
    ASSERT_TRUE(cache.add(0, sample_result(0)));
    ASSERT_TRUE(cache.add(1, sample_result(1)));
    ASSERT_TRUE(cache.get(0).has_value());

    ASSERT_TRUE(cache.add(2, sample_result(2)));

    EXPECT_EQ(cache.indices(), (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(cache.stats().evictions, 1u);
    EXPECT_LE(cache.resident_bytes(), cache.capacity_bytes());
}

TEST(ResultCache, LruKeepsRecentlyReadEntriesWhenLargeEntryArrives) {
    ResultCache cache(sized_for(3, EvictionPolicy::LRU));
    ASSERT_TRUE(cache.add(0, sample_result(0)));
    ASSERT_TRUE(cache.add(1, sample_result(1)));
    ASSERT_TRUE(cache.add(2, sample_result(2)));
    ASSERT_TRUE(cache.get(0).has_value());
    ASSERT_TRUE(cache.get(1).has_value());

    // Needs more than the free half entry, but fits once one entry is gone.
    const ChunkResult large = padded_result(3, entry_size() / 3);
    const std::size_t large_size = encode_chunk_result(large).size();
    ASSERT_GT(large_size, entry_size() / 2);
    ASSERT_LE(large_size, entry_size() + entry_size() / 2);

    ASSERT_TRUE(cache.add(3, large));
    EXPECT_EQ(cache.indices(), (std::vector<std::size_t>{0, 1, 3}));
    EXPECT_EQ(cache.stats().evictions, 1u);
    EXPECT_LE(cache.resident_bytes(), cache.capacity_bytes());
}

TEST(ResultCache, OversizedEntryLeavesFullCacheUntouched) {
    ResultCache cache(sized_for(3, EvictionPolicy::LRU));
    ASSERT_TRUE(cache.add(0, sample_result(0)));
    ASSERT_TRUE(cache.add(1, sample_result(1)));
    ASSERT_TRUE(cache.add(2, sample_result(2)));
    const std::size_t resident = cache.resident_bytes();

    EXPECT_FALSE(cache.add(3, padded_result(3, cache.capacity_bytes())));

    EXPECT_EQ(cache.indices(), (std::vector<std::size_t>{0, 1, 2}));
    EXPECT_EQ(cache.resident_bytes(), resident);
    EXPECT_EQ(cache.stats().evictions, 0u);
    EXPECT_TRUE(cache.get(2).has_value());
}

TEST(ResultCache, ResidentBytesStayWithinCapacity) {
    for (const EvictionPolicy policy : {EvictionPolicy::LRU, EvictionPolicy::FIFO}) {
        ResultCache cache(sized_for(4, policy));
        std::mt19937 rng(1234);
        std::uniform_int_distribution<std::size_t> index_dist(0, 15);
        std::uniform_int_distribution<std::size_t> extra_dist(0, entry_size());
        std::bernoulli_distribution do_add(0.6);

        std::size_t added_bytes = 0;
        for (int step = 0; step < 500; ++step) {
            const std::size_t index = index_dist(rng);
            if (do_add(rng)) {
                const ChunkResult result = padded_result(index, extra_dist(rng));
                ASSERT_TRUE(cache.add(index, result));
                added_bytes += encode_chunk_result(result).size();
            } else {
                cache.get(index);
            }
            ASSERT_LE(cache.resident_bytes(), cache.capacity_bytes()) << "step " << step;
        }

        ASSERT_GT(added_bytes, cache.capacity_bytes());
        EXPECT_GT(cache.stats().evictions, 0u);
    }
}

TEST(ResultCache, FifoEvictsOldestInsertion) {
    ResultCache cache(sized_for(2, EvictionPolicy::FIFO));
    ASSERT_TRUE(cache.add(0, sample_result(0)));
    ASSERT_TRUE(cache.add(1, sample_result(1)));
    ASSERT_TRUE(cache.get(0).has_value());

    ASSERT_TRUE(cache.add(2, sample_result(2)));

    EXPECT_EQ(cache.indices(), (std::vector<std::size_t>{1, 2}));
}

TEST(ResultCache, ReplacingAnIndexDoesNotGrowTheCache) {
    ResultCache cache(sized_for(2, EvictionPolicy::LRU));
    ASSERT_TRUE(cache.add(0, sample_result(0)));
    const std::size_t resident = cache.resident_bytes();

    ASSERT_TRUE(cache.add(0, sample_result(0)));
    EXPECT_EQ(cache.resident_bytes(), resident);
    EXPECT_EQ(cache.stats().chunks, 1u);
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST(ResultCache, RejectsEntryLargerThanCapacity) {
    BufferConfig config = test::uncompressed_buffer();
    config.max_size_bytes = 16;
    ResultCache cache(config);

    EXPECT_FALSE(cache.add(0, sample_result(0)));
    EXPECT_EQ(cache.resident_bytes(), 0u);
    EXPECT_TRUE(cache.indices().empty());
}

TEST(ResultCache, CompressesThroughCodec) {
    BufferConfig config;
    config.enable_compression = true;
    ResultCache cache(config, std::make_shared<test::ReversingCodec>());

    ASSERT_TRUE(cache.add(1, sample_result(1)));
    EXPECT_EQ(cache.resident_bytes(), encode_chunk_result(sample_result(1)).size());
    EXPECT_EQ(cache.stats().compressions, 1u);

    const auto loaded = cache.get(1);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->translated_blocks->front().content, "total = sum(values)");
}

TEST(ResultCache, CompressionWithoutCodecIsRejected) {
    BufferConfig config;
    config.enable_compression = true;
    EXPECT_THROW(ResultCache cache(config), std::invalid_argument);
}

TEST(ResultCache, ClearDropsEverything) {
    ResultCache cache(test::uncompressed_buffer());
    cache.add(0, sample_result(0));
    cache.add(1, sample_result(1));

    cache.clear();
    EXPECT_EQ(cache.resident_bytes(), 0u);
    EXPECT_TRUE(cache.indices().empty());
    EXPECT_FALSE(cache.get(0).has_value());
}

TEST(ResultCache, ClearResetsStatistics) {
    ResultCache cache(sized_for(1, EvictionPolicy::LRU));
    cache.add(0, sample_result(0));
    cache.add(1, sample_result(1));
    cache.get(1);
    cache.get(7);
    ASSERT_EQ(cache.stats().evictions, 1u);

    cache.clear();
    const CacheStats stats = cache.stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.evictions, 0u);
    EXPECT_EQ(stats.chunks, 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.0);
}

TEST(ResultCache, DecodeRejectsTruncatedEntry) {
    std::string bytes = encode_chunk_result(sample_result(3));
    bytes.resize(bytes.size() / 2);
    EXPECT_THROW(decode_chunk_result(bytes), std::runtime_error);
}

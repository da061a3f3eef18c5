#include "chunker.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace pseudo_mt;

namespace {

std::size_t occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

ChunkConfig small_chunks() {
    ChunkConfig config;
    config.max_chunk_size = 64;
    config.min_chunk_size = 16;
    config.overlap_size = 0;
    return config;
}

const char* kThreeFunctions =
    "def alpha(x):\n"
    "    total = x + 1\n"
    "    return total\n"
    "\n"
    "def beta(y):\n"
    "    doubled = y * 2\n"
    "    return doubled\n"
    "\n"
    "def gamma(z):\n"
    "    shifted = z - 3\n"
    "    return shifted\n";

}  // namespace

TEST(Chunker, EmptyAndWhitespaceInputYieldNoChunks) {
    EXPECT_TRUE(chunk_text("", ChunkConfig{}).empty());
    EXPECT_TRUE(chunk_text("  \n\n\t\n", ChunkConfig{}).empty());
    EXPECT_TRUE(validate_chunks({}, "\n\n"));
}

TEST(Chunker, SmallInputIsOneChunk) {
    const std::string text = "x = 1\nprint(x)\n";
    const auto chunks = chunk_text(text, ChunkConfig{});

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, text);
    EXPECT_EQ(chunks[0].start_line, 1u);
    EXPECT_EQ(chunks[0].end_line, 2u);
    EXPECT_EQ(chunks[0].total_chunks, 1u);
    EXPECT_TRUE(chunks[0].metadata.single_chunk);
    EXPECT_TRUE(validate_chunks(chunks, text));
}

TEST(Chunker, KeepsFunctionDefinitionsWhole) {
    const std::string text = kThreeFunctions;
    ASSERT_GT(text.size(), 64u);

    const auto chunks = chunk_text(text, small_chunks());

    ASSERT_GE(chunks.size(), 2u);
    for (const auto& chunk : chunks) {
        EXPECT_TRUE(chunk.metadata.ast_based);
        EXPECT_LE(chunk.size(), 64u);
        EXPECT_GE(occurrences(chunk.content, "def "), 1u);
        EXPECT_EQ(occurrences(chunk.content, "def "), occurrences(chunk.content, "return "))
            << "chunk " << chunk.index << " splits a function:\n" << chunk.content;
        const auto& kinds = chunk.metadata.boundary_types;
        EXPECT_NE(std::find(kinds.begin(), kinds.end(), "function"), kinds.end());
    }

    std::string error;
    EXPECT_TRUE(validate_chunks(chunks, text, error)) << error;
}

TEST(Chunker, RespectsLineLimit) {
    ChunkConfig config = small_chunks();
    config.max_chunk_size = 4096;
    config.max_lines_per_chunk = 4;

    std::string text;
    for (int i = 0; i < 30; ++i) {
        text += "value_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    }
    text += std::string(4096, '#') + "\n";

    const auto chunks = chunk_text(text, config);
    ASSERT_GT(chunks.size(), 1u);
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].line_count(), 4u);
    }
    std::string error;
    EXPECT_TRUE(validate_chunks(chunks, text, error)) << error;
}

TEST(Chunker, UnbalancedInputFallsBackToLineBasedChunks) {
    const std::string text = test::paragraphs(3) + "broken = call(first, second\n\n" + test::paragraphs(3);
    const auto chunks = chunk_text(text, small_chunks());

    ASSERT_GT(chunks.size(), 1u);
    for (const auto& chunk : chunks) {
        EXPECT_TRUE(chunk.metadata.line_based);
        EXPECT_FALSE(chunk.metadata.ast_based);
    }
    std::string error;
    EXPECT_TRUE(validate_chunks(chunks, text, error)) << error;
}

TEST(Chunker, LineBasedChunksOverlapAndStayWithinSize) {
    ChunkConfig config = small_chunks();
    config.respect_boundaries = false;
    config.overlap_size = 24;
    config.min_chunk_size = 64;

    std::string text;
    for (int i = 0; i < 20; ++i) {
        text += "line number " + std::to_string(i) + "\n";
    }

    const auto chunks = chunk_text(text, config);
    ASSERT_GT(chunks.size(), 2u);
    EXPECT_FALSE(chunks[0].metadata.has_overlap);

    bool saw_overlap = false;
    for (const auto& chunk : chunks) {
        EXPECT_LE(chunk.size(), config.max_chunk_size);
        if (chunk.index > 0 && chunk.metadata.has_overlap) {
            saw_overlap = true;
            EXPECT_LE(chunk.metadata.overlap_bytes, config.overlap_size);
            // The overlap repeats the tail of the previous chunk.
            const Chunk& previous = chunks[chunk.index - 1];
            EXPECT_EQ(
                previous.content.substr(previous.size() - chunk.metadata.overlap_bytes),
                chunk.content.substr(0, chunk.metadata.overlap_bytes)
            );
        }
    }
    EXPECT_TRUE(saw_overlap);

    std::string error;
    EXPECT_TRUE(validate_chunks(chunks, text, error)) << error;
}

TEST(Chunker, ChunksCoverInputForManyConfigs) {
    const std::string text = std::string(kThreeFunctions) + "\n" + test::paragraphs(12) + "# trailing comment";

    for (bool boundaries : {true, false}) {
        for (std::size_t max_size : {64u, 100u, 256u}) {
            ChunkConfig config = small_chunks();
            config.respect_boundaries = boundaries;
            config.max_chunk_size = max_size;
            config.overlap_size = max_size / 4;

            const auto chunks = chunk_text(text, config);
            std::string error;
            EXPECT_TRUE(validate_chunks(chunks, text, error))
                << "boundaries=" << boundaries << " max=" << max_size << ": " << error;
        }
    }
}

TEST(Chunker, ValidateRejectsGapsAndBadIndices) {
    const std::string text = test::paragraphs(10);
    auto chunks = chunk_text(text, small_chunks());
    ASSERT_GT(chunks.size(), 2u);

    auto missing = chunks;
    missing.erase(missing.begin() + 1);
    for (std::size_t i = 0; i < missing.size(); ++i) {
        missing[i].index = i;
        missing[i].total_chunks = missing.size();
    }
    EXPECT_FALSE(validate_chunks(missing, text));

    auto misnumbered = chunks;
    misnumbered[1].index = 7;
    std::string error;
    EXPECT_FALSE(validate_chunks(misnumbered, text, error));
    EXPECT_NE(error.find("index"), std::string::npos);
}

TEST(Chunker, StreamYieldsSameChunksAsEagerSplit) {
    const std::string text = test::paragraphs(10);
    const auto eager = chunk_text(text, small_chunks());

    ChunkStream stream(text, small_chunks());
    EXPECT_EQ(stream.total_chunks(), eager.size());

    std::size_t i = 0;
    while (auto chunk = stream.next()) {
        ASSERT_LT(i, eager.size());
        EXPECT_EQ(chunk->index, eager[i].index);
        EXPECT_EQ(chunk->content, eager[i].content);
        EXPECT_EQ(chunk->start_line, eager[i].start_line);
        EXPECT_EQ(chunk->end_line, eager[i].end_line);
        ++i;
    }
    EXPECT_EQ(i, eager.size());
    EXPECT_FALSE(stream.next().has_value());
}

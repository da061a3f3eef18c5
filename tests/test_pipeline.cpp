#include "assembler.hpp"
#include "errors.hpp"
#include "heuristic_parser.hpp"
#include "pipeline.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace pseudo_mt;
using namespace std::chrono_literals;

namespace {

ChunkConfig small_chunks() {
    ChunkConfig config;
    config.max_chunk_size = 64;
    config.min_chunk_size = 16;
    config.overlap_size = 0;
    return config;
}

StreamConfig sequential() {
    StreamConfig config;
    config.max_concurrent_chunks = 1;
    config.progress_interval = 5ms;
    return config;
}

StreamConfig parallel(std::size_t concurrency, std::size_t workers) {
    StreamConfig config;
    config.max_concurrent_chunks = concurrency;
    config.thread_pool_size = workers;
    config.progress_interval = 5ms;
    return config;
}

std::string item(std::size_t i) {
    return "compute item " + std::to_string(i) + " now.";
}

std::string assembled_items(const std::vector<std::size_t>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += "\n\n";
        }
        out += test::FakeTranslator::expected(item(items[i]));
    }
    return out + "\n";
}

std::vector<std::size_t> range(std::size_t count) {
    std::vector<std::size_t> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = i;
    }
    return out;
}

class PipelineTest : public ::testing::Test {
protected:
    test::FakeTranslator translator;
    HeuristicParser parser;
    BasicAssembler assembler;
};

}  // namespace

TEST_F(PipelineTest, SequentialRunYieldsChunksInOrder) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    const std::string text = test::paragraphs(10);

    std::vector<std::size_t> order;
    auto stream = pipeline.stream_translate(text);
    while (auto result = stream.next()) {
        EXPECT_TRUE(result->success) << result->error.value_or("");
        order.push_back(result->index);
    }

    ASSERT_GT(pipeline.chunks().size(), 1u);
    EXPECT_EQ(order, range(pipeline.chunks().size()));
    EXPECT_EQ(pipeline.assemble_streamed(), assembled_items(range(10)));
    EXPECT_EQ(translator.log().clones.load(), 1);
    EXPECT_EQ(translator.log().calls.load(), 10);

    const StreamingProgress progress = pipeline.progress();
    EXPECT_TRUE(progress.is_complete());
    EXPECT_EQ(progress.bytes_processed, text.size());
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
    EXPECT_TRUE(progress.errors.empty());

    const PipelineStats stats = pipeline.stats();
    EXPECT_EQ(stats.chunks_total, pipeline.chunks().size());
    EXPECT_EQ(stats.workers_used, 1u);
}

TEST_F(PipelineTest, TranslatedBlocksMapToSourceLines) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    auto stream = pipeline.stream_translate(test::paragraphs(10));

    std::vector<std::size_t> lines;
    while (auto result = stream.next()) {
        ASSERT_TRUE(result->translated_blocks.has_value());
        for (const auto& block : *result->translated_blocks) {
            EXPECT_EQ(block.type, BlockType::Code);
            EXPECT_EQ(block.metadata.at("translated"), "true");
            lines.push_back(block.start_line);
        }
    }

    // Item i sits on source line 2i + 1; context and separators are not echoed.
    ASSERT_EQ(lines.size(), 10u);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i], 2 * i + 1);
    }
}

TEST_F(PipelineTest, LaterChunksSeePreviousCode) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (stream.next()) {
    }

    std::lock_guard<std::mutex> lock(translator.log().mutex);
    const auto& instructions = translator.log().instructions;
    const auto& contexts = translator.log().contexts;
    const auto it = std::find(instructions.begin(), instructions.end(), item(3));
    ASSERT_NE(it, instructions.end());

    const TranslationContext& context = contexts[static_cast<std::size_t>(it - instructions.begin())];
    EXPECT_EQ(context.at("chunk_index"), "1");
    EXPECT_NE(context.at("before").find(test::FakeTranslator::expected(item(2))), std::string::npos);
    EXPECT_EQ(context.at("code"), context.at("before"));
    EXPECT_EQ(context.at("after"), "");
    EXPECT_NE(context.at("window").find(test::FakeTranslator::expected(item(0))), std::string::npos);
}

TEST_F(PipelineTest, ParallelRunAssemblesInIndexOrder) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), parallel(3, 3), test::uncompressed_buffer());

    std::vector<std::size_t> seen;
    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (auto result = stream.next()) {
        EXPECT_TRUE(result->success);
        seen.push_back(result->index);
    }

    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, range(pipeline.chunks().size()));
    EXPECT_EQ(pipeline.assemble_streamed(), assembled_items(range(10)));
    EXPECT_EQ(translator.log().clones.load(), 3);
    EXPECT_EQ(pipeline.stats().workers_used, 3u);
}

TEST_F(PipelineTest, BackpressureBoundsChunksInFlight) {
    translator.delay = 5ms;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), parallel(2, 4), test::uncompressed_buffer());

    std::size_t count = 0;
    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (auto result = stream.next()) {
        ++count;
    }

    EXPECT_EQ(count, pipeline.chunks().size());
    EXPECT_LE(translator.log().max_active.load(), 2);
}

TEST_F(PipelineTest, ParseFailureDoesNotStopLaterChunks) {
    const std::string text = item(0) + "\n\n" + item(1) + "\n\n" + "broken = call(first, second\n\n" + item(3) +
        "\n\n" + item(4) + "\n\n";
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());

    std::vector<std::size_t> failed;
    std::size_t succeeded = 0;
    auto stream = pipeline.stream_translate(text);
    while (auto result = stream.next()) {
        if (result->success) {
            ++succeeded;
            continue;
        }
        failed.push_back(result->index);
        ASSERT_TRUE(result->error.has_value());
        EXPECT_EQ(result->error->rfind("Parse error: ", 0), 0u) << *result->error;
        EXPECT_FALSE(result->translated_blocks.has_value());
    }

    ASSERT_EQ(pipeline.chunks().size(), 5u);
    EXPECT_EQ(failed, std::vector<std::size_t>{2});
    EXPECT_EQ(succeeded, 4u);
    EXPECT_EQ(pipeline.assemble_streamed(), assembled_items({0, 1, 3, 4}));

    const StreamingProgress progress = pipeline.progress();
    ASSERT_EQ(progress.errors.size(), 1u);
    EXPECT_EQ(progress.errors[0].rfind("chunk 2: Parse error", 0), 0u);
}

TEST_F(PipelineTest, TranslationFailureKeepsBlockAndWarns) {
    translator.fail_on = "item 1 ";
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());

    auto stream = pipeline.stream_translate(test::paragraphs(10));
    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->success);
    ASSERT_EQ(first->warnings.size(), 1u);
    EXPECT_EQ(first->warnings[0], "Translation failed at line 3: model returned no code");

    ASSERT_TRUE(first->translated_blocks.has_value());
    const Block& kept = (*first->translated_blocks)[1];
    EXPECT_EQ(kept.type, BlockType::English);
    EXPECT_EQ(kept.content, item(1));

    while (stream.next()) {
    }
    EXPECT_EQ(pipeline.progress().warnings.size(), 1u);
}

TEST_F(PipelineTest, CancelStopsDispatchingNewChunks) {
    translator.delay = 150ms;
    translator.fast_on = {item(0), item(1), item(2)};
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), parallel(5, 5), test::uncompressed_buffer());

    auto stream = pipeline.stream_translate(test::paragraphs(13));
    ASSERT_EQ(pipeline.chunks().size(), 5u);

    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->index, 0u);

    pipeline.cancel();
    EXPECT_TRUE(pipeline.is_cancelled());

    std::size_t total = 1;
    while (stream.next()) {
        ++total;
    }
    EXPECT_LT(total, 5u);
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(PipelineTest, SlowChunkTimesOut) {
    translator.delay = 300ms;
    StreamConfig config = parallel(2, 1);
    config.chunk_timeout = 30ms;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), config, test::uncompressed_buffer());

    auto stream = pipeline.stream_translate(item(0) + "\n");
    auto result = stream.next();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_EQ(*result->error, "Chunk 0 timed out after 30 ms");
    EXPECT_FALSE(stream.next().has_value());

    EXPECT_EQ(pipeline.progress().errors.size(), 1u);
}

TEST_F(PipelineTest, TimedOutChunkIsNeitherCachedNorUsedAsContext) {
    translator.delay = 150ms;
    StreamConfig config = parallel(2, 1);
    config.chunk_timeout = 20ms;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), config, test::uncompressed_buffer());

    auto stream = pipeline.stream_translate(item(0) + "\n");
    auto result = stream.next();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_FALSE(stream.next().has_value());

    // The worker keeps translating after the timeout; wait for it to finish.
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while ((translator.log().calls.load() == 0 || translator.log().active.load() > 0) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(translator.log().calls.load(), 1);

    EXPECT_TRUE(pipeline.cache().indices().empty());
    EXPECT_TRUE(pipeline.context_window().context().empty());
    EXPECT_EQ(pipeline.assemble_streamed(), "");
}

TEST_F(PipelineTest, ProgressCallbacksSeeMonotonicCounts) {
    translator.delay = 2ms;
    StreamConfig config = sequential();
    config.progress_interval = 1ms;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), config, test::uncompressed_buffer());

    std::mutex mutex;
    std::vector<std::size_t> run_counts;
    std::vector<std::size_t> global_counts;
    pipeline.add_progress_callback([&](const StreamingProgress& progress) {
        std::lock_guard<std::mutex> lock(mutex);
        global_counts.push_back(progress.processed_chunks);
    });

    auto stream = pipeline.stream_translate(test::paragraphs(10), [&](const StreamingProgress& progress) {
        std::lock_guard<std::mutex> lock(mutex);
        run_counts.push_back(progress.processed_chunks);
    });
    while (stream.next()) {
    }

    std::lock_guard<std::mutex> lock(mutex);
    for (const auto* counts : {&run_counts, &global_counts}) {
        ASSERT_FALSE(counts->empty());
        EXPECT_TRUE(std::is_sorted(counts->begin(), counts->end()));
        EXPECT_EQ(counts->back(), pipeline.chunks().size());
    }
}

TEST_F(PipelineTest, ReportsChunkStarts) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    std::vector<std::size_t> started;
    pipeline.set_chunk_started_callback([&started](std::size_t index) { started.push_back(index); });

    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (stream.next()) {
    }
    EXPECT_EQ(started, range(pipeline.chunks().size()));
}

TEST_F(PipelineTest, CacheStatisticsCoverOnlyTheCurrentRun) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());

    for (int run = 0; run < 2; ++run) {
        auto stream = pipeline.stream_translate(test::paragraphs(10));
        while (stream.next()) {
        }
    }

    // Each chunk after the first reads its predecessor once.
    const std::size_t chunks = pipeline.chunks().size();
    const CacheStats stats = pipeline.cache().stats();
    EXPECT_EQ(stats.chunks, chunks);
    EXPECT_EQ(stats.hits, chunks - 1);
    EXPECT_EQ(stats.misses, 0u);
}

TEST_F(PipelineTest, NewRunInvalidatesOldStream) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());

    auto old_stream = pipeline.stream_translate(test::paragraphs(10));
    ASSERT_TRUE(old_stream.next().has_value());

    auto stream = pipeline.stream_translate(test::paragraphs(4));
    EXPECT_FALSE(old_stream.next().has_value());

    std::size_t count = 0;
    while (stream.next()) {
        ++count;
    }
    EXPECT_EQ(count, pipeline.chunks().size());
    EXPECT_EQ(pipeline.assemble_streamed(), assembled_items(range(4)));
}

TEST_F(PipelineTest, MemoryUsageReflectsCacheAndWindow) {
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (stream.next()) {
    }

    const MemoryUsage usage = pipeline.memory_usage();
    EXPECT_GT(usage.buffer_size_bytes, 0u);
    EXPECT_EQ(usage.buffer_size_bytes, pipeline.cache().resident_bytes());
    EXPECT_GT(usage.context_window_size_bytes, 0u);
    EXPECT_LE(usage.context_window_size_bytes, pipeline.stream_config().context_window_size);
    EXPECT_EQ(usage.queue_size_estimate_bytes, 0u);
}

TEST_F(PipelineTest, CompressedCacheProducesSameOutput) {
    BufferConfig buffer;
    buffer.enable_compression = true;
    StreamingPipeline pipeline(
        translator,
        parser,
        assembler,
        small_chunks(),
        sequential(),
        buffer,
        std::make_shared<test::ReversingCodec>()
    );

    auto stream = pipeline.stream_translate(test::paragraphs(10));
    while (stream.next()) {
    }
    EXPECT_EQ(pipeline.assemble_streamed(), assembled_items(range(10)));
    EXPECT_GT(pipeline.cache().stats().compressions, 0u);
}

TEST_F(PipelineTest, StreamingThreshold) {
    StreamConfig config = sequential();
    config.min_size_for_streaming = 100;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), config, test::uncompressed_buffer());

    EXPECT_FALSE(pipeline.should_use_streaming(std::string(99, 'x')));
    EXPECT_TRUE(pipeline.should_use_streaming(std::string(100, 'x')));

    config.enable_streaming = false;
    StreamingPipeline disabled(translator, parser, assembler, small_chunks(), config, test::uncompressed_buffer());
    EXPECT_FALSE(disabled.should_use_streaming(std::string(1000, 'x')));
}

TEST_F(PipelineTest, UnchunkedTranslationOfSmallInput) {
    StreamingPipeline pipeline(translator, parser, assembler, ChunkConfig{}, sequential(), test::uncompressed_buffer());

    ChunkResult result;
    const std::string code = pipeline.translate_unchunked("import os\n\ncompute the total.\n", result);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(code, "import os\n\n" + test::FakeTranslator::expected("compute the total.") + "\n");
    EXPECT_EQ(pipeline.progress().processed_chunks, 1u);
}

TEST_F(PipelineTest, UnchunkedTranslationReturnsInputOnParseFailure) {
    StreamingPipeline pipeline(translator, parser, assembler, ChunkConfig{}, sequential(), test::uncompressed_buffer());

    ChunkResult result;
    const std::string text = "value = call(first,\n";
    EXPECT_EQ(pipeline.translate_unchunked(text, result), text);
    EXPECT_FALSE(result.success);
}

TEST_F(PipelineTest, RejectsInvalidConfiguration) {
    ChunkConfig tiny = small_chunks();
    tiny.max_chunk_size = 10;
    EXPECT_THROW(
        StreamingPipeline pipeline(translator, parser, assembler, tiny, sequential(), test::uncompressed_buffer()),
        std::invalid_argument
    );

    StreamConfig no_workers = sequential();
    no_workers.thread_pool_size = 0;
    EXPECT_THROW(
        StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), no_workers, test::uncompressed_buffer()),
        std::invalid_argument
    );

    BufferConfig compressed;
    compressed.enable_compression = true;
    EXPECT_THROW(
        StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), compressed),
        std::invalid_argument
    );
}

TEST(StreamingPipelineConstruction, BufferConfigMustBeGiven) {
    // A default BufferConfig enables compression, which needs a codec.
    static_assert(!std::is_constructible_v<StreamingPipeline, const Translator&, const Parser&, const Assembler&>);
    static_assert(std::is_constructible_v<
                  StreamingPipeline,
                  const Translator&,
                  const Parser&,
                  const Assembler&,
                  ChunkConfig,
                  StreamConfig,
                  BufferConfig>);
    EXPECT_TRUE(BufferConfig{}.enable_compression);
}

TEST_F(PipelineTest, CloneFailureIsAStreamingError) {
    translator.fail_clone = true;
    StreamingPipeline pipeline(translator, parser, assembler, small_chunks(), sequential(), test::uncompressed_buffer());
    EXPECT_THROW(pipeline.stream_translate(test::paragraphs(10)), StreamingError);
}

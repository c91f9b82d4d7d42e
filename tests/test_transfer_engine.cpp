#include "support/fake_http_client.hpp"
#include "support/fakes.hpp"

#include "updatechecker/progress.hpp"
#include "updatechecker/transfer_engine.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace updatechecker;
using namespace updatechecker::test;

namespace {

constexpr std::uint64_t kSmallChunk = 16 * 1024;

TransferOptions smallChunks(const fs::path& temp_root) {
    TransferOptions options;
    options.chunk_size = kSmallChunk;
    options.temp_root = temp_root;
    return options;
}

bool isEmptyDirectory(const fs::path& dir) {
    return !fs::exists(dir) || fs::is_empty(dir);
}

} // namespace

TEST(CalculateChunks, SplitsOneByteOverBoundaryIntoTwoChunks) {
    const std::uint64_t ten_mib = 10ull * 1024 * 1024;
    const auto chunks = calculateChunks(ten_mib + 1, ten_mib);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], (ChunkSpec{0, 0, 10485759}));
    EXPECT_EQ(chunks[1], (ChunkSpec{1, 10485760, 10485760}));
}

TEST(CalculateChunks, SmallFileIsOneChunk) {
    const auto chunks = calculateChunks(100, kDefaultChunkSize);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (ChunkSpec{0, 0, 99}));
}

TEST(CalculateChunks, ExactMultipleHasNoTrailingChunk) {
    const auto chunks = calculateChunks(300, 100);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2], (ChunkSpec{2, 200, 299}));
}

TEST(CalculateChunks, ZeroBytesIsEmpty) {
    EXPECT_TRUE(calculateChunks(0, 100).empty());
}

TEST(CalculateChunks, RangesAreContiguousAndCoverTheFile) {
    for (std::uint64_t size : {1ull, 2ull, 99ull, 100ull, 101ull, 999ull, 12345ull}) {
        for (std::uint64_t chunk : {1ull, 7ull, 100ull, 4096ull}) {
            const auto chunks = calculateChunks(size, chunk);
            ASSERT_FALSE(chunks.empty());
            EXPECT_EQ(chunks.front().start_byte, 0u);
            EXPECT_EQ(chunks.back().end_byte, size - 1);
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                EXPECT_EQ(chunks[i].index, i);
                EXPECT_LE(chunks[i].start_byte, chunks[i].end_byte);
                EXPECT_LE(chunks[i].end_byte - chunks[i].start_byte + 1, chunk);
                if (i > 0) {
                    EXPECT_EQ(chunks[i].start_byte, chunks[i - 1].end_byte + 1);
                }
            }
        }
    }
}

TEST(ParseContentRange, AcceptsKnownAndUnknownTotals) {
    const auto range = parseContentRange("bytes 100-199/1000");
    ASSERT_TRUE(range);
    EXPECT_EQ(range->first, 100u);
    EXPECT_EQ(range->last, 199u);

    const auto open = parseContentRange("bytes 0-9/*");
    ASSERT_TRUE(open);
    EXPECT_EQ(open->last, 9u);
}

TEST(ParseContentRange, RejectsMalformedValues) {
    EXPECT_FALSE(parseContentRange(""));
    EXPECT_FALSE(parseContentRange("bytes */1000"));
    EXPECT_FALSE(parseContentRange("bytes 200-100/1000"));
}

TEST(AssembleChunks, ReproducesTheOriginalBytes) {
    TempDir dir;
    const std::string original = makePayload(10000);

    std::vector<fs::path> files;
    for (const auto& chunk : calculateChunks(original.size(), 3000)) {
        const fs::path file = dir / ("chunk_" + std::to_string(chunk.index));
        writeFile(file, original.substr(chunk.start_byte, chunk.end_byte - chunk.start_byte + 1));
        files.push_back(file);
    }

    ASSERT_TRUE(assembleChunks(files, dir / "out.bin"));
    EXPECT_EQ(readFile(dir / "out.bin"), original);
}

TEST(AssembleChunks, FailsOnMissingChunk) {
    TempDir dir;
    writeFile(dir / "a", "abc");
    EXPECT_FALSE(assembleChunks({dir / "a", dir / "missing"}, dir / "out.bin"));
}

class TransferEngineTest : public ::testing::Test {
protected:
    const std::string url_ = "https://example.com/files/app.bin";
    TempDir dir_;
    FakeHttpClient client_;
    ProgressSink progress_;
};

TEST_F(TransferEngineTest, PlansSingleStreamBelowChunkSize) {
    client_.setBody(url_, makePayload(kSmallChunk - 1));
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto job = engine.plan(url_, dir_ / "app.bin", std::nullopt);
    EXPECT_EQ(job.strategy, TransferStrategy::Single);
    ASSERT_TRUE(job.file_size);
    EXPECT_EQ(*job.file_size, kSmallChunk - 1);
}

TEST_F(TransferEngineTest, PlansChunkedForLargeRangeCapableServer) {
    client_.setBody(url_, makePayload(kSmallChunk * 3));
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    EXPECT_EQ(engine.plan(url_, dir_ / "app.bin", std::nullopt).strategy,
              TransferStrategy::Chunked);
}

TEST_F(TransferEngineTest, PlansSingleStreamWithoutRangeSupport) {
    FakeResource resource;
    resource.body = makePayload(kSmallChunk * 3);
    resource.supports_ranges = false;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    EXPECT_EQ(engine.plan(url_, dir_ / "app.bin", std::nullopt).strategy,
              TransferStrategy::Single);
}

TEST_F(TransferEngineTest, ProbeFailureDegradesToSingleStream) {
    FakeResource resource;
    resource.body = makePayload(kSmallChunk * 3);
    resource.fail_head = true;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "app.bin");
    ASSERT_TRUE(result);
    EXPECT_EQ(readFile(*result), resource.body);
    EXPECT_EQ(client_.rangeCalls(url_), 0);
}

TEST_F(TransferEngineTest, ExplicitPreferenceOverridesSizeThreshold) {
    client_.setBody(url_, makePayload(1000));
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    EXPECT_EQ(engine.plan(url_, dir_ / "app.bin", true).strategy, TransferStrategy::Chunked);
    EXPECT_EQ(engine.plan(url_, dir_ / "app.bin", false).strategy, TransferStrategy::Single);
    EXPECT_EQ(client_.headCalls(url_), 1);
}

TEST_F(TransferEngineTest, ChunkedDownloadReassemblesInOrder) {
    const std::string body = makePayload(kSmallChunk * 4 + 123);
    client_.setBody(url_, body);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "out" / "app.bin");
    ASSERT_TRUE(result);
    EXPECT_EQ(readFile(*result), body);
    EXPECT_EQ(client_.rangeCalls(url_), 5);
    EXPECT_TRUE(isEmptyDirectory(dir_ / "tmp"));

    const auto task = progress_.find((dir_ / "out" / "app.bin").string());
    ASSERT_TRUE(task);
    EXPECT_FALSE(task->is_running);
    EXPECT_EQ(task->downloaded_bytes, body.size());
    EXPECT_EQ(task->chunks_total, 5u);
    EXPECT_EQ(task->chunks_done, 5u);
    EXPECT_FALSE(task->fell_back);
}

TEST_F(TransferEngineTest, FailedChunkFallsBackToSingleStream) {
    FakeResource resource;
    resource.body = makePayload(kSmallChunk * 3);
    resource.fail_range_at = kSmallChunk;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "app.bin");
    ASSERT_TRUE(result);
    EXPECT_EQ(readFile(*result), resource.body);
    EXPECT_EQ(client_.getCalls(url_) - client_.rangeCalls(url_), 1);
    EXPECT_TRUE(isEmptyDirectory(dir_ / "tmp"));

    const auto task = progress_.find((dir_ / "app.bin").string());
    ASSERT_TRUE(task);
    EXPECT_TRUE(task->fell_back);
    EXPECT_EQ(task->chunks_total, 0u);
    EXPECT_EQ(task->downloaded_bytes, resource.body.size());
}

TEST_F(TransferEngineTest, MismatchedContentRangeFallsBackToSingleStream) {
    FakeResource resource;
    resource.body = makePayload(kSmallChunk * 2 + 10);
    resource.wrong_range = true;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "app.bin");
    ASSERT_TRUE(result);
    EXPECT_EQ(readFile(*result), resource.body);
}

TEST_F(TransferEngineTest, FailureKeepsPreviousDestination) {
    const fs::path destination = dir_ / "app.bin";
    writeFile(destination, "previous");
    FakeResource resource;
    resource.body = makePayload(1000);
    resource.fail_get = true;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    EXPECT_FALSE(engine.fetch(url_, destination));
    EXPECT_EQ(readFile(destination), "previous");
    EXPECT_FALSE(fs::exists(dir_ / "app.bin.download"));

    const auto task = progress_.find(destination.string());
    ASSERT_TRUE(task);
    EXPECT_TRUE(task->has_error);
}

TEST_F(TransferEngineTest, BodyWithoutLengthIsBuffered) {
    FakeResource resource;
    resource.body = makePayload(5000);
    resource.report_length = false;
    client_.set(url_, resource);
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "app.bin");
    ASSERT_TRUE(result);
    EXPECT_EQ(readFile(*result), resource.body);

    const auto task = progress_.find((dir_ / "app.bin").string());
    ASSERT_TRUE(task);
    EXPECT_EQ(task->total_bytes, resource.body.size());
}

TEST_F(TransferEngineTest, ZeroByteFileIsWritten) {
    client_.setBody(url_, "");
    TransferEngine engine(client_, progress_, smallChunks(dir_ / "tmp"));

    const auto result = engine.fetch(url_, dir_ / "empty.bin", true);
    ASSERT_TRUE(result);
    EXPECT_TRUE(fs::exists(*result));
    EXPECT_EQ(fs::file_size(*result), 0u);
}

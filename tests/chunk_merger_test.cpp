#include "core/chunk_merger.hpp"
#include "test_base.hpp"
#include <gtest/gtest.h>
#include <fstream>

namespace
{
    // Writes to a real file but fails once the byte budget is spent
    class FailingOutput : public MergeOutput
    {
    public:
        FailingOutput(const std::string &path, size_t budget)
            : stream_(path, std::ios::binary | std::ios::trunc), budget_(budget) {}

        bool write(const char *data, size_t size) override
        {
            if (size > budget_)
            {
                stream_.write(data, static_cast<std::streamsize>(budget_));
                budget_ = 0;
                return false;
            }
            budget_ -= size;
            stream_.write(data, static_cast<std::streamsize>(size));
            return true;
        }

        bool close() override
        {
            stream_.close();
            return true;
        }

    private:
        std::ofstream stream_;
        size_t budget_;
    };
}

class ChunkMergerTest : public TestBase
{
protected:
    ChunkMerger makeMerger(ChunkMerger::Options options = {}, ChunkMerger::OutputFactory factory = nullptr)
    {
        return ChunkMerger(options, logger_, std::move(factory));
    }
};

TEST_F(ChunkMergerTest, MergesInNumericOrder)
{
    createFile("video/2.chunk", "B");
    createFile("video/0.chunk", "A");
    createFile("video/1.chunk", "C");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success) << result.status.error_message;
    EXPECT_EQ(readFile(path("video/merged.mp4")), "ACB");
    EXPECT_EQ(result.bytes_written, 3u);
    EXPECT_FALSE(result.degraded);
    ASSERT_EQ(result.chunks.size(), 3u);
    EXPECT_EQ(result.chunks[0].file_name, "0.chunk");
    EXPECT_EQ(result.chunks[2].file_name, "2.chunk");
}

TEST_F(ChunkMergerTest, OrdersNumericallyNotLexically)
{
    createFile("video/chunk_10.chunk", "ten,");
    createFile("video/chunk_9.chunk", "nine,");
    createFile("video/chunk_100.chunk", "hundred");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(readFile(path("video/merged.mp4")), "nine,ten,hundred");
}

TEST_F(ChunkMergerTest, IgnoresOtherFilesAndSubdirectories)
{
    createFile("video/0.chunk", "A");
    createFile("video/1.chunk", "B");
    createFile("video/notes.txt", "ignored");
    createFile("video/nested/2.chunk", "ignored");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(readFile(path("video/merged.mp4")), "AB");
}

TEST_F(ChunkMergerTest, TruncatesExistingArtifact)
{
    createFile("video/0.chunk", "new");
    createFile("video/merged.mp4", "stale content from an earlier attempt");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(readFile(path("video/merged.mp4")), "new");
}

TEST_F(ChunkMergerTest, CopiesAcrossBufferBoundaries)
{
    std::string first(10000, 'x');
    std::string second(7, 'y');
    createFile("video/0.chunk", first);
    createFile("video/1.chunk", second);

    ChunkMerger::Options options;
    options.buffer_size = 4096;
    auto merger = makeMerger(options);
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(readFile(path("video/merged.mp4")), first + second);
    EXPECT_EQ(result.bytes_written, 10007u);
}

TEST_F(ChunkMergerTest, EmptyDirectoryIsNoChunksFound)
{
    fs::create_directories(path("video"));
    createFile("video/readme.txt", "no chunks here");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.kind, PipelineErrorKind::NoChunksFound);
    EXPECT_EQ(result.status.error_message, "failed to find chunks");
    EXPECT_FALSE(fs::exists(path("video/merged.mp4")));
}

TEST_F(ChunkMergerTest, MissingDirectoryIsNoChunksFound)
{
    auto merger = makeMerger();
    auto result = merger.merge(path("absent"), path("merged.mp4"));

    EXPECT_EQ(result.status.kind, PipelineErrorKind::NoChunksFound);
    EXPECT_FALSE(fs::exists(path("merged.mp4")));
}

TEST_F(ChunkMergerTest, WriteFailureLeavesNoArtifact)
{
    createFile("video/0.chunk", "AAAA");
    createFile("video/1.chunk", "BBBB");

    auto factory = [](const std::string &output_path) -> std::unique_ptr<MergeOutput>
    {
        return std::make_unique<FailingOutput>(output_path, 6);
    };
    auto merger = makeMerger({}, factory);
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.kind, PipelineErrorKind::MergeIOError);
    EXPECT_NE(result.status.error_message.find("1.chunk"), std::string::npos);
    EXPECT_FALSE(fs::exists(path("video/merged.mp4")));
}

TEST_F(ChunkMergerTest, UncreatableOutputIsMergeIOError)
{
    createFile("video/0.chunk", "A");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("missing-dir/merged.mp4"));

    EXPECT_EQ(result.status.kind, PipelineErrorKind::MergeIOError);
    EXPECT_EQ(result.status.error_message, "failed to create output file");
}

TEST_F(ChunkMergerTest, UnnumberedChunksSortFirstInNameOrder)
{
    createFile("video/1.chunk", "one,");
    createFile("video/beta.chunk", "beta,");
    createFile("video/alpha.chunk", "alpha,");
    createFile("video/0.chunk", "zero,");

    auto merger = makeMerger();
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(readFile(path("video/merged.mp4")), "alpha,beta,zero,one,");
    EXPECT_TRUE(logContains("no sequence number"));
}

TEST_F(ChunkMergerTest, RejectsUnnumberedChunksWhenConfigured)
{
    createFile("video/0.chunk", "A");
    createFile("video/final.chunk", "Z");

    ChunkMerger::Options options;
    options.reject_unnumbered = true;
    auto merger = makeMerger(options);
    auto result = merger.merge(path("video"), path("video/merged.mp4"));

    EXPECT_FALSE(result.status.success);
    EXPECT_EQ(result.status.kind, PipelineErrorKind::InvalidChunkName);
    EXPECT_FALSE(fs::exists(path("video/merged.mp4")));
}

TEST_F(ChunkMergerTest, CustomExtension)
{
    createFile("video/part-1.bin", "1");
    createFile("video/part-0.bin", "0");
    createFile("video/part-2.chunk", "ignored");

    ChunkMerger::Options options;
    options.chunk_extension = ".bin";
    auto merger = makeMerger(options);
    auto result = merger.merge(path("video"), path("video/out.mp4"));

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(readFile(path("video/out.mp4")), "01");
}

TEST_F(ChunkMergerTest, ExtractSequenceKey)
{
    EXPECT_EQ(ChunkMerger::extractSequenceKey("0.chunk"), 0);
    EXPECT_EQ(ChunkMerger::extractSequenceKey("chunk_0017.chunk"), 17);
    EXPECT_EQ(ChunkMerger::extractSequenceKey("part12of40.chunk"), 12);
    EXPECT_EQ(ChunkMerger::extractSequenceKey("/var/data/7/3.chunk"), 3);
    EXPECT_EQ(ChunkMerger::extractSequenceKey("final.chunk"), ChunkMerger::kUnnumberedKey);
    EXPECT_EQ(ChunkMerger::extractSequenceKey("99999999999999999999.chunk"), ChunkMerger::kUnnumberedKey);
}

TEST_F(ChunkMergerTest, OrderChunksIsDeterministicForEqualKeys)
{
    std::vector<ChunkFile> chunks = {
        {"/d/b_1.chunk", "b_1.chunk", 1},
        {"/d/a_1.chunk", "a_1.chunk", 1},
        {"/d/0.chunk", "0.chunk", 0},
    };
    ChunkMerger::orderChunks(chunks);

    EXPECT_EQ(chunks[0].file_name, "0.chunk");
    EXPECT_EQ(chunks[1].file_name, "a_1.chunk");
    EXPECT_EQ(chunks[2].file_name, "b_1.chunk");
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pipeline/element_util.h"
#include "store/chunk_format.h"
#include "store/posix_chunk_store.h"
#include "store/snapshot_layout.h"
#include "store/stream_metadata.h"
#include "test_util/temp_dir.h"
#include "worker/chunk_writer.h"

using namespace Snapstream;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class ChunkWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.Path("snap");
        StreamMetadataStore metadata(&store_);
        ASSERT_TRUE(metadata.CreateLayout(root_).ok());
    }

    std::vector<std::string> Uncommitted() {
        auto names = store_.List(layout::UncommittedDir(root_), "");
        EXPECT_TRUE(names.ok()) << names.status();
        return names.ok() ? *names : std::vector<std::string>{};
    }

    std::vector<int64_t> ReadChunk(const std::string& name) {
        auto file = store_.ReadFile(layout::UncommittedPath(root_, name));
        EXPECT_TRUE(file.ok()) << file.status();
        auto chunk = DecodeChunk(*file);
        EXPECT_TRUE(chunk.ok()) << chunk.status();
        return Int64Values(chunk->elements);
    }

    test_util::TempDir dir_;
    PosixChunkStore store_;
    std::string root_;
};

TEST_F(ChunkWriterTest, FlushesWhenChunkIsFull) {
    ChunkWriter writer(&store_, root_, "w1", 3, 0, snapshot_protocol::COMPRESSION_NONE, 64);
    for (int64_t i = 0; i < 100; ++i) {
        ASSERT_TRUE(writer.Write(MakeInt64Element(i)).ok());
    }
    ASSERT_TRUE(writer.Finish().ok());
    EXPECT_EQ(writer.num_elements(), 100);
    ASSERT_GT(writer.chunks().size(), 1u);

    std::vector<int64_t> values;
    int64_t total = 0;
    for (const auto& chunk : writer.chunks()) {
        EXPECT_EQ(chunk.split_index(), 3);
        total += chunk.num_elements();
        auto part = ReadChunk(chunk.uncommitted_name());
        EXPECT_EQ(static_cast<int64_t>(part.size()), chunk.num_elements());
        values.insert(values.end(), part.begin(), part.end());
    }
    EXPECT_EQ(total, 100);
    for (int64_t i = 0; i < 100; ++i) EXPECT_EQ(values[i], i);
    EXPECT_THAT(Uncommitted(), SizeIs(writer.chunks().size()));
}

TEST_F(ChunkWriterTest, SmallSplitIsOneChunk) {
    ChunkWriter writer(&store_, root_, "w1", 0, 0, snapshot_protocol::COMPRESSION_BLOSC_LZ4, 1 << 20);
    for (int64_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(writer.Write(MakeInt64Element(i)).ok());
    }
    ASSERT_TRUE(writer.Finish().ok());
    ASSERT_THAT(writer.chunks(), SizeIs(1));
    EXPECT_EQ(writer.chunks()[0].num_elements(), 10);
    EXPECT_EQ(ReadChunk(writer.chunks()[0].uncommitted_name()).size(), 10u);
}

TEST_F(ChunkWriterTest, EmptySplitWritesNothing) {
    ChunkWriter writer(&store_, root_, "w1", 0, 0, snapshot_protocol::COMPRESSION_NONE, 1 << 20);
    ASSERT_TRUE(writer.Finish().ok());
    EXPECT_THAT(writer.chunks(), IsEmpty());
    EXPECT_THAT(Uncommitted(), IsEmpty());
}

TEST_F(ChunkWriterTest, ConcurrentAssignmentsDoNotCollide) {
    ChunkWriter first(&store_, root_, "w1", 0, 0, snapshot_protocol::COMPRESSION_NONE, 1);
    ChunkWriter second(&store_, root_, "w2", 0, 1, snapshot_protocol::COMPRESSION_NONE, 1);
    ASSERT_TRUE(first.Write(MakeInt64Element(1)).ok());
    ASSERT_TRUE(second.Write(MakeInt64Element(2)).ok());
    ASSERT_TRUE(first.Finish().ok());
    ASSERT_TRUE(second.Finish().ok());
    EXPECT_NE(first.chunks()[0].uncommitted_name(), second.chunks()[0].uncommitted_name());
    EXPECT_THAT(Uncommitted(), SizeIs(2));
}

TEST_F(ChunkWriterTest, AbandonDeletesPublishedChunks) {
    ChunkWriter writer(&store_, root_, "w1", 0, 0, snapshot_protocol::COMPRESSION_NONE, 1);
    for (int64_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(writer.Write(MakeInt64Element(i)).ok());
    }
    EXPECT_THAT(Uncommitted(), SizeIs(5));
    writer.Abandon();
    EXPECT_THAT(writer.chunks(), IsEmpty());
    EXPECT_THAT(Uncommitted(), IsEmpty());
}

TEST_F(ChunkWriterTest, WriteAfterFinishFails) {
    ChunkWriter writer(&store_, root_, "w1", 0, 0, snapshot_protocol::COMPRESSION_NONE, 1 << 20);
    ASSERT_TRUE(writer.Finish().ok());
    EXPECT_TRUE(absl::IsFailedPrecondition(writer.Write(MakeInt64Element(0))));
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <thread>

#include "common/status_util.h"
#include "dispatcher/stream_manager.h"
#include "pipeline/element_util.h"
#include "pipeline/pipeline.h"
#include "store/posix_chunk_store.h"
#include "store/snapshot_layout.h"
#include "store/stream_metadata.h"
#include "test_util/fault_injecting_chunk_store.h"
#include "test_util/test_cluster.h"
#include "worker/chunk_writer.h"

using namespace Snapstream;
using snapshot_protocol::GetSplitResponse;
using test_util::FaultInjectingChunkStore;
using ::testing::ElementsAre;

class StreamManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        faults_ = std::make_shared<FaultInjectingChunkStore>(std::make_shared<PosixChunkStore>());
        root_ = dir_.Path("stream");
        StreamMetadataStore metadata(faults_.get());
        ASSERT_TRUE(metadata.CreateLayout(root_).ok());
        snapshot_protocol::StreamMetadata record;
        record.set_run_id("run");
        ASSERT_TRUE(metadata.WriteMetadata(root_, record).ok());
    }

    std::unique_ptr<StreamManager> MakeStream(const snapshot_protocol::PipelineDescriptor& descriptor) {
        auto pipeline = BuildPipeline(descriptor);
        EXPECT_TRUE(pipeline.ok()) << pipeline.status();
        snapshot_protocol::SnapshotOptions options;
        options.set_max_chunk_size_bytes(1 << 20);
        return std::make_unique<StreamManager>(1, root_, "run", descriptor, options,
                std::move(pipeline).value(), faults_.get());
    }

    GetSplitResponse Pull(StreamManager* stream, const std::string& worker,
                          absl::Duration wait = absl::Milliseconds(10)) {
        GetSplitResponse response;
        stream->GetSplit(worker, wait, &response);
        return response;
    }

    // Writes num_chunks single-element chunks for one split assignment.
    snapshot_protocol::ReportSplitDoneRequest Complete(const std::string& worker, int64_t split,
                                                       int64_t generation, int num_chunks) {
        ChunkWriter writer(faults_.get(), root_, worker, split, generation,
                snapshot_protocol::COMPRESSION_NONE, 1);
        for (int i = 0; i < num_chunks; ++i) {
            EXPECT_TRUE(writer.Write(MakeInt64Element(split * 100 + i)).ok());
        }
        EXPECT_TRUE(writer.Finish().ok());
        snapshot_protocol::ReportSplitDoneRequest request;
        request.set_stream_id(1);
        request.set_worker_id(worker);
        request.set_split_index(split);
        request.set_generation(generation);
        for (const auto& chunk : writer.chunks()) *request.add_chunks() = chunk;
        return request;
    }

    absl::StatusOr<StreamStatus> Persisted() {
        StreamMetadataStore metadata(faults_.get());
        return metadata.ReadStatus(root_);
    }

    test_util::TempDir dir_;
    std::shared_ptr<FaultInjectingChunkStore> faults_;
    std::string root_;
};

TEST_F(StreamManagerTest, EmptyPipelineSealsOnStart) {
    auto stream = MakeStream(test_util::RangePipeline(0));
    ASSERT_TRUE(stream->Start().ok());
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_DONE);
    auto status = Persisted();
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status->state, snapshot_protocol::STREAM_STATE_DONE);
    EXPECT_EQ(status->seal->num_chunks(), 0);
    EXPECT_EQ(Pull(stream.get(), "w1").result(), GetSplitResponse::NO_MORE_SPLITS);
}

TEST_F(StreamManagerTest, HandsOutSplitsInOrderThenWaits) {
    auto stream = MakeStream(test_util::RangePipeline(10, 3));
    ASSERT_TRUE(stream->Start().ok());
    for (int64_t i = 0; i < 3; ++i) {
        GetSplitResponse response = Pull(stream.get(), "w1");
        ASSERT_EQ(response.result(), GetSplitResponse::ASSIGNED);
        EXPECT_EQ(response.split().index(), i);
        EXPECT_EQ(response.generation(), 0);
    }
    // Everything is out and nobody finished
    EXPECT_EQ(Pull(stream.get(), "w2").result(), GetSplitResponse::WAIT);
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_STREAMING);
}

TEST_F(StreamManagerTest, ChunksAreNumberedInCommitOrder) {
    auto stream = MakeStream(test_util::RangePipeline(10, 3));
    ASSERT_TRUE(stream->Start().ok());
    for (int i = 0; i < 3; ++i) Pull(stream.get(), "w1");

    snapshot_protocol::ReportSplitDoneResponse response;
    ASSERT_TRUE(stream->ReportSplitDone(Complete("w1", 2, 0, 2), &response).ok());
    EXPECT_TRUE(response.accepted());
    EXPECT_THAT(response.chunk_indices(), ElementsAre(0, 1));

    response.Clear();
    ASSERT_TRUE(stream->ReportSplitDone(Complete("w1", 0, 0, 1), &response).ok());
    EXPECT_THAT(response.chunk_indices(), ElementsAre(2));
    EXPECT_EQ(stream->num_committed_chunks(), 3);
    EXPECT_TRUE(*faults_->Exists(layout::ChunkPath(root_, 2)));
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_STREAMING);

    response.Clear();
    ASSERT_TRUE(stream->ReportSplitDone(Complete("w1", 1, 0, 3), &response).ok());
    EXPECT_THAT(response.chunk_indices(), ElementsAre(3, 4, 5));
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_DONE);

    auto status = Persisted();
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status->seal->num_chunks(), 6);
    EXPECT_EQ(status->seal->num_elements(), 6);
    EXPECT_EQ(status->seal->num_splits(), 3);
    // Sealing clears leftovers
    EXPECT_TRUE(faults_->List(layout::UncommittedDir(root_), "")->empty());
}

TEST_F(StreamManagerTest, ReleasedSplitIsReassignedWithNewGeneration) {
    auto stream = MakeStream(test_util::RangePipeline(10, 1));
    ASSERT_TRUE(stream->Start().ok());
    ASSERT_EQ(Pull(stream.get(), "w1").result(), GetSplitResponse::ASSIGNED);

    EXPECT_EQ(stream->ReleaseWorker("w1"), 1);
    GetSplitResponse again = Pull(stream.get(), "w2");
    ASSERT_EQ(again.result(), GetSplitResponse::ASSIGNED);
    EXPECT_EQ(again.split().index(), 0);
    EXPECT_EQ(again.generation(), 1);
    EXPECT_EQ(stream->ReleaseWorker("w1"), 0);
}

TEST_F(StreamManagerTest, DuplicateCompletionIsDiscarded) {
    auto stream = MakeStream(test_util::RangePipeline(10, 1));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");
    stream->ReleaseWorker("w1");
    Pull(stream.get(), "w2");

    // The presumed-dead holder finishes first and wins
    auto late = Complete("w1", 0, 0, 2);
    auto current = Complete("w2", 0, 1, 2);
    snapshot_protocol::ReportSplitDoneResponse response;
    ASSERT_TRUE(stream->ReportSplitDone(late, &response).ok());
    EXPECT_TRUE(response.accepted());

    response.Clear();
    ASSERT_TRUE(stream->ReportSplitDone(current, &response).ok());
    EXPECT_FALSE(response.accepted());
    EXPECT_EQ(stream->num_committed_chunks(), 2);
    for (const auto& chunk : current.chunks()) {
        EXPECT_FALSE(*faults_->Exists(layout::UncommittedPath(root_, chunk.uncommitted_name())));
    }
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_DONE);
}

TEST_F(StreamManagerTest, CompletionOfUnissuedSplitIsRejected) {
    auto stream = MakeStream(test_util::RangePipeline(10, 2));
    ASSERT_TRUE(stream->Start().ok());
    snapshot_protocol::ReportSplitDoneResponse response;
    EXPECT_TRUE(absl::IsInvalidArgument(stream->ReportSplitDone(Complete("w1", 1, 0, 1), &response)));
}

TEST_F(StreamManagerTest, SplitFailureFailsTheStream) {
    auto stream = MakeStream(test_util::RangePipeline(10, 2));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");
    Pull(stream.get(), "w2");

    stream->ReportSplitFailed("w2", 1, ToFailureRecord(absl::InvalidArgumentError("NaN"), 1));
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_FAILED);
    EXPECT_EQ(Pull(stream.get(), "w1").result(), GetSplitResponse::ABORTED);

    snapshot_protocol::ReportSplitDoneResponse response;
    EXPECT_TRUE(absl::IsAborted(stream->ReportSplitDone(Complete("w1", 0, 0, 1), &response)));

    auto status = Persisted();
    ASSERT_TRUE(status.ok());
    ASSERT_EQ(status->state, snapshot_protocol::STREAM_STATE_FAILED);
    EXPECT_TRUE(absl::IsInvalidArgument(FromFailureRecord(*status->failure)));
    EXPECT_EQ(status->failure->split_index(), 1);
}

TEST_F(StreamManagerTest, CommitRenameFailureFailsTheStream) {
    auto stream = MakeStream(test_util::RangePipeline(10, 1));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");
    auto request = Complete("w1", 0, 0, 1);

    faults_->FailNext(FaultInjectingChunkStore::Op::kRename, -1, absl::UnavailableError("disk gone"), "chunks");
    snapshot_protocol::ReportSplitDoneResponse response;
    EXPECT_TRUE(absl::IsUnavailable(stream->ReportSplitDone(request, &response)));
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_FAILED);
    ASSERT_TRUE(stream->failure().has_value());
    EXPECT_TRUE(absl::IsUnavailable(FromFailureRecord(*stream->failure())));
}

TEST_F(StreamManagerTest, WaitingPullWakesOnRelease) {
    auto stream = MakeStream(test_util::RangePipeline(10, 1));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");

    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stream->ReleaseWorker("w1");
    });
    GetSplitResponse response = Pull(stream.get(), "w2", absl::Seconds(10));
    releaser.join();
    EXPECT_EQ(response.result(), GetSplitResponse::ASSIGNED);
    EXPECT_EQ(response.generation(), 1);
}

TEST_F(StreamManagerTest, SlowCommitDoesNotBlockSplitAssignment) {
    auto stream = MakeStream(test_util::RangePipeline(10, 3));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");
    auto request = Complete("w1", 0, 0, 1);

    faults_->HoldNext(FaultInjectingChunkStore::Op::kRename, layout::ChunkPath(root_, 0));
    snapshot_protocol::ReportSplitDoneResponse response;
    absl::Status committed;
    std::thread committer([&]() { committed = stream->ReportSplitDone(request, &response); });
    ASSERT_TRUE(faults_->AwaitHeld(absl::Seconds(10)));

    // Releases the rename even if the pull below wrongly waits on it.
    std::thread watchdog([&]() {
        std::this_thread::sleep_for(std::chrono::seconds(2));
        faults_->ReleaseHeld();
    });
    const absl::Time start = absl::Now();
    GetSplitResponse pulled = Pull(stream.get(), "w2");
    const absl::Duration elapsed = absl::Now() - start;
    EXPECT_EQ(stream->num_committed_chunks(), 0);
    faults_->ReleaseHeld();
    committer.join();
    watchdog.join();

    EXPECT_LT(elapsed, absl::Seconds(1));
    ASSERT_EQ(pulled.result(), GetSplitResponse::ASSIGNED);
    EXPECT_EQ(pulled.split().index(), 1);
    ASSERT_TRUE(committed.ok()) << committed;
    EXPECT_TRUE(response.accepted());
    EXPECT_THAT(response.chunk_indices(), ElementsAre(0));
    EXPECT_EQ(stream->num_committed_chunks(), 1);
}

TEST_F(StreamManagerTest, DuplicateDuringCommitIsDiscarded) {
    auto stream = MakeStream(test_util::RangePipeline(10, 1));
    ASSERT_TRUE(stream->Start().ok());
    Pull(stream.get(), "w1");
    stream->ReleaseWorker("w1");
    Pull(stream.get(), "w2");
    auto first = Complete("w1", 0, 0, 1);
    auto second = Complete("w2", 0, 1, 1);

    faults_->HoldNext(FaultInjectingChunkStore::Op::kRename, layout::ChunkPath(root_, 0));
    snapshot_protocol::ReportSplitDoneResponse first_response;
    std::thread committer([&]() { EXPECT_TRUE(stream->ReportSplitDone(first, &first_response).ok()); });
    ASSERT_TRUE(faults_->AwaitHeld(absl::Seconds(10)));

    snapshot_protocol::ReportSplitDoneResponse second_response;
    ASSERT_TRUE(stream->ReportSplitDone(second, &second_response).ok());
    EXPECT_FALSE(second_response.accepted());
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_STREAMING);

    faults_->ReleaseHeld();
    committer.join();
    EXPECT_TRUE(first_response.accepted());
    EXPECT_EQ(stream->state(), snapshot_protocol::STREAM_STATE_DONE);
    EXPECT_EQ(Persisted()->seal->num_chunks(), 1);
}

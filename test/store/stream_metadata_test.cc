#include <gtest/gtest.h>

#include "store/posix_chunk_store.h"
#include "store/snapshot_layout.h"
#include "store/stream_metadata.h"
#include "test_util/temp_dir.h"

using namespace Snapstream;

class StreamMetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.Path("stream");
        metadata_ = std::make_unique<StreamMetadataStore>(&store_);
    }

    test_util::TempDir dir_;
    PosixChunkStore store_;
    std::unique_ptr<StreamMetadataStore> metadata_;
    std::string root_;
};

TEST_F(StreamMetadataTest, UnknownBeforeCreation) {
    auto status = metadata_->ReadStatus(root_);
    ASSERT_TRUE(status.ok()) << status.status();
    EXPECT_FALSE(status->created());
    EXPECT_TRUE(absl::IsNotFound(metadata_->ReadMetadata(root_).status()));
}

TEST_F(StreamMetadataTest, StateFollowsRecords) {
    ASSERT_TRUE(metadata_->CreateLayout(root_).ok());
    EXPECT_TRUE(*store_.Exists(layout::ChunksDir(root_)));
    EXPECT_TRUE(*store_.Exists(layout::UncommittedDir(root_)));

    snapshot_protocol::StreamMetadata metadata;
    metadata.set_run_id("run-1");
    metadata.set_max_chunk_size_bytes(1024);
    ASSERT_TRUE(metadata_->WriteMetadata(root_, metadata).ok());
    EXPECT_EQ(metadata_->ReadStatus(root_)->state, snapshot_protocol::STREAM_STATE_STREAMING);
    EXPECT_EQ(metadata_->ReadMetadata(root_)->run_id(), "run-1");

    snapshot_protocol::SealRecord seal;
    seal.set_num_chunks(3);
    seal.set_num_elements(30);
    ASSERT_TRUE(metadata_->WriteSealRecord(root_, seal).ok());
    auto sealed = metadata_->ReadStatus(root_);
    ASSERT_TRUE(sealed.ok());
    EXPECT_EQ(sealed->state, snapshot_protocol::STREAM_STATE_DONE);
    ASSERT_TRUE(sealed->seal.has_value());
    EXPECT_EQ(sealed->seal->num_chunks(), 3);
    EXPECT_TRUE(sealed->terminal());
}

TEST_F(StreamMetadataTest, ErrorWinsOverDone) {
    ASSERT_TRUE(metadata_->CreateLayout(root_).ok());
    ASSERT_TRUE(metadata_->WriteMetadata(root_, snapshot_protocol::StreamMetadata()).ok());
    ASSERT_TRUE(metadata_->WriteSealRecord(root_, snapshot_protocol::SealRecord()).ok());
    snapshot_protocol::FailureRecord failure;
    failure.set_code(static_cast<int>(absl::StatusCode::kInvalidArgument));
    failure.set_message("NaN");
    ASSERT_TRUE(metadata_->WriteFailureRecord(root_, failure).ok());

    auto status = metadata_->ReadStatus(root_);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status->state, snapshot_protocol::STREAM_STATE_FAILED);
    ASSERT_TRUE(status->failure.has_value());
    EXPECT_EQ(status->failure->message(), "NaN");
}

TEST_F(StreamMetadataTest, GarbageRecordIsDataLoss) {
    ASSERT_TRUE(metadata_->CreateLayout(root_).ok());
    ASSERT_TRUE(store_.WriteAtomic(layout::DonePath(root_), "\xff\xff\xff not a proto").ok());
    ASSERT_TRUE(store_.WriteAtomic(layout::MetadataPath(root_), "").ok());
    EXPECT_TRUE(absl::IsDataLoss(metadata_->ReadStatus(root_).status()));
}

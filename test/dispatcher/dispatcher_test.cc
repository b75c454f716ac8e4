#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <thread>

#include "dispatcher/dispatcher.h"
#include "store/posix_chunk_store.h"
#include "pipeline/element_util.h"
#include "test_util/fault_injecting_chunk_store.h"
#include "test_util/stream_builder.h"
#include "test_util/test_cluster.h"

using namespace Snapstream;
using snapshot_protocol::GetSplitResponse;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;
using snapshot_protocol::GetNextElementResponse;

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<PosixChunkStore>();
        options_.lease_timeout = absl::Milliseconds(200);
        options_.lease_check_interval = absl::Milliseconds(20);
        options_.split_wait = absl::Milliseconds(20);
        dispatcher_ = std::make_unique<Dispatcher>(store_, options_);
    }

    absl::StatusOr<int64_t> Begin(const std::string& name, int64_t n, int64_t splits = 1) {
        snapshot_protocol::BeginStreamRequest request;
        request.set_path(dir_.Path(name));
        *request.mutable_pipeline() = test_util::RangePipeline(n, splits);
        snapshot_protocol::BeginStreamResponse response;
        absl::Status s = dispatcher_->BeginStream(request, &response);
        if (!s.ok()) return s;
        return response.stream_id();
    }

    GetSplitResponse Pull(int64_t stream_id, const std::string& worker) {
        snapshot_protocol::GetSplitRequest request;
        request.set_stream_id(stream_id);
        request.set_worker_id(worker);
        GetSplitResponse response;
        EXPECT_TRUE(dispatcher_->GetSplit(request, &response).ok());
        return response;
    }

    snapshot_protocol::WorkerHeartbeatResponse Heartbeat(const std::string& worker,
                                                         std::vector<int64_t> active = {}) {
        snapshot_protocol::WorkerHeartbeatRequest request;
        request.set_worker_id(worker);
        for (int64_t id : active) request.add_active_stream_ids(id);
        snapshot_protocol::WorkerHeartbeatResponse response;
        EXPECT_TRUE(dispatcher_->WorkerHeartbeat(request, &response).ok());
        return response;
    }

    absl::StatusOr<int64_t> Join(const std::string& group_name, const std::string& name,
                                 snapshot_protocol::ShardingPolicy policy, int num_consumers) {
        snapshot_protocol::JoinConsumerGroupRequest request;
        request.set_group_name(group_name);
        request.set_path(dir_.Path(name));
        request.set_policy(policy);
        request.set_num_consumers(num_consumers);
        request.set_repetitions(1);
        request.set_poll_initial_backoff_ms(1);
        request.set_poll_max_backoff_ms(10);
        request.set_queue_capacity(4);
        snapshot_protocol::JoinConsumerGroupResponse response;
        absl::Status s = dispatcher_->JoinConsumerGroup(request, &response);
        if (!s.ok()) return s;
        return response.group_id();
    }

    absl::Status Next(int64_t group_id, int consumer, GetNextElementResponse* response) {
        snapshot_protocol::GetNextElementRequest request;
        request.set_group_id(group_id);
        request.set_consumer(consumer);
        response->Clear();
        return dispatcher_->GetNextElement(request, response);
    }

    test_util::TempDir dir_;
    std::shared_ptr<ChunkStore> store_;
    DispatcherOptions options_;
    std::unique_ptr<Dispatcher> dispatcher_;
};

TEST_F(DispatcherTest, BeginStreamValidatesRequest) {
    snapshot_protocol::BeginStreamRequest request;
    snapshot_protocol::BeginStreamResponse response;
    *request.mutable_pipeline() = test_util::RangePipeline(10);
    EXPECT_TRUE(absl::IsInvalidArgument(dispatcher_->BeginStream(request, &response)));

    request.set_path(dir_.Path("bad"));
    request.mutable_options()->set_max_chunk_size_bytes(-1);
    EXPECT_TRUE(absl::IsInvalidArgument(dispatcher_->BeginStream(request, &response)));

    request.mutable_options()->set_max_chunk_size_bytes(0);
    request.mutable_pipeline()->clear_range();
    EXPECT_TRUE(absl::IsInvalidArgument(dispatcher_->BeginStream(request, &response)));
}

TEST_F(DispatcherTest, SavingTwiceReturnsTheActiveStream) {
    auto first = Begin("snap", 10);
    ASSERT_TRUE(first.ok()) << first.status();
    auto second = Begin("snap/", 10);
    ASSERT_TRUE(second.ok()) << second.status();
    EXPECT_EQ(*first, *second);
}

TEST_F(DispatcherTest, SavingOverAFinishedStreamFails) {
    auto empty = Begin("empty", 0);
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(absl::IsAlreadyExists(Begin("empty", 0).status()));

    // A second dispatcher sees the records on disk
    Dispatcher other(store_, options_);
    snapshot_protocol::BeginStreamRequest request;
    request.set_path(dir_.Path("empty"));
    *request.mutable_pipeline() = test_util::RangePipeline(0);
    snapshot_protocol::BeginStreamResponse response;
    EXPECT_TRUE(absl::IsAlreadyExists(other.BeginStream(request, &response)));
}

TEST_F(DispatcherTest, HeartbeatAnnouncesAndRetiresStreams) {
    auto id = Begin("snap", 10);
    ASSERT_TRUE(id.ok());

    auto response = Heartbeat("w1");
    ASSERT_EQ(response.new_streams_size(), 1);
    EXPECT_EQ(response.new_streams(0).stream_id(), *id);
    EXPECT_EQ(response.new_streams(0).path(), dir_.Path("snap"));
    EXPECT_GT(response.new_streams(0).options().max_chunk_size_bytes(), 0);
    EXPECT_EQ(dispatcher_->GetNumWorkers(), 1);

    // Known and still running: nothing to report
    response = Heartbeat("w1", {*id});
    EXPECT_THAT(response.new_streams(), IsEmpty());
    EXPECT_THAT(response.finished_stream_ids(), IsEmpty());

    // An id this dispatcher never issued is finished
    response = Heartbeat("w1", {*id, 999});
    EXPECT_THAT(response.finished_stream_ids(), ElementsAre(999));
}

TEST_F(DispatcherTest, AutoCompressionIsResolvedForWorkers) {
    snapshot_protocol::BeginStreamRequest request;
    request.set_path(dir_.Path("auto"));
    *request.mutable_pipeline() = test_util::RangePipeline(10);
    request.mutable_options()->set_compression(snapshot_protocol::COMPRESSION_AUTO);
    snapshot_protocol::BeginStreamResponse response;
    ASSERT_TRUE(dispatcher_->BeginStream(request, &response).ok());

    auto heartbeat = Heartbeat("w1");
    ASSERT_EQ(heartbeat.new_streams_size(), 1);
    EXPECT_EQ(heartbeat.new_streams(0).options().compression(), snapshot_protocol::COMPRESSION_BLOSC_LZ4);
}

TEST_F(DispatcherTest, UnknownStreamIsNotFound) {
    snapshot_protocol::GetSplitRequest request;
    request.set_stream_id(42);
    request.set_worker_id("w1");
    GetSplitResponse response;
    EXPECT_TRUE(absl::IsNotFound(dispatcher_->GetSplit(request, &response)));

    snapshot_protocol::GetStreamInfoRequest info;
    info.set_path(dir_.Path("never"));
    snapshot_protocol::GetStreamInfoResponse info_response;
    EXPECT_TRUE(absl::IsNotFound(dispatcher_->GetStreamInfo(info, &info_response)));
}

TEST_F(DispatcherTest, ExpiredLeaseReturnsSplitToPool) {
    auto id = Begin("snap", 10);
    ASSERT_TRUE(id.ok());
    ASSERT_EQ(Pull(*id, "w1").result(), GetSplitResponse::ASSIGNED);

    // w2 keeps asking; w1 stays silent until its lease runs out
    const absl::Time deadline = absl::Now() + absl::Seconds(10);
    GetSplitResponse response;
    do {
        response = Pull(*id, "w2");
    } while (response.result() == GetSplitResponse::WAIT && absl::Now() < deadline);
    ASSERT_EQ(response.result(), GetSplitResponse::ASSIGNED);
    EXPECT_EQ(response.split().index(), 0);
    EXPECT_EQ(response.generation(), 1);
}

TEST_F(DispatcherTest, ActiveWorkerKeepsItsLease) {
    auto id = Begin("snap", 10);
    ASSERT_TRUE(id.ok());
    ASSERT_EQ(Pull(*id, "w1").result(), GetSplitResponse::ASSIGNED);

    for (int i = 0; i < 20; ++i) {
        Heartbeat("w1", {*id});
        EXPECT_EQ(Pull(*id, "w2").result(), GetSplitResponse::WAIT);
    }
}

TEST_F(DispatcherTest, StreamInfoFromPersistedRecords) {
    auto id = Begin("empty", 0);
    ASSERT_TRUE(id.ok());

    Dispatcher other(store_, options_);
    snapshot_protocol::GetStreamInfoRequest request;
    request.set_path(dir_.Path("empty"));
    snapshot_protocol::GetStreamInfoResponse response;
    ASSERT_TRUE(other.GetStreamInfo(request, &response).ok());
    EXPECT_EQ(response.state(), snapshot_protocol::STREAM_STATE_DONE);
    EXPECT_EQ(response.num_committed_chunks(), 0);
}

TEST_F(DispatcherTest, OversizedRangeIsRejected) {
    snapshot_protocol::BeginStreamRequest request;
    request.set_path(dir_.Path("huge"));
    request.mutable_pipeline()->mutable_range()->set_start(std::numeric_limits<int64_t>::min() + 1);
    request.mutable_pipeline()->mutable_range()->set_stop(std::numeric_limits<int64_t>::max());
    snapshot_protocol::BeginStreamResponse response;
    EXPECT_TRUE(absl::IsInvalidArgument(dispatcher_->BeginStream(request, &response)));

    snapshot_protocol::GetStreamInfoRequest info_request;
    info_request.set_path(dir_.Path("huge"));
    snapshot_protocol::GetStreamInfoResponse info;
    EXPECT_TRUE(absl::IsNotFound(dispatcher_->GetStreamInfo(info_request, &info)));
}

TEST_F(DispatcherTest, SlowMetadataWriteDoesNotBlockOtherStreams) {
    auto faults = std::make_shared<test_util::FaultInjectingChunkStore>(store_);
    dispatcher_ = std::make_unique<Dispatcher>(faults, options_);
    auto first = Begin("a", 10);
    ASSERT_TRUE(first.ok()) << first.status();

    faults->HoldNext(test_util::FaultInjectingChunkStore::Op::kWriteAtomic, dir_.Path("b"));
    absl::StatusOr<int64_t> second;
    absl::StatusOr<int64_t> third;
    std::thread beginner([&]() { second = Begin("b", 10); });
    ASSERT_TRUE(faults->AwaitHeld(absl::Seconds(10)));
    // Waits for the held save to the same path, then joins it.
    std::thread joiner([&]() { third = Begin("b", 10); });

    std::thread watchdog([&]() {
        std::this_thread::sleep_for(std::chrono::seconds(2));
        faults->ReleaseHeld();
    });
    const absl::Time start = absl::Now();
    GetSplitResponse pulled = Pull(*first, "w1");
    Heartbeat("w1", {*first});
    const absl::Duration elapsed = absl::Now() - start;
    faults->ReleaseHeld();
    beginner.join();
    joiner.join();
    watchdog.join();

    EXPECT_LT(elapsed, absl::Seconds(1));
    EXPECT_EQ(pulled.result(), GetSplitResponse::ASSIGNED);
    ASSERT_TRUE(second.ok()) << second.status();
    ASSERT_TRUE(third.ok()) << third.status();
    EXPECT_EQ(*third, *second);
    EXPECT_NE(*second, *first);
}

TEST_F(DispatcherTest, ConsumerGroupsJoinByNameAndRelease) {
    test_util::StreamBuilder builder(store_.get(), dir_.Path("snap"));
    builder.Create();
    builder.AddChunk({0, 1, 2});
    builder.AddChunk({3, 4});
    builder.Seal();

    auto group = Join("train", "snap", snapshot_protocol::SHARDING_POLICY_DYNAMIC, 2);
    ASSERT_TRUE(group.ok()) << group.status();
    auto joined = Join("train", "snap", snapshot_protocol::SHARDING_POLICY_DYNAMIC, 2);
    ASSERT_TRUE(joined.ok());
    EXPECT_EQ(*joined, *group);
    EXPECT_TRUE(absl::IsInvalidArgument(
            Join("train", "snap", snapshot_protocol::SHARDING_POLICY_DYNAMIC, 3).status()));
    EXPECT_EQ(dispatcher_->GetNumConsumerGroups(), 1);

    std::vector<int64_t> values;
    for (int consumer = 0; consumer < 2; ++consumer) {
        while (true) {
            GetNextElementResponse response;
            ASSERT_TRUE(Next(*group, consumer, &response).ok());
            if (response.result() == GetNextElementResponse::END_OF_SEQUENCE) break;
            if (response.result() == GetNextElementResponse::WAIT) continue;
            values.push_back(Int64Component(response.element()));
        }
    }
    EXPECT_THAT(values, UnorderedElementsAre(0, 1, 2, 3, 4));

    GetNextElementResponse response;
    EXPECT_TRUE(absl::IsInvalidArgument(Next(*group, 2, &response)));

    snapshot_protocol::ReleaseConsumerGroupRequest release;
    release.set_group_id(*group);
    snapshot_protocol::ReleaseConsumerGroupResponse released;
    ASSERT_TRUE(dispatcher_->ReleaseConsumerGroup(release, &released).ok());
    EXPECT_TRUE(absl::IsCancelled(Next(*group, 0, &response)));
    EXPECT_EQ(dispatcher_->GetNumConsumerGroups(), 0);

    auto fresh = Join("train", "snap", snapshot_protocol::SHARDING_POLICY_DYNAMIC, 2);
    ASSERT_TRUE(fresh.ok());
    EXPECT_NE(*fresh, *group);

    release.set_group_id(12345);
    EXPECT_TRUE(absl::IsNotFound(dispatcher_->ReleaseConsumerGroup(release, &released)));
}

TEST_F(DispatcherTest, GetNextElementWaitsForOpenStream) {
    test_util::StreamBuilder builder(store_.get(), dir_.Path("snap"));
    builder.Create();

    auto group = Join("", "snap", snapshot_protocol::SHARDING_POLICY_OFF, 1);
    ASSERT_TRUE(group.ok()) << group.status();
    GetNextElementResponse response;
    ASSERT_TRUE(Next(*group, 0, &response).ok());
    EXPECT_EQ(response.result(), GetNextElementResponse::WAIT);

    builder.AddChunk({7});
    builder.Seal();
    do {
        ASSERT_TRUE(Next(*group, 0, &response).ok());
    } while (response.result() == GetNextElementResponse::WAIT);
    ASSERT_EQ(response.result(), GetNextElementResponse::ELEMENT);
    EXPECT_EQ(Int64Component(response.element()), 7);
    ASSERT_TRUE(Next(*group, 0, &response).ok());
    EXPECT_EQ(response.result(), GetNextElementResponse::END_OF_SEQUENCE);
}

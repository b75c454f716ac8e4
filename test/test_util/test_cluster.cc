#include "test_util/test_cluster.h"

#include <thread>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "dispatcher/local_dispatcher_client.h"
#include "pipeline/element_util.h"
#include "store/posix_chunk_store.h"
#include "store/retrying_chunk_store.h"

namespace Snapstream {
namespace test_util {

TestCluster::TestCluster(TestClusterOptions options) : options_(options) {
	faults_ = std::make_shared<FaultInjectingChunkStore>(std::make_shared<PosixChunkStore>());
	RetryOptions retry;
	retry.max_attempts = 4;
	retry.initial_backoff = std::chrono::milliseconds(1);
	retry.max_backoff = std::chrono::milliseconds(10);
	store_ = std::make_shared<RetryingChunkStore>(faults_, retry);

	DispatcherOptions dispatcher_options;
	dispatcher_options.lease_timeout = options_.lease_timeout;
	dispatcher_options.lease_check_interval = options_.lease_check_interval;
	dispatcher_options.split_wait = options_.split_wait;
	dispatcher_options.default_max_chunk_size_bytes = options_.default_max_chunk_size_bytes;
	dispatcher_ = std::make_unique<Dispatcher>(store_, dispatcher_options);
	client_ = std::make_shared<LocalDispatcherClient>(dispatcher_.get());

	for (int i = 0; i < options_.num_workers; ++i) AddWorker();
}

TestCluster::~TestCluster() {
	for (auto& worker : workers_) {
		if (worker) worker->Stop();
	}
	workers_.clear();
	dispatcher_->Shutdown();
}

int TestCluster::AddWorker() {
	WorkerOptions worker_options;
	worker_options.heartbeat_interval = options_.heartbeat_interval;
	worker_options.worker_id = absl::StrCat("worker_", workers_.size());
	worker_options.writer.rpc_retry_initial = std::chrono::milliseconds(5);
	worker_options.writer.rpc_retry_max = std::chrono::milliseconds(50);
	auto worker = std::make_unique<SnapshotWorker>(client_, store_, worker_options);
	absl::Status s = worker->Start();
	CHECK(s.ok()) << s;
	workers_.push_back(std::move(worker));
	return static_cast<int>(workers_.size()) - 1;
}

void TestCluster::StopWorker(int i) {
	workers_[i]->Stop();
}

absl::StatusOr<SaveHandle> TestCluster::Save(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& name, SaveOptions options) {
	return DistributedSave(pipeline, Path(name), *dispatcher_, options);
}

std::unique_ptr<ReplayOrchestrator> TestCluster::Load(const std::string& name, int64_t repetitions) {
	return LoadDistributedSnapshot(Path(name), FastLoadOptions(repetitions), store_);
}

absl::Status TestCluster::WaitForState(const std::string& name, snapshot_protocol::StreamState state,
		absl::Duration timeout) {
	const absl::Time deadline = absl::Now() + timeout;
	snapshot_protocol::GetStreamInfoRequest request;
	request.set_path(Path(name));
	while (absl::Now() < deadline) {
		snapshot_protocol::GetStreamInfoResponse response;
		absl::Status s = dispatcher_->GetStreamInfo(request, &response);
		if (s.ok() && response.state() == state) return absl::OkStatus();
		if (!s.ok() && !absl::IsNotFound(s)) return s;
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return absl::DeadlineExceededError(absl::StrCat(name, " did not reach ",
			snapshot_protocol::StreamState_Name(state)));
}

snapshot_protocol::PipelineDescriptor RangePipeline(int64_t n, int64_t num_splits) {
	snapshot_protocol::PipelineDescriptor pipeline;
	pipeline.mutable_range()->set_start(0);
	pipeline.mutable_range()->set_stop(n);
	pipeline.mutable_range()->set_step(1);
	pipeline.set_num_splits(num_splits);
	return pipeline;
}

LoadOptions FastLoadOptions(int64_t repetitions) {
	LoadOptions options;
	options.repetitions = repetitions;
	options.poll_initial_backoff = std::chrono::milliseconds(1);
	options.poll_max_backoff = std::chrono::milliseconds(20);
	return options;
}

absl::StatusOr<std::vector<snapshot_protocol::Element>> ReadAll(ReplayOrchestrator* replay) {
	std::vector<snapshot_protocol::Element> elements;
	while (true) {
		snapshot_protocol::Element element;
		bool end = false;
		absl::Status s = replay->GetNext(&element, &end);
		if (!s.ok()) return s;
		if (end) return elements;
		elements.push_back(std::move(element));
	}
}

absl::StatusOr<std::vector<int64_t>> ReadAllValues(ReplayOrchestrator* replay) {
	auto elements = ReadAll(replay);
	if (!elements.ok()) return elements.status();
	return Int64Values(*elements);
}

} // namespace test_util
} // namespace Snapstream

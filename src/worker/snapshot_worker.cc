#include "worker/snapshot_worker.h"

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/configuration.h"
#include "common/unique_id.h"

namespace Snapstream {

WorkerOptions WorkerOptions::FromConfig() {
	const auto& config = GetConfig().config();
	WorkerOptions options;
	options.heartbeat_interval = std::chrono::milliseconds(config.worker.heartbeat_interval_ms.get());
	return options;
}

SnapshotWorker::SnapshotWorker(std::shared_ptr<DispatcherClient> dispatcher,
		std::shared_ptr<ChunkStore> store, WorkerOptions options, const PipelineRegistry* registry)
	: dispatcher_(std::move(dispatcher)),
	  store_(std::move(store)),
	  options_(std::move(options)),
	  registry_(registry != nullptr ? registry : &PipelineRegistry::getInstance()),
	  worker_id_(options_.worker_id.empty() ? GenerateUniqueId() : options_.worker_id) {
	VLOG(3) << "\t[SnapshotWorker]\t\tConstructed " << worker_id_;
}

SnapshotWorker::~SnapshotWorker() {
	Stop();
}

absl::Status SnapshotWorker::Start() {
	if (started_) return absl::FailedPreconditionError("worker already started");
	started_ = true;
	absl::Status first = Heartbeat();
	if (!first.ok()) {
		// The dispatcher may come up later; the loop keeps trying.
		LOG(WARNING) << "[SnapshotWorker] " << worker_id_ << " initial heartbeat failed: " << first;
	}
	heartbeat_thread_ = std::thread([this]() {
		this->HeartbeatLoop();
	});
	LOG(INFO) << "[SnapshotWorker] " << worker_id_ << " started";
	return absl::OkStatus();
}

void SnapshotWorker::Stop() {
	if (!stop_.HasBeenNotified()) stop_.Notify();
	if (heartbeat_thread_.joinable()) heartbeat_thread_.join();

	absl::flat_hash_map<int64_t, std::unique_ptr<StreamWriter>> writers;
	{
		absl::MutexLock lock(&mu_);
		writers.swap(writers_);
	}
	for (auto& entry : writers) entry.second->Cancel();
	for (auto& entry : writers) entry.second->Join();
}

void SnapshotWorker::Wait() {
	stop_.WaitForNotification();
}

int SnapshotWorker::GetNumActiveStreams() const {
	absl::MutexLock lock(&mu_);
	int active = 0;
	for (const auto& entry : writers_) {
		if (!entry.second->finished()) ++active;
	}
	return active;
}

void SnapshotWorker::HeartbeatLoop() {
	const absl::Duration interval = absl::FromChrono(options_.heartbeat_interval);
	while (!stop_.WaitForNotificationWithTimeout(interval)) {
		absl::Status s = Heartbeat();
		if (!s.ok()) {
			LOG(WARNING) << "[SnapshotWorker] " << worker_id_ << " heartbeat failed: " << s;
		}
	}
}

absl::Status SnapshotWorker::Heartbeat() {
	snapshot_protocol::WorkerHeartbeatRequest request;
	request.set_worker_id(worker_id_);
	request.set_address(options_.address);
	{
		absl::MutexLock lock(&mu_);
		for (const auto& entry : writers_) request.add_active_stream_ids(entry.first);
	}

	snapshot_protocol::WorkerHeartbeatResponse response;
	absl::Status s = dispatcher_->WorkerHeartbeat(request, &response);
	if (!s.ok()) return s;

	std::vector<std::unique_ptr<StreamWriter>> finished;
	{
		absl::MutexLock lock(&mu_);
		if (stop_.HasBeenNotified()) return absl::OkStatus();
		for (const auto& task : response.new_streams()) {
			if (writers_.contains(task.stream_id())) continue;
			auto writer = std::make_unique<StreamWriter>(task, worker_id_, dispatcher_.get(),
					store_.get(), registry_, options_.writer);
			writer->Start();
			writers_[task.stream_id()] = std::move(writer);
		}
		for (int64_t id : response.finished_stream_ids()) {
			auto it = writers_.find(id);
			if (it == writers_.end()) continue;
			finished.push_back(std::move(it->second));
			writers_.erase(it);
		}
	}
	// Joined outside the lock; writers of terminal streams exit promptly.
	for (auto& writer : finished) {
		writer->Cancel();
		writer->Join();
		VLOG(1) << "[SnapshotWorker] " << worker_id_ << " done with stream " << writer->stream_id();
	}
	return absl::OkStatus();
}

} // namespace Snapstream

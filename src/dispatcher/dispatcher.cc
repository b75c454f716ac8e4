#include "dispatcher/dispatcher.h"

#include <glog/logging.h>
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

#include "common/configuration.h"
#include "common/status_util.h"
#include "common/unique_id.h"
#include "store/chunk_format.h"
#include "store/snapshot_layout.h"
#include "store/stream_metadata.h"

namespace Snapstream {

DispatcherOptions DispatcherOptions::FromConfig() {
	const auto& config = GetConfig().config();
	DispatcherOptions options;
	options.lease_timeout = absl::Milliseconds(config.dispatcher.lease_timeout_ms.get());
	options.lease_check_interval = absl::Milliseconds(config.dispatcher.lease_check_interval_ms.get());
	options.split_wait = absl::Milliseconds(config.dispatcher.split_wait_ms.get());
	options.default_max_chunk_size_bytes = config.snapshot.max_chunk_size_bytes.get();
	return options;
}

Dispatcher::Dispatcher(std::shared_ptr<ChunkStore> store, DispatcherOptions options,
		const PipelineRegistry* registry)
	: store_(std::move(store)),
	  options_(options),
	  registry_(registry != nullptr ? registry : &PipelineRegistry::getInstance()) {
	lease_thread_ = std::thread([this]() {
		this->CheckLeases();
	});
	VLOG(3) << "\t[Dispatcher]\t\tConstructed lease_timeout:" << options_.lease_timeout;
}

Dispatcher::~Dispatcher() {
	Shutdown();
	LOG(INFO) << "[Dispatcher] Destructed";
}

void Dispatcher::Shutdown() {
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = true;
		shutdown_cv_.SignalAll();
	}
	{
		absl::MutexLock lock(&groups_mu_);
		for (auto& entry : groups_) entry.second->group->Cancel();
	}
	if (lease_thread_.joinable()) {
		lease_thread_.join();
	}
}

absl::Status Dispatcher::BeginStream(const snapshot_protocol::BeginStreamRequest& request,
		snapshot_protocol::BeginStreamResponse* response) {
	if (request.path().empty()) {
		return absl::InvalidArgumentError("snapshot path must not be empty");
	}
	if (request.options().max_chunk_size_bytes() < 0) {
		return absl::InvalidArgumentError(absl::StrCat("max_chunk_size_bytes must be >= 0, got ",
				request.options().max_chunk_size_bytes()));
	}
	const std::string root = layout::NormalizeRoot(request.path());

	snapshot_protocol::SnapshotOptions options = request.options();
	options.set_compression(ResolveCompression(options.compression()));
	if (options.max_chunk_size_bytes() == 0) {
		options.set_max_chunk_size_bytes(static_cast<int64_t>(options_.default_max_chunk_size_bytes));
	}

	int64_t stream_id;
	{
		absl::MutexLock lock(&mu_);
		// A concurrent save to the same path is resolved before this one is considered.
		while (pending_paths_.contains(root)) begin_cv_.Wait(&mu_);
		auto existing = streams_by_path_.find(root);
		if (existing != streams_by_path_.end()) {
			StreamManager* stream = streams_.at(existing->second).get();
			if (!stream->terminal()) {
				response->set_stream_id(stream->id());
				response->set_run_id(stream->run_id());
				return absl::OkStatus();
			}
			return absl::AlreadyExistsError(absl::StrCat("snapshot at ", root, " already finished"));
		}
		pending_paths_.insert(root);
		stream_id = next_stream_id_++;
	}

	// Store I/O runs without mu_; the reserved path keeps other saves to it out.
	auto stream = CreateStream(stream_id, root, request, options);
	absl::MutexLock lock(&mu_);
	pending_paths_.erase(root);
	begin_cv_.SignalAll();
	if (!stream.ok()) return stream.status();

	response->set_stream_id(stream_id);
	response->set_run_id((*stream)->run_id());
	LOG(INFO) << "[Dispatcher] Began stream " << stream_id << " at " << root
		<< " run " << (*stream)->run_id();
	streams_by_path_[root] = stream_id;
	streams_[stream_id] = std::move(stream).value();
	return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<StreamManager>> Dispatcher::CreateStream(int64_t stream_id,
		const std::string& root, const snapshot_protocol::BeginStreamRequest& request,
		const snapshot_protocol::SnapshotOptions& options) {
	StreamMetadataStore metadata_store(store_.get());
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamStatus on_disk, metadata_store.ReadStatus(root));
	if (on_disk.created()) {
		return absl::AlreadyExistsError(absl::StrCat("a snapshot already exists at ", root));
	}

	SNAPSTREAM_ASSIGN_OR_RETURN(std::unique_ptr<Pipeline> pipeline,
			BuildPipeline(request.pipeline(), registry_));

	const std::string run_id = GenerateUniqueId();
	snapshot_protocol::StreamMetadata metadata;
	metadata.set_run_id(run_id);
	*metadata.mutable_element_spec() = pipeline->element_spec();
	metadata.set_compression(options.compression());
	metadata.set_max_chunk_size_bytes(options.max_chunk_size_bytes());
	metadata.set_creation_time_us(absl::ToUnixMicros(absl::Now()));
	*metadata.mutable_pipeline() = request.pipeline();

	SNAPSTREAM_RETURN_IF_ERROR(metadata_store.CreateLayout(root));
	SNAPSTREAM_RETURN_IF_ERROR(metadata_store.WriteMetadata(root, metadata));

	auto stream = std::make_unique<StreamManager>(stream_id, root, run_id, request.pipeline(),
			options, std::move(pipeline), store_.get());
	absl::Status started = stream->Start();
	if (!started.ok()) {
		// The failure is persisted; the save itself still succeeds and loads report it.
		LOG(WARNING) << "[Dispatcher] stream " << stream_id << " failed while starting: " << started;
	}
	return stream;
}

absl::Status Dispatcher::WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
		snapshot_protocol::WorkerHeartbeatResponse* response) {
	if (request.worker_id().empty()) {
		return absl::InvalidArgumentError("worker_id must not be empty");
	}
	RenewLease(request.worker_id(), request.address());

	absl::flat_hash_set<int64_t> known(request.active_stream_ids().begin(),
			request.active_stream_ids().end());
	absl::MutexLock lock(&mu_);
	for (const auto& entry : streams_) {
		const StreamManager* stream = entry.second.get();
		if (known.contains(entry.first)) {
			if (stream->terminal()) response->add_finished_stream_ids(entry.first);
			known.erase(entry.first);
		} else if (!stream->terminal()) {
			*response->add_new_streams() = stream->task();
		}
	}
	// Ids this dispatcher never issued (e.g. from before a restart).
	for (int64_t id : known) {
		response->add_finished_stream_ids(id);
	}
	return absl::OkStatus();
}

absl::Status Dispatcher::GetSplit(const snapshot_protocol::GetSplitRequest& request,
		snapshot_protocol::GetSplitResponse* response) {
	RenewLease(request.worker_id(), "");
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamManager* stream, FindStream(request.stream_id()));
	stream->GetSplit(request.worker_id(), options_.split_wait, response);
	return absl::OkStatus();
}

absl::Status Dispatcher::ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
		snapshot_protocol::ReportSplitDoneResponse* response) {
	RenewLease(request.worker_id(), "");
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamManager* stream, FindStream(request.stream_id()));
	return stream->ReportSplitDone(request, response);
}

absl::Status Dispatcher::ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
		snapshot_protocol::ReportSplitFailedResponse* response) {
	RenewLease(request.worker_id(), "");
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamManager* stream, FindStream(request.stream_id()));
	stream->ReportSplitFailed(request.worker_id(), request.split_index(), request.cause());
	return absl::OkStatus();
}

absl::Status Dispatcher::GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
		snapshot_protocol::GetStreamInfoResponse* response) {
	const std::string root = layout::NormalizeRoot(request.path());
	StreamManager* stream = nullptr;
	{
		absl::MutexLock lock(&mu_);
		auto it = streams_by_path_.find(root);
		if (it != streams_by_path_.end()) stream = streams_.at(it->second).get();
	}
	if (stream != nullptr) {
		response->set_stream_id(stream->id());
		response->set_state(stream->state());
		response->set_num_committed_chunks(stream->num_committed_chunks());
		auto failure = stream->failure();
		if (failure.has_value()) *response->mutable_failure() = *failure;
		return absl::OkStatus();
	}

	// Not written by this dispatcher; answer from the persisted records.
	StreamMetadataStore metadata_store(store_.get());
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamStatus status, metadata_store.ReadStatus(root));
	if (!status.created()) {
		return absl::NotFoundError(absl::StrCat("no snapshot at ", root));
	}
	response->set_stream_id(0);
	response->set_state(status.state);
	if (status.seal.has_value()) {
		response->set_num_committed_chunks(status.seal->num_chunks());
	} else {
		SNAPSTREAM_ASSIGN_OR_RETURN(std::vector<std::string> chunks,
				store_->List(layout::ChunksDir(root), layout::kChunkPrefix));
		response->set_num_committed_chunks(static_cast<int64_t>(chunks.size()));
	}
	if (status.failure.has_value()) *response->mutable_failure() = *status.failure;
	return absl::OkStatus();
}

absl::Status Dispatcher::JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
		snapshot_protocol::JoinConsumerGroupResponse* response) {
	if (request.path().empty()) {
		return absl::InvalidArgumentError("snapshot path must not be empty");
	}
	const std::string root = layout::NormalizeRoot(request.path());

	absl::MutexLock lock(&groups_mu_);
	if (!request.group_name().empty()) {
		auto it = groups_by_name_.find(request.group_name());
		if (it != groups_by_name_.end()) {
			const HostedGroup& existing = *groups_.at(it->second);
			if (existing.root != root || existing.request.policy() != request.policy() ||
					existing.request.num_consumers() != request.num_consumers() ||
					existing.request.repetitions() != request.repetitions()) {
				return absl::InvalidArgumentError(absl::StrCat("consumer group '", request.group_name(),
						"' already reads ", existing.root, " with other parameters"));
			}
			response->set_group_id(it->second);
			return absl::OkStatus();
		}
	}

	LoadOptions options = LoadOptions::FromConfig();
	options.repetitions = request.repetitions();
	if (request.poll_initial_backoff_ms() > 0) {
		options.poll_initial_backoff = std::chrono::milliseconds(request.poll_initial_backoff_ms());
	}
	if (request.poll_max_backoff_ms() > 0) {
		options.poll_max_backoff = std::chrono::milliseconds(request.poll_max_backoff_ms());
	}
	size_t capacity = request.queue_capacity() > 0 ? static_cast<size_t>(request.queue_capacity())
		: static_cast<size_t>(GetConfig().config().reader.shard_queue_capacity.get());
	SNAPSTREAM_ASSIGN_OR_RETURN(std::unique_ptr<ConsumerGroup> group,
			ConsumerGroup::Create(store_, root, ShardingPolicyFromProto(request.policy()),
					request.num_consumers(), options, capacity));

	auto hosted = std::make_unique<HostedGroup>();
	hosted->name = request.group_name();
	hosted->root = root;
	hosted->request = request;
	hosted->group = std::move(group);
	for (int i = 0; i < request.num_consumers(); ++i) {
		hosted->consumer_mu.push_back(std::make_unique<absl::Mutex>());
	}
	const int64_t group_id = next_group_id_++;
	if (!hosted->name.empty()) groups_by_name_[hosted->name] = group_id;
	groups_[group_id] = std::move(hosted);
	LOG(INFO) << "[Dispatcher] Hosting consumer group " << group_id
		<< (request.group_name().empty() ? "" : " '" + request.group_name() + "'")
		<< " over " << root;
	response->set_group_id(group_id);
	return absl::OkStatus();
}

absl::Status Dispatcher::GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
		snapshot_protocol::GetNextElementResponse* response) {
	SNAPSTREAM_ASSIGN_OR_RETURN(HostedGroup* hosted, FindGroup(request.group_id()));
	const int consumer = request.consumer();
	if (consumer < 0 || consumer >= static_cast<int>(hosted->consumer_mu.size())) {
		return absl::InvalidArgumentError(absl::StrCat("consumer ", consumer, " outside [0, ",
				hosted->consumer_mu.size(), ")"));
	}
	absl::MutexLock consumer_lock(hosted->consumer_mu[consumer].get());
	bool end = false;
	bool timed_out = false;
	SNAPSTREAM_RETURN_IF_ERROR(hosted->group->GetNext(consumer, response->mutable_element(), &end,
			absl::Now() + options_.split_wait, &timed_out));
	if (timed_out) {
		response->clear_element();
		response->set_result(snapshot_protocol::GetNextElementResponse::WAIT);
	} else if (end) {
		response->clear_element();
		response->set_result(snapshot_protocol::GetNextElementResponse::END_OF_SEQUENCE);
	} else {
		response->set_result(snapshot_protocol::GetNextElementResponse::ELEMENT);
	}
	return absl::OkStatus();
}

absl::Status Dispatcher::ReleaseConsumerGroup(
		const snapshot_protocol::ReleaseConsumerGroupRequest& request,
		snapshot_protocol::ReleaseConsumerGroupResponse* response) {
	absl::MutexLock lock(&groups_mu_);
	auto it = groups_.find(request.group_id());
	if (it == groups_.end()) {
		return absl::NotFoundError(absl::StrCat("unknown consumer group ", request.group_id()));
	}
	HostedGroup* hosted = it->second.get();
	if (hosted->released) return absl::OkStatus();
	hosted->released = true;
	hosted->group->Cancel();
	auto named = groups_by_name_.find(hosted->name);
	if (named != groups_by_name_.end() && named->second == request.group_id()) {
		groups_by_name_.erase(named);
	}
	LOG(INFO) << "[Dispatcher] Released consumer group " << request.group_id();
	return absl::OkStatus();
}

absl::StatusOr<Dispatcher::HostedGroup*> Dispatcher::FindGroup(int64_t group_id) const {
	absl::MutexLock lock(&groups_mu_);
	auto it = groups_.find(group_id);
	if (it == groups_.end()) {
		return absl::NotFoundError(absl::StrCat("unknown consumer group ", group_id));
	}
	return it->second.get();
}

int Dispatcher::GetNumConsumerGroups() const {
	absl::MutexLock lock(&groups_mu_);
	int live = 0;
	for (const auto& entry : groups_) {
		if (!entry.second->released) ++live;
	}
	return live;
}

int Dispatcher::GetNumWorkers() const {
	absl::MutexLock lock(&mu_);
	return static_cast<int>(workers_.size());
}

void Dispatcher::RenewLease(const std::string& worker_id, const std::string& address) {
	if (worker_id.empty()) return;
	absl::MutexLock lock(&mu_);
	auto it = workers_.find(worker_id);
	if (it == workers_.end()) {
		VLOG(1) << "[Dispatcher] Registering worker " << worker_id
			<< (address.empty() ? "" : " at ") << address;
		workers_[worker_id] = {address, std::chrono::steady_clock::now()};
		return;
	}
	it->second.last_heartbeat = std::chrono::steady_clock::now();
	if (!address.empty()) it->second.address = address;
}

absl::StatusOr<StreamManager*> Dispatcher::FindStream(int64_t stream_id) const {
	absl::MutexLock lock(&mu_);
	auto it = streams_.find(stream_id);
	if (it == streams_.end()) {
		return absl::NotFoundError(absl::StrCat("unknown stream ", stream_id));
	}
	return it->second.get();
}

void Dispatcher::CheckLeases() {
	const auto timeout = absl::ToChronoMilliseconds(options_.lease_timeout);
	while (true) {
		std::vector<std::string> expired;
		std::vector<StreamManager*> streams;
		{
			absl::MutexLock lock(&mu_);
			shutdown_cv_.WaitWithTimeout(&mu_, options_.lease_check_interval);
			if (shutdown_) break;

			auto now = std::chrono::steady_clock::now();
			for (auto it = workers_.begin(); it != workers_.end();) {
				if (now - it->second.last_heartbeat > timeout) {
					LOG(WARNING) << "[Dispatcher] Worker " << it->first << " lease expired";
					expired.push_back(it->first);
					workers_.erase(it++);
				} else {
					++it;
				}
			}
			if (expired.empty()) continue;
			for (const auto& entry : streams_) streams.push_back(entry.second.get());
		}
		// Stream locks are taken outside the registry lock.
		for (const auto& worker_id : expired) {
			for (StreamManager* stream : streams) {
				stream->ReleaseWorker(worker_id);
			}
		}
	}
}

} // namespace Snapstream

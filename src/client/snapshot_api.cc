#include "client/snapshot_api.h"

#include <glog/logging.h>

#include "common/configuration.h"
#include "dispatcher/local_dispatcher_client.h"
#include "store/chunk_format.h"
#include "store/posix_chunk_store.h"
#include "store/retrying_chunk_store.h"
#include "worker/grpc_dispatcher_client.h"

namespace Snapstream {

SaveOptions SaveOptions::FromConfig() {
	const auto& snapshot = GetConfig().config().snapshot;
	SaveOptions options;
	auto compression = ParseCompression(snapshot.compression.get());
	if (compression.ok()) {
		options.compression = *compression;
	} else {
		LOG(WARNING) << "[SaveOptions] " << compression.status() << "; saving uncompressed";
	}
	options.max_chunk_size_bytes = static_cast<int64_t>(snapshot.max_chunk_size_bytes.get());
	return options;
}

std::shared_ptr<ChunkStore> DefaultChunkStore() {
	static const std::shared_ptr<ChunkStore> store = std::make_shared<RetryingChunkStore>(
			std::make_shared<PosixChunkStore>(), RetryOptions::FromConfig());
	return store;
}

absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, DispatcherClient* dispatcher, const SaveOptions& options) {
	snapshot_protocol::BeginStreamRequest request;
	request.set_path(path);
	*request.mutable_pipeline() = pipeline;
	request.mutable_options()->set_compression(options.compression);
	request.mutable_options()->set_max_chunk_size_bytes(options.max_chunk_size_bytes);

	snapshot_protocol::BeginStreamResponse response;
	absl::Status status = dispatcher->BeginStream(request, &response);
	if (!status.ok()) {
		LOG(ERROR) << "[DistributedSave] " << path << ": " << status;
		return status;
	}
	VLOG(1) << "[DistributedSave] " << path << " registered as stream " << response.stream_id()
		<< " (run " << response.run_id() << ")";
	SaveHandle handle;
	handle.stream_id = response.stream_id();
	handle.run_id = response.run_id();
	return handle;
}

absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, const std::string& dispatcher_address, const SaveOptions& options) {
	GrpcDispatcherClient client(dispatcher_address);
	return DistributedSave(pipeline, path, &client, options);
}

absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, Dispatcher& dispatcher, const SaveOptions& options) {
	LocalDispatcherClient client(&dispatcher);
	return DistributedSave(pipeline, path, &client, options);
}

std::unique_ptr<ReplayOrchestrator> LoadDistributedSnapshot(const std::string& path,
		const LoadOptions& options, std::shared_ptr<ChunkStore> store) {
	if (!store) store = DefaultChunkStore();
	return std::make_unique<ReplayOrchestrator>(std::move(store), path, options);
}

std::unique_ptr<ChunkListing> ListSnapshotChunks(const std::string& path, ChunkStore* store,
		int64_t repetitions) {
	if (store == nullptr) store = DefaultChunkStore().get();
	auto listing = std::make_unique<ChunkListing>(store, path, repetitions);
	const auto& reader = GetConfig().config().reader;
	listing->set_poll_backoff(std::chrono::milliseconds(reader.poll_initial_backoff_ms.get()),
			std::chrono::milliseconds(reader.poll_max_backoff_ms.get()));
	return listing;
}

absl::StatusOr<std::unique_ptr<ConsumerGroup>> Distribute(const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		std::shared_ptr<ChunkStore> store, size_t queue_capacity) {
	if (!store) store = DefaultChunkStore();
	if (queue_capacity == 0) {
		queue_capacity = GetConfig().config().reader.shard_queue_capacity.get();
	}
	return ConsumerGroup::Create(std::move(store), path, policy, num_consumers, options,
			queue_capacity);
}

absl::StatusOr<std::unique_ptr<RemoteConsumerGroup>> Distribute(const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		const std::string& dispatcher_address, const std::string& group_name,
		size_t queue_capacity) {
	auto client = std::make_shared<GrpcDispatcherClient>(dispatcher_address);
	return JoinRemoteConsumerGroup(std::move(client), path, policy, num_consumers, options,
			group_name, queue_capacity);
}

} // namespace Snapstream

#ifndef SNAPSTREAM_SRC_CLIENT_SNAPSHOT_API_H_
#define SNAPSTREAM_SRC_CLIENT_SNAPSHOT_API_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include <dispatcher.pb.h>
#include <snapshot.pb.h>

#include "client/remote_consumer_group.h"
#include "dispatcher/dispatcher.h"
#include "reader/chunk_listing.h"
#include "replay/replay_orchestrator.h"
#include "shard/shard_redistributor.h"
#include "store/chunk_store.h"
#include "worker/dispatcher_client.h"

namespace Snapstream {

struct SaveOptions {
	snapshot_protocol::Compression compression = snapshot_protocol::COMPRESSION_NONE;
	// 0 uses the dispatcher's default.
	int64_t max_chunk_size_bytes = 0;

	// Built from the snapshot section of the loaded configuration.
	static SaveOptions FromConfig();
};

// Result of a save: the stream has been registered, not yet written.
struct SaveHandle {
	int64_t stream_id = 0;
	std::string run_id;
};

/**
 * Process-wide store used when none is passed: a RetryingChunkStore over the
 * local filesystem, built from the loaded configuration on first use. Lives
 * until the process exits.
 */
std::shared_ptr<ChunkStore> DefaultChunkStore();

/**
 * Registers pipeline for writing to path and returns without waiting for
 * any data to be written. Errors raised while running the pipeline never
 * surface here; they reach the readers of path.
 *
 * @return ALREADY_EXISTS when path already holds a snapshot; INVALID_ARGUMENT
 *         for a malformed descriptor
 */
absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, DispatcherClient* dispatcher, const SaveOptions& options);

// Connects to the dispatcher at host:port over gRPC.
absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, const std::string& dispatcher_address, const SaveOptions& options);

// In-process dispatcher.
absl::StatusOr<SaveHandle> DistributedSave(const snapshot_protocol::PipelineDescriptor& pipeline,
		const std::string& path, Dispatcher& dispatcher, const SaveOptions& options);

/**
 * Opens path for replay. Nothing is read until the first GetNext(); path may
 * not exist yet, may be mid-write, or may be sealed.
 *
 * @param store nullptr for DefaultChunkStore()
 */
std::unique_ptr<ReplayOrchestrator> LoadDistributedSnapshot(const std::string& path,
		const LoadOptions& options, std::shared_ptr<ChunkStore> store = nullptr);

/**
 * Lists the committed chunks of path in chunk order.
 *
 * @param store Must outlive the listing; nullptr for DefaultChunkStore()
 * @param repetitions Passes over the sealed chunks; < 0 repeats without bound
 */
std::unique_ptr<ChunkListing> ListSnapshotChunks(const std::string& path,
		ChunkStore* store = nullptr, int64_t repetitions = 1);

/**
 * Replays path to a group of num_consumers consumers.
 *
 * @param queue_capacity 0 takes reader.shard_queue_capacity from the configuration
 */
absl::StatusOr<std::unique_ptr<ConsumerGroup>> Distribute(const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		std::shared_ptr<ChunkStore> store = nullptr, size_t queue_capacity = 0);

/**
 * Replays path to a group of num_consumers consumers hosted by the dispatcher
 * at host:port, so consumers in several processes share one group. Handles
 * made with the same non-empty group_name join the same live group.
 */
absl::StatusOr<std::unique_ptr<RemoteConsumerGroup>> Distribute(const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		const std::string& dispatcher_address, const std::string& group_name = "",
		size_t queue_capacity = 0);

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_CLIENT_SNAPSHOT_API_H_

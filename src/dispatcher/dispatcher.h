#ifndef SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_H_
#define SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include <dispatcher.pb.h>

#include "dispatcher/stream_manager.h"
#include "pipeline/pipeline_registry.h"
#include "shard/shard_redistributor.h"
#include "store/chunk_store.h"

namespace Snapstream {

struct DispatcherOptions {
	// A worker silent for longer than this loses the splits it holds.
	absl::Duration lease_timeout = absl::Seconds(10);
	absl::Duration lease_check_interval = absl::Seconds(1);
	// Longest GetSplit blocks before answering WAIT.
	absl::Duration split_wait = absl::Seconds(1);
	size_t default_max_chunk_size_bytes = 16UL << 20;

	static DispatcherOptions FromConfig();
};

struct WorkerInfo {
	std::string address;
	std::chrono::steady_clock::time_point last_heartbeat;
};

/**
 * Snapshot coordinator. Owns the registry of streams and of live workers.
 *
 * Every call made on behalf of a worker renews that worker's lease; a
 * background thread returns the splits of workers whose lease expired to
 * their streams' pools. Request/response types are the RPC messages so the
 * gRPC service is a thin forwarding layer.
 */
class Dispatcher {
public:
	Dispatcher(std::shared_ptr<ChunkStore> store, DispatcherOptions options,
			const PipelineRegistry* registry = nullptr);
	~Dispatcher();

	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator=(const Dispatcher&) = delete;

	/**
	 * @brief Registers a new stream and persists its metadata
	 * @return The existing handle when path is already being written by this
	 *         dispatcher; ALREADY_EXISTS when path holds a finished or foreign stream
	 */
	absl::Status BeginStream(const snapshot_protocol::BeginStreamRequest& request,
			snapshot_protocol::BeginStreamResponse* response);

	absl::Status WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
			snapshot_protocol::WorkerHeartbeatResponse* response);

	absl::Status GetSplit(const snapshot_protocol::GetSplitRequest& request,
			snapshot_protocol::GetSplitResponse* response);

	absl::Status ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
			snapshot_protocol::ReportSplitDoneResponse* response);

	absl::Status ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
			snapshot_protocol::ReportSplitFailedResponse* response);

	absl::Status GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
			snapshot_protocol::GetStreamInfoResponse* response);

	/**
	 * @brief Creates a consumer group over a stream, hosted here for remote consumers
	 * @return The live group of the same name when there is one;
	 *         INVALID_ARGUMENT when that group was joined with other parameters
	 */
	absl::Status JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
			snapshot_protocol::JoinConsumerGroupResponse* response);

	/**
	 * Blocks up to split_wait for the consumer's next element and answers WAIT
	 * when none is ready. Calls for one consumer index are served one at a time.
	 * @return The stream's failure cause; CANCELLED once the group was released
	 */
	absl::Status GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
			snapshot_protocol::GetNextElementResponse* response);

	// Cancels the group; its name may be joined again afterwards.
	absl::Status ReleaseConsumerGroup(const snapshot_protocol::ReleaseConsumerGroupRequest& request,
			snapshot_protocol::ReleaseConsumerGroupResponse* response);

	// Stops the lease checker. Idempotent.
	void Shutdown();

	int GetNumWorkers() const;
	int GetNumConsumerGroups() const;
	const DispatcherOptions& options() const { return options_; }

private:
	struct HostedGroup {
		std::string name;
		std::string root;
		snapshot_protocol::JoinConsumerGroupRequest request;
		std::unique_ptr<ConsumerGroup> group;
		// One per consumer index.
		std::vector<std::unique_ptr<absl::Mutex>> consumer_mu;
		bool released = false;
	};

	absl::StatusOr<HostedGroup*> FindGroup(int64_t group_id) const;

	// Validates the path on disk, persists the metadata and starts the stream.
	absl::StatusOr<std::unique_ptr<StreamManager>> CreateStream(int64_t stream_id,
			const std::string& root, const snapshot_protocol::BeginStreamRequest& request,
			const snapshot_protocol::SnapshotOptions& options);
	void CheckLeases();
	void RenewLease(const std::string& worker_id, const std::string& address);
	absl::StatusOr<StreamManager*> FindStream(int64_t stream_id) const;

	std::shared_ptr<ChunkStore> store_;
	const DispatcherOptions options_;
	const PipelineRegistry* registry_;

	mutable absl::Mutex mu_;
	absl::CondVar shutdown_cv_;
	// Streams are never removed, so StreamManager pointers stay valid.
	absl::flat_hash_map<int64_t, std::unique_ptr<StreamManager>> streams_ ABSL_GUARDED_BY(mu_);
	absl::flat_hash_map<std::string, int64_t> streams_by_path_ ABSL_GUARDED_BY(mu_);
	// Paths whose BeginStream is writing metadata; begin_cv_ fires when one resolves.
	absl::flat_hash_set<std::string> pending_paths_ ABSL_GUARDED_BY(mu_);
	absl::CondVar begin_cv_;
	absl::flat_hash_map<std::string, WorkerInfo> workers_ ABSL_GUARDED_BY(mu_);
	int64_t next_stream_id_ ABSL_GUARDED_BY(mu_) = 1;
	bool shutdown_ ABSL_GUARDED_BY(mu_) = false;

	// Consumer groups never share mu_: GetNextElement blocks on them.
	mutable absl::Mutex groups_mu_;
	// Groups are never removed before destruction, so HostedGroup pointers stay valid.
	absl::flat_hash_map<int64_t, std::unique_ptr<HostedGroup>> groups_ ABSL_GUARDED_BY(groups_mu_);
	absl::flat_hash_map<std::string, int64_t> groups_by_name_ ABSL_GUARDED_BY(groups_mu_);
	int64_t next_group_id_ ABSL_GUARDED_BY(groups_mu_) = 1;
	std::thread lease_thread_;
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_H_

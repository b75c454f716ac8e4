#ifndef SNAPSTREAM_SRC_WORKER_SNAPSHOT_WORKER_H_
#define SNAPSTREAM_SRC_WORKER_SNAPSHOT_WORKER_H_

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"

#include "pipeline/pipeline_registry.h"
#include "store/chunk_store.h"
#include "worker/dispatcher_client.h"
#include "worker/stream_writer.h"

namespace Snapstream {

struct WorkerOptions {
	std::chrono::milliseconds heartbeat_interval{1000};
	// Generated when empty.
	std::string worker_id;
	// Reported to the dispatcher for diagnostics only.
	std::string address;
	StreamWriterOptions writer;

	static WorkerOptions FromConfig();
};

/**
 * Writer worker. A heartbeat thread keeps the worker's lease alive and
 * discovers streams; each discovered stream gets its own StreamWriter thread.
 */
class SnapshotWorker {
	public:
		SnapshotWorker(std::shared_ptr<DispatcherClient> dispatcher, std::shared_ptr<ChunkStore> store,
				WorkerOptions options, const PipelineRegistry* registry = nullptr);
		~SnapshotWorker();

		SnapshotWorker(const SnapshotWorker&) = delete;
		SnapshotWorker& operator=(const SnapshotWorker&) = delete;

		// Sends the first heartbeat and starts the heartbeat thread.
		absl::Status Start();

		/**
		 * Stops heartbeating and cancels all writers. Splits in progress are
		 * not reported; the dispatcher reassigns them when the lease expires.
		 */
		void Stop();

		// Blocks until Stop() is called.
		void Wait();

		const std::string& worker_id() const { return worker_id_; }
		int GetNumActiveStreams() const;

	private:
		void HeartbeatLoop();
		absl::Status Heartbeat();

		std::shared_ptr<DispatcherClient> dispatcher_;
		std::shared_ptr<ChunkStore> store_;
		const WorkerOptions options_;
		const PipelineRegistry* registry_;
		std::string worker_id_;

		mutable absl::Mutex mu_;
		absl::flat_hash_map<int64_t, std::unique_ptr<StreamWriter>> writers_ ABSL_GUARDED_BY(mu_);
		absl::Notification stop_;
		std::thread heartbeat_thread_;
		bool started_ = false;
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_WORKER_SNAPSHOT_WORKER_H_

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "absl/synchronization/notification.h"
#include <dispatcher.pb.h>

#include "pipeline/pipeline.h"
#include "pipeline/pipeline_registry.h"
#include "store/chunk_store.h"
#include "worker/dispatcher_client.h"

namespace Snapstream {

struct StreamWriterOptions {
	// Backoff between retries of dispatcher calls that failed transiently.
	std::chrono::milliseconds rpc_retry_initial{50};
	std::chrono::milliseconds rpc_retry_max{1000};
};

/**
 * Writes one stream on behalf of a worker: pull a split, execute it into
 * chunks, report, repeat until the dispatcher answers NO_MORE_SPLITS or
 * ABORTED, or until cancelled.
 *
 * A data error of a split is reported with ReportSplitFailed and never
 * retried here. A cancelled writer abandons its current split without
 * reporting; the dispatcher reassigns it once this worker's lease expires.
 */
class StreamWriter {
public:
	StreamWriter(snapshot_protocol::StreamTask task, std::string worker_id,
			DispatcherClient* dispatcher, ChunkStore* store,
			const PipelineRegistry* registry, StreamWriterOptions options = {});
	~StreamWriter();

	void Start();
	void Cancel();
	void Join();

	bool finished() const { return finished_.load(); }
	int64_t stream_id() const { return task_.stream_id(); }
	int64_t num_splits_written() const { return num_splits_written_.load(); }

private:
	enum class SplitOutcome { kContinue, kStop };

	void Run();
	SplitOutcome ProcessSplit(const Pipeline& pipeline, const snapshot_protocol::Split& split,
			int64_t generation);
	SplitOutcome ReportFailure(int64_t split_index, const absl::Status& cause);
	// Sleeps for delay unless cancelled first. Returns false when cancelled.
	bool SleepUnlessCancelled(std::chrono::milliseconds delay);

	const snapshot_protocol::StreamTask task_;
	const std::string worker_id_;
	DispatcherClient* dispatcher_;
	ChunkStore* store_;
	const PipelineRegistry* registry_;
	const StreamWriterOptions options_;

	absl::Notification cancelled_;
	std::atomic<bool> finished_{false};
	std::atomic<int64_t> num_splits_written_{0};
	std::thread thread_;
};

} // namespace Snapstream

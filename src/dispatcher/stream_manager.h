#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include <dispatcher.pb.h>

#include "pipeline/pipeline.h"
#include "store/chunk_store.h"
#include "store/stream_metadata.h"

namespace Snapstream {

/**
 * Dispatcher-side state of one stream: split assignment, commit numbering,
 * sealing and failure. Every public method is thread safe; streams never
 * share locks, so one stream stalling never blocks another.
 *
 * Commit rule: the first completion report for a split index wins. Its
 * uncommitted chunks are renamed into chunks/ with consecutive numbers while
 * commit_mu_ is held, so the visible chunk set is always a contiguous prefix.
 * Store I/O (renames, seal and failure records) never runs under mu_; a slow
 * store stalls commits of this stream only, never split assignment.
 *
 * state() turns DONE or FAILED only once the matching record is durable.
 */
class StreamManager {
public:
	StreamManager(int64_t stream_id, std::string root, std::string run_id,
			snapshot_protocol::PipelineDescriptor descriptor,
			snapshot_protocol::SnapshotOptions options,
			std::unique_ptr<Pipeline> pipeline, ChunkStore* store);

	/**
	 * Reads ahead one split and seals immediately when the pipeline has none.
	 * Called once, after the stream metadata is durable.
	 */
	absl::Status Start();

	/**
	 * @brief Hands out the next split, blocking up to wait when none is ready
	 * @param response ASSIGNED, WAIT, NO_MORE_SPLITS (sealed) or ABORTED (failed)
	 */
	void GetSplit(const std::string& worker_id, absl::Duration wait,
			snapshot_protocol::GetSplitResponse* response);

	// ABORTED when the stream already failed; duplicates are answered with accepted=false.
	absl::Status ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
			snapshot_protocol::ReportSplitDoneResponse* response);

	void ReportSplitFailed(const std::string& worker_id, int64_t split_index,
			const snapshot_protocol::FailureRecord& cause);

	// Returns every split worker_id holds to the pool. Returns how many.
	int ReleaseWorker(const std::string& worker_id);

	int64_t id() const { return id_; }
	const std::string& root() const { return root_; }
	const std::string& run_id() const { return run_id_; }

	snapshot_protocol::StreamState state() const;
	bool terminal() const;
	int64_t num_committed_chunks() const;
	std::optional<snapshot_protocol::FailureRecord> failure() const;
	snapshot_protocol::StreamTask task() const;

private:
	struct Assignment {
		std::string worker_id;
		int64_t generation;
		snapshot_protocol::Split split;
	};

	absl::Status FetchNextSplitLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	void AssignLocked(snapshot_protocol::Split split, const std::string& worker_id,
			snapshot_protocol::GetSplitResponse* response) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	bool streaming() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
		return state_ == snapshot_protocol::STREAM_STATE_STREAMING && !failure_.has_value() && !sealing_;
	}
	// The seal to write once mu_ is released, when every split is committed.
	std::optional<snapshot_protocol::SealRecord> MaybeSealLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	// Fails the stream in memory; returns the record to persist once mu_ is released.
	std::optional<snapshot_protocol::FailureRecord> FailLocked(
			const snapshot_protocol::FailureRecord& cause) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	void FinishSeal(const snapshot_protocol::SealRecord& seal) ABSL_LOCKS_EXCLUDED(mu_);
	void PersistFailure(const snapshot_protocol::FailureRecord& record) ABSL_LOCKS_EXCLUDED(mu_);
	void DiscardUncommitted(const snapshot_protocol::ReportSplitDoneRequest& request);
	void CleanUncommittedDir();

	const int64_t id_;
	const std::string root_;
	const std::string run_id_;
	const snapshot_protocol::PipelineDescriptor descriptor_;
	const snapshot_protocol::SnapshotOptions options_;
	const std::unique_ptr<Pipeline> pipeline_;
	ChunkStore* store_;
	StreamMetadataStore metadata_;

	// Serializes chunk renames. Acquired before mu_.
	absl::Mutex commit_mu_ ABSL_ACQUIRED_BEFORE(mu_);
	mutable absl::Mutex mu_;
	absl::CondVar cv_;
	snapshot_protocol::StreamState state_ ABSL_GUARDED_BY(mu_) = snapshot_protocol::STREAM_STATE_STREAMING;
	std::unique_ptr<SplitProvider> provider_ ABSL_GUARDED_BY(mu_);
	// Split read ahead from the provider, not yet handed out.
	std::optional<snapshot_protocol::Split> next_split_ ABSL_GUARDED_BY(mu_);
	bool provider_exhausted_ ABSL_GUARDED_BY(mu_) = false;
	int64_t num_issued_splits_ ABSL_GUARDED_BY(mu_) = 0;
	// Splits taken back from expired workers, handed out before new ones.
	std::deque<snapshot_protocol::Split> returned_splits_ ABSL_GUARDED_BY(mu_);
	absl::btree_map<int64_t, Assignment> in_flight_ ABSL_GUARDED_BY(mu_);
	absl::flat_hash_map<int64_t, int64_t> generations_ ABSL_GUARDED_BY(mu_);
	// Includes splits whose chunks are still being renamed.
	absl::flat_hash_set<int64_t> completed_splits_ ABSL_GUARDED_BY(mu_);
	int pending_commits_ ABSL_GUARDED_BY(mu_) = 0;
	bool sealing_ ABSL_GUARDED_BY(mu_) = false;
	// Only advanced while commit_mu_ is held.
	int64_t next_chunk_index_ ABSL_GUARDED_BY(mu_) = 0;
	int64_t num_elements_ ABSL_GUARDED_BY(mu_) = 0;
	std::optional<snapshot_protocol::FailureRecord> failure_ ABSL_GUARDED_BY(mu_);
};

} // namespace Snapstream

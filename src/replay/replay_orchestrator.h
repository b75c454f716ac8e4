#ifndef SNAPSTREAM_SRC_REPLAY_REPLAY_ORCHESTRATOR_H_
#define SNAPSTREAM_SRC_REPLAY_REPLAY_ORCHESTRATOR_H_

#include <chrono>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include <snapshot.pb.h>

#include "reader/chunk_reader.h"
#include "store/chunk_store.h"

namespace Snapstream {

struct LoadOptions {
	// 1 = single pass, N = N passes, -1 = unbounded. 0 produces nothing.
	int64_t repetitions = 1;
	std::chrono::milliseconds poll_initial_backoff{10};
	std::chrono::milliseconds poll_max_backoff{1000};

	static LoadOptions FromConfig();
};

/**
 * Turns a ChunkReader into a blocking element sequence with epochs.
 *
 * GetNext() suspends with bounded exponential backoff while the stream is
 * still being written and ends only once the stream is sealed and the last
 * epoch consumed. Every epoch restarts at chunk 0; since chunk numbers are
 * fixed at commit, epochs that start after sealing always produce the same
 * order. EpochStartedSealed() tells whether the current epoch is one of them.
 *
 * GetNext/Save/Restore are called from one consumer thread; Cancel() may be
 * called from any thread and wakes a suspended GetNext.
 */
class ReplayOrchestrator {
	public:
		ReplayOrchestrator(std::shared_ptr<ChunkStore> store, std::string root, LoadOptions options);

		/**
		 * @param element Receives the next element
		 * @param end_of_sequence Set once every epoch was consumed
		 * @return The stream's failure cause (original code), DATA_LOSS for an
		 *         integrity error, CANCELLED after Cancel(). Errors are sticky.
		 */
		absl::Status GetNext(snapshot_protocol::Element* element, bool* end_of_sequence);

		// As above, but gives up waiting for an unwritten chunk at deadline and
		// sets *timed_out; nothing is consumed then.
		absl::Status GetNext(snapshot_protocol::Element* element, bool* end_of_sequence,
				absl::Time deadline, bool* timed_out);

		// Position after the last element returned by GetNext().
		absl::StatusOr<snapshot_protocol::CheckpointToken> Save();

		// FAILED_PRECONDITION when the token belongs to another run of the path.
		absl::Status Restore(const snapshot_protocol::CheckpointToken& token);

		void Cancel();

		/**
		 * Element count of the whole replay: unknown while the stream is open,
		 * sealed element count times repetitions once sealed.
		 */
		absl::StatusOr<int64_t> Cardinality();

		int64_t epoch() const { return epoch_; }
		bool EpochStartedSealed() const { return epoch_started_sealed_; }
		const std::string& root() const { return reader_.root(); }

	private:
		absl::Status StartIfNeeded();
		bool Exhausted() const {
			return options_.repetitions >= 0 && epoch_ >= options_.repetitions;
		}

		std::shared_ptr<ChunkStore> store_;
		ChunkReader reader_;
		const LoadOptions options_;
		absl::Notification cancelled_;

		bool started_ = false;
		bool ended_ = false;
		absl::Status error_;
		int64_t epoch_ = 0;
		bool epoch_started_sealed_ = false;
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_REPLAY_REPLAY_ORCHESTRATOR_H_

#pragma once

#include <chrono>
#include <string>

#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include <snapshot.pb.h>

#include "reader/cardinality.h"
#include "store/chunk_store.h"
#include "store/stream_metadata.h"

namespace Snapstream {

enum class ListOutcome {
	kChunk,        // *ref describes the next committed chunk
	kEndOfStream,  // sealed and every chunk listed
	kAwait,        // next chunk not committed yet
};

/**
 * Lists the committed chunks of a stream in chunk order, tailing an open
 * stream the same way ChunkReader does, and resolves the stream's chunk
 * count lazily.
 *
 * With repetitions the listing restarts at chunk 0 after each pass over a
 * sealed stream; repetitions < 0 repeats without bound, 0 lists nothing.
 */
class ChunkListing {
	public:
		ChunkListing(ChunkStore* store, std::string root, int64_t repetitions = 1);

		// Non-blocking step.
		absl::StatusOr<ListOutcome> Poll(snapshot_protocol::ChunkRef* ref);

		/**
		 * Blocks with bounded backoff until a chunk is listed or the stream ends.
		 * CANCELLED once Cancel() was called.
		 */
		absl::Status GetNext(snapshot_protocol::ChunkRef* ref, bool* end_of_stream);

		void Cancel();

		/**
		 * Number of chunk refs the whole listing yields: the sealed chunk count
		 * repeated per RepeatCardinality, with kUnknownCardinality as the base
		 * while the stream is open or not created. The failure cause once
		 * FAILED. Only the sealed count is cached.
		 */
		absl::StatusOr<int64_t> Cardinality();

		void set_poll_backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max) {
			poll_initial_ = initial;
			poll_max_ = max;
		}

	private:
		absl::Status RefreshState();

		ChunkStore* store_;
		const std::string root_;
		StreamMetadataStore metadata_;
		std::optional<snapshot_protocol::SealRecord> seal_;
		const int64_t repetitions_;
		int64_t next_chunk_ = 0;
		// Completed passes over the sealed stream.
		int64_t pass_ = 0;
		std::chrono::milliseconds poll_initial_{10};
		std::chrono::milliseconds poll_max_{1000};
		absl::Notification cancelled_;
};

} // namespace Snapstream

#ifndef SNAPSTREAM_SRC_READER_CHUNK_READER_H_
#define SNAPSTREAM_SRC_READER_CHUNK_READER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include <snapshot.pb.h>

#include "store/chunk_store.h"
#include "store/stream_metadata.h"

namespace Snapstream {

enum class ReadOutcome {
	kElement,      // *element holds the next element
	kEndOfChunk,   // the current chunk is exhausted; the cursor moved to the next one
	kEndOfStream,  // the stream is sealed and every chunk was read
	kAwait,        // the next chunk is not committed yet; try again later
};

const char* ReadOutcomeName(ReadOutcome outcome);

/**
 * Cursor over the committed chunks of one stream, in chunk order and in write
 * order within a chunk. Works on streams that are not created yet, still
 * being written, sealed or failed.
 *
 * At every chunk boundary the stream state is read before the next chunk is
 * checked, so:
 *   - a missing chunk below the sealed count is DATA_LOSS (never retried),
 *   - a missing chunk of an open stream is kAwait,
 *   - a failed stream returns its persisted cause with the original code.
 * Corrupt chunk files are DATA_LOSS.
 */
class ChunkReader {
	public:
		ChunkReader(ChunkStore* store, std::string root);

		absl::StatusOr<ReadOutcome> Next(snapshot_protocol::Element* element);

		// Positions the cursor at element element_offset of chunk chunk_index.
		absl::Status Seek(int64_t chunk_index, int64_t element_offset);

		// Back to the first element of chunk 0.
		void Reset() {
			chunk_index_ = 0;
			element_offset_ = 0;
			chunk_loaded_ = false;
			elements_.clear();
		}

		int64_t chunk_index() const { return chunk_index_; }
		int64_t element_offset() const { return element_offset_; }
		const std::string& root() const { return root_; }

		bool sealed() const { return seal_.has_value(); }
		// Sealed chunk count once the stream is DONE.
		std::optional<int64_t> num_chunks() const;

		/**
		 * Re-reads the stream state unless it is already known to be sealed.
		 * Returns the persisted cause when the stream failed.
		 */
		absl::Status RefreshState();

		// Run id of the stream; NOT_FOUND until the stream is created.
		absl::StatusOr<std::string> run_id();

	private:
		absl::Status LoadChunk();

		ChunkStore* store_;
		const std::string root_;
		StreamMetadataStore metadata_;

		std::optional<snapshot_protocol::SealRecord> seal_;
		std::optional<std::string> run_id_;

		int64_t chunk_index_ = 0;
		int64_t element_offset_ = 0;
		bool chunk_loaded_ = false;
		std::vector<snapshot_protocol::Element> elements_;
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_READER_CHUNK_READER_H_

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include <snapshot.pb.h>

#include "store/chunk_format.h"
#include "store/chunk_store.h"

namespace Snapstream {

/**
 * Writes the elements of one split assignment as size-bounded chunks into
 * <root>/uncommitted/. A chunk is flushed as soon as its buffered records
 * reach max_chunk_size_bytes, and once more by Finish() for the remainder.
 * A split without elements produces no chunk.
 *
 * Flushed chunks are published with ChunkStore::WriteAtomic, so a name in
 * uncommitted/ always refers to a complete file.
 */
class ChunkWriter {
public:
	ChunkWriter(ChunkStore* store, std::string root, std::string worker_id,
			int64_t split_index, int64_t generation,
			snapshot_protocol::Compression compression, size_t max_chunk_size_bytes);

	absl::Status Write(const snapshot_protocol::Element& element);

	// Flushes whatever is buffered. No writes are accepted afterwards.
	absl::Status Finish();

	// Deletes the chunks this writer already published (best effort).
	void Abandon();

	const std::vector<snapshot_protocol::ChunkRef>& chunks() const { return chunks_; }
	int64_t num_elements() const { return num_elements_; }

private:
	absl::Status Flush();

	ChunkStore* store_;
	const std::string root_;
	const std::string worker_id_;
	const int64_t split_index_;
	const int64_t generation_;
	const snapshot_protocol::Compression compression_;
	const size_t max_chunk_size_bytes_;

	ChunkRecordBuffer buffer_;
	std::vector<snapshot_protocol::ChunkRef> chunks_;
	int64_t num_elements_ = 0;
	bool finished_ = false;
};

} // namespace Snapstream

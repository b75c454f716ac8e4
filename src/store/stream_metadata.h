#pragma once

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include <snapshot.pb.h>

#include "store/chunk_store.h"

namespace Snapstream {

// State of a stream as derived from the records persisted under its root.
struct StreamStatus {
	snapshot_protocol::StreamState state = snapshot_protocol::STREAM_STATE_UNKNOWN;
	std::optional<snapshot_protocol::SealRecord> seal;
	std::optional<snapshot_protocol::FailureRecord> failure;

	bool created() const { return state != snapshot_protocol::STREAM_STATE_UNKNOWN; }
	bool terminal() const {
		return state == snapshot_protocol::STREAM_STATE_DONE ||
			state == snapshot_protocol::STREAM_STATE_FAILED;
	}
};

/**
 * Reads and writes the per-stream records (snapshot.metadata, DONE, ERROR).
 * All writes go through ChunkStore::WriteAtomic, so a record is either
 * absent or complete.
 */
class StreamMetadataStore {
public:
	explicit StreamMetadataStore(ChunkStore* store) : store_(store) {}

	// Creates <root>, <root>/chunks and <root>/uncommitted.
	absl::Status CreateLayout(const std::string& root);

	absl::Status WriteMetadata(const std::string& root, const snapshot_protocol::StreamMetadata& metadata);
	// NOT_FOUND when the stream was never created.
	absl::StatusOr<snapshot_protocol::StreamMetadata> ReadMetadata(const std::string& root);

	absl::Status WriteSealRecord(const std::string& root, const snapshot_protocol::SealRecord& seal);
	absl::Status WriteFailureRecord(const std::string& root, const snapshot_protocol::FailureRecord& failure);

	/**
	 * ERROR present -> FAILED; else DONE present -> DONE; else metadata
	 * present -> STREAMING; otherwise UNKNOWN (not yet created).
	 */
	absl::StatusOr<StreamStatus> ReadStatus(const std::string& root);

private:
	template <typename Message>
	absl::Status WriteRecord(const std::string& path, const Message& message);

	// Returns std::nullopt when path is missing.
	template <typename Message>
	absl::StatusOr<std::optional<Message>> ReadRecord(const std::string& path);

	ChunkStore* store_;
};

} // namespace Snapstream

#include "reader/chunk_reader.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/status_util.h"
#include "store/chunk_format.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

const char* ReadOutcomeName(ReadOutcome outcome) {
	switch (outcome) {
		case ReadOutcome::kElement: return "ELEMENT";
		case ReadOutcome::kEndOfChunk: return "END_OF_CHUNK";
		case ReadOutcome::kEndOfStream: return "END_OF_STREAM";
		case ReadOutcome::kAwait: return "AWAIT";
	}
	return "UNKNOWN";
}

ChunkReader::ChunkReader(ChunkStore* store, std::string root)
	: store_(store), root_(layout::NormalizeRoot(root)), metadata_(store) {}

std::optional<int64_t> ChunkReader::num_chunks() const {
	if (!seal_.has_value()) return std::nullopt;
	return seal_->num_chunks();
}

absl::Status ChunkReader::RefreshState() {
	if (seal_.has_value()) return absl::OkStatus();
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamStatus status, metadata_.ReadStatus(root_));
	if (status.state == snapshot_protocol::STREAM_STATE_FAILED) {
		return FromFailureRecord(*status.failure);
	}
	if (status.state == snapshot_protocol::STREAM_STATE_DONE) {
		seal_ = *status.seal;
		VLOG(2) << "[ChunkReader] " << root_ << " sealed with " << seal_->num_chunks() << " chunks";
	}
	return absl::OkStatus();
}

absl::StatusOr<std::string> ChunkReader::run_id() {
	if (!run_id_.has_value()) {
		SNAPSTREAM_ASSIGN_OR_RETURN(snapshot_protocol::StreamMetadata metadata,
				metadata_.ReadMetadata(root_));
		run_id_ = metadata.run_id();
	}
	return *run_id_;
}

absl::Status ChunkReader::Seek(int64_t chunk_index, int64_t element_offset) {
	if (chunk_index < 0 || element_offset < 0) {
		return absl::InvalidArgumentError(absl::StrCat("invalid position (", chunk_index, ", ",
				element_offset, ")"));
	}
	chunk_index_ = chunk_index;
	element_offset_ = element_offset;
	chunk_loaded_ = false;
	elements_.clear();
	return absl::OkStatus();
}

absl::Status ChunkReader::LoadChunk() {
	const std::string path = layout::ChunkPath(root_, chunk_index_);
	SNAPSTREAM_ASSIGN_OR_RETURN(std::string file, store_->ReadFile(path));
	auto chunk = DecodeChunk(file);
	if (!chunk.ok()) {
		return absl::DataLossError(absl::StrCat(path, ": ", chunk.status().message()));
	}
	if (element_offset_ > static_cast<int64_t>(chunk->elements.size())) {
		return absl::OutOfRangeError(absl::StrCat("offset ", element_offset_, " past the ",
				chunk->elements.size(), " elements of chunk ", chunk_index_));
	}
	elements_ = std::move(chunk->elements);
	chunk_loaded_ = true;
	return absl::OkStatus();
}

absl::StatusOr<ReadOutcome> ChunkReader::Next(snapshot_protocol::Element* element) {
	if (chunk_loaded_) {
		if (element_offset_ < static_cast<int64_t>(elements_.size())) {
			*element = elements_[element_offset_++];
			return ReadOutcome::kElement;
		}
		++chunk_index_;
		element_offset_ = 0;
		chunk_loaded_ = false;
		elements_.clear();
		return ReadOutcome::kEndOfChunk;
	}

	// Chunk boundary: state first, then the chunk itself.
	SNAPSTREAM_RETURN_IF_ERROR(RefreshState());
	if (seal_.has_value() && chunk_index_ >= seal_->num_chunks()) {
		return ReadOutcome::kEndOfStream;
	}
	absl::Status s = LoadChunk();
	if (absl::IsNotFound(s)) {
		if (seal_.has_value()) {
			return absl::DataLossError(absl::StrCat("chunk ", chunk_index_, " missing from sealed stream ",
					root_, " with ", seal_->num_chunks(), " chunks"));
		}
		return ReadOutcome::kAwait;
	}
	SNAPSTREAM_RETURN_IF_ERROR(s);
	return Next(element);
}

} // namespace Snapstream

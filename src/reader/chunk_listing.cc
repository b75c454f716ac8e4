#include "reader/chunk_listing.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

#include "common/backoff.h"
#include "common/status_util.h"
#include "store/chunk_format.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

ChunkListing::ChunkListing(ChunkStore* store, std::string root, int64_t repetitions)
	: store_(store), root_(layout::NormalizeRoot(root)), metadata_(store),
	repetitions_(repetitions) {
	VLOG(3) << "\t[ChunkListing]\t\tConstructed " << root_ << " repetitions:" << repetitions_;
}

absl::Status ChunkListing::RefreshState() {
	if (seal_.has_value()) return absl::OkStatus();
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamStatus status, metadata_.ReadStatus(root_));
	if (status.state == snapshot_protocol::STREAM_STATE_FAILED) {
		return FromFailureRecord(*status.failure);
	}
	if (status.state == snapshot_protocol::STREAM_STATE_DONE) {
		seal_ = *status.seal;
	}
	return absl::OkStatus();
}

absl::StatusOr<ListOutcome> ChunkListing::Poll(snapshot_protocol::ChunkRef* ref) {
	if (repetitions_ == 0) return ListOutcome::kEndOfStream;
	SNAPSTREAM_RETURN_IF_ERROR(RefreshState());
	if (seal_.has_value() && next_chunk_ >= seal_->num_chunks()) {
		if (seal_->num_chunks() == 0) return ListOutcome::kEndOfStream;
		++pass_;
		if (repetitions_ > 0 && pass_ >= repetitions_) {
			pass_ = repetitions_;
			return ListOutcome::kEndOfStream;
		}
		next_chunk_ = 0;
	}
	const std::string path = layout::ChunkPath(root_, next_chunk_);
	auto file = store_->ReadFile(path);
	if (absl::IsNotFound(file.status())) {
		if (seal_.has_value()) {
			return absl::DataLossError(absl::StrCat("chunk ", next_chunk_, " missing from sealed stream ",
					root_));
		}
		return ListOutcome::kAwait;
	}
	if (!file.ok()) return file.status();
	auto header = ParseChunkHeader(*file);
	if (!header.ok()) {
		return absl::DataLossError(absl::StrCat(path, ": ", header.status().message()));
	}
	ref->Clear();
	ref->set_chunk_index(next_chunk_);
	ref->set_num_elements(static_cast<int64_t>(header->num_elements));
	ref->set_byte_size(static_cast<int64_t>(file->size()));
	ref->set_split_index(header->split_index);
	++next_chunk_;
	return ListOutcome::kChunk;
}

absl::Status ChunkListing::GetNext(snapshot_protocol::ChunkRef* ref, bool* end_of_stream) {
	Backoff backoff(poll_initial_, poll_max_);
	while (true) {
		if (cancelled_.HasBeenNotified()) return absl::CancelledError("chunk listing cancelled");
		SNAPSTREAM_ASSIGN_OR_RETURN(ListOutcome outcome, Poll(ref));
		switch (outcome) {
			case ListOutcome::kChunk:
				*end_of_stream = false;
				return absl::OkStatus();
			case ListOutcome::kEndOfStream:
				*end_of_stream = true;
				return absl::OkStatus();
			case ListOutcome::kAwait:
				cancelled_.WaitForNotificationWithTimeout(absl::FromChrono(backoff.Next()));
				break;
		}
	}
}

void ChunkListing::Cancel() {
	if (!cancelled_.HasBeenNotified()) cancelled_.Notify();
}

absl::StatusOr<int64_t> ChunkListing::Cardinality() {
	SNAPSTREAM_RETURN_IF_ERROR(RefreshState());
	const int64_t base = seal_.has_value() ? seal_->num_chunks() : kUnknownCardinality;
	return RepeatCardinality(base, repetitions_);
}

} // namespace Snapstream

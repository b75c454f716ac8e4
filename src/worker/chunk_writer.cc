#include "worker/chunk_writer.h"

#include <glog/logging.h>

#include "common/status_util.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

ChunkWriter::ChunkWriter(ChunkStore* store, std::string root, std::string worker_id,
		int64_t split_index, int64_t generation,
		snapshot_protocol::Compression compression, size_t max_chunk_size_bytes)
	: store_(store),
	  root_(std::move(root)),
	  worker_id_(std::move(worker_id)),
	  split_index_(split_index),
	  generation_(generation),
	  compression_(compression),
	  max_chunk_size_bytes_(max_chunk_size_bytes == 0 ? 1 : max_chunk_size_bytes) {}

absl::Status ChunkWriter::Write(const snapshot_protocol::Element& element) {
	if (finished_) {
		return absl::FailedPreconditionError("ChunkWriter already finished");
	}
	SNAPSTREAM_RETURN_IF_ERROR(buffer_.Append(element));
	++num_elements_;
	if (buffer_.byte_size() >= max_chunk_size_bytes_) {
		return Flush();
	}
	return absl::OkStatus();
}

absl::Status ChunkWriter::Finish() {
	if (finished_) return absl::OkStatus();
	finished_ = true;
	if (buffer_.empty()) return absl::OkStatus();
	return Flush();
}

absl::Status ChunkWriter::Flush() {
	SNAPSTREAM_ASSIGN_OR_RETURN(std::string file, EncodeChunk(buffer_, compression_, split_index_));
	const std::string name = layout::UncommittedName(split_index_, worker_id_, generation_,
			static_cast<int64_t>(chunks_.size()));
	SNAPSTREAM_RETURN_IF_ERROR(store_->WriteAtomic(layout::UncommittedPath(root_, name), file));

	snapshot_protocol::ChunkRef ref;
	ref.set_uncommitted_name(name);
	ref.set_num_elements(buffer_.num_elements());
	ref.set_byte_size(static_cast<int64_t>(file.size()));
	ref.set_split_index(split_index_);
	chunks_.push_back(std::move(ref));
	VLOG(3) << "[ChunkWriter] split " << split_index_ << " flushed " << name << " ("
		<< buffer_.num_elements() << " elements, " << file.size() << " bytes)";
	buffer_.Clear();
	return absl::OkStatus();
}

void ChunkWriter::Abandon() {
	for (const auto& chunk : chunks_) {
		absl::Status s = store_->Delete(layout::UncommittedPath(root_, chunk.uncommitted_name()));
		if (!s.ok()) {
			LOG(WARNING) << "[ChunkWriter] could not remove " << chunk.uncommitted_name() << ": " << s;
		}
	}
	chunks_.clear();
	buffer_.Clear();
	finished_ = true;
}

} // namespace Snapstream

#include "dispatcher/stream_manager.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/status_util.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

using snapshot_protocol::GetSplitResponse;

StreamManager::StreamManager(int64_t stream_id, std::string root, std::string run_id,
		snapshot_protocol::PipelineDescriptor descriptor,
		snapshot_protocol::SnapshotOptions options,
		std::unique_ptr<Pipeline> pipeline, ChunkStore* store)
	: id_(stream_id),
	  root_(std::move(root)),
	  run_id_(std::move(run_id)),
	  descriptor_(std::move(descriptor)),
	  options_(std::move(options)),
	  pipeline_(std::move(pipeline)),
	  store_(store),
	  metadata_(store) {
	absl::MutexLock lock(&mu_);
	provider_ = pipeline_->MakeSplitProvider();
	VLOG(3) << "\t[StreamManager]\t\tConstructed stream:" << id_ << " root:" << root_;
}

absl::Status StreamManager::Start() {
	std::optional<snapshot_protocol::FailureRecord> failure;
	std::optional<snapshot_protocol::SealRecord> seal;
	absl::Status s;
	{
		absl::MutexLock lock(&mu_);
		s = FetchNextSplitLocked();
		if (!s.ok()) {
			failure = FailLocked(ToFailureRecord(s, -1));
		} else {
			seal = MaybeSealLocked();
		}
	}
	if (failure.has_value()) PersistFailure(*failure);
	if (seal.has_value()) FinishSeal(*seal);
	return s;
}

absl::Status StreamManager::FetchNextSplitLocked() {
	if (provider_exhausted_ || next_split_.has_value()) return absl::OkStatus();
	snapshot_protocol::Split split;
	bool end = false;
	SNAPSTREAM_RETURN_IF_ERROR(provider_->GetNext(&split, &end));
	if (end) {
		provider_exhausted_ = true;
		VLOG(2) << "[StreamManager] stream " << id_ << " split provider exhausted after "
			<< num_issued_splits_ << " splits";
		return absl::OkStatus();
	}
	if (split.index() != num_issued_splits_) {
		return absl::InternalError(absl::StrCat("split provider produced index ", split.index(),
				", expected ", num_issued_splits_));
	}
	next_split_ = std::move(split);
	return absl::OkStatus();
}

void StreamManager::AssignLocked(snapshot_protocol::Split split, const std::string& worker_id,
		GetSplitResponse* response) {
	const int64_t index = split.index();
	const int64_t generation = generations_[index];
	VLOG(2) << "[StreamManager] stream " << id_ << " split " << index << " gen " << generation
		<< " -> worker " << worker_id;
	response->set_result(GetSplitResponse::ASSIGNED);
	response->set_generation(generation);
	*response->mutable_split() = split;
	in_flight_[index] = Assignment{worker_id, generation, std::move(split)};
}

void StreamManager::GetSplit(const std::string& worker_id, absl::Duration wait,
		GetSplitResponse* response) {
	const absl::Time deadline = absl::Now() + wait;
	std::optional<snapshot_protocol::FailureRecord> failure;
	{
		absl::MutexLock lock(&mu_);
		while (true) {
			if (failure_.has_value() || state_ == snapshot_protocol::STREAM_STATE_FAILED) {
				response->set_result(GetSplitResponse::ABORTED);
				break;
			}
			if (state_ == snapshot_protocol::STREAM_STATE_DONE) {
				response->set_result(GetSplitResponse::NO_MORE_SPLITS);
				break;
			}
			if (!returned_splits_.empty()) {
				snapshot_protocol::Split split = std::move(returned_splits_.front());
				returned_splits_.pop_front();
				AssignLocked(std::move(split), worker_id, response);
				break;
			}
			if (next_split_.has_value()) {
				snapshot_protocol::Split split = std::move(*next_split_);
				next_split_.reset();
				++num_issued_splits_;
				AssignLocked(std::move(split), worker_id, response);
				absl::Status s = FetchNextSplitLocked();
				if (!s.ok()) {
					LOG(ERROR) << "[StreamManager] stream " << id_ << " split enumeration failed: " << s;
					failure = FailLocked(ToFailureRecord(s, num_issued_splits_));
				}
				break;
			}
			// Every split is out; one may come back if its holder's lease expires.
			if (cv_.WaitWithDeadline(&mu_, deadline)) {
				response->set_result(GetSplitResponse::WAIT);
				break;
			}
		}
	}
	if (failure.has_value()) PersistFailure(*failure);
}

absl::Status StreamManager::ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
		snapshot_protocol::ReportSplitDoneResponse* response) {
	const int64_t index = request.split_index();
	bool duplicate = false;
	{
		absl::MutexLock lock(&mu_);
		if (failure_.has_value()) {
			response->set_accepted(false);
			return absl::AbortedError(absl::StrCat("stream ", id_, " failed"));
		}
		if (index < 0 || index >= num_issued_splits_) {
			return absl::InvalidArgumentError(absl::StrCat("split ", index,
					" was never issued for stream ", id_));
		}
		duplicate = completed_splits_.contains(index);
		if (!duplicate) {
			completed_splits_.insert(index);
			++pending_commits_;
		}
	}
	if (duplicate) {
		VLOG(1) << "[StreamManager] stream " << id_ << " ignoring duplicate completion of split "
			<< index << " from worker " << request.worker_id() << " gen " << request.generation();
		response->set_accepted(false);
		DiscardUncommitted(request);
		return absl::OkStatus();
	}

	absl::MutexLock commit_lock(&commit_mu_);
	int64_t first_chunk;
	{
		absl::MutexLock lock(&mu_);
		first_chunk = next_chunk_index_;
	}
	absl::Status renamed_status;
	int64_t renamed = 0;
	int64_t elements = 0;
	for (const auto& chunk : request.chunks()) {
		const std::string from = layout::UncommittedPath(root_, chunk.uncommitted_name());
		const std::string to = layout::ChunkPath(root_, first_chunk + renamed);
		renamed_status = store_->Rename(from, to);
		if (!renamed_status.ok()) {
			LOG(ERROR) << "[StreamManager] stream " << id_ << " failed to commit " << from
				<< " as chunk " << first_chunk + renamed << ": " << renamed_status;
			break;
		}
		response->add_chunk_indices(first_chunk + renamed);
		++renamed;
		elements += chunk.num_elements();
	}

	std::optional<snapshot_protocol::FailureRecord> failure;
	std::optional<snapshot_protocol::SealRecord> seal;
	absl::Status result;
	{
		absl::MutexLock lock(&mu_);
		next_chunk_index_ += renamed;
		num_elements_ += elements;
		--pending_commits_;
		if (!renamed_status.ok()) {
			failure = FailLocked(ToFailureRecord(renamed_status, index));
			result = renamed_status;
		} else if (failure_.has_value()) {
			response->set_accepted(false);
			result = absl::AbortedError(absl::StrCat("stream ", id_, " failed"));
		} else {
			in_flight_.erase(index);
			returned_splits_.erase(
					std::remove_if(returned_splits_.begin(), returned_splits_.end(),
							[index](const snapshot_protocol::Split& s) { return s.index() == index; }),
					returned_splits_.end());
			response->set_accepted(true);
			VLOG(2) << "[StreamManager] stream " << id_ << " committed split " << index << " ("
				<< request.chunks_size() << " chunks) from worker " << request.worker_id();
			seal = MaybeSealLocked();
		}
		cv_.SignalAll();
	}
	if (failure.has_value()) PersistFailure(*failure);
	if (seal.has_value()) FinishSeal(*seal);
	return result;
}

void StreamManager::ReportSplitFailed(const std::string& worker_id, int64_t split_index,
		const snapshot_protocol::FailureRecord& cause) {
	std::optional<snapshot_protocol::FailureRecord> failure;
	{
		absl::MutexLock lock(&mu_);
		if (!streaming()) {
			VLOG(1) << "[StreamManager] stream " << id_ << " already terminal, ignoring failure of split "
				<< split_index;
			return;
		}
		LOG(WARNING) << "[StreamManager] stream " << id_ << " split " << split_index << " failed on worker "
			<< worker_id << ": " << FromFailureRecord(cause);
		snapshot_protocol::FailureRecord record = cause;
		record.set_split_index(split_index);
		failure = FailLocked(record);
	}
	if (failure.has_value()) PersistFailure(*failure);
}

int StreamManager::ReleaseWorker(const std::string& worker_id) {
	absl::MutexLock lock(&mu_);
	if (!streaming()) return 0;
	int released = 0;
	for (auto it = in_flight_.begin(); it != in_flight_.end();) {
		if (it->second.worker_id != worker_id) {
			++it;
			continue;
		}
		++generations_[it->first];
		LOG(WARNING) << "[StreamManager] stream " << id_ << " reassigning split " << it->first
			<< " held by worker " << worker_id << " (generation " << generations_[it->first] << ")";
		returned_splits_.push_back(std::move(it->second.split));
		in_flight_.erase(it++);
		++released;
	}
	if (released > 0) cv_.SignalAll();
	return released;
}

std::optional<snapshot_protocol::SealRecord> StreamManager::MaybeSealLocked() {
	if (!streaming()) return std::nullopt;
	if (!provider_exhausted_ || next_split_.has_value() || pending_commits_ > 0 ||
			!in_flight_.empty() || !returned_splits_.empty()) {
		return std::nullopt;
	}
	sealing_ = true;
	snapshot_protocol::SealRecord seal;
	seal.set_num_chunks(next_chunk_index_);
	seal.set_num_elements(num_elements_);
	seal.set_num_splits(num_issued_splits_);
	return seal;
}

void StreamManager::FinishSeal(const snapshot_protocol::SealRecord& seal) {
	absl::Status s = metadata_.WriteSealRecord(root_, seal);
	if (!s.ok()) {
		LOG(ERROR) << "[StreamManager] stream " << id_ << " failed to write seal record: " << s;
		std::optional<snapshot_protocol::FailureRecord> failure;
		{
			absl::MutexLock lock(&mu_);
			sealing_ = false;
			failure = FailLocked(ToFailureRecord(absl::UnavailableError(absl::StrCat(
					"failed to seal snapshot: ", s.message())), -1));
		}
		if (failure.has_value()) PersistFailure(*failure);
		return;
	}
	{
		absl::MutexLock lock(&mu_);
		state_ = snapshot_protocol::STREAM_STATE_DONE;
		sealing_ = false;
		cv_.SignalAll();
	}
	LOG(INFO) << "[StreamManager] stream " << id_ << " at " << root_ << " sealed: "
		<< seal.num_chunks() << " chunks, " << seal.num_elements() << " elements, "
		<< seal.num_splits() << " splits";
	CleanUncommittedDir();
}

std::optional<snapshot_protocol::FailureRecord> StreamManager::FailLocked(
		const snapshot_protocol::FailureRecord& cause) {
	if (!streaming()) return std::nullopt;
	failure_ = cause;
	returned_splits_.clear();
	in_flight_.clear();
	next_split_.reset();
	cv_.SignalAll();
	return cause;
}

void StreamManager::PersistFailure(const snapshot_protocol::FailureRecord& record) {
	absl::Status s = metadata_.WriteFailureRecord(root_, record);
	if (!s.ok()) {
		// Readers keep waiting on a stream whose failure never became durable.
		LOG(ERROR) << "[StreamManager] stream " << id_ << " failed to persist failure record: " << s;
	}
	{
		absl::MutexLock lock(&mu_);
		state_ = snapshot_protocol::STREAM_STATE_FAILED;
		cv_.SignalAll();
	}
	LOG(ERROR) << "[StreamManager] stream " << id_ << " at " << root_ << " failed: "
		<< FromFailureRecord(record);
}

void StreamManager::DiscardUncommitted(const snapshot_protocol::ReportSplitDoneRequest& request) {
	for (const auto& chunk : request.chunks()) {
		absl::Status s = store_->Delete(layout::UncommittedPath(root_, chunk.uncommitted_name()));
		if (!s.ok()) {
			LOG(WARNING) << "[StreamManager] could not discard " << chunk.uncommitted_name() << ": " << s;
		}
	}
}

void StreamManager::CleanUncommittedDir() {
	const std::string dir = layout::UncommittedDir(root_);
	auto names = store_->List(dir, "");
	if (!names.ok()) {
		LOG(WARNING) << "[StreamManager] could not list " << dir << ": " << names.status();
		return;
	}
	for (const auto& name : *names) {
		absl::Status s = store_->Delete(layout::JoinPath(dir, name));
		if (!s.ok()) {
			LOG(WARNING) << "[StreamManager] could not remove leftover " << name << ": " << s;
		}
	}
}

snapshot_protocol::StreamState StreamManager::state() const {
	absl::MutexLock lock(&mu_);
	return state_;
}

bool StreamManager::terminal() const {
	absl::MutexLock lock(&mu_);
	return state_ != snapshot_protocol::STREAM_STATE_STREAMING;
}

int64_t StreamManager::num_committed_chunks() const {
	absl::MutexLock lock(&mu_);
	return next_chunk_index_;
}

std::optional<snapshot_protocol::FailureRecord> StreamManager::failure() const {
	absl::MutexLock lock(&mu_);
	return failure_;
}

snapshot_protocol::StreamTask StreamManager::task() const {
	snapshot_protocol::StreamTask task;
	task.set_stream_id(id_);
	task.set_path(root_);
	*task.mutable_pipeline() = descriptor_;
	*task.mutable_options() = options_;
	return task;
}

} // namespace Snapstream

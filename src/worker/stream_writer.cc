#include "worker/stream_writer.h"

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/backoff.h"
#include "common/status_util.h"
#include "worker/chunk_writer.h"

namespace Snapstream {

namespace {

bool IsRetryableRpc(const absl::Status& status) {
	return absl::IsUnavailable(status) || absl::IsDeadlineExceeded(status);
}

} // namespace

StreamWriter::StreamWriter(snapshot_protocol::StreamTask task, std::string worker_id,
		DispatcherClient* dispatcher, ChunkStore* store,
		const PipelineRegistry* registry, StreamWriterOptions options)
	: task_(std::move(task)),
	  worker_id_(std::move(worker_id)),
	  dispatcher_(dispatcher),
	  store_(store),
	  registry_(registry),
	  options_(options) {}

StreamWriter::~StreamWriter() {
	Cancel();
	Join();
}

void StreamWriter::Start() {
	thread_ = std::thread([this]() {
		this->Run();
	});
}

void StreamWriter::Cancel() {
	if (!cancelled_.HasBeenNotified()) cancelled_.Notify();
}

void StreamWriter::Join() {
	if (thread_.joinable()) thread_.join();
}

bool StreamWriter::SleepUnlessCancelled(std::chrono::milliseconds delay) {
	return !cancelled_.WaitForNotificationWithTimeout(absl::FromChrono(delay));
}

void StreamWriter::Run() {
	VLOG(1) << "[StreamWriter] worker " << worker_id_ << " writing stream " << task_.stream_id()
		<< " at " << task_.path();
	auto pipeline = BuildPipeline(task_.pipeline(), registry_);
	if (!pipeline.ok()) {
		// The dispatcher built this pipeline, so the problem is local to this worker.
		LOG(ERROR) << "[StreamWriter] worker " << worker_id_ << " cannot build the pipeline of stream "
			<< task_.stream_id() << ": " << pipeline.status();
		finished_ = true;
		return;
	}

	Backoff backoff(options_.rpc_retry_initial, options_.rpc_retry_max);
	while (!cancelled_.HasBeenNotified()) {
		snapshot_protocol::GetSplitRequest request;
		request.set_stream_id(task_.stream_id());
		request.set_worker_id(worker_id_);
		snapshot_protocol::GetSplitResponse response;
		absl::Status s = dispatcher_->GetSplit(request, &response);
		if (!s.ok()) {
			if (absl::IsNotFound(s)) {
				LOG(WARNING) << "[StreamWriter] dispatcher no longer knows stream " << task_.stream_id();
				break;
			}
			LOG(WARNING) << "[StreamWriter] GetSplit for stream " << task_.stream_id() << " failed: " << s;
			if (!SleepUnlessCancelled(backoff.Next())) break;
			continue;
		}
		backoff.Reset();

		if (response.result() == snapshot_protocol::GetSplitResponse::WAIT) continue;
		if (response.result() == snapshot_protocol::GetSplitResponse::NO_MORE_SPLITS) {
			VLOG(1) << "[StreamWriter] stream " << task_.stream_id() << " has no more splits";
			break;
		}
		if (response.result() == snapshot_protocol::GetSplitResponse::ABORTED) {
			VLOG(1) << "[StreamWriter] stream " << task_.stream_id() << " aborted";
			break;
		}
		if (ProcessSplit(**pipeline, response.split(), response.generation()) == SplitOutcome::kStop) {
			break;
		}
	}
	finished_ = true;
}

StreamWriter::SplitOutcome StreamWriter::ProcessSplit(const Pipeline& pipeline,
		const snapshot_protocol::Split& split, int64_t generation) {
	const int64_t index = split.index();
	auto iterator = pipeline.MakeSplitIterator(split);
	if (!iterator.ok()) {
		return ReportFailure(index, iterator.status());
	}

	ChunkWriter writer(store_, task_.path(), worker_id_, index, generation,
			task_.options().compression(),
			static_cast<size_t>(task_.options().max_chunk_size_bytes()));
	while (true) {
		if (cancelled_.HasBeenNotified()) {
			writer.Abandon();
			return SplitOutcome::kStop;
		}
		snapshot_protocol::Element element;
		bool end = false;
		absl::Status s = (*iterator)->GetNext(&element, &end);
		if (!s.ok()) {
			writer.Abandon();
			return ReportFailure(index, s);
		}
		if (end) break;
		s = writer.Write(element);
		if (!s.ok()) {
			writer.Abandon();
			return ReportFailure(index, absl::UnavailableError(s.message()));
		}
	}
	absl::Status s = writer.Finish();
	if (!s.ok()) {
		writer.Abandon();
		return ReportFailure(index, absl::UnavailableError(s.message()));
	}

	snapshot_protocol::ReportSplitDoneRequest request;
	request.set_stream_id(task_.stream_id());
	request.set_worker_id(worker_id_);
	request.set_split_index(index);
	request.set_generation(generation);
	for (const auto& chunk : writer.chunks()) {
		*request.add_chunks() = chunk;
	}

	Backoff backoff(options_.rpc_retry_initial, options_.rpc_retry_max);
	while (true) {
		snapshot_protocol::ReportSplitDoneResponse response;
		s = dispatcher_->ReportSplitDone(request, &response);
		if (s.ok()) {
			if (response.accepted()) {
				++num_splits_written_;
				VLOG(2) << "[StreamWriter] stream " << task_.stream_id() << " split " << index
					<< " committed as " << response.chunk_indices_size() << " chunks";
			}
			return SplitOutcome::kContinue;
		}
		if (absl::IsAborted(s)) {
			writer.Abandon();
			return SplitOutcome::kStop;
		}
		if (!IsRetryableRpc(s)) {
			LOG(ERROR) << "[StreamWriter] stream " << task_.stream_id() << " split " << index
				<< " completion rejected: " << s;
			writer.Abandon();
			return SplitOutcome::kStop;
		}
		LOG(WARNING) << "[StreamWriter] reporting split " << index << " failed, retrying: " << s;
		if (!SleepUnlessCancelled(backoff.Next())) {
			// Files stay in uncommitted/ until the stream seals; the split is reassigned.
			return SplitOutcome::kStop;
		}
	}
}

StreamWriter::SplitOutcome StreamWriter::ReportFailure(int64_t split_index, const absl::Status& cause) {
	LOG(WARNING) << "[StreamWriter] stream " << task_.stream_id() << " split " << split_index
		<< " failed: " << cause;
	snapshot_protocol::ReportSplitFailedRequest request;
	request.set_stream_id(task_.stream_id());
	request.set_worker_id(worker_id_);
	request.set_split_index(split_index);
	*request.mutable_cause() = ToFailureRecord(cause, split_index);

	Backoff backoff(options_.rpc_retry_initial, options_.rpc_retry_max);
	while (true) {
		snapshot_protocol::ReportSplitFailedResponse response;
		absl::Status s = dispatcher_->ReportSplitFailed(request, &response);
		if (s.ok() || !IsRetryableRpc(s)) {
			if (!s.ok()) LOG(ERROR) << "[StreamWriter] could not report split failure: " << s;
			return SplitOutcome::kStop;
		}
		if (!SleepUnlessCancelled(backoff.Next())) return SplitOutcome::kStop;
	}
}

} // namespace Snapstream

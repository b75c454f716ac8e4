#include "replay/replay_orchestrator.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

#include "common/backoff.h"
#include "common/configuration.h"
#include "common/status_util.h"
#include "reader/cardinality.h"
#include "store/stream_metadata.h"

namespace Snapstream {

LoadOptions LoadOptions::FromConfig() {
	const auto& reader = GetConfig().config().reader;
	LoadOptions options;
	options.poll_initial_backoff = std::chrono::milliseconds(reader.poll_initial_backoff_ms.get());
	options.poll_max_backoff = std::chrono::milliseconds(reader.poll_max_backoff_ms.get());
	return options;
}

ReplayOrchestrator::ReplayOrchestrator(std::shared_ptr<ChunkStore> store, std::string root,
		LoadOptions options)
	: store_(std::move(store)),
	  reader_(store_.get(), std::move(root)),
	  options_(options) {
	VLOG(3) << "\t[ReplayOrchestrator]\t\tConstructed " << reader_.root()
		<< " repetitions:" << options_.repetitions;
}

absl::Status ReplayOrchestrator::StartIfNeeded() {
	if (started_) return absl::OkStatus();
	SNAPSTREAM_RETURN_IF_ERROR(reader_.RefreshState());
	epoch_started_sealed_ = reader_.sealed();
	started_ = true;
	return absl::OkStatus();
}

absl::Status ReplayOrchestrator::GetNext(snapshot_protocol::Element* element, bool* end_of_sequence) {
	bool timed_out = false;
	return GetNext(element, end_of_sequence, absl::InfiniteFuture(), &timed_out);
}

absl::Status ReplayOrchestrator::GetNext(snapshot_protocol::Element* element, bool* end_of_sequence,
		absl::Time deadline, bool* timed_out) {
	*timed_out = false;
	if (cancelled_.HasBeenNotified()) return absl::CancelledError("replay cancelled");
	if (!error_.ok()) return error_;
	if (ended_ || Exhausted()) {
		ended_ = true;
		*end_of_sequence = true;
		return absl::OkStatus();
	}
	absl::Status s = StartIfNeeded();
	if (!s.ok()) {
		error_ = s;
		return s;
	}

	Backoff backoff(options_.poll_initial_backoff, options_.poll_max_backoff);
	while (true) {
		if (cancelled_.HasBeenNotified()) return absl::CancelledError("replay cancelled");
		auto outcome = reader_.Next(element);
		if (!outcome.ok()) {
			LOG(ERROR) << "[ReplayOrchestrator] " << reader_.root() << " failed at chunk "
				<< reader_.chunk_index() << ": " << outcome.status();
			error_ = outcome.status();
			return error_;
		}
		switch (*outcome) {
			case ReadOutcome::kElement:
				*end_of_sequence = false;
				return absl::OkStatus();
			case ReadOutcome::kEndOfChunk:
				backoff.Reset();
				break;
			case ReadOutcome::kAwait: {
				const absl::Time now = absl::Now();
				if (now >= deadline) {
					*timed_out = true;
					return absl::OkStatus();
				}
				VLOG(3) << "[ReplayOrchestrator] " << reader_.root() << " waiting for chunk "
					<< reader_.chunk_index();
				cancelled_.WaitForNotificationWithTimeout(
						std::min(absl::FromChrono(backoff.Next()), deadline - now));
				break;
			}
			case ReadOutcome::kEndOfStream:
				++epoch_;
				// A sealed stream without chunks would otherwise spin forever.
				if (Exhausted() || reader_.num_chunks().value_or(0) == 0) {
					VLOG(1) << "[ReplayOrchestrator] " << reader_.root() << " finished after "
						<< epoch_ << " epochs";
					ended_ = true;
					*end_of_sequence = true;
					return absl::OkStatus();
				}
				reader_.Reset();
				epoch_started_sealed_ = true;
				break;
		}
	}
}

absl::StatusOr<snapshot_protocol::CheckpointToken> ReplayOrchestrator::Save() {
	snapshot_protocol::CheckpointToken token;
	auto run_id = reader_.run_id();
	if (run_id.ok()) {
		token.set_run_id(*run_id);
	} else if (!absl::IsNotFound(run_id.status())) {
		return run_id.status();
	}
	token.set_epoch(epoch_);
	token.set_chunk_index(reader_.chunk_index());
	token.set_element_offset(reader_.element_offset());
	token.set_epoch_started_sealed(epoch_started_sealed_);
	return token;
}

absl::Status ReplayOrchestrator::Restore(const snapshot_protocol::CheckpointToken& token) {
	if (!token.run_id().empty()) {
		auto run_id = reader_.run_id();
		if (!run_id.ok()) {
			return absl::FailedPreconditionError(absl::StrCat("checkpoint of run ", token.run_id(),
					" cannot be restored: ", run_id.status().message()));
		}
		if (*run_id != token.run_id()) {
			return absl::FailedPreconditionError(absl::StrCat("checkpoint belongs to run ",
					token.run_id(), " but ", reader_.root(), " holds run ", *run_id));
		}
	} else if (token.chunk_index() != 0 || token.element_offset() != 0) {
		return absl::InvalidArgumentError("checkpoint without a run id must be at the start of an epoch");
	}
	if (token.epoch() < 0) {
		return absl::InvalidArgumentError(absl::StrCat("invalid checkpoint epoch ", token.epoch()));
	}
	SNAPSTREAM_RETURN_IF_ERROR(reader_.Seek(token.chunk_index(), token.element_offset()));
	epoch_ = token.epoch();
	epoch_started_sealed_ = token.epoch_started_sealed();
	started_ = true;
	ended_ = false;
	error_ = absl::OkStatus();
	VLOG(1) << "[ReplayOrchestrator] " << reader_.root() << " restored to epoch " << epoch_
		<< " chunk " << token.chunk_index() << " offset " << token.element_offset();
	return absl::OkStatus();
}

void ReplayOrchestrator::Cancel() {
	if (!cancelled_.HasBeenNotified()) cancelled_.Notify();
}

absl::StatusOr<int64_t> ReplayOrchestrator::Cardinality() {
	StreamMetadataStore metadata(store_.get());
	SNAPSTREAM_ASSIGN_OR_RETURN(StreamStatus status, metadata.ReadStatus(reader_.root()));
	if (status.state == snapshot_protocol::STREAM_STATE_FAILED) {
		return FromFailureRecord(*status.failure);
	}
	if (status.state == snapshot_protocol::STREAM_STATE_DONE) {
		return RepeatCardinality(status.seal->num_elements(), options_.repetitions);
	}
	return RepeatCardinality(kUnknownCardinality, options_.repetitions);
}

} // namespace Snapstream

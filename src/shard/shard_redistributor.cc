#include "shard/shard_redistributor.h"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

namespace Snapstream {

namespace {

// How often blocked queue operations look at the cancellation flag.
constexpr std::chrono::milliseconds kQueuePollInterval{50};

} // namespace

const char* ShardingPolicyName(ShardingPolicy policy) {
	switch (policy) {
		case ShardingPolicy::kOff: return "OFF";
		case ShardingPolicy::kDynamic: return "DYNAMIC";
	}
	return "UNKNOWN";
}

snapshot_protocol::ShardingPolicy ShardingPolicyToProto(ShardingPolicy policy) {
	return policy == ShardingPolicy::kDynamic ? snapshot_protocol::SHARDING_POLICY_DYNAMIC
		: snapshot_protocol::SHARDING_POLICY_OFF;
}

ShardingPolicy ShardingPolicyFromProto(snapshot_protocol::ShardingPolicy policy) {
	return policy == snapshot_protocol::SHARDING_POLICY_DYNAMIC ? ShardingPolicy::kDynamic
		: ShardingPolicy::kOff;
}

ConsumerGroup::ConsumerGroup(ShardingPolicy policy, int num_consumers, size_t queue_capacity)
	: policy_(policy), num_consumers_(num_consumers) {
	if (policy_ == ShardingPolicy::kDynamic) {
		queue_ = std::make_unique<ShardQueue>(queue_capacity);
		drained_ = std::make_unique<std::atomic<bool>[]>(num_consumers_);
		for (int i = 0; i < num_consumers_; ++i) drained_[i] = false;
	}
}

absl::StatusOr<std::unique_ptr<ConsumerGroup>> ConsumerGroup::Create(
		std::shared_ptr<ChunkStore> store, const std::string& root,
		ShardingPolicy policy, int num_consumers, LoadOptions options, size_t queue_capacity) {
	if (num_consumers < 1) {
		return absl::InvalidArgumentError(absl::StrCat("num_consumers must be >= 1, got ", num_consumers));
	}
	if (queue_capacity < 1) {
		return absl::InvalidArgumentError("queue capacity must be >= 1");
	}
	std::unique_ptr<ConsumerGroup> group(new ConsumerGroup(policy, num_consumers, queue_capacity));
	if (policy == ShardingPolicy::kOff) {
		for (int i = 0; i < num_consumers; ++i) {
			group->replicas_.push_back(std::make_unique<ReplayOrchestrator>(store, root, options));
		}
	} else {
		group->source_ = std::make_unique<ReplayOrchestrator>(store, root, options);
		ConsumerGroup* raw = group.get();
		group->producer_ = std::thread([raw]() {
			raw->ProduceLoop();
		});
	}
	LOG(INFO) << "[ConsumerGroup] " << ShardingPolicyName(policy) << " group of " << num_consumers
		<< " consumers over " << root;
	return group;
}

ConsumerGroup::~ConsumerGroup() {
	Cancel();
	if (producer_.joinable()) producer_.join();
}

void ConsumerGroup::Cancel() {
	if (!cancelled_.HasBeenNotified()) cancelled_.Notify();
	if (source_) source_->Cancel();
	for (auto& replica : replicas_) replica->Cancel();
}

bool ConsumerGroup::WriteUnlessCancelled(std::optional<snapshot_protocol::Element> item) {
	while (!cancelled_.HasBeenNotified()) {
		if (queue_->tryWriteUntil(std::chrono::steady_clock::now() + kQueuePollInterval, item)) {
			return true;
		}
	}
	return false;
}

void ConsumerGroup::ProduceLoop() {
	int64_t produced = 0;
	absl::Status terminal;
	while (true) {
		snapshot_protocol::Element element;
		bool end = false;
		terminal = source_->GetNext(&element, &end);
		if (!terminal.ok() || end) break;
		if (!WriteUnlessCancelled(std::make_optional(std::move(element)))) return;
		++produced;
	}
	if (absl::IsCancelled(terminal) && cancelled_.HasBeenNotified()) return;

	VLOG(1) << "[ConsumerGroup] producer done after " << produced << " elements: " << terminal;
	{
		absl::MutexLock lock(&mu_);
		terminal_status_ = terminal;
	}
	// One sentinel per consumer; a consumer stops reading after its first.
	for (int i = 0; i < num_consumers_; ++i) {
		std::optional<snapshot_protocol::Element> sentinel = std::nullopt;
		if (!WriteUnlessCancelled(std::move(sentinel))) return;
	}
}

absl::Status ConsumerGroup::GetNext(int consumer, snapshot_protocol::Element* element,
		bool* end_of_sequence) {
	bool timed_out = false;
	return GetNext(consumer, element, end_of_sequence, absl::InfiniteFuture(), &timed_out);
}

absl::Status ConsumerGroup::GetNext(int consumer, snapshot_protocol::Element* element,
		bool* end_of_sequence, absl::Time deadline, bool* timed_out) {
	*timed_out = false;
	if (consumer < 0 || consumer >= num_consumers_) {
		return absl::InvalidArgumentError(absl::StrCat("consumer ", consumer, " outside [0, ",
				num_consumers_, ")"));
	}
	if (policy_ == ShardingPolicy::kOff) {
		return replicas_[consumer]->GetNext(element, end_of_sequence, deadline, timed_out);
	}

	auto finish = [&]() -> absl::Status {
		absl::MutexLock lock(&mu_);
		if (!terminal_status_.ok()) return terminal_status_;
		*end_of_sequence = true;
		return absl::OkStatus();
	};
	if (drained_[consumer]) return finish();

	std::optional<snapshot_protocol::Element> item;
	while (true) {
		if (cancelled_.HasBeenNotified()) return absl::CancelledError("consumer group cancelled");
		const absl::Duration remaining = deadline - absl::Now();
		if (remaining <= absl::ZeroDuration()) {
			*timed_out = true;
			return absl::OkStatus();
		}
		const std::chrono::milliseconds wait =
				std::min(kQueuePollInterval, absl::ToChronoMilliseconds(remaining));
		if (queue_->tryReadUntil(std::chrono::steady_clock::now() + wait, item)) break;
	}
	if (!item.has_value()) {
		drained_[consumer] = true;
		return finish();
	}
	*element = std::move(*item);
	*end_of_sequence = false;
	return absl::OkStatus();
}

} // namespace Snapstream

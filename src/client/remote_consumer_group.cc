#include "client/remote_consumer_group.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/status_util.h"

namespace Snapstream {

RemoteConsumerGroup::RemoteConsumerGroup(std::shared_ptr<DispatcherClient> dispatcher,
		int64_t group_id, ShardingPolicy policy, int num_consumers)
	: dispatcher_(std::move(dispatcher)),
	  group_id_(group_id),
	  policy_(policy),
	  num_consumers_(num_consumers) {
	VLOG(3) << "\t[RemoteConsumerGroup]\t\tConstructed group:" << group_id_
		<< " policy:" << ShardingPolicyName(policy_) << " consumers:" << num_consumers_;
}

absl::Status RemoteConsumerGroup::GetNext(int consumer, snapshot_protocol::Element* element,
		bool* end_of_sequence) {
	if (consumer < 0 || consumer >= num_consumers_) {
		return absl::InvalidArgumentError(absl::StrCat("consumer ", consumer, " outside [0, ",
				num_consumers_, ")"));
	}
	snapshot_protocol::GetNextElementRequest request;
	request.set_group_id(group_id_);
	request.set_consumer(consumer);
	while (true) {
		if (cancelled_.HasBeenNotified()) return absl::CancelledError("consumer group cancelled");
		snapshot_protocol::GetNextElementResponse response;
		SNAPSTREAM_RETURN_IF_ERROR(dispatcher_->GetNextElement(request, &response));
		switch (response.result()) {
			case snapshot_protocol::GetNextElementResponse::ELEMENT:
				*element = std::move(*response.mutable_element());
				*end_of_sequence = false;
				return absl::OkStatus();
			case snapshot_protocol::GetNextElementResponse::END_OF_SEQUENCE:
				*end_of_sequence = true;
				return absl::OkStatus();
			default:
				// The dispatcher already waited; ask again.
				break;
		}
	}
}

void RemoteConsumerGroup::Cancel() {
	if (!cancelled_.HasBeenNotified()) cancelled_.Notify();
}

absl::Status RemoteConsumerGroup::Release() {
	Cancel();
	snapshot_protocol::ReleaseConsumerGroupRequest request;
	request.set_group_id(group_id_);
	snapshot_protocol::ReleaseConsumerGroupResponse response;
	return dispatcher_->ReleaseConsumerGroup(request, &response);
}

absl::StatusOr<std::unique_ptr<RemoteConsumerGroup>> JoinRemoteConsumerGroup(
		std::shared_ptr<DispatcherClient> dispatcher, const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		const std::string& group_name, size_t queue_capacity) {
	snapshot_protocol::JoinConsumerGroupRequest request;
	request.set_group_name(group_name);
	request.set_path(path);
	request.set_policy(ShardingPolicyToProto(policy));
	request.set_num_consumers(num_consumers);
	request.set_repetitions(options.repetitions);
	request.set_poll_initial_backoff_ms(options.poll_initial_backoff.count());
	request.set_poll_max_backoff_ms(options.poll_max_backoff.count());
	request.set_queue_capacity(static_cast<int64_t>(queue_capacity));
	snapshot_protocol::JoinConsumerGroupResponse response;
	SNAPSTREAM_RETURN_IF_ERROR(dispatcher->JoinConsumerGroup(request, &response));
	return std::make_unique<RemoteConsumerGroup>(std::move(dispatcher), response.group_id(),
			policy, num_consumers);
}

} // namespace Snapstream

#ifndef SNAPSTREAM_SRC_CLIENT_REMOTE_CONSUMER_GROUP_H_
#define SNAPSTREAM_SRC_CLIENT_REMOTE_CONSUMER_GROUP_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include <snapshot.pb.h>

#include "replay/replay_orchestrator.h"
#include "shard/shard_redistributor.h"
#include "worker/dispatcher_client.h"

namespace Snapstream {

/**
 * Consumer-side handle of a ConsumerGroup hosted by the dispatcher.
 *
 * Any number of processes may hold a handle to the same group (joined by
 * name); together they share its num_consumers indices. Each index must be
 * read by one thread across all of them. An element whose GetNextElement
 * call is lost on the wire is not redelivered.
 */
class RemoteConsumerGroup {
	public:
		RemoteConsumerGroup(std::shared_ptr<DispatcherClient> dispatcher, int64_t group_id,
				ShardingPolicy policy, int num_consumers);

		RemoteConsumerGroup(const RemoteConsumerGroup&) = delete;
		RemoteConsumerGroup& operator=(const RemoteConsumerGroup&) = delete;

		/**
		 * Blocks until the dispatcher hands this consumer an element or the end.
		 * @return The stream's failure cause; CANCELLED after Cancel() or once
		 *         any holder released the group
		 */
		absl::Status GetNext(int consumer, snapshot_protocol::Element* element, bool* end_of_sequence);

		// Stops this handle's waits. The hosted group keeps running.
		void Cancel();

		// Cancels the hosted group for every holder.
		absl::Status Release();

		int64_t group_id() const { return group_id_; }
		ShardingPolicy policy() const { return policy_; }
		int num_consumers() const { return num_consumers_; }

	private:
		std::shared_ptr<DispatcherClient> dispatcher_;
		const int64_t group_id_;
		const ShardingPolicy policy_;
		const int num_consumers_;
		absl::Notification cancelled_;
};

/**
 * Creates a consumer group over path on the dispatcher, or joins the live
 * group named group_name.
 *
 * @param group_name Empty always creates a new group
 * @param queue_capacity 0 takes the dispatcher's reader.shard_queue_capacity
 */
absl::StatusOr<std::unique_ptr<RemoteConsumerGroup>> JoinRemoteConsumerGroup(
		std::shared_ptr<DispatcherClient> dispatcher, const std::string& path,
		ShardingPolicy policy, int num_consumers, const LoadOptions& options,
		const std::string& group_name = "", size_t queue_capacity = 0);

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_CLIENT_REMOTE_CONSUMER_GROUP_H_

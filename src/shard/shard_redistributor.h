#ifndef SNAPSTREAM_SRC_SHARD_SHARD_REDISTRIBUTOR_H_
#define SNAPSTREAM_SRC_SHARD_SHARD_REDISTRIBUTOR_H_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "folly/MPMCQueue.h"
#include <dispatcher.pb.h>
#include <snapshot.pb.h>

#include "replay/replay_orchestrator.h"
#include "store/chunk_store.h"

namespace Snapstream {

enum class ShardingPolicy {
	// Every consumer replays the whole stream.
	kOff,
	// Each element goes to exactly one consumer, whichever asks first.
	kDynamic,
};

const char* ShardingPolicyName(ShardingPolicy policy);
snapshot_protocol::ShardingPolicy ShardingPolicyToProto(ShardingPolicy policy);
ShardingPolicy ShardingPolicyFromProto(snapshot_protocol::ShardingPolicy policy);

/**
 * A group of num_consumers consumers over one stream.
 *
 * kOff gives every consumer an independent ReplayOrchestrator.
 * kDynamic runs one orchestrator on a producer thread feeding a bounded
 * folly::MPMCQueue; waiting consumers are served in ticket (arrival) order.
 * End of stream and terminal errors reach every consumer. Order is preserved
 * per consumer only.
 *
 * Destroying or cancelling the group stops the producer. It never affects
 * whoever writes the stream.
 */
class ConsumerGroup {
	public:
		static absl::StatusOr<std::unique_ptr<ConsumerGroup>> Create(
				std::shared_ptr<ChunkStore> store, const std::string& root,
				ShardingPolicy policy, int num_consumers, LoadOptions options,
				size_t queue_capacity);
		~ConsumerGroup();

		ConsumerGroup(const ConsumerGroup&) = delete;
		ConsumerGroup& operator=(const ConsumerGroup&) = delete;

		/**
		 * @param consumer Index in [0, num_consumers); one thread per index
		 * @return The stream error for every consumer once it occurred;
		 *         CANCELLED after Cancel()
		 */
		absl::Status GetNext(int consumer, snapshot_protocol::Element* element, bool* end_of_sequence);

		// Waits no later than deadline; *timed_out is set when nothing was ready.
		absl::Status GetNext(int consumer, snapshot_protocol::Element* element, bool* end_of_sequence,
				absl::Time deadline, bool* timed_out);

		void Cancel();

		ShardingPolicy policy() const { return policy_; }
		int num_consumers() const { return num_consumers_; }

	private:
		using ShardQueue = folly::MPMCQueue<std::optional<snapshot_protocol::Element>>;

		ConsumerGroup(ShardingPolicy policy, int num_consumers, size_t queue_capacity);

		void ProduceLoop();
		// Returns false when cancelled before the write went through.
		bool WriteUnlessCancelled(std::optional<snapshot_protocol::Element> item);

		const ShardingPolicy policy_;
		const int num_consumers_;
		absl::Notification cancelled_;

		// kOff
		std::vector<std::unique_ptr<ReplayOrchestrator>> replicas_;

		// kDynamic
		std::unique_ptr<ReplayOrchestrator> source_;
		std::unique_ptr<ShardQueue> queue_;
		std::unique_ptr<std::atomic<bool>[]> drained_;
		absl::Mutex mu_;
		absl::Status terminal_status_ ABSL_GUARDED_BY(mu_);
		std::thread producer_;
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_SHARD_SHARD_REDISTRIBUTOR_H_

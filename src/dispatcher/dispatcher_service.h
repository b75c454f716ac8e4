#ifndef SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_SERVICE_H_
#define SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_SERVICE_H_

#include <atomic>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <dispatcher.grpc.pb.h>

#include "dispatcher/dispatcher.h"

namespace Snapstream {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using snapshot_protocol::SnapshotDispatcher;

// gRPC front of a Dispatcher. Status codes pass through unchanged.
class DispatcherServiceImpl final : public SnapshotDispatcher::Service {
	public:
		explicit DispatcherServiceImpl(Dispatcher* dispatcher) : dispatcher_(dispatcher) {}

		Status BeginStream(ServerContext* context, const snapshot_protocol::BeginStreamRequest* request,
				snapshot_protocol::BeginStreamResponse* reply) override;

		Status WorkerHeartbeat(ServerContext* context, const snapshot_protocol::WorkerHeartbeatRequest* request,
				snapshot_protocol::WorkerHeartbeatResponse* reply) override;

		Status GetSplit(ServerContext* context, const snapshot_protocol::GetSplitRequest* request,
				snapshot_protocol::GetSplitResponse* reply) override;

		Status ReportSplitDone(ServerContext* context, const snapshot_protocol::ReportSplitDoneRequest* request,
				snapshot_protocol::ReportSplitDoneResponse* reply) override;

		Status ReportSplitFailed(ServerContext* context, const snapshot_protocol::ReportSplitFailedRequest* request,
				snapshot_protocol::ReportSplitFailedResponse* reply) override;

		Status GetStreamInfo(ServerContext* context, const snapshot_protocol::GetStreamInfoRequest* request,
				snapshot_protocol::GetStreamInfoResponse* reply) override;

		Status JoinConsumerGroup(ServerContext* context, const snapshot_protocol::JoinConsumerGroupRequest* request,
				snapshot_protocol::JoinConsumerGroupResponse* reply) override;

		Status GetNextElement(ServerContext* context, const snapshot_protocol::GetNextElementRequest* request,
				snapshot_protocol::GetNextElementResponse* reply) override;

		Status ReleaseConsumerGroup(ServerContext* context, const snapshot_protocol::ReleaseConsumerGroupRequest* request,
				snapshot_protocol::ReleaseConsumerGroupResponse* reply) override;

	private:
		Dispatcher* dispatcher_;
};

/**
 * Owns a Dispatcher and serves it over gRPC.
 */
class DispatcherServer {
	public:
		DispatcherServer(std::shared_ptr<ChunkStore> store, DispatcherOptions options,
				const PipelineRegistry* registry = nullptr);
		~DispatcherServer();

		/**
		 * @param address host:port; port 0 picks a free port
		 * @return The bound address (host:port)
		 */
		absl::StatusOr<std::string> Start(const std::string& address);

		void Wait();
		void Shutdown();

		Dispatcher* dispatcher() { return dispatcher_.get(); }

	private:
		std::unique_ptr<Dispatcher> dispatcher_;
		std::unique_ptr<DispatcherServiceImpl> service_;
		std::unique_ptr<Server> server_;
		std::atomic<bool> stopped_{false};
};

} // namespace Snapstream

#endif // SNAPSTREAM_SRC_DISPATCHER_DISPATCHER_SERVICE_H_

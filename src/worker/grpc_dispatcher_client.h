#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <dispatcher.grpc.pb.h>

#include "worker/dispatcher_client.h"

namespace Snapstream {

class GrpcDispatcherClient : public DispatcherClient {
public:
	/**
	 * @param address Dispatcher host:port
	 * @param rpc_timeout Deadline of every call; must exceed the dispatcher's split wait
	 */
	GrpcDispatcherClient(const std::string& address, std::chrono::milliseconds rpc_timeout);

	// Uses the worker rpc timeout from the loaded configuration.
	explicit GrpcDispatcherClient(const std::string& address);

	absl::Status BeginStream(const snapshot_protocol::BeginStreamRequest& request,
			snapshot_protocol::BeginStreamResponse* response) override;
	absl::Status WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
			snapshot_protocol::WorkerHeartbeatResponse* response) override;
	absl::Status GetSplit(const snapshot_protocol::GetSplitRequest& request,
			snapshot_protocol::GetSplitResponse* response) override;
	absl::Status ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
			snapshot_protocol::ReportSplitDoneResponse* response) override;
	absl::Status ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
			snapshot_protocol::ReportSplitFailedResponse* response) override;
	absl::Status GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
			snapshot_protocol::GetStreamInfoResponse* response) override;
	absl::Status JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
			snapshot_protocol::JoinConsumerGroupResponse* response) override;
	absl::Status GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
			snapshot_protocol::GetNextElementResponse* response) override;
	absl::Status ReleaseConsumerGroup(const snapshot_protocol::ReleaseConsumerGroupRequest& request,
			snapshot_protocol::ReleaseConsumerGroupResponse* response) override;

	const std::string& address() const { return address_; }

private:
	void SetDeadline(grpc::ClientContext* context) const;

	std::string address_;
	std::chrono::milliseconds rpc_timeout_;
	std::unique_ptr<snapshot_protocol::SnapshotDispatcher::Stub> stub_;
};

} // namespace Snapstream

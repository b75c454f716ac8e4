#pragma once

#include "absl/status/status.h"
#include <dispatcher.pb.h>

namespace Snapstream {

/**
 * How workers and the client API reach the snapshot dispatcher.
 * Implemented in-process (LocalDispatcherClient) and over gRPC
 * (GrpcDispatcherClient).
 */
class DispatcherClient {
public:
	virtual ~DispatcherClient() = default;

	virtual absl::Status BeginStream(const snapshot_protocol::BeginStreamRequest& request,
			snapshot_protocol::BeginStreamResponse* response) = 0;

	virtual absl::Status WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
			snapshot_protocol::WorkerHeartbeatResponse* response) = 0;

	virtual absl::Status GetSplit(const snapshot_protocol::GetSplitRequest& request,
			snapshot_protocol::GetSplitResponse* response) = 0;

	virtual absl::Status ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
			snapshot_protocol::ReportSplitDoneResponse* response) = 0;

	virtual absl::Status ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
			snapshot_protocol::ReportSplitFailedResponse* response) = 0;

	virtual absl::Status GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
			snapshot_protocol::GetStreamInfoResponse* response) = 0;

	virtual absl::Status JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
			snapshot_protocol::JoinConsumerGroupResponse* response) = 0;

	virtual absl::Status GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
			snapshot_protocol::GetNextElementResponse* response) = 0;

	virtual absl::Status ReleaseConsumerGroup(const snapshot_protocol::ReleaseConsumerGroupRequest& request,
			snapshot_protocol::ReleaseConsumerGroupResponse* response) = 0;
};

} // namespace Snapstream

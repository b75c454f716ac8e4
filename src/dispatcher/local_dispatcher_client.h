#pragma once

#include "dispatcher/dispatcher.h"
#include "worker/dispatcher_client.h"

namespace Snapstream {

// In-process DispatcherClient; calls go straight to the Dispatcher.
class LocalDispatcherClient : public DispatcherClient {
public:
	explicit LocalDispatcherClient(Dispatcher* dispatcher) : dispatcher_(dispatcher) {}

	absl::Status BeginStream(const snapshot_protocol::BeginStreamRequest& request,
			snapshot_protocol::BeginStreamResponse* response) override {
		return dispatcher_->BeginStream(request, response);
	}

	absl::Status WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
			snapshot_protocol::WorkerHeartbeatResponse* response) override {
		return dispatcher_->WorkerHeartbeat(request, response);
	}

	absl::Status GetSplit(const snapshot_protocol::GetSplitRequest& request,
			snapshot_protocol::GetSplitResponse* response) override {
		return dispatcher_->GetSplit(request, response);
	}

	absl::Status ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
			snapshot_protocol::ReportSplitDoneResponse* response) override {
		return dispatcher_->ReportSplitDone(request, response);
	}

	absl::Status ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
			snapshot_protocol::ReportSplitFailedResponse* response) override {
		return dispatcher_->ReportSplitFailed(request, response);
	}

	absl::Status GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
			snapshot_protocol::GetStreamInfoResponse* response) override {
		return dispatcher_->GetStreamInfo(request, response);
	}

	absl::Status JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
			snapshot_protocol::JoinConsumerGroupResponse* response) override {
		return dispatcher_->JoinConsumerGroup(request, response);
	}

	absl::Status GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
			snapshot_protocol::GetNextElementResponse* response) override {
		return dispatcher_->GetNextElement(request, response);
	}

	absl::Status ReleaseConsumerGroup(const snapshot_protocol::ReleaseConsumerGroupRequest& request,
			snapshot_protocol::ReleaseConsumerGroupResponse* response) override {
		return dispatcher_->ReleaseConsumerGroup(request, response);
	}

private:
	Dispatcher* dispatcher_;
};

} // namespace Snapstream

#include "worker/grpc_dispatcher_client.h"

#include <glog/logging.h>

#include "common/configuration.h"
#include "common/status_util.h"

namespace Snapstream {

GrpcDispatcherClient::GrpcDispatcherClient(const std::string& address,
		std::chrono::milliseconds rpc_timeout)
	: address_(address),
	  rpc_timeout_(rpc_timeout),
	  stub_(snapshot_protocol::SnapshotDispatcher::NewStub(
			  grpc::CreateChannel(address, grpc::InsecureChannelCredentials()))) {
	VLOG(3) << "\t[GrpcDispatcherClient]\t\tConstructed for " << address_;
}

GrpcDispatcherClient::GrpcDispatcherClient(const std::string& address)
	: GrpcDispatcherClient(address,
			std::chrono::milliseconds(GetConfig().config().worker.rpc_timeout_ms.get())) {}

void GrpcDispatcherClient::SetDeadline(grpc::ClientContext* context) const {
	context->set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
}

absl::Status GrpcDispatcherClient::BeginStream(const snapshot_protocol::BeginStreamRequest& request,
		snapshot_protocol::BeginStreamResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->BeginStream(&context, request, response));
}

absl::Status GrpcDispatcherClient::WorkerHeartbeat(const snapshot_protocol::WorkerHeartbeatRequest& request,
		snapshot_protocol::WorkerHeartbeatResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->WorkerHeartbeat(&context, request, response));
}

absl::Status GrpcDispatcherClient::GetSplit(const snapshot_protocol::GetSplitRequest& request,
		snapshot_protocol::GetSplitResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->GetSplit(&context, request, response));
}

absl::Status GrpcDispatcherClient::ReportSplitDone(const snapshot_protocol::ReportSplitDoneRequest& request,
		snapshot_protocol::ReportSplitDoneResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->ReportSplitDone(&context, request, response));
}

absl::Status GrpcDispatcherClient::ReportSplitFailed(const snapshot_protocol::ReportSplitFailedRequest& request,
		snapshot_protocol::ReportSplitFailedResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->ReportSplitFailed(&context, request, response));
}

absl::Status GrpcDispatcherClient::GetStreamInfo(const snapshot_protocol::GetStreamInfoRequest& request,
		snapshot_protocol::GetStreamInfoResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->GetStreamInfo(&context, request, response));
}

absl::Status GrpcDispatcherClient::JoinConsumerGroup(const snapshot_protocol::JoinConsumerGroupRequest& request,
		snapshot_protocol::JoinConsumerGroupResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->JoinConsumerGroup(&context, request, response));
}

absl::Status GrpcDispatcherClient::GetNextElement(const snapshot_protocol::GetNextElementRequest& request,
		snapshot_protocol::GetNextElementResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->GetNextElement(&context, request, response));
}

absl::Status GrpcDispatcherClient::ReleaseConsumerGroup(const snapshot_protocol::ReleaseConsumerGroupRequest& request,
		snapshot_protocol::ReleaseConsumerGroupResponse* response) {
	grpc::ClientContext context;
	SetDeadline(&context);
	return FromGrpcStatus(stub_->ReleaseConsumerGroup(&context, request, response));
}

} // namespace Snapstream

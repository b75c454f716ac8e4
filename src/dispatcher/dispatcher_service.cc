#include "dispatcher/dispatcher_service.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/status_util.h"

namespace Snapstream {

Status DispatcherServiceImpl::BeginStream(ServerContext* context,
		const snapshot_protocol::BeginStreamRequest* request,
		snapshot_protocol::BeginStreamResponse* reply) {
	return ToGrpcStatus(dispatcher_->BeginStream(*request, reply));
}

Status DispatcherServiceImpl::WorkerHeartbeat(ServerContext* context,
		const snapshot_protocol::WorkerHeartbeatRequest* request,
		snapshot_protocol::WorkerHeartbeatResponse* reply) {
	return ToGrpcStatus(dispatcher_->WorkerHeartbeat(*request, reply));
}

Status DispatcherServiceImpl::GetSplit(ServerContext* context,
		const snapshot_protocol::GetSplitRequest* request,
		snapshot_protocol::GetSplitResponse* reply) {
	return ToGrpcStatus(dispatcher_->GetSplit(*request, reply));
}

Status DispatcherServiceImpl::ReportSplitDone(ServerContext* context,
		const snapshot_protocol::ReportSplitDoneRequest* request,
		snapshot_protocol::ReportSplitDoneResponse* reply) {
	return ToGrpcStatus(dispatcher_->ReportSplitDone(*request, reply));
}

Status DispatcherServiceImpl::ReportSplitFailed(ServerContext* context,
		const snapshot_protocol::ReportSplitFailedRequest* request,
		snapshot_protocol::ReportSplitFailedResponse* reply) {
	return ToGrpcStatus(dispatcher_->ReportSplitFailed(*request, reply));
}

Status DispatcherServiceImpl::GetStreamInfo(ServerContext* context,
		const snapshot_protocol::GetStreamInfoRequest* request,
		snapshot_protocol::GetStreamInfoResponse* reply) {
	return ToGrpcStatus(dispatcher_->GetStreamInfo(*request, reply));
}

Status DispatcherServiceImpl::JoinConsumerGroup(ServerContext* context,
		const snapshot_protocol::JoinConsumerGroupRequest* request,
		snapshot_protocol::JoinConsumerGroupResponse* reply) {
	return ToGrpcStatus(dispatcher_->JoinConsumerGroup(*request, reply));
}

Status DispatcherServiceImpl::GetNextElement(ServerContext* context,
		const snapshot_protocol::GetNextElementRequest* request,
		snapshot_protocol::GetNextElementResponse* reply) {
	return ToGrpcStatus(dispatcher_->GetNextElement(*request, reply));
}

Status DispatcherServiceImpl::ReleaseConsumerGroup(ServerContext* context,
		const snapshot_protocol::ReleaseConsumerGroupRequest* request,
		snapshot_protocol::ReleaseConsumerGroupResponse* reply) {
	return ToGrpcStatus(dispatcher_->ReleaseConsumerGroup(*request, reply));
}

DispatcherServer::DispatcherServer(std::shared_ptr<ChunkStore> store, DispatcherOptions options,
		const PipelineRegistry* registry)
	: dispatcher_(std::make_unique<Dispatcher>(std::move(store), options, registry)),
	  service_(std::make_unique<DispatcherServiceImpl>(dispatcher_.get())) {}

DispatcherServer::~DispatcherServer() {
	Shutdown();
}

absl::StatusOr<std::string> DispatcherServer::Start(const std::string& address) {
	if (server_) {
		return absl::FailedPreconditionError("dispatcher server already started");
	}
	int selected_port = 0;
	ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &selected_port);
	builder.RegisterService(service_.get());
	server_ = builder.BuildAndStart();
	if (!server_ || selected_port == 0) {
		server_.reset();
		return absl::UnavailableError(absl::StrCat("failed to listen on ", address));
	}
	const std::string host = address.substr(0, address.rfind(':'));
	const std::string bound = absl::StrCat(host, ":", selected_port);
	LOG(INFO) << "[DispatcherServer] Serving snapshot dispatcher on " << bound;
	return bound;
}

void DispatcherServer::Wait() {
	if (server_) server_->Wait();
}

void DispatcherServer::Shutdown() {
	if (server_ && !stopped_.exchange(true)) {
		// Bounded so blocked GetSplit and GetNextElement calls cannot hold shutdown forever.
		server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
	}
	dispatcher_->Shutdown();
}

} // namespace Snapstream

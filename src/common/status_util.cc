#include "status_util.h"

#include <cerrno>
#include <cstring>

#include "absl/strings/str_cat.h"

namespace Snapstream {

grpc::Status ToGrpcStatus(const absl::Status& status) {
	if (status.ok()) return grpc::Status::OK;
	return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
			std::string(status.message()));
}

absl::Status FromGrpcStatus(const grpc::Status& status) {
	if (status.ok()) return absl::OkStatus();
	return absl::Status(static_cast<absl::StatusCode>(status.error_code()),
			status.error_message());
}

snapshot_protocol::FailureRecord ToFailureRecord(const absl::Status& status, int64_t split_index) {
	snapshot_protocol::FailureRecord record;
	record.set_code(static_cast<int32_t>(status.code()));
	record.set_message(std::string(status.message()));
	record.set_split_index(split_index);
	return record;
}

absl::Status FromFailureRecord(const snapshot_protocol::FailureRecord& record) {
	auto code = static_cast<absl::StatusCode>(record.code());
	if (code == absl::StatusCode::kOk) {
		// A failure record always describes a failure.
		code = absl::StatusCode::kUnknown;
	}
	return absl::Status(code, record.message());
}

absl::Status ErrnoToStatus(int err, absl::string_view context) {
	std::string message = absl::StrCat(context, ": ", std::strerror(err));
	switch (err) {
		case ENOENT:
			return absl::NotFoundError(message);
		case EEXIST:
			return absl::AlreadyExistsError(message);
		case EINTR:
		case EAGAIN:
		case EBUSY:
		case EIO:
		case ENOSPC:
		case EMFILE:
		case ENFILE:
		case ETIMEDOUT:
			return absl::UnavailableError(message);
		case EACCES:
		case EPERM:
			return absl::PermissionDeniedError(message);
		case ENOTDIR:
		case EISDIR:
		case EINVAL:
			return absl::FailedPreconditionError(message);
		default:
			return absl::InternalError(message);
	}
}

} // namespace Snapstream

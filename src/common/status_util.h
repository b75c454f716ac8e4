#ifndef SNAPSTREAM_SRC_COMMON_STATUS_UTIL_H_
#define SNAPSTREAM_SRC_COMMON_STATUS_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include <grpcpp/grpcpp.h>
#include <snapshot.pb.h>

#define SNAPSTREAM_STATUS_CONCAT_INNER_(a, b) a##b
#define SNAPSTREAM_STATUS_CONCAT_(a, b) SNAPSTREAM_STATUS_CONCAT_INNER_(a, b)

#define SNAPSTREAM_RETURN_IF_ERROR(expr)                  \
	do {                                                    \
		const absl::Status _snapstream_status = (expr);       \
		if (!_snapstream_status.ok()) return _snapstream_status; \
	} while (0)

#define SNAPSTREAM_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, expr) \
	auto statusor = (expr);                                      \
	if (!statusor.ok()) return statusor.status();                \
	lhs = std::move(statusor).value()

#define SNAPSTREAM_ASSIGN_OR_RETURN(lhs, expr)                                   \
	SNAPSTREAM_ASSIGN_OR_RETURN_IMPL_(                                             \
			SNAPSTREAM_STATUS_CONCAT_(_snapstream_statusor_, __LINE__), lhs, expr)

namespace Snapstream {

// absl and gRPC share the canonical code numbering.
grpc::Status ToGrpcStatus(const absl::Status& status);
absl::Status FromGrpcStatus(const grpc::Status& status);

snapshot_protocol::FailureRecord ToFailureRecord(const absl::Status& status, int64_t split_index);
absl::Status FromFailureRecord(const snapshot_protocol::FailureRecord& record);

/**
 * Maps an errno value from a filesystem call to a status.
 * ENOENT -> NOT_FOUND, EEXIST -> ALREADY_EXISTS, interrupted or
 * resource-exhaustion errors -> UNAVAILABLE (retryable), everything else -> INTERNAL.
 */
absl::Status ErrnoToStatus(int err, absl::string_view context);

// Only UNAVAILABLE is retried by the store retry layer.
inline bool IsTransient(const absl::Status& status) {
	return absl::IsUnavailable(status);
}

} // namespace Snapstream

#endif  // SNAPSTREAM_SRC_COMMON_STATUS_UTIL_H_

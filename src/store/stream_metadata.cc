#include "store/stream_metadata.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/status_util.h"
#include "store/snapshot_layout.h"

namespace Snapstream {

absl::Status StreamMetadataStore::CreateLayout(const std::string& root) {
	SNAPSTREAM_RETURN_IF_ERROR(store_->CreateDir(root));
	SNAPSTREAM_RETURN_IF_ERROR(store_->CreateDir(layout::ChunksDir(root)));
	return store_->CreateDir(layout::UncommittedDir(root));
}

template <typename Message>
absl::Status StreamMetadataStore::WriteRecord(const std::string& path, const Message& message) {
	std::string bytes;
	if (!message.SerializeToString(&bytes)) {
		return absl::InternalError(absl::StrCat("failed to serialize ", path));
	}
	return store_->WriteAtomic(path, bytes);
}

template <typename Message>
absl::StatusOr<std::optional<Message>> StreamMetadataStore::ReadRecord(const std::string& path) {
	auto bytes = store_->ReadFile(path);
	if (absl::IsNotFound(bytes.status())) return std::optional<Message>();
	if (!bytes.ok()) return bytes.status();
	Message message;
	if (!message.ParseFromString(*bytes)) {
		return absl::DataLossError(absl::StrCat("corrupt stream record ", path));
	}
	return std::optional<Message>(std::move(message));
}

absl::Status StreamMetadataStore::WriteMetadata(const std::string& root,
		const snapshot_protocol::StreamMetadata& metadata) {
	return WriteRecord(layout::MetadataPath(root), metadata);
}

absl::StatusOr<snapshot_protocol::StreamMetadata> StreamMetadataStore::ReadMetadata(const std::string& root) {
	auto record = ReadRecord<snapshot_protocol::StreamMetadata>(layout::MetadataPath(root));
	if (!record.ok()) return record.status();
	if (!record->has_value()) {
		return absl::NotFoundError(absl::StrCat("no snapshot stream at ", root));
	}
	return std::move(**record);
}

absl::Status StreamMetadataStore::WriteSealRecord(const std::string& root,
		const snapshot_protocol::SealRecord& seal) {
	return WriteRecord(layout::DonePath(root), seal);
}

absl::Status StreamMetadataStore::WriteFailureRecord(const std::string& root,
		const snapshot_protocol::FailureRecord& failure) {
	return WriteRecord(layout::ErrorPath(root), failure);
}

absl::StatusOr<StreamStatus> StreamMetadataStore::ReadStatus(const std::string& root) {
	StreamStatus status;

	auto failure = ReadRecord<snapshot_protocol::FailureRecord>(layout::ErrorPath(root));
	if (!failure.ok()) return failure.status();
	if (failure->has_value()) {
		status.state = snapshot_protocol::STREAM_STATE_FAILED;
		status.failure = std::move(**failure);
		return status;
	}

	auto seal = ReadRecord<snapshot_protocol::SealRecord>(layout::DonePath(root));
	if (!seal.ok()) return seal.status();
	if (seal->has_value()) {
		status.state = snapshot_protocol::STREAM_STATE_DONE;
		status.seal = std::move(**seal);
		return status;
	}

	auto created = store_->Exists(layout::MetadataPath(root));
	if (!created.ok()) return created.status();
	status.state = *created ? snapshot_protocol::STREAM_STATE_STREAMING
		: snapshot_protocol::STREAM_STATE_UNKNOWN;
	return status;
}

} // namespace Snapstream

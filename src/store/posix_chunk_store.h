#pragma once

#include <atomic>

#include "store/chunk_store.h"

namespace Snapstream {

/**
 * ChunkStore over a local or mounted POSIX filesystem.
 * Files are fsynced before rename and parent directories after it.
 */
class PosixChunkStore : public ChunkStore {
public:
	PosixChunkStore() = default;

	absl::Status CreateDir(const std::string& dir) override;
	absl::Status WriteAtomic(const std::string& path, absl::string_view data) override;
	absl::Status Rename(const std::string& from, const std::string& to) override;
	absl::StatusOr<bool> Exists(const std::string& path) override;
	absl::StatusOr<std::string> ReadFile(const std::string& path) override;
	absl::StatusOr<std::vector<std::string>> List(const std::string& dir,
			const std::string& prefix) override;
	absl::Status Delete(const std::string& path) override;

private:
	absl::Status SyncParentDir(const std::string& path);
	std::string TempPathFor(const std::string& path);

	std::atomic<uint64_t> tmp_counter_{0};
};

} // namespace Snapstream

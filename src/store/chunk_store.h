#pragma once

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace Snapstream {

/**
 * Durable, hierarchical namespace the snapshot protocol is built on.
 *
 * Requirements on implementations:
 * - WriteAtomic publishes a fully written file under its final name in one
 *   step; readers never observe a partial file.
 * - Rename is atomic within the store.
 * - Transient faults are reported as UNAVAILABLE so RetryingChunkStore can
 *   retry them; a missing file is NOT_FOUND.
 */
class ChunkStore {
public:
	virtual ~ChunkStore() = default;

	// Creates dir and any missing parents. OK when it already exists.
	virtual absl::Status CreateDir(const std::string& dir) = 0;

	// Writes data to a temporary sibling, syncs it and renames it onto path.
	virtual absl::Status WriteAtomic(const std::string& path, absl::string_view data) = 0;

	virtual absl::Status Rename(const std::string& from, const std::string& to) = 0;

	virtual absl::StatusOr<bool> Exists(const std::string& path) = 0;

	virtual absl::StatusOr<std::string> ReadFile(const std::string& path) = 0;

	/**
	 * @param dir Directory to list (a missing dir lists as empty)
	 * @param prefix Only names starting with prefix are returned
	 * @return Entry names (not paths) sorted ascending; temporary files excluded
	 */
	virtual absl::StatusOr<std::vector<std::string>> List(const std::string& dir,
			const std::string& prefix) = 0;

	// Removes a file. OK when it is already gone.
	virtual absl::Status Delete(const std::string& path) = 0;
};

} // namespace Snapstream

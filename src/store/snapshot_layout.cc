#include "store/snapshot_layout.h"

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace Snapstream {
namespace layout {

std::string JoinPath(const std::string& a, const std::string& b) {
	if (a.empty()) return b;
	if (a.back() == '/') return absl::StrCat(a, b);
	return absl::StrCat(a, "/", b);
}

std::string ChunkFileName(int64_t chunk_index) {
	return absl::StrFormat("%s%010d", kChunkPrefix, chunk_index);
}

std::string ChunkPath(const std::string& root, int64_t chunk_index) {
	return JoinPath(ChunksDir(root), ChunkFileName(chunk_index));
}

bool ParseChunkFileName(const std::string& name, int64_t* chunk_index) {
	if (!absl::StartsWith(name, kChunkPrefix)) return false;
	absl::string_view digits = absl::string_view(name).substr(sizeof(kChunkPrefix) - 1);
	if (digits.empty()) return false;
	for (char c : digits) {
		if (c < '0' || c > '9') return false;
	}
	return absl::SimpleAtoi(digits, chunk_index);
}

std::string UncommittedName(int64_t split_index, const std::string& worker_id,
		int64_t generation, int64_t k) {
	return absl::StrCat("split_", split_index, "_w", worker_id, "_g", generation, "_", k);
}

std::string UncommittedPath(const std::string& root, const std::string& name) {
	return JoinPath(UncommittedDir(root), name);
}

std::string NormalizeRoot(const std::string& root) {
	std::string normalized = root;
	while (normalized.size() > 1 && normalized.back() == '/') {
		normalized.pop_back();
	}
	return normalized;
}

} // namespace layout
} // namespace Snapstream

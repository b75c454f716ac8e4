#pragma once

#include <cstdint>
#include <string>

/**
 * Path scheme of a snapshot stream rooted at <root>:
 *
 *   <root>/snapshot.metadata
 *   <root>/DONE
 *   <root>/ERROR
 *   <root>/chunks/chunk_<%010d>
 *   <root>/uncommitted/split_<s>_w<worker>_g<gen>_<k>
 */
namespace Snapstream {
namespace layout {

constexpr char kMetadataFile[] = "snapshot.metadata";
constexpr char kDoneFile[] = "DONE";
constexpr char kErrorFile[] = "ERROR";
constexpr char kChunksDir[] = "chunks";
constexpr char kUncommittedDir[] = "uncommitted";
constexpr char kChunkPrefix[] = "chunk_";
constexpr char kTempSuffix[] = ".tmp";

std::string JoinPath(const std::string& a, const std::string& b);

inline std::string MetadataPath(const std::string& root) { return JoinPath(root, kMetadataFile); }
inline std::string DonePath(const std::string& root) { return JoinPath(root, kDoneFile); }
inline std::string ErrorPath(const std::string& root) { return JoinPath(root, kErrorFile); }
inline std::string ChunksDir(const std::string& root) { return JoinPath(root, kChunksDir); }
inline std::string UncommittedDir(const std::string& root) { return JoinPath(root, kUncommittedDir); }

std::string ChunkFileName(int64_t chunk_index);
std::string ChunkPath(const std::string& root, int64_t chunk_index);

// Returns false when name is not a committed chunk file name.
bool ParseChunkFileName(const std::string& name, int64_t* chunk_index);

/**
 * Name of the k-th chunk a worker wrote for one assignment of a split.
 * Worker id and generation keep concurrent executions of the same split apart.
 */
std::string UncommittedName(int64_t split_index, const std::string& worker_id,
		int64_t generation, int64_t k);
std::string UncommittedPath(const std::string& root, const std::string& name);

// Strips trailing slashes so equal roots compare equal.
std::string NormalizeRoot(const std::string& root);

} // namespace layout
} // namespace Snapstream

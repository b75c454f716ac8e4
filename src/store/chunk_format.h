#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include <snapshot.pb.h>

namespace Snapstream {

// ============================================================================
// Chunk file layout
//
// [ChunkHeader (64B, little endian)][record section, possibly compressed]
// record section := { u32 length, serialized snapshot_protocol::Element }*
// ============================================================================

static constexpr uint32_t kChunkMagic = 0x4B4E4853;  // "SHNK"
static constexpr uint16_t kChunkFormatVersion = 1;
static constexpr size_t kChunkHeaderSize = 64;
static constexpr size_t kRecordLengthSize = sizeof(uint32_t);

struct ChunkHeader {
	uint32_t magic;
	uint16_t version;
	uint16_t compression;      // snapshot_protocol::Compression
	uint64_t num_elements;
	uint64_t raw_bytes;        // record section before compression
	uint64_t stored_bytes;     // record section as written
	int64_t split_index;
	uint32_t checksum;         // CRC-32C of the stored record section
	uint8_t reserved[20];
};
static_assert(sizeof(ChunkHeader) == kChunkHeaderSize, "ChunkHeader must be exactly 64 bytes");
static_assert(offsetof(ChunkHeader, num_elements) == 8, "num_elements offset");
static_assert(offsetof(ChunkHeader, split_index) == 32, "split_index offset");
static_assert(offsetof(ChunkHeader, checksum) == 40, "checksum offset");

/**
 * Accumulates length-prefixed element records for one chunk.
 */
class ChunkRecordBuffer {
public:
	absl::Status Append(const snapshot_protocol::Element& element);

	// Bytes of the (uncompressed) record section buffered so far.
	size_t byte_size() const { return records_.size(); }
	int64_t num_elements() const { return num_elements_; }
	bool empty() const { return num_elements_ == 0; }
	const std::string& records() const { return records_; }

	void Clear() {
		records_.clear();
		num_elements_ = 0;
	}

private:
	std::string records_;
	int64_t num_elements_ = 0;
};

/**
 * @brief Serializes a chunk file from buffered records
 * @param records Buffered records of the chunk
 * @param compression NONE, BLOSC_LZ4 or BLOSC_ZSTD (AUTO is encoded as BLOSC_LZ4)
 * @param split_index Split the records originate from
 */
absl::StatusOr<std::string> EncodeChunk(const ChunkRecordBuffer& records,
		snapshot_protocol::Compression compression, int64_t split_index);

// Validates magic, version and the stored length. DATA_LOSS on mismatch.
absl::StatusOr<ChunkHeader> ParseChunkHeader(absl::string_view file);

struct DecodedChunk {
	ChunkHeader header;
	std::vector<snapshot_protocol::Element> elements;
};

/**
 * @brief Validates (header, size, checksum) and decodes a chunk file
 * @return DATA_LOSS for any corruption or truncation
 */
absl::StatusOr<DecodedChunk> DecodeChunk(absl::string_view file);

// Replaces AUTO with the concrete codec used for new streams.
snapshot_protocol::Compression ResolveCompression(snapshot_protocol::Compression compression);

// "none" | "auto" | "blosc_lz4" | "blosc_zstd"
absl::StatusOr<snapshot_protocol::Compression> ParseCompression(absl::string_view name);

} // namespace Snapstream

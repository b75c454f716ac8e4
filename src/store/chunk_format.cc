#include "store/chunk_format.h"

#include <blosc.h>
#include <climits>
#include <cstring>
#include <limits>

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "store/crc32c.h"

namespace Snapstream {

namespace {

using snapshot_protocol::Compression;

constexpr int kBloscClevel = 5;

const char* BloscCodecName(Compression compression) {
	switch (compression) {
		case snapshot_protocol::COMPRESSION_BLOSC_ZSTD:
			return BLOSC_ZSTD_COMPNAME;
		case snapshot_protocol::COMPRESSION_AUTO:
		case snapshot_protocol::COMPRESSION_BLOSC_LZ4:
		default:
			return BLOSC_LZ4_COMPNAME;
	}
}

absl::StatusOr<std::string> BloscCompress(const std::string& raw, Compression compression) {
	if (raw.size() > static_cast<size_t>(BLOSC_MAX_BUFFERSIZE)) {
		return absl::InvalidArgumentError(absl::StrCat(
				"record section of ", raw.size(), " bytes exceeds the blosc buffer limit"));
	}
	std::string out;
	out.resize(raw.size() + BLOSC_MAX_OVERHEAD);
	const int nb = blosc_compress_ctx(kBloscClevel,
			BLOSC_NOSHUFFLE,
			1 /* typesize */,
			raw.size(),
			raw.data(),
			&out[0],
			out.size(),
			BloscCodecName(compression),
			0 /* blocksize - 0:automatic */,
			1);
	if (nb <= 0) {
		return absl::InternalError(absl::StrCat("blosc compression failed with code ", nb));
	}
	out.resize(static_cast<size_t>(nb));
	return out;
}

absl::StatusOr<std::string> BloscDecompress(absl::string_view stored, size_t raw_bytes) {
	if (stored.size() < BLOSC_MIN_HEADER_LENGTH) {
		return absl::DataLossError("compressed record section shorter than the blosc header");
	}
	size_t nbytes = 0, cbytes = 0, blocksize = 0;
	blosc_cbuffer_sizes(stored.data(), &nbytes, &cbytes, &blocksize);
	if (nbytes != raw_bytes || cbytes != stored.size()) {
		return absl::DataLossError(absl::StrCat("blosc frame sizes (", nbytes, ", ", cbytes,
				") disagree with the chunk header (", raw_bytes, ", ", stored.size(), ")"));
	}
	std::string out;
	out.resize(raw_bytes);
	if (raw_bytes == 0) return out;
	const int nb = blosc_decompress_ctx(stored.data(), &out[0], out.size(), 1);
	if (nb < 0 || static_cast<size_t>(nb) != raw_bytes) {
		return absl::DataLossError(absl::StrCat("blosc decompression returned ", nb,
				", expected ", raw_bytes, " bytes"));
	}
	return out;
}

bool IsKnownCompression(uint16_t value) {
	return value == snapshot_protocol::COMPRESSION_NONE ||
		value == snapshot_protocol::COMPRESSION_BLOSC_LZ4 ||
		value == snapshot_protocol::COMPRESSION_BLOSC_ZSTD;
}

} // namespace

absl::Status ChunkRecordBuffer::Append(const snapshot_protocol::Element& element) {
	const size_t size = element.ByteSizeLong();
	if (size > std::numeric_limits<uint32_t>::max()) {
		return absl::InvalidArgumentError(absl::StrCat("element of ", size, " bytes is too large"));
	}
	const uint32_t len = static_cast<uint32_t>(size);
	const size_t offset = records_.size();
	records_.resize(offset + kRecordLengthSize + size);
	std::memcpy(&records_[offset], &len, kRecordLengthSize);
	if (!element.SerializeToArray(&records_[offset + kRecordLengthSize], static_cast<int>(size))) {
		records_.resize(offset);
		return absl::InternalError("failed to serialize element");
	}
	++num_elements_;
	return absl::OkStatus();
}

absl::StatusOr<std::string> EncodeChunk(const ChunkRecordBuffer& records,
		Compression compression, int64_t split_index) {
	compression = ResolveCompression(compression);

	std::string compressed;
	const std::string* stored = &records.records();
	if (compression != snapshot_protocol::COMPRESSION_NONE) {
		auto result = BloscCompress(records.records(), compression);
		if (!result.ok()) return result.status();
		compressed = std::move(result).value();
		stored = &compressed;
	}

	ChunkHeader header;
	std::memset(&header, 0, sizeof(header));
	header.magic = kChunkMagic;
	header.version = kChunkFormatVersion;
	header.compression = static_cast<uint16_t>(compression);
	header.num_elements = static_cast<uint64_t>(records.num_elements());
	header.raw_bytes = records.byte_size();
	header.stored_bytes = stored->size();
	header.split_index = split_index;
	header.checksum = Crc32cValue(stored->data(), stored->size());

	std::string file;
	file.resize(kChunkHeaderSize + stored->size());
	std::memcpy(&file[0], &header, kChunkHeaderSize);
	if (!stored->empty()) {
		std::memcpy(&file[kChunkHeaderSize], stored->data(), stored->size());
	}
	return file;
}

absl::StatusOr<ChunkHeader> ParseChunkHeader(absl::string_view file) {
	if (file.size() < kChunkHeaderSize) {
		return absl::DataLossError(absl::StrCat("chunk truncated: ", file.size(),
				" bytes is shorter than the header"));
	}
	ChunkHeader header;
	std::memcpy(&header, file.data(), kChunkHeaderSize);
	if (header.magic != kChunkMagic) {
		return absl::DataLossError(absl::StrCat("bad chunk magic 0x", absl::Hex(header.magic)));
	}
	if (header.version != kChunkFormatVersion) {
		return absl::DataLossError(absl::StrCat("unsupported chunk version ", header.version));
	}
	if (!IsKnownCompression(header.compression)) {
		return absl::DataLossError(absl::StrCat("unknown chunk compression ", header.compression));
	}
	if (header.stored_bytes != file.size() - kChunkHeaderSize) {
		return absl::DataLossError(absl::StrCat("chunk size mismatch: header says ",
				header.stored_bytes, " stored bytes, file has ", file.size() - kChunkHeaderSize));
	}
	if (header.compression == snapshot_protocol::COMPRESSION_NONE &&
			header.raw_bytes != header.stored_bytes) {
		return absl::DataLossError("uncompressed chunk with raw/stored size mismatch");
	}
	return header;
}

absl::StatusOr<DecodedChunk> DecodeChunk(absl::string_view file) {
	auto header_or = ParseChunkHeader(file);
	if (!header_or.ok()) return header_or.status();

	DecodedChunk chunk;
	chunk.header = *header_or;
	absl::string_view stored = file.substr(kChunkHeaderSize);
	const uint32_t crc = Crc32cValue(stored.data(), stored.size());
	if (crc != chunk.header.checksum) {
		return absl::DataLossError(absl::StrCat("chunk checksum mismatch: expected ",
				chunk.header.checksum, ", computed ", crc));
	}

	std::string decompressed;
	absl::string_view records = stored;
	if (chunk.header.compression != snapshot_protocol::COMPRESSION_NONE) {
		auto raw = BloscDecompress(stored, chunk.header.raw_bytes);
		if (!raw.ok()) return raw.status();
		decompressed = std::move(raw).value();
		records = decompressed;
	}

	chunk.elements.reserve(chunk.header.num_elements);
	size_t offset = 0;
	for (uint64_t i = 0; i < chunk.header.num_elements; ++i) {
		if (records.size() - offset < kRecordLengthSize) {
			return absl::DataLossError(absl::StrCat("chunk record ", i, " length truncated"));
		}
		uint32_t len;
		std::memcpy(&len, records.data() + offset, kRecordLengthSize);
		offset += kRecordLengthSize;
		if (records.size() - offset < len) {
			return absl::DataLossError(absl::StrCat("chunk record ", i, " body truncated"));
		}
		snapshot_protocol::Element element;
		if (!element.ParseFromArray(records.data() + offset, static_cast<int>(len))) {
			return absl::DataLossError(absl::StrCat("chunk record ", i, " does not parse"));
		}
		chunk.elements.push_back(std::move(element));
		offset += len;
	}
	if (offset != records.size()) {
		return absl::DataLossError(absl::StrCat("chunk has ", records.size() - offset,
				" trailing bytes after ", chunk.header.num_elements, " records"));
	}
	return chunk;
}

Compression ResolveCompression(Compression compression) {
	if (compression == snapshot_protocol::COMPRESSION_AUTO) {
		return snapshot_protocol::COMPRESSION_BLOSC_LZ4;
	}
	return compression;
}

absl::StatusOr<Compression> ParseCompression(absl::string_view name) {
	const std::string lower = absl::AsciiStrToLower(name);
	if (lower == "none" || lower.empty()) return snapshot_protocol::COMPRESSION_NONE;
	if (lower == "auto") return snapshot_protocol::COMPRESSION_AUTO;
	if (lower == "blosc_lz4" || lower == "lz4") return snapshot_protocol::COMPRESSION_BLOSC_LZ4;
	if (lower == "blosc_zstd" || lower == "zstd") return snapshot_protocol::COMPRESSION_BLOSC_ZSTD;
	return absl::InvalidArgumentError(absl::StrCat("unknown compression '", name, "'"));
}

} // namespace Snapstream

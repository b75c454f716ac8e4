#include "store/crc32c.h"

#include <array>

namespace Snapstream {

namespace {

constexpr uint32_t kCastagnoliPoly = 0x82F63B78u;

std::array<uint32_t, 256> BuildTable() {
	std::array<uint32_t, 256> table{};
	for (uint32_t i = 0; i < 256; ++i) {
		uint32_t crc = i;
		for (int bit = 0; bit < 8; ++bit) {
			crc = (crc & 1) ? (crc >> 1) ^ kCastagnoliPoly : crc >> 1;
		}
		table[i] = crc;
	}
	return table;
}

const std::array<uint32_t, 256>& Table() {
	static const std::array<uint32_t, 256> table = BuildTable();
	return table;
}

} // namespace

uint32_t Crc32cExtend(uint32_t crc, const void* data, size_t n) {
	const auto& table = Table();
	const uint8_t* p = static_cast<const uint8_t*>(data);
	crc = ~crc;
	for (size_t i = 0; i < n; ++i) {
		crc = table[(crc ^ p[i]) & 0xFF] ^ (crc >> 8);
	}
	return ~crc;
}

} // namespace Snapstream

#pragma once

#include <cstddef>
#include <cstdint>

namespace Snapstream {

// CRC-32C (Castagnoli, reflected polynomial 0x82F63B78).
// Extend(0, data, n) == Value(data, n).
uint32_t Crc32cExtend(uint32_t crc, const void* data, size_t n);

inline uint32_t Crc32cValue(const void* data, size_t n) {
	return Crc32cExtend(0, data, n);
}

} // namespace Snapstream

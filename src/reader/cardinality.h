#pragma once

#include <cstdint>

namespace Snapstream {

// Cardinality sentinels of a possibly unbounded, possibly unresolved sequence.
constexpr int64_t kInfiniteCardinality = -1;
constexpr int64_t kUnknownCardinality = -2;

/**
 * Cardinality of a sequence of base elements repeated count times.
 * count < 0 means unbounded repetition.
 *
 *   count < 0  -> infinite (even for an unresolved base), except an empty base stays 0
 *   count == 0 -> 0
 *   base unknown or infinite -> base
 *   otherwise  -> base * count
 */
inline int64_t RepeatCardinality(int64_t base, int64_t count) {
	if (count < 0) return base == 0 ? 0 : kInfiniteCardinality;
	if (count == 0) return 0;
	if (base == kUnknownCardinality || base == kInfiniteCardinality) return base;
	return base * count;
}

} // namespace Snapstream

#pragma once

#include <chrono>
#include <random>
#include <string>

#include "absl/strings/str_format.h"

namespace Snapstream {

// Timestamp plus randomness; used for worker ids and stream run ids.
inline std::string GenerateUniqueId() {
	auto now = std::chrono::system_clock::now();
	auto now_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
	long long timestamp = now_ms.time_since_epoch().count();

	std::random_device rd;
	std::mt19937_64 gen(rd());
	std::uniform_int_distribution<uint32_t> dis(0, 0xFFFFFF);

	return absl::StrFormat("%x%06x", timestamp, dis(gen));
}

} // namespace Snapstream

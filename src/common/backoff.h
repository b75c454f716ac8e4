#ifndef SNAPSTREAM_SRC_COMMON_BACKOFF_H_
#define SNAPSTREAM_SRC_COMMON_BACKOFF_H_

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace Snapstream {

/**
 * Bounded exponential backoff. Each call to Next() returns the current delay
 * and doubles it, never exceeding max.
 */
class Backoff {
public:
	Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
		: initial_(initial), max_(std::max(initial, max)), current_(initial) {}

	std::chrono::milliseconds Next() {
		std::chrono::milliseconds delay = current_;
		current_ = std::min(max_, current_ * 2);
		if (current_.count() == 0 && max_.count() > 0) current_ = std::chrono::milliseconds(1);
		return delay;
	}

	void Reset() { current_ = initial_; }

	std::chrono::milliseconds current() const { return current_; }

private:
	std::chrono::milliseconds initial_;
	std::chrono::milliseconds max_;
	std::chrono::milliseconds current_;
};

} // namespace Snapstream

#endif  // SNAPSTREAM_SRC_COMMON_BACKOFF_H_

// RAII wrapper for file descriptors opened by the chunk store.
// Closes on scope exit so early error returns never leak a descriptor.
#ifndef SNAPSTREAM_SRC_COMMON_SCOPED_FD_H_
#define SNAPSTREAM_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Snapstream {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	bool valid() const { return fd >= 0; }
	int get() const { return fd; }

	// Closes now and returns the close() result.
	int Close() {
		if (fd < 0) return 0;
		int rc = ::close(fd);
		fd = -1;
		return rc;
	}

	void Reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

} // namespace Snapstream

#endif  // SNAPSTREAM_SRC_COMMON_SCOPED_FD_H_

#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "store/chunk_store.h"

namespace Snapstream {

struct RetryOptions {
	int max_attempts = 5;
	std::chrono::milliseconds initial_backoff{20};
	std::chrono::milliseconds max_backoff{2000};

	// Built from the store section of the loaded configuration.
	static RetryOptions FromConfig();
};

/**
 * Decorator that retries UNAVAILABLE results of the wrapped store with
 * bounded exponential backoff. Any other status is returned unchanged.
 * When retries are exhausted the last UNAVAILABLE status is returned.
 */
class RetryingChunkStore : public ChunkStore {
public:
	RetryingChunkStore(std::shared_ptr<ChunkStore> base, RetryOptions options);

	absl::Status CreateDir(const std::string& dir) override;
	absl::Status WriteAtomic(const std::string& path, absl::string_view data) override;
	absl::Status Rename(const std::string& from, const std::string& to) override;
	absl::StatusOr<bool> Exists(const std::string& path) override;
	absl::StatusOr<std::string> ReadFile(const std::string& path) override;
	absl::StatusOr<std::vector<std::string>> List(const std::string& dir,
			const std::string& prefix) override;
	absl::Status Delete(const std::string& path) override;

	ChunkStore* base() const { return base_.get(); }

private:
	template <typename T>
	T Retry(const char* op, const std::string& target, const std::function<T()>& fn);

	std::shared_ptr<ChunkStore> base_;
	RetryOptions options_;
};

} // namespace Snapstream

#include "store/retrying_chunk_store.h"

#include <thread>

#include <glog/logging.h>

#include "common/backoff.h"
#include "common/configuration.h"
#include "common/status_util.h"

namespace Snapstream {

namespace {

const absl::Status& StatusOf(const absl::Status& s) { return s; }

template <typename T>
const absl::Status& StatusOf(const absl::StatusOr<T>& s) { return s.status(); }

} // namespace

RetryOptions RetryOptions::FromConfig() {
	const auto& store = GetConfig().config().store;
	RetryOptions options;
	options.max_attempts = store.retry_max_attempts.get();
	options.initial_backoff = std::chrono::milliseconds(store.retry_initial_backoff_ms.get());
	options.max_backoff = std::chrono::milliseconds(store.retry_max_backoff_ms.get());
	return options;
}

RetryingChunkStore::RetryingChunkStore(std::shared_ptr<ChunkStore> base, RetryOptions options)
	: base_(std::move(base)), options_(options) {
	if (options_.max_attempts < 1) options_.max_attempts = 1;
}

template <typename T>
T RetryingChunkStore::Retry(const char* op, const std::string& target, const std::function<T()>& fn) {
	Backoff backoff(options_.initial_backoff, options_.max_backoff);
	for (int attempt = 1;; ++attempt) {
		T result = fn();
		const absl::Status& status = StatusOf(result);
		if (!IsTransient(status)) return result;
		if (attempt >= options_.max_attempts) {
			LOG(ERROR) << "[RetryingChunkStore] " << op << " " << target << " failed after "
				<< attempt << " attempts: " << status;
			return result;
		}
		auto delay = backoff.Next();
		LOG(WARNING) << "[RetryingChunkStore] " << op << " " << target << " attempt " << attempt
			<< " failed (" << status << "), retrying in " << delay.count() << "ms";
		std::this_thread::sleep_for(delay);
	}
}

absl::Status RetryingChunkStore::CreateDir(const std::string& dir) {
	return Retry<absl::Status>("CreateDir", dir, [&] { return base_->CreateDir(dir); });
}

absl::Status RetryingChunkStore::WriteAtomic(const std::string& path, absl::string_view data) {
	return Retry<absl::Status>("WriteAtomic", path, [&] { return base_->WriteAtomic(path, data); });
}

absl::Status RetryingChunkStore::Rename(const std::string& from, const std::string& to) {
	bool retried = false;
	return Retry<absl::Status>("Rename", from, [&]() -> absl::Status {
		absl::Status s = base_->Rename(from, to);
		// An earlier attempt may have landed even though it reported a fault.
		if (retried && absl::IsNotFound(s)) {
			auto landed = base_->Exists(to);
			if (landed.ok() && *landed) return absl::OkStatus();
		}
		retried = true;
		return s;
	});
}

absl::StatusOr<bool> RetryingChunkStore::Exists(const std::string& path) {
	return Retry<absl::StatusOr<bool>>("Exists", path, [&] { return base_->Exists(path); });
}

absl::StatusOr<std::string> RetryingChunkStore::ReadFile(const std::string& path) {
	return Retry<absl::StatusOr<std::string>>("ReadFile", path, [&] { return base_->ReadFile(path); });
}

absl::StatusOr<std::vector<std::string>> RetryingChunkStore::List(const std::string& dir,
		const std::string& prefix) {
	return Retry<absl::StatusOr<std::vector<std::string>>>("List", dir,
			[&] { return base_->List(dir, prefix); });
}

absl::Status RetryingChunkStore::Delete(const std::string& path) {
	return Retry<absl::Status>("Delete", path, [&] { return base_->Delete(path); });
}

} // namespace Snapstream

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "store/chunk_store.h"

namespace Snapstream {
namespace test_util {

/**
 * ChunkStore decorator that fails selected operations on demand.
 * Faults are consumed in the order they were added.
 */
class FaultInjectingChunkStore : public ChunkStore {
public:
	enum class Op { kCreateDir, kWriteAtomic, kRename, kExists, kReadFile, kList, kDelete };

	explicit FaultInjectingChunkStore(std::shared_ptr<ChunkStore> base) : base_(std::move(base)) {}

	// The next count calls of op on a path containing substring return status.
	// count < 0 fails every matching call until ClearFaults().
	void FailNext(Op op, int count, absl::Status status, std::string substring = "") {
		absl::MutexLock lock(&mu_);
		faults_.push_back(Fault{op, count, std::move(status), std::move(substring)});
	}

	// The next call of op on a path containing substring blocks until ReleaseHeld().
	void HoldNext(Op op, std::string substring = "") {
		absl::MutexLock lock(&mu_);
		hold_ = Fault{op, 1, absl::OkStatus(), std::move(substring)};
		held_ = false;
		released_ = false;
	}

	// True once a call is blocked by HoldNext().
	bool AwaitHeld(absl::Duration timeout) {
		absl::MutexLock lock(&mu_);
		return mu_.AwaitWithTimeout(absl::Condition(&held_), timeout);
	}

	void ReleaseHeld() {
		absl::MutexLock lock(&mu_);
		released_ = true;
	}

	void ClearFaults() {
		absl::MutexLock lock(&mu_);
		faults_.clear();
	}

	int calls(Op op) const {
		absl::MutexLock lock(&mu_);
		auto it = calls_.find(static_cast<int>(op));
		return it == calls_.end() ? 0 : it->second;
	}

	int injected() const {
		absl::MutexLock lock(&mu_);
		return injected_;
	}

	absl::Status CreateDir(const std::string& dir) override {
		absl::Status fault = Check(Op::kCreateDir, dir);
		if (!fault.ok()) return fault;
		return base_->CreateDir(dir);
	}

	absl::Status WriteAtomic(const std::string& path, absl::string_view data) override {
		absl::Status fault = Check(Op::kWriteAtomic, path);
		if (!fault.ok()) return fault;
		return base_->WriteAtomic(path, data);
	}

	absl::Status Rename(const std::string& from, const std::string& to) override {
		absl::Status fault = Check(Op::kRename, to);
		if (!fault.ok()) return fault;
		return base_->Rename(from, to);
	}

	absl::StatusOr<bool> Exists(const std::string& path) override {
		absl::Status fault = Check(Op::kExists, path);
		if (!fault.ok()) return fault;
		return base_->Exists(path);
	}

	absl::StatusOr<std::string> ReadFile(const std::string& path) override {
		absl::Status fault = Check(Op::kReadFile, path);
		if (!fault.ok()) return fault;
		return base_->ReadFile(path);
	}

	absl::StatusOr<std::vector<std::string>> List(const std::string& dir,
			const std::string& prefix) override {
		absl::Status fault = Check(Op::kList, dir);
		if (!fault.ok()) return fault;
		return base_->List(dir, prefix);
	}

	absl::Status Delete(const std::string& path) override {
		absl::Status fault = Check(Op::kDelete, path);
		if (!fault.ok()) return fault;
		return base_->Delete(path);
	}

private:
	struct Fault {
		Op op;
		int remaining;
		absl::Status status;
		std::string substring;
	};

	absl::Status Check(Op op, const std::string& path) {
		absl::MutexLock lock(&mu_);
		++calls_[static_cast<int>(op)];
		if (hold_.has_value() && hold_->op == op &&
				path.find(hold_->substring) != std::string::npos) {
			hold_.reset();
			held_ = true;
			mu_.Await(absl::Condition(&released_));
		}
		for (auto it = faults_.begin(); it != faults_.end(); ++it) {
			if (it->op != op || path.find(it->substring) == std::string::npos) continue;
			absl::Status status = it->status;
			if (it->remaining > 0 && --it->remaining == 0) faults_.erase(it);
			++injected_;
			return status;
		}
		return absl::OkStatus();
	}

	std::shared_ptr<ChunkStore> base_;
	mutable absl::Mutex mu_;
	std::vector<Fault> faults_ ABSL_GUARDED_BY(mu_);
	absl::flat_hash_map<int, int> calls_ ABSL_GUARDED_BY(mu_);
	int injected_ ABSL_GUARDED_BY(mu_) = 0;
	std::optional<Fault> hold_ ABSL_GUARDED_BY(mu_);
	bool held_ ABSL_GUARDED_BY(mu_) = false;
	bool released_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace test_util
} // namespace Snapstream

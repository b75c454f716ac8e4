#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "pipeline/indexed_pipeline.h"

namespace Snapstream {

// Builds a source from the opaque config bytes of a CustomSource.
using SourceFactory = std::function<absl::StatusOr<std::unique_ptr<IndexedSource>>(const std::string& config)>;

/**
 * Resolves the source of a PipelineDescriptor. Built-in sources (range,
 * floats, strings) are always available; custom sources are looked up by
 * name and must be registered in every process that runs the pipeline
 * (the dispatcher and all workers).
 */
class PipelineRegistry {
public:
	static PipelineRegistry& getInstance();

	PipelineRegistry() = default;

	// Returns ALREADY_EXISTS when name is taken.
	absl::Status Register(const std::string& name, SourceFactory factory);
	void Unregister(const std::string& name);

	absl::StatusOr<std::unique_ptr<IndexedSource>> MakeSource(
			const snapshot_protocol::PipelineDescriptor& descriptor) const;

	std::vector<std::string> RegisteredNames() const;

private:
	PipelineRegistry(const PipelineRegistry&) = delete;
	PipelineRegistry& operator=(const PipelineRegistry&) = delete;

	mutable absl::Mutex mu_;
	absl::flat_hash_map<std::string, SourceFactory> factories_ ABSL_GUARDED_BY(mu_);
};

} // namespace Snapstream

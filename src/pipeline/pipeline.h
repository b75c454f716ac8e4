#pragma once

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include <snapshot.pb.h>

namespace Snapstream {

class PipelineRegistry;

/**
 * Produces the elements of one split in pipeline order.
 * A non-OK status is a data error of the split (e.g. a failed numeric check).
 */
class ElementIterator {
public:
	virtual ~ElementIterator() = default;
	virtual absl::Status GetNext(snapshot_protocol::Element* element, bool* end_of_split) = 0;
};

/**
 * Enumerates the splits of a pipeline with increasing indexes starting at 0.
 * Reset() restarts the enumeration from the first split.
 */
class SplitProvider {
public:
	virtual ~SplitProvider() = default;
	virtual absl::Status GetNext(snapshot_protocol::Split* split, bool* end_of_splits) = 0;
	virtual absl::Status Reset() = 0;
	// Total number of splits, or -1 when not known up front.
	virtual int64_t NumSplits() const { return -1; }
};

/**
 * A data-generating pipeline that can be cut into splits.
 * Concatenating the output of every split in split order yields exactly the
 * element sequence of the whole pipeline.
 */
class Pipeline {
public:
	virtual ~Pipeline() = default;

	virtual const snapshot_protocol::ElementSpec& element_spec() const = 0;

	virtual std::unique_ptr<SplitProvider> MakeSplitProvider() const = 0;

	virtual absl::StatusOr<std::unique_ptr<ElementIterator>> MakeSplitIterator(
			const snapshot_protocol::Split& split) const = 0;
};

/**
 * @brief Instantiates the pipeline a descriptor describes
 * @param registry Resolves custom sources; nullptr uses PipelineRegistry::getInstance()
 * @return INVALID_ARGUMENT for malformed descriptors, NOT_FOUND for unknown custom sources
 */
absl::StatusOr<std::unique_ptr<Pipeline>> BuildPipeline(
		const snapshot_protocol::PipelineDescriptor& descriptor,
		const PipelineRegistry* registry = nullptr);

// Runs every split in order and appends the elements to out.
absl::Status RunPipeline(const Pipeline& pipeline, std::vector<snapshot_protocol::Element>* out);

// Runs a single split to completion.
absl::Status RunSplit(const Pipeline& pipeline, const snapshot_protocol::Split& split,
		std::vector<snapshot_protocol::Element>* out);

} // namespace Snapstream

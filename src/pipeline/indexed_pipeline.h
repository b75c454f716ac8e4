#pragma once

#include <cstdint>
#include <memory>

#include "pipeline/pipeline.h"

namespace Snapstream {

/**
 * Random-access source of elements. Every built-in source and every source a
 * PipelineRegistry factory returns implements this; IndexedPipeline applies
 * the descriptor's transforms on top of it.
 */
class IndexedSource {
public:
	virtual ~IndexedSource() = default;
	virtual int64_t size() const = 0;
	virtual snapshot_protocol::ElementSpec element_spec() const = 0;
	// i is in [0, size()).
	virtual absl::Status Get(int64_t i, snapshot_protocol::Element* element) const = 0;
};

// INVALID_ARGUMENT when the range holds more than 2^63-1 elements.
absl::StatusOr<std::unique_ptr<IndexedSource>> MakeRangeSource(
		const snapshot_protocol::RangeSource& range);
std::unique_ptr<IndexedSource> MakeFloatSource(const snapshot_protocol::FloatSource& floats);
std::unique_ptr<IndexedSource> MakeStringSource(const snapshot_protocol::StringSource& strings);

/**
 * Pipeline over an IndexedSource with the descriptor transforms applied in
 * this order: repetitions, shuffle, enumerate, check_numerics.
 *
 * The logical sequence has size() * max(1, repetitions) positions. Splits are
 * contiguous ranges of logical positions (payload: IndexRange).
 */
class IndexedPipeline : public Pipeline {
public:
	static absl::StatusOr<std::unique_ptr<Pipeline>> Create(
			const snapshot_protocol::PipelineDescriptor& descriptor,
			std::unique_ptr<IndexedSource> source);

	const snapshot_protocol::ElementSpec& element_spec() const override { return element_spec_; }
	std::unique_ptr<SplitProvider> MakeSplitProvider() const override;
	absl::StatusOr<std::unique_ptr<ElementIterator>> MakeSplitIterator(
			const snapshot_protocol::Split& split) const override;

	int64_t num_positions() const { return num_positions_; }
	int64_t num_splits() const { return num_splits_; }

	// Produces the element at logical position pos.
	absl::Status ElementAt(int64_t pos, snapshot_protocol::Element* element) const;

private:
	IndexedPipeline(const snapshot_protocol::PipelineDescriptor& descriptor,
			std::unique_ptr<IndexedSource> source);

	snapshot_protocol::PipelineDescriptor descriptor_;
	std::unique_ptr<IndexedSource> source_;
	snapshot_protocol::ElementSpec element_spec_;
	int64_t num_positions_ = 0;
	int64_t num_splits_ = 0;
	// Logical position -> shuffled position. A keyed Feistel network over the
	// smallest even power of two covering num_positions_, cycle-walked back
	// into range, so nothing is materialized.
	int64_t Permute(int64_t pos) const;

	bool shuffled_ = false;
	int half_bits_ = 0;
};

} // namespace Snapstream

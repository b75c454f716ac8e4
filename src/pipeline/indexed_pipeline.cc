#include "pipeline/indexed_pipeline.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glog/logging.h>
#include "absl/numeric/int128.h"
#include "absl/strings/str_cat.h"

#include "common/status_util.h"

namespace Snapstream {

namespace {

using snapshot_protocol::Element;
using snapshot_protocol::ElementSpec;

constexpr uint64_t kFeistelRounds = 4;

uint64_t SplitMix64(uint64_t x) {
	x += 0x9e3779b97f4a7c15ULL;
	x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
	x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
	return x ^ (x >> 31);
}

class RangeSourceImpl : public IndexedSource {
public:
	RangeSourceImpl(int64_t start, int64_t step, int64_t size)
		: start_(start), step_(step), size_(size) {}

	int64_t size() const override { return size_; }

	ElementSpec element_spec() const override {
		ElementSpec spec;
		spec.add_component_types(snapshot_protocol::DT_INT64);
		return spec;
	}

	absl::Status Get(int64_t i, Element* element) const override {
		// start + i * step stays inside [start, stop); the unsigned form avoids
		// intermediate overflow.
		const uint64_t value = static_cast<uint64_t>(start_) +
			static_cast<uint64_t>(i) * static_cast<uint64_t>(step_);
		element->add_components()->set_int64_value(static_cast<int64_t>(value));
		return absl::OkStatus();
	}

private:
	const int64_t start_;
	const int64_t step_;
	const int64_t size_;
};

class FloatSourceImpl : public IndexedSource {
public:
	explicit FloatSourceImpl(const snapshot_protocol::FloatSource& floats)
		: values_(floats.values().begin(), floats.values().end()) {}

	int64_t size() const override { return static_cast<int64_t>(values_.size()); }

	ElementSpec element_spec() const override {
		ElementSpec spec;
		spec.add_component_types(snapshot_protocol::DT_FLOAT);
		return spec;
	}

	absl::Status Get(int64_t i, Element* element) const override {
		element->add_components()->set_float_value(values_[i]);
		return absl::OkStatus();
	}

private:
	std::vector<float> values_;
};

class StringSourceImpl : public IndexedSource {
public:
	explicit StringSourceImpl(const snapshot_protocol::StringSource& strings)
		: values_(strings.values().begin(), strings.values().end()) {}

	int64_t size() const override { return static_cast<int64_t>(values_.size()); }

	ElementSpec element_spec() const override {
		ElementSpec spec;
		spec.add_component_types(snapshot_protocol::DT_BYTES);
		return spec;
	}

	absl::Status Get(int64_t i, Element* element) const override {
		element->add_components()->set_bytes_value(values_[i]);
		return absl::OkStatus();
	}

private:
	std::vector<std::string> values_;
};

absl::Status CheckNumerics(const Element& element, int64_t pos) {
	for (const auto& component : element.components()) {
		double value;
		if (component.value_case() == snapshot_protocol::ElementComponent::kFloatValue) {
			value = component.float_value();
		} else if (component.value_case() == snapshot_protocol::ElementComponent::kDoubleValue) {
			value = component.double_value();
		} else {
			continue;
		}
		if (std::isnan(value)) {
			return absl::InvalidArgumentError(absl::StrCat(
					"check_numerics: element ", pos, " has a NaN component"));
		}
		if (std::isinf(value)) {
			return absl::InvalidArgumentError(absl::StrCat(
					"check_numerics: element ", pos, " has an Inf component"));
		}
	}
	return absl::OkStatus();
}

class IndexRangeSplitProvider : public SplitProvider {
public:
	IndexRangeSplitProvider(int64_t num_positions, int64_t num_splits)
		: num_positions_(num_positions), num_splits_(num_splits) {}

	absl::Status GetNext(snapshot_protocol::Split* split, bool* end_of_splits) override {
		if (next_ >= num_splits_) {
			*end_of_splits = true;
			return absl::OkStatus();
		}
		// Balanced cut: the first (positions % splits) splits get one extra position.
		const int64_t base = num_positions_ / num_splits_;
		const int64_t extra = num_positions_ % num_splits_;
		const int64_t begin = next_ * base + std::min(next_, extra);
		const int64_t end = begin + base + (next_ < extra ? 1 : 0);

		snapshot_protocol::IndexRange range;
		range.set_begin(begin);
		range.set_end(end);
		split->set_index(next_);
		split->set_payload(range.SerializeAsString());
		++next_;
		*end_of_splits = false;
		return absl::OkStatus();
	}

	absl::Status Reset() override {
		next_ = 0;
		return absl::OkStatus();
	}

	int64_t NumSplits() const override { return num_splits_; }

private:
	const int64_t num_positions_;
	const int64_t num_splits_;
	int64_t next_ = 0;
};

class IndexRangeIterator : public ElementIterator {
public:
	IndexRangeIterator(const IndexedPipeline* pipeline, int64_t begin, int64_t end)
		: pipeline_(pipeline), pos_(begin), end_(end) {}

	absl::Status GetNext(Element* element, bool* end_of_split) override {
		if (pos_ >= end_) {
			*end_of_split = true;
			return absl::OkStatus();
		}
		element->Clear();
		SNAPSTREAM_RETURN_IF_ERROR(pipeline_->ElementAt(pos_, element));
		++pos_;
		*end_of_split = false;
		return absl::OkStatus();
	}

private:
	const IndexedPipeline* pipeline_;
	int64_t pos_;
	const int64_t end_;
};

} // namespace

absl::StatusOr<std::unique_ptr<IndexedSource>> MakeRangeSource(
		const snapshot_protocol::RangeSource& range) {
	const int64_t step = range.step() == 0 ? 1 : range.step();
	// Widen so that stop - start and -INT64_MIN are representable.
	const absl::int128 span = absl::int128(range.stop()) - absl::int128(range.start());
	const absl::int128 wide_step(step);
	absl::int128 size = 0;
	if ((wide_step > 0 && span > 0) || (wide_step < 0 && span < 0)) {
		const absl::int128 abs_step = wide_step > 0 ? wide_step : -wide_step;
		const absl::int128 abs_span = span > 0 ? span : -span;
		size = (abs_span + abs_step - 1) / abs_step;
	}
	if (size > absl::int128(std::numeric_limits<int64_t>::max())) {
		return absl::InvalidArgumentError(absl::StrCat("range [", range.start(), ", ",
				range.stop(), ") step ", step, " has more than 2^63-1 elements"));
	}
	return std::unique_ptr<IndexedSource>(
			new RangeSourceImpl(range.start(), step, static_cast<int64_t>(size)));
}

std::unique_ptr<IndexedSource> MakeFloatSource(const snapshot_protocol::FloatSource& floats) {
	return std::make_unique<FloatSourceImpl>(floats);
}

std::unique_ptr<IndexedSource> MakeStringSource(const snapshot_protocol::StringSource& strings) {
	return std::make_unique<StringSourceImpl>(strings);
}

absl::StatusOr<std::unique_ptr<Pipeline>> IndexedPipeline::Create(
		const snapshot_protocol::PipelineDescriptor& descriptor,
		std::unique_ptr<IndexedSource> source) {
	if (source == nullptr) {
		return absl::InvalidArgumentError("pipeline has no source");
	}
	if (descriptor.num_splits() < 0) {
		return absl::InvalidArgumentError(absl::StrCat("num_splits must be >= 0, got ",
				descriptor.num_splits()));
	}
	const int64_t repetitions = std::max<int64_t>(1, descriptor.repetitions());
	if (source->size() > 0 &&
			repetitions > std::numeric_limits<int64_t>::max() / source->size()) {
		return absl::InvalidArgumentError("pipeline length overflows int64");
	}
	return std::unique_ptr<Pipeline>(new IndexedPipeline(descriptor, std::move(source)));
}

IndexedPipeline::IndexedPipeline(const snapshot_protocol::PipelineDescriptor& descriptor,
		std::unique_ptr<IndexedSource> source)
	: descriptor_(descriptor), source_(std::move(source)) {
	const int64_t repetitions = std::max<int64_t>(1, descriptor_.repetitions());
	num_positions_ = source_->size() * repetitions;
	// An empty pipeline has no splits at all; otherwise never more splits than positions.
	const int64_t requested = std::max<int64_t>(1, descriptor_.num_splits());
	num_splits_ = std::min(requested, num_positions_);

	if (descriptor_.enumerate()) {
		element_spec_.add_component_types(snapshot_protocol::DT_INT64);
	}
	ElementSpec source_spec = source_->element_spec();
	for (int type : source_spec.component_types()) {
		element_spec_.add_component_types(static_cast<snapshot_protocol::DataType>(type));
	}

	if (descriptor_.shuffle() && num_positions_ > 1) {
		shuffled_ = true;
		int bits = 1;
		while (bits < 63 && (int64_t{1} << bits) < num_positions_) ++bits;
		half_bits_ = (bits + 1) / 2;
	}
	VLOG(3) << "\t[IndexedPipeline]\t\tConstructed positions:" << num_positions_
		<< " splits:" << num_splits_ << " shuffled:" << shuffled_;
}

int64_t IndexedPipeline::Permute(int64_t pos) const {
	const uint64_t mask = (uint64_t{1} << half_bits_) - 1;
	const uint64_t seed = static_cast<uint64_t>(descriptor_.shuffle_seed());
	uint64_t x = static_cast<uint64_t>(pos);
	do {
		uint64_t left = x >> half_bits_;
		uint64_t right = x & mask;
		for (uint64_t round = 0; round < kFeistelRounds; ++round) {
			const uint64_t next = left ^ (SplitMix64(seed ^ (round << 56) ^ right) & mask);
			left = right;
			right = next;
		}
		x = (left << half_bits_) | right;
	} while (x >= static_cast<uint64_t>(num_positions_));
	return static_cast<int64_t>(x);
}

absl::Status IndexedPipeline::ElementAt(int64_t pos, Element* element) const {
	if (pos < 0 || pos >= num_positions_) {
		return absl::OutOfRangeError(absl::StrCat("position ", pos, " outside [0, ",
				num_positions_, ")"));
	}
	const int64_t logical = shuffled_ ? Permute(pos) : pos;
	const int64_t source_index = logical % source_->size();
	if (descriptor_.enumerate()) {
		element->add_components()->set_int64_value(pos);
	}
	SNAPSTREAM_RETURN_IF_ERROR(source_->Get(source_index, element));
	if (descriptor_.check_numerics()) {
		SNAPSTREAM_RETURN_IF_ERROR(CheckNumerics(*element, pos));
	}
	return absl::OkStatus();
}

std::unique_ptr<SplitProvider> IndexedPipeline::MakeSplitProvider() const {
	return std::make_unique<IndexRangeSplitProvider>(num_positions_, num_splits_);
}

absl::StatusOr<std::unique_ptr<ElementIterator>> IndexedPipeline::MakeSplitIterator(
		const snapshot_protocol::Split& split) const {
	snapshot_protocol::IndexRange range;
	if (!range.ParseFromString(split.payload())) {
		return absl::InvalidArgumentError(absl::StrCat("split ", split.index(),
				" has a malformed payload"));
	}
	if (range.begin() < 0 || range.end() < range.begin() || range.end() > num_positions_) {
		return absl::InvalidArgumentError(absl::StrCat("split ", split.index(), " range [",
				range.begin(), ", ", range.end(), ") outside the pipeline"));
	}
	return std::unique_ptr<ElementIterator>(
			new IndexRangeIterator(this, range.begin(), range.end()));
}

} // namespace Snapstream

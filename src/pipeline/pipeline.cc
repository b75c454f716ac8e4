#include "pipeline/pipeline.h"

#include "common/status_util.h"
#include "pipeline/indexed_pipeline.h"
#include "pipeline/pipeline_registry.h"

namespace Snapstream {

absl::StatusOr<std::unique_ptr<Pipeline>> BuildPipeline(
		const snapshot_protocol::PipelineDescriptor& descriptor,
		const PipelineRegistry* registry) {
	if (registry == nullptr) {
		registry = &PipelineRegistry::getInstance();
	}
	SNAPSTREAM_ASSIGN_OR_RETURN(std::unique_ptr<IndexedSource> source,
			registry->MakeSource(descriptor));
	return IndexedPipeline::Create(descriptor, std::move(source));
}

absl::Status RunSplit(const Pipeline& pipeline, const snapshot_protocol::Split& split,
		std::vector<snapshot_protocol::Element>* out) {
	SNAPSTREAM_ASSIGN_OR_RETURN(std::unique_ptr<ElementIterator> it,
			pipeline.MakeSplitIterator(split));
	while (true) {
		snapshot_protocol::Element element;
		bool end = false;
		SNAPSTREAM_RETURN_IF_ERROR(it->GetNext(&element, &end));
		if (end) return absl::OkStatus();
		out->push_back(std::move(element));
	}
}

absl::Status RunPipeline(const Pipeline& pipeline, std::vector<snapshot_protocol::Element>* out) {
	std::unique_ptr<SplitProvider> provider = pipeline.MakeSplitProvider();
	while (true) {
		snapshot_protocol::Split split;
		bool end = false;
		SNAPSTREAM_RETURN_IF_ERROR(provider->GetNext(&split, &end));
		if (end) return absl::OkStatus();
		SNAPSTREAM_RETURN_IF_ERROR(RunSplit(pipeline, split, out));
	}
}

} // namespace Snapstream

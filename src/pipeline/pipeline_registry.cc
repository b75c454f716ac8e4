#include "pipeline/pipeline_registry.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

namespace Snapstream {

PipelineRegistry& PipelineRegistry::getInstance() {
	static PipelineRegistry instance;
	return instance;
}

absl::Status PipelineRegistry::Register(const std::string& name, SourceFactory factory) {
	if (name.empty() || !factory) {
		return absl::InvalidArgumentError("custom source needs a name and a factory");
	}
	absl::MutexLock lock(&mu_);
	if (!factories_.emplace(name, std::move(factory)).second) {
		return absl::AlreadyExistsError(absl::StrCat("custom source '", name, "' already registered"));
	}
	VLOG(1) << "[PipelineRegistry] Registered custom source " << name;
	return absl::OkStatus();
}

void PipelineRegistry::Unregister(const std::string& name) {
	absl::MutexLock lock(&mu_);
	factories_.erase(name);
}

absl::StatusOr<std::unique_ptr<IndexedSource>> PipelineRegistry::MakeSource(
		const snapshot_protocol::PipelineDescriptor& descriptor) const {
	switch (descriptor.source_case()) {
		case snapshot_protocol::PipelineDescriptor::kRange:
			return MakeRangeSource(descriptor.range());
		case snapshot_protocol::PipelineDescriptor::kFloats:
			return MakeFloatSource(descriptor.floats());
		case snapshot_protocol::PipelineDescriptor::kStrings:
			return MakeStringSource(descriptor.strings());
		case snapshot_protocol::PipelineDescriptor::kCustom: {
			SourceFactory factory;
			{
				absl::MutexLock lock(&mu_);
				auto it = factories_.find(descriptor.custom().name());
				if (it == factories_.end()) {
					return absl::NotFoundError(absl::StrCat("unknown custom source '",
							descriptor.custom().name(), "'"));
				}
				factory = it->second;
			}
			// Factories run outside the lock; they may be slow.
			auto source = factory(descriptor.custom().config());
			if (source.ok() && *source == nullptr) {
				return absl::InternalError(absl::StrCat("custom source '",
						descriptor.custom().name(), "' returned no source"));
			}
			return source;
		}
		case snapshot_protocol::PipelineDescriptor::SOURCE_NOT_SET:
		default:
			return absl::InvalidArgumentError("pipeline descriptor has no source");
	}
}

std::vector<std::string> PipelineRegistry::RegisteredNames() const {
	std::vector<std::string> names;
	{
		absl::MutexLock lock(&mu_);
		for (const auto& entry : factories_) names.push_back(entry.first);
	}
	std::sort(names.begin(), names.end());
	return names;
}

} // namespace Snapstream

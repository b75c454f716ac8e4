#include "pipeline/element_util.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/escaping.h"

namespace Snapstream {

using snapshot_protocol::Element;
using snapshot_protocol::ElementComponent;

Element MakeInt64Element(int64_t value) {
	Element element;
	element.add_components()->set_int64_value(value);
	return element;
}

Element MakeFloatElement(float value) {
	Element element;
	element.add_components()->set_float_value(value);
	return element;
}

Element MakeBytesElement(absl::string_view value) {
	Element element;
	element.add_components()->set_bytes_value(std::string(value));
	return element;
}

std::string ElementDebugString(const Element& element) {
	std::vector<std::string> parts;
	for (const auto& c : element.components()) {
		switch (c.value_case()) {
			case ElementComponent::kInt64Value:
				parts.push_back(absl::StrCat(c.int64_value()));
				break;
			case ElementComponent::kFloatValue:
				parts.push_back(absl::StrCat(c.float_value()));
				break;
			case ElementComponent::kDoubleValue:
				parts.push_back(absl::StrCat(c.double_value()));
				break;
			case ElementComponent::kBytesValue:
				parts.push_back(absl::StrCat("\"", absl::CEscape(c.bytes_value()), "\""));
				break;
			default:
				parts.push_back("<unset>");
		}
	}
	return absl::StrCat("(", absl::StrJoin(parts, ", "), ")");
}

int64_t Int64Component(const Element& element, int i) {
	CHECK_LT(i, element.components_size()) << ElementDebugString(element);
	CHECK_EQ(element.components(i).value_case(), ElementComponent::kInt64Value)
		<< ElementDebugString(element);
	return element.components(i).int64_value();
}

std::vector<int64_t> Int64Values(const std::vector<Element>& elements) {
	std::vector<int64_t> values;
	values.reserve(elements.size());
	for (const auto& element : elements) {
		values.push_back(Int64Component(element));
	}
	return values;
}

bool MatchesSpec(const Element& element, const snapshot_protocol::ElementSpec& spec) {
	if (element.components_size() != spec.component_types_size()) return false;
	for (int i = 0; i < element.components_size(); ++i) {
		ElementComponent::ValueCase expected;
		switch (spec.component_types(i)) {
			case snapshot_protocol::DT_INT64: expected = ElementComponent::kInt64Value; break;
			case snapshot_protocol::DT_FLOAT: expected = ElementComponent::kFloatValue; break;
			case snapshot_protocol::DT_DOUBLE: expected = ElementComponent::kDoubleValue; break;
			case snapshot_protocol::DT_BYTES: expected = ElementComponent::kBytesValue; break;
			default: return false;
		}
		if (element.components(i).value_case() != expected) return false;
	}
	return true;
}

} // namespace Snapstream

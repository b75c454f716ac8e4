#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include <snapshot.pb.h>

namespace Snapstream {

snapshot_protocol::Element MakeInt64Element(int64_t value);
snapshot_protocol::Element MakeFloatElement(float value);
snapshot_protocol::Element MakeBytesElement(absl::string_view value);

// Human-readable form, e.g. "(3, \"a\")".
std::string ElementDebugString(const snapshot_protocol::Element& element);

// Component i as int64; CHECK-fails on a type mismatch.
int64_t Int64Component(const snapshot_protocol::Element& element, int i = 0);

// First int64 component of every element.
std::vector<int64_t> Int64Values(const std::vector<snapshot_protocol::Element>& elements);

// True when element matches the component types of spec.
bool MatchesSpec(const snapshot_protocol::Element& element,
		const snapshot_protocol::ElementSpec& spec);

} // namespace Snapstream

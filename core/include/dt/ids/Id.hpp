#pragma once
#include <string>

namespace dt {

// Tab ids are unique across every window and travel unchanged with a
// transferred tab. Window labels name top-level windows ("main", "doc-2").
using TabId = std::string;
using WindowLabel = std::string;

inline const WindowLabel kPrimaryWindowLabel = "main";

} // namespace dt

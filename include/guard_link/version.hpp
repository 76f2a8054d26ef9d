// === Version Metadata ========================================================
//
// Exposes the coordination server's semantic version string used in logs.

#pragma once

#include <string_view>

namespace guard_link {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace guard_link

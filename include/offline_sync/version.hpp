// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs and the CLI.

#pragma once

#include <string_view>

namespace offline_sync {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace offline_sync
